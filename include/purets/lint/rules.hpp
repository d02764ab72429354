// purets/lint/rules.hpp - Rule checks dispatched by the rule visitor
//
// Each check inspects one node, reads and updates the traversal state in
// RuleContext, and reports through its DiagnosticSink. Checks never
// recurse; the RuleVisitor owns the walk and the scope flags.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

#include <gsl/span>

#include "purets/ast/ast.hpp"
#include "purets/lint/rule_context.hpp"

namespace purets::lint
{

// ============================================================================
// Banned constructs (rules_constructs.cpp)
// ============================================================================

/// no-classes, for both declarations and expressions.
void check_class(const AstNode * node, const Expr * super_class, RuleContext & ctx);
void check_enum_decl(const EnumDecl * node, RuleContext & ctx);
void check_interface_decl(const InterfaceDecl * node, RuleContext & ctx);
void check_unary_expr(const UnaryExpr * node, RuleContext & ctx);
void check_do_while_stmt(const DoWhileStmt * node, RuleContext & ctx);
void check_object_property(const ObjectProperty * node, RuleContext & ctx);
void check_class_member(const ClassMember * node, RuleContext & ctx);
void check_as_expr(const AsExpr * node, RuleContext & ctx);
void check_type_assertion_expr(const TypeAssertionExpr * node, RuleContext & ctx);
void check_member_expr(const MemberExpr * node, RuleContext & ctx);

/// no-dynamic-access for a computed read.
void check_index_expr(const IndexExpr * node, RuleContext & ctx);

/**
 * Assignment checks: member assignments, computed assignment targets and
 * indexed writes that mutate a tracked array.
 */
void check_assign_expr(const AssignExpr * node, RuleContext & ctx);

/**
 * Call checks: forEach, eval, Function(), require(), Object.define*,
 * gated console and timer calls, side-effect functions and array
 * mutation tracking.
 */
void check_call_expr(const CallExpr * node, RuleContext & ctx);

/// new Function(), and `new Date()` inside functions.
void check_new_expr(const NewExpr * node, RuleContext & ctx);

// ============================================================================
// Declarations (rules_declarations.cpp)
// ============================================================================

/**
 * Per-declarator checks: let-requires-type, empty-array-requires-type,
 * no-mutable-record; records the declared name and tracks arrays.
 */
void check_var_decl(const VarDecl * node, RuleContext & ctx);

// ============================================================================
// Control flow (rules_control.cpp)
// ============================================================================

void check_if_stmt(const IfStmt * node, RuleContext & ctx);
void check_while_stmt(const WhileStmt * node, RuleContext & ctx);
void check_switch_case(const SwitchCase * node, RuleContext & ctx);
void check_throw_stmt(const ThrowStmt * node, RuleContext & ctx);
void check_catch_clause(const CatchClause * node, RuleContext & ctx);

/// no-unused-map
void check_expr_stmt(const ExprStmt * node, RuleContext & ctx);

// ============================================================================
// Imports and module sources (rules_imports.cpp)
// ============================================================================

void check_import_decl(const ImportDecl * node, RuleContext & ctx);

/**
 * Checks shared by import and re-export sources: relative extensions,
 * HTTP(S) specifiers and forbidden libraries.
 */
void check_module_source(std::string_view source, SourceRange range, RuleContext & ctx);

/// forbidden-libraries for one module name.
void check_library(std::string_view source, SourceRange range, RuleContext & ctx);

// ============================================================================
// Functions and references (rules_functions.cpp)
// ============================================================================

/**
 * max-function-params. Function declarations and expressions are named
 * in the message; arrows are not.
 */
void check_param_count(const AstNode * function, size_t param_count, RuleContext & ctx);

/**
 * Parameter checks of a named function: param-missing-type and
 * jsdoc-param-match.
 *
 * @param name       Function name used in messages
 * @param params     Declared parameters
 * @param range      Range reported for documentation mismatches
 * @param doc_offset Offset the documentation block must precede
 */
void check_function_signature(
  std::string_view name, gsl::span<Param * const> params, SourceRange range, uint32_t doc_offset,
  RuleContext & ctx);

void check_this_expr(const ThisExpr * node, RuleContext & ctx);

/**
 * Identifier references: gated DOM and network globals, global
 * `process`, `__filename` / `__dirname`; records the name as used.
 */
void check_identifier_expr(const IdentifierExpr * node, RuleContext & ctx);

/// Gated DOM and network types; records the referenced name as used.
void check_type_reference(const TypeReference * node, RuleContext & ctx);

// ============================================================================
// Module structure (rules_exports.cpp)
// ============================================================================

/**
 * Pre-pass over top-level statements: classifies exports, records
 * re-exports, imported `process` bindings and import bindings, and checks
 * export typing and documentation.
 */
void collect_top_level(const Program & program, RuleContext & ctx);

/// no-top-level-side-effects for one top-level statement.
void check_top_level_statement(const Stmt * stmt, RuleContext & ctx);

// Post-pass
void report_one_public_function(RuleContext & ctx);
void report_unused_variables(RuleContext & ctx);
void report_readonly_arrays(RuleContext & ctx);
void report_unused_allow_directives(RuleContext & ctx);

}  // namespace purets::lint
