// purets/lint/rule_visitor.hpp - Walks one program and dispatches rule checks
//
// The visitor owns the traversal: it runs the export pre-pass, visits every
// top-level statement, keeps the scope flags in VisitorState current, and
// finishes with the post-pass reports.
//
#pragma once

#include "purets/ast/ast.hpp"
#include "purets/ast/visitor.hpp"
#include "purets/lint/rule_context.hpp"

namespace purets::lint
{

/**
 * Rule dispatch for one file.
 *
 * Each overridden visit method runs the checks for its node kind and then
 * continues into the children through the base visitor.
 */
class RuleVisitor : public ConstRecursiveAstVisitor<RuleVisitor>
{
  using Base = ConstRecursiveAstVisitor<RuleVisitor>;

public:
  explicit RuleVisitor(RuleContext & ctx) : ctx_(ctx) {}

  // ===========================================================================
  // Entry Point
  // ===========================================================================

  /**
   * Run the pre-pass, the walk and the post-pass over `program`.
   *
   * Diagnostics go to the context's sink in that order.
   */
  void check(const Program & program);

  // ===========================================================================
  // Visitor Methods
  // ===========================================================================

  // Expressions
  bool visit_identifier_expr(const IdentifierExpr * node);
  bool visit_this_expr(const ThisExpr * node);
  bool visit_function_expr(const FunctionExpr * node);
  bool visit_arrow_function_expr(const ArrowFunctionExpr * node);
  bool visit_class_expr(const ClassExpr * node);
  bool visit_call_expr(const CallExpr * node);
  bool visit_new_expr(const NewExpr * node);
  bool visit_member_expr(const MemberExpr * node);
  bool visit_index_expr(const IndexExpr * node);
  bool visit_assign_expr(const AssignExpr * node);
  bool visit_unary_expr(const UnaryExpr * node);
  bool visit_as_expr(const AsExpr * node);
  bool visit_type_assertion_expr(const TypeAssertionExpr * node);

  // Type nodes
  bool visit_type_reference(const TypeReference * node);
  bool visit_type_query(const TypeQuery * node);

  // Statements
  bool visit_expr_stmt(const ExprStmt * node);
  bool visit_if_stmt(const IfStmt * node);
  bool visit_while_stmt(const WhileStmt * node);
  bool visit_do_while_stmt(const DoWhileStmt * node);
  bool visit_throw_stmt(const ThrowStmt * node);

  // Declarations
  bool visit_var_decl(const VarDecl * node);
  bool visit_function_decl(const FunctionDecl * node);
  bool visit_class_decl(const ClassDecl * node);
  bool visit_interface_decl(const InterfaceDecl * node);
  bool visit_enum_decl(const EnumDecl * node);
  bool visit_import_decl(const ImportDecl * node);

  // Supporting nodes
  bool visit_param(const Param * node);
  bool visit_object_property(const ObjectProperty * node);
  bool visit_class_member(const ClassMember * node);
  bool visit_switch_case(const SwitchCase * node);
  bool visit_catch_clause(const CatchClause * node);

private:
  /// Run `walk` with `in_function` set, restoring the previous value.
  template <typename Walk>
  bool in_function_scope(Walk && walk)
  {
    const bool saved = ctx_.state.in_function;
    ctx_.state.in_function = true;
    const bool result = walk();
    ctx_.state.in_function = saved;
    return result;
  }

  RuleContext & ctx_;
};

}  // namespace purets::lint
