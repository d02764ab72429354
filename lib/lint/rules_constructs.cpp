// purets/lint/rules_constructs.cpp - Banned constructs, calls and member access
#include <string>

#include <fmt/format.h>

#include "purets/lint/ast_queries.hpp"
#include "purets/lint/module_tables.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

void report_side_effect(std::string_view what, SourceRange range, RuleContext & ctx)
{
  ctx.report(
    rule::k_no_side_effect_functions,
    fmt::format(
      "Direct use of '{}' is not allowed in functions. Pass it as a parameter or use a default "
      "parameter instead",
      what),
    range);
}

/// Side effects count inside function bodies but not in default values.
bool in_side_effect_scope(const RuleContext & ctx)
{
  return ctx.state.in_function && !ctx.state.in_default_parameter;
}

void report_accessor(PropertyKind kind, std::string_view name, SourceRange range, RuleContext & ctx)
{
  const std::string_view label = kind == PropertyKind::Getter ? "Getter" : "Setter";
  ctx.report(
    rule::k_no_getters_setters,
    fmt::format(
      "{} '{}' is not allowed. Use regular methods instead", label,
      name.empty() ? std::string_view("computed") : name),
    range);
}

void check_member_call(const CallExpr * node, const MemberExpr * callee, RuleContext & ctx)
{
  const std::string_view object = identifier_name(callee->object);
  const std::string_view method = callee->property;

  if (method == "forEach") {
    ctx.report(
      rule::k_no_foreach, "forEach is not allowed. Use for...of loop instead", node->get_range());
  }

  if (object == "Object" && (method == "defineProperty" || method == "defineProperties")) {
    ctx.report(
      rule::k_no_define_property,
      fmt::format(
        "Object.{} is not allowed. Use direct property assignment or object literals instead",
        method),
      node->get_range());
  }

  if (!object.empty() && tables::contains(tables::k_mutating_array_methods, method)) {
    ctx.state.mutated_arrays.insert(object);
  }

  if (object == "console" && !ctx.use_feature(Feature::Console)) {
    ctx.report(
      rule::k_allow_directives, "Use of 'console' requires '@allow console' directive",
      node->get_range());
  }

  if (in_side_effect_scope(ctx)) {
    if (object == "Math" && method == "random") {
      report_side_effect("Math.random()", node->get_range(), ctx);
    } else if (object == "Date" && method == "now") {
      report_side_effect("Date.now()", node->get_range(), ctx);
    }
  }
}

void check_plain_call(const CallExpr * node, std::string_view callee, RuleContext & ctx)
{
  if (callee == "eval") {
    ctx.report(rule::k_no_eval_function, "eval() is not allowed", node->get_range());
    return;
  }
  if (callee == "Function") {
    ctx.report(rule::k_no_eval_function, "new Function() is not allowed", node->get_range());
    return;
  }
  if (callee == "require") {
    ctx.report(
      rule::k_no_require, "require() is not allowed. Use ES6 import statements instead",
      node->get_range());
    if (!node->args.empty()) {
      if (const auto * lit = dyn_cast<StringLiteralExpr>(skip_parens(node->args[0]))) {
        check_library(lit->value, node->get_range(), ctx);
      }
    }
    return;
  }

  if (tables::contains(tables::k_timer_functions, callee)) {
    if (!ctx.use_feature(Feature::Timers)) {
      ctx.report(
        rule::k_allow_directives,
        fmt::format("Use of '{}' requires '@allow timers' directive", callee), node->get_range());
    }
    if (in_side_effect_scope(ctx)) {
      report_side_effect(fmt::format("{}()", callee), node->get_range(), ctx);
    }
  }
}

}  // namespace

// ============================================================================
// Declarations
// ============================================================================

void check_class(const AstNode * node, const Expr * super_class, RuleContext & ctx)
{
  // Error files are required to declare `class XError extends Error`.
  if (ctx.traits.is_error_file && identifier_name(super_class) == "Error") return;

  ctx.report(
    rule::k_no_classes, "Classes are not allowed in pure TypeScript subset", node->get_range());
}

void check_enum_decl(const EnumDecl * node, RuleContext & ctx)
{
  ctx.report(
    rule::k_no_enums, "Enums are not allowed in pure TypeScript subset", node->get_range());
}

void check_interface_decl(const InterfaceDecl * node, RuleContext & ctx)
{
  if (!node->extends.empty()) return;
  ctx.report(
    rule::k_interface_extends_only,
    fmt::format("Interface '{}' without extends is not allowed. Use 'type' instead", node->name),
    node->get_range());
}

void check_do_while_stmt(const DoWhileStmt * node, RuleContext & ctx)
{
  ctx.report(
    rule::k_no_do_while, "do-while statements are not allowed. Use while instead",
    node->get_range());
}

void check_object_property(const ObjectProperty * node, RuleContext & ctx)
{
  if (node->propKind == PropertyKind::Getter || node->propKind == PropertyKind::Setter) {
    report_accessor(node->propKind, node->key, node->get_range(), ctx);
  }
}

void check_class_member(const ClassMember * node, RuleContext & ctx)
{
  if (node->memberKind == ClassMemberKind::Getter) {
    report_accessor(PropertyKind::Getter, node->name, node->get_range(), ctx);
  } else if (node->memberKind == ClassMemberKind::Setter) {
    report_accessor(PropertyKind::Setter, node->name, node->get_range(), ctx);
  }
}

// ============================================================================
// Expressions
// ============================================================================

void check_unary_expr(const UnaryExpr * node, RuleContext & ctx)
{
  if (node->op == UnaryOp::Delete) {
    ctx.report(rule::k_no_delete, "Delete operator is not allowed", node->get_range());
  }
}

void check_as_expr(const AsExpr * node, RuleContext & ctx)
{
  if (node->isConst || node->isSatisfies) return;
  ctx.report(rule::k_no_as_cast, "Type assertions with 'as' are not allowed", node->get_range());
}

void check_type_assertion_expr(const TypeAssertionExpr * node, RuleContext & ctx)
{
  ctx.report(
    rule::k_no_as_cast, "Angle-bracket type assertions are not allowed", node->get_range());
}

void check_member_expr(const MemberExpr * node, RuleContext & ctx)
{
  if (node->property == "assign" && identifier_name(node->object) == "Object") {
    ctx.report(
      rule::k_no_object_assign, "Object.assign is not allowed. Use spread operator instead",
      node->get_range());
  }
}

void check_index_expr(const IndexExpr * node, RuleContext & ctx)
{
  if (is_integer_key(node->index)) return;
  ctx.report(
    rule::k_no_dynamic_access,
    "Dynamic property access is not allowed. Use dot notation or destructuring instead",
    node->get_range());
}

void check_assign_expr(const AssignExpr * node, RuleContext & ctx)
{
  const Expr * target = skip_parens(node->target);
  const bool is_member = isa<MemberExpr>(target) || isa<IndexExpr>(target);

  if (is_member && !ctx.traits.is_error_file) {
    ctx.report(
      rule::k_no_member_assignments, "Direct member assignments are not allowed",
      node->get_range());
  }

  if (const auto * index = dyn_cast<IndexExpr>(target)) {
    if (!is_integer_key(index->index)) {
      ctx.report(
        rule::k_no_dynamic_access,
        "Dynamic property assignment is not allowed. Use dot notation instead",
        index->get_range());
    }
    if (const std::string_view name = identifier_name(index->object); !name.empty()) {
      ctx.state.mutated_arrays.insert(name);
    }
  }
}

void check_call_expr(const CallExpr * node, RuleContext & ctx)
{
  const Expr * callee = skip_parens(node->callee);
  if (const auto * member = dyn_cast<MemberExpr>(callee)) {
    check_member_call(node, member, ctx);
  } else if (const auto * id = dyn_cast<IdentifierExpr>(callee)) {
    check_plain_call(node, id->name, ctx);
  }
}

void check_new_expr(const NewExpr * node, RuleContext & ctx)
{
  const std::string_view callee = identifier_name(node->callee);
  if (callee == "Function") {
    ctx.report(rule::k_no_eval_function, "new Function() is not allowed", node->get_range());
  } else if (callee == "Date" && in_side_effect_scope(ctx)) {
    report_side_effect("new Date()", node->get_range(), ctx);
  }
}

}  // namespace purets::lint
