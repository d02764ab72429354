// purets/lint/rules_control.cpp - Conditions, switch cases, throw and catch
#include <fmt/format.h>

#include "purets/lint/ast_queries.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// `Error.isError(<param>)` or `<param> instanceof Error`.
bool is_error_guard(const Expr * test, std::string_view param)
{
  test = skip_parens(test);
  if (const auto * call = dyn_cast<CallExpr>(test)) {
    return is_member_of(call->callee, "Error", "isError") && !call->args.empty() &&
           identifier_name(call->args[0]) == param;
  }
  if (const auto * bin = dyn_cast<BinaryExpr>(test)) {
    return bin->op == BinaryOp::InstanceOf && identifier_name(bin->lhs) == param &&
           identifier_name(bin->rhs) == "Error";
  }
  return false;
}

}  // namespace

void check_if_stmt(const IfStmt * node, RuleContext & ctx)
{
  const Expr * test = skip_parens(node->condition);
  if (isa<BoolLiteralExpr>(test)) {
    ctx.report(
      rule::k_no_constant_condition, "Avoid constant conditions in if statements",
      node->condition->get_range());
  }
}

void check_while_stmt(const WhileStmt * node, RuleContext & ctx)
{
  const auto * lit = dyn_cast<BoolLiteralExpr>(skip_parens(node->condition));
  if (lit && lit->value) {
    ctx.report(
      rule::k_no_constant_condition, "Avoid constant conditions in while statements",
      node->condition->get_range());
  }
}

void check_switch_case(const SwitchCase * node, RuleContext & ctx)
{
  const auto & body = node->body;
  if (body.size() <= 1) return;
  for (const Stmt * stmt : body) {
    if (isa<BlockStmt>(stmt)) return;
  }

  ctx.report(
    rule::k_switch_case_block, "Switch cases with multiple statements should use block scope",
    node->get_range());
}

void check_throw_stmt(const ThrowStmt * node, RuleContext & ctx)
{
  if (!ctx.use_feature(Feature::Throws)) {
    ctx.report(
      rule::k_no_throw,
      "Throw statements are not allowed. Use Result type instead (or add '@allow throws')",
      node->get_range());
    return;
  }

  const Expr * value = skip_parens(node->value);
  if (isa<IdentifierExpr>(value)) return;
  if (const auto * n = dyn_cast<NewExpr>(value); n && ends_with(identifier_name(n->callee), "Error")) {
    return;
  }
  ctx.report(
    rule::k_no_throw, "Only Error subclasses or rethrown errors can be thrown", node->get_range());
}

void check_catch_clause(const CatchClause * node, RuleContext & ctx)
{
  if (!node->param) {
    ctx.report(
      rule::k_catch_error_handling,
      "Catch clause must have an error parameter to handle errors properly", node->get_range());
    return;
  }

  // Destructured parameters cannot be guarded by name.
  const std::string_view param = binding_name(node->param);
  if (param.empty()) return;

  if (node->body->body.empty()) {
    ctx.report(
      rule::k_catch_error_handling,
      "Empty catch block is not allowed. Must handle error properly with type checking and "
      "neverthrow's err()",
      node->get_range());
    return;
  }

  const auto * first = dyn_cast<IfStmt>(node->body->body[0]);
  if (first && is_error_guard(first->condition, param)) return;

  ctx.report(
    rule::k_catch_error_handling,
    fmt::format(
      "Catch block must check error type with 'if (Error.isError({}))' or similar type guard, "
      "then wrap with neverthrow's err()",
      param),
    node->get_range());
}

void check_expr_stmt(const ExprStmt * node, RuleContext & ctx)
{
  const auto * call = dyn_cast<CallExpr>(skip_parens(node->expr));
  if (!call) return;
  const auto * callee = dyn_cast<MemberExpr>(skip_parens(call->callee));
  if (callee && callee->property == "map") {
    ctx.report(rule::k_no_unused_map, "map() return value must be used", node->get_range());
  }
}

}  // namespace purets::lint
