// purets/lint/rule_visitor.cpp - Rule dispatch and scope tracking
#include "purets/lint/rule_visitor.hpp"

#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

/// Leading segment of `typeof a.b.c`.
std::string_view query_root(std::string_view expr_name)
{
  return expr_name.substr(0, expr_name.find('.'));
}

}  // namespace

void RuleVisitor::check(const Program & program)
{
  collect_top_level(program, ctx_);

  for (const Stmt * stmt : program.body) {
    check_top_level_statement(stmt, ctx_);
    traverse(stmt);
  }

  report_one_public_function(ctx_);
  report_unused_variables(ctx_);
  report_readonly_arrays(ctx_);
  report_unused_allow_directives(ctx_);
}

// ============================================================================
// Expressions
// ============================================================================

bool RuleVisitor::visit_identifier_expr(const IdentifierExpr * node)
{
  check_identifier_expr(node, ctx_);
  return true;
}

bool RuleVisitor::visit_this_expr(const ThisExpr * node)
{
  check_this_expr(node, ctx_);
  return true;
}

bool RuleVisitor::visit_function_expr(const FunctionExpr * node)
{
  check_param_count(node, node->params.size(), ctx_);
  if (!node->name.empty()) {
    check_function_signature(
      node->name, node->params, node->get_range(), node->get_range().get_begin().get_offset(),
      ctx_);
  }
  return in_function_scope([&] { return Base::visit_function_expr(node); });
}

bool RuleVisitor::visit_arrow_function_expr(const ArrowFunctionExpr * node)
{
  check_param_count(node, node->params.size(), ctx_);
  return in_function_scope([&] { return Base::visit_arrow_function_expr(node); });
}

bool RuleVisitor::visit_class_expr(const ClassExpr * node)
{
  check_class(node, node->superClass, ctx_);
  return Base::visit_class_expr(node);
}

bool RuleVisitor::visit_call_expr(const CallExpr * node)
{
  check_call_expr(node, ctx_);
  return Base::visit_call_expr(node);
}

bool RuleVisitor::visit_new_expr(const NewExpr * node)
{
  check_new_expr(node, ctx_);
  return Base::visit_new_expr(node);
}

bool RuleVisitor::visit_member_expr(const MemberExpr * node)
{
  check_member_expr(node, ctx_);
  return Base::visit_member_expr(node);
}

bool RuleVisitor::visit_index_expr(const IndexExpr * node)
{
  check_index_expr(node, ctx_);
  return Base::visit_index_expr(node);
}

bool RuleVisitor::visit_assign_expr(const AssignExpr * node)
{
  check_assign_expr(node, ctx_);

  // A computed target is reported as an assignment, not as a read.
  if (const auto * index = dyn_cast<IndexExpr>(skip_parens(node->target))) {
    return traverse(index->object) && traverse(index->index) && traverse(node->value);
  }
  return Base::visit_assign_expr(node);
}

bool RuleVisitor::visit_unary_expr(const UnaryExpr * node)
{
  check_unary_expr(node, ctx_);
  return Base::visit_unary_expr(node);
}

bool RuleVisitor::visit_as_expr(const AsExpr * node)
{
  check_as_expr(node, ctx_);
  return Base::visit_as_expr(node);
}

bool RuleVisitor::visit_type_assertion_expr(const TypeAssertionExpr * node)
{
  check_type_assertion_expr(node, ctx_);
  return Base::visit_type_assertion_expr(node);
}

// ============================================================================
// Type nodes
// ============================================================================

bool RuleVisitor::visit_type_reference(const TypeReference * node)
{
  check_type_reference(node, ctx_);
  return Base::visit_type_reference(node);
}

bool RuleVisitor::visit_type_query(const TypeQuery * node)
{
  ctx_.state.used_names.insert(query_root(node->exprName));
  return true;
}

// ============================================================================
// Statements
// ============================================================================

bool RuleVisitor::visit_expr_stmt(const ExprStmt * node)
{
  check_expr_stmt(node, ctx_);
  return Base::visit_expr_stmt(node);
}

bool RuleVisitor::visit_if_stmt(const IfStmt * node)
{
  check_if_stmt(node, ctx_);
  return Base::visit_if_stmt(node);
}

bool RuleVisitor::visit_while_stmt(const WhileStmt * node)
{
  check_while_stmt(node, ctx_);
  return Base::visit_while_stmt(node);
}

bool RuleVisitor::visit_do_while_stmt(const DoWhileStmt * node)
{
  check_do_while_stmt(node, ctx_);
  return Base::visit_do_while_stmt(node);
}

bool RuleVisitor::visit_throw_stmt(const ThrowStmt * node)
{
  check_throw_stmt(node, ctx_);
  return Base::visit_throw_stmt(node);
}

// ============================================================================
// Declarations
// ============================================================================

bool RuleVisitor::visit_var_decl(const VarDecl * node)
{
  check_var_decl(node, ctx_);
  return Base::visit_var_decl(node);
}

bool RuleVisitor::visit_function_decl(const FunctionDecl * node)
{
  check_param_count(node, node->params.size(), ctx_);
  check_function_signature(
    node->name, node->params, node->get_range(), node->get_range().get_begin().get_offset(), ctx_);
  return in_function_scope([&] { return Base::visit_function_decl(node); });
}

bool RuleVisitor::visit_class_decl(const ClassDecl * node)
{
  check_class(node, node->superClass, ctx_);
  return Base::visit_class_decl(node);
}

bool RuleVisitor::visit_interface_decl(const InterfaceDecl * node)
{
  check_interface_decl(node, ctx_);
  return Base::visit_interface_decl(node);
}

bool RuleVisitor::visit_enum_decl(const EnumDecl * node)
{
  check_enum_decl(node, ctx_);
  return Base::visit_enum_decl(node);
}

bool RuleVisitor::visit_import_decl(const ImportDecl * node)
{
  check_import_decl(node, ctx_);
  return Base::visit_import_decl(node);
}

// ============================================================================
// Supporting nodes
// ============================================================================

bool RuleVisitor::visit_param(const Param * node)
{
  if (!traverse(node->binding) || !traverse(node->type)) return false;

  const bool saved = ctx_.state.in_default_parameter;
  ctx_.state.in_default_parameter = true;
  const bool result = traverse(node->defaultValue);
  ctx_.state.in_default_parameter = saved;
  return result;
}

bool RuleVisitor::visit_object_property(const ObjectProperty * node)
{
  check_object_property(node, ctx_);
  return Base::visit_object_property(node);
}

bool RuleVisitor::visit_class_member(const ClassMember * node)
{
  check_class_member(node, ctx_);
  return Base::visit_class_member(node);
}

bool RuleVisitor::visit_switch_case(const SwitchCase * node)
{
  check_switch_case(node, ctx_);
  return Base::visit_switch_case(node);
}

bool RuleVisitor::visit_catch_clause(const CatchClause * node)
{
  check_catch_clause(node, ctx_);
  return Base::visit_catch_clause(node);
}

}  // namespace purets::lint
