// purets/lint/rules_declarations.cpp - Variable declaration checks
#include <fmt/format.h>

#include "purets/lint/ast_queries.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

bool is_array_annotation(const TypeNode * type)
{
  if (isa<ArrayType>(type)) return true;
  const auto * ref = dyn_cast<TypeReference>(type);
  return ref && ref->name == "Array";
}

bool is_readonly_array_annotation(const TypeNode * type)
{
  if (const auto * ref = dyn_cast<TypeReference>(type)) return ref->name == "ReadonlyArray";
  if (const auto * op = dyn_cast<TypeOperator>(type)) {
    return op->op == TypeOperatorKind::Readonly && isa<ArrayType>(op->operand);
  }
  return false;
}

/// Initializers that produce a fresh mutable array.
bool is_array_initializer(const Expr * init)
{
  init = skip_parens(init);
  if (isa<ArrayLiteralExpr>(init)) return true;
  if (const auto * n = dyn_cast<NewExpr>(init)) return identifier_name(n->callee) == "Array";
  if (const auto * call = dyn_cast<CallExpr>(init)) {
    const Expr * callee = skip_parens(call->callee);
    if (identifier_name(callee) == "Array") return true;
    if (const auto * m = dyn_cast<MemberExpr>(callee)) return identifier_name(m->object) == "Array";
  }
  return false;
}

void track_array(const VarDeclarator * d, std::string_view name, RuleContext & ctx)
{
  if (ctx.state.is_tracked_array(name)) return;
  if (d->type) {
    if (is_array_annotation(d->type)) {
      ctx.state.array_variables.push_back({name, d->get_range()});
    } else if (is_readonly_array_annotation(d->type)) {
      ctx.state.readonly_arrays.insert(name);
    }
    return;
  }
  if (d->init && is_array_initializer(d->init)) {
    ctx.state.array_variables.push_back({name, d->get_range()});
  }
}

void check_declarator(const VarDecl * decl, const VarDeclarator * d, RuleContext & ctx)
{
  const std::string_view name = binding_name(d->binding);
  if (name.empty()) return;

  ctx.state.declared_vars.push_back({name, d->get_range()});

  if (decl->varKind == VarKind::Let && !d->type && !d->init) {
    ctx.report(
      rule::k_let_requires_type, fmt::format("'let' declaration '{}' requires type annotation", name),
      d->get_range());
  }

  const Expr * init = d->init ? skip_parens(d->init) : nullptr;

  if (const auto * array = dyn_cast<ArrayLiteralExpr>(init); array && array->elements.empty()) {
    if (!d->type) {
      ctx.report(
        rule::k_empty_array_requires_type,
        fmt::format("Empty array '{}' requires type annotation", name), d->get_range());
    }
  }

  if (const auto * ref = dyn_cast<TypeReference>(d->type); ref && ref->name == "Record") {
    const auto * object = dyn_cast<ObjectLiteralExpr>(init);
    if (object && object->properties.empty()) {
      ctx.report(
        rule::k_no_mutable_record,
        "Mutable Record<K, V> is not allowed. Use ReadonlyMap or define a specific interface",
        d->get_range());
    }
  }

  track_array(d, name, ctx);

  // A function bound to a name is checked under that name.
  const uint32_t doc_offset = decl->get_range().get_begin().get_offset();
  if (const auto * arrow = dyn_cast<ArrowFunctionExpr>(init)) {
    check_function_signature(name, arrow->params, arrow->get_range(), doc_offset, ctx);
  } else if (const auto * fn = dyn_cast<FunctionExpr>(init); fn && fn->name.empty()) {
    check_function_signature(name, fn->params, fn->get_range(), doc_offset, ctx);
  }
}

}  // namespace

void check_var_decl(const VarDecl * node, RuleContext & ctx)
{
  for (const VarDeclarator * d : node->declarators) {
    check_declarator(node, d, ctx);
  }
}

}  // namespace purets::lint
