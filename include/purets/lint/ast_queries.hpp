// purets/lint/ast_queries.hpp - Small syntactic queries used by several rules
#pragma once

#include <charconv>
#include <cstdint>
#include <string_view>

#include "purets/ast/ast.hpp"

namespace purets::lint
{

/// Name of an identifier expression (parentheses skipped), or empty.
[[nodiscard]] inline std::string_view identifier_name(const Expr * e) noexcept
{
  if (const auto * id = dyn_cast<IdentifierExpr>(skip_parens(e))) return id->name;
  return {};
}

/// Name of a simple binding, or empty for patterns.
[[nodiscard]] inline std::string_view binding_name(const AstNode * binding) noexcept
{
  if (const auto * id = dyn_cast<BindingIdent>(binding)) return id->name;
  return {};
}

/// `callee` is `<object>.<property>` with a plain identifier object.
[[nodiscard]] inline bool is_member_of(
  const Expr * callee, std::string_view object, std::string_view property) noexcept
{
  const auto * m = dyn_cast<MemberExpr>(skip_parens(callee));
  return m && m->property == property && identifier_name(m->object) == object;
}

[[nodiscard]] inline bool is_function_like(const Expr * e) noexcept
{
  e = skip_parens(e);
  return isa<FunctionExpr>(e) || isa<ArrowFunctionExpr>(e);
}

/// Key of a computed access that behaves like an array index.
[[nodiscard]] inline bool is_integer_key(const Expr * key) noexcept
{
  key = skip_parens(key);
  if (isa<NumberLiteralExpr>(key)) return true;
  if (const auto * s = dyn_cast<StringLiteralExpr>(key)) {
    std::string_view text = s->value;
    if (!text.empty() && text.front() == '+') text.remove_prefix(1);
    if (text.empty()) return false;
    int32_t value = 0;
    const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    return ec == std::errc() && ptr == text.data() + text.size();
  }
  return false;
}

}  // namespace purets::lint
