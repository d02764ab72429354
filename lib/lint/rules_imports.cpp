// purets/lint/rules_imports.cpp - Import hygiene
#include <algorithm>
#include <string>

#include <fmt/format.h>

#include "purets/lint/module_tables.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

constexpr std::string_view k_node_prefix = "node:";

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

bool is_relative(std::string_view source)
{
  return starts_with(source, "./") || starts_with(source, "../");
}

bool has_import_extension(std::string_view source)
{
  return std::any_of(
    tables::k_import_extensions.begin(), tables::k_import_extensions.end(),
    [&](std::string_view ext) { return ends_with(source, ext); });
}

void check_node_style(const ImportDecl * node, RuleContext & ctx)
{
  const std::string_view source = node->source;

  if (tables::contains(tables::k_node_builtins, source)) {
    ctx.report(
      rule::k_node_import_style,
      fmt::format(
        "Node.js built-in '{}' must be imported with 'node:' prefix. Use 'node:{}' instead", source,
        source),
      node->get_range());
  }

  std::string_view module = source;
  if (starts_with(module, k_node_prefix)) module.remove_prefix(k_node_prefix.size());
  if (tables::contains(tables::k_prefer_promises, module)) {
    ctx.report(
      rule::k_node_import_style,
      fmt::format("Prefer promise-based API. Use 'node:{}/promises' instead of '{}'", module, source),
      node->get_range());
  }
}

}  // namespace

void check_import_decl(const ImportDecl * node, RuleContext & ctx)
{
  const bool has_namespace = std::any_of(
    node->specifiers.begin(), node->specifiers.end(),
    [](const ImportSpecifier * s) { return s->importKind == ImportKind::Namespace; });

  if (has_namespace) {
    if (starts_with(node->source, k_node_prefix)) {
      ctx.report(
        rule::k_node_import_style,
        fmt::format(
          "Use named imports instead of namespace import from '{}'. Example: import {{ readFile }} "
          "from '{}'",
          node->source, node->source),
        node->get_range());
    } else {
      ctx.report(
        rule::k_no_namespace_imports, "Namespace imports are not allowed. Use named imports instead",
        node->get_range());
    }
  }

  check_node_style(node, ctx);
  check_module_source(node->source, node->get_range(), ctx);
}

void check_module_source(std::string_view source, SourceRange range, RuleContext & ctx)
{
  if (is_relative(source) && !has_import_extension(source)) {
    ctx.report(
      rule::k_import_extensions,
      fmt::format(
        "Relative imports must have an extension. Change '{}' to '{}.js'", source, source),
      range);
  }

  if (starts_with(source, "http://") || starts_with(source, "https://")) {
    ctx.report(
      rule::k_no_http_imports,
      fmt::format("HTTP(S) imports are not allowed. Import from '{}' is forbidden", source), range);
  }

  check_library(source, range, ctx);
}

void check_library(std::string_view source, SourceRange range, RuleContext & ctx)
{
  if (tables::contains(tables::k_forbidden_libraries, source) || starts_with(source, "lodash/")) {
    ctx.report(
      rule::k_forbidden_libraries,
      fmt::format("Library '{}' is forbidden. Consider using modern alternatives", source), range);
  }

  for (const tables::LibraryAlternative & alt : tables::k_library_alternatives) {
    if (source == alt.library) {
      ctx.report(
        rule::k_forbidden_libraries,
        fmt::format("Library '{}' has a better alternative. Use '{}' instead", source, alt.alternative),
        range);
    }
  }
}

}  // namespace purets::lint
