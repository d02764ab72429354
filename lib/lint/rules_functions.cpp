// purets/lint/rules_functions.cpp - Function shape, parameters and references
#include <algorithm>
#include <vector>

#include <fmt/format.h>

#include "purets/lint/ast_queries.hpp"
#include "purets/lint/jsdoc.hpp"
#include "purets/lint/module_tables.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

constexpr size_t k_max_params = 2;

/// Leading segment of a dotted name: `Foo` for `Foo.Bar`.
std::string_view root_name(std::string_view dotted)
{
  return dotted.substr(0, dotted.find('.'));
}

void gate_global(
  std::string_view name, Feature feature, std::string_view kind, SourceRange range,
  RuleContext & ctx)
{
  if (ctx.use_feature(feature)) return;
  ctx.report(
    rule::k_allow_directives,
    fmt::format("{} '{}' requires '@allow {}' directive", kind, name, to_string(feature)), range);
}

}  // namespace

// ============================================================================
// Function shape
// ============================================================================

void check_param_count(const AstNode * function, size_t param_count, RuleContext & ctx)
{
  if (param_count <= k_max_params) return;

  if (isa<ArrowFunctionExpr>(function)) {
    ctx.report(
      rule::k_max_function_params,
      fmt::format(
        "Arrow function has {} parameters (max: {}). Use an options object as the second "
        "parameter instead",
        param_count, k_max_params),
      function->get_range());
    return;
  }

  std::string_view name;
  if (const auto * decl = dyn_cast<FunctionDecl>(function)) {
    name = decl->name;
  } else if (const auto * expr = dyn_cast<FunctionExpr>(function)) {
    name = expr->name;
  }
  if (name.empty()) name = "<anonymous>";

  ctx.report(
    rule::k_max_function_params,
    fmt::format(
      "Function '{}' has {} parameters (max: {}). Use an options object as the second parameter "
      "instead",
      name, param_count, k_max_params),
    function->get_range());
}

void check_function_signature(
  std::string_view name, gsl::span<Param * const> params, SourceRange range, uint32_t doc_offset,
  RuleContext & ctx)
{
  if (params.empty()) return;

  std::vector<std::string_view> tags;
  if (
    const auto doc =
      find_doc_comment(ctx.source.get_content(), ctx.program.comments, doc_offset)) {
    tags = extract_param_tags(*doc);
  }
  const auto documented = [&](std::string_view p) {
    return std::find(tags.begin(), tags.end(), p) != tags.end();
  };

  std::vector<std::string_view> param_names;
  for (const Param * p : params) {
    const std::string_view param = binding_name(p->binding);
    if (param.empty()) continue;
    param_names.push_back(param);

    if (!p->type) {
      ctx.report(
        rule::k_param_missing_type,
        fmt::format("Parameter '{}' in function '{}' must have a type annotation", param, name),
        p->get_range());
      continue;
    }
    if (!tags.empty() && !documented(param)) {
      ctx.report(
        rule::k_jsdoc_param_match,
        fmt::format("JSDoc @param tag missing for parameter '{}' in function '{}'", param, name),
        p->get_range());
    }
  }

  for (std::string_view tag : tags) {
    // `@param options.limit` documents a property of a parameter.
    if (tag.find('.') != std::string_view::npos) continue;
    if (std::find(param_names.begin(), param_names.end(), tag) != param_names.end()) continue;
    ctx.report(
      rule::k_jsdoc_param_match,
      fmt::format("JSDoc @param '{}' does not match any parameter of function '{}'", tag, name),
      range);
  }
}

// ============================================================================
// References
// ============================================================================

void check_this_expr(const ThisExpr * node, RuleContext & ctx)
{
  if (!ctx.state.in_function || ctx.traits.is_error_file) return;
  ctx.report(
    rule::k_no_this_in_functions, "'this' is not allowed in regular functions", node->get_range());
}

void check_identifier_expr(const IdentifierExpr * node, RuleContext & ctx)
{
  const std::string_view name = node->name;
  const SourceRange range = node->get_range();
  ctx.state.used_names.insert(name);

  if (tables::contains(tables::k_dom_globals, name)) {
    gate_global(name, Feature::Dom, "Access to", range, ctx);
  } else if (tables::contains(tables::k_net_globals, name)) {
    gate_global(name, Feature::Net, "Access to", range, ctx);
  } else if (name == "process") {
    if (ctx.state.imported_process_names.count(name) == 0) {
      ctx.report(
        rule::k_no_global_process,
        "Global 'process' is not allowed. Import it from 'node:process' instead", range);
    }
  } else if (name == "__filename" || name == "__dirname") {
    ctx.report(
      rule::k_no_filename_dirname,
      fmt::format("{} is not allowed in pure TypeScript subset. Use import.meta.url instead", name),
      range);
  }
}

void check_type_reference(const TypeReference * node, RuleContext & ctx)
{
  ctx.state.used_names.insert(root_name(node->name));

  if (tables::contains(tables::k_dom_types, node->name)) {
    gate_global(node->name, Feature::Dom, "Type", node->get_range(), ctx);
  } else if (tables::contains(tables::k_net_types, node->name)) {
    gate_global(node->name, Feature::Net, "Type", node->get_range(), ctx);
  }
}

}  // namespace purets::lint
