// purets/lint/rule_ids.hpp - Rule identifiers and the rule catalogue
//
// Every diagnostic emitted by the linter carries one of these ids as its
// code. Presets and purets.yaml overrides refer to rules by the same ids.
//
#pragma once

#include <gsl/span>
#include <string_view>

namespace purets::lint
{

namespace rule
{

// Banned constructs
inline constexpr std::string_view k_no_classes = "no-classes";
inline constexpr std::string_view k_no_enums = "no-enums";
inline constexpr std::string_view k_no_delete = "no-delete";
inline constexpr std::string_view k_no_do_while = "no-do-while";
inline constexpr std::string_view k_no_getters_setters = "no-getters-setters";
inline constexpr std::string_view k_no_foreach = "no-foreach";
inline constexpr std::string_view k_no_eval_function = "no-eval-function";
inline constexpr std::string_view k_no_require = "no-require";
inline constexpr std::string_view k_no_define_property = "no-define-property";
inline constexpr std::string_view k_no_object_assign = "no-object-assign";
inline constexpr std::string_view k_no_member_assignments = "no-member-assignments";
inline constexpr std::string_view k_no_as_cast = "no-as-cast";
inline constexpr std::string_view k_interface_extends_only = "interface-extends-only";
inline constexpr std::string_view k_no_mutable_record = "no-mutable-record";

// Throw / try
inline constexpr std::string_view k_no_throw = "no-throw";
inline constexpr std::string_view k_catch_error_handling = "catch-error-handling";

// Imports
inline constexpr std::string_view k_no_namespace_imports = "no-namespace-imports";
inline constexpr std::string_view k_node_import_style = "node-import-style";
inline constexpr std::string_view k_import_extensions = "import-extensions";
inline constexpr std::string_view k_no_http_imports = "no-http-imports";
inline constexpr std::string_view k_forbidden_libraries = "forbidden-libraries";
inline constexpr std::string_view k_no_reexports = "no-reexports";

// Functions
inline constexpr std::string_view k_no_side_effect_functions = "no-side-effect-functions";
inline constexpr std::string_view k_no_this_in_functions = "no-this-in-functions";
inline constexpr std::string_view k_max_function_params = "max-function-params";
inline constexpr std::string_view k_param_missing_type = "param-missing-type";

// Statements and declarations
inline constexpr std::string_view k_no_constant_condition = "no-constant-condition";
inline constexpr std::string_view k_switch_case_block = "switch-case-block";
inline constexpr std::string_view k_let_requires_type = "let-requires-type";
inline constexpr std::string_view k_empty_array_requires_type = "empty-array-requires-type";
inline constexpr std::string_view k_export_const_type_required = "export-const-type-required";
inline constexpr std::string_view k_no_dynamic_access = "no-dynamic-access";
inline constexpr std::string_view k_prefer_readonly_array = "prefer-readonly-array";
inline constexpr std::string_view k_no_top_level_side_effects = "no-top-level-side-effects";
inline constexpr std::string_view k_no_unused_map = "no-unused-map";
inline constexpr std::string_view k_no_unused_variables = "no-unused-variables";
inline constexpr std::string_view k_one_public_function = "one-public-function";

// Documentation
inline constexpr std::string_view k_export_requires_jsdoc = "export-requires-jsdoc";
inline constexpr std::string_view k_jsdoc_param_match = "jsdoc-param-match";

// Node globals
inline constexpr std::string_view k_no_global_process = "no-global-process";
inline constexpr std::string_view k_no_filename_dirname = "no-filename-dirname";

// File-level
inline constexpr std::string_view k_allow_directives = "allow-directives";
inline constexpr std::string_view k_path_based_restrictions = "path-based-restrictions";
inline constexpr std::string_view k_filename_function_match = "filename-function-match";
inline constexpr std::string_view k_unused_expect_error = "unused-expect-error";
inline constexpr std::string_view k_parse_error = "parse-error";

}  // namespace rule

/**
 * One entry of the rule catalogue.
 */
struct RuleInfo
{
  std::string_view id;
  std::string_view summary;
};

/// All rules the linter can emit, in catalogue order.
[[nodiscard]] gsl::span<const RuleInfo> rule_catalogue() noexcept;

[[nodiscard]] bool is_known_rule(std::string_view id) noexcept;

/// Rules that no preset or configuration can turn off.
[[nodiscard]] bool is_always_enabled(std::string_view id) noexcept;

}  // namespace purets::lint
