// purets/lint/rule_ids.cpp - Rule catalogue
#include "purets/lint/rule_ids.hpp"

#include <algorithm>
#include <array>

namespace purets::lint
{

namespace
{

constexpr std::array k_catalogue = {
  RuleInfo{rule::k_no_classes, "Class declarations and expressions"},
  RuleInfo{rule::k_no_enums, "Enum declarations"},
  RuleInfo{rule::k_no_delete, "The delete operator"},
  RuleInfo{rule::k_no_do_while, "do-while loops"},
  RuleInfo{rule::k_no_getters_setters, "Getters and setters"},
  RuleInfo{rule::k_no_foreach, "Array.prototype.forEach"},
  RuleInfo{rule::k_no_eval_function, "eval() and the Function constructor"},
  RuleInfo{rule::k_no_require, "CommonJS require()"},
  RuleInfo{rule::k_no_define_property, "Object.defineProperty / defineProperties"},
  RuleInfo{rule::k_no_object_assign, "Object.assign"},
  RuleInfo{rule::k_no_member_assignments, "Assignments to object members"},
  RuleInfo{rule::k_no_as_cast, "Type assertions other than 'as const'"},
  RuleInfo{rule::k_interface_extends_only, "Interfaces that extend nothing"},
  RuleInfo{rule::k_no_mutable_record, "Record<K, V> built from an empty object"},
  RuleInfo{rule::k_no_throw, "throw statements"},
  RuleInfo{rule::k_catch_error_handling, "Catch clauses without an error type guard"},
  RuleInfo{rule::k_no_namespace_imports, "import * as x"},
  RuleInfo{rule::k_node_import_style, "Node built-in import style"},
  RuleInfo{rule::k_import_extensions, "Relative imports without a file extension"},
  RuleInfo{rule::k_no_http_imports, "Imports from http(s) URLs"},
  RuleInfo{rule::k_forbidden_libraries, "Forbidden or superseded libraries"},
  RuleInfo{rule::k_no_reexports, "Re-exports outside entry points"},
  RuleInfo{rule::k_no_side_effect_functions, "Non-deterministic calls inside functions"},
  RuleInfo{rule::k_no_this_in_functions, "'this' inside functions"},
  RuleInfo{rule::k_max_function_params, "Functions with more than two parameters"},
  RuleInfo{rule::k_param_missing_type, "Parameters without type annotations"},
  RuleInfo{rule::k_no_constant_condition, "Boolean literal conditions"},
  RuleInfo{rule::k_switch_case_block, "Multi-statement switch cases without a block"},
  RuleInfo{rule::k_let_requires_type, "Untyped, uninitialized let"},
  RuleInfo{rule::k_empty_array_requires_type, "Untyped empty array literals"},
  RuleInfo{rule::k_export_const_type_required, "Exported bindings without a type"},
  RuleInfo{rule::k_no_dynamic_access, "Computed member access with non-numeric keys"},
  RuleInfo{rule::k_prefer_readonly_array, "Arrays that are never mutated"},
  RuleInfo{rule::k_no_top_level_side_effects, "Side effects at module top level"},
  RuleInfo{rule::k_no_unused_map, "map() calls whose result is discarded"},
  RuleInfo{rule::k_no_unused_variables, "Unused variables and imports"},
  RuleInfo{rule::k_one_public_function, "More than one exported function"},
  RuleInfo{rule::k_export_requires_jsdoc, "Exports without a JSDoc block"},
  RuleInfo{rule::k_jsdoc_param_match, "JSDoc @param tags that do not match"},
  RuleInfo{rule::k_no_global_process, "The global 'process' object"},
  RuleInfo{rule::k_no_filename_dirname, "__filename and __dirname"},
  RuleInfo{rule::k_allow_directives, "Gated APIs and unused @allow grants"},
  RuleInfo{rule::k_path_based_restrictions, "Directory conventions"},
  RuleInfo{rule::k_filename_function_match, "Exported function named after the file"},
  RuleInfo{rule::k_unused_expect_error, "purets-expect-error that never fired"},
  RuleInfo{rule::k_parse_error, "Syntax errors"},
};

}  // namespace

gsl::span<const RuleInfo> rule_catalogue() noexcept
{
  return {k_catalogue.data(), k_catalogue.size()};
}

bool is_known_rule(std::string_view id) noexcept
{
  return std::any_of(
    k_catalogue.begin(), k_catalogue.end(), [id](const RuleInfo & r) { return r.id == id; });
}

bool is_always_enabled(std::string_view id) noexcept
{
  return id == rule::k_unused_expect_error || id == rule::k_parse_error;
}

}  // namespace purets::lint
