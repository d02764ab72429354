// purets/lint/rule_presets.cpp - Preset data
#include "purets/lint/rule_presets.hpp"

#include <algorithm>

#include "purets/lint/rule_ids.hpp"

namespace purets::lint
{

namespace
{

using namespace rule;

std::vector<RulePreset> make_presets()
{
  std::vector<RulePreset> presets;

  presets.push_back(RulePreset{
    "strict",
    "All rules enabled for maximum strictness",
    {
      k_no_classes,
      k_no_enums,
      k_no_throw,
      k_no_delete,
      k_no_eval_function,
      k_no_foreach,
      k_no_do_while,
      k_no_as_cast,
      k_let_requires_type,
      k_empty_array_requires_type,
      k_prefer_readonly_array,
      k_no_mutable_record,
      k_no_unused_variables,
      k_no_unused_map,
      k_catch_error_handling,
      k_switch_case_block,
      k_no_namespace_imports,
      k_no_reexports,
      k_import_extensions,
      k_no_http_imports,
      k_no_require,
      k_no_filename_dirname,
      k_no_global_process,
      k_node_import_style,
      k_forbidden_libraries,
      k_max_function_params,
      k_no_this_in_functions,
      k_no_side_effect_functions,
      k_filename_function_match,
      k_export_requires_jsdoc,
      k_jsdoc_param_match,
      k_path_based_restrictions,
      k_no_top_level_side_effects,
    },
    {},
  });

  presets.push_back(RulePreset{
    "relaxed",
    "Relaxed rules for gradual migration",
    {
      k_no_eval_function,
      k_no_delete,
      k_no_unused_variables,
      k_catch_error_handling,
      k_no_http_imports,
      k_forbidden_libraries,
    },
    {
      k_no_classes,
      k_no_throw,
      k_filename_function_match,
      k_export_requires_jsdoc,
      k_no_top_level_side_effects,
    },
  });

  presets.push_back(RulePreset{
    "functional",
    "Functional programming style enforcement",
    {
      k_no_classes,
      k_no_this_in_functions,
      k_no_foreach,
      k_no_do_while,
      k_no_delete,
      k_no_member_assignments,
      k_no_object_assign,
      k_prefer_readonly_array,
      k_no_mutable_record,
      k_no_side_effect_functions,
      k_path_based_restrictions,
      k_let_requires_type,
      k_empty_array_requires_type,
    },
    {
      k_filename_function_match,
    },
  });

  presets.push_back(RulePreset{
    "library",
    "Rules optimized for library development",
    {
      k_export_requires_jsdoc,
      k_jsdoc_param_match,
      k_no_unused_variables,
      k_no_as_cast,
      k_let_requires_type,
      k_prefer_readonly_array,
      k_no_reexports,
      k_filename_function_match,
      k_no_top_level_side_effects,
      k_no_side_effect_functions,
    },
    {
      k_no_classes,
      k_max_function_params,
    },
  });

  presets.push_back(RulePreset{
    "test",
    "Rules for test files",
    {
      k_no_unused_variables,
      k_catch_error_handling,
      k_import_extensions,
    },
    {
      k_no_top_level_side_effects,
      k_filename_function_match,
      k_export_requires_jsdoc,
      k_no_throw,
      k_max_function_params,
    },
  });

  return presets;
}

bool contains(const std::vector<std::string_view> & v, std::string_view s)
{
  return std::find(v.begin(), v.end(), s) != v.end();
}

}  // namespace

std::optional<bool> RulePreset::is_rule_enabled(std::string_view rule) const
{
  if (contains(disabled_rules, rule)) return false;
  if (contains(enabled_rules, rule)) return true;
  return std::nullopt;
}

gsl::span<const RulePreset> all_presets()
{
  static const std::vector<RulePreset> presets = make_presets();
  return {presets.data(), presets.size()};
}

const RulePreset * find_preset(std::string_view name)
{
  for (const RulePreset & p : all_presets()) {
    if (p.name == name) return &p;
  }
  return nullptr;
}

std::vector<std::string_view> preset_names()
{
  std::vector<std::string_view> names;
  for (const RulePreset & p : all_presets()) {
    names.push_back(p.name);
  }
  return names;
}

// ============================================================================
// RuleFilter
// ============================================================================

void RuleFilter::set_override(std::string rule, bool enabled)
{
  overrides_[std::move(rule)] = enabled;
}

bool RuleFilter::is_enabled(std::string_view rule) const
{
  if (is_always_enabled(rule)) return true;

  if (const auto it = overrides_.find(rule); it != overrides_.end()) {
    return it->second;
  }
  if (preset_ == nullptr) return true;
  return preset_->is_rule_enabled(rule).value_or(false);
}

}  // namespace purets::lint
