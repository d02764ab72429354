// purets/lint/rule_presets.hpp - Named rule bundles and the enabled-rule filter
#pragma once

#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <gsl/span>

namespace purets::lint
{

// ============================================================================
// RulePreset
// ============================================================================

/**
 * A named bundle of rule verdicts.
 *
 * Rules listed in neither set have no verdict from the preset.
 */
struct RulePreset
{
  std::string_view name;
  std::string_view description;
  std::vector<std::string_view> enabled_rules;
  std::vector<std::string_view> disabled_rules;

  /// false if disabled, true if enabled, nullopt if the preset is silent.
  [[nodiscard]] std::optional<bool> is_rule_enabled(std::string_view rule) const;
};

/// strict, relaxed, functional, library, test.
[[nodiscard]] gsl::span<const RulePreset> all_presets();

[[nodiscard]] const RulePreset * find_preset(std::string_view name);

[[nodiscard]] std::vector<std::string_view> preset_names();

// ============================================================================
// RuleFilter
// ============================================================================

/**
 * Decides which rules run for a file.
 *
 * Resolution order: explicit override, then the preset's verdict, then the
 * default. Without a preset every rule defaults to enabled; with one,
 * rules it does not mention default to disabled. `unused-expect-error` and
 * `parse-error` are always enabled.
 */
class RuleFilter
{
public:
  RuleFilter() = default;

  void set_preset(const RulePreset * preset) noexcept { preset_ = preset; }
  [[nodiscard]] const RulePreset * preset() const noexcept { return preset_; }

  void set_override(std::string rule, bool enabled);

  [[nodiscard]] bool is_enabled(std::string_view rule) const;

private:
  const RulePreset * preset_ = nullptr;
  std::map<std::string, bool, std::less<>> overrides_;
};

}  // namespace purets::lint
