// tests/unit/lint/test_rule_presets.cpp - Presets and rule filtering
#include <gtest/gtest.h>

#include <algorithm>
#include <string_view>

#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rule_presets.hpp"
#include "purets/test_support/lint_helpers.hpp"

using namespace purets;
using namespace purets::lint;

TEST(LintPresets, AllPresetsAreRegistered)
{
  const auto names = preset_names();
  ASSERT_EQ(names.size(), 5u);
  for (const std::string_view expected : {"strict", "relaxed", "functional", "library", "test"}) {
    EXPECT_NE(std::find(names.begin(), names.end(), expected), names.end()) << expected;
    EXPECT_NE(find_preset(expected), nullptr) << expected;
  }
  EXPECT_EQ(find_preset("nope"), nullptr);
}

TEST(LintPresets, PresetRulesAreKnown)
{
  for (const RulePreset & preset : all_presets()) {
    for (const auto rule : preset.enabled_rules) {
      EXPECT_TRUE(is_known_rule(rule)) << preset.name << ": " << rule;
    }
    for (const auto rule : preset.disabled_rules) {
      EXPECT_TRUE(is_known_rule(rule)) << preset.name << ": " << rule;
    }
  }
}

TEST(LintPresets, PresetVerdicts)
{
  const RulePreset * relaxed = find_preset("relaxed");
  ASSERT_NE(relaxed, nullptr);
  EXPECT_EQ(relaxed->is_rule_enabled(rule::k_no_eval_function), std::optional<bool>(true));
  EXPECT_EQ(relaxed->is_rule_enabled(rule::k_no_classes), std::optional<bool>(false));
  EXPECT_EQ(relaxed->is_rule_enabled(rule::k_no_enums), std::nullopt);
}

TEST(LintPresets, FilterWithoutPresetEnablesEverything)
{
  const RuleFilter filter;
  for (const RuleInfo & info : rule_catalogue()) {
    EXPECT_TRUE(filter.is_enabled(info.id)) << info.id;
  }
}

TEST(LintPresets, FilterResolutionOrder)
{
  RuleFilter filter;
  filter.set_preset(find_preset("relaxed"));

  EXPECT_TRUE(filter.is_enabled(rule::k_no_delete));
  EXPECT_FALSE(filter.is_enabled(rule::k_no_classes));
  // Silent in the preset
  EXPECT_FALSE(filter.is_enabled(rule::k_no_enums));

  filter.set_override(std::string(rule::k_no_classes), true);
  filter.set_override(std::string(rule::k_no_delete), false);
  EXPECT_TRUE(filter.is_enabled(rule::k_no_classes));
  EXPECT_FALSE(filter.is_enabled(rule::k_no_delete));
}

TEST(LintPresets, AlwaysEnabledRules)
{
  RuleFilter filter;
  filter.set_preset(find_preset("test"));
  filter.set_override(std::string(rule::k_unused_expect_error), false);

  EXPECT_TRUE(filter.is_enabled(rule::k_unused_expect_error));
  EXPECT_TRUE(filter.is_enabled(rule::k_parse_error));
}

TEST(LintPresets, DisabledRuleProducesNoDiagnostics)
{
  LintOptions options;
  options.rules.set_preset(find_preset("relaxed"));

  const auto diags = test_support::lint("class A {}\nenum B { C }\n", "test.ts", options);
  EXPECT_EQ(diags.count_code(rule::k_no_classes), 0u);
  EXPECT_EQ(diags.count_code(rule::k_no_enums), 0u);
}

TEST(LintPresets, ExpectErrorForDisabledRuleIsUntriggered)
{
  LintOptions options;
  options.rules.set_override(std::string(rule::k_no_enums), false);

  const auto diags = test_support::lint(
    "// purets-expect-error no-enums\nenum B { C }\n", "test.ts", options);
  EXPECT_EQ(diags.count_code(rule::k_no_enums), 0u);
  EXPECT_EQ(diags.count_code(rule::k_unused_expect_error), 1u);
}
