// tests/unit/project/test_lint_config.cpp - purets.yaml loading and validation
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "purets/lint/rule_ids.hpp"
#include "purets/project/lint_config.hpp"

using namespace purets;

namespace fs = std::filesystem;

namespace
{

fs::path make_temp_dir(std::string_view prefix)
{
  const auto base = fs::temp_directory_path();
  const auto now = std::chrono::steady_clock::now().time_since_epoch().count();
  const fs::path dir = base / (std::string(prefix) + "_" + std::to_string(now));
  fs::create_directories(dir);
  return dir;
}

void write_all(const fs::path & p, const std::string & s)
{
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

TEST(LintConfig, EmptyDocumentIsDefault)
{
  const auto result = parse_lint_config("", "/project");
  ASSERT_TRUE(result.success) << result.error;
  EXPECT_FALSE(result.config.preset.has_value());
  EXPECT_TRUE(result.config.rules.empty());
  EXPECT_FALSE(result.config.test_runner.has_value());
}

TEST(LintConfig, ParsesAllKeys)
{
  const auto result = parse_lint_config(R"(
preset: relaxed
rules:
  no-enums: true
  no-delete: false
test_runner: node-test
entry: [src/index.ts, src/api.ts]
main: src/main.ts
)",
                                        "/project");
  ASSERT_TRUE(result.success) << result.error;

  const LintConfig & config = result.config;
  EXPECT_EQ(config.preset, std::optional<std::string>("relaxed"));
  ASSERT_EQ(config.rules.size(), 2u);
  EXPECT_TRUE(config.rules.at("no-enums"));
  EXPECT_FALSE(config.rules.at("no-delete"));
  EXPECT_EQ(config.test_runner, std::optional<lint::TestRunner>(lint::TestRunner::NodeTest));

  ASSERT_EQ(config.entry_points.size(), 2u);
  EXPECT_EQ(config.entry_points[0], fs::path("/project") / "src/index.ts");
  ASSERT_EQ(config.main_entries.size(), 1u);
  EXPECT_EQ(config.main_entries[0], fs::path("/project") / "src/main.ts");
}

TEST(LintConfig, RuleFilterAppliesPresetAndOverrides)
{
  const auto result = parse_lint_config("preset: relaxed\nrules:\n  no-enums: true\n", "/p");
  ASSERT_TRUE(result.success) << result.error;

  const auto filter = result.config.make_rule_filter();
  EXPECT_TRUE(filter.is_enabled(lint::rule::k_no_enums));
  EXPECT_FALSE(filter.is_enabled(lint::rule::k_no_classes));

  // A command-line preset replaces the file's preset; overrides still apply.
  const auto strict = result.config.make_rule_filter(std::string("strict"));
  EXPECT_TRUE(strict.is_enabled(lint::rule::k_no_classes));
  EXPECT_TRUE(strict.is_enabled(lint::rule::k_no_enums));
}

TEST(LintConfig, RejectsUnknownPreset)
{
  const auto result = parse_lint_config("preset: extreme\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("unknown preset: 'extreme'"), std::string::npos) << result.error;
  EXPECT_NE(result.error.find("strict"), std::string::npos) << result.error;
}

TEST(LintConfig, RejectsUnknownRule)
{
  const auto result = parse_lint_config("rules:\n  no-goto: true\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("unknown rule in rules: 'no-goto'"), std::string::npos);
}

TEST(LintConfig, RejectsInvalidTestRunner)
{
  const auto result = parse_lint_config("test_runner: jest\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("invalid test_runner: 'jest'"), std::string::npos);
}

TEST(LintConfig, RejectsMalformedYaml)
{
  const auto result = parse_lint_config("rules: [unterminated\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("failed to parse YAML"), std::string::npos);
}

TEST(LintConfig, RejectsNonMapRoot)
{
  const auto result = parse_lint_config("- a\n- b\n", "/p");
  EXPECT_FALSE(result.success);
  EXPECT_EQ(result.error, "configuration root must be a map");
}

TEST(LintConfig, LoadMissingFileFails)
{
  const auto result = load_lint_config("/nonexistent/dir/purets.yaml");
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("configuration file not found"), std::string::npos);
}

TEST(LintConfig, LoadResolvesPathsAgainstConfigDirectory)
{
  const fs::path dir = make_temp_dir("purets_config");
  write_all(dir / "purets.yaml", "entry: src/index.ts\n");

  const auto result = load_lint_config(dir / "purets.yaml");
  ASSERT_TRUE(result.success) << result.error;
  ASSERT_EQ(result.config.entry_points.size(), 1u);
  EXPECT_EQ(result.config.entry_points[0], fs::absolute(dir) / "src/index.ts");

  fs::remove_all(dir);
}

TEST(LintConfig, FindSearchesUpward)
{
  const fs::path dir = make_temp_dir("purets_find");
  const fs::path nested = dir / "src" / "pure";
  fs::create_directories(nested);
  write_all(dir / "purets.yaml", "preset: strict\n");

  const auto found = find_lint_config(nested);
  ASSERT_TRUE(found.has_value());
  EXPECT_EQ(fs::weakly_canonical(*found), fs::weakly_canonical(dir / "purets.yaml"));

  fs::remove_all(dir);
}
