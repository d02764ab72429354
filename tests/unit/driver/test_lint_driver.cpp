// tests/unit/driver/test_lint_driver.cpp - Lint driver and source discovery
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include "purets/driver/lint_driver.hpp"
#include "purets/lint/rule_ids.hpp"

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
  fs::create_directories(p.parent_path());
  std::ofstream out(p);
  ASSERT_TRUE(out.is_open()) << "Failed to open file for writing: " << p.string();
  out << s;
}

}  // namespace

TEST(LintDriver, CleanSourceSucceeds)
{
  const auto result = LintDriver::lint_source(
    "src/add.ts", R"(/**
 * Adds two numbers.
 * @param a left
 * @param b right
 */
export function add(a: number, b: number): number {
  return a + b;
}
)",
    {});
  EXPECT_TRUE(result.success);
  EXPECT_FALSE(result.parse_failed);
  EXPECT_TRUE(result.diagnostics.empty());
  EXPECT_EQ(result.source.get_path(), fs::path("src/add.ts"));
}

TEST(LintDriver, ViolationsAreReported)
{
  const auto result = LintDriver::lint_source("a.ts", "enum E { X }\n", {});
  EXPECT_FALSE(result.success);
  EXPECT_FALSE(result.parse_failed);
  EXPECT_EQ(result.diagnostics.count_code(lint::rule::k_no_enums), 1u);
}

TEST(LintDriver, ParseErrorsSkipRules)
{
  const auto result = LintDriver::lint_source("a.ts", "const = 1;\nenum E { X }\n", {});
  EXPECT_FALSE(result.success);
  EXPECT_TRUE(result.parse_failed);
  ASSERT_FALSE(result.diagnostics.empty());
  EXPECT_EQ(result.diagnostics.count_code(lint::rule::k_parse_error), result.diagnostics.size());
}

TEST(LintDriver, UnreadableFileIsIoError)
{
  const auto result = LintDriver::lint_file("/nonexistent/purets/missing.ts", {});
  EXPECT_TRUE(result.io_error);
  EXPECT_FALSE(result.success);
  EXPECT_NE(result.error.find("cannot read file"), std::string::npos);
}

TEST(LintDriver, LintFileReadsFromDisk)
{
  const fs::path dir = make_temp_dir("purets_driver");
  write_all(dir / "pure" / "calc.ts", "class Calc {}\n");

  const auto result = LintDriver::lint_file(dir / "pure" / "calc.ts", {});
  EXPECT_FALSE(result.io_error);
  EXPECT_EQ(result.diagnostics.count_code(lint::rule::k_no_classes), 1u);

  fs::remove_all(dir);
}

TEST(LintDriver, DiscoverSourcesSkipsDependenciesAndHiddenDirs)
{
  const fs::path dir = make_temp_dir("purets_discover");
  write_all(dir / "src" / "b.ts", "");
  write_all(dir / "src" / "a.tsx", "");
  write_all(dir / "src" / "readme.md", "");
  write_all(dir / "node_modules" / "lib" / "index.ts", "");
  write_all(dir / ".cache" / "x.ts", "");

  const auto files = discover_sources(dir);
  ASSERT_EQ(files.size(), 2u);
  EXPECT_EQ(files[0].filename(), "a.tsx");
  EXPECT_EQ(files[1].filename(), "b.ts");

  const auto single = discover_sources(dir / "src" / "b.ts");
  ASSERT_EQ(single.size(), 1u);

  fs::remove_all(dir);
}

TEST(LintDriver, SettingsMarkEntryAndMainFiles)
{
  LintSettings settings;
  settings.entry_points.push_back(fs::absolute("src/api.ts"));
  settings.main_entries.push_back(fs::absolute("src/cli.ts"));
  settings.test_runner = lint::TestRunner::DenoTest;

  const auto api = settings.options_for("src/api.ts");
  EXPECT_TRUE(api.is_entry_point);
  EXPECT_FALSE(api.is_main_entry);
  EXPECT_EQ(api.test_runner, std::optional<lint::TestRunner>(lint::TestRunner::DenoTest));

  const auto cli = settings.options_for("src/cli.ts");
  EXPECT_TRUE(cli.is_main_entry);

  const auto other = settings.options_for("src/other.ts");
  EXPECT_FALSE(other.is_entry_point);
  EXPECT_FALSE(other.is_main_entry);
}
