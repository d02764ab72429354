// purets/lint/lint_options.hpp - Per-file lint options and path-derived facts
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

#include "purets/lint/rule_presets.hpp"
#include "purets/lint/test_runner.hpp"

namespace purets::lint
{

/**
 * Options the driver passes to one file's lint run.
 */
struct LintOptions
{
  /// Print progress lines and source excerpts
  bool verbose = false;

  /// Runner whose imports and registration calls test files use
  std::optional<TestRunner> test_runner;

  /// File was named with --entry (or in `entry:` of purets.yaml)
  bool is_entry_point = false;

  /// File was named with --main (or in `main:` of purets.yaml)
  bool is_main_entry = false;

  RuleFilter rules;
};

/**
 * Facts derived once from a file's path and options.
 *
 * Directory checks match path segments, so `src/io/read.ts` and
 * `io/read.ts` are both I/O files.
 */
struct FileTraits
{
  std::string normalized_path;  ///< Backslashes replaced by '/'
  std::string file_name;        ///< Last path component
  std::string stem;             ///< file_name without its extension

  bool is_error_file = false;  ///< under errors/
  bool is_io_error_file = false;  ///< under io/errors/
  bool is_types_file = false;  ///< under types/
  bool is_pure_file = false;   ///< under pure/
  bool is_io_file = false;     ///< under io/
  bool is_test_file = false;   ///< *_test.ts, *.test.ts, *.spec.ts (and .tsx)
  bool is_index_file = false;  ///< stem `index`
  bool is_entry_point = false;  ///< index file, or flagged entry/main
  bool is_main_entry = false;   ///< main.ts, or flagged main

  std::optional<TestRunner> test_runner;

  [[nodiscard]] static FileTraits from_path(
    const std::filesystem::path & path, const LintOptions & options);

  /// Stem of a test file without its `_test` / `.test` / `.spec` suffix.
  [[nodiscard]] std::string_view tested_name() const;
};

}  // namespace purets::lint
