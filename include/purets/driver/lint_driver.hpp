// purets/driver/lint_driver.hpp - Lint driver
//
// Single entry point for the parse + lint pipeline of one file, plus the
// source discovery used by the CLI.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"
#include "purets/lint/lint_options.hpp"

namespace purets
{

// ============================================================================
// Lint Settings
// ============================================================================

/**
 * Settings shared by every file of one run, merged from purets.yaml and
 * the command line.
 */
struct LintSettings
{
  bool verbose = false;

  std::optional<lint::TestRunner> test_runner;

  /// Files treated as entry points (--entry / `entry:`)
  std::vector<std::filesystem::path> entry_points;

  /// Files treated as main entries (--main / `main:`)
  std::vector<std::filesystem::path> main_entries;

  lint::RuleFilter rules;

  /// Options for linting `file`.
  [[nodiscard]] lint::LintOptions options_for(const std::filesystem::path & file) const;
};

// ============================================================================
// Lint Result
// ============================================================================

struct LintFileResult
{
  /// True when the file was read, parsed and produced no diagnostics
  bool success = false;

  /// The file could not be read; see `error`
  bool io_error = false;

  /// The file had syntax errors; `diagnostics` holds them instead of lint results
  bool parse_failed = false;

  std::string error;

  DiagnosticBag diagnostics;

  /// The linted source, for rendering diagnostics
  SourceFile source;
};

// ============================================================================
// Lint Driver
// ============================================================================

class LintDriver
{
public:
  /**
   * Parse and lint in-memory source.
   *
   * @param path    Path used for path policies and reporting
   * @param text    File content
   * @param options Per-file options
   */
  [[nodiscard]] static LintFileResult lint_source(
    const std::filesystem::path & path, std::string text, const lint::LintOptions & options);

  /**
   * Read, parse and lint a file. Unreadable files set `io_error`.
   */
  [[nodiscard]] static LintFileResult lint_file(
    const std::filesystem::path & path, const lint::LintOptions & options);
};

/**
 * Collect `.ts` and `.tsx` files under `root`, sorted by path.
 *
 * `node_modules` and directories starting with '.' are skipped. A regular
 * file given as `root` is returned as-is.
 */
[[nodiscard]] std::vector<std::filesystem::path> discover_sources(const std::filesystem::path & root);

}  // namespace purets
