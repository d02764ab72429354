// purets/project/lint_config.hpp - Project configuration (purets.yaml)
//
// Parses and validates purets.yaml. The CLI finds the file by searching
// upward from the lint root; command-line flags override its settings.
//
#pragma once

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "purets/lint/rule_presets.hpp"
#include "purets/lint/test_runner.hpp"

namespace purets
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (purets.yaml).
 *
 * @code{.yaml}
 * preset: strict
 * rules:
 *   no-classes: false
 * test_runner: vitest
 * entry: [src/index.ts]
 * main: src/main.ts
 * @endcode
 */
struct LintConfig
{
  /// Preset name; validated against the preset registry
  std::optional<std::string> preset;

  /// Per-rule overrides; keys are validated rule ids
  std::map<std::string, bool, std::less<>> rules;

  std::optional<lint::TestRunner> test_runner;

  /// Entry-point files, resolved against project_root
  std::vector<std::filesystem::path> entry_points;

  /// Main-entry files, resolved against project_root
  std::vector<std::filesystem::path> main_entries;

  /// Directory containing purets.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /**
   * Rule filter for this configuration.
   *
   * @param preset_override Preset named on the command line, if any
   */
  [[nodiscard]] lint::RuleFilter make_rule_filter(
    const std::optional<std::string> & preset_override = std::nullopt) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  LintConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(LintConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a purets.yaml file.
 *
 * @param config_path Path to purets.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_lint_config(const std::filesystem::path & config_path);

/**
 * Parse configuration text. Relative paths resolve against `project_root`.
 */
[[nodiscard]] ConfigLoadResult parse_lint_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to purets.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_lint_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_lint_config_file_name = "purets.yaml";

}  // namespace purets
