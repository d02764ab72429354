// purets/project/lint_config.cpp - Project configuration implementation
//
#include "purets/project/lint_config.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <yaml-cpp/yaml.h>

#include "purets/lint/rule_ids.hpp"

namespace purets
{

namespace
{

/// Accepts a single path or a list of paths.
bool parse_paths(
  const YAML::Node & node, const std::filesystem::path & root,
  std::vector<std::filesystem::path> & out)
{
  if (node.IsScalar()) {
    out.push_back(root / node.as<std::string>());
    return true;
  }
  if (!node.IsSequence()) return false;
  for (const auto & item : node) {
    out.push_back(root / item.as<std::string>());
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  LintConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'preset'
  if (root["preset"]) {
    const auto name = root["preset"].as<std::string>();
    if (!lint::find_preset(name)) {
      return ConfigLoadResult::fail(fmt::format(
        "unknown preset: '{}' (expected one of: {})", name,
        fmt::join(lint::preset_names(), ", ")));
    }
    config.preset = name;
  }

  // Parse 'rules' overrides
  if (root["rules"]) {
    const auto & rules = root["rules"];
    if (!rules.IsMap()) {
      return ConfigLoadResult::fail("rules must be a map of rule ids to true/false");
    }
    for (const auto & entry : rules) {
      const auto id = entry.first.as<std::string>();
      if (!lint::is_known_rule(id)) {
        return ConfigLoadResult::fail(fmt::format("unknown rule in rules: '{}'", id));
      }
      config.rules[id] = entry.second.as<bool>();
    }
  }

  // Parse 'test_runner'
  if (root["test_runner"]) {
    const auto name = root["test_runner"].as<std::string>();
    config.test_runner = lint::parse_test_runner(name);
    if (!config.test_runner) {
      return ConfigLoadResult::fail(fmt::format(
        "invalid test_runner: '{}' (must be 'vitest', 'node-test' or 'deno-test')", name));
    }
  }

  if (root["entry"] && !parse_paths(root["entry"], project_root, config.entry_points)) {
    return ConfigLoadResult::fail("entry must be a path or a list of paths");
  }
  if (root["main"] && !parse_paths(root["main"], project_root, config.main_entries)) {
    return ConfigLoadResult::fail("main must be a path or a list of paths");
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

lint::RuleFilter LintConfig::make_rule_filter(
  const std::optional<std::string> & preset_override) const
{
  lint::RuleFilter filter;
  const auto & name = preset_override ? preset_override : preset;
  if (name) filter.set_preset(lint::find_preset(*name));
  for (const auto & [id, enabled] : rules) {
    filter.set_override(id, enabled);
  }
  return filter;
}

ConfigLoadResult parse_lint_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_lint_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  // Scalar conversions below throw on values of the wrong type.
  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration value: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_lint_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_lint_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace purets
