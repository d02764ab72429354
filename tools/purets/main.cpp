// purets - Pure TypeScript subset linter command line interface
//
// Usage:
//   purets [path] [options]
//
#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdio>
#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <nlohmann/json.hpp>

#include "purets/basic/diagnostic_json.hpp"
#include "purets/basic/diagnostic_printer.hpp"
#include "purets/driver/lint_driver.hpp"
#include "purets/lint/rule_presets.hpp"
#include "purets/lint/test_runner.hpp"
#include "purets/project/lint_config.hpp"

namespace fs = std::filesystem;

namespace
{

constexpr int k_exit_clean = 0;
constexpr int k_exit_diagnostics = 1;
constexpr int k_exit_usage = 2;

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "purets - Pure TypeScript subset linter v0.1.0\n\n"
            << "Usage: " << program_name << " [path] [options]\n\n"
            << "Options:\n"
            << "  -v, --verbose            Print progress and source excerpts\n"
            << "  --test <runner>          Test runner: vitest, node-test, deno-test\n"
            << "  --entry <a,b,...>        Files treated as entry points\n"
            << "  --main <a,b,...>         Files treated as main entries\n"
            << "  -j <N>                   Number of worker threads\n"
            << "  --preset <name>          Rule preset: "
            << fmt::format("{}", fmt::join(purets::lint::preset_names(), ", ")) << "\n"
            << "  --config <file>          Use this purets.yaml instead of searching\n"
            << "  --format <text|json>     Output format (default: text)\n"
            << "  --no-color               Disable colored output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

enum class OutputFormat { Text, Json };

struct CommandArgs
{
  std::string path = ".";
  std::optional<std::string> test_runner;
  std::vector<std::string> entry_points;
  std::vector<std::string> main_entries;
  std::optional<std::string> preset;
  std::optional<std::string> config_path;
  unsigned jobs = 0;
  OutputFormat format = OutputFormat::Text;
  bool verbose = false;
  bool no_color = false;
  bool show_help = false;

  /// Set when the command line is malformed
  std::string error;
};

std::vector<std::string> split_list(const std::string & value)
{
  std::vector<std::string> items;
  size_t begin = 0;
  while (begin <= value.size()) {
    const size_t comma = std::min(value.find(',', begin), value.size());
    if (comma > begin) items.push_back(value.substr(begin, comma - begin));
    begin = comma + 1;
  }
  return items;
}

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;
  bool has_path = false;

  for (int i = 1; i < argc; ++i) {
    const std::string arg = argv[i];

    const auto value = [&]() -> std::optional<std::string> {
      if (i + 1 < argc) return std::string(argv[++i]);
      args.error = fmt::format("missing value for '{}'", arg);
      return std::nullopt;
    };

    if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "--test") {
      args.test_runner = value();
    } else if (arg == "--entry") {
      if (auto v = value()) args.entry_points = split_list(*v);
    } else if (arg == "--main") {
      if (auto v = value()) args.main_entries = split_list(*v);
    } else if (arg == "--preset") {
      args.preset = value();
    } else if (arg == "--config") {
      args.config_path = value();
    } else if (arg == "-j") {
      if (auto v = value()) {
        try {
          const int jobs = std::stoi(*v);
          if (jobs < 1) throw std::out_of_range("jobs");
          args.jobs = static_cast<unsigned>(jobs);
        } catch (const std::exception &) {
          args.error = fmt::format("invalid job count: '{}'", *v);
        }
      }
    } else if (arg == "--format") {
      if (auto v = value()) {
        if (*v == "text") {
          args.format = OutputFormat::Text;
        } else if (*v == "json") {
          args.format = OutputFormat::Json;
        } else {
          args.error = fmt::format("invalid format: '{}' (must be 'text' or 'json')", *v);
        }
      }
    } else if (!arg.empty() && arg[0] == '-') {
      args.error = fmt::format("unknown option '{}'", arg);
    } else if (!has_path) {
      args.path = arg;
      has_path = true;
    } else {
      args.error = fmt::format("unexpected argument '{}'", arg);
    }

    if (!args.error.empty()) break;
  }

  return args;
}

// ============================================================================
// Settings
// ============================================================================

/// Merge purets.yaml and the command line; returns false after printing an error.
bool build_settings(const CommandArgs & args, const fs::path & root, purets::LintSettings & out)
{
  purets::LintConfig config;

  std::optional<fs::path> config_path;
  if (args.config_path) {
    config_path = fs::path(*args.config_path);
  } else {
    config_path = purets::find_lint_config(root);
  }

  if (config_path) {
    auto loaded = purets::load_lint_config(*config_path);
    if (!loaded.success) {
      std::cerr << "error: " << config_path->string() << ": " << loaded.error << "\n";
      return false;
    }
    config = std::move(loaded.config);
    if (args.verbose) {
      fmt::print(stderr, "[purets] using configuration {}\n", config_path->generic_string());
    }
  }

  if (args.preset && !purets::lint::find_preset(*args.preset)) {
    std::cerr << "error: unknown preset '" << *args.preset << "'\n";
    return false;
  }

  out.verbose = args.verbose;
  out.test_runner = config.test_runner;
  if (args.test_runner) {
    out.test_runner = purets::lint::parse_test_runner(*args.test_runner);
    if (!out.test_runner) {
      std::cerr << "error: unknown test runner '" << *args.test_runner
                << "' (must be 'vitest', 'node-test' or 'deno-test')\n";
      return false;
    }
  }

  out.entry_points = config.entry_points;
  for (const auto & e : args.entry_points) out.entry_points.push_back(fs::absolute(e));
  out.main_entries = config.main_entries;
  for (const auto & m : args.main_entries) out.main_entries.push_back(fs::absolute(m));

  out.rules = config.make_rule_filter(args.preset);
  return true;
}

// ============================================================================
// Linting
// ============================================================================

std::vector<purets::LintFileResult> lint_all(
  const std::vector<fs::path> & files, const purets::LintSettings & settings, unsigned jobs)
{
  std::vector<purets::LintFileResult> results(files.size());
  std::atomic<size_t> next{0};

  const auto worker = [&]() {
    for (size_t i = next++; i < files.size(); i = next++) {
      results[i] = purets::LintDriver::lint_file(files[i], settings.options_for(files[i]));
    }
  };

  const unsigned count =
    std::max(1u, std::min<unsigned>(jobs, static_cast<unsigned>(files.size())));
  std::vector<std::thread> pool;
  pool.reserve(count);
  for (unsigned t = 0; t < count; ++t) pool.emplace_back(worker);
  for (auto & thread : pool) thread.join();

  return results;
}

int run(const CommandArgs & args)
{
  const auto started = std::chrono::steady_clock::now();
  const fs::path root = args.path;

  if (!fs::exists(root)) {
    std::cerr << "error: path not found: " << root.string() << "\n";
    return k_exit_usage;
  }

  purets::LintSettings settings;
  if (!build_settings(args, root, settings)) return k_exit_usage;

  const auto files = purets::discover_sources(root);
  if (args.verbose) {
    fmt::print(stderr, "[purets] {} file(s) to lint\n", files.size());
  }

  unsigned jobs = args.jobs;
  if (jobs == 0) jobs = std::max(1u, std::thread::hardware_concurrency());
  const auto results = lint_all(files, settings, jobs);

  size_t error_count = 0;
  nlohmann::json report = nlohmann::json::array();
  const bool use_color = !args.no_color && isatty(fileno(stdout)) != 0;
  purets::DiagnosticPrinter printer(std::cout, use_color, args.verbose);

  for (const auto & result : results) {
    if (result.io_error) {
      std::cerr << "error: " << result.error << "\n";
      ++error_count;
      continue;
    }
    error_count += result.diagnostics.size();
    if (args.format == OutputFormat::Json) {
      for (const auto & diag : result.diagnostics.all()) {
        report.push_back(purets::to_json(diag, result.source));
      }
    } else {
      printer.print_all(result.diagnostics, result.source);
    }
  }

  if (args.format == OutputFormat::Json) {
    std::cout << report.dump(2) << "\n";
  }

  const std::chrono::duration<double> elapsed = std::chrono::steady_clock::now() - started;
  if (error_count > 0) {
    fmt::print(stderr, "{} error(s) found in {:.2f}s\n", error_count, elapsed.count());
    return k_exit_diagnostics;
  }
  fmt::print(stderr, "No errors found in {} file(s)\n", files.size());
  return k_exit_clean;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (!args.error.empty()) {
    std::cerr << "error: " << args.error << "\n";
    print_usage(argv[0]);
    return k_exit_usage;
  }

  if (args.show_help) {
    print_usage(argv[0]);
    return k_exit_clean;
  }

  return run(args);
}
