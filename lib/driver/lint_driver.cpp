// purets/driver/lint_driver.cpp - Lint driver implementation
//
#include "purets/driver/lint_driver.hpp"

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <sstream>

#include <fmt/format.h>

#include "purets/lint/linter.hpp"
#include "purets/syntax/frontend.hpp"

namespace purets
{

namespace
{

namespace fs = std::filesystem;

fs::path canonical_or_self(const fs::path & p)
{
  std::error_code ec;
  fs::path result = fs::weakly_canonical(fs::absolute(p, ec), ec);
  return ec ? p : result;
}

bool contains_path(const std::vector<fs::path> & list, const fs::path & canonical)
{
  return std::any_of(list.begin(), list.end(), [&](const fs::path & p) {
    return canonical_or_self(p) == canonical;
  });
}

bool is_source_file(const fs::path & p)
{
  const auto ext = p.extension();
  return ext == ".ts" || ext == ".tsx";
}

bool is_skipped_directory(const fs::path & dir)
{
  const std::string name = dir.filename().string();
  return name == "node_modules" || (!name.empty() && name.front() == '.');
}

}  // namespace

lint::LintOptions LintSettings::options_for(const fs::path & file) const
{
  lint::LintOptions options;
  options.verbose = verbose;
  options.test_runner = test_runner;
  options.rules = rules;

  const fs::path canonical = canonical_or_self(file);
  options.is_entry_point = contains_path(entry_points, canonical);
  options.is_main_entry = contains_path(main_entries, canonical);
  return options;
}

LintFileResult LintDriver::lint_source(
  const fs::path & path, std::string text, const lint::LintOptions & options)
{
  LintFileResult result;

  if (options.verbose) {
    fmt::print(stderr, "[purets] linting {}\n", path.generic_string());
  }

  auto unit = parse_unit(path, std::move(text));
  if (unit->has_syntax_errors()) {
    result.parse_failed = true;
    result.diagnostics = std::move(unit->diags);
    if (options.verbose) {
      fmt::print(
        stderr, "[purets] {}: {} parse error(s), skipping rules\n", path.generic_string(),
        result.diagnostics.size());
    }
  } else {
    const size_t count =
      lint::lint_program(unit->source, *unit->program, options, result.diagnostics);
    if (options.verbose) {
      fmt::print(stderr, "[purets] {}: {} diagnostic(s)\n", path.generic_string(), count);
    }
  }

  // The tree points into the source text; it is not used past this point.
  result.source = std::move(unit->source);
  result.success = result.diagnostics.empty();
  return result;
}

LintFileResult LintDriver::lint_file(const fs::path & path, const lint::LintOptions & options)
{
  std::ifstream in(path, std::ios::binary);
  if (!in) {
    LintFileResult result;
    result.io_error = true;
    result.error = fmt::format("cannot read file: {}", path.generic_string());
    return result;
  }

  std::ostringstream ss;
  ss << in.rdbuf();
  return lint_source(path, ss.str(), options);
}

std::vector<fs::path> discover_sources(const fs::path & root)
{
  std::vector<fs::path> files;
  std::error_code ec;

  if (fs::is_regular_file(root, ec)) {
    files.push_back(root);
    return files;
  }

  fs::recursive_directory_iterator it(root, fs::directory_options::skip_permission_denied, ec);
  const fs::recursive_directory_iterator end;
  for (; !ec && it != end; it.increment(ec)) {
    const fs::directory_entry & entry = *it;
    if (entry.is_directory(ec)) {
      if (is_skipped_directory(entry.path())) it.disable_recursion_pending();
      continue;
    }
    if (entry.is_regular_file(ec) && is_source_file(entry.path())) {
      files.push_back(entry.path());
    }
  }

  std::sort(files.begin(), files.end());
  return files;
}

}  // namespace purets
