// purets/test_support/lint_helpers.hpp - helpers for lint unit tests
//
// Parses and lints one in-memory file. A file with syntax errors returns
// its parse diagnostics instead, as the driver does.
//
#pragma once

#include <algorithm>
#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "purets/basic/diagnostic.hpp"
#include "purets/lint/lint_options.hpp"
#include "purets/lint/linter.hpp"
#include "purets/test_support/parse_helpers.hpp"

namespace purets::test_support
{

[[nodiscard]] inline DiagnosticBag lint(
  std::string src, const std::filesystem::path & virtual_path = "test.ts",
  const lint::LintOptions & options = {})
{
  auto unit = parse(std::move(src), virtual_path);
  if (unit->has_syntax_errors()) return unit->diags;

  DiagnosticBag out;
  static_cast<void>(lint::lint_program(unit->source, *unit->program, options, out));
  return out;
}

[[nodiscard]] inline bool has_error_containing(const DiagnosticBag & diags, std::string_view needle)
{
  return std::any_of(diags.begin(), diags.end(), [&](const Diagnostic & d) {
    return d.message.find(needle) != std::string::npos;
  });
}

}  // namespace purets::test_support
