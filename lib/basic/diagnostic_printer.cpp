// purets/basic/diagnostic_printer.cpp - Compact diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "purets/basic/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <ostream>
#include <rang.hpp>
#include <string>

namespace purets
{

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color, bool verbose)
: os_(os), use_color_(use_color), verbose_(verbose)
{
  // Configure rang based on use_color setting
  if (!use_color_) {
    rang::setControlMode(rang::control::Off);
  }
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceFile & source)
{
  const SourceRange primary_range = diag.primary_range();
  LineColumn lc{1, 1};
  if (primary_range.is_valid()) {
    lc = source.get_line_column(primary_range.get_begin());
  }

  print_location(fmt::format("{}:{}:{}", display_path(source), lc.line, lc.column));

  if (use_color_) {
    os_ << rang::fg::yellow;
    fmt::print(os_, "[{}]", diag.code.empty() ? "error" : diag.code);
    os_ << rang::fg::reset;
    fmt::print(os_, " {}\n", diag.message);
  } else {
    fmt::print(os_, "[{}] {}\n", diag.code.empty() ? "error" : diag.code, diag.message);
  }

  if (verbose_ && primary_range.is_valid()) {
    print_source_excerpt(source, lc);
  }
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceFile & source)
{
  for (const auto & d : diags) {
    print(d, source);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_location(std::string_view location)
{
  if (use_color_) {
    os_ << rang::style::bold << rang::fg::cyan << location << rang::fg::reset
        << rang::style::reset << " ";
  } else {
    fmt::print(os_, "{} ", location);
  }
}

void DiagnosticPrinter::print_source_excerpt(const SourceFile & source, LineColumn lc)
{
  const std::string_view line = source.get_line(lc.line - 1);

  if (use_color_) {
    os_ << rang::style::dim;
    fmt::print(os_, "  {}", line);
    os_ << rang::style::reset;
    fmt::print(os_, "\n  {}", std::string(lc.column - 1, ' '));
    os_ << rang::fg::red << rang::style::bold << "^" << rang::style::reset << rang::fg::reset;
    fmt::print(os_, "\n\n");
  } else {
    fmt::print(os_, "  {}\n  {}^\n\n", line, std::string(lc.column - 1, ' '));
  }
}

std::string DiagnosticPrinter::display_path(const SourceFile & source)
{
  if (source.get_path().empty()) {
    return "<input>";
  }
  return source.get_path().generic_string();
}

}  // namespace purets
