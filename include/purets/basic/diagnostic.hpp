// purets/basic/diagnostic.hpp - Diagnostic types for parsing and linting
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "purets/basic/source_manager.hpp"

namespace purets
{

// ============================================================================
// Core Structures
// ============================================================================

/**
 * One reported problem: a rule violation or a syntax error.
 *
 * Every diagnostic is an error; the linter has no warning level.
 */
struct Diagnostic
{
  std::string code;     // rule id, e.g. "no-classes"
  std::string message;
  SourceRange range;

  [[nodiscard]] SourceRange primary_range() const noexcept { return range; }
};

// ============================================================================
// Forward Declarations
// ============================================================================

class DiagnosticBag;

// ============================================================================
// DiagnosticBuilder
// ============================================================================

/**
 * Builds a diagnostic fluently and registers it with the bag on destruction.
 */
class DiagnosticBuilder
{
public:
  DiagnosticBuilder(DiagnosticBag & bag, Diagnostic diag);

  DiagnosticBuilder(const DiagnosticBuilder &) = delete;
  DiagnosticBuilder & operator=(const DiagnosticBuilder &) = delete;

  DiagnosticBuilder(DiagnosticBuilder && other) noexcept;

  ~DiagnosticBuilder();

  DiagnosticBuilder & with_code(std::string code);

private:
  DiagnosticBag & bag_;
  Diagnostic diagnostic_;
  bool active_ = true;
};

// ============================================================================
// DiagnosticBag
// ============================================================================

class DiagnosticBag
{
public:
  DiagnosticBag() = default;

  DiagnosticBag(const DiagnosticBag &) = default;
  DiagnosticBag & operator=(const DiagnosticBag &) = default;
  DiagnosticBag(DiagnosticBag &&) = default;
  DiagnosticBag & operator=(DiagnosticBag &&) = default;

  // Builder Starters
  DiagnosticBuilder report_error(SourceRange range, std::string message);

  // Add
  void add(Diagnostic && diag);
  void add(const Diagnostic & diag);

  // Accessors
  [[nodiscard]] const std::vector<Diagnostic> & all() const { return diagnostics_; }
  [[nodiscard]] bool empty() const { return diagnostics_.empty(); }
  [[nodiscard]] size_t size() const { return diagnostics_.size(); }

  [[nodiscard]] bool has_errors() const { return !diagnostics_.empty(); }

  /// Number of diagnostics carrying the given code
  [[nodiscard]] size_t count_code(std::string_view code) const;

  // Utilities
  void merge(DiagnosticBag && other);
  void merge(const DiagnosticBag & other);

  [[nodiscard]] auto begin() const { return diagnostics_.begin(); }
  [[nodiscard]] auto end() const { return diagnostics_.end(); }

private:
  std::vector<Diagnostic> diagnostics_;
};

}  // namespace purets
