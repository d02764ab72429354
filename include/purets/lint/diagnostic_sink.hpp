// purets/lint/diagnostic_sink.hpp - Filtering front door for lint diagnostics
//
// Every rule reports through the sink. The sink resolves the byte span to
// a line and decides whether the diagnostic is dropped (rule disabled or
// line suppressed), consumed by an expect-error directive, or stored.
//
#pragma once

#include <string>
#include <string_view>

#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"
#include "purets/lint/directives.hpp"
#include "purets/lint/rule_presets.hpp"

namespace purets::lint
{

class DiagnosticSink
{
public:
  /**
   * @param source File being linted; directives are scanned from its text
   * @param rules  Enabled rule set
   * @param out    Bag receiving the surviving diagnostics
   */
  DiagnosticSink(const SourceFile & source, const RuleFilter & rules, DiagnosticBag & out);

  /**
   * Report a rule violation.
   *
   * Dropped when the rule is disabled or its line is suppressed; consumed
   * when an expect-error directive expects it; stored otherwise.
   */
  void add_error(std::string_view rule, std::string message, SourceRange range);

  /**
   * Report every expect-error directive that was never triggered.
   *
   * These diagnostics bypass suppression. Call once, after all rules ran.
   */
  void report_unused_expect_errors();

  [[nodiscard]] const SuppressionIndex & suppressions() const noexcept { return suppressions_; }
  [[nodiscard]] const ExpectErrorIndex & expectations() const noexcept { return expectations_; }

  /// Number of diagnostics stored so far.
  [[nodiscard]] size_t stored_count() const noexcept { return stored_; }

private:
  void store(std::string_view rule, std::string message, SourceRange range);

  const SourceFile & source_;
  const RuleFilter & rules_;
  DiagnosticBag & out_;

  SuppressionIndex suppressions_;
  ExpectErrorIndex expectations_;
  size_t stored_ = 0;
};

}  // namespace purets::lint
