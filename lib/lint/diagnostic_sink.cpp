// purets/lint/diagnostic_sink.cpp - DiagnosticSink implementation
#include "purets/lint/diagnostic_sink.hpp"

#include <fmt/format.h>

#include "purets/lint/rule_ids.hpp"

namespace purets::lint
{

DiagnosticSink::DiagnosticSink(
  const SourceFile & source, const RuleFilter & rules, DiagnosticBag & out)
: source_(source),
  rules_(rules),
  out_(out),
  suppressions_(SuppressionIndex::from_source(source.get_content())),
  expectations_(ExpectErrorIndex::from_source(source.get_content()))
{
}

void DiagnosticSink::add_error(std::string_view rule, std::string message, SourceRange range)
{
  if (!rules_.is_enabled(rule)) return;

  // Spans at offset 0 still land on line 1.
  const uint32_t start = range.get_begin().is_valid() ? range.get_begin().get_offset() : 0;
  const uint32_t line = source_.get_line_column(start).line;
  const uint32_t line_index = line > 0 ? line - 1 : 0;

  if (suppressions_.is_rule_disabled(line_index, rule)) return;

  if (expectations_.is_error_expected(line_index, rule)) {
    expectations_.mark_as_triggered(line_index, rule);
    return;
  }

  store(rule, std::move(message), range);
}

void DiagnosticSink::report_unused_expect_errors()
{
  for (const auto & [line, rules] : expectations_.get_untriggered_errors()) {
    for (const std::string & rule : rules) {
      store(
        rule::k_unused_expect_error,
        fmt::format("Expected error '{}' on line {} was not triggered", rule, line + 1),
        source_.get_line_range(line));
    }
  }
}

void DiagnosticSink::store(std::string_view rule, std::string message, SourceRange range)
{
  out_.report_error(range, std::move(message)).with_code(std::string(rule));
  ++stored_;
}

}  // namespace purets::lint
