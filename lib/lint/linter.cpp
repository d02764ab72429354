// purets/lint/linter.cpp - Lint pipeline
#include "purets/lint/linter.hpp"

#include "purets/lint/diagnostic_sink.hpp"
#include "purets/lint/path_policy.hpp"
#include "purets/lint/rule_context.hpp"
#include "purets/lint/rule_visitor.hpp"

namespace purets::lint
{

size_t lint_program(
  const SourceFile & source, const Program & program, const LintOptions & options,
  DiagnosticBag & out)
{
  DiagnosticSink sink(source, options.rules, out);
  if (sink.suppressions().is_file_disabled()) return 0;

  const FileTraits traits = FileTraits::from_path(source.get_path(), options);
  RuleContext ctx(source, program, traits, sink);

  RuleVisitor visitor(ctx);
  visitor.check(program);
  check_path_policy(program, ctx);

  sink.report_unused_expect_errors();
  return sink.stored_count();
}

}  // namespace purets::lint
