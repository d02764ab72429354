// purets/lint/rule_context.hpp - Everything a rule check may read or update
#pragma once

#include <string>
#include <string_view>

#include "purets/ast/ast.hpp"
#include "purets/basic/source_manager.hpp"
#include "purets/lint/allow_features.hpp"
#include "purets/lint/diagnostic_sink.hpp"
#include "purets/lint/lint_options.hpp"
#include "purets/lint/visitor_state.hpp"

namespace purets::lint
{

/**
 * Per-file context passed to every rule check.
 *
 * Owns the mutable traversal state; everything else is borrowed from the
 * caller and outlives the check.
 */
struct RuleContext
{
  RuleContext(
    const SourceFile & src, const Program & prog, const FileTraits & file_traits,
    DiagnosticSink & diag_sink)
  : source(src),
    program(prog),
    traits(file_traits),
    sink(diag_sink),
    allowed(parse_allowed_features(src.get_content(), prog.comments))
  {
  }

  const SourceFile & source;
  const Program & program;
  const FileTraits & traits;
  DiagnosticSink & sink;

  FeatureSet allowed;  ///< Grants declared by the file
  FeatureSet used;     ///< Grants exercised during the walk
  VisitorState state;

  void report(std::string_view rule, std::string message, SourceRange range)
  {
    sink.add_error(rule, std::move(message), range);
  }

  /// Whether the file may use `feature`; records the use when it may.
  bool use_feature(Feature feature)
  {
    if (!allowed.has(feature)) return false;
    used.set(feature);
    return true;
  }
};

}  // namespace purets::lint
