// purets/lint/linter.hpp - Lint pipeline for one parsed file
#pragma once

#include <cstddef>

#include "purets/ast/ast.hpp"
#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"
#include "purets/lint/lint_options.hpp"

namespace purets::lint
{

/**
 * Lint one parsed program.
 *
 * Runs the rule visitor (pre-pass, walk, post-pass), then the path
 * policy, then reports untriggered expect-error directives. A file marked
 * `purets-disable-file` produces nothing.
 *
 * @param source  The file the program was parsed from
 * @param program Its syntax tree; must be free of parse errors
 * @param options Per-file options
 * @param out     Bag receiving diagnostics, coded with their rule id
 * @return Number of diagnostics added to `out`
 */
size_t lint_program(
  const SourceFile & source, const Program & program, const LintOptions & options,
  DiagnosticBag & out);

}  // namespace purets::lint
