// purets/lint/path_policy.hpp - Restrictions derived from a file's location
//
//   *_test.ts, *.test.ts, *.spec.ts  must import the tested function and
//                                    the configured runner
//   index.ts                         re-exports only
//   io/errors/<Name>.ts              exports class <Name> extending Error
//   pure/**                          synchronous, no io/ imports
//   io/**                            exported functions are async
//   types/**                         one type named after the file
//
#pragma once

#include "purets/ast/ast.hpp"
#include "purets/lint/rule_context.hpp"

namespace purets::lint
{

/**
 * Run the path-based-restrictions and filename-function-match checks.
 *
 * Reads the exports collected by the rule visitor, so it runs after the
 * visitor's post-pass. Test files get only the test-file checks.
 */
void check_path_policy(const Program & program, RuleContext & ctx);

}  // namespace purets::lint
