// tests/unit/lint/test_module_structure.cpp - Exports, top-level statements and post-pass
#include <gtest/gtest.h>

#include "purets/lint/rule_ids.hpp"
#include "purets/test_support/lint_helpers.hpp"

using namespace purets;
using namespace purets::lint;
using test_support::has_error_containing;
using test_support::lint;

namespace
{

LintOptions entry_options()
{
  LintOptions options;
  options.is_entry_point = true;
  return options;
}

}  // namespace

// ============================================================================
// one-public-function
// ============================================================================

TEST(LintModule, SecondExportedFunctionIsReported)
{
  const auto diags = lint("export function a(){} export function b(){}\n");

  ASSERT_EQ(diags.count_code(rule::k_one_public_function), 1u);
  for (const auto & d : diags) {
    if (d.code == rule::k_one_public_function) {
      EXPECT_EQ(
        d.message, "Only one function can be exported per file. Found additional export: b");
    }
  }
}

TEST(LintModule, NonFunctionExportsAreReported)
{
  const auto diags = lint(R"(/** Doubles. */
export function test(x: number): number {
  return x * 2;
}
export const limit: number = 3;
export type Shape = { n: number };
)");
  EXPECT_EQ(diags.count_code(rule::k_one_public_function), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Found non-function export: limit"));
}

TEST(LintModule, ExportedArrowCountsAsFunction)
{
  const auto diags = lint(R"(/** Doubles. */
export const test = (x: number): number => x * 2;
)");
  EXPECT_EQ(diags.count_code(rule::k_one_public_function), 0u);
  EXPECT_EQ(diags.count_code(rule::k_export_const_type_required), 0u);
  EXPECT_EQ(diags.count_code(rule::k_filename_function_match), 0u);
}

TEST(LintModule, EntryPointsStillExportOneFunction)
{
  const auto diags = lint(R"(/** A. */
export function a(): void {}
/** B. */
export function b(): void {}
)",
                          "src/api.ts", entry_options());
  EXPECT_EQ(diags.count_code(rule::k_one_public_function), 1u);
  EXPECT_TRUE(has_error_containing(
    diags, "Only one function can be exported per file. Found additional export: b"));

  const auto index = lint(R"(/** A. */
export function a(): void {}
/** B. */
export function b(): void {}
)",
                          "src/index.ts");
  EXPECT_EQ(index.count_code(rule::k_one_public_function), 1u);
}

TEST(LintModule, OverloadSignaturesAreOneExport)
{
  const auto diags = lint(R"(/**
 * Formats a value.
 * @param v value
 */
export function format(v: string): string;
export function format(v: number): string;
export function format(v: string | number): string {
  return String(v);
}
)",
                          "src/format.ts");
  EXPECT_EQ(diags.count_code(rule::k_one_public_function), 0u);
  EXPECT_EQ(diags.count_code(rule::k_export_requires_jsdoc), 0u);
}

// ============================================================================
// Exports
// ============================================================================

TEST(LintModule, ExportedLetAndUntypedConst)
{
  const auto diags = lint(R"(export let counter: number = 0;
export const name = "x";
export const typed: string = "y";
)");
  EXPECT_EQ(diags.count_code(rule::k_export_const_type_required), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Exported 'let' declarations are not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "Exported const 'name' requires type annotation"));
}

TEST(LintModule, ExportedFunctionRequiresJsDoc)
{
  const auto diags = lint(R"(export function test(): void {}
)");
  EXPECT_EQ(diags.count_code(rule::k_export_requires_jsdoc), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Exported function 'test' must have a JSDoc comment"));
}

TEST(LintModule, ExportedTypesNeedJsDocOnlyInTypesFiles)
{
  const char * src = "export type Point = { x: number };\n";
  EXPECT_EQ(lint(src, "src/geometry.ts").count_code(rule::k_export_requires_jsdoc), 0u);
  EXPECT_EQ(lint(src, "src/types/Point.ts").count_code(rule::k_export_requires_jsdoc), 1u);
}

TEST(LintModule, ReExportsOutsideEntryPoints)
{
  const auto diags = lint(R"(export { a } from "./a.js";
export * from "./b.js";
)");
  EXPECT_EQ(diags.count_code(rule::k_no_reexports), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Re-exports from './a.js' are not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "Re-exports from './b.js' are not allowed"));
}

TEST(LintModule, EntryPointAllowsNamedReExportsOnly)
{
  const auto diags = lint(R"(export { a } from "./a.js";
export * from "./b.js";
)",
                          "src/index.ts");
  EXPECT_EQ(diags.count_code(rule::k_no_reexports), 1u);
  EXPECT_TRUE(has_error_containing(
    diags, "Namespace re-exports are not allowed in entry points. Use named exports: export { name } "
           "from './b.js'"));
}

TEST(LintModule, ReExportSourceIsChecked)
{
  const auto diags = lint("export { a } from \"./a\";\n", "src/index.ts");
  EXPECT_TRUE(has_error_containing(diags, "Change './a' to './a.js'"));
}

// ============================================================================
// Top-level side effects
// ============================================================================

TEST(LintModule, TopLevelStatementsWithSideEffects)
{
  const auto diags = lint(R"(function run(): void {}
let n: number = 0;
run();
n = 1;
n++;
new Date();
for (const x of [1]) { }
if (n > 0) { }
)");
  EXPECT_EQ(diags.count_code(rule::k_no_top_level_side_effects), 6u);
  EXPECT_TRUE(has_error_containing(diags, "Top-level function calls are not allowed (side effects)"));
  EXPECT_TRUE(has_error_containing(diags, "Top-level assignments are not allowed (side effects)"));
  EXPECT_TRUE(has_error_containing(diags, "Top-level update expressions are not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "Top-level new expressions are not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "Top-level loops are not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "Top-level if statements are not allowed"));
}

TEST(LintModule, AllowedTopLevelStatements)
{
  const auto diags = lint(R"(function isText(v: unknown): boolean {
  return typeof v === "string";
}
const v: unknown = 1;
(() => {})();
if (typeof v === "string") { }
if (isText(v) && !Array.isArray(v)) { }
if (v instanceof Date) { }
)");
  EXPECT_EQ(diags.count_code(rule::k_no_top_level_side_effects), 0u);
}

TEST(LintModule, MainCallAllowedInMainEntry)
{
  const char * src = R"(async function main(): Promise<void> {}
await main();
)";
  EXPECT_EQ(lint(src, "src/main.ts").count_code(rule::k_no_top_level_side_effects), 0u);
  EXPECT_EQ(lint(src, "src/run.ts").count_code(rule::k_no_top_level_side_effects), 1u);
}

TEST(LintModule, TestRegistrationCallsNeedARunner)
{
  const char * src = R"(function check(): void {}
describe("suite", check);
)";
  LintOptions options;
  options.test_runner = TestRunner::Vitest;
  EXPECT_EQ(lint(src, "src/setup.ts", options).count_code(rule::k_no_top_level_side_effects), 0u);
  EXPECT_EQ(lint(src, "src/setup.ts").count_code(rule::k_no_top_level_side_effects), 1u);
}

TEST(LintModule, TestFilesSkipTopLevelChecks)
{
  const auto diags = lint(R"(import { add } from "./add.js";
add(1, 2);
)",
                          "src/add.test.ts");
  EXPECT_EQ(diags.count_code(rule::k_no_top_level_side_effects), 0u);
}
