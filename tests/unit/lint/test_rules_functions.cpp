// tests/unit/lint/test_rules_functions.cpp - Function shape, statements and declarations
#include <gtest/gtest.h>

#include "purets/lint/rule_ids.hpp"
#include "purets/test_support/lint_helpers.hpp"

using namespace purets;
using namespace purets::lint;
using test_support::has_error_containing;
using test_support::lint;

// ============================================================================
// Parameters
// ============================================================================

TEST(LintFunctions, MaxParamsForFunctionsAndArrows)
{
  const auto diags = lint(R"(function f(a: number, b: number, c: number): number {
  return a + b + c;
}
const g = (a: number, b: number, c: number): number => a + b + c;
const h = (a: number, b: number): number => a + b;
)");
  EXPECT_EQ(diags.count_code(rule::k_max_function_params), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Function 'f' has 3 parameters (max: 2)"));
  EXPECT_TRUE(has_error_containing(diags, "Arrow function has 3 parameters (max: 2)"));
}

TEST(LintFunctions, ParamsRequireTypes)
{
  const auto diags = lint(R"(function f(a, b: number): number {
  return b;
}
const g = (x) => x;
)");
  EXPECT_EQ(diags.count_code(rule::k_param_missing_type), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Parameter 'a' in function 'f' must have a type annotation"));
  EXPECT_TRUE(has_error_containing(diags, "Parameter 'x' in function 'g' must have a type annotation"));
}

TEST(LintFunctions, JsDocParamsMustMatch)
{
  const auto diags = lint(R"(/**
 * Adds numbers.
 * @param a first
 * @param c missing
 */
function add(a: number, b: number): number {
  return a + b;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_jsdoc_param_match), 2u);
  EXPECT_TRUE(has_error_containing(diags, "JSDoc @param tag missing for parameter 'b' in function 'add'"));
  EXPECT_TRUE(has_error_containing(diags, "JSDoc @param 'c' does not match any parameter of function 'add'"));
}

TEST(LintFunctions, JsDocWithoutParamTagsIsNotChecked)
{
  const auto diags = lint(R"(/** Adds numbers. */
function add(a: number, b: number): number {
  return a + b;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_jsdoc_param_match), 0u);
}

TEST(LintFunctions, ThisInRegularFunction)
{
  const auto diags = lint(R"(function f(): unknown {
  return this;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_this_in_functions), 1u);
}

// ============================================================================
// Statements
// ============================================================================

TEST(LintFunctions, ConstantWhileTrueOnly)
{
  const auto diags = lint(R"(function f(): void {
  while (true) { break; }
  while (false) { }
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_constant_condition), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Avoid constant conditions in while statements"));
}

TEST(LintFunctions, SwitchCaseBlocks)
{
  const auto diags = lint(R"(function f(x: number): number {
  let y: number = 0;
  switch (x) {
    case 1:
      y = 1;
      break;
    case 2:
      y = 2;
      y = 3;
      break;
    case 3: {
      y = 4;
      y = 5;
      break;
    }
    case 4:
      break;
  }
  return y;
}
)");
  // `y = 1; break;` is two statements without a block.
  EXPECT_EQ(diags.count_code(rule::k_switch_case_block), 2u);
}

TEST(LintFunctions, SwitchCaseStatementThenBreakNeedsBlock)
{
  const auto diags = lint(R"(const pick = (x: number): number => {
  let y: number = 0;
  switch (x) {
    case 1: y = 1; break;
  }
  return y;
};
)");
  EXPECT_EQ(diags.count_code(rule::k_switch_case_block), 1u);
  EXPECT_TRUE(
    has_error_containing(diags, "Switch cases with multiple statements should use block scope"));
}

TEST(LintFunctions, ThrowRequiresGrant)
{
  const auto diags = lint(R"(function f(): void {
  throw new Error("x");
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_throw), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Throw statements are not allowed"));
}

TEST(LintFunctions, GrantedThrowOnlyAcceptsErrors)
{
  const auto diags = lint(R"(/** @allow throws */
function f(e: unknown): void {
  throw new RangeError("x");
}
function g(): void {
  throw "oops";
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_throw), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Only Error subclasses or rethrown errors can be thrown"));
  EXPECT_FALSE(has_error_containing(diags, "Unused '@allow throws'"));
}

TEST(LintFunctions, CatchMustGuardErrorType)
{
  const auto diags = lint(R"(function f(run: () => void): void {
  try { run(); } catch { }
  try { run(); } catch (e) { }
  try { run(); } catch (e) { run(); }
  try { run(); } catch (e) {
    if (Error.isError(e)) { run(); }
  }
  try { run(); } catch (e) {
    if (e instanceof Error) { run(); }
  }
}
)");
  EXPECT_EQ(diags.count_code(rule::k_catch_error_handling), 3u);
  EXPECT_TRUE(has_error_containing(diags, "Catch clause must have an error parameter"));
  EXPECT_TRUE(has_error_containing(diags, "Empty catch block is not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "if (Error.isError(e))"));
}

TEST(LintFunctions, UnusedMapResult)
{
  const auto diags = lint(R"(function f(xs: ReadonlyArray<number>): ReadonlyArray<number> {
  xs.map((x: number) => x * 2);
  return xs.map((x: number) => x * 2);
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_unused_map), 1u);
}

// ============================================================================
// Declarations
// ============================================================================

TEST(LintFunctions, LetWithoutTypeOrInitializer)
{
  const auto diags = lint(R"(function f(): number {
  let a;
  let b = 1;
  let c: number;
  a = b;
  c = a;
  return c;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_let_requires_type), 1u);
  EXPECT_TRUE(has_error_containing(diags, "'let' declaration 'a' requires type annotation"));
}

TEST(LintFunctions, EmptyArrayAndMutableRecord)
{
  const auto diags = lint(R"(function f(): number {
  const xs = [];
  const ys: number[] = [];
  const r: Record<string, number> = {};
  return xs.length + ys.length + r.size;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_empty_array_requires_type), 1u);
  EXPECT_EQ(diags.count_code(rule::k_no_mutable_record), 1u);
}

TEST(LintFunctions, ArrayMutationBeforeOrAfterDeclarationIsSeen)
{
  const auto diags = lint(R"(function early(): void {
  items.push(1);
}
const items = [1, 2, 3];
const frozen = [1, 2, 3];
const annotated: ReadonlyArray<number> = [1];
function late(): number {
  return frozen.length + annotated.length;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_prefer_readonly_array), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Array 'frozen' is never mutated"));
}

TEST(LintFunctions, SameArrayNameInTwoFunctionsReportedOnce)
{
  const auto diags = lint(R"(function first(): number {
  const values = [1, 2];
  return values.length;
}
function second(): number {
  const values = [3, 4];
  return values.length;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_prefer_readonly_array), 1u);
}

TEST(LintFunctions, PushedArrayIsNotReadonlyCandidate)
{
  const auto diags = lint("const arr = [1, 2, 3];\narr.push(4);\n");
  EXPECT_EQ(diags.count_code(rule::k_prefer_readonly_array), 0u);
}

TEST(LintFunctions, IndexAssignmentCountsAsMutation)
{
  const auto diags = lint(R"(const arr: number[] = [1, 2];
function set(): void {
  arr[0] = 3;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_prefer_readonly_array), 0u);
}

// ============================================================================
// Imports
// ============================================================================

TEST(LintFunctions, ImportStyle)
{
  const auto diags = lint(R"(import { readFile } from "fs";
import * as path from "node:path";
import * as lib from "./lib.js";
import { helper } from "./helper";
import { a } from "https://example.com/a.js";
import $ from "jquery";
import yargs from "yargs";
export { readFile, path, lib, helper, a, $, yargs };
)");
  EXPECT_TRUE(has_error_containing(diags, "Node.js built-in 'fs' must be imported with 'node:' prefix"));
  EXPECT_TRUE(has_error_containing(diags, "Prefer promise-based API. Use 'node:fs/promises'"));
  EXPECT_TRUE(has_error_containing(diags, "Use named imports instead of namespace import from 'node:path'"));
  EXPECT_EQ(diags.count_code(rule::k_no_namespace_imports), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Change './helper' to './helper.js'"));
  EXPECT_EQ(diags.count_code(rule::k_no_http_imports), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Library 'jquery' is forbidden"));
  EXPECT_TRUE(has_error_containing(diags, "Library 'yargs' has a better alternative"));
}

TEST(LintFunctions, UnusedVariablesAndImports)
{
  const auto diags = lint(R"(import { used, unused } from "./dep.js";
const kept: number = used;
const dropped: number = 2;
const _ignored: number = 3;
export { kept };
)");
  EXPECT_EQ(diags.count_code(rule::k_no_unused_variables), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Import 'unused' is declared but never used"));
  EXPECT_TRUE(has_error_containing(diags, "Variable 'dropped' is declared but never used"));
}

TEST(LintFunctions, TypeQueryCountsAsUse)
{
  const auto diags = lint(R"(const config = { a: 1 };
export type Config = typeof config;
)");
  EXPECT_FALSE(has_error_containing(diags, "Variable 'config' is declared but never used"));
}
