// tests/unit/lint/test_rules_constructs.cpp - Banned constructs and access rules
#include <gtest/gtest.h>

#include "purets/lint/rule_ids.hpp"
#include "purets/test_support/lint_helpers.hpp"

using namespace purets;
using namespace purets::lint;
using test_support::has_error_containing;
using test_support::lint;

TEST(LintConstructs, ConstantConditionWithConsoleReportsExactlyTwo)
{
  const auto diags = lint("if (true) { console.log(1); }\n");

  ASSERT_EQ(diags.size(), 2u);
  EXPECT_EQ(diags.count_code(rule::k_no_constant_condition), 1u);
  EXPECT_EQ(diags.count_code(rule::k_allow_directives), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Use of 'console' requires '@allow console' directive"));
}

TEST(LintConstructs, ConsoleAllowedByGrant)
{
  const auto diags = lint(R"(/**
 * @allow console
 */
function log(): void {
  console.log("x");
}
log();
)",
                          "src/main.ts");
  EXPECT_EQ(diags.count_code(rule::k_allow_directives), 0u);
}

TEST(LintConstructs, UnusedGrantIsReported)
{
  const auto diags = lint("/** @allow timers */\nconst x: number = 1;\n");
  EXPECT_TRUE(has_error_containing(diags, "Unused '@allow timers' directive"));
}

TEST(LintConstructs, ClassesAndEnums)
{
  const auto diags = lint(R"(class A {}
enum E { X }
)");
  EXPECT_EQ(diags.count_code(rule::k_no_classes), 1u);
  EXPECT_EQ(diags.count_code(rule::k_no_enums), 1u);
}

TEST(LintConstructs, ErrorClassAllowedUnderErrors)
{
  const auto diags = lint(
    "export class NotFoundError extends Error {}\n", "src/io/errors/NotFoundError.ts");
  EXPECT_EQ(diags.count_code(rule::k_no_classes), 0u);
}

TEST(LintConstructs, InterfaceWithoutExtends)
{
  const auto diags = lint(R"(interface Point { x: number }
interface Point3 extends Point { z: number }
)");
  EXPECT_EQ(diags.count_code(rule::k_interface_extends_only), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Interface 'Point' without extends"));
}

TEST(LintConstructs, DeleteDoWhileAndForEach)
{
  const auto diags = lint(R"(function f(o: { a?: number }, xs: ReadonlyArray<number>): void {
  delete o.a;
  do { } while (false);
  xs.forEach((x) => x);
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_delete), 1u);
  EXPECT_EQ(diags.count_code(rule::k_no_do_while), 1u);
  EXPECT_EQ(diags.count_code(rule::k_no_foreach), 1u);
}

TEST(LintConstructs, EvalFunctionAndRequire)
{
  const auto diags = lint(R"(function f(): void {
  eval("1");
  const g = new Function("return 1");
  const fs = require("fs");
}
)");
  EXPECT_TRUE(has_error_containing(diags, "eval() is not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "new Function() is not allowed"));
  EXPECT_EQ(diags.count_code(rule::k_no_require), 1u);
}

TEST(LintConstructs, AsCastsExceptConstAndSatisfies)
{
  const auto diags = lint(R"(function f(v: unknown): void {
  const a = v as string;
  const b = <number>v;
  const c = [1, 2] as const;
  const d = { x: 1 } satisfies { x: number };
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_as_cast), 2u);
}

TEST(LintConstructs, GettersAndSetters)
{
  const auto diags = lint(R"(const o = {
  get value() { return 1; },
  set value(v: number) { },
};
)");
  EXPECT_EQ(diags.count_code(rule::k_no_getters_setters), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Getter 'value' is not allowed"));
  EXPECT_TRUE(has_error_containing(diags, "Setter 'value' is not allowed"));
}

TEST(LintConstructs, ObjectAssignAndDefineProperty)
{
  const auto diags = lint(R"(function f(a: object): void {
  const b = Object.assign({}, a);
  Object.defineProperty(a, "x", {});
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_object_assign), 1u);
  EXPECT_EQ(diags.count_code(rule::k_no_define_property), 1u);
}

// ============================================================================
// Dynamic access
// ============================================================================

TEST(LintConstructs, IntegerKeysAreNotDynamicAccess)
{
  const auto diags = lint(R"(function f(arr: ReadonlyArray<number>): number {
  return arr[0] + arr["2"];
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_dynamic_access), 0u);
}

TEST(LintConstructs, ComputedKeysAreDynamicAccess)
{
  const auto diags = lint(R"(function f(obj: { x: number }, key: string): number {
  return obj[key] + obj["x"];
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_dynamic_access), 2u);
}

TEST(LintConstructs, MemberAssignments)
{
  const auto diags = lint(R"(function f(o: { a: number }, key: string): void {
  o.a = 1;
  o[key] = 2;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_member_assignments), 2u);
  EXPECT_TRUE(has_error_containing(diags, "Dynamic property assignment is not allowed"));
}

TEST(LintConstructs, MemberAssignmentsAllowedInErrorFiles)
{
  const auto diags = lint(R"(/**
 * Raised when a file is missing.
 */
export class MissingError extends Error {
  constructor(message: string) {
    super(message);
    this.name = "MissingError";
  }
}
)",
                          "src/io/errors/MissingError.ts");
  EXPECT_EQ(diags.count_code(rule::k_no_member_assignments), 0u);
  EXPECT_EQ(diags.count_code(rule::k_no_this_in_functions), 0u);
}

// ============================================================================
// Side effects and gated globals
// ============================================================================

TEST(LintConstructs, SideEffectCallsInsideFunctions)
{
  const auto diags = lint(R"(function roll(): number {
  const t = Date.now();
  const d = new Date();
  return Math.random() + t;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_side_effect_functions), 3u);
  EXPECT_TRUE(has_error_containing(diags, "Direct use of 'Math.random()'"));
}

TEST(LintConstructs, SideEffectCallsAllowedInDefaultParameters)
{
  const auto diags = lint(R"(function stamp(now: number = Date.now()): number {
  return now;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_side_effect_functions), 0u);
}

TEST(LintConstructs, TimersRequireGrant)
{
  const auto diags = lint(R"(function later(): void {
  setTimeout(() => 1, 10);
}
)");
  EXPECT_TRUE(has_error_containing(diags, "Use of 'setTimeout' requires '@allow timers' directive"));
}

TEST(LintConstructs, TimerGrantDoesNotExemptSideEffects)
{
  const auto diags = lint(R"(/** @allow timers */
function later(g: () => void): void {
  setTimeout(g, 1);
}
)");
  EXPECT_EQ(diags.count_code(rule::k_allow_directives), 0u);
  EXPECT_EQ(diags.count_code(rule::k_no_side_effect_functions), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Direct use of 'setTimeout()' is not allowed in functions"));
}

TEST(LintConstructs, DomAndNetGlobalsRequireGrant)
{
  const auto diags = lint(R"(function f(): void {
  const el = document.body;
  const r = fetch("/x");
}
)");
  EXPECT_TRUE(has_error_containing(diags, "Access to 'document' requires '@allow dom' directive"));
  EXPECT_TRUE(has_error_containing(diags, "Access to 'fetch' requires '@allow net' directive"));
}

TEST(LintConstructs, GlobalProcessAndFilename)
{
  const auto diags = lint(R"(function f(): string {
  return process.cwd() + __dirname;
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_global_process), 1u);
  EXPECT_EQ(diags.count_code(rule::k_no_filename_dirname), 1u);
}

TEST(LintConstructs, ImportedProcessIsAllowed)
{
  const auto diags = lint(R"(import process from "node:process";
function f(): string {
  return process.cwd();
}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_global_process), 0u);
}
