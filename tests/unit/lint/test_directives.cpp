// tests/unit/lint/test_directives.cpp - Disable and expect-error directives
#include <gtest/gtest.h>

#include <string>
#include <vector>

#include "purets/lint/directives.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/test_support/lint_helpers.hpp"

using namespace purets;
using namespace purets::lint;
using test_support::has_error_containing;

// ============================================================================
// Rule lists
// ============================================================================

TEST(LintDirectives, ParseRuleListSplitsOnCommasAndSpaces)
{
  const auto rules = parse_rule_list(" no-classes, no-enums  no-throw,,");
  const std::vector<std::string> expected = {"no-classes", "no-enums", "no-throw"};
  EXPECT_EQ(rules, expected);
}

TEST(LintDirectives, ParseRuleListDropsCommentCloser)
{
  const auto rules = parse_rule_list(" no-classes */");
  ASSERT_EQ(rules.size(), 1u);
  EXPECT_EQ(rules[0], "no-classes");
}

// ============================================================================
// SuppressionIndex
// ============================================================================

TEST(LintDirectives, DisableNextLineWithRuleSilencesOnlyThatRule)
{
  const auto index = SuppressionIndex::from_source(
    "// purets-disable-next-line no-classes\n"
    "class A {}\n");

  EXPECT_TRUE(index.is_line_disabled(1));
  EXPECT_TRUE(index.is_rule_disabled(1, "no-classes"));
  EXPECT_FALSE(index.is_rule_disabled(1, "no-enums"));
  EXPECT_FALSE(index.is_rule_disabled(0, "no-classes"));
  EXPECT_FALSE(index.is_rule_disabled(2, "no-classes"));
}

TEST(LintDirectives, DisableNextLineWithoutRulesSilencesEverything)
{
  const auto index = SuppressionIndex::from_source("// purets-disable-next-line\nclass A {}\n");
  EXPECT_TRUE(index.is_rule_disabled(1, "no-classes"));
  EXPECT_TRUE(index.is_rule_disabled(1, "no-enums"));
}

TEST(LintDirectives, DisableLineAppliesToItsOwnLine)
{
  const auto index = SuppressionIndex::from_source("class A {} // purets-disable-line no-classes\n");
  EXPECT_TRUE(index.is_rule_disabled(0, "no-classes"));
  EXPECT_FALSE(index.is_rule_disabled(1, "no-classes"));
}

TEST(LintDirectives, DisableFileSilencesEveryLine)
{
  const auto index = SuppressionIndex::from_source("const a = 1;\n// purets-disable-file\n");
  EXPECT_TRUE(index.is_file_disabled());
  EXPECT_TRUE(index.is_rule_disabled(0, "no-classes"));
  EXPECT_TRUE(index.is_rule_disabled(42, "anything"));
}

TEST(LintDirectives, DisableFileAcceptsBlockComment)
{
  const auto index = SuppressionIndex::from_source("/* purets-disable-file */\nclass A {}\n");
  EXPECT_TRUE(index.is_file_disabled());
}

TEST(LintDirectives, DirectiveWordsOutsideCommentsAreIgnored)
{
  const auto index = SuppressionIndex::from_source(
    "const s: string = \"purets-disable-file\";\n"
    "const t: string = \"purets-disable-line\";\n");
  EXPECT_FALSE(index.is_file_disabled());
  EXPECT_FALSE(index.is_line_disabled(1));

  const auto expected =
    ExpectErrorIndex::from_source("const u: string = \"purets-expect-error no-classes\";\n");
  EXPECT_TRUE(expected.empty());
}

// ============================================================================
// ExpectErrorIndex
// ============================================================================

TEST(LintDirectives, ExpectErrorTargetsTheFollowingLine)
{
  auto index = ExpectErrorIndex::from_source(
    "// purets-expect-error no-classes, no-throw\n"
    "class A {}\n");

  EXPECT_TRUE(index.is_error_expected(1, "no-classes"));
  EXPECT_TRUE(index.is_error_expected(1, "no-throw"));
  EXPECT_FALSE(index.is_error_expected(0, "no-classes"));
  EXPECT_FALSE(index.is_error_expected(1, "no-enums"));
}

TEST(LintDirectives, UntriggeredErrorsEmptyOnlyWhenAllPairsFired)
{
  auto index = ExpectErrorIndex::from_source(
    "// purets-expect-error no-classes no-throw\n"
    "class A {}\n");

  auto missing = index.get_untriggered_errors();
  ASSERT_EQ(missing.size(), 1u);
  EXPECT_EQ(missing[0].first, 1u);
  EXPECT_EQ(missing[0].second.size(), 2u);

  index.mark_as_triggered(1, "no-classes");
  missing = index.get_untriggered_errors();
  ASSERT_EQ(missing.size(), 1u);
  ASSERT_EQ(missing[0].second.size(), 1u);
  EXPECT_EQ(missing[0].second[0], "no-throw");

  index.mark_as_triggered(1, "no-throw");
  EXPECT_TRUE(index.get_untriggered_errors().empty());
}

TEST(LintDirectives, ExpectErrorWithoutRulesExpectsNothing)
{
  const auto index = ExpectErrorIndex::from_source("// purets-expect-error\nclass A {}\n");
  EXPECT_TRUE(index.empty());
}

// ============================================================================
// Through the linter
// ============================================================================

TEST(LintDirectives, DisableNextLineSuppressesDiagnostic)
{
  const auto diags = test_support::lint(R"(// purets-disable-next-line no-enums
enum Color { Red }
enum Shape { Square }
)");
  EXPECT_EQ(diags.count_code(rule::k_no_enums), 1u);
}

TEST(LintDirectives, DisableFileProducesNothing)
{
  const auto diags = test_support::lint(R"(// purets-disable-file
// purets-expect-error no-throw
class A {}
enum B { C }
)");
  EXPECT_TRUE(diags.empty());
}

TEST(LintDirectives, TriggeredExpectErrorIsConsumed)
{
  const auto diags = test_support::lint(R"(// purets-expect-error no-enums
enum Color { Red }
)");
  EXPECT_EQ(diags.count_code(rule::k_no_enums), 0u);
  EXPECT_EQ(diags.count_code(rule::k_unused_expect_error), 0u);
}

TEST(LintDirectives, UntriggeredExpectErrorIsReported)
{
  const auto diags = test_support::lint(R"(// purets-expect-error no-classes
enum Color { Red }
)");
  EXPECT_EQ(diags.count_code(rule::k_no_enums), 1u);
  EXPECT_EQ(diags.count_code(rule::k_unused_expect_error), 1u);
  EXPECT_TRUE(has_error_containing(diags, "Expected error 'no-classes' on line 2 was not triggered"));
}

TEST(LintDirectives, DirectiveTextInStringDoesNotSuppress)
{
  const auto diags = test_support::lint(R"(const s: string = "purets-disable-file";
class A {}
)");
  EXPECT_EQ(diags.count_code(rule::k_no_classes), 1u);
}
