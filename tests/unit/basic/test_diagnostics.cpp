// tests/unit/basic/test_diagnostics.cpp - Diagnostic bag, printer and JSON output
#include <gtest/gtest.h>

#include <sstream>
#include <string>

#include "purets/basic/diagnostic.hpp"
#include "purets/basic/diagnostic_json.hpp"
#include "purets/basic/diagnostic_printer.hpp"
#include "purets/basic/source_manager.hpp"

using namespace purets;

TEST(BasicSourceFile, LineColumnAndLines)
{
  const SourceFile source("a.ts", "const a = 1;\n  class B {}\n");

  const auto lc = source.get_line_column(15);
  EXPECT_EQ(lc.line, 2u);
  EXPECT_EQ(lc.column, 3u);
  EXPECT_EQ(source.get_line(1), "  class B {}");
  EXPECT_EQ(source.get_slice(SourceRange(0, 5)), "const");
}

TEST(BasicDiagnostics, BuilderRegistersOnDestruction)
{
  DiagnosticBag bag;
  bag.report_error(SourceRange(0, 5), "Classes are not allowed").with_code("no-classes");
  bag.report_error(SourceRange(6, 7), "Enums are not allowed").with_code("no-enums");
  bag.report_error(SourceRange(8, 9), "Classes again").with_code("no-classes");

  ASSERT_EQ(bag.size(), 3u);
  EXPECT_EQ(bag.count_code("no-classes"), 2u);
  EXPECT_EQ(bag.count_code("no-enums"), 1u);
  EXPECT_EQ(bag.all()[0].message, "Classes are not allowed");
  EXPECT_EQ(bag.all()[1].primary_range().get_begin().get_offset(), 6u);
}

TEST(BasicDiagnostics, MergeKeepsOrder)
{
  DiagnosticBag a;
  a.report_error(SourceRange(0, 1), "first");
  DiagnosticBag b;
  b.report_error(SourceRange(0, 1), "second");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 2u);
  EXPECT_EQ(a.all()[1].message, "second");
}

TEST(BasicDiagnosticPrinter, CompactFormat)
{
  const SourceFile source("src/pure/add.ts", "const a = 1;\nclass Foo {}\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(13, 25), "Classes are not allowed in pure TypeScript subset")
    .with_code("no-classes");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false, false);
  printer.print_all(bag, source);

  EXPECT_EQ(
    out.str(),
    "src/pure/add.ts:2:1 [no-classes] Classes are not allowed in pure TypeScript subset\n");
}

TEST(BasicDiagnosticPrinter, VerboseShowsSourceAndCaret)
{
  const SourceFile source("x.ts", "let a;\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(4, 5), "'let' declaration 'a' requires type annotation")
    .with_code("let-requires-type");

  std::ostringstream out;
  DiagnosticPrinter printer(out, false, true);
  printer.print_all(bag, source);

  EXPECT_EQ(
    out.str(),
    "x.ts:1:5 [let-requires-type] 'let' declaration 'a' requires type annotation\n"
    "  let a;\n"
    "      ^\n\n");
}

TEST(BasicDiagnosticJson, SerializesLocationAndRule)
{
  const SourceFile source("src/a.ts", "const a = 1;\nenum E { X }\n");
  DiagnosticBag bag;
  bag.report_error(SourceRange(13, 25), "Enums are not allowed in pure TypeScript subset")
    .with_code("no-enums");

  const auto arr = to_json(bag, source);
  ASSERT_TRUE(arr.is_array());
  ASSERT_EQ(arr.size(), 1u);

  const auto & j = arr[0];
  EXPECT_EQ(j["file"], "src/a.ts");
  EXPECT_EQ(j["rule"], "no-enums");
  EXPECT_EQ(j["line"], 2);
  EXPECT_EQ(j["column"], 1);
  EXPECT_EQ(j["start"], 13);
  EXPECT_EQ(j["end"], 25);
  EXPECT_EQ(j["severity"], "error");
}
