// tests/unit/syntax/test_lexer.cpp - Unit tests for the TypeScript lexer
#include <gtest/gtest.h>

#include <string_view>
#include <vector>

#include "purets/syntax/lexer.hpp"
#include "purets/syntax/token.hpp"

using purets::syntax::Lexer;
using purets::syntax::Token;
using purets::syntax::TokenKind;

namespace
{

std::vector<Token> lex(std::string_view src)
{
  Lexer lexer(src);
  return lexer.lex_all();
}

std::vector<TokenKind> kinds_of(const std::vector<Token> & toks)
{
  std::vector<TokenKind> out;
  out.reserve(toks.size());
  for (const auto & t : toks) out.push_back(t.kind);
  return out;
}

}  // namespace

TEST(SyntaxLexer, EmitsLineAndBlockCommentsAsTokens)
{
  const std::string_view src =
    "// line\n"
    "/* block */\n"
    "const x = 1; // trailing\n"
    "const y = /* inline */ 2;\n";

  const auto toks = lex(src);

  int const_count = 0;
  int line_comment_count = 0;
  int block_comment_count = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Identifier && t.text == "const") ++const_count;
    if (t.kind == TokenKind::LineComment) ++line_comment_count;
    if (t.kind == TokenKind::BlockComment) ++block_comment_count;
  }
  EXPECT_EQ(const_count, 2);
  EXPECT_EQ(line_comment_count, 2);
  EXPECT_EQ(block_comment_count, 2);
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.back().kind, TokenKind::Eof);
}

TEST(SyntaxLexer, HashbangIsALineComment)
{
  const auto toks = lex("#!/usr/bin/env node\nmain();\n");
  ASSERT_GE(toks.size(), 2u);
  EXPECT_EQ(toks[0].kind, TokenKind::LineComment);
  EXPECT_EQ(toks[1].text, "main");
  EXPECT_TRUE(toks[1].newlineBefore);
}

TEST(SyntaxLexer, NumberLiterals)
{
  const auto toks = lex("0xDEAD_BEEF 0b1010 0o777 10n 1_000 .5 1.25e-3 2E8");
  std::vector<std::string_view> texts;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::Eof) break;
    EXPECT_EQ(t.kind, TokenKind::NumberLiteral) << t.text;
    texts.push_back(t.text);
  }
  const std::vector<std::string_view> expected = {"0xDEAD_BEEF", "0b1010", "0o777", "10n",
                                                  "1_000",       ".5",     "1.25e-3", "2E8"};
  EXPECT_EQ(texts, expected);
}

TEST(SyntaxLexer, EmptyBasePrefixIsUnknown)
{
  const auto toks = lex("0x;");
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks[0].kind, TokenKind::Unknown);
}

TEST(SyntaxLexer, StringTokenTextIsInterior)
{
  const auto toks = lex(R"(const s = "a\"b"; const t = 'it\'s';)");

  std::vector<std::string_view> strings;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::StringLiteral) strings.push_back(t.text);
  }
  ASSERT_EQ(strings.size(), 2u);
  EXPECT_EQ(strings[0], R"(a\"b)");
  EXPECT_EQ(strings[1], R"(it\'s)");

  // The range still covers the quotes
  for (const auto & t : toks) {
    if (t.kind == TokenKind::StringLiteral) {
      EXPECT_EQ(t.end() - t.begin(), t.text.size() + 2);
    }
  }
}

TEST(SyntaxLexer, UnterminatedStringAndCommentAreUnknown)
{
  {
    const auto toks = lex("const s = \"abc\nconst t = 1;");
    bool saw_unknown = false;
    for (const auto & t : toks) saw_unknown = saw_unknown || t.kind == TokenKind::Unknown;
    EXPECT_TRUE(saw_unknown);
  }
  {
    const auto toks = lex("x /* never closed");
    ASSERT_GE(toks.size(), 2u);
    EXPECT_EQ(toks[1].kind, TokenKind::Unknown);
  }
}

TEST(SyntaxLexer, SlashAfterOperandIsDivision)
{
  const auto toks = lex("a / b / c");
  const std::vector<TokenKind> expected = {
    TokenKind::Identifier, TokenKind::Slash, TokenKind::Identifier,
    TokenKind::Slash,      TokenKind::Identifier, TokenKind::Eof};
  EXPECT_EQ(kinds_of(toks), expected);
}

TEST(SyntaxLexer, SlashAfterParenIsDivision)
{
  const auto toks = lex("(a + b) / 2");
  bool saw_regex = false;
  bool saw_slash = false;
  for (const auto & t : toks) {
    saw_regex = saw_regex || t.kind == TokenKind::RegexLiteral;
    saw_slash = saw_slash || t.kind == TokenKind::Slash;
  }
  EXPECT_FALSE(saw_regex);
  EXPECT_TRUE(saw_slash);
}

TEST(SyntaxLexer, SlashAfterKeywordOrOperatorIsRegex)
{
  {
    const auto toks = lex("return /x[/]y/gi;");
    ASSERT_GE(toks.size(), 2u);
    EXPECT_EQ(toks[1].kind, TokenKind::RegexLiteral);
    EXPECT_EQ(toks[1].text, "/x[/]y/gi");
  }
  {
    const auto toks = lex("const re = /\\d+/;");
    ASSERT_GE(toks.size(), 4u);
    EXPECT_EQ(toks[3].kind, TokenKind::RegexLiteral);
    EXPECT_EQ(toks[3].text, "/\\d+/");
  }
  {
    const auto toks = lex("/^a/.test(s)");
    ASSERT_FALSE(toks.empty());
    EXPECT_EQ(toks[0].kind, TokenKind::RegexLiteral);
  }
}

TEST(SyntaxLexer, TemplateLiteralPieces)
{
  const auto toks = lex("`a${x}b${y}c`");
  const std::vector<TokenKind> expected = {
    TokenKind::TemplateHead, TokenKind::Identifier, TokenKind::TemplateMiddle,
    TokenKind::Identifier,   TokenKind::TemplateTail, TokenKind::Eof};
  ASSERT_EQ(kinds_of(toks), expected);
  EXPECT_EQ(toks[0].text, "a");
  EXPECT_EQ(toks[2].text, "b");
  EXPECT_EQ(toks[4].text, "c");
}

TEST(SyntaxLexer, TemplateWithObjectLiteralInside)
{
  const auto toks = lex("`v=${ {a: 1}.a }!`");
  ASSERT_FALSE(toks.empty());
  EXPECT_EQ(toks.front().kind, TokenKind::TemplateHead);

  // The object braces do not close the substitution
  int tails = 0;
  int rbraces = 0;
  for (const auto & t : toks) {
    if (t.kind == TokenKind::TemplateTail) ++tails;
    if (t.kind == TokenKind::RBrace) ++rbraces;
  }
  EXPECT_EQ(tails, 1);
  EXPECT_EQ(rbraces, 1);
}

TEST(SyntaxLexer, NoSubstitutionTemplate)
{
  const auto toks = lex("`plain \\` text`");
  ASSERT_GE(toks.size(), 2u);
  EXPECT_EQ(toks[0].kind, TokenKind::NoSubstTemplate);
  EXPECT_EQ(toks[0].text, "plain \\` text");
}

TEST(SyntaxLexer, TracksNewlineBefore)
{
  const auto toks = lex("a\nb c");
  ASSERT_GE(toks.size(), 3u);
  EXPECT_FALSE(toks[0].newlineBefore);
  EXPECT_TRUE(toks[1].newlineBefore);
  EXPECT_FALSE(toks[2].newlineBefore);
}

TEST(SyntaxLexer, MultiCharacterPunctuators)
{
  const auto toks = lex("a?.b ?? c === d !== e => ... **= ??=");
  std::vector<TokenKind> puncts;
  for (const auto & t : toks) {
    if (t.kind != TokenKind::Identifier && t.kind != TokenKind::Eof) puncts.push_back(t.kind);
  }
  const std::vector<TokenKind> expected = {
    TokenKind::QuestionDot, TokenKind::QuestionQuestion, TokenKind::EqEqEq,
    TokenKind::NeEq,        TokenKind::Arrow,            TokenKind::DotDotDot,
    TokenKind::StarStarEq,  TokenKind::QuestionQuestionEq};
  EXPECT_EQ(puncts, expected);
}

TEST(SyntaxLexer, ConditionalWithDecimalIsNotOptionalChain)
{
  const auto toks = lex("a?.5:b");
  ASSERT_GE(toks.size(), 3u);
  EXPECT_EQ(toks[1].kind, TokenKind::Question);
  EXPECT_EQ(toks[2].kind, TokenKind::NumberLiteral);
  EXPECT_EQ(toks[2].text, ".5");
}

TEST(SyntaxLexer, GreaterThanIsAlwaysSingle)
{
  const auto toks = lex("a >> b");
  ASSERT_GE(toks.size(), 4u);
  EXPECT_EQ(toks[1].kind, TokenKind::Gt);
  EXPECT_EQ(toks[2].kind, TokenKind::Gt);
}

TEST(SyntaxLexer, PrivateNamesAreIdentifiers)
{
  const auto toks = lex("this.#count");
  ASSERT_GE(toks.size(), 3u);
  EXPECT_EQ(toks[2].kind, TokenKind::Identifier);
  EXPECT_EQ(toks[2].text, "#count");
}
