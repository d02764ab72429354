// purets/syntax/token.hpp - Token model for the TypeScript lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "purets/basic/source_manager.hpp"

namespace purets::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,

  // Comments are kept as tokens; the parser moves them to Program::comments.
  LineComment,   // // ...
  BlockComment,  // /* ... */

  Identifier,  // includes keywords and #private names
  NumberLiteral,
  StringLiteral,  // token.text is the string *contents* (without quotes, escapes raw)
  RegexLiteral,

  // Template literal pieces (token.text is the raw text between delimiters)
  NoSubstTemplate,  // `abc`
  TemplateHead,     // `abc${
  TemplateMiddle,   // }abc${
  TemplateTail,     // }abc`

  // Punctuation
  LParen,
  RParen,
  LBrace,
  RBrace,
  LBracket,
  RBracket,

  Comma,
  Colon,
  Semicolon,
  Dot,
  DotDotDot,
  Question,
  QuestionDot,
  QuestionQuestion,
  QuestionQuestionEq,
  Arrow,
  At,

  // Operators
  Plus,
  Minus,
  Star,
  StarStar,
  Slash,
  Percent,
  PlusPlus,
  MinusMinus,

  Amp,
  Pipe,
  Caret,
  Tilde,
  Bang,

  AndAnd,
  OrOr,
  AndAndEq,
  OrOrEq,

  Eq,
  EqEq,
  EqEqEq,
  Ne,
  NeEq,
  Lt,
  Le,
  Gt,  // `>>`, `>=`, `>>>` are combined by the parser from adjacent `>`/`=`
  Shl,
  ShlEq,

  PlusEq,
  MinusEq,
  StarEq,
  StarStarEq,
  SlashEq,
  PercentEq,
  AmpEq,
  PipeEq,
  CaretEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;      // byte range in the original source (including quotes for strings)
  std::string_view text;  // slice view (for StringLiteral: interior)
  bool newlineBefore = false;  // a line terminator precedes this token

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().get_offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().get_offset(); }
};

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "<eof>";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::LineComment:
      return "<line_comment>";
    case TokenKind::BlockComment:
      return "<block_comment>";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::NumberLiteral:
      return "number";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::RegexLiteral:
      return "regex";
    case TokenKind::NoSubstTemplate:
    case TokenKind::TemplateHead:
    case TokenKind::TemplateMiddle:
    case TokenKind::TemplateTail:
      return "template";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::DotDotDot:
      return "...";
    case TokenKind::Question:
      return "?";
    case TokenKind::QuestionDot:
      return "?.";
    case TokenKind::QuestionQuestion:
      return "??";
    case TokenKind::QuestionQuestionEq:
      return "??=";
    case TokenKind::Arrow:
      return "=>";
    case TokenKind::At:
      return "@";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::StarStar:
      return "**";
    case TokenKind::Slash:
      return "/";
    case TokenKind::Percent:
      return "%";
    case TokenKind::PlusPlus:
      return "++";
    case TokenKind::MinusMinus:
      return "--";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::Bang:
      return "!";
    case TokenKind::AndAnd:
      return "&&";
    case TokenKind::OrOr:
      return "||";
    case TokenKind::AndAndEq:
      return "&&=";
    case TokenKind::OrOrEq:
      return "||=";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::EqEqEq:
      return "===";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::NeEq:
      return "!==";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Shl:
      return "<<";
    case TokenKind::ShlEq:
      return "<<=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::StarStarEq:
      return "**=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::PercentEq:
      return "%=";
    case TokenKind::AmpEq:
      return "&=";
    case TokenKind::PipeEq:
      return "|=";
    case TokenKind::CaretEq:
      return "^=";
  }
  return "<invalid>";
}

}  // namespace purets::syntax
