// purets/syntax/lexer.cpp - TypeScript lexer implementation
#include "purets/syntax/lexer.hpp"

#include <array>
#include <cctype>

namespace purets::syntax
{
namespace
{

bool is_ident_start(unsigned char c)
{
  return (std::isalpha(c) != 0) || c == '_' || c == '$' || c >= 0x80;
}
bool is_ident_continue(unsigned char c) { return is_ident_start(c) || (std::isdigit(c) != 0); }

bool is_hex_digit(unsigned char c)
{
  return (std::isdigit(c) != 0) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

/// Keywords after which a `/` starts a regular expression.
constexpr std::array<std::string_view, 14> k_regex_prefix_keywords = {
  "return", "typeof", "instanceof", "in",    "of",    "new",   "delete",
  "void",   "throw",  "case",       "do",    "else",  "yield", "await",
};

struct Punct
{
  std::string_view text;
  TokenKind kind;
};

// Longest first.
constexpr std::array<Punct, 52> k_punctuators = {{
  {"...", TokenKind::DotDotDot},
  {"===", TokenKind::EqEqEq},
  {"!==", TokenKind::NeEq},
  {"**=", TokenKind::StarStarEq},
  {"<<=", TokenKind::ShlEq},
  {"&&=", TokenKind::AndAndEq},
  {"||=", TokenKind::OrOrEq},
  {"?\?=", TokenKind::QuestionQuestionEq},
  {"=>", TokenKind::Arrow},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"<=", TokenKind::Le},
  {"<<", TokenKind::Shl},
  {"**", TokenKind::StarStar},
  {"++", TokenKind::PlusPlus},
  {"--", TokenKind::MinusMinus},
  {"&&", TokenKind::AndAnd},
  {"||", TokenKind::OrOr},
  {"??", TokenKind::QuestionQuestion},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},
  {"&=", TokenKind::AmpEq},
  {"|=", TokenKind::PipeEq},
  {"^=", TokenKind::CaretEq},
  {"(", TokenKind::LParen},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {")", TokenKind::RParen},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {",", TokenKind::Comma},
  {":", TokenKind::Colon},
  {";", TokenKind::Semicolon},
  {".", TokenKind::Dot},
  {"?", TokenKind::Question},
  {"@", TokenKind::At},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"*", TokenKind::Star},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"&", TokenKind::Amp},
  {"|", TokenKind::Pipe},
  {"^", TokenKind::Caret},
  {"~", TokenKind::Tilde},
  {"!", TokenKind::Bang},
  {"=", TokenKind::Eq},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

bool Lexer::skip_whitespace()
{
  bool newline = false;
  while (!eof()) {
    const auto c = static_cast<unsigned char>(peek());
    if (c == '\n') {
      newline = true;
      advance(1);
      continue;
    }
    if (c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f') {
      advance(1);
      continue;
    }
    // U+00A0 NBSP and U+FEFF BOM (UTF-8 encoded)
    if (starts_with("\xC2\xA0")) {
      advance(2);
      continue;
    }
    if (starts_with("\xEF\xBB\xBF")) {
      advance(3);
      continue;
    }
    break;
  }
  return newline;
}

Token Lexer::make_token(TokenKind kind, uint32_t start) const noexcept
{
  const auto end = static_cast<uint32_t>(pos_);
  Token t;
  t.kind = kind;
  t.range = make_range(start, end);
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::lex_line_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  while (!eof() && peek() != '\n') {
    advance(1);
  }
  return make_token(TokenKind::LineComment, start);
}

Token Lexer::lex_block_comment()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(2);
  while (!eof() && !starts_with("*/")) {
    advance(1);
  }
  if (eof()) {
    // Unterminated block comment
    return make_token(TokenKind::Unknown, start);
  }
  advance(2);
  return make_token(TokenKind::BlockComment, start);
}

Token Lexer::lex_identifier_or_keyword()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::Identifier, start);
}

Token Lexer::lex_number()
{
  const auto start = static_cast<uint32_t>(pos_);

  // Base-prefixed integers: 0x.. 0b.. 0o..
  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'b' || p1 == 'B' || p1 == 'o' || p1 == 'O') {
      advance(2);
      bool any = false;
      while (!eof()) {
        const auto c = static_cast<unsigned char>(peek());
        if (is_hex_digit(c) || c == '_') {
          any = true;
          advance(1);
          continue;
        }
        break;
      }
      if (peek() == 'n') {
        advance(1);
      }
      return make_token(any ? TokenKind::NumberLiteral : TokenKind::Unknown, start);
    }
  }

  auto consume_digits = [this]() {
    while (!eof() && ((std::isdigit(static_cast<unsigned char>(peek())) != 0) || peek() == '_')) {
      advance(1);
    }
  };

  consume_digits();

  // Fractional part (also handles a leading `.5`)
  if (peek() == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0) {
    advance(1);
    consume_digits();
  } else if (peek() == '.' && pos_ > start) {
    // `1.` is a complete literal
    advance(1);
  }

  // Exponent
  if (peek() == 'e' || peek() == 'E') {
    const char after = peek(1);
    const bool signed_exp = (after == '+' || after == '-') &&
                            std::isdigit(static_cast<unsigned char>(peek(2))) != 0;
    if (signed_exp || std::isdigit(static_cast<unsigned char>(after)) != 0) {
      advance(signed_exp ? 2 : 1);
      consume_digits();
    }
  }

  // BigInt suffix
  if (peek() == 'n') {
    advance(1);
  }

  return make_token(TokenKind::NumberLiteral, start);
}

Token Lexer::lex_string()
{
  const auto start = static_cast<uint32_t>(pos_);
  const char quote = peek();
  advance(1);

  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof()) {
    const char c = peek();
    if (c == quote) {
      break;
    }
    // Raw newlines are not allowed inside string literals.
    if (c == '\n') {
      return make_token(TokenKind::Unknown, start);
    }
    if (c == '\\') {
      // Line continuations and escaped quotes are both skipped here.
      advance(2);
      continue;
    }
    advance(1);
  }

  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }

  const auto payload_end = static_cast<uint32_t>(pos_);
  advance(1);  // closing quote

  Token t = make_token(TokenKind::StringLiteral, start);
  t.text = src_.substr(payload_start, payload_end - payload_start);
  return t;
}

Token Lexer::lex_template_part(uint32_t start, bool is_head)
{
  // pos_ is just after the opening '`' (head) or the closing '}' (continuation)
  const auto payload_start = static_cast<uint32_t>(pos_);

  while (!eof()) {
    const char c = peek();
    if (c == '\\') {
      advance(2);
      continue;
    }
    if (c == '`') {
      const auto payload_end = static_cast<uint32_t>(pos_);
      advance(1);
      if (!is_head) {
        template_depth_.pop_back();
      }
      Token t = make_token(is_head ? TokenKind::NoSubstTemplate : TokenKind::TemplateTail, start);
      t.text = src_.substr(payload_start, payload_end - payload_start);
      return t;
    }
    if (c == '$' && peek(1) == '{') {
      const auto payload_end = static_cast<uint32_t>(pos_);
      advance(2);
      if (is_head) {
        template_depth_.push_back(0);
      }
      Token t = make_token(is_head ? TokenKind::TemplateHead : TokenKind::TemplateMiddle, start);
      t.text = src_.substr(payload_start, payload_end - payload_start);
      return t;
    }
    advance(1);
  }

  if (!is_head && !template_depth_.empty()) {
    template_depth_.pop_back();
  }
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::lex_regex()
{
  const auto start = static_cast<uint32_t>(pos_);
  advance(1);  // opening '/'

  bool in_class = false;
  while (!eof()) {
    const char c = peek();
    if (c == '\n') {
      return make_token(TokenKind::Unknown, start);
    }
    if (c == '\\') {
      advance(2);
      continue;
    }
    if (c == '[') {
      in_class = true;
    } else if (c == ']') {
      in_class = false;
    } else if (c == '/' && !in_class) {
      break;
    }
    advance(1);
  }

  if (eof()) {
    return make_token(TokenKind::Unknown, start);
  }
  advance(1);  // closing '/'

  // Flags
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }
  return make_token(TokenKind::RegexLiteral, start);
}

bool Lexer::regex_allowed() const noexcept
{
  switch (last_kind_) {
    case TokenKind::Eof:
      return true;  // start of input
    case TokenKind::Identifier:
      for (const auto kw : k_regex_prefix_keywords) {
        if (last_text_ == kw) return true;
      }
      return false;
    case TokenKind::NumberLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::RegexLiteral:
    case TokenKind::NoSubstTemplate:
    case TokenKind::TemplateTail:
    case TokenKind::RParen:
    case TokenKind::RBracket:
    case TokenKind::RBrace:
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus:
      return false;
    default:
      return true;
  }
}

Token Lexer::lex_punctuator()
{
  const auto start = static_cast<uint32_t>(pos_);

  // `?.` followed by a digit is a conditional with a decimal (a?.5:b)
  if (starts_with("?.") && std::isdigit(static_cast<unsigned char>(peek(2))) != 0) {
    advance(1);
    return make_token(TokenKind::Question, start);
  }
  if (starts_with("?.")) {
    advance(2);
    return make_token(TokenKind::QuestionDot, start);
  }

  for (const auto & p : k_punctuators) {
    if (starts_with(p.text)) {
      advance(p.text.size());
      return make_token(p.kind, start);
    }
  }

  advance(1);
  return make_token(TokenKind::Unknown, start);
}

Token Lexer::next_token()
{
  const bool newline = skip_whitespace();

  Token t;
  if (eof()) {
    const auto at = static_cast<uint32_t>(src_.size());
    t.kind = TokenKind::Eof;
    t.range = make_range(at, at);
  } else if (starts_with("//")) {
    t = lex_line_comment();
  } else if (starts_with("/*")) {
    t = lex_block_comment();
  } else if (pos_ == 0 && starts_with("#!")) {
    // Hashbang line
    t = lex_line_comment();
  } else {
    const auto c = static_cast<unsigned char>(peek());
    const auto start = static_cast<uint32_t>(pos_);

    if (is_ident_start(c) ||
        (c == '#' && is_ident_start(static_cast<unsigned char>(peek(1))))) {
      if (c == '#') advance(1);
      t = lex_identifier_or_keyword();
      t.range = make_range(start, t.end());
      t.text = src_.substr(start, t.end() - start);
    } else if (
      (std::isdigit(c) != 0) ||
      (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
      t = lex_number();
    } else if (c == '"' || c == '\'') {
      t = lex_string();
    } else if (c == '`') {
      advance(1);
      t = lex_template_part(start, true);
    } else if (c == '/' && regex_allowed()) {
      t = lex_regex();
    } else if (c == '{') {
      if (!template_depth_.empty()) ++template_depth_.back();
      t = lex_punctuator();
    } else if (c == '}' && !template_depth_.empty() && template_depth_.back() == 0) {
      advance(1);
      t = lex_template_part(start, false);
    } else {
      if (c == '}' && !template_depth_.empty()) --template_depth_.back();
      t = lex_punctuator();
    }
  }

  t.newlineBefore = newline;
  if (t.kind != TokenKind::LineComment && t.kind != TokenKind::BlockComment) {
    last_kind_ = t.kind;
    last_text_ = t.text;
  }
  return t;
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    const Token t = next_token();
    out.push_back(t);
    if (t.kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

}  // namespace purets::syntax
