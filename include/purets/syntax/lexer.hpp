// purets/syntax/lexer.hpp - Hand-written TypeScript lexer
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "purets/syntax/token.hpp"

namespace purets::syntax
{

/**
 * Splits TypeScript source into tokens.
 *
 * Comments are emitted as tokens. Regular expression literals are told
 * apart from division by the previous significant token, and template
 * literals are split into head/middle/tail pieces around `${ ... }`.
 * The returned vector always ends with an Eof token.
 */
class Lexer
{
public:
  explicit Lexer(std::string_view src) : src_(src) {}

  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Skips whitespace; returns true if a line terminator was crossed.
  bool skip_whitespace();

  [[nodiscard]] Token lex_line_comment();
  [[nodiscard]] Token lex_block_comment();
  [[nodiscard]] Token lex_identifier_or_keyword();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string();
  [[nodiscard]] Token lex_template_part(uint32_t start, bool is_head);
  [[nodiscard]] Token lex_regex();
  [[nodiscard]] Token lex_punctuator();

  [[nodiscard]] bool regex_allowed() const noexcept;

  [[nodiscard]] Token make_token(TokenKind kind, uint32_t start) const noexcept;

  [[nodiscard]] static SourceRange make_range(uint32_t start, uint32_t end) noexcept
  {
    return {start, end};
  }

  std::string_view src_;
  size_t pos_ = 0;

  TokenKind last_kind_ = TokenKind::Eof;  ///< Last significant (non-comment) token
  std::string_view last_text_;
  std::vector<int> template_depth_;  ///< Open `{` count per enclosing `${`
};

}  // namespace purets::syntax
