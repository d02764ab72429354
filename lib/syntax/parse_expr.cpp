// purets/syntax/parse_expr.cpp - Expression parsing
#include <cstdint>
#include <cstdlib>
#include <string>

#include "purets/syntax/parser.hpp"

namespace purets::syntax
{
namespace
{

// Binary operator precedences, loosest first.
constexpr int k_prec_nullish = 1;
constexpr int k_prec_or = 1;
constexpr int k_prec_and = 2;
constexpr int k_prec_bitor = 3;
constexpr int k_prec_bitxor = 4;
constexpr int k_prec_bitand = 5;
constexpr int k_prec_equality = 6;
constexpr int k_prec_relational = 7;
constexpr int k_prec_shift = 8;
constexpr int k_prec_additive = 9;
constexpr int k_prec_multiplicative = 10;
constexpr int k_prec_exponent = 11;

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

[[nodiscard]] int hex_value(char h) noexcept
{
  if (h >= '0' && h <= '9') return h - '0';
  if (h >= 'a' && h <= 'f') return 10 + (h - 'a');
  if (h >= 'A' && h <= 'F') return 10 + (h - 'A');
  return -1;
}

/// Reads exactly `count` hex digits at raw[i..]; returns false when they are missing.
[[nodiscard]] bool read_hex(std::string_view raw, size_t i, size_t count, uint32_t & out)
{
  if (i + count > raw.size()) {
    return false;
  }
  out = 0;
  for (size_t k = 0; k < count; ++k) {
    const int v = hex_value(raw[i + k]);
    if (v < 0) {
      return false;
    }
    out = (out << 4) | static_cast<uint32_t>(v);
  }
  return true;
}

}  // namespace

// ============================================================================
// Assignment, conditional and binary levels
// ============================================================================

Expr * Parser::parse_expr()
{
  const uint32_t begin = cur().begin();
  Expr * first = parse_assign();
  if (!at(TokenKind::Comma)) {
    return first;
  }
  std::vector<Expr *> list{first};
  while (match(TokenKind::Comma)) {
    list.push_back(parse_assign());
  }
  return ast_.create<SequenceExpr>(to_span(list), range_from(begin));
}

Expr * Parser::parse_assign()
{
  const Token & t = cur();
  const uint32_t begin = t.begin();

  if (is_kw("yield", t)) {
    advance();
    const bool delegate = match(TokenKind::Star);
    Expr * arg = nullptr;
    if (
      !can_insert_semicolon() && !at(TokenKind::Semicolon) && !at(TokenKind::RParen) &&
      !at(TokenKind::RBracket) && !at(TokenKind::Comma) && !at(TokenKind::Colon)) {
      arg = parse_assign();
    }
    auto * y = ast_.create<YieldExpr>(arg, range_from(begin));
    y->delegate = delegate;
    return y;
  }

  // Arrow function heads.
  if (at_identifier() && cur(1).kind == TokenKind::Arrow && !cur(1).newlineBefore) {
    return parse_arrow_function(begin, false);
  }
  if (is_kw("async", t) && !cur(1).newlineBefore) {
    const bool ident_head = cur(1).kind == TokenKind::Identifier &&
                            cur(2).kind == TokenKind::Arrow && !cur(2).newlineBefore;
    if (ident_head || is_arrow_paren_at(idx_ + 1) || is_generic_arrow_at(idx_ + 1)) {
      advance();
      return parse_arrow_function(begin, true);
    }
  }
  if (is_arrow_paren_at(idx_) || is_generic_arrow_at(idx_)) {
    return parse_arrow_function(begin, false);
  }

  Expr * lhs = parse_conditional();
  if (const auto op = peek_assign_op()) {
    idx_ += op->second;
    Expr * rhs = parse_assign();
    return ast_.create<AssignExpr>(op->first, lhs, rhs, range_from(begin));
  }
  return lhs;
}

Expr * Parser::parse_conditional()
{
  const uint32_t begin = cur().begin();
  Expr * test = parse_binary(1);
  if (!match(TokenKind::Question)) {
    return test;
  }

  Expr * consequent = nullptr;
  {
    const FlagScope no_arrow(no_arrow_return_type_, true);
    const FlagScope in(no_in_, false);
    consequent = parse_assign();
  }
  expect(TokenKind::Colon, "':' in conditional expression");
  Expr * alternate = parse_assign();
  return ast_.create<ConditionalExpr>(test, consequent, alternate, range_from(begin));
}

Expr * Parser::parse_binary(int min_prec)
{
  const uint32_t begin = cur().begin();
  Expr * lhs = parse_unary();

  for (;;) {
    if (
      (at_kw("as") || at_kw("satisfies")) && !cur().newlineBefore &&
      k_prec_relational >= min_prec) {
      const bool satisfies = advance().text == "satisfies";
      TypeNode * type = nullptr;
      bool is_const = false;
      if (!satisfies && at_kw("const")) {
        advance();
        is_const = true;
      } else {
        type = parse_type();
      }
      auto * as = ast_.create<AsExpr>(lhs, type, range_from(begin));
      as->isConst = is_const;
      as->isSatisfies = satisfies;
      lhs = as;
      continue;
    }

    const BinaryOpInfo info = peek_binary_op();
    if (info.precedence < 0 || info.precedence < min_prec) {
      break;
    }
    idx_ += info.token_count;
    const int next_min = info.op == BinaryOp::Exp ? info.precedence : info.precedence + 1;
    Expr * rhs = parse_binary(next_min);
    lhs = ast_.create<BinaryExpr>(lhs, info.op, rhs, range_from(begin));
  }
  return lhs;
}

Parser::BinaryOpInfo Parser::peek_binary_op() const
{
  const Token & t = cur();
  auto adjacent = [this](size_t la) { return cur(la).begin() == cur(la - 1).end(); };
  auto make = [](int prec, BinaryOp op, size_t count = 1) {
    BinaryOpInfo info;
    info.precedence = prec;
    info.op = op;
    info.token_count = count;
    return info;
  };

  switch (t.kind) {
    case TokenKind::QuestionQuestion:
      return make(k_prec_nullish, BinaryOp::Nullish);
    case TokenKind::OrOr:
      return make(k_prec_or, BinaryOp::Or);
    case TokenKind::AndAnd:
      return make(k_prec_and, BinaryOp::And);
    case TokenKind::Pipe:
      return make(k_prec_bitor, BinaryOp::BitOr);
    case TokenKind::Caret:
      return make(k_prec_bitxor, BinaryOp::BitXor);
    case TokenKind::Amp:
      return make(k_prec_bitand, BinaryOp::BitAnd);
    case TokenKind::EqEq:
      return make(k_prec_equality, BinaryOp::Eq);
    case TokenKind::Ne:
      return make(k_prec_equality, BinaryOp::Ne);
    case TokenKind::EqEqEq:
      return make(k_prec_equality, BinaryOp::StrictEq);
    case TokenKind::NeEq:
      return make(k_prec_equality, BinaryOp::StrictNe);
    case TokenKind::Lt:
      return make(k_prec_relational, BinaryOp::Lt);
    case TokenKind::Le:
      return make(k_prec_relational, BinaryOp::Le);
    case TokenKind::Gt: {
      // The lexer never joins '>' so that type argument lists close cleanly.
      if (cur(1).kind == TokenKind::Gt && adjacent(1)) {
        if (cur(2).kind == TokenKind::Gt && adjacent(2)) {
          if (cur(3).kind == TokenKind::Eq && adjacent(3)) {
            return {};  // >>>=
          }
          return make(k_prec_shift, BinaryOp::UShr, 3);
        }
        if (cur(2).kind == TokenKind::Eq && adjacent(2)) {
          return {};  // >>=
        }
        return make(k_prec_shift, BinaryOp::Shr, 2);
      }
      if (cur(1).kind == TokenKind::Eq && adjacent(1)) {
        return make(k_prec_relational, BinaryOp::Ge, 2);
      }
      return make(k_prec_relational, BinaryOp::Gt);
    }
    case TokenKind::Shl:
      return make(k_prec_shift, BinaryOp::Shl);
    case TokenKind::Plus:
      return make(k_prec_additive, BinaryOp::Add);
    case TokenKind::Minus:
      return make(k_prec_additive, BinaryOp::Sub);
    case TokenKind::Star:
      return make(k_prec_multiplicative, BinaryOp::Mul);
    case TokenKind::Slash:
      return make(k_prec_multiplicative, BinaryOp::Div);
    case TokenKind::Percent:
      return make(k_prec_multiplicative, BinaryOp::Mod);
    case TokenKind::StarStar:
      return make(k_prec_exponent, BinaryOp::Exp);
    case TokenKind::Identifier:
      if (t.text == "instanceof") {
        return make(k_prec_relational, BinaryOp::InstanceOf);
      }
      if (t.text == "in" && !no_in_) {
        return make(k_prec_relational, BinaryOp::In);
      }
      return {};
    default:
      return {};
  }
}

std::optional<std::pair<AssignOp, size_t>> Parser::peek_assign_op() const
{
  auto adjacent = [this](size_t la) { return cur(la).begin() == cur(la - 1).end(); };
  switch (cur().kind) {
    case TokenKind::Eq:
      return std::make_pair(AssignOp::Assign, size_t{1});
    case TokenKind::PlusEq:
      return std::make_pair(AssignOp::AddAssign, size_t{1});
    case TokenKind::MinusEq:
      return std::make_pair(AssignOp::SubAssign, size_t{1});
    case TokenKind::StarEq:
      return std::make_pair(AssignOp::MulAssign, size_t{1});
    case TokenKind::SlashEq:
      return std::make_pair(AssignOp::DivAssign, size_t{1});
    case TokenKind::PercentEq:
      return std::make_pair(AssignOp::ModAssign, size_t{1});
    case TokenKind::StarStarEq:
      return std::make_pair(AssignOp::ExpAssign, size_t{1});
    case TokenKind::ShlEq:
      return std::make_pair(AssignOp::ShlAssign, size_t{1});
    case TokenKind::AmpEq:
      return std::make_pair(AssignOp::BitAndAssign, size_t{1});
    case TokenKind::PipeEq:
      return std::make_pair(AssignOp::BitOrAssign, size_t{1});
    case TokenKind::CaretEq:
      return std::make_pair(AssignOp::BitXorAssign, size_t{1});
    case TokenKind::AndAndEq:
      return std::make_pair(AssignOp::LogicalAndAssign, size_t{1});
    case TokenKind::OrOrEq:
      return std::make_pair(AssignOp::LogicalOrAssign, size_t{1});
    case TokenKind::QuestionQuestionEq:
      return std::make_pair(AssignOp::NullishAssign, size_t{1});
    case TokenKind::Gt:
      if (cur(1).kind == TokenKind::Gt && adjacent(1)) {
        if (cur(2).kind == TokenKind::Eq && adjacent(2)) {
          return std::make_pair(AssignOp::ShrAssign, size_t{3});
        }
        if (
          cur(2).kind == TokenKind::Gt && adjacent(2) && cur(3).kind == TokenKind::Eq &&
          adjacent(3)) {
          return std::make_pair(AssignOp::UShrAssign, size_t{4});
        }
      }
      return std::nullopt;
    default:
      return std::nullopt;
  }
}

// ============================================================================
// Unary and postfix
// ============================================================================

Expr * Parser::parse_unary()
{
  const Token & t = cur();
  const uint32_t begin = t.begin();

  auto unary = [&](UnaryOp op) -> Expr * {
    advance();
    Expr * operand = parse_unary();
    return ast_.create<UnaryExpr>(op, operand, range_from(begin));
  };

  switch (t.kind) {
    case TokenKind::Bang:
      return unary(UnaryOp::Not);
    case TokenKind::Minus:
      return unary(UnaryOp::Neg);
    case TokenKind::Plus:
      return unary(UnaryOp::Plus);
    case TokenKind::Tilde:
      return unary(UnaryOp::BitNot);
    case TokenKind::PlusPlus:
    case TokenKind::MinusMinus: {
      const UpdateOp op =
        t.kind == TokenKind::PlusPlus ? UpdateOp::Increment : UpdateOp::Decrement;
      advance();
      Expr * operand = parse_unary();
      return ast_.create<UpdateExpr>(op, true, operand, range_from(begin));
    }
    case TokenKind::Lt: {
      // <T>expr
      advance();
      TypeNode * type = parse_type();
      expect(TokenKind::Gt, "'>' to close type assertion");
      Expr * operand = parse_unary();
      return ast_.create<TypeAssertionExpr>(type, operand, range_from(begin));
    }
    case TokenKind::Identifier:
      if (t.text == "typeof") return unary(UnaryOp::TypeOf);
      if (t.text == "void") return unary(UnaryOp::Void);
      if (t.text == "delete") return unary(UnaryOp::Delete);
      if (t.text == "await") {
        advance();
        Expr * operand = parse_unary();
        return ast_.create<AwaitExpr>(operand, range_from(begin));
      }
      break;
    default:
      break;
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  const uint32_t begin = cur().begin();
  Expr * e = parse_call_chain(parse_primary(), true);
  if ((at(TokenKind::PlusPlus) || at(TokenKind::MinusMinus)) && !cur().newlineBefore) {
    const UpdateOp op =
      advance().kind == TokenKind::PlusPlus ? UpdateOp::Increment : UpdateOp::Decrement;
    return ast_.create<UpdateExpr>(op, false, e, range_from(begin));
  }
  return e;
}

Expr * Parser::parse_call_chain(Expr * base, bool allow_calls)
{
  Expr * e = base;
  const uint32_t begin = base->get_range().get_begin().get_offset();

  auto parse_member_name = [this](Expr * object, uint32_t from, bool optional) -> Expr * {
    if (!at(TokenKind::Identifier)) {
      error_at(cur(), "expected property name");
      return object;
    }
    const Token & name = advance();
    auto * m = ast_.create<MemberExpr>(object, name.text, range_from(from));
    m->propertyRange = name.range;
    m->optional = optional;
    return m;
  };

  for (;;) {
    if (match(TokenKind::Dot)) {
      e = parse_member_name(e, begin, false);
      continue;
    }

    if (match(TokenKind::QuestionDot)) {
      if (at(TokenKind::LParen)) {
        auto args = parse_arguments();
        auto * call = ast_.create<CallExpr>(e, to_span(args), range_from(begin));
        call->optional = true;
        e = call;
      } else if (at(TokenKind::LBracket)) {
        advance();
        Expr * index = nullptr;
        {
          const NestedScope nested(*this);
          index = parse_expr();
        }
        expect(TokenKind::RBracket, "']'");
        auto * ix = ast_.create<IndexExpr>(e, index, range_from(begin));
        ix->optional = true;
        e = ix;
      } else if (at(TokenKind::Lt) && at_call_type_args()) {
        (void)parse_type_args();
        auto args = parse_arguments();
        auto * call = ast_.create<CallExpr>(e, to_span(args), range_from(begin));
        call->optional = true;
        e = call;
      } else {
        e = parse_member_name(e, begin, true);
      }
      continue;
    }

    if (at(TokenKind::LBracket)) {
      advance();
      Expr * index = nullptr;
      {
        const NestedScope nested(*this);
        index = parse_expr();
      }
      expect(TokenKind::RBracket, "']'");
      e = ast_.create<IndexExpr>(e, index, range_from(begin));
      continue;
    }

    if (at(TokenKind::Bang) && !cur().newlineBefore) {
      advance();
      e = ast_.create<NonNullExpr>(e, range_from(begin));
      continue;
    }

    if (allow_calls && at(TokenKind::LParen)) {
      auto args = parse_arguments();
      e = ast_.create<CallExpr>(e, to_span(args), range_from(begin));
      continue;
    }

    if (at(TokenKind::Lt) && at_call_type_args()) {
      (void)parse_type_args();
      if (!allow_calls) {
        break;
      }
      continue;
    }

    if (at(TokenKind::NoSubstTemplate) || at(TokenKind::TemplateHead)) {
      e = parse_template(e, begin);
      continue;
    }

    break;
  }
  return e;
}

std::vector<Expr *> Parser::parse_arguments()
{
  std::vector<Expr *> args;
  const NestedScope nested(*this);
  expect(TokenKind::LParen, "'('");
  while (!at_eof() && !at(TokenKind::RParen)) {
    const uint32_t begin = cur().begin();
    if (match(TokenKind::DotDotDot)) {
      Expr * arg = parse_assign();
      args.push_back(ast_.create<SpreadExpr>(arg, range_from(begin)));
    } else {
      args.push_back(parse_assign());
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RParen, "')' to close argument list");
  return args;
}

bool Parser::at_call_type_args() const
{
  // f<T>(x) versus a < b: scan a balanced <...> made only of type tokens,
  // then require a call or a tagged template after it.
  if (!at(TokenKind::Lt)) {
    return false;
  }
  int depth = 0;
  size_t i = idx_;
  while (i < tokens_.size()) {
    const TokenKind k = tokens_[i].kind;
    switch (k) {
      case TokenKind::Lt:
        ++depth;
        ++i;
        break;
      case TokenKind::Gt:
        --depth;
        ++i;
        if (depth == 0) {
          const TokenKind next = i < tokens_.size() ? tokens_[i].kind : TokenKind::Eof;
          return next == TokenKind::LParen || next == TokenKind::NoSubstTemplate ||
                 next == TokenKind::TemplateHead;
        }
        break;
      case TokenKind::LParen:
      case TokenKind::LBracket:
      case TokenKind::LBrace: {
        const auto end = find_matching(i);
        if (!end) {
          return false;
        }
        i = *end;
        break;
      }
      case TokenKind::Identifier:
      case TokenKind::Dot:
      case TokenKind::Comma:
      case TokenKind::StringLiteral:
      case TokenKind::NumberLiteral:
      case TokenKind::NoSubstTemplate:
      case TokenKind::Pipe:
      case TokenKind::Amp:
      case TokenKind::Question:
      case TokenKind::Colon:
      case TokenKind::Arrow:
      case TokenKind::Minus:
      case TokenKind::DotDotDot:
        ++i;
        break;
      default:
        return false;
    }
  }
  return false;
}

// ============================================================================
// Arrow functions
// ============================================================================

bool Parser::is_arrow_paren_at(size_t idx) const
{
  if (idx >= tokens_.size() || tokens_[idx].kind != TokenKind::LParen) {
    return false;
  }
  const auto end = find_matching(idx);
  if (!end || *end >= tokens_.size()) {
    return false;
  }
  const Token & after = tokens_[*end];
  if (after.kind == TokenKind::Arrow && !after.newlineBefore) {
    return true;
  }
  if (after.kind != TokenKind::Colon || no_arrow_return_type_) {
    return false;
  }

  // (params): ReturnType => body
  int depth = 0;
  for (size_t i = *end + 1; i < tokens_.size(); ++i) {
    const TokenKind k = tokens_[i].kind;
    if (k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace) {
      ++depth;
    } else if (k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace) {
      if (depth == 0) {
        return false;
      }
      --depth;
    } else if (depth == 0) {
      if (k == TokenKind::Arrow) {
        return true;
      }
      if (k == TokenKind::Semicolon || k == TokenKind::Eq || k == TokenKind::Eof) {
        return false;
      }
    }
  }
  return false;
}

bool Parser::is_generic_arrow_at(size_t idx) const
{
  if (
    idx + 1 >= tokens_.size() || tokens_[idx].kind != TokenKind::Lt ||
    tokens_[idx + 1].kind != TokenKind::Identifier) {
    return false;
  }
  int depth = 0;
  size_t i = idx;
  while (i < tokens_.size()) {
    const TokenKind k = tokens_[i].kind;
    if (k == TokenKind::Lt) {
      ++depth;
    } else if (k == TokenKind::Gt) {
      --depth;
      if (depth == 0) {
        return is_arrow_paren_at(i + 1);
      }
    } else if (k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace) {
      const auto end = find_matching(i);
      if (!end) {
        return false;
      }
      i = *end;
      continue;
    } else if (
      k == TokenKind::Semicolon || k == TokenKind::RParen || k == TokenKind::RBrace ||
      k == TokenKind::Eof) {
      return false;
    }
    ++i;
  }
  return false;
}

Expr * Parser::parse_arrow_function(uint32_t begin, bool is_async)
{
  auto * fn = ast_.create<ArrowFunctionExpr>();
  fn->isAsync = is_async;
  skip_type_params();

  if (at(TokenKind::Identifier)) {
    const Token & name = advance();
    auto * binding = ast_.create<BindingIdent>(name.text, name.range);
    std::vector<Param *> params{ast_.create<Param>(binding, name.range)};
    fn->params = to_span(params);
  } else {
    fn->params = to_span(parse_params());
  }
  if (match(TokenKind::Colon)) {
    fn->returnType = parse_return_type();
  }
  expect(TokenKind::Arrow, "'=>'");

  if (at(TokenKind::LBrace)) {
    fn->body = parse_block();
  } else {
    fn->body = parse_assign();
  }
  fn->range_ = range_from(begin);
  return fn;
}

// ============================================================================
// Primary expressions
// ============================================================================

Expr * Parser::parse_primary()
{
  const Token & t = cur();
  const uint32_t begin = t.begin();

  switch (t.kind) {
    case TokenKind::NumberLiteral:
      return parse_number_literal();
    case TokenKind::StringLiteral:
      return parse_string_literal();
    case TokenKind::NoSubstTemplate:
    case TokenKind::TemplateHead:
      return parse_template(nullptr, begin);
    case TokenKind::RegexLiteral:
      advance();
      return ast_.create<RegexLiteralExpr>(t.text, t.range);
    case TokenKind::LParen: {
      advance();
      Expr * inner = nullptr;
      {
        const NestedScope nested(*this);
        inner = parse_expr();
      }
      expect(TokenKind::RParen, "')'");
      return ast_.create<ParenExpr>(inner, range_from(begin));
    }
    case TokenKind::LBracket:
      return parse_array_literal();
    case TokenKind::LBrace:
      return parse_object_literal();
    case TokenKind::Identifier:
      break;
    default:
      error_at(t, "expected expression");
      return make_missing_expr_at(t);
  }

  const std::string_view text = t.text;
  if (text == "true" || text == "false") {
    advance();
    return ast_.create<BoolLiteralExpr>(text == "true", t.range);
  }
  if (text == "null") {
    advance();
    return ast_.create<NullLiteralExpr>(t.range);
  }
  if (text == "this") {
    advance();
    return ast_.create<ThisExpr>(t.range);
  }
  if (text == "super") {
    advance();
    return ast_.create<SuperExpr>(t.range);
  }
  if (text == "function") {
    advance();
    return parse_function_rest(begin, false);
  }
  if (text == "async" && is_kw("function", cur(1)) && !cur(1).newlineBefore) {
    advance();
    advance();
    return parse_function_rest(begin, true);
  }
  if (text == "class") {
    return parse_class_expr();
  }
  if (text == "new") {
    return parse_new_expr();
  }
  if (text == "import") {
    advance();
    if (match(TokenKind::Dot)) {
      if (!at(TokenKind::Identifier)) {
        error_at(cur(), "expected 'meta'");
        return ast_.create<MetaPropertyExpr>("import", "", range_from(begin));
      }
      const std::string_view prop = advance().text;
      return ast_.create<MetaPropertyExpr>("import", prop, range_from(begin));
    }
    // import('x') is parsed as a call whose callee is the `import` identifier.
    return ast_.create<IdentifierExpr>(text, t.range);
  }
  if (is_reserved_word(text)) {
    error_at(t, "expected expression");
    return make_missing_expr_at(t);
  }

  advance();
  return ast_.create<IdentifierExpr>(text, t.range);
}

Expr * Parser::parse_new_expr()
{
  const uint32_t begin = advance().begin();
  if (match(TokenKind::Dot)) {
    std::string_view prop;
    if (at(TokenKind::Identifier)) {
      prop = advance().text;
    } else {
      error_at(cur(), "expected 'target'");
    }
    return ast_.create<MetaPropertyExpr>("new", prop, range_from(begin));
  }

  Expr * callee = at_kw("new") ? parse_new_expr() : parse_call_chain(parse_primary(), false);
  std::vector<Expr *> args;
  if (at(TokenKind::LParen)) {
    args = parse_arguments();
  }
  return ast_.create<NewExpr>(callee, to_span(args), range_from(begin));
}

Expr * Parser::parse_array_literal()
{
  const uint32_t begin = advance().begin();
  const NestedScope nested(*this);
  std::vector<Expr *> elems;
  while (!at_eof() && !at(TokenKind::RBracket)) {
    if (match(TokenKind::Comma)) {
      elems.push_back(nullptr);
      continue;
    }
    const uint32_t e_begin = cur().begin();
    if (match(TokenKind::DotDotDot)) {
      Expr * arg = parse_assign();
      elems.push_back(ast_.create<SpreadExpr>(arg, range_from(e_begin)));
    } else {
      elems.push_back(parse_assign());
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBracket, "']'");
  return ast_.create<ArrayLiteralExpr>(to_span(elems), range_from(begin));
}

Expr * Parser::parse_object_literal()
{
  const uint32_t begin = advance().begin();
  const NestedScope nested(*this);
  std::vector<ObjectProperty *> props;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    const size_t before = idx_;
    if (ObjectProperty * p = parse_object_property()) {
      props.push_back(p);
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
    if (idx_ == before) {
      advance();
    }
  }
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<ObjectLiteralExpr>(to_span(props), range_from(begin));
}

ObjectProperty * Parser::parse_object_property()
{
  const uint32_t begin = cur().begin();

  if (match(TokenKind::DotDotDot)) {
    auto * p = ast_.create<ObjectProperty>(PropertyKind::Spread, "");
    p->value = parse_assign();
    p->range_ = range_from(begin);
    return p;
  }

  auto next_is_key = [this]() {
    const TokenKind k = cur(1).kind;
    return k == TokenKind::Identifier || k == TokenKind::StringLiteral ||
           k == TokenKind::NumberLiteral || k == TokenKind::LBracket || k == TokenKind::Star;
  };

  PropertyKind kind = PropertyKind::Init;
  bool is_async = false;
  if ((at_kw("get") || at_kw("set")) && next_is_key() && cur(1).kind != TokenKind::Star) {
    kind = advance().text == "get" ? PropertyKind::Getter : PropertyKind::Setter;
  } else if (at_kw("async") && next_is_key() && !cur(1).newlineBefore) {
    advance();
    is_async = true;
  }
  const bool is_generator = match(TokenKind::Star);

  const Token & key_tok = cur();
  std::string_view key;
  Expr * computed = nullptr;
  if (match(TokenKind::LBracket)) {
    computed = parse_assign();
    expect(TokenKind::RBracket, "']'");
  } else if (at(TokenKind::StringLiteral)) {
    key = unescape_string(advance().text);
  } else if (at(TokenKind::Identifier) || at(TokenKind::NumberLiteral)) {
    key = advance().text;
  } else {
    error_at(cur(), "expected property name");
    return nullptr;
  }

  if (at(TokenKind::LParen) || at(TokenKind::Lt)) {
    auto * p = ast_.create<ObjectProperty>(
      kind == PropertyKind::Init ? PropertyKind::Method : kind, key);
    p->computedKey = computed;
    const uint32_t fn_begin = cur().begin();
    auto * fn = ast_.create<FunctionExpr>();
    fn->name = key;
    fn->isAsync = is_async;
    fn->isGenerator = is_generator;
    skip_type_params();
    fn->params = to_span(parse_params());
    if (match(TokenKind::Colon)) {
      fn->returnType = parse_return_type();
    }
    fn->body = parse_block();
    fn->range_ = range_from(fn_begin);
    p->value = fn;
    p->range_ = range_from(begin);
    return p;
  }

  if (kind != PropertyKind::Init || is_async || is_generator) {
    error_at(cur(), "expected '(' after accessor or method name");
  }

  if (match(TokenKind::Colon)) {
    auto * p = ast_.create<ObjectProperty>(PropertyKind::Init, key);
    p->computedKey = computed;
    p->value = parse_assign();
    p->range_ = range_from(begin);
    return p;
  }

  // { a } or { a = 1 } (the latter only inside assignment patterns)
  auto * p = ast_.create<ObjectProperty>(PropertyKind::Shorthand, key);
  Expr * value = ast_.create<IdentifierExpr>(key, key_tok.range);
  if (match(TokenKind::Eq)) {
    Expr * def = parse_assign();
    value = ast_.create<AssignExpr>(AssignOp::Assign, value, def, range_from(begin));
  }
  p->value = value;
  p->range_ = range_from(begin);
  return p;
}

Expr * Parser::parse_template(Expr * tag, uint32_t begin)
{
  auto * tpl = ast_.create<TemplateLiteralExpr>();
  tpl->tag = tag;
  std::vector<Expr *> exprs;

  if (!match(TokenKind::NoSubstTemplate)) {
    expect(TokenKind::TemplateHead, "template literal");
    const NestedScope nested(*this);
    for (;;) {
      exprs.push_back(parse_expr());
      if (match(TokenKind::TemplateMiddle)) {
        continue;
      }
      if (match(TokenKind::TemplateTail)) {
        break;
      }
      error_at(cur(), "expected '}' in template literal");
      break;
    }
  }

  tpl->expressions = to_span(exprs);
  tpl->range_ = range_from(begin);
  return tpl;
}

// ============================================================================
// Literals
// ============================================================================

Expr * Parser::parse_number_literal()
{
  const Token & t = advance();
  std::string digits;
  digits.reserve(t.text.size());
  for (const char c : t.text) {
    if (c != '_') {
      digits.push_back(c);
    }
  }
  if (!digits.empty() && digits.back() == 'n') {
    digits.pop_back();  // BigInt suffix
  }

  double value = 0.0;
  if (digits.size() > 2 && digits[0] == '0') {
    const char p = static_cast<char>(digits[1] | 0x20);
    const int base = p == 'x' ? 16 : p == 'o' ? 8 : p == 'b' ? 2 : 0;
    if (base != 0) {
      value = static_cast<double>(std::strtoull(digits.c_str() + 2, nullptr, base));
      return ast_.create<NumberLiteralExpr>(t.text, value, t.range);
    }
  }
  value = std::strtod(digits.c_str(), nullptr);
  return ast_.create<NumberLiteralExpr>(t.text, value, t.range);
}

Expr * Parser::parse_string_literal()
{
  const Token & t = advance();
  return ast_.create<StringLiteralExpr>(unescape_string(t.text), t.range);
}

Expr * Parser::make_missing_expr_at(const Token & t) { return ast_.create<MissingExpr>(t.range); }

std::string_view Parser::unescape_string(std::string_view raw)
{
  if (raw.find('\\') == std::string_view::npos) {
    return raw;
  }

  std::string out;
  out.reserve(raw.size());
  for (size_t i = 0; i < raw.size(); ++i) {
    const char c = raw[i];
    if (c != '\\' || i + 1 >= raw.size()) {
      out.push_back(c);
      continue;
    }

    const char esc = raw[++i];
    switch (esc) {
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'v':
        out.push_back('\v');
        break;
      case '0':
        out.push_back('\0');
        break;
      case '\r':
        // Line continuation
        if (i + 1 < raw.size() && raw[i + 1] == '\n') {
          ++i;
        }
        break;
      case '\n':
        break;
      case 'x': {
        uint32_t cp = 0;
        if (read_hex(raw, i + 1, 2, cp)) {
          append_utf8(out, cp);
          i += 2;
        } else {
          out.push_back('x');
        }
        break;
      }
      case 'u': {
        uint32_t cp = 0;
        if (i + 1 < raw.size() && raw[i + 1] == '{') {
          const size_t close = raw.find('}', i + 2);
          if (close != std::string_view::npos && close > i + 2 &&
              read_hex(raw, i + 2, close - (i + 2), cp) && cp <= 0x10FFFF) {
            append_utf8(out, cp);
            i = close;
          } else {
            out.push_back('u');
          }
        } else if (read_hex(raw, i + 1, 4, cp)) {
          append_utf8(out, cp);
          i += 4;
        } else {
          out.push_back('u');
        }
        break;
      }
      default:
        out.push_back(esc);
        break;
    }
  }
  return ast_.intern(out);
}

}  // namespace purets::syntax
