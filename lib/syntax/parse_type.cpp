// purets/syntax/parse_type.cpp - Type annotation parsing
#include "purets/syntax/parser.hpp"

namespace purets::syntax
{

TypeNode * Parser::parse_type()
{
  const uint32_t begin = cur().begin();

  if (at_function_type_start()) {
    return parse_function_type(false);
  }
  if (at_kw("new") && (cur(1).kind == TokenKind::LParen || cur(1).kind == TokenKind::Lt)) {
    advance();
    return parse_function_type(true);
  }
  if (at_kw("abstract") && at_kw("new", 1)) {
    advance();
    advance();
    return parse_function_type(true);
  }

  TypeNode * check = parse_union_type();
  if (no_conditional_types_ || !at_kw("extends") || cur().newlineBefore) {
    return check;
  }

  advance();
  TypeNode * extends_type = nullptr;
  {
    const FlagScope no_cond(no_conditional_types_, true);
    extends_type = parse_type();
  }
  expect(TokenKind::Question, "'?' in conditional type");
  TypeNode * true_type = parse_type();
  expect(TokenKind::Colon, "':' in conditional type");
  TypeNode * false_type = parse_type();
  return ast_.create<ConditionalType>(
    check, extends_type, true_type, false_type, range_from(begin));
}

TypeNode * Parser::parse_return_type()
{
  const uint32_t begin = cur().begin();

  // asserts x, asserts x is T
  if (
    at_kw("asserts") && cur(1).kind == TokenKind::Identifier && !cur(1).newlineBefore &&
    !is_kw("is", cur(1))) {
    advance();
    const std::string_view name = advance().text;
    TypeNode * type = nullptr;
    if (match_kw("is")) {
      type = parse_type();
    }
    auto * pred = ast_.create<TypePredicate>(name, type, range_from(begin));
    pred->asserts = true;
    return pred;
  }

  // x is T
  if (at(TokenKind::Identifier) && at_kw("is", 1) && !cur(1).newlineBefore) {
    const std::string_view name = advance().text;
    advance();
    TypeNode * type = parse_type();
    return ast_.create<TypePredicate>(name, type, range_from(begin));
  }

  return parse_type();
}

bool Parser::at_function_type_start() const
{
  if (at(TokenKind::Lt)) {
    return true;
  }
  if (!at(TokenKind::LParen)) {
    return false;
  }
  const auto end = find_matching(idx_);
  return end && *end < tokens_.size() && tokens_[*end].kind == TokenKind::Arrow;
}

TypeNode * Parser::parse_function_type(bool is_constructor)
{
  const uint32_t begin = is_constructor ? prev().begin() : cur().begin();
  auto * fn = ast_.create<FunctionType>();
  fn->isConstructor = is_constructor;
  skip_type_params();
  fn->params = to_span(parse_params());
  expect(TokenKind::Arrow, "'=>' in function type");
  fn->returnType = parse_return_type();
  fn->range_ = range_from(begin);
  return fn;
}

TypeNode * Parser::parse_union_type()
{
  const uint32_t begin = cur().begin();
  match(TokenKind::Pipe);
  TypeNode * first = parse_intersection_type();
  if (!at(TokenKind::Pipe)) {
    return first;
  }
  std::vector<TypeNode *> types{first};
  while (match(TokenKind::Pipe)) {
    types.push_back(parse_intersection_type());
  }
  return ast_.create<UnionType>(to_span(types), range_from(begin));
}

TypeNode * Parser::parse_intersection_type()
{
  const uint32_t begin = cur().begin();
  match(TokenKind::Amp);
  TypeNode * first = parse_type_operator();
  if (!at(TokenKind::Amp)) {
    return first;
  }
  std::vector<TypeNode *> types{first};
  while (match(TokenKind::Amp)) {
    types.push_back(parse_type_operator());
  }
  return ast_.create<IntersectionType>(to_span(types), range_from(begin));
}

TypeNode * Parser::parse_type_operator()
{
  const uint32_t begin = cur().begin();
  const bool operand_follows =
    cur(1).kind == TokenKind::Identifier || cur(1).kind == TokenKind::LParen ||
    cur(1).kind == TokenKind::LBracket || cur(1).kind == TokenKind::LBrace;

  if (at_kw("keyof") && operand_follows) {
    advance();
    TypeNode * operand = parse_type_operator();
    return ast_.create<TypeOperator>(TypeOperatorKind::KeyOf, operand, range_from(begin));
  }
  if (at_kw("readonly") && operand_follows) {
    advance();
    TypeNode * operand = parse_type_operator();
    return ast_.create<TypeOperator>(TypeOperatorKind::Readonly, operand, range_from(begin));
  }
  if (at_kw("unique") && at_kw("symbol", 1)) {
    advance();
    TypeNode * operand = parse_type_operator();
    return ast_.create<TypeOperator>(TypeOperatorKind::Unique, operand, range_from(begin));
  }
  if (at_kw("infer") && cur(1).kind == TokenKind::Identifier) {
    advance();
    const std::string_view name = advance().text;
    if (at_kw("extends") && !cur().newlineBefore) {
      advance();
      const FlagScope no_cond(no_conditional_types_, true);
      (void)parse_type();
    }
    return ast_.create<InferType>(name, range_from(begin));
  }
  return parse_postfix_type();
}

TypeNode * Parser::parse_postfix_type()
{
  const uint32_t begin = cur().begin();
  TypeNode * type = parse_primary_type();
  while (at(TokenKind::LBracket) && !cur().newlineBefore) {
    advance();
    if (match(TokenKind::RBracket)) {
      type = ast_.create<ArrayType>(type, range_from(begin));
      continue;
    }
    TypeNode * index = nullptr;
    {
      const NestedScope nested(*this);
      index = parse_type();
    }
    expect(TokenKind::RBracket, "']'");
    type = ast_.create<IndexedAccessType>(type, index, range_from(begin));
  }
  return type;
}

TypeNode * Parser::parse_primary_type()
{
  const Token & t = cur();
  const uint32_t begin = t.begin();

  switch (t.kind) {
    case TokenKind::LParen: {
      advance();
      TypeNode * inner = nullptr;
      {
        const NestedScope nested(*this);
        inner = parse_type();
      }
      expect(TokenKind::RParen, "')'");
      return inner;
    }
    case TokenKind::LBracket:
      return parse_tuple_type();
    case TokenKind::LBrace:
      return parse_object_or_mapped_type();
    case TokenKind::StringLiteral:
    case TokenKind::NumberLiteral:
    case TokenKind::NoSubstTemplate:
      advance();
      return ast_.create<LiteralType>(source_.get_slice(t.range), t.range);
    case TokenKind::TemplateHead:
      return parse_template_literal_type();
    case TokenKind::Minus:
      advance();
      expect(TokenKind::NumberLiteral, "number after '-'");
      return ast_.create<LiteralType>(source_.get_slice(range_from(begin)), range_from(begin));
    case TokenKind::Identifier:
      break;
    default:
      error_at(t, "expected type");
      if (
        !at(TokenKind::RParen) && !at(TokenKind::RBracket) && !at(TokenKind::RBrace) &&
        !at(TokenKind::Semicolon) && !at(TokenKind::Comma) && !at(TokenKind::Eq) &&
        !at(TokenKind::Gt) && !at_eof()) {
        advance();
      }
      return ast_.create<TypeReference>("", t.range);
  }

  if (t.text == "true" || t.text == "false") {
    advance();
    return ast_.create<LiteralType>(t.text, t.range);
  }

  if (t.text == "typeof") {
    advance();
    std::string_view name;
    if (at_kw("import") && cur(1).kind == TokenKind::LParen) {
      const uint32_t name_begin = cur().begin();
      advance();
      advance();
      (void)parse_module_source(nullptr);
      expect(TokenKind::RParen, "')'");
      while (match(TokenKind::Dot)) {
        expect(TokenKind::Identifier, "property name");
      }
      name = source_.get_slice(range_from(name_begin));
    } else {
      name = parse_dotted_name();
    }
    if (at(TokenKind::Lt) && !cur().newlineBefore) {
      (void)parse_type_args();
    }
    return ast_.create<TypeQuery>(name, range_from(begin));
  }

  if (t.text == "import" && cur(1).kind == TokenKind::LParen) {
    // import('./mod').Name
    advance();
    advance();
    (void)parse_module_source(nullptr);
    expect(TokenKind::RParen, "')'");
    while (match(TokenKind::Dot)) {
      expect(TokenKind::Identifier, "type name");
    }
    auto * ref = ast_.create<TypeReference>(source_.get_slice(range_from(begin)));
    if (at(TokenKind::Lt) && !cur().newlineBefore) {
      ref->typeArgs = to_span(parse_type_args());
    }
    ref->range_ = range_from(begin);
    return ref;
  }

  auto * ref = ast_.create<TypeReference>(parse_dotted_name());
  if (at(TokenKind::Lt) && !cur().newlineBefore) {
    ref->typeArgs = to_span(parse_type_args());
  }
  ref->range_ = range_from(begin);
  return ref;
}

std::string_view Parser::parse_dotted_name()
{
  const uint32_t begin = cur().begin();
  if (!expect(TokenKind::Identifier, "type name")) {
    return {};
  }
  while (at(TokenKind::Dot) && cur(1).kind == TokenKind::Identifier) {
    advance();
    advance();
  }
  return source_.get_slice(range_from(begin));
}

std::vector<TypeNode *> Parser::parse_type_args()
{
  std::vector<TypeNode *> args;
  const NestedScope nested(*this);
  expect(TokenKind::Lt, "'<'");
  while (!at_eof() && !at(TokenKind::Gt)) {
    args.push_back(parse_type());
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::Gt, "'>' to close type arguments");
  return args;
}

void Parser::skip_type_params()
{
  if (!match(TokenKind::Lt)) {
    return;
  }
  const NestedScope nested(*this);
  while (!at_eof() && !at(TokenKind::Gt)) {
    while ((at_kw("const") || at_kw("in") || at_kw("out")) && cur(1).kind == TokenKind::Identifier) {
      advance();
    }
    if (!expect(TokenKind::Identifier, "type parameter name")) {
      break;
    }
    if (match_kw("extends")) {
      (void)parse_type();
    }
    if (match(TokenKind::Eq)) {
      (void)parse_type();
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::Gt, "'>' to close type parameters");
}

TypeNode * Parser::parse_tuple_type()
{
  const uint32_t begin = advance().begin();
  const NestedScope nested(*this);
  std::vector<TypeNode *> elems;
  while (!at_eof() && !at(TokenKind::RBracket)) {
    match(TokenKind::DotDotDot);
    // Named member: [first: string, rest?: number]
    if (
      at(TokenKind::Identifier) &&
      (cur(1).kind == TokenKind::Colon ||
       (cur(1).kind == TokenKind::Question && cur(2).kind == TokenKind::Colon))) {
      advance();
      match(TokenKind::Question);
      advance();
    }
    elems.push_back(parse_type());
    match(TokenKind::Question);
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBracket, "']'");
  return ast_.create<TupleType>(to_span(elems), range_from(begin));
}

TypeNode * Parser::parse_template_literal_type()
{
  const uint32_t begin = advance().begin();
  const NestedScope nested(*this);
  for (;;) {
    (void)parse_type();
    if (match(TokenKind::TemplateMiddle)) {
      continue;
    }
    if (!match(TokenKind::TemplateTail)) {
      error_at(cur(), "expected '}' in template literal type");
    }
    break;
  }
  return ast_.create<LiteralType>(source_.get_slice(range_from(begin)), range_from(begin));
}

TypeNode * Parser::parse_object_or_mapped_type()
{
  const uint32_t begin = cur().begin();

  size_t k = 1;
  if (cur(k).kind == TokenKind::Plus || cur(k).kind == TokenKind::Minus) {
    ++k;
  }
  if (is_kw("readonly", cur(k))) {
    ++k;
  }
  const bool is_mapped = cur(k).kind == TokenKind::LBracket &&
                         cur(k + 1).kind == TokenKind::Identifier && is_kw("in", cur(k + 2));

  advance();
  const NestedScope nested(*this);

  if (!is_mapped) {
    auto members = parse_type_members();
    expect(TokenKind::RBrace, "'}'");
    return ast_.create<ObjectType>(members, range_from(begin));
  }

  const bool removes_readonly = at(TokenKind::Minus);
  match(TokenKind::Plus);
  match(TokenKind::Minus);
  const bool has_readonly = match_kw("readonly");
  advance();  // [
  auto * mapped = ast_.create<MappedType>(advance().text);
  mapped->isReadonly = has_readonly && !removes_readonly;
  advance();  // in
  mapped->constraint = parse_type();
  if (match_kw("as")) {
    mapped->nameType = parse_type();
  }
  expect(TokenKind::RBracket, "']'");
  if (match(TokenKind::Plus) || match(TokenKind::Minus)) {
    expect(TokenKind::Question, "'?'");
  } else {
    match(TokenKind::Question);
  }
  if (match(TokenKind::Colon)) {
    mapped->valueType = parse_type();
  }
  if (!match(TokenKind::Semicolon)) {
    match(TokenKind::Comma);
  }
  expect(TokenKind::RBrace, "'}'");
  mapped->range_ = range_from(begin);
  return mapped;
}

gsl::span<PropertySignature *> Parser::parse_type_members()
{
  std::vector<PropertySignature *> members;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    const size_t before = idx_;
    if (PropertySignature * m = parse_type_member()) {
      members.push_back(m);
    }
    if (!match(TokenKind::Semicolon)) {
      match(TokenKind::Comma);
    }
    if (idx_ == before) {
      error_at(cur(), "unexpected token in type member list");
      advance();
    }
  }
  return to_span(members);
}

PropertySignature * Parser::parse_type_member()
{
  const uint32_t begin = cur().begin();

  auto signature = [&](SignatureKind kind, std::string_view name) {
    auto * sig = ast_.create<PropertySignature>(kind, name);
    skip_type_params();
    sig->params = to_span(parse_params());
    if (match(TokenKind::Colon)) {
      sig->type = parse_return_type();
    }
    sig->range_ = range_from(begin);
    return sig;
  };

  if (at(TokenKind::LParen) || at(TokenKind::Lt)) {
    return signature(SignatureKind::Call, "");
  }
  if (at_kw("new") && (cur(1).kind == TokenKind::LParen || cur(1).kind == TokenKind::Lt)) {
    advance();
    return signature(SignatureKind::Construct, "");
  }

  auto next_is_name = [this]() {
    const TokenKind k = cur(1).kind;
    return k == TokenKind::Identifier || k == TokenKind::StringLiteral ||
           k == TokenKind::NumberLiteral || k == TokenKind::LBracket;
  };

  bool is_readonly = false;
  if (at_kw("readonly") && next_is_name()) {
    advance();
    is_readonly = true;
  }
  bool is_accessor = false;
  if ((at_kw("get") || at_kw("set")) && next_is_name() && !cur(1).newlineBefore) {
    advance();
    is_accessor = true;
  }

  // [key: string]: T
  if (
    at(TokenKind::LBracket) && cur(1).kind == TokenKind::Identifier &&
    cur(2).kind == TokenKind::Colon) {
    advance();
    const Token & key = advance();
    advance();
    auto * param = ast_.create<Param>(ast_.create<BindingIdent>(key.text, key.range), key.range);
    param->type = parse_type();
    expect(TokenKind::RBracket, "']'");
    auto * sig = ast_.create<PropertySignature>(SignatureKind::Index, "");
    std::vector<Param *> params{param};
    sig->params = to_span(params);
    if (match(TokenKind::Colon)) {
      sig->type = parse_type();
    }
    sig->isReadonly = is_readonly;
    sig->range_ = range_from(begin);
    return sig;
  }

  std::string_view name;
  if (at(TokenKind::LBracket)) {
    const uint32_t name_begin = advance().begin();
    (void)parse_assign();
    expect(TokenKind::RBracket, "']'");
    name = source_.get_slice(range_from(name_begin));
  } else if (at(TokenKind::StringLiteral)) {
    name = unescape_string(advance().text);
  } else if (at(TokenKind::Identifier) || at(TokenKind::NumberLiteral)) {
    name = advance().text;
  } else {
    error_at(cur(), "expected property name");
    return nullptr;
  }

  const bool is_optional = match(TokenKind::Question);
  if (at(TokenKind::LParen) || at(TokenKind::Lt) || is_accessor) {
    auto * sig = signature(SignatureKind::Method, name);
    sig->isOptional = is_optional;
    return sig;
  }

  auto * sig = ast_.create<PropertySignature>(SignatureKind::Property, name);
  sig->isOptional = is_optional;
  sig->isReadonly = is_readonly;
  if (match(TokenKind::Colon)) {
    sig->type = parse_type();
  }
  sig->range_ = range_from(begin);
  return sig;
}

}  // namespace purets::syntax
