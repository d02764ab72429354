// purets/syntax/parser.cpp - Token helpers, statements and declarations
#include "purets/syntax/parser.hpp"

#include <algorithm>
#include <string>

namespace purets::syntax
{
namespace
{

[[nodiscard]] bool is_comment(TokenKind k) noexcept
{
  return k == TokenKind::LineComment || k == TokenKind::BlockComment;
}

[[nodiscard]] bool is_open_bracket(TokenKind k) noexcept
{
  return k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace ||
         k == TokenKind::TemplateHead;
}

[[nodiscard]] bool is_close_bracket(TokenKind k) noexcept
{
  return k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace ||
         k == TokenKind::TemplateTail;
}

}  // namespace

Parser::Parser(
  AstContext & ast, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens)
: ast_(ast), source_(source), diags_(diags)
{
  // Comments are recorded separately; a line break inside or before a
  // comment still counts as a line break before the next real token.
  tokens_.reserve(tokens.size());
  bool pending_newline = false;
  for (auto & t : tokens) {
    if (is_comment(t.kind)) {
      comments_.push_back(Comment{t.range, t.kind == TokenKind::BlockComment});
      pending_newline = pending_newline || t.newlineBefore ||
                        (t.kind == TokenKind::BlockComment &&
                         t.text.find('\n') != std::string_view::npos);
      continue;
    }
    if (t.kind == TokenKind::Unknown) {
      // Unterminated strings, comments and stray characters.
      diags_.report_error(t.range, "invalid or unterminated token").with_code(k_parse_error_code);
      pending_newline = pending_newline || t.newlineBefore;
      continue;
    }
    if (pending_newline) {
      t.newlineBefore = true;
      pending_newline = false;
    }
    tokens_.push_back(t);
  }
  if (tokens_.empty() || tokens_.back().kind != TokenKind::Eof) {
    Token eof;
    eof.kind = TokenKind::Eof;
    const auto end = static_cast<uint32_t>(source_.size());
    eof.range = SourceRange(end, end);
    tokens_.push_back(eof);
  }
}

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return idx_ > 0 ? tokens_[idx_ - 1] : tokens_.front(); }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const
{
  return is_kw(kw, cur(lookahead));
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::expect(TokenKind k, std::string_view what)
{
  if (match(k)) {
    return true;
  }
  error_at(cur(), std::string("expected ") + std::string(what));
  return false;
}

bool Parser::expect_kw(std::string_view kw)
{
  if (match_kw(kw)) {
    return true;
  }
  error_at(cur(), std::string("expected '") + std::string(kw) + "'");
  return false;
}

bool Parser::can_insert_semicolon() const
{
  return at(TokenKind::RBrace) || at_eof() || cur().newlineBefore;
}

void Parser::consume_semicolon()
{
  if (match(TokenKind::Semicolon) || can_insert_semicolon()) {
    return;
  }
  error_at(cur(), "expected ';'");
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  // One error per token position keeps recovery from cascading.
  if (t.begin() == last_error_offset_) {
    return;
  }
  last_error_offset_ = t.begin();
  diags_.report_error(t.range, std::string(msg)).with_code(k_parse_error_code);
}

void Parser::synchronize_to_stmt()
{
  while (!at_eof()) {
    if (match(TokenKind::Semicolon)) {
      return;
    }
    if (at(TokenKind::RBrace) || cur().newlineBefore) {
      return;
    }
    advance();
  }
}

bool Parser::is_kw(std::string_view kw, const Token & t)
{
  return t.kind == TokenKind::Identifier && t.text == kw;
}

bool Parser::is_reserved_word(std::string_view ident)
{
  static const std::string_view k_reserved[] = {
    "break",  "case",    "catch",  "continue", "debugger", "default",    "do",
    "else",   "export",  "extends", "finally", "for",      "if",         "in",
    "instanceof", "return", "switch", "throw", "try",      "var",        "while",
    "with",   "const",   "enum",   "implements"};
  return std::any_of(std::begin(k_reserved), std::end(k_reserved), [&](std::string_view k) {
    return ident == k;
  });
}

bool Parser::at_identifier() const
{
  return at(TokenKind::Identifier) && !is_reserved_word(cur().text) &&
         (cur().text.empty() || cur().text.front() != '#');
}

bool Parser::at_property_name() const
{
  return at(TokenKind::Identifier) || at(TokenKind::StringLiteral) ||
         at(TokenKind::NumberLiteral) || at(TokenKind::LBracket);
}

uint32_t Parser::prev_end() const { return idx_ > 0 ? tokens_[idx_ - 1].end() : 0; }

SourceRange Parser::range_from(uint32_t begin) const
{
  return SourceRange(begin, std::max(begin, prev_end()));
}

std::optional<size_t> Parser::find_matching(size_t open_idx) const
{
  int depth = 0;
  for (size_t i = open_idx; i < tokens_.size(); ++i) {
    const TokenKind k = tokens_[i].kind;
    if (k == TokenKind::Eof) {
      return std::nullopt;
    }
    if (is_open_bracket(k)) {
      ++depth;
    } else if (is_close_bracket(k)) {
      --depth;
      if (depth == 0) {
        return i + 1;
      }
      if (depth < 0) {
        return std::nullopt;
      }
    }
  }
  return std::nullopt;
}

// ============================================================================
// Program
// ============================================================================

Program * Parser::parse_program()
{
  std::vector<Stmt *> body;
  while (!at_eof()) {
    const size_t before = idx_;
    if (match(TokenKind::RBrace)) {
      error_at(prev(), "unexpected '}'");
      continue;
    }
    if (Stmt * s = parse_stmt()) {
      body.push_back(s);
    }
    if (idx_ == before) {
      error_at(cur(), "unexpected token");
      advance();
    }
  }

  auto * program =
    ast_.create<Program>(SourceRange(0, static_cast<uint32_t>(source_.size())));
  program->body = to_span(body);
  program->comments = to_span(comments_);
  return program;
}

// ============================================================================
// Statements
// ============================================================================

Stmt * Parser::parse_stmt()
{
  skip_decorators();

  if (Stmt * decl = parse_declaration_or_null()) {
    return decl;
  }

  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::LBrace:
      return parse_block();
    case TokenKind::Semicolon:
      advance();
      return ast_.create<EmptyStmt>(t.range);
    default:
      break;
  }

  if (t.kind == TokenKind::Identifier) {
    if (t.text == "if") return parse_if_stmt();
    if (t.text == "for") return parse_for_stmt();
    if (t.text == "while") return parse_while_stmt();
    if (t.text == "do") return parse_do_while_stmt();
    if (t.text == "return") return parse_return_stmt();
    if (t.text == "throw") return parse_throw_stmt();
    if (t.text == "try") return parse_try_stmt();
    if (t.text == "switch") return parse_switch_stmt();
    if (t.text == "break" || t.text == "continue") return parse_break_or_continue();
    if (t.text == "debugger") {
      advance();
      consume_semicolon();
      return ast_.create<EmptyStmt>(range_from(t.begin()));
    }
    if (at_identifier() && cur(1).kind == TokenKind::Colon) {
      const std::string_view label = advance().text;
      advance();
      Stmt * body = parse_stmt();
      return ast_.create<LabeledStmt>(label, body, range_from(t.begin()));
    }
  }

  const uint32_t begin = t.begin();
  const size_t diag_count = diags_.size();
  Expr * e = parse_expr();
  if (diags_.size() != diag_count) {
    synchronize_to_stmt();
  } else {
    consume_semicolon();
  }
  return ast_.create<ExprStmt>(e, range_from(begin));
}

Stmt * Parser::parse_declaration_or_null()
{
  const Token & t = cur();
  if (t.kind != TokenKind::Identifier) {
    return nullptr;
  }
  const uint32_t begin = t.begin();
  const Token & next = cur(1);
  const bool next_same_line = !next.newlineBefore;

  if (t.text == "const" && is_kw("enum", next)) {
    advance();
    advance();
    return parse_enum_decl(begin, true);
  }
  if (t.text == "var" || t.text == "const") {
    return parse_var_decl(false);
  }
  if (
    t.text == "let" && (next.kind == TokenKind::Identifier || next.kind == TokenKind::LBracket ||
                        next.kind == TokenKind::LBrace)) {
    return parse_var_decl(false);
  }
  if (t.text == "function") {
    advance();
    return parse_function_decl(begin, false);
  }
  if (t.text == "async" && is_kw("function", next) && next_same_line) {
    advance();
    advance();
    return parse_function_decl(begin, true);
  }
  if (t.text == "class") {
    advance();
    return parse_class_decl(begin, false);
  }
  if (t.text == "abstract" && is_kw("class", next) && next_same_line) {
    advance();
    advance();
    return parse_class_decl(begin, true);
  }
  if (t.text == "interface" && next.kind == TokenKind::Identifier && next_same_line) {
    advance();
    return parse_interface_decl(begin);
  }
  if (
    t.text == "type" && next.kind == TokenKind::Identifier && next_same_line &&
    (cur(2).kind == TokenKind::Eq || cur(2).kind == TokenKind::Lt)) {
    advance();
    return parse_type_alias_decl(begin);
  }
  if (t.text == "enum" && next.kind == TokenKind::Identifier) {
    advance();
    return parse_enum_decl(begin, false);
  }
  if (
    (t.text == "namespace" || t.text == "module") && next_same_line &&
    (next.kind == TokenKind::Identifier || next.kind == TokenKind::StringLiteral)) {
    advance();
    return parse_module_decl(begin);
  }
  if (t.text == "global" && next.kind == TokenKind::LBrace && next_same_line) {
    return parse_module_decl(begin);
  }
  if (t.text == "declare" && next.kind == TokenKind::Identifier && next_same_line) {
    advance();
    Stmt * inner = parse_declaration_or_null();
    if (inner == nullptr) {
      error_at(cur(), "expected declaration after 'declare'");
      synchronize_to_stmt();
      return ast_.create<EmptyStmt>(range_from(begin));
    }
    if (auto * v = dyn_cast<VarDecl>(inner)) {
      v->isDeclare = true;
    } else if (auto * f = dyn_cast<FunctionDecl>(inner)) {
      f->isDeclare = true;
    }
    return inner;
  }
  if (
    t.text == "import" && next.kind != TokenKind::LParen && next.kind != TokenKind::Dot) {
    return parse_import_decl();
  }
  if (t.text == "export") {
    return parse_export_decl();
  }
  return nullptr;
}

BlockStmt * Parser::parse_block()
{
  const NestedScope nested(*this);
  const uint32_t begin = cur().begin();
  if (!expect(TokenKind::LBrace, "'{'")) {
    return ast_.create<BlockStmt>(gsl::span<Stmt *>{}, range_from(begin));
  }
  auto body = parse_stmt_list_until_rbrace();
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<BlockStmt>(body, range_from(begin));
}

gsl::span<Stmt *> Parser::parse_stmt_list_until_rbrace()
{
  std::vector<Stmt *> body;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    const size_t before = idx_;
    if (Stmt * s = parse_stmt()) {
      body.push_back(s);
    }
    if (idx_ == before) {
      error_at(cur(), "unexpected token");
      advance();
    }
  }
  return to_span(body);
}

VarDecl * Parser::parse_var_decl(bool in_for_init)
{
  const Token & kw = advance();
  const uint32_t begin = kw.begin();
  VarKind kind = VarKind::Var;
  if (kw.text == "const") {
    kind = VarKind::Const;
  } else if (kw.text == "let") {
    kind = VarKind::Let;
  }

  const FlagScope no_in(no_in_, in_for_init);
  std::vector<VarDeclarator *> decls;
  do {
    const uint32_t d_begin = cur().begin();
    AstNode * binding = parse_binding_target();
    auto * d = ast_.create<VarDeclarator>(binding);
    match(TokenKind::Bang);  // definite assignment: let x!: T
    if (match(TokenKind::Colon)) {
      d->type = parse_type();
    }
    if (match(TokenKind::Eq)) {
      d->init = parse_assign();
    }
    d->range_ = range_from(d_begin);
    decls.push_back(d);
  } while (match(TokenKind::Comma));

  if (!in_for_init) {
    consume_semicolon();
  }
  return ast_.create<VarDecl>(kind, to_span(decls), range_from(begin));
}

Stmt * Parser::parse_if_stmt()
{
  const uint32_t begin = advance().begin();
  expect(TokenKind::LParen, "'(' after 'if'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')'");
  Stmt * then_branch = parse_stmt();
  Stmt * else_branch = nullptr;
  if (match_kw("else")) {
    else_branch = parse_stmt();
  }
  return ast_.create<IfStmt>(cond, then_branch, else_branch, range_from(begin));
}

Stmt * Parser::parse_for_stmt()
{
  const uint32_t begin = advance().begin();
  const bool is_await = match_kw("await");
  expect(TokenKind::LParen, "'(' after 'for'");

  AstNode * init = nullptr;
  if (!at(TokenKind::Semicolon)) {
    if (
      at_kw("const") || at_kw("var") ||
      (at_kw("let") && (cur(1).kind == TokenKind::Identifier ||
                        cur(1).kind == TokenKind::LBracket || cur(1).kind == TokenKind::LBrace))) {
      init = parse_var_decl(true);
    } else {
      const FlagScope no_in(no_in_, true);
      init = parse_expr();
    }
  }

  if (at_kw("of") || at_kw("in")) {
    const bool is_of = advance().text == "of";
    Expr * right = is_of ? parse_assign() : parse_expr();
    expect(TokenKind::RParen, "')'");
    Stmt * body = parse_stmt();
    if (is_of) {
      auto * s = ast_.create<ForOfStmt>(init, right, body, range_from(begin));
      s->isAwait = is_await;
      return s;
    }
    return ast_.create<ForInStmt>(init, right, body, range_from(begin));
  }

  auto * s = ast_.create<ForStmt>();
  s->init = init;
  expect(TokenKind::Semicolon, "';'");
  if (!at(TokenKind::Semicolon)) {
    s->test = parse_expr();
  }
  expect(TokenKind::Semicolon, "';'");
  if (!at(TokenKind::RParen)) {
    s->update = parse_expr();
  }
  expect(TokenKind::RParen, "')'");
  s->body = parse_stmt();
  s->range_ = range_from(begin);
  return s;
}

Stmt * Parser::parse_while_stmt()
{
  const uint32_t begin = advance().begin();
  expect(TokenKind::LParen, "'(' after 'while'");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')'");
  Stmt * body = parse_stmt();
  return ast_.create<WhileStmt>(cond, body, range_from(begin));
}

Stmt * Parser::parse_do_while_stmt()
{
  const uint32_t begin = advance().begin();
  Stmt * body = parse_stmt();
  expect_kw("while");
  expect(TokenKind::LParen, "'('");
  Expr * cond = parse_expr();
  expect(TokenKind::RParen, "')'");
  match(TokenKind::Semicolon);
  return ast_.create<DoWhileStmt>(body, cond, range_from(begin));
}

Stmt * Parser::parse_return_stmt()
{
  const uint32_t begin = advance().begin();
  Expr * value = nullptr;
  if (!at(TokenKind::Semicolon) && !can_insert_semicolon()) {
    value = parse_expr();
  }
  consume_semicolon();
  return ast_.create<ReturnStmt>(value, range_from(begin));
}

Stmt * Parser::parse_throw_stmt()
{
  const uint32_t begin = advance().begin();
  Expr * value = parse_expr();
  consume_semicolon();
  return ast_.create<ThrowStmt>(value, range_from(begin));
}

Stmt * Parser::parse_try_stmt()
{
  const uint32_t begin = advance().begin();
  BlockStmt * block = parse_block();
  auto * s = ast_.create<TryStmt>(block);

  if (at_kw("catch")) {
    const uint32_t c_begin = advance().begin();
    AstNode * param = nullptr;
    TypeNode * param_type = nullptr;
    if (match(TokenKind::LParen)) {
      param = parse_binding_target();
      if (match(TokenKind::Colon)) {
        param_type = parse_type();
      }
      expect(TokenKind::RParen, "')'");
    }
    BlockStmt * body = parse_block();
    auto * handler = ast_.create<CatchClause>(body, range_from(c_begin));
    handler->param = param;
    handler->paramType = param_type;
    s->handler = handler;
  }
  if (match_kw("finally")) {
    s->finalizer = parse_block();
  }
  if (s->handler == nullptr && s->finalizer == nullptr) {
    error_at(cur(), "expected 'catch' or 'finally'");
  }
  s->range_ = range_from(begin);
  return s;
}

Stmt * Parser::parse_switch_stmt()
{
  const uint32_t begin = advance().begin();
  expect(TokenKind::LParen, "'(' after 'switch'");
  Expr * disc = parse_expr();
  expect(TokenKind::RParen, "')'");
  expect(TokenKind::LBrace, "'{'");

  std::vector<SwitchCase *> cases;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    const uint32_t c_begin = cur().begin();
    Expr * test = nullptr;
    if (match_kw("case")) {
      const FlagScope no_arrow(no_arrow_return_type_, true);
      test = parse_expr();
    } else if (!match_kw("default")) {
      error_at(cur(), "expected 'case' or 'default'");
      synchronize_to_stmt();
      if (!at_kw("case") && !at_kw("default") && !at(TokenKind::RBrace)) {
        advance();
      }
      continue;
    }
    expect(TokenKind::Colon, "':'");

    std::vector<Stmt *> body;
    while (!at_eof() && !at(TokenKind::RBrace) && !at_kw("case") && !at_kw("default")) {
      const size_t before = idx_;
      if (Stmt * st = parse_stmt()) {
        body.push_back(st);
      }
      if (idx_ == before) {
        advance();
      }
    }
    cases.push_back(ast_.create<SwitchCase>(test, to_span(body), range_from(c_begin)));
  }
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<SwitchStmt>(disc, to_span(cases), range_from(begin));
}

Stmt * Parser::parse_break_or_continue()
{
  const Token & kw = advance();
  std::string_view label;
  if (at_identifier() && !cur().newlineBefore) {
    label = advance().text;
  }
  consume_semicolon();
  if (kw.text == "break") {
    return ast_.create<BreakStmt>(label, range_from(kw.begin()));
  }
  return ast_.create<ContinueStmt>(label, range_from(kw.begin()));
}

// ============================================================================
// Declarations
// ============================================================================

FunctionDecl * Parser::parse_function_decl(uint32_t begin, bool is_async)
{
  const bool is_generator = match(TokenKind::Star);
  std::string_view name;
  SourceRange name_range;
  if (at(TokenKind::Identifier)) {
    const Token & n = advance();
    name = n.text;
    name_range = n.range;
  }

  auto * fn = ast_.create<FunctionDecl>(name);
  fn->nameRange = name_range;
  fn->isAsync = is_async;
  fn->isGenerator = is_generator;
  skip_type_params();
  fn->params = to_span(parse_params());
  if (match(TokenKind::Colon)) {
    fn->returnType = parse_return_type();
  }
  fn->body = parse_function_body_opt();
  fn->range_ = range_from(begin);
  return fn;
}

BlockStmt * Parser::parse_function_body_opt()
{
  if (at(TokenKind::LBrace)) {
    return parse_block();
  }
  // Overload signature or ambient declaration.
  consume_semicolon();
  return nullptr;
}

ClassDecl * Parser::parse_class_decl(uint32_t begin, bool is_abstract)
{
  std::string_view name;
  if (at_identifier() && !at_kw("extends") && !at_kw("implements")) {
    name = advance().text;
  }
  auto * decl = ast_.create<ClassDecl>(name);
  decl->isAbstract = is_abstract;
  skip_type_params();

  if (match_kw("extends")) {
    decl->superClass = parse_call_chain(parse_primary(), true);
    if (at(TokenKind::Lt)) {
      (void)parse_type_args();
    }
  }
  if (match_kw("implements")) {
    std::vector<TypeNode *> impls;
    do {
      impls.push_back(parse_primary_type());
    } while (match(TokenKind::Comma));
    decl->implements = to_span(impls);
  }

  decl->members = parse_class_body();
  decl->range_ = range_from(begin);
  return decl;
}

ClassExpr * Parser::parse_class_expr()
{
  const uint32_t begin = advance().begin();
  auto * cls = ast_.create<ClassExpr>();
  if (at_identifier() && !at_kw("extends") && !at_kw("implements")) {
    cls->name = advance().text;
  }
  skip_type_params();
  if (match_kw("extends")) {
    cls->superClass = parse_call_chain(parse_primary(), true);
    if (at(TokenKind::Lt)) {
      (void)parse_type_args();
    }
  }
  if (match_kw("implements")) {
    do {
      (void)parse_primary_type();
    } while (match(TokenKind::Comma));
  }
  cls->members = parse_class_body();
  cls->range_ = range_from(begin);
  return cls;
}

gsl::span<ClassMember *> Parser::parse_class_body()
{
  std::vector<ClassMember *> members;
  if (!expect(TokenKind::LBrace, "'{' to start class body")) {
    return {};
  }
  while (!at_eof() && !at(TokenKind::RBrace)) {
    if (match(TokenKind::Semicolon)) {
      continue;
    }
    const size_t before = idx_;
    if (ClassMember * m = parse_class_member()) {
      members.push_back(m);
    }
    if (idx_ == before) {
      error_at(cur(), "unexpected token in class body");
      advance();
    }
  }
  expect(TokenKind::RBrace, "'}'");
  return to_span(members);
}

ClassMember * Parser::parse_class_member()
{
  skip_decorators();
  const uint32_t begin = cur().begin();

  bool is_static = false;
  bool is_readonly = false;
  bool is_async = false;
  bool is_generator = false;
  ClassMemberKind accessor = ClassMemberKind::Method;

  // A modifier keyword is only a modifier when another member name follows it.
  auto next_starts_name = [this]() {
    const Token & n = cur(1);
    if (n.newlineBefore && n.kind != TokenKind::LBrace) {
      return n.kind == TokenKind::Identifier || n.kind == TokenKind::LBracket;
    }
    return n.kind == TokenKind::Identifier || n.kind == TokenKind::StringLiteral ||
           n.kind == TokenKind::NumberLiteral || n.kind == TokenKind::LBracket ||
           n.kind == TokenKind::Star || n.kind == TokenKind::LBrace;
  };

  while (at(TokenKind::Identifier) && next_starts_name()) {
    const std::string_view m = cur().text;
    if (m == "static") {
      if (cur(1).kind == TokenKind::LBrace) {
        advance();
        auto * block = ast_.create<ClassMember>(ClassMemberKind::StaticBlock, "");
        block->isStatic = true;
        block->staticBody = parse_block();
        block->range_ = range_from(begin);
        return block;
      }
      is_static = true;
    } else if (m == "readonly") {
      is_readonly = true;
    } else if (m == "async" && !cur(1).newlineBefore) {
      is_async = true;
    } else if (m == "get" || m == "set") {
      if (cur(1).kind == TokenKind::LBrace) {
        break;
      }
      accessor = m == "get" ? ClassMemberKind::Getter : ClassMemberKind::Setter;
    } else if (
      m != "public" && m != "private" && m != "protected" && m != "abstract" &&
      m != "override" && m != "declare" && m != "accessor") {
      break;
    }
    advance();
  }
  if (match(TokenKind::Star)) {
    is_generator = true;
  }

  // Index signature: [key: string]: T;
  if (
    at(TokenKind::LBracket) && cur(1).kind == TokenKind::Identifier &&
    cur(2).kind == TokenKind::Colon) {
    advance();
    advance();
    advance();
    (void)parse_type();
    expect(TokenKind::RBracket, "']'");
    auto * member = ast_.create<ClassMember>(ClassMemberKind::IndexSignature, "");
    if (match(TokenKind::Colon)) {
      member->type = parse_type();
    }
    consume_semicolon();
    member->isStatic = is_static;
    member->isReadonly = is_readonly;
    member->range_ = range_from(begin);
    return member;
  }

  std::string_view name;
  Expr * computed = nullptr;
  if (match(TokenKind::LBracket)) {
    computed = parse_assign();
    expect(TokenKind::RBracket, "']'");
  } else if (at(TokenKind::StringLiteral)) {
    name = unescape_string(advance().text);
  } else if (at(TokenKind::Identifier) || at(TokenKind::NumberLiteral)) {
    name = advance().text;
  } else {
    error_at(cur(), "expected class member name");
    return nullptr;
  }

  match(TokenKind::Question);

  if (at(TokenKind::LParen) || at(TokenKind::Lt)) {
    ClassMemberKind kind = accessor;
    if (kind == ClassMemberKind::Method && name == "constructor" && computed == nullptr) {
      kind = ClassMemberKind::Constructor;
    }
    auto * member = ast_.create<ClassMember>(kind, name);
    member->computedKey = computed;
    member->isStatic = is_static;
    member->isReadonly = is_readonly;
    const uint32_t fn_begin = cur().begin();
    auto * fn = ast_.create<FunctionExpr>();
    fn->name = name;
    fn->isAsync = is_async;
    fn->isGenerator = is_generator;
    skip_type_params();
    fn->params = to_span(parse_params());
    if (match(TokenKind::Colon)) {
      fn->returnType = parse_return_type();
    }
    fn->body = parse_function_body_opt();
    fn->range_ = range_from(fn_begin);
    member->function = fn;
    member->range_ = range_from(begin);
    return member;
  }

  auto * member = ast_.create<ClassMember>(ClassMemberKind::Property, name);
  member->computedKey = computed;
  member->isStatic = is_static;
  member->isReadonly = is_readonly;
  match(TokenKind::Bang);
  if (match(TokenKind::Colon)) {
    member->type = parse_type();
  }
  if (match(TokenKind::Eq)) {
    member->initializer = parse_assign();
  }
  consume_semicolon();
  member->range_ = range_from(begin);
  return member;
}

InterfaceDecl * Parser::parse_interface_decl(uint32_t begin)
{
  auto * decl = ast_.create<InterfaceDecl>(advance().text);
  skip_type_params();
  if (match_kw("extends")) {
    std::vector<TypeNode *> bases;
    do {
      bases.push_back(parse_primary_type());
    } while (match(TokenKind::Comma));
    decl->extends = to_span(bases);
  }
  if (expect(TokenKind::LBrace, "'{' to start interface body")) {
    decl->members = parse_type_members();
    expect(TokenKind::RBrace, "'}'");
  }
  decl->range_ = range_from(begin);
  return decl;
}

TypeAliasDecl * Parser::parse_type_alias_decl(uint32_t begin)
{
  const std::string_view name = advance().text;
  skip_type_params();
  expect(TokenKind::Eq, "'='");
  TypeNode * type = parse_type();
  consume_semicolon();
  return ast_.create<TypeAliasDecl>(name, type, range_from(begin));
}

EnumDecl * Parser::parse_enum_decl(uint32_t begin, bool is_const)
{
  if (!at(TokenKind::Identifier)) {
    error_at(cur(), "expected enum name");
  }
  auto * decl = ast_.create<EnumDecl>(at(TokenKind::Identifier) ? advance().text : "");
  decl->isConst = is_const;

  std::vector<EnumMember *> members;
  if (expect(TokenKind::LBrace, "'{'")) {
    while (!at_eof() && !at(TokenKind::RBrace)) {
      const uint32_t m_begin = cur().begin();
      std::string_view name;
      if (at(TokenKind::StringLiteral)) {
        name = unescape_string(advance().text);
      } else if (at(TokenKind::Identifier)) {
        name = advance().text;
      } else {
        error_at(cur(), "expected enum member name");
        advance();
        continue;
      }
      auto * member = ast_.create<EnumMember>(name);
      if (match(TokenKind::Eq)) {
        member->init = parse_assign();
      }
      member->range_ = range_from(m_begin);
      members.push_back(member);
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
    expect(TokenKind::RBrace, "'}'");
  }
  decl->members = to_span(members);
  decl->range_ = range_from(begin);
  return decl;
}

ModuleDecl * Parser::parse_module_decl(uint32_t begin)
{
  std::string_view name;
  if (at(TokenKind::StringLiteral)) {
    name = unescape_string(advance().text);
  } else {
    const uint32_t name_begin = cur().begin();
    advance();
    while (match(TokenKind::Dot)) {
      if (!expect(TokenKind::Identifier, "namespace name")) {
        break;
      }
    }
    name = source_.get_slice(range_from(name_begin));
  }
  auto * decl = ast_.create<ModuleDecl>(name);
  if (match(TokenKind::LBrace)) {
    decl->body = parse_stmt_list_until_rbrace();
    expect(TokenKind::RBrace, "'}'");
  } else {
    // declare module 'x';
    consume_semicolon();
  }
  decl->range_ = range_from(begin);
  return decl;
}

std::string_view Parser::parse_module_source(SourceRange * out_range)
{
  if (!at(TokenKind::StringLiteral)) {
    error_at(cur(), "expected module specifier string");
    return {};
  }
  const Token & t = advance();
  if (out_range != nullptr) {
    *out_range = t.range;
  }
  return unescape_string(t.text);
}

void Parser::skip_import_attributes()
{
  if ((at_kw("with") || at_kw("assert")) && cur(1).kind == TokenKind::LBrace &&
      !cur().newlineBefore) {
    advance();
    if (auto end = find_matching(idx_)) {
      idx_ = *end;
    }
  }
}

void Parser::skip_decorators()
{
  while (at(TokenKind::At)) {
    advance();
    Expr * target = parse_primary();
    (void)parse_call_chain(target, true);
  }
}

Stmt * Parser::parse_import_decl()
{
  const uint32_t begin = advance().begin();

  // Side-effect import: import 'x';
  if (at(TokenKind::StringLiteral)) {
    SourceRange src_range;
    const std::string_view src = parse_module_source(&src_range);
    auto * decl = ast_.create<ImportDecl>(src);
    decl->sourceRange = src_range;
    skip_import_attributes();
    consume_semicolon();
    decl->range_ = range_from(begin);
    return decl;
  }

  bool type_only = false;
  if (
    at_kw("type") && (cur(1).kind == TokenKind::LBrace || cur(1).kind == TokenKind::Star ||
                      (cur(1).kind == TokenKind::Identifier && !is_kw("from", cur(1))))) {
    advance();
    type_only = true;
  }

  std::vector<ImportSpecifier *> specs;

  if (at(TokenKind::Identifier) && !at_kw("from")) {
    const Token & local = advance();
    if (at(TokenKind::Eq)) {
      // import x = require('y'); is CommonJS interop, outside the subset.
      error_at(cur(), "'import = require()' is not supported; use an ES import");
      synchronize_to_stmt();
      return ast_.create<EmptyStmt>(range_from(begin));
    }
    specs.push_back(ast_.create<ImportSpecifier>(ImportKind::Default, local.text, local.range));
    match(TokenKind::Comma);
  }

  if (at(TokenKind::Star)) {
    const uint32_t s_begin = advance().begin();
    expect_kw("as");
    std::string_view local;
    if (at(TokenKind::Identifier)) {
      local = advance().text;
    } else {
      error_at(cur(), "expected namespace import name");
    }
    specs.push_back(
      ast_.create<ImportSpecifier>(ImportKind::Namespace, local, range_from(s_begin)));
  } else if (match(TokenKind::LBrace)) {
    while (!at_eof() && !at(TokenKind::RBrace)) {
      const uint32_t s_begin = cur().begin();
      bool spec_type_only = false;
      if (
        at_kw("type") && (cur(1).kind == TokenKind::Identifier ||
                          cur(1).kind == TokenKind::StringLiteral) &&
        !is_kw("as", cur(1))) {
        advance();
        spec_type_only = true;
      }
      std::string_view imported;
      if (at(TokenKind::StringLiteral)) {
        imported = unescape_string(advance().text);
      } else if (at(TokenKind::Identifier)) {
        imported = advance().text;
      } else {
        error_at(cur(), "expected import name");
        break;
      }
      std::string_view local = imported;
      if (match_kw("as")) {
        if (at(TokenKind::Identifier)) {
          local = advance().text;
        } else {
          error_at(cur(), "expected local name after 'as'");
        }
      }
      auto * spec = ast_.create<ImportSpecifier>(ImportKind::Named, local, range_from(s_begin));
      spec->imported = imported;
      spec->isTypeOnly = spec_type_only;
      specs.push_back(spec);
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
    expect(TokenKind::RBrace, "'}'");
  }

  expect_kw("from");
  SourceRange src_range;
  const std::string_view src = parse_module_source(&src_range);
  skip_import_attributes();
  consume_semicolon();

  auto * decl = ast_.create<ImportDecl>(src, range_from(begin));
  decl->sourceRange = src_range;
  decl->specifiers = to_span(specs);
  decl->isTypeOnly = type_only;
  return decl;
}

Stmt * Parser::parse_export_decl()
{
  const uint32_t begin = advance().begin();

  if (match_kw("default")) {
    const Token & t = cur();
    AstNode * declaration = nullptr;
    if (is_kw("function", t)) {
      advance();
      declaration = parse_function_decl(t.begin(), false);
    } else if (is_kw("async", t) && is_kw("function", cur(1))) {
      advance();
      advance();
      declaration = parse_function_decl(t.begin(), true);
    } else if (is_kw("class", t)) {
      advance();
      declaration = parse_class_decl(t.begin(), false);
    } else if (is_kw("abstract", t) && is_kw("class", cur(1))) {
      advance();
      advance();
      declaration = parse_class_decl(t.begin(), true);
    } else if (is_kw("interface", t) && cur(1).kind == TokenKind::Identifier) {
      advance();
      declaration = parse_interface_decl(t.begin());
    } else {
      declaration = parse_assign();
      consume_semicolon();
    }
    return ast_.create<ExportDefaultDecl>(declaration, range_from(begin));
  }

  if (at(TokenKind::Eq)) {
    error_at(cur(), "'export =' is not supported; use an ES export");
    synchronize_to_stmt();
    return ast_.create<EmptyStmt>(range_from(begin));
  }

  bool type_only = false;
  if (at_kw("type") && (cur(1).kind == TokenKind::LBrace || cur(1).kind == TokenKind::Star)) {
    advance();
    type_only = true;
  }

  if (match(TokenKind::Star)) {
    std::string_view alias;
    if (match_kw("as")) {
      if (at(TokenKind::Identifier) || at(TokenKind::StringLiteral)) {
        alias = advance().text;
      } else {
        error_at(cur(), "expected name after 'as'");
      }
    }
    expect_kw("from");
    const std::string_view src = parse_module_source(nullptr);
    skip_import_attributes();
    consume_semicolon();
    auto * decl = ast_.create<ExportAllDecl>(src, range_from(begin));
    decl->alias = alias;
    return decl;
  }

  if (match(TokenKind::LBrace)) {
    std::vector<ExportSpecifier *> specs;
    while (!at_eof() && !at(TokenKind::RBrace)) {
      const uint32_t s_begin = cur().begin();
      bool spec_type_only = false;
      if (at_kw("type") && cur(1).kind == TokenKind::Identifier && !is_kw("as", cur(1))) {
        advance();
        spec_type_only = true;
      }
      if (!at(TokenKind::Identifier) && !at(TokenKind::StringLiteral)) {
        error_at(cur(), "expected export name");
        break;
      }
      const std::string_view local = advance().text;
      std::string_view exported = local;
      if (match_kw("as")) {
        if (at(TokenKind::Identifier) || at(TokenKind::StringLiteral)) {
          exported = advance().text;
        } else {
          error_at(cur(), "expected exported name after 'as'");
        }
      }
      auto * spec = ast_.create<ExportSpecifier>(local, exported, range_from(s_begin));
      spec->isTypeOnly = spec_type_only;
      specs.push_back(spec);
      if (!match(TokenKind::Comma)) {
        break;
      }
    }
    expect(TokenKind::RBrace, "'}'");

    auto * decl = ast_.create<ExportNamedDecl>();
    decl->specifiers = to_span(specs);
    decl->isTypeOnly = type_only;
    if (match_kw("from")) {
      decl->source = parse_module_source(nullptr);
      decl->hasSource = true;
      skip_import_attributes();
    }
    consume_semicolon();
    decl->range_ = range_from(begin);
    return decl;
  }

  Stmt * inner = parse_declaration_or_null();
  if (inner == nullptr) {
    error_at(cur(), "expected declaration after 'export'");
    synchronize_to_stmt();
    return ast_.create<EmptyStmt>(range_from(begin));
  }
  auto * decl = ast_.create<ExportNamedDecl>();
  decl->declaration = inner;
  decl->range_ = range_from(begin);
  return decl;
}

// ============================================================================
// Parameters and binding patterns
// ============================================================================

std::vector<Param *> Parser::parse_params()
{
  std::vector<Param *> params;
  if (!expect(TokenKind::LParen, "'('")) {
    return params;
  }
  while (!at_eof() && !at(TokenKind::RParen)) {
    const size_t before = idx_;
    if (Param * p = parse_param()) {
      params.push_back(p);
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
    if (idx_ == before) {
      advance();
    }
  }
  expect(TokenKind::RParen, "')'");
  return params;
}

Param * Parser::parse_param()
{
  skip_decorators();
  const uint32_t begin = cur().begin();

  bool is_property = false;
  while (at(TokenKind::Identifier) &&
         (cur().text == "public" || cur().text == "private" || cur().text == "protected" ||
          cur().text == "readonly" || cur().text == "override") &&
         (cur(1).kind == TokenKind::Identifier || cur(1).kind == TokenKind::LBrace ||
          cur(1).kind == TokenKind::LBracket)) {
    advance();
    is_property = true;
  }

  const bool is_rest = match(TokenKind::DotDotDot);
  AstNode * binding = nullptr;
  if (at_kw("this")) {
    const Token & t = advance();
    binding = ast_.create<BindingIdent>(t.text, t.range);
  } else {
    binding = parse_binding_target();
  }

  auto * param = ast_.create<Param>(binding);
  param->isRest = is_rest;
  param->isParameterProperty = is_property;
  param->isOptional = match(TokenKind::Question);
  if (match(TokenKind::Colon)) {
    param->type = parse_type();
  }
  if (match(TokenKind::Eq)) {
    param->defaultValue = parse_assign();
  }
  param->range_ = range_from(begin);
  return param;
}

AstNode * Parser::parse_binding_target()
{
  if (at(TokenKind::LBrace)) {
    return parse_object_pattern();
  }
  if (at(TokenKind::LBracket)) {
    return parse_array_pattern();
  }
  if (at(TokenKind::Identifier)) {
    const Token & t = advance();
    return ast_.create<BindingIdent>(t.text, t.range);
  }
  error_at(cur(), "expected binding name or pattern");
  return ast_.create<BindingIdent>("", cur().range);
}

AstNode * Parser::parse_binding_element()
{
  const uint32_t begin = cur().begin();
  AstNode * target = parse_binding_target();
  if (match(TokenKind::Eq)) {
    Expr * def = parse_assign();
    return ast_.create<AssignPattern>(target, def, range_from(begin));
  }
  return target;
}

ObjectPattern * Parser::parse_object_pattern()
{
  const uint32_t begin = advance().begin();
  std::vector<AstNode *> props;
  while (!at_eof() && !at(TokenKind::RBrace)) {
    const uint32_t p_begin = cur().begin();
    if (match(TokenKind::DotDotDot)) {
      AstNode * target = parse_binding_target();
      props.push_back(ast_.create<RestElement>(target, range_from(p_begin)));
    } else {
      std::string_view key;
      Expr * computed = nullptr;
      const Token & key_tok = cur();
      if (match(TokenKind::LBracket)) {
        computed = parse_assign();
        expect(TokenKind::RBracket, "']'");
      } else if (at(TokenKind::StringLiteral)) {
        key = unescape_string(advance().text);
      } else if (at(TokenKind::Identifier) || at(TokenKind::NumberLiteral)) {
        key = advance().text;
      } else {
        error_at(cur(), "expected property name in pattern");
        break;
      }

      PatternProperty * prop = nullptr;
      if (match(TokenKind::Colon)) {
        prop = ast_.create<PatternProperty>(key, parse_binding_element());
      } else {
        AstNode * value = ast_.create<BindingIdent>(key, key_tok.range);
        if (match(TokenKind::Eq)) {
          Expr * def = parse_assign();
          value = ast_.create<AssignPattern>(value, def, range_from(p_begin));
        }
        prop = ast_.create<PatternProperty>(key, value);
        prop->shorthand = true;
      }
      prop->computedKey = computed;
      prop->range_ = range_from(p_begin);
      props.push_back(prop);
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBrace, "'}'");
  return ast_.create<ObjectPattern>(to_span(props), range_from(begin));
}

ArrayPattern * Parser::parse_array_pattern()
{
  const uint32_t begin = advance().begin();
  std::vector<AstNode *> elems;
  while (!at_eof() && !at(TokenKind::RBracket)) {
    if (match(TokenKind::Comma)) {
      elems.push_back(nullptr);
      continue;
    }
    const uint32_t e_begin = cur().begin();
    if (match(TokenKind::DotDotDot)) {
      AstNode * target = parse_binding_target();
      elems.push_back(ast_.create<RestElement>(target, range_from(e_begin)));
    } else {
      elems.push_back(parse_binding_element());
    }
    if (!match(TokenKind::Comma)) {
      break;
    }
  }
  expect(TokenKind::RBracket, "']'");
  return ast_.create<ArrayPattern>(to_span(elems), range_from(begin));
}

FunctionExpr * Parser::parse_function_rest(uint32_t begin, bool is_async)
{
  auto * fn = ast_.create<FunctionExpr>();
  fn->isAsync = is_async;
  fn->isGenerator = match(TokenKind::Star);
  if (at_identifier()) {
    fn->name = advance().text;
  }
  skip_type_params();
  fn->params = to_span(parse_params());
  if (match(TokenKind::Colon)) {
    fn->returnType = parse_return_type();
  }
  fn->body = parse_block();
  fn->range_ = range_from(begin);
  return fn;
}

}  // namespace purets::syntax
