// purets/syntax/parser.hpp - Recursive-descent parser for the TypeScript subset
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "purets/ast/ast.hpp"
#include "purets/ast/ast_context.hpp"
#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"
#include "purets/syntax/token.hpp"

namespace purets::syntax
{

/// Diagnostic code attached to every syntax error.
inline constexpr const char * k_parse_error_code = "parse-error";

/**
 * Builds the AST of one TypeScript file.
 *
 * Comment tokens are moved into Program::comments before parsing.
 * Syntax errors are reported to the DiagnosticBag with code `parse-error`;
 * the parser then resynchronizes at the next statement boundary, so a
 * Program is always returned.
 */
class Parser
{
public:
  Parser(
    AstContext & ast, const SourceFile & source, DiagnosticBag & diags, std::vector<Token> tokens);

  [[nodiscard]] Program * parse_program();

private:
  // ===========================================================================
  // Token helpers
  // ===========================================================================

  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  bool expect(TokenKind k, std::string_view what);
  bool expect_kw(std::string_view kw);

  /// Accepts `;`, or an inserted semicolon before `}`, EOF or a line break.
  void consume_semicolon();
  [[nodiscard]] bool can_insert_semicolon() const;

  void error_at(const Token & t, std::string_view msg);
  void synchronize_to_stmt();

  [[nodiscard]] static bool is_kw(std::string_view kw, const Token & t);
  [[nodiscard]] static bool is_reserved_word(std::string_view ident);
  [[nodiscard]] bool at_identifier() const;
  [[nodiscard]] bool at_property_name() const;

  [[nodiscard]] uint32_t prev_end() const;
  [[nodiscard]] SourceRange range_from(uint32_t begin) const;

  /// Index just past the bracket matching the one at `open_idx`.
  [[nodiscard]] std::optional<size_t> find_matching(size_t open_idx) const;

  // ===========================================================================
  // Statements
  // ===========================================================================

  [[nodiscard]] Stmt * parse_stmt();
  [[nodiscard]] Stmt * parse_declaration_or_null();
  [[nodiscard]] BlockStmt * parse_block();
  [[nodiscard]] gsl::span<Stmt *> parse_stmt_list_until_rbrace();
  [[nodiscard]] VarDecl * parse_var_decl(bool in_for_init);
  [[nodiscard]] Stmt * parse_if_stmt();
  [[nodiscard]] Stmt * parse_for_stmt();
  [[nodiscard]] Stmt * parse_while_stmt();
  [[nodiscard]] Stmt * parse_do_while_stmt();
  [[nodiscard]] Stmt * parse_return_stmt();
  [[nodiscard]] Stmt * parse_throw_stmt();
  [[nodiscard]] Stmt * parse_try_stmt();
  [[nodiscard]] Stmt * parse_switch_stmt();
  [[nodiscard]] Stmt * parse_break_or_continue();

  // ===========================================================================
  // Declarations
  // ===========================================================================

  [[nodiscard]] FunctionDecl * parse_function_decl(uint32_t begin, bool is_async);
  [[nodiscard]] ClassDecl * parse_class_decl(uint32_t begin, bool is_abstract);
  [[nodiscard]] ClassExpr * parse_class_expr();
  [[nodiscard]] gsl::span<ClassMember *> parse_class_body();
  [[nodiscard]] ClassMember * parse_class_member();
  [[nodiscard]] InterfaceDecl * parse_interface_decl(uint32_t begin);
  [[nodiscard]] TypeAliasDecl * parse_type_alias_decl(uint32_t begin);
  [[nodiscard]] EnumDecl * parse_enum_decl(uint32_t begin, bool is_const);
  [[nodiscard]] ModuleDecl * parse_module_decl(uint32_t begin);
  [[nodiscard]] Stmt * parse_import_decl();
  [[nodiscard]] Stmt * parse_export_decl();
  [[nodiscard]] std::string_view parse_module_source(SourceRange * out_range);
  void skip_import_attributes();
  void skip_decorators();

  // ===========================================================================
  // Functions, parameters and patterns
  // ===========================================================================

  [[nodiscard]] std::vector<Param *> parse_params();
  [[nodiscard]] Param * parse_param();
  [[nodiscard]] AstNode * parse_binding_target();
  [[nodiscard]] AstNode * parse_binding_element();
  [[nodiscard]] ObjectPattern * parse_object_pattern();
  [[nodiscard]] ArrayPattern * parse_array_pattern();
  [[nodiscard]] FunctionExpr * parse_function_rest(uint32_t begin, bool is_async);
  [[nodiscard]] BlockStmt * parse_function_body_opt();

  // ===========================================================================
  // Types
  // ===========================================================================

  [[nodiscard]] TypeNode * parse_type();
  [[nodiscard]] TypeNode * parse_return_type();
  [[nodiscard]] TypeNode * parse_union_type();
  [[nodiscard]] TypeNode * parse_intersection_type();
  [[nodiscard]] TypeNode * parse_type_operator();
  [[nodiscard]] TypeNode * parse_postfix_type();
  [[nodiscard]] TypeNode * parse_primary_type();
  [[nodiscard]] TypeNode * parse_function_type(bool is_constructor);
  [[nodiscard]] TypeNode * parse_object_or_mapped_type();
  [[nodiscard]] TypeNode * parse_tuple_type();
  [[nodiscard]] TypeNode * parse_template_literal_type();
  [[nodiscard]] PropertySignature * parse_type_member();
  [[nodiscard]] gsl::span<PropertySignature *> parse_type_members();
  [[nodiscard]] std::vector<TypeNode *> parse_type_args();
  void skip_type_params();
  [[nodiscard]] bool at_function_type_start() const;
  [[nodiscard]] std::string_view parse_dotted_name();

  // ===========================================================================
  // Expressions
  // ===========================================================================

  [[nodiscard]] Expr * parse_expr();
  [[nodiscard]] Expr * parse_assign();
  [[nodiscard]] Expr * parse_conditional();
  [[nodiscard]] Expr * parse_binary(int min_prec);
  [[nodiscard]] Expr * parse_unary();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_call_chain(Expr * base, bool allow_calls);
  [[nodiscard]] Expr * parse_primary();
  [[nodiscard]] Expr * parse_new_expr();
  [[nodiscard]] Expr * parse_array_literal();
  [[nodiscard]] Expr * parse_object_literal();
  [[nodiscard]] ObjectProperty * parse_object_property();
  [[nodiscard]] Expr * parse_template(Expr * tag, uint32_t begin);
  [[nodiscard]] std::vector<Expr *> parse_arguments();
  [[nodiscard]] Expr * parse_arrow_function(uint32_t begin, bool is_async);
  [[nodiscard]] Expr * parse_number_literal();
  [[nodiscard]] Expr * parse_string_literal();

  /// Binary operator at the cursor: precedence and the number of tokens it spans.
  struct BinaryOpInfo
  {
    int precedence = -1;
    BinaryOp op = BinaryOp::Add;
    size_t token_count = 1;
  };
  [[nodiscard]] BinaryOpInfo peek_binary_op() const;
  [[nodiscard]] std::optional<std::pair<AssignOp, size_t>> peek_assign_op() const;

  [[nodiscard]] bool is_arrow_paren_at(size_t idx) const;
  [[nodiscard]] bool is_generic_arrow_at(size_t idx) const;
  [[nodiscard]] bool at_call_type_args() const;

  [[nodiscard]] Expr * make_missing_expr_at(const Token & t);
  [[nodiscard]] std::string_view unescape_string(std::string_view raw);

  template <typename T>
  [[nodiscard]] gsl::span<T> to_span(const std::vector<T> & v)
  {
    return ast_.copy_to_arena(v);
  }

  /// Sets a context flag for the lifetime of the scope.
  class FlagScope
  {
  public:
    FlagScope(bool & flag, bool value) : flag_(flag), saved_(flag) { flag_ = value; }
    ~FlagScope() { flag_ = saved_; }
    FlagScope(const FlagScope &) = delete;
    FlagScope & operator=(const FlagScope &) = delete;

  private:
    bool & flag_;
    bool saved_;
  };

  /// Brackets reset every context flag of the enclosing construct.
  struct NestedScope
  {
    explicit NestedScope(Parser & p)
    : in(p.no_in_, false),
      arrow(p.no_arrow_return_type_, false),
      cond(p.no_conditional_types_, false)
    {
    }
    FlagScope in;
    FlagScope arrow;
    FlagScope cond;
  };

  AstContext & ast_;
  const SourceFile & source_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  std::vector<Comment> comments_;
  size_t idx_ = 0;

  bool no_in_ = false;                  ///< Inside a for-statement head
  bool no_arrow_return_type_ = false;   ///< `(a): b` is not an arrow head here
  bool no_conditional_types_ = false;   ///< Inside an `extends` clause of a conditional type
  uint32_t last_error_offset_ = UINT32_MAX;
};

}  // namespace purets::syntax
