// purets/ast/ast.hpp - AST node class definitions for the TypeScript subset
//
// This header contains all AST node class definitions following the
// LLVM/Clang style with classof() for RTTI support.
//
#pragma once

#include <gsl/span>
#include <string_view>

#include "purets/ast/ast_enums.hpp"
#include "purets/basic/casting.hpp"
#include "purets/basic/source_manager.hpp"

namespace purets
{

// ============================================================================
// Base Classes
// ============================================================================

/**
 * Base class for all AST nodes.
 *
 * Every AST node has:
 * - A NodeKind for RTTI (using classof pattern)
 * - A SourceRange indicating its location in source
 *
 * Nodes are non-copyable and managed by AstContext.
 */
class AstNode
{
public:
  const NodeKind kind;
  SourceRange range_;  ///< Byte offsets only. Line/col computed via SourceFile.

  // Non-copyable, non-movable (managed by AstContext)
  AstNode(const AstNode &) = delete;
  AstNode & operator=(const AstNode &) = delete;
  AstNode(AstNode &&) = delete;
  AstNode & operator=(AstNode &&) = delete;

  [[nodiscard]] NodeKind get_kind() const noexcept { return kind; }

  [[nodiscard]] SourceRange get_range() const noexcept { return range_; }

protected:
  explicit AstNode(NodeKind k, SourceRange r = {}) : kind(k), range_(r) {}
  ~AstNode() = default;  // Non-virtual, protected: prevents polymorphic delete
};

// ============================================================================
// CRTP Base for Automatic classof()
// ============================================================================

/**
 * CRTP base class that automatically implements classof().
 *
 * @tparam Derived The concrete node class
 * @tparam Base The base class to inherit from
 * @tparam K The NodeKind for this node type
 */
template <typename Derived, typename Base, NodeKind K>
class NodeBase : public Base
{
public:
  static constexpr NodeKind kind = K;

  static bool classof(const AstNode * node) { return node->get_kind() == K; }

protected:
  explicit NodeBase(SourceRange r = {}) : Base(K, r) {}
};

// ============================================================================
// Category Base Classes
// ============================================================================

class Expr : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_expr_kind(node->kind); }

protected:
  explicit Expr(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class TypeNode : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_type_kind(node->kind); }

protected:
  explicit TypeNode(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

/**
 * Base class for statements. Declarations are statements too.
 */
class Stmt : public AstNode
{
public:
  static bool classof(const AstNode * node) { return is_stmt_kind(node->kind); }

protected:
  explicit Stmt(NodeKind k, SourceRange r = {}) : AstNode(k, r) {}
};

class Decl : public Stmt
{
public:
  static bool classof(const AstNode * node) { return is_decl_kind(node->kind); }

protected:
  explicit Decl(NodeKind k, SourceRange r = {}) : Stmt(k, r) {}
};

// Forward declarations used by expression nodes
class BlockStmt;
class Param;
class ObjectProperty;
class ClassMember;

// ============================================================================
// Expression Nodes
// ============================================================================

/// Identifier reference.
class IdentifierExpr : public NodeBase<IdentifierExpr, Expr, NodeKind::Identifier>
{
public:
  std::string_view name;

  explicit IdentifierExpr(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// Numeric literal. `text` is the literal as written.
class NumberLiteralExpr : public NodeBase<NumberLiteralExpr, Expr, NodeKind::NumberLiteral>
{
public:
  std::string_view text;
  double value;

  NumberLiteralExpr(std::string_view t, double v, SourceRange r = {})
  : NodeBase(r), text(t), value(v)
  {
  }
};

/// String literal. `value` has escapes decoded and quotes removed.
class StringLiteralExpr : public NodeBase<StringLiteralExpr, Expr, NodeKind::StringLiteral>
{
public:
  std::string_view value;

  explicit StringLiteralExpr(std::string_view v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

/// Template literal, optionally tagged: tag`a${b}c`.
class TemplateLiteralExpr : public NodeBase<TemplateLiteralExpr, Expr, NodeKind::TemplateLiteral>
{
public:
  Expr * tag = nullptr;
  gsl::span<Expr *> expressions;

  explicit TemplateLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class BoolLiteralExpr : public NodeBase<BoolLiteralExpr, Expr, NodeKind::BoolLiteral>
{
public:
  bool value;

  explicit BoolLiteralExpr(bool v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class NullLiteralExpr : public NodeBase<NullLiteralExpr, Expr, NodeKind::NullLiteral>
{
public:
  explicit NullLiteralExpr(SourceRange r = {}) : NodeBase(r) {}
};

class RegexLiteralExpr : public NodeBase<RegexLiteralExpr, Expr, NodeKind::RegexLiteral>
{
public:
  std::string_view text;

  explicit RegexLiteralExpr(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

class ThisExpr : public NodeBase<ThisExpr, Expr, NodeKind::This>
{
public:
  explicit ThisExpr(SourceRange r = {}) : NodeBase(r) {}
};

class SuperExpr : public NodeBase<SuperExpr, Expr, NodeKind::Super>
{
public:
  explicit SuperExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// `import.meta` / `new.target`.
class MetaPropertyExpr : public NodeBase<MetaPropertyExpr, Expr, NodeKind::MetaProperty>
{
public:
  std::string_view meta;
  std::string_view property;

  MetaPropertyExpr(std::string_view m, std::string_view p, SourceRange r = {})
  : NodeBase(r), meta(m), property(p)
  {
  }
};

/// Array literal: [a, , ...b]. Holes are nullptr.
class ArrayLiteralExpr : public NodeBase<ArrayLiteralExpr, Expr, NodeKind::ArrayLiteral>
{
public:
  gsl::span<Expr *> elements;

  explicit ArrayLiteralExpr(gsl::span<Expr *> elems, SourceRange r = {})
  : NodeBase(r), elements(elems)
  {
  }
};

class ObjectLiteralExpr : public NodeBase<ObjectLiteralExpr, Expr, NodeKind::ObjectLiteral>
{
public:
  gsl::span<ObjectProperty *> properties;

  explicit ObjectLiteralExpr(gsl::span<ObjectProperty *> props, SourceRange r = {})
  : NodeBase(r), properties(props)
  {
  }
};

/// Function expression: function name(params) { body }.
class FunctionExpr : public NodeBase<FunctionExpr, Expr, NodeKind::Function>
{
public:
  std::string_view name;  ///< Empty when anonymous
  gsl::span<Param *> params;
  TypeNode * returnType = nullptr;
  BlockStmt * body = nullptr;
  bool isAsync = false;
  bool isGenerator = false;

  explicit FunctionExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Arrow function: (params) => body. Body is a BlockStmt or an expression.
class ArrowFunctionExpr : public NodeBase<ArrowFunctionExpr, Expr, NodeKind::ArrowFunction>
{
public:
  gsl::span<Param *> params;
  TypeNode * returnType = nullptr;
  AstNode * body = nullptr;
  bool isAsync = false;

  explicit ArrowFunctionExpr(SourceRange r = {}) : NodeBase(r) {}
};

class ClassExpr : public NodeBase<ClassExpr, Expr, NodeKind::Class>
{
public:
  std::string_view name;
  Expr * superClass = nullptr;
  gsl::span<ClassMember *> members;

  explicit ClassExpr(SourceRange r = {}) : NodeBase(r) {}
};

/// Call expression: callee(args). `optional` marks callee?.(args).
class CallExpr : public NodeBase<CallExpr, Expr, NodeKind::Call>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;
  bool optional = false;

  CallExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

class NewExpr : public NodeBase<NewExpr, Expr, NodeKind::New>
{
public:
  Expr * callee;
  gsl::span<Expr *> args;

  NewExpr(Expr * c, gsl::span<Expr *> a, SourceRange r = {}) : NodeBase(r), callee(c), args(a) {}
};

/// Static member access: object.property (or object?.property).
class MemberExpr : public NodeBase<MemberExpr, Expr, NodeKind::Member>
{
public:
  Expr * object;
  std::string_view property;
  SourceRange propertyRange;
  bool optional = false;

  MemberExpr(Expr * o, std::string_view p, SourceRange r = {})
  : NodeBase(r), object(o), property(p)
  {
  }
};

/// Computed member access: object[index].
class IndexExpr : public NodeBase<IndexExpr, Expr, NodeKind::Index>
{
public:
  Expr * object;
  Expr * index;
  bool optional = false;

  IndexExpr(Expr * o, Expr * i, SourceRange r = {}) : NodeBase(r), object(o), index(i) {}
};

class AssignExpr : public NodeBase<AssignExpr, Expr, NodeKind::Assign>
{
public:
  AssignOp op;
  Expr * target;
  Expr * value;

  AssignExpr(AssignOp o, Expr * t, Expr * v, SourceRange r = {})
  : NodeBase(r), op(o), target(t), value(v)
  {
  }
};

class UnaryExpr : public NodeBase<UnaryExpr, Expr, NodeKind::Unary>
{
public:
  UnaryOp op;
  Expr * operand;

  UnaryExpr(UnaryOp o, Expr * e, SourceRange r = {}) : NodeBase(r), op(o), operand(e) {}
};

class UpdateExpr : public NodeBase<UpdateExpr, Expr, NodeKind::Update>
{
public:
  UpdateOp op;
  bool prefix;
  Expr * operand;

  UpdateExpr(UpdateOp o, bool pre, Expr * e, SourceRange r = {})
  : NodeBase(r), op(o), prefix(pre), operand(e)
  {
  }
};

class BinaryExpr : public NodeBase<BinaryExpr, Expr, NodeKind::Binary>
{
public:
  Expr * lhs;
  BinaryOp op;
  Expr * rhs;

  BinaryExpr(Expr * l, BinaryOp o, Expr * r, SourceRange range = {})
  : NodeBase(range), lhs(l), op(o), rhs(r)
  {
  }
};

class ConditionalExpr : public NodeBase<ConditionalExpr, Expr, NodeKind::Conditional>
{
public:
  Expr * test;
  Expr * consequent;
  Expr * alternate;

  ConditionalExpr(Expr * t, Expr * c, Expr * a, SourceRange r = {})
  : NodeBase(r), test(t), consequent(c), alternate(a)
  {
  }
};

/// `expr as T`, `expr as const` (type == nullptr) or `expr satisfies T`.
class AsExpr : public NodeBase<AsExpr, Expr, NodeKind::As>
{
public:
  Expr * expr;
  TypeNode * type;
  bool isConst = false;
  bool isSatisfies = false;

  AsExpr(Expr * e, TypeNode * t, SourceRange r = {}) : NodeBase(r), expr(e), type(t) {}
};

/// Angle-bracket assertion: <T>expr.
class TypeAssertionExpr : public NodeBase<TypeAssertionExpr, Expr, NodeKind::TypeAssertion>
{
public:
  TypeNode * type;
  Expr * expr;

  TypeAssertionExpr(TypeNode * t, Expr * e, SourceRange r = {}) : NodeBase(r), type(t), expr(e) {}
};

/// Non-null assertion: expr!.
class NonNullExpr : public NodeBase<NonNullExpr, Expr, NodeKind::NonNull>
{
public:
  Expr * expr;

  explicit NonNullExpr(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class ParenExpr : public NodeBase<ParenExpr, Expr, NodeKind::Paren>
{
public:
  Expr * inner;

  explicit ParenExpr(Expr * e, SourceRange r = {}) : NodeBase(r), inner(e) {}
};

class AwaitExpr : public NodeBase<AwaitExpr, Expr, NodeKind::Await>
{
public:
  Expr * argument;

  explicit AwaitExpr(Expr * e, SourceRange r = {}) : NodeBase(r), argument(e) {}
};

class YieldExpr : public NodeBase<YieldExpr, Expr, NodeKind::Yield>
{
public:
  Expr * argument;  ///< nullptr for a bare `yield`
  bool delegate = false;

  explicit YieldExpr(Expr * e, SourceRange r = {}) : NodeBase(r), argument(e) {}
};

/// Spread in call arguments and array literals: ...expr.
class SpreadExpr : public NodeBase<SpreadExpr, Expr, NodeKind::Spread>
{
public:
  Expr * argument;

  explicit SpreadExpr(Expr * e, SourceRange r = {}) : NodeBase(r), argument(e) {}
};

/// Comma expression: a, b, c.
class SequenceExpr : public NodeBase<SequenceExpr, Expr, NodeKind::Sequence>
{
public:
  gsl::span<Expr *> expressions;

  explicit SequenceExpr(gsl::span<Expr *> e, SourceRange r = {}) : NodeBase(r), expressions(e) {}
};

/// Missing expression (parser recovery placeholder).
class MissingExpr : public NodeBase<MissingExpr, Expr, NodeKind::MissingExpr>
{
public:
  explicit MissingExpr(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Type Nodes
// ============================================================================

class PropertySignature;

/// Named type with optional arguments: Foo, ns.Foo, Array<T>.
class TypeReference : public NodeBase<TypeReference, TypeNode, NodeKind::TypeReference>
{
public:
  std::string_view name;  ///< Full dotted name as written
  gsl::span<TypeNode *> typeArgs;

  explicit TypeReference(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// T[]
class ArrayType : public NodeBase<ArrayType, TypeNode, NodeKind::ArrayType>
{
public:
  TypeNode * elementType;

  explicit ArrayType(TypeNode * elem, SourceRange r = {}) : NodeBase(r), elementType(elem) {}
};

class TupleType : public NodeBase<TupleType, TypeNode, NodeKind::TupleType>
{
public:
  gsl::span<TypeNode *> elements;

  explicit TupleType(gsl::span<TypeNode *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

class UnionType : public NodeBase<UnionType, TypeNode, NodeKind::UnionType>
{
public:
  gsl::span<TypeNode *> types;

  explicit UnionType(gsl::span<TypeNode *> t, SourceRange r = {}) : NodeBase(r), types(t) {}
};

class IntersectionType : public NodeBase<IntersectionType, TypeNode, NodeKind::IntersectionType>
{
public:
  gsl::span<TypeNode *> types;

  explicit IntersectionType(gsl::span<TypeNode *> t, SourceRange r = {}) : NodeBase(r), types(t)
  {
  }
};

/// (a: A) => R, or `new (...) => R` when isConstructor.
class FunctionType : public NodeBase<FunctionType, TypeNode, NodeKind::FunctionType>
{
public:
  gsl::span<Param *> params;
  TypeNode * returnType = nullptr;
  bool isConstructor = false;

  explicit FunctionType(SourceRange r = {}) : NodeBase(r) {}
};

/// Type literal: { a: string; b(): void }.
class ObjectType : public NodeBase<ObjectType, TypeNode, NodeKind::ObjectType>
{
public:
  gsl::span<PropertySignature *> members;

  explicit ObjectType(gsl::span<PropertySignature *> m, SourceRange r = {})
  : NodeBase(r), members(m)
  {
  }
};

/// Literal or keyword-like leaf written verbatim: 'a', 42, true, `x${string}`.
class LiteralType : public NodeBase<LiteralType, TypeNode, NodeKind::LiteralType>
{
public:
  std::string_view text;

  explicit LiteralType(std::string_view t, SourceRange r = {}) : NodeBase(r), text(t) {}
};

/// keyof T, readonly T[], unique symbol.
class TypeOperator : public NodeBase<TypeOperator, TypeNode, NodeKind::TypeOperator>
{
public:
  TypeOperatorKind op;
  TypeNode * operand;

  TypeOperator(TypeOperatorKind o, TypeNode * t, SourceRange r = {})
  : NodeBase(r), op(o), operand(t)
  {
  }
};

/// T[K]
class IndexedAccessType
: public NodeBase<IndexedAccessType, TypeNode, NodeKind::IndexedAccessType>
{
public:
  TypeNode * object;
  TypeNode * index;

  IndexedAccessType(TypeNode * o, TypeNode * i, SourceRange r = {})
  : NodeBase(r), object(o), index(i)
  {
  }
};

/// typeof expr (in a type position).
class TypeQuery : public NodeBase<TypeQuery, TypeNode, NodeKind::TypeQuery>
{
public:
  std::string_view exprName;

  explicit TypeQuery(std::string_view n, SourceRange r = {}) : NodeBase(r), exprName(n) {}
};

/// C extends E ? T : F
class ConditionalType : public NodeBase<ConditionalType, TypeNode, NodeKind::ConditionalType>
{
public:
  TypeNode * checkType;
  TypeNode * extendsType;
  TypeNode * trueType;
  TypeNode * falseType;

  ConditionalType(TypeNode * c, TypeNode * e, TypeNode * t, TypeNode * f, SourceRange r = {})
  : NodeBase(r), checkType(c), extendsType(e), trueType(t), falseType(f)
  {
  }
};

class InferType : public NodeBase<InferType, TypeNode, NodeKind::InferType>
{
public:
  std::string_view name;

  explicit InferType(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// { [K in C as N]: V }
class MappedType : public NodeBase<MappedType, TypeNode, NodeKind::MappedType>
{
public:
  std::string_view paramName;
  TypeNode * constraint = nullptr;
  TypeNode * nameType = nullptr;
  TypeNode * valueType = nullptr;
  bool isReadonly = false;

  explicit MappedType(std::string_view p, SourceRange r = {}) : NodeBase(r), paramName(p) {}
};

/// x is T, asserts x is T, asserts x.
class TypePredicate : public NodeBase<TypePredicate, TypeNode, NodeKind::TypePredicate>
{
public:
  std::string_view paramName;
  TypeNode * type;  ///< nullptr for `asserts x`
  bool asserts = false;

  TypePredicate(std::string_view p, TypeNode * t, SourceRange r = {})
  : NodeBase(r), paramName(p), type(t)
  {
  }
};

// ============================================================================
// Statement Nodes
// ============================================================================

class SwitchCase;
class CatchClause;
class VarDeclarator;
class ImportSpecifier;
class ExportSpecifier;
class EnumMember;

class BlockStmt : public NodeBase<BlockStmt, Stmt, NodeKind::BlockStmt>
{
public:
  gsl::span<Stmt *> body;

  explicit BlockStmt(gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

class ExprStmt : public NodeBase<ExprStmt, Stmt, NodeKind::ExprStmt>
{
public:
  Expr * expr;

  explicit ExprStmt(Expr * e, SourceRange r = {}) : NodeBase(r), expr(e) {}
};

class IfStmt : public NodeBase<IfStmt, Stmt, NodeKind::IfStmt>
{
public:
  Expr * condition;
  Stmt * thenBranch;
  Stmt * elseBranch;  ///< nullptr when absent

  IfStmt(Expr * c, Stmt * t, Stmt * e, SourceRange r = {})
  : NodeBase(r), condition(c), thenBranch(t), elseBranch(e)
  {
  }
};

class WhileStmt : public NodeBase<WhileStmt, Stmt, NodeKind::WhileStmt>
{
public:
  Expr * condition;
  Stmt * body;

  WhileStmt(Expr * c, Stmt * b, SourceRange r = {}) : NodeBase(r), condition(c), body(b) {}
};

class DoWhileStmt : public NodeBase<DoWhileStmt, Stmt, NodeKind::DoWhileStmt>
{
public:
  Stmt * body;
  Expr * condition;

  DoWhileStmt(Stmt * b, Expr * c, SourceRange r = {}) : NodeBase(r), body(b), condition(c) {}
};

/// for (init; test; update) body. `init` is a VarDecl or an Expr.
class ForStmt : public NodeBase<ForStmt, Stmt, NodeKind::ForStmt>
{
public:
  AstNode * init = nullptr;
  Expr * test = nullptr;
  Expr * update = nullptr;
  Stmt * body = nullptr;

  explicit ForStmt(SourceRange r = {}) : NodeBase(r) {}
};

/// for (left in right) body. `left` is a VarDecl or an Expr.
class ForInStmt : public NodeBase<ForInStmt, Stmt, NodeKind::ForInStmt>
{
public:
  AstNode * left;
  Expr * right;
  Stmt * body;

  ForInStmt(AstNode * l, Expr * rt, Stmt * b, SourceRange r = {})
  : NodeBase(r), left(l), right(rt), body(b)
  {
  }
};

class ForOfStmt : public NodeBase<ForOfStmt, Stmt, NodeKind::ForOfStmt>
{
public:
  AstNode * left;
  Expr * right;
  Stmt * body;
  bool isAwait = false;

  ForOfStmt(AstNode * l, Expr * rt, Stmt * b, SourceRange r = {})
  : NodeBase(r), left(l), right(rt), body(b)
  {
  }
};

class ReturnStmt : public NodeBase<ReturnStmt, Stmt, NodeKind::ReturnStmt>
{
public:
  Expr * value;  ///< nullptr for a bare `return`

  explicit ReturnStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class BreakStmt : public NodeBase<BreakStmt, Stmt, NodeKind::BreakStmt>
{
public:
  std::string_view label;

  explicit BreakStmt(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

class ContinueStmt : public NodeBase<ContinueStmt, Stmt, NodeKind::ContinueStmt>
{
public:
  std::string_view label;

  explicit ContinueStmt(std::string_view l, SourceRange r = {}) : NodeBase(r), label(l) {}
};

class ThrowStmt : public NodeBase<ThrowStmt, Stmt, NodeKind::ThrowStmt>
{
public:
  Expr * value;

  explicit ThrowStmt(Expr * v, SourceRange r = {}) : NodeBase(r), value(v) {}
};

class TryStmt : public NodeBase<TryStmt, Stmt, NodeKind::TryStmt>
{
public:
  BlockStmt * block;
  CatchClause * handler = nullptr;
  BlockStmt * finalizer = nullptr;

  explicit TryStmt(BlockStmt * b, SourceRange r = {}) : NodeBase(r), block(b) {}
};

class SwitchStmt : public NodeBase<SwitchStmt, Stmt, NodeKind::SwitchStmt>
{
public:
  Expr * discriminant;
  gsl::span<SwitchCase *> cases;

  SwitchStmt(Expr * d, gsl::span<SwitchCase *> c, SourceRange r = {})
  : NodeBase(r), discriminant(d), cases(c)
  {
  }
};

class LabeledStmt : public NodeBase<LabeledStmt, Stmt, NodeKind::LabeledStmt>
{
public:
  std::string_view label;
  Stmt * body;

  LabeledStmt(std::string_view l, Stmt * b, SourceRange r = {}) : NodeBase(r), label(l), body(b) {}
};

class EmptyStmt : public NodeBase<EmptyStmt, Stmt, NodeKind::EmptyStmt>
{
public:
  explicit EmptyStmt(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Declaration Nodes
// ============================================================================

/// const/let/var statement with one or more declarators.
class VarDecl : public NodeBase<VarDecl, Decl, NodeKind::VarDecl>
{
public:
  VarKind varKind;
  gsl::span<VarDeclarator *> declarators;
  bool isDeclare = false;

  VarDecl(VarKind k, gsl::span<VarDeclarator *> d, SourceRange r = {})
  : NodeBase(r), varKind(k), declarators(d)
  {
  }
};

/// function name(params): R { body }. `body` is nullptr for overload signatures.
class FunctionDecl : public NodeBase<FunctionDecl, Decl, NodeKind::FunctionDecl>
{
public:
  std::string_view name;  ///< Empty for `export default function () {}`
  SourceRange nameRange;
  gsl::span<Param *> params;
  TypeNode * returnType = nullptr;
  BlockStmt * body = nullptr;
  bool isAsync = false;
  bool isGenerator = false;
  bool isDeclare = false;

  explicit FunctionDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ClassDecl : public NodeBase<ClassDecl, Decl, NodeKind::ClassDecl>
{
public:
  std::string_view name;
  Expr * superClass = nullptr;
  gsl::span<TypeNode *> implements;
  gsl::span<ClassMember *> members;
  bool isAbstract = false;

  explicit ClassDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class InterfaceDecl : public NodeBase<InterfaceDecl, Decl, NodeKind::InterfaceDecl>
{
public:
  std::string_view name;
  gsl::span<TypeNode *> extends;
  gsl::span<PropertySignature *> members;

  explicit InterfaceDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class TypeAliasDecl : public NodeBase<TypeAliasDecl, Decl, NodeKind::TypeAliasDecl>
{
public:
  std::string_view name;
  TypeNode * aliasedType;

  TypeAliasDecl(std::string_view n, TypeNode * t, SourceRange r = {})
  : NodeBase(r), name(n), aliasedType(t)
  {
  }
};

class EnumDecl : public NodeBase<EnumDecl, Decl, NodeKind::EnumDecl>
{
public:
  std::string_view name;
  gsl::span<EnumMember *> members;
  bool isConst = false;

  explicit EnumDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// namespace N { ... }, declare module 'm' { ... }, declare global { ... }.
class ModuleDecl : public NodeBase<ModuleDecl, Decl, NodeKind::ModuleDecl>
{
public:
  std::string_view name;
  gsl::span<Stmt *> body;

  explicit ModuleDecl(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

class ImportDecl : public NodeBase<ImportDecl, Decl, NodeKind::ImportDecl>
{
public:
  std::string_view source;
  SourceRange sourceRange;
  gsl::span<ImportSpecifier *> specifiers;
  bool isTypeOnly = false;

  explicit ImportDecl(std::string_view s, SourceRange r = {}) : NodeBase(r), source(s) {}
};

/**
 * export <declaration>, export { a, b as c }, export { a } from 'm'.
 *
 * Exactly one of `declaration` and `specifiers` is meaningful.
 */
class ExportNamedDecl : public NodeBase<ExportNamedDecl, Decl, NodeKind::ExportNamedDecl>
{
public:
  Stmt * declaration = nullptr;
  gsl::span<ExportSpecifier *> specifiers;
  std::string_view source;
  bool hasSource = false;
  bool isTypeOnly = false;

  explicit ExportNamedDecl(SourceRange r = {}) : NodeBase(r) {}
};

/// export default <function | class | expression>.
class ExportDefaultDecl : public NodeBase<ExportDefaultDecl, Decl, NodeKind::ExportDefaultDecl>
{
public:
  AstNode * declaration;

  explicit ExportDefaultDecl(AstNode * d, SourceRange r = {}) : NodeBase(r), declaration(d) {}
};

/// export * from 'm', export * as ns from 'm'.
class ExportAllDecl : public NodeBase<ExportAllDecl, Decl, NodeKind::ExportAllDecl>
{
public:
  std::string_view source;
  std::string_view alias;

  explicit ExportAllDecl(std::string_view s, SourceRange r = {}) : NodeBase(r), source(s) {}
};

// ============================================================================
// Supporting Nodes
// ============================================================================

/// One binding of a variable statement: pattern: T = init.
class VarDeclarator : public NodeBase<VarDeclarator, AstNode, NodeKind::VarDeclarator>
{
public:
  AstNode * binding;  ///< BindingIdent, ObjectPattern or ArrayPattern
  TypeNode * type = nullptr;
  Expr * init = nullptr;

  explicit VarDeclarator(AstNode * b, SourceRange r = {}) : NodeBase(r), binding(b) {}
};

/// Function parameter. Also used for function type parameters.
class Param : public NodeBase<Param, AstNode, NodeKind::Param>
{
public:
  AstNode * binding;
  TypeNode * type = nullptr;
  Expr * defaultValue = nullptr;
  bool isRest = false;
  bool isOptional = false;
  bool isParameterProperty = false;  ///< constructor(private readonly x: T)

  explicit Param(AstNode * b, SourceRange r = {}) : NodeBase(r), binding(b) {}
};

/// A name introduced by a binding pattern.
class BindingIdent : public NodeBase<BindingIdent, AstNode, NodeKind::BindingIdent>
{
public:
  std::string_view name;

  explicit BindingIdent(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// { a, b: c, ...rest } in a binding position.
class ObjectPattern : public NodeBase<ObjectPattern, AstNode, NodeKind::ObjectPattern>
{
public:
  gsl::span<AstNode *> properties;  ///< PatternProperty or RestElement

  explicit ObjectPattern(gsl::span<AstNode *> p, SourceRange r = {}) : NodeBase(r), properties(p) {}
};

class PatternProperty : public NodeBase<PatternProperty, AstNode, NodeKind::PatternProperty>
{
public:
  std::string_view key;
  Expr * computedKey = nullptr;
  AstNode * value;  ///< Binding target (may be an AssignPattern)
  bool shorthand = false;

  PatternProperty(std::string_view k, AstNode * v, SourceRange r = {})
  : NodeBase(r), key(k), value(v)
  {
  }
};

/// [a, , b = 1, ...rest] in a binding position. Holes are nullptr.
class ArrayPattern : public NodeBase<ArrayPattern, AstNode, NodeKind::ArrayPattern>
{
public:
  gsl::span<AstNode *> elements;

  explicit ArrayPattern(gsl::span<AstNode *> e, SourceRange r = {}) : NodeBase(r), elements(e) {}
};

/// target = default, inside a pattern.
class AssignPattern : public NodeBase<AssignPattern, AstNode, NodeKind::AssignPattern>
{
public:
  AstNode * target;
  Expr * defaultValue;

  AssignPattern(AstNode * t, Expr * d, SourceRange r = {}) : NodeBase(r), target(t), defaultValue(d)
  {
  }
};

class RestElement : public NodeBase<RestElement, AstNode, NodeKind::RestElement>
{
public:
  AstNode * target;

  explicit RestElement(AstNode * t, SourceRange r = {}) : NodeBase(r), target(t) {}
};

class ImportSpecifier : public NodeBase<ImportSpecifier, AstNode, NodeKind::ImportSpecifier>
{
public:
  ImportKind importKind;
  std::string_view imported;  ///< Name in the source module (empty for default/namespace)
  std::string_view local;
  bool isTypeOnly = false;

  ImportSpecifier(ImportKind k, std::string_view l, SourceRange r = {})
  : NodeBase(r), importKind(k), local(l)
  {
  }
};

class ExportSpecifier : public NodeBase<ExportSpecifier, AstNode, NodeKind::ExportSpecifier>
{
public:
  std::string_view local;
  std::string_view exported;
  bool isTypeOnly = false;

  ExportSpecifier(std::string_view l, std::string_view e, SourceRange r = {})
  : NodeBase(r), local(l), exported(e)
  {
  }
};

/// Object literal member. Methods and accessors carry a FunctionExpr value.
class ObjectProperty : public NodeBase<ObjectProperty, AstNode, NodeKind::ObjectProperty>
{
public:
  PropertyKind propKind;
  std::string_view key;
  Expr * computedKey = nullptr;
  Expr * value = nullptr;

  ObjectProperty(PropertyKind k, std::string_view key_name, SourceRange r = {})
  : NodeBase(r), propKind(k), key(key_name)
  {
  }
};

class ClassMember : public NodeBase<ClassMember, AstNode, NodeKind::ClassMember>
{
public:
  ClassMemberKind memberKind;
  std::string_view name;
  Expr * computedKey = nullptr;
  FunctionExpr * function = nullptr;  ///< Methods, accessors, constructors
  TypeNode * type = nullptr;          ///< Property annotation
  Expr * initializer = nullptr;       ///< Property initializer
  BlockStmt * staticBody = nullptr;   ///< static { ... }
  bool isStatic = false;
  bool isReadonly = false;

  ClassMember(ClassMemberKind k, std::string_view n, SourceRange r = {})
  : NodeBase(r), memberKind(k), name(n)
  {
  }
};

/// Interface / object type member.
class PropertySignature
: public NodeBase<PropertySignature, AstNode, NodeKind::PropertySignature>
{
public:
  SignatureKind sigKind;
  std::string_view name;
  gsl::span<Param *> params;  ///< Methods, call/construct/index signatures
  TypeNode * type = nullptr;
  bool isOptional = false;
  bool isReadonly = false;

  PropertySignature(SignatureKind k, std::string_view n, SourceRange r = {})
  : NodeBase(r), sigKind(k), name(n)
  {
  }
};

class EnumMember : public NodeBase<EnumMember, AstNode, NodeKind::EnumMember>
{
public:
  std::string_view name;
  Expr * init = nullptr;

  explicit EnumMember(std::string_view n, SourceRange r = {}) : NodeBase(r), name(n) {}
};

/// case test: body, or default: body when `test` is nullptr.
class SwitchCase : public NodeBase<SwitchCase, AstNode, NodeKind::SwitchCase>
{
public:
  Expr * test;
  gsl::span<Stmt *> body;

  SwitchCase(Expr * t, gsl::span<Stmt *> b, SourceRange r = {}) : NodeBase(r), test(t), body(b) {}
};

class CatchClause : public NodeBase<CatchClause, AstNode, NodeKind::CatchClause>
{
public:
  AstNode * param = nullptr;  ///< nullptr for `catch { }`
  TypeNode * paramType = nullptr;
  BlockStmt * body;

  explicit CatchClause(BlockStmt * b, SourceRange r = {}) : NodeBase(r), body(b) {}
};

// ============================================================================
// Top-level
// ============================================================================

/// A comment recorded by the parser.
struct Comment
{
  SourceRange range;
  bool isBlock = false;
};

class Program : public NodeBase<Program, AstNode, NodeKind::Program>
{
public:
  gsl::span<Stmt *> body;
  gsl::span<Comment> comments;  ///< In source order

  explicit Program(SourceRange r = {}) : NodeBase(r) {}
};

// ============================================================================
// Helpers
// ============================================================================

[[nodiscard]] inline SourceRange get_range(const AstNode * node) noexcept
{
  return node ? node->get_range() : SourceRange{};
}

/// Strip any number of enclosing parentheses.
[[nodiscard]] inline const Expr * skip_parens(const Expr * e) noexcept
{
  while (const auto * p = dyn_cast<ParenExpr>(e)) {
    e = p->inner;
  }
  return e;
}

}  // namespace purets
