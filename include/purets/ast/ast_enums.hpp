// purets/ast/ast_enums.hpp - AST enumeration definitions
//
// This header contains all enumeration types used in the TypeScript AST,
// including node kinds, operators, and declaration attributes.
//
#pragma once

#include <cstdint>
#include <string_view>

namespace purets
{

// ============================================================================
// NodeKind - Identifies all AST node types
// ============================================================================

/**
 * Node kind enumeration for LLVM-style RTTI.
 * Nodes are grouped by category for efficient range-based classof checks.
 * Generated from ast_nodes.def.
 */
enum class NodeKind : uint8_t {
// === Expressions ===
#define AST_NODE_EXPR(Class, Kind, Snake) Kind,
#include "purets/ast/ast_nodes.def"

// === Types ===
#define AST_NODE_TYPE(Class, Kind, Snake) Kind,
#include "purets/ast/ast_nodes.def"

// === Statements ===
#define AST_NODE_STMT(Class, Kind, Snake) Kind,
#include "purets/ast/ast_nodes.def"

// === Declarations ===
#define AST_NODE_DECL(Class, Kind, Snake) Kind,
#include "purets/ast/ast_nodes.def"

// === Supporting nodes ===
#define AST_NODE_SUPPORT(Class, Kind, Snake) Kind,
#include "purets/ast/ast_nodes.def"

// === Top-level ===
#define AST_NODE_TOP(Class, Kind, Snake) Kind,
#include "purets/ast/ast_nodes.def"
};

// ============================================================================
// Declarations
// ============================================================================

/// Binding keyword of a variable statement.
enum class VarKind : uint8_t {
  Const,
  Let,
  Var,
};

/// Shape of one import binding.
enum class ImportKind : uint8_t {
  Named,      ///< import { a as b } from '...'
  Default,    ///< import a from '...'
  Namespace,  ///< import * as a from '...'
};

/// Object literal property form.
enum class PropertyKind : uint8_t {
  Init,       ///< key: value
  Shorthand,  ///< { key }
  Method,     ///< key() {}
  Getter,     ///< get key() {}
  Setter,     ///< set key(v) {}
  Spread,     ///< ...expr
};

/// Class body member form.
enum class ClassMemberKind : uint8_t {
  Constructor,
  Method,
  Getter,
  Setter,
  Property,
  IndexSignature,
  StaticBlock,
};

/// Interface / object type member form.
enum class SignatureKind : uint8_t {
  Property,
  Method,
  Index,
  Call,
  Construct,
};

enum class TypeOperatorKind : uint8_t {
  KeyOf,
  Readonly,
  Unique,
};

// ============================================================================
// Operators
// ============================================================================

enum class BinaryOp : uint8_t {
  // Arithmetic
  Add,  ///< +
  Sub,  ///< -
  Mul,  ///< *
  Div,  ///< /
  Mod,  ///< %
  Exp,  ///< **
  // Comparison
  Eq,        ///< ==
  Ne,        ///< !=
  StrictEq,  ///< ===
  StrictNe,  ///< !==
  Lt,        ///< <
  Le,        ///< <=
  Gt,        ///< >
  Ge,        ///< >=
  // Logical
  And,      ///< &&
  Or,       ///< ||
  Nullish,  ///< ??
  // Bitwise
  BitAnd,  ///< &
  BitXor,  ///< ^
  BitOr,   ///< |
  Shl,     ///< <<
  Shr,     ///< >>
  UShr,    ///< >>>
  // Relational keywords
  InstanceOf,
  In,
};

enum class UnaryOp : uint8_t {
  Not,     ///< !
  Neg,     ///< -
  Plus,    ///< +
  BitNot,  ///< ~
  TypeOf,
  Void,
  Delete,
};

enum class UpdateOp : uint8_t {
  Increment,  ///< ++
  Decrement,  ///< --
};

enum class AssignOp : uint8_t {
  Assign,            ///< =
  AddAssign,         ///< +=
  SubAssign,         ///< -=
  MulAssign,         ///< *=
  DivAssign,         ///< /=
  ModAssign,         ///< %=
  ExpAssign,         ///< **=
  ShlAssign,         ///< <<=
  ShrAssign,         ///< >>=
  UShrAssign,        ///< >>>=
  BitAndAssign,      ///< &=
  BitOrAssign,       ///< |=
  BitXorAssign,      ///< ^=
  LogicalAndAssign,  ///< &&=
  LogicalOrAssign,   ///< ||=
  NullishAssign,     ///< ??=
};

// ============================================================================
// to_string() Helper Functions
// ============================================================================

[[nodiscard]] constexpr std::string_view to_string(VarKind kind) noexcept
{
  switch (kind) {
    case VarKind::Const:
      return "const";
    case VarKind::Let:
      return "let";
    case VarKind::Var:
      return "var";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(BinaryOp op) noexcept
{
  switch (op) {
    case BinaryOp::Add:
      return "+";
    case BinaryOp::Sub:
      return "-";
    case BinaryOp::Mul:
      return "*";
    case BinaryOp::Div:
      return "/";
    case BinaryOp::Mod:
      return "%";
    case BinaryOp::Exp:
      return "**";
    case BinaryOp::Eq:
      return "==";
    case BinaryOp::Ne:
      return "!=";
    case BinaryOp::StrictEq:
      return "===";
    case BinaryOp::StrictNe:
      return "!==";
    case BinaryOp::Lt:
      return "<";
    case BinaryOp::Le:
      return "<=";
    case BinaryOp::Gt:
      return ">";
    case BinaryOp::Ge:
      return ">=";
    case BinaryOp::And:
      return "&&";
    case BinaryOp::Or:
      return "||";
    case BinaryOp::Nullish:
      return "??";
    case BinaryOp::BitAnd:
      return "&";
    case BinaryOp::BitXor:
      return "^";
    case BinaryOp::BitOr:
      return "|";
    case BinaryOp::Shl:
      return "<<";
    case BinaryOp::Shr:
      return ">>";
    case BinaryOp::UShr:
      return ">>>";
    case BinaryOp::InstanceOf:
      return "instanceof";
    case BinaryOp::In:
      return "in";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(UnaryOp op) noexcept
{
  switch (op) {
    case UnaryOp::Not:
      return "!";
    case UnaryOp::Neg:
      return "-";
    case UnaryOp::Plus:
      return "+";
    case UnaryOp::BitNot:
      return "~";
    case UnaryOp::TypeOf:
      return "typeof";
    case UnaryOp::Void:
      return "void";
    case UnaryOp::Delete:
      return "delete";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AssignOp op) noexcept
{
  switch (op) {
    case AssignOp::Assign:
      return "=";
    case AssignOp::AddAssign:
      return "+=";
    case AssignOp::SubAssign:
      return "-=";
    case AssignOp::MulAssign:
      return "*=";
    case AssignOp::DivAssign:
      return "/=";
    case AssignOp::ModAssign:
      return "%=";
    case AssignOp::ExpAssign:
      return "**=";
    case AssignOp::ShlAssign:
      return "<<=";
    case AssignOp::ShrAssign:
      return ">>=";
    case AssignOp::UShrAssign:
      return ">>>=";
    case AssignOp::BitAndAssign:
      return "&=";
    case AssignOp::BitOrAssign:
      return "|=";
    case AssignOp::BitXorAssign:
      return "^=";
    case AssignOp::LogicalAndAssign:
      return "&&=";
    case AssignOp::LogicalOrAssign:
      return "||=";
    case AssignOp::NullishAssign:
      return "??=";
  }
  return "";
}

// ============================================================================
// NodeKind Range Helpers
// ============================================================================

namespace detail
{

inline constexpr NodeKind k_first_expr_kind = NodeKind::Identifier;
inline constexpr NodeKind k_last_expr_kind = NodeKind::MissingExpr;

inline constexpr NodeKind k_first_type_kind = NodeKind::TypeReference;
inline constexpr NodeKind k_last_type_kind = NodeKind::TypePredicate;

inline constexpr NodeKind k_first_stmt_kind = NodeKind::BlockStmt;
inline constexpr NodeKind k_last_stmt_kind = NodeKind::EmptyStmt;

inline constexpr NodeKind k_first_decl_kind = NodeKind::VarDecl;
inline constexpr NodeKind k_last_decl_kind = NodeKind::ExportAllDecl;

}  // namespace detail

/// Check if a NodeKind is an expression
[[nodiscard]] constexpr bool is_expr_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_expr_kind && kind <= detail::k_last_expr_kind;
}

/// Check if a NodeKind is a type
[[nodiscard]] constexpr bool is_type_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_type_kind && kind <= detail::k_last_type_kind;
}

/// Check if a NodeKind is a declaration
[[nodiscard]] constexpr bool is_decl_kind(NodeKind kind) noexcept
{
  return kind >= detail::k_first_decl_kind && kind <= detail::k_last_decl_kind;
}

/// Check if a NodeKind is a statement (declarations are statements)
[[nodiscard]] constexpr bool is_stmt_kind(NodeKind kind) noexcept
{
  return (kind >= detail::k_first_stmt_kind && kind <= detail::k_last_stmt_kind) ||
         is_decl_kind(kind);
}

}  // namespace purets
