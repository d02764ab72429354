// purets/ast/visitor.hpp - CRTP Visitor pattern for AST traversal
//
// This header provides a visitor pattern implementation using CRTP
// (Curiously Recurring Template Pattern) for type-safe AST traversal.
//
#pragma once

#include <type_traits>

#include "purets/ast/ast.hpp"
#include "purets/ast/ast_enums.hpp"
#include "purets/basic/casting.hpp"

namespace purets
{

// ============================================================================
// Type Traits for Const-Aware Node Pointer
// ============================================================================

namespace detail
{

/// Helper to propagate const from NodePtrT to derived node types
template <typename NodePtrT, typename DerivedNode>
struct PropagateConst
{
  using type = std::conditional_t<
    std::is_const_v<std::remove_pointer_t<NodePtrT>>, const DerivedNode *, DerivedNode *>;
};

template <typename NodePtrT, typename DerivedNode>
using propagate_const_t = typename PropagateConst<NodePtrT, DerivedNode>::type;

}  // namespace detail

// ============================================================================
// AstVisitor - CRTP Base Class
// ============================================================================

/**
 * CRTP-based visitor for AST traversal.
 *
 * The derived class implements visit methods for the node types it cares
 * about; every other node falls through to the category method
 * (visit_expr, visit_type_node, visit_stmt, visit_decl) and then visit_node.
 *
 * Usage:
 * @code
 *   class CallCounter : public ConstAstVisitor<CallCounter, void> {
 *   public:
 *     void visit_call_expr(const CallExpr * node) { ++count; }
 *     int count = 0;
 *   };
 * @endcode
 *
 * @tparam Derived The derived visitor class
 * @tparam ReturnType The return type of visit methods (default: void)
 * @tparam NodePtrT The node pointer type (AstNode* or const AstNode*)
 */
template <typename Derived, typename ReturnType = void, typename NodePtrT = AstNode *>
class AstVisitor
{
public:
  using node_ptr_type = NodePtrT;

  [[nodiscard]] Derived & get_derived() { return static_cast<Derived &>(*this); }
  [[nodiscard]] const Derived & get_derived() const { return static_cast<const Derived &>(*this); }

  // ===========================================================================
  // Main dispatch method
  // ===========================================================================

  ReturnType visit(NodePtrT node)
  {
    if (!node) {
      return ReturnType();
    }

    switch (node->kind) {
#define AST_NODE_EXPR(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TYPE(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_STMT(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_DECL(Class, Kind, Snake) \
  case NodeKind::Kind:                    \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_SUPPORT(Class, Kind, Snake) \
  case NodeKind::Kind:                       \
    return get_derived().visit_##Snake(cast<Class>(node));
#define AST_NODE_TOP(Class, Kind, Snake) \
  case NodeKind::Kind:                   \
    return get_derived().visit_##Snake(cast<Class>(node));
#include "purets/ast/ast_nodes.def"
    }

    // Unreachable, but silences compiler warning
    return ReturnType();
  }

  // ===========================================================================
  // Default visit methods (generated from X-Macro)
  // ===========================================================================

#define AST_NODE_EXPR(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_expr(node);                                  \
  }
#define AST_NODE_TYPE(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_type_node(node);                             \
  }
#define AST_NODE_STMT(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_stmt(node);                                  \
  }
#define AST_NODE_DECL(Class, Kind, Snake)                                   \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_decl(node);                                  \
  }
#define AST_NODE_SUPPORT(Class, Kind, Snake)                                \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#define AST_NODE_TOP(Class, Kind, Snake)                                    \
  ReturnType visit_##Snake(detail::propagate_const_t<NodePtrT, Class> node) \
  {                                                                         \
    return get_derived().visit_node(node);                                  \
  }
#include "purets/ast/ast_nodes.def"

  // ===========================================================================
  // Category-level visit methods (for grouping behavior)
  // ===========================================================================

  ReturnType visit_expr(detail::propagate_const_t<NodePtrT, Expr> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_type_node(detail::propagate_const_t<NodePtrT, TypeNode> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_stmt(detail::propagate_const_t<NodePtrT, Stmt> node)
  {
    return get_derived().visit_node(node);
  }
  ReturnType visit_decl(detail::propagate_const_t<NodePtrT, Decl> node)
  {
    return get_derived().visit_node(node);
  }

  /// Base case - does nothing by default
  ReturnType visit_node(NodePtrT /*node*/) { return ReturnType(); }
};

/// Alias for const AST traversal
template <typename Derived, typename ReturnType = void>
using ConstAstVisitor = AstVisitor<Derived, ReturnType, const AstNode *>;

// ============================================================================
// RecursiveAstVisitor - Traverses children automatically
// ============================================================================

/**
 * A visitor that automatically traverses child nodes in source order.
 *
 * Override specific visit methods to customize behavior. Call the base
 * implementation to continue traversal, or skip it to prune the subtree.
 * Returning false stops the whole traversal.
 *
 * @tparam Derived The derived visitor class
 * @tparam NodePtrT The node pointer type (default: AstNode*)
 */
template <typename Derived, typename NodePtrT = AstNode *>
class RecursiveAstVisitor : public AstVisitor<Derived, bool, NodePtrT>
{
  using Base = AstVisitor<Derived, bool, NodePtrT>;

public:
  using Base::get_derived;

  template <typename T>
  using NodePtr = detail::propagate_const_t<NodePtrT, T>;

  /// Visit an optional child; absent children do not stop traversal.
  bool traverse(NodePtrT node) { return node == nullptr || get_derived().visit(node); }

  template <typename Range>
  bool traverse_all(const Range & nodes)
  {
    for (auto * n : nodes) {
      if (!traverse(n)) return false;
    }
    return true;
  }

  // ===========================================================================
  // Expressions
  // ===========================================================================

  bool visit_template_literal_expr(NodePtr<TemplateLiteralExpr> node)
  {
    return traverse(node->tag) && traverse_all(node->expressions);
  }

  bool visit_array_literal_expr(NodePtr<ArrayLiteralExpr> node)
  {
    return traverse_all(node->elements);
  }

  bool visit_object_literal_expr(NodePtr<ObjectLiteralExpr> node)
  {
    return traverse_all(node->properties);
  }

  bool visit_function_expr(NodePtr<FunctionExpr> node)
  {
    return traverse_all(node->params) && traverse(node->returnType) && traverse(node->body);
  }

  bool visit_arrow_function_expr(NodePtr<ArrowFunctionExpr> node)
  {
    return traverse_all(node->params) && traverse(node->returnType) && traverse(node->body);
  }

  bool visit_class_expr(NodePtr<ClassExpr> node)
  {
    return traverse(node->superClass) && traverse_all(node->members);
  }

  bool visit_call_expr(NodePtr<CallExpr> node)
  {
    return traverse(node->callee) && traverse_all(node->args);
  }

  bool visit_new_expr(NodePtr<NewExpr> node)
  {
    return traverse(node->callee) && traverse_all(node->args);
  }

  bool visit_member_expr(NodePtr<MemberExpr> node) { return traverse(node->object); }

  bool visit_index_expr(NodePtr<IndexExpr> node)
  {
    return traverse(node->object) && traverse(node->index);
  }

  bool visit_assign_expr(NodePtr<AssignExpr> node)
  {
    return traverse(node->target) && traverse(node->value);
  }

  bool visit_unary_expr(NodePtr<UnaryExpr> node) { return traverse(node->operand); }

  bool visit_update_expr(NodePtr<UpdateExpr> node) { return traverse(node->operand); }

  bool visit_binary_expr(NodePtr<BinaryExpr> node)
  {
    return traverse(node->lhs) && traverse(node->rhs);
  }

  bool visit_conditional_expr(NodePtr<ConditionalExpr> node)
  {
    return traverse(node->test) && traverse(node->consequent) && traverse(node->alternate);
  }

  bool visit_as_expr(NodePtr<AsExpr> node) { return traverse(node->expr) && traverse(node->type); }

  bool visit_type_assertion_expr(NodePtr<TypeAssertionExpr> node)
  {
    return traverse(node->type) && traverse(node->expr);
  }

  bool visit_non_null_expr(NodePtr<NonNullExpr> node) { return traverse(node->expr); }

  bool visit_paren_expr(NodePtr<ParenExpr> node) { return traverse(node->inner); }

  bool visit_await_expr(NodePtr<AwaitExpr> node) { return traverse(node->argument); }

  bool visit_yield_expr(NodePtr<YieldExpr> node) { return traverse(node->argument); }

  bool visit_spread_expr(NodePtr<SpreadExpr> node) { return traverse(node->argument); }

  bool visit_sequence_expr(NodePtr<SequenceExpr> node) { return traverse_all(node->expressions); }

  // Leaf expressions
  bool visit_identifier_expr(NodePtr<IdentifierExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_number_literal_expr(NodePtr<NumberLiteralExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_string_literal_expr(NodePtr<StringLiteralExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_bool_literal_expr(NodePtr<BoolLiteralExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_null_literal_expr(NodePtr<NullLiteralExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_regex_literal_expr(NodePtr<RegexLiteralExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_this_expr(NodePtr<ThisExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_super_expr(NodePtr<SuperExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_meta_property_expr(NodePtr<MetaPropertyExpr> node)
  {
    (void)node;
    return true;
  }
  bool visit_missing_expr(NodePtr<MissingExpr> node)
  {
    (void)node;
    return true;
  }

  // ===========================================================================
  // Types
  // ===========================================================================

  bool visit_type_reference(NodePtr<TypeReference> node) { return traverse_all(node->typeArgs); }

  bool visit_array_type(NodePtr<ArrayType> node) { return traverse(node->elementType); }

  bool visit_tuple_type(NodePtr<TupleType> node) { return traverse_all(node->elements); }

  bool visit_union_type(NodePtr<UnionType> node) { return traverse_all(node->types); }

  bool visit_intersection_type(NodePtr<IntersectionType> node)
  {
    return traverse_all(node->types);
  }

  bool visit_function_type(NodePtr<FunctionType> node)
  {
    return traverse_all(node->params) && traverse(node->returnType);
  }

  bool visit_object_type(NodePtr<ObjectType> node) { return traverse_all(node->members); }

  bool visit_type_operator(NodePtr<TypeOperator> node) { return traverse(node->operand); }

  bool visit_indexed_access_type(NodePtr<IndexedAccessType> node)
  {
    return traverse(node->object) && traverse(node->index);
  }

  bool visit_conditional_type(NodePtr<ConditionalType> node)
  {
    return traverse(node->checkType) && traverse(node->extendsType) &&
           traverse(node->trueType) && traverse(node->falseType);
  }

  bool visit_mapped_type(NodePtr<MappedType> node)
  {
    return traverse(node->constraint) && traverse(node->nameType) && traverse(node->valueType);
  }

  bool visit_type_predicate(NodePtr<TypePredicate> node) { return traverse(node->type); }

  bool visit_literal_type(NodePtr<LiteralType> node)
  {
    (void)node;
    return true;
  }
  bool visit_type_query(NodePtr<TypeQuery> node)
  {
    (void)node;
    return true;
  }
  bool visit_infer_type(NodePtr<InferType> node)
  {
    (void)node;
    return true;
  }

  // ===========================================================================
  // Statements
  // ===========================================================================

  bool visit_block_stmt(NodePtr<BlockStmt> node) { return traverse_all(node->body); }

  bool visit_expr_stmt(NodePtr<ExprStmt> node) { return traverse(node->expr); }

  bool visit_if_stmt(NodePtr<IfStmt> node)
  {
    return traverse(node->condition) && traverse(node->thenBranch) && traverse(node->elseBranch);
  }

  bool visit_while_stmt(NodePtr<WhileStmt> node)
  {
    return traverse(node->condition) && traverse(node->body);
  }

  bool visit_do_while_stmt(NodePtr<DoWhileStmt> node)
  {
    return traverse(node->body) && traverse(node->condition);
  }

  bool visit_for_stmt(NodePtr<ForStmt> node)
  {
    return traverse(node->init) && traverse(node->test) && traverse(node->update) &&
           traverse(node->body);
  }

  bool visit_for_in_stmt(NodePtr<ForInStmt> node)
  {
    return traverse(node->left) && traverse(node->right) && traverse(node->body);
  }

  bool visit_for_of_stmt(NodePtr<ForOfStmt> node)
  {
    return traverse(node->left) && traverse(node->right) && traverse(node->body);
  }

  bool visit_return_stmt(NodePtr<ReturnStmt> node) { return traverse(node->value); }

  bool visit_throw_stmt(NodePtr<ThrowStmt> node) { return traverse(node->value); }

  bool visit_try_stmt(NodePtr<TryStmt> node)
  {
    return traverse(node->block) && traverse(node->handler) && traverse(node->finalizer);
  }

  bool visit_switch_stmt(NodePtr<SwitchStmt> node)
  {
    return traverse(node->discriminant) && traverse_all(node->cases);
  }

  bool visit_labeled_stmt(NodePtr<LabeledStmt> node) { return traverse(node->body); }

  bool visit_break_stmt(NodePtr<BreakStmt> node)
  {
    (void)node;
    return true;
  }
  bool visit_continue_stmt(NodePtr<ContinueStmt> node)
  {
    (void)node;
    return true;
  }
  bool visit_empty_stmt(NodePtr<EmptyStmt> node)
  {
    (void)node;
    return true;
  }

  // ===========================================================================
  // Declarations
  // ===========================================================================

  bool visit_var_decl(NodePtr<VarDecl> node) { return traverse_all(node->declarators); }

  bool visit_function_decl(NodePtr<FunctionDecl> node)
  {
    return traverse_all(node->params) && traverse(node->returnType) && traverse(node->body);
  }

  bool visit_class_decl(NodePtr<ClassDecl> node)
  {
    return traverse(node->superClass) && traverse_all(node->implements) &&
           traverse_all(node->members);
  }

  bool visit_interface_decl(NodePtr<InterfaceDecl> node)
  {
    return traverse_all(node->extends) && traverse_all(node->members);
  }

  bool visit_type_alias_decl(NodePtr<TypeAliasDecl> node) { return traverse(node->aliasedType); }

  bool visit_enum_decl(NodePtr<EnumDecl> node) { return traverse_all(node->members); }

  bool visit_module_decl(NodePtr<ModuleDecl> node) { return traverse_all(node->body); }

  bool visit_import_decl(NodePtr<ImportDecl> node) { return traverse_all(node->specifiers); }

  bool visit_export_named_decl(NodePtr<ExportNamedDecl> node)
  {
    return traverse(node->declaration) && traverse_all(node->specifiers);
  }

  bool visit_export_default_decl(NodePtr<ExportDefaultDecl> node)
  {
    return traverse(node->declaration);
  }

  bool visit_export_all_decl(NodePtr<ExportAllDecl> node)
  {
    (void)node;
    return true;
  }

  // ===========================================================================
  // Supporting nodes
  // ===========================================================================

  bool visit_var_declarator(NodePtr<VarDeclarator> node)
  {
    return traverse(node->binding) && traverse(node->type) && traverse(node->init);
  }

  bool visit_param(NodePtr<Param> node)
  {
    return traverse(node->binding) && traverse(node->type) && traverse(node->defaultValue);
  }

  bool visit_object_pattern(NodePtr<ObjectPattern> node) { return traverse_all(node->properties); }

  bool visit_pattern_property(NodePtr<PatternProperty> node)
  {
    return traverse(node->computedKey) && traverse(node->value);
  }

  bool visit_array_pattern(NodePtr<ArrayPattern> node) { return traverse_all(node->elements); }

  bool visit_assign_pattern(NodePtr<AssignPattern> node)
  {
    return traverse(node->target) && traverse(node->defaultValue);
  }

  bool visit_rest_element(NodePtr<RestElement> node) { return traverse(node->target); }

  bool visit_object_property(NodePtr<ObjectProperty> node)
  {
    return traverse(node->computedKey) && traverse(node->value);
  }

  bool visit_class_member(NodePtr<ClassMember> node)
  {
    return traverse(node->computedKey) && traverse(node->function) && traverse(node->type) &&
           traverse(node->initializer) && traverse(node->staticBody);
  }

  bool visit_property_signature(NodePtr<PropertySignature> node)
  {
    return traverse_all(node->params) && traverse(node->type);
  }

  bool visit_enum_member(NodePtr<EnumMember> node) { return traverse(node->init); }

  bool visit_switch_case(NodePtr<SwitchCase> node)
  {
    return traverse(node->test) && traverse_all(node->body);
  }

  bool visit_catch_clause(NodePtr<CatchClause> node)
  {
    return traverse(node->param) && traverse(node->paramType) && traverse(node->body);
  }

  bool visit_binding_ident(NodePtr<BindingIdent> node)
  {
    (void)node;
    return true;
  }
  bool visit_import_specifier(NodePtr<ImportSpecifier> node)
  {
    (void)node;
    return true;
  }
  bool visit_export_specifier(NodePtr<ExportSpecifier> node)
  {
    (void)node;
    return true;
  }

  // ===========================================================================
  // Top-level
  // ===========================================================================

  bool visit_program(NodePtr<Program> node) { return traverse_all(node->body); }
};

/// Alias for const recursive AST traversal
template <typename Derived>
using ConstRecursiveAstVisitor = RecursiveAstVisitor<Derived, const AstNode *>;

}  // namespace purets
