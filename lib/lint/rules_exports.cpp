// purets/lint/rules_exports.cpp - Module structure: exports, top level, post-pass
#include <set>

#include <fmt/format.h>

#include "purets/lint/ast_queries.hpp"
#include "purets/lint/jsdoc.hpp"
#include "purets/lint/rule_ids.hpp"
#include "purets/lint/rules.hpp"

namespace purets::lint
{

namespace
{

using NameSet = std::set<std::string_view, std::less<>>;

bool starts_with(std::string_view s, std::string_view prefix)
{
  return s.substr(0, prefix.size()) == prefix;
}

bool ends_with(std::string_view s, std::string_view suffix)
{
  return s.size() >= suffix.size() && s.substr(s.size() - suffix.size()) == suffix;
}

/// Names of top-level functions, declared or bound to a const.
NameSet collect_function_names(const Program & program)
{
  NameSet names;
  for (const Stmt * stmt : program.body) {
    if (const auto * exp = dyn_cast<ExportNamedDecl>(stmt); exp && exp->declaration) {
      stmt = exp->declaration;
    }
    if (const auto * fn = dyn_cast<FunctionDecl>(stmt)) {
      names.insert(fn->name);
    } else if (const auto * var = dyn_cast<VarDecl>(stmt)) {
      for (const VarDeclarator * d : var->declarators) {
        if (is_function_like(d->init)) names.insert(binding_name(d->binding));
      }
    }
  }
  return names;
}

bool has_doc_comment(uint32_t offset, const RuleContext & ctx)
{
  return find_doc_comment(ctx.source.get_content(), ctx.program.comments, offset).has_value();
}

void require_doc(
  std::string_view what, std::string_view name, uint32_t offset, SourceRange range,
  RuleContext & ctx)
{
  if (has_doc_comment(offset, ctx)) return;
  ctx.report(
    rule::k_export_requires_jsdoc,
    fmt::format("Exported {} '{}' must have a JSDoc comment", what, name), range);
}

void add_export(std::string_view name, bool is_function, SourceRange range, RuleContext & ctx)
{
  ctx.state.exported_names.insert(name);
  (is_function ? ctx.state.exported_functions : ctx.state.exported_other).push_back({name, range});
}

void collect_import(const ImportDecl * node, RuleContext & ctx)
{
  const bool from_process = node->source == "process" || node->source == "node:process";
  for (const ImportSpecifier * spec : node->specifiers) {
    ctx.state.imported_bindings.push_back({spec->local, spec->get_range()});
    if (from_process) ctx.state.imported_process_names.insert(spec->local);
  }
}

void collect_exported_var(const ExportNamedDecl * exp, const VarDecl * var, RuleContext & ctx)
{
  if (var->varKind == VarKind::Let) {
    ctx.report(
      rule::k_export_const_type_required,
      "Exported 'let' declarations are not allowed. Use 'const' instead", exp->get_range());
  }

  for (const VarDeclarator * d : var->declarators) {
    const std::string_view name = binding_name(d->binding);
    if (name.empty()) continue;

    const bool is_function = is_function_like(d->init);
    if (var->varKind == VarKind::Const && !d->type && !is_function) {
      ctx.report(
        rule::k_export_const_type_required,
        fmt::format("Exported const '{}' requires type annotation", name), d->get_range());
    }

    add_export(name, is_function, exp->get_range(), ctx);
    if (is_function) {
      require_doc("function", name, exp->get_range().get_begin().get_offset(), exp->get_range(), ctx);
    }
  }
}

void collect_exported_declaration(const ExportNamedDecl * exp, RuleContext & ctx)
{
  const Stmt * decl = exp->declaration;
  const SourceRange range = exp->get_range();
  const uint32_t offset = range.get_begin().get_offset();

  if (const auto * fn = dyn_cast<FunctionDecl>(decl)) {
    // Overload signatures have no body; the implementation is the export.
    if (!fn->body) {
      ctx.state.exported_names.insert(fn->name);
      if (has_doc_comment(offset, ctx)) ctx.state.documented_overloads.insert(fn->name);
      return;
    }
    add_export(fn->name, true, range, ctx);
    if (ctx.state.documented_overloads.count(fn->name) == 0) {
      require_doc("function", fn->name, offset, range, ctx);
    }
  } else if (const auto * var = dyn_cast<VarDecl>(decl)) {
    collect_exported_var(exp, var, ctx);
  } else if (const auto * cls = dyn_cast<ClassDecl>(decl)) {
    add_export(cls->name, false, range, ctx);
    if (ctx.traits.is_error_file && ends_with(ctx.traits.file_name, "Error.ts")) {
      require_doc("error class", cls->name, offset, range, ctx);
    }
  } else if (const auto * en = dyn_cast<EnumDecl>(decl)) {
    add_export(en->name, false, range, ctx);
  } else if (const auto * mod = dyn_cast<ModuleDecl>(decl)) {
    add_export(mod->name, false, range, ctx);
  } else if (const auto * alias = dyn_cast<TypeAliasDecl>(decl)) {
    ctx.state.exported_names.insert(alias->name);
    if (ctx.traits.is_types_file) require_doc("type", alias->name, offset, range, ctx);
  } else if (const auto * iface = dyn_cast<InterfaceDecl>(decl)) {
    ctx.state.exported_names.insert(iface->name);
    if (ctx.traits.is_types_file) require_doc("interface", iface->name, offset, range, ctx);
  }
}

void collect_export_list(
  const ExportNamedDecl * exp, const NameSet & functions, RuleContext & ctx)
{
  if (exp->hasSource) {
    if (!ctx.traits.is_entry_point) {
      ctx.report(
        rule::k_no_reexports, fmt::format("Re-exports from '{}' are not allowed", exp->source),
        exp->get_range());
    }
    check_module_source(exp->source, exp->get_range(), ctx);
    return;
  }

  for (const ExportSpecifier * spec : exp->specifiers) {
    ctx.state.exported_names.insert(spec->local);
    if (exp->isTypeOnly || spec->isTypeOnly) continue;
    ctx.state.used_names.insert(spec->local);
    add_export(spec->exported, functions.count(spec->local) > 0, exp->get_range(), ctx);
  }
}

void collect_default_export(
  const ExportDefaultDecl * exp, const NameSet & functions, RuleContext & ctx)
{
  const SourceRange range = exp->get_range();
  const AstNode * decl = exp->declaration;

  if (const auto * fn = dyn_cast<FunctionDecl>(decl)) {
    const std::string_view name = fn->name.empty() ? std::string_view("default") : fn->name;
    add_export(name, true, range, ctx);
    require_doc("function", name, range.get_begin().get_offset(), range, ctx);
    return;
  }
  if (const auto * e = dyn_cast<Expr>(decl)) {
    if (is_function_like(e)) {
      add_export("default", true, range, ctx);
      require_doc("function", "default", range.get_begin().get_offset(), range, ctx);
      return;
    }
    if (const std::string_view name = identifier_name(e); !name.empty()) {
      add_export(name, functions.count(name) > 0, range, ctx);
      return;
    }
  }
  add_export("default", false, range, ctx);
}

void collect_export_all(const ExportAllDecl * exp, RuleContext & ctx)
{
  if (ctx.traits.is_entry_point) {
    ctx.report(
      rule::k_no_reexports,
      fmt::format(
        "Namespace re-exports are not allowed in entry points. Use named exports: export {{ name "
        "}} from '{}'",
        exp->source),
      exp->get_range());
  } else {
    ctx.report(
      rule::k_no_reexports, fmt::format("Re-exports from '{}' are not allowed", exp->source),
      exp->get_range());
  }
  check_module_source(exp->source, exp->get_range(), ctx);
}

// ============================================================================
// Top-level side effects
// ============================================================================

/**
 * Conditions that only narrow types: `typeof x === ...`, `x instanceof T`,
 * `Array.isArray(x)` and `isFoo(x)` predicates, combined with `!`, `&&`
 * and `||`.
 */
bool is_type_guard(const Expr * test)
{
  test = skip_parens(test);
  if (const auto * un = dyn_cast<UnaryExpr>(test)) {
    return un->op == UnaryOp::Not && is_type_guard(un->operand);
  }
  if (const auto * bin = dyn_cast<BinaryExpr>(test)) {
    switch (bin->op) {
      case BinaryOp::And:
      case BinaryOp::Or:
        return is_type_guard(bin->lhs) && is_type_guard(bin->rhs);
      case BinaryOp::InstanceOf:
        return true;
      case BinaryOp::Eq:
      case BinaryOp::Ne:
      case BinaryOp::StrictEq:
      case BinaryOp::StrictNe: {
        const auto is_typeof = [](const Expr * e) {
          const auto * u = dyn_cast<UnaryExpr>(skip_parens(e));
          return u && u->op == UnaryOp::TypeOf;
        };
        return is_typeof(bin->lhs) || is_typeof(bin->rhs);
      }
      default:
        return false;
    }
  }
  if (const auto * call = dyn_cast<CallExpr>(test)) {
    if (is_member_of(call->callee, "Array", "isArray")) return true;
    const std::string_view name = identifier_name(call->callee);
    return name.size() > 2 && starts_with(name, "is");
  }
  return false;
}

bool is_test_registration(const CallExpr * call, const RuleContext & ctx)
{
  if (!ctx.traits.test_runner) return false;

  const Expr * callee = skip_parens(call->callee);
  // `describe.each(...)` and `it.skip(...)` register like their base.
  std::string_view base = identifier_name(callee);
  std::string dotted;
  if (const auto * m = dyn_cast<MemberExpr>(callee)) {
    base = identifier_name(m->object);
    dotted = fmt::format("{}.{}", base, m->property);
  }

  for (std::string_view fn : test_functions(*ctx.traits.test_runner)) {
    if (fn == base || fn == dotted) return true;
  }
  return false;
}

bool is_allowed_top_level_call(const CallExpr * call, const RuleContext & ctx)
{
  if (is_function_like(call->callee)) return true;  // IIFE
  if (identifier_name(call->callee) == "main" &&
      (ctx.traits.is_entry_point || ctx.traits.is_main_entry)) {
    return true;
  }
  return is_test_registration(call, ctx);
}

void report_side_effect(std::string_view what, const Stmt * stmt, RuleContext & ctx)
{
  ctx.report(
    rule::k_no_top_level_side_effects,
    fmt::format("Top-level {} are not allowed (side effects)", what), stmt->get_range());
}

}  // namespace

// ============================================================================
// Pre-pass
// ============================================================================

void collect_top_level(const Program & program, RuleContext & ctx)
{
  const NameSet functions = collect_function_names(program);

  for (const Stmt * stmt : program.body) {
    if (const auto * imp = dyn_cast<ImportDecl>(stmt)) {
      collect_import(imp, ctx);
    } else if (const auto * exp = dyn_cast<ExportNamedDecl>(stmt)) {
      if (exp->declaration) {
        collect_exported_declaration(exp, ctx);
      } else {
        collect_export_list(exp, functions, ctx);
      }
    } else if (const auto * def = dyn_cast<ExportDefaultDecl>(stmt)) {
      collect_default_export(def, functions, ctx);
    } else if (const auto * all = dyn_cast<ExportAllDecl>(stmt)) {
      collect_export_all(all, ctx);
    }
  }
}

void check_top_level_statement(const Stmt * stmt, RuleContext & ctx)
{
  if (ctx.traits.is_test_file) return;

  if (const auto * es = dyn_cast<ExprStmt>(stmt)) {
    const Expr * e = skip_parens(es->expr);
    if (const auto * aw = dyn_cast<AwaitExpr>(e)) e = skip_parens(aw->argument);

    if (const auto * call = dyn_cast<CallExpr>(e)) {
      if (!is_allowed_top_level_call(call, ctx)) report_side_effect("function calls", stmt, ctx);
    } else if (isa<AssignExpr>(e)) {
      report_side_effect("assignments", stmt, ctx);
    } else if (isa<UpdateExpr>(e)) {
      report_side_effect("update expressions", stmt, ctx);
    } else if (isa<NewExpr>(e)) {
      report_side_effect("new expressions", stmt, ctx);
    }
    return;
  }

  switch (stmt->get_kind()) {
    case NodeKind::ForStmt:
    case NodeKind::ForInStmt:
    case NodeKind::ForOfStmt:
    case NodeKind::WhileStmt:
    case NodeKind::DoWhileStmt:
      report_side_effect("loops", stmt, ctx);
      break;
    case NodeKind::IfStmt: {
      const Expr * test = skip_parens(cast<IfStmt>(stmt)->condition);
      // Literal conditions are reported as constant conditions.
      if (!isa<BoolLiteralExpr>(test) && !is_type_guard(test)) {
        report_side_effect("if statements", stmt, ctx);
      }
      break;
    }
    default:
      break;
  }
}

// ============================================================================
// Post-pass
// ============================================================================

void report_one_public_function(RuleContext & ctx)
{
  for (const NamedRange & other : ctx.state.exported_other) {
    ctx.report(
      rule::k_one_public_function,
      fmt::format("Only functions can be exported. Found non-function export: {}", other.name),
      other.range);
  }

  const auto & functions = ctx.state.exported_functions;
  for (size_t i = 1; i < functions.size(); ++i) {
    ctx.report(
      rule::k_one_public_function,
      fmt::format(
        "Only one function can be exported per file. Found additional export: {}",
        functions[i].name),
      functions[i].range);
  }
}

void report_unused_variables(RuleContext & ctx)
{
  const VisitorState & state = ctx.state;
  const auto is_unused = [&](std::string_view name) {
    return !starts_with(name, "_") && state.exported_names.count(name) == 0 &&
           state.used_names.count(name) == 0;
  };

  for (const NamedRange & var : state.declared_vars) {
    if (is_unused(var.name)) {
      ctx.report(
        rule::k_no_unused_variables,
        fmt::format("Variable '{}' is declared but never used", var.name), var.range);
    }
  }
  for (const NamedRange & imp : state.imported_bindings) {
    if (is_unused(imp.name)) {
      ctx.report(
        rule::k_no_unused_variables, fmt::format("Import '{}' is declared but never used", imp.name),
        imp.range);
    }
  }
}

void report_readonly_arrays(RuleContext & ctx)
{
  const VisitorState & state = ctx.state;
  for (const NamedRange & array : state.array_variables) {
    if (state.mutated_arrays.count(array.name) > 0) continue;
    if (state.readonly_arrays.count(array.name) > 0) continue;
    ctx.report(
      rule::k_prefer_readonly_array,
      fmt::format(
        "Array '{}' is never mutated. Consider using 'ReadonlyArray' or 'readonly' modifier",
        array.name),
      array.range);
  }
}

void report_unused_allow_directives(RuleContext & ctx)
{
  for (Feature f : k_all_features) {
    if (ctx.allowed.has(f) && !ctx.used.has(f)) {
      ctx.report(
        rule::k_allow_directives, fmt::format("Unused '@allow {}' directive", to_string(f)),
        SourceRange(0, 0));
    }
  }
}

}  // namespace purets::lint
