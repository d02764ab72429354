// purets/lint/path_policy.cpp - Directory conventions and filename matching
#include "purets/lint/path_policy.hpp"

#include <algorithm>
#include <array>
#include <vector>

#include <fmt/format.h>

#include "purets/lint/ast_queries.hpp"
#include "purets/lint/rule_ids.hpp"

namespace purets::lint
{

namespace
{

/// Top-level calls that mark a file as containing tests.
constexpr std::array<std::string_view, 4> k_test_calls = {"describe", "it", "test", "expect"};

const SourceRange k_file_start(0, 0);

void report(std::string message, SourceRange range, RuleContext & ctx)
{
  ctx.report(rule::k_path_based_restrictions, std::move(message), range);
}

/// The declaration behind `export <decl>`, or the statement itself.
const Stmt * unwrap_export(const Stmt * stmt)
{
  if (const auto * exp = dyn_cast<ExportNamedDecl>(stmt); exp && exp->declaration) {
    return exp->declaration;
  }
  return stmt;
}

/// An `async` function or arrow bound to a declarator.
bool is_async_function(const Expr * init)
{
  init = skip_parens(init);
  if (const auto * arrow = dyn_cast<ArrowFunctionExpr>(init)) return arrow->isAsync;
  if (const auto * fn = dyn_cast<FunctionExpr>(init)) return fn->isAsync;
  return false;
}

// ============================================================================
// Test files
// ============================================================================

bool has_test_code(const Program & program)
{
  for (const Stmt * stmt : program.body) {
    const auto * es = dyn_cast<ExprStmt>(stmt);
    const auto * call = es ? dyn_cast<CallExpr>(skip_parens(es->expr)) : nullptr;
    if (!call) continue;
    const std::string_view callee = identifier_name(call->callee);
    if (std::find(k_test_calls.begin(), k_test_calls.end(), callee) != k_test_calls.end()) {
      return true;
    }
  }
  return false;
}

void check_runner_imports(const Program & program, TestRunner runner, RuleContext & ctx)
{
  bool found_runner = false;
  std::string_view other_runner;

  for (const Stmt * stmt : program.body) {
    const auto * imp = dyn_cast<ImportDecl>(stmt);
    if (!imp) continue;
    if (matches_import(runner, imp->source)) found_runner = true;
    for (TestRunner other : k_all_test_runners) {
      if (other != runner && matches_import(other, imp->source)) {
        other_runner = to_string(other);
        break;
      }
    }
  }

  if (!other_runner.empty()) {
    report(
      fmt::format(
        "Test file should use '{}' but found imports for '{}'", to_string(runner), other_runner),
      k_file_start, ctx);
  } else if (!found_runner && has_test_code(program)) {
    report(
      fmt::format("Test file should import from '{}' test runner", to_string(runner)),
      k_file_start, ctx);
  }
}

bool imports_tested_function(const ImportDecl * imp, std::string_view tested)
{
  for (const ImportSpecifier * spec : imp->specifiers) {
    switch (spec->importKind) {
      case ImportKind::Named:
        if (spec->imported == tested) return true;
        break;
      case ImportKind::Default:
        if (imp->source.find(tested) != std::string_view::npos) return true;
        break;
      default:
        break;
    }
  }
  return false;
}

void check_test_file(const Program & program, RuleContext & ctx)
{
  if (ctx.traits.test_runner) check_runner_imports(program, *ctx.traits.test_runner, ctx);

  const std::string_view tested = ctx.traits.tested_name();
  if (tested.empty()) return;

  bool has_imports = false;
  for (const Stmt * stmt : program.body) {
    const auto * imp = dyn_cast<ImportDecl>(stmt);
    if (!imp) continue;
    has_imports = true;
    if (imports_tested_function(imp, tested)) return;
  }

  if (!has_imports) {
    report(
      fmt::format("Test file '{}' must have at least one import statement", ctx.traits.file_name),
      k_file_start, ctx);
  } else {
    report(
      fmt::format(
        "Test file '{}' must import function '{}' from the module being tested",
        ctx.traits.file_name, tested),
      k_file_start, ctx);
  }
}

// ============================================================================
// Directory conventions
// ============================================================================

void check_index_file(const Program & program, RuleContext & ctx)
{
  for (const Stmt * stmt : program.body) {
    if (const auto * exp = dyn_cast<ExportNamedDecl>(stmt)) {
      if (exp->declaration) {
        report(
          "index.ts files can only contain re-exports, not direct exports", exp->get_range(), ctx);
      }
    } else if (isa<ExportDefaultDecl>(stmt)) {
      report(
        "index.ts files can only contain re-exports, not default exports", stmt->get_range(), ctx);
    } else if (isa<FunctionDecl>(stmt) || isa<ClassDecl>(stmt) || isa<VarDecl>(stmt)) {
      report(
        "index.ts files can only contain re-exports, not declarations", stmt->get_range(), ctx);
    }
  }
}

void check_io_error_file(const Program & program, RuleContext & ctx)
{
  const std::string_view expected = ctx.traits.stem;
  bool found = false;

  for (const Stmt * stmt : program.body) {
    const auto * exp = dyn_cast<ExportNamedDecl>(stmt);
    const auto * cls = exp ? dyn_cast<ClassDecl>(exp->declaration) : nullptr;
    if (!cls) continue;

    if (cls->name == expected) {
      found = true;
      if (identifier_name(cls->superClass) != "Error") {
        report(
          fmt::format("Error class '{}' must extend Error", cls->name), cls->get_range(), ctx);
      }
    } else if (cls->name.size() >= 5 && cls->name.substr(cls->name.size() - 5) == "Error") {
      report(
        fmt::format("Error class must be named '{}' to match filename", expected),
        cls->get_range(), ctx);
    }
  }

  if (!found) {
    report(
      fmt::format("io/errors/{}.ts must export error class '{}' extending Error", expected, expected),
      k_file_start, ctx);
  }
}

void check_pure_file(const Program & program, RuleContext & ctx)
{
  for (const Stmt * stmt : program.body) {
    const auto * imp = dyn_cast<ImportDecl>(stmt);
    if (imp && imp->source.find("/io/") != std::string_view::npos) {
      report(
        "pure/**/*.ts files cannot import from io/**/*.ts (pure functions cannot depend on I/O)",
        imp->get_range(), ctx);
    }
  }

  for (const Stmt * stmt : program.body) {
    const Stmt * decl = unwrap_export(stmt);
    if (const auto * fn = dyn_cast<FunctionDecl>(decl); fn && fn->isAsync) {
      report("Functions in pure/**/*.ts cannot be async", fn->get_range(), ctx);
    } else if (const auto * var = dyn_cast<VarDecl>(decl)) {
      for (const VarDeclarator * d : var->declarators) {
        if (is_async_function(d->init)) {
          report("Functions in pure/**/*.ts cannot be async", d->get_range(), ctx);
        }
      }
    }
  }

  const auto & exported = ctx.state.exported_functions;
  if (exported.empty()) return;
  const bool matches = std::any_of(exported.begin(), exported.end(), [&](const NamedRange & f) {
    return f.name == ctx.traits.stem;
  });
  if (!matches) {
    report(
      fmt::format(
        "pure/**/*.ts must export a function named '{}' matching the filename", ctx.traits.stem),
      k_file_start, ctx);
  }
}

void check_io_file(const Program & program, RuleContext & ctx)
{
  for (const Stmt * stmt : program.body) {
    const auto * exp = dyn_cast<ExportNamedDecl>(stmt);
    if (!exp || !exp->declaration) continue;

    if (const auto * fn = dyn_cast<FunctionDecl>(exp->declaration)) {
      // Overload signatures have no body.
      if (fn->body && !fn->isAsync) {
        report("Functions in io/**/*.ts must be async", fn->get_range(), ctx);
      }
    } else if (const auto * var = dyn_cast<VarDecl>(exp->declaration)) {
      for (const VarDeclarator * d : var->declarators) {
        if (is_function_like(d->init) && !is_async_function(d->init)) {
          report("Functions in io/**/*.ts must be async", d->get_range(), ctx);
        }
      }
    }
  }
}

void check_types_file(const Program & program, RuleContext & ctx)
{
  const std::string_view expected = ctx.traits.stem;
  std::vector<NamedRange> types;

  for (const Stmt * stmt : program.body) {
    const auto * exp = dyn_cast<ExportNamedDecl>(stmt);
    if (!exp || !exp->declaration) continue;
    const Stmt * decl = exp->declaration;

    if (const auto * alias = dyn_cast<TypeAliasDecl>(decl)) {
      types.push_back({alias->name, alias->get_range()});
    } else if (const auto * iface = dyn_cast<InterfaceDecl>(decl)) {
      types.push_back({iface->name, iface->get_range()});
    } else {
      std::string_view what;
      if (isa<EnumDecl>(decl)) {
        what = "enums";
      } else if (isa<FunctionDecl>(decl)) {
        what = "functions";
      } else if (isa<ClassDecl>(decl)) {
        what = "classes";
      } else if (isa<VarDecl>(decl)) {
        what = "variables";
      }
      if (!what.empty()) {
        report(
          fmt::format("types/**/*.ts should only export type definitions, not {}", what),
          decl->get_range(), ctx);
      }
    }
  }

  if (types.size() > 1) {
    for (const NamedRange & t : types) {
      if (t.name == expected) continue;
      report(
        fmt::format(
          "types/**/*.ts should only export one type named '{}' matching the filename", expected),
        t.range, ctx);
    }
  } else if (types.size() == 1 && types[0].name != expected) {
    report(
      fmt::format("Type export must be named '{}' to match the filename", expected), types[0].range,
      ctx);
  }
}

// ============================================================================
// filename-function-match
// ============================================================================

void check_filename_function_match(RuleContext & ctx)
{
  const FileTraits & traits = ctx.traits;
  if (traits.is_types_file || traits.is_error_file || traits.is_index_file) return;
  if (traits.is_main_entry) return;

  std::string_view expected = traits.stem;
  if (!expected.empty() && expected.front() == '_') expected.remove_prefix(1);

  // Anonymous default exports carry no name to compare.
  const NamedRange * first = nullptr;
  for (const NamedRange & f : ctx.state.exported_functions) {
    if (f.name == "default") continue;
    if (f.name == expected) return;
    if (!first) first = &f;
  }
  if (!first) return;

  ctx.report(
    rule::k_filename_function_match,
    fmt::format("Exported function name '{}' must match filename '{}'", first->name, expected),
    first->range);
}

}  // namespace

void check_path_policy(const Program & program, RuleContext & ctx)
{
  const FileTraits & traits = ctx.traits;

  if (traits.is_test_file) {
    check_test_file(program, ctx);
    return;
  }

  if (traits.is_index_file) check_index_file(program, ctx);
  if (traits.is_io_error_file) check_io_error_file(program, ctx);
  if (traits.is_pure_file) check_pure_file(program, ctx);
  if (traits.is_io_file && !traits.is_io_error_file) check_io_file(program, ctx);
  if (traits.is_types_file) check_types_file(program, ctx);

  check_filename_function_match(ctx);
}

}  // namespace purets::lint
