// purets/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <memory>
#include <string>

#include "purets/ast/ast.hpp"
#include "purets/ast/ast_context.hpp"
#include "purets/basic/diagnostic.hpp"
#include "purets/basic/source_manager.hpp"

namespace purets
{

struct ParseOutput
{
  Program * program = nullptr;
  size_t syntax_error_count = 0;
};

/// A parsed file together with everything its AST points into.
struct ParsedUnit
{
  SourceFile source;
  AstContext ast;
  DiagnosticBag diags;
  Program * program = nullptr;

  [[nodiscard]] bool has_syntax_errors() const { return diags.has_errors(); }
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics
[[nodiscard]] ParseOutput parse_source(
  const SourceFile & source, AstContext & ast, DiagnosticBag & diags);

/// Convenience wrapper that owns the source, arena and diagnostics.
[[nodiscard]] std::unique_ptr<ParsedUnit> parse_unit(
  std::filesystem::path path, std::string source_text);

}  // namespace purets
