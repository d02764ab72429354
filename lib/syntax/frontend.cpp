// purets/syntax/frontend.cpp - High-level parse pipeline
#include "purets/syntax/frontend.hpp"

#include "purets/syntax/lexer.hpp"
#include "purets/syntax/parser.hpp"

namespace purets
{

ParseOutput parse_source(const SourceFile & source, AstContext & ast, DiagnosticBag & diags)
{
  const size_t diags_before = diags.size();

  syntax::Lexer lexer(source.get_content());
  auto tokens = lexer.lex_all();

  syntax::Parser parser(ast, source, diags, std::move(tokens));
  ParseOutput out;
  out.program = parser.parse_program();
  out.syntax_error_count = diags.size() - diags_before;
  return out;
}

std::unique_ptr<ParsedUnit> parse_unit(std::filesystem::path path, std::string source_text)
{
  auto unit = std::make_unique<ParsedUnit>();
  unit->source = SourceFile(std::move(path), std::move(source_text));
  unit->program = parse_source(unit->source, unit->ast, unit->diags).program;
  return unit;
}

}  // namespace purets
