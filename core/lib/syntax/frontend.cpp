// schemaflow/syntax/frontend.cpp - High-level parse pipeline
#include "schemaflow/syntax/frontend.hpp"

#include <utility>

#include "schemaflow/syntax/lexer.hpp"
#include "schemaflow/syntax/parser.hpp"

namespace schemaflow
{

ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags)
{
  const FileId id = sources.register_file(path, std::move(source_text));
  return parse_source(static_cast<const SourceRegistry &>(sources), id, ast, diags);
}

ParseOutput parse_source(
  const SourceRegistry & sources, FileId file_id, AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = file_id;

  const SourceFile * file = sources.get_file(file_id);
  if (file == nullptr) {
    throw InternalFault("parse requested for an unregistered file id");
  }

  syntax::Lexer lexer(file_id, file->content());
  syntax::Parser parser(ast, file_id, diags, lexer.lex_all());
  out.module = parser.parse_module();
  return out;
}

}  // namespace schemaflow
