// schemaflow/syntax/frontend.hpp - High-level parse pipeline entry point
#pragma once

#include <filesystem>
#include <string>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  Module * module = nullptr;  ///< Null when the file has a syntax error

  [[nodiscard]] bool ok() const noexcept { return module != nullptr; }
};

// Parse pipeline:
// source -> lexer (token stream) -> recursive-descent parser (AST) -> diagnostics

/// Register `source_text` under `path` and parse it.
[[nodiscard]] ParseOutput parse_source(
  SourceRegistry & sources, const std::filesystem::path & path, std::string source_text,
  AstContext & ast, DiagnosticBag & diags);

/// Parse a file that is already registered. The registry is only read.
[[nodiscard]] ParseOutput parse_source(
  const SourceRegistry & sources, FileId file_id, AstContext & ast, DiagnosticBag & diags);

}  // namespace schemaflow
