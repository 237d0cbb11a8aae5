// schemaflow/test_support/parse_helpers.hpp - helpers for unit/integration tests
//
// These helpers provide a lightweight single-file parsing pipeline for tests.
// They keep ownership explicit (SourceRegistry + AstContext) while offering a
// convenient wrapper.
//
#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>

#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"
#include "schemaflow/driver/engine.hpp"
#include "schemaflow/sema/schema/schema_collector.hpp"
#include "schemaflow/sema/schema/schema_registry.hpp"
#include "schemaflow/syntax/frontend.hpp"

namespace schemaflow::test_support
{

struct TestParseUnit
{
  SourceRegistry sources;
  FileId file_id = FileId::invalid();
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  Module * module = nullptr;

  [[nodiscard]] const SourceFile * source_file() const noexcept
  {
    return sources.get_file(file_id);
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources.get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources.get_full_range(r);
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, const std::filesystem::path & virtual_path = "<test>.py")
{
  TestParseUnit out;
  out.ast = std::make_unique<AstContext>();

  const ParseOutput parsed =
    parse_source(out.sources, virtual_path, std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.module = parsed.module;
  return out;
}

/// Parsed files plus the frozen registry built from them.
struct TestProject
{
  SourceRegistry sources;
  std::vector<std::unique_ptr<AstContext>> asts;
  std::vector<FileId> file_ids;
  std::vector<Module *> modules;
  DiagnosticBag diags;
  SchemaRegistry registry;

  [[nodiscard]] const SchemaDefinition * schema(std::string_view name) const
  {
    return registry.find(name);
  }
};

/// Parse each (path, text) pair in order, then build and freeze the registry.
[[nodiscard]] inline std::unique_ptr<TestProject> build_project(
  const std::vector<std::pair<std::string, std::string>> & files)
{
  auto out = std::make_unique<TestProject>();
  std::vector<CollectedSchemas> collected;

  for (const auto & [path, text] : files) {
    auto ast = std::make_unique<AstContext>();
    const ParseOutput parsed = parse_source(out->sources, path, text, *ast, out->diags);
    out->file_ids.push_back(parsed.file_id);
    out->modules.push_back(parsed.module);
    if (parsed.ok()) {
      collected.push_back(SchemaCollector(*ast, parsed.file_id).collect(*parsed.module));
    }
    out->asts.push_back(std::move(ast));
  }

  out->registry = SchemaRegistry::build(std::move(collected), out->diags);
  return out;
}

[[nodiscard]] inline std::unique_ptr<TestProject> build_project(std::string src)
{
  return build_project({{"<test>.py", std::move(src)}});
}

/// Run the engine over in-memory files.
[[nodiscard]] inline CheckResult check(
  const std::vector<std::pair<std::string, std::string>> & files, CheckOptions options = {})
{
  std::vector<SourceInput> inputs;
  inputs.reserve(files.size());
  for (const auto & [path, text] : files) {
    inputs.push_back(SourceInput{path, text});
  }
  return Engine(options).check_sources(std::move(inputs));
}

[[nodiscard]] inline CheckResult check(std::string src, CheckOptions options = {})
{
  return check({{"<test>.py", std::move(src)}}, options);
}

/// Diagnostics of `result` carrying `code`.
[[nodiscard]] inline std::vector<Diagnostic> with_code(
  const CheckResult & result, std::string_view code)
{
  std::vector<Diagnostic> out;
  for (const auto & d : result.diagnostics) {
    if (d.code == code) {
      out.push_back(d);
    }
  }
  return out;
}

}  // namespace schemaflow::test_support
