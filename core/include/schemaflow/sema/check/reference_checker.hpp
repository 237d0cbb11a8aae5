// schemaflow/sema/check/reference_checker.hpp - Column access judgment
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/sema/binding/schema_binding.hpp"
#include "schemaflow/sema/check/access_site.hpp"
#include "schemaflow/sema/schema/schema.hpp"
#include "schemaflow/sema/schema/schema_registry.hpp"

namespace schemaflow
{

enum class Verdict : uint8_t {
  Ok,
  UnknownColumn,
  UndeclaredMutation,
};

struct Judgment
{
  Verdict verdict = Verdict::Ok;
  std::optional<std::string> suggestion;

  [[nodiscard]] bool ok() const noexcept { return verdict == Verdict::Ok; }
};

/**
 * Reference Checker.
 *
 * Judges each access site against the schema bound to its frame and turns
 * failed judgments into UnknownColumn / UndeclaredColumnMutation errors.
 * Accesses on Unknown bindings never reach the checker.
 */
class ReferenceChecker : public AccessSink
{
public:
  explicit ReferenceChecker(DiagnosticBag & diags) : diags_(diags) {}

  /**
   * Whether `name` may be accessed on `schema`. This is the whole decision:
   * the engine and out-of-process consumers share it.
   *
   * Matching order: exact lookup key, attribute name (attribute accesses
   * only), listed family members, family patterns, family names, groups.
   */
  [[nodiscard]] static Judgment judge(
    const SchemaDefinition & schema, std::string_view name, AccessKind kind, AccessMode mode);

  void on_access(const AccessSite & site, const SchemaBinding & binding) override;

  [[nodiscard]] size_t sites_checked() const noexcept { return sites_checked_; }

private:
  void report(
    const AccessSite & site, const SchemaDefinition & schema, std::string_view name,
    const Judgment & judgment);

  DiagnosticBag & diags_;
  size_t sites_checked_ = 0;
};

/**
 * Resolve bindings for one parsed module and report every unjustified column
 * access into `diags`. Returns the number of access sites judged.
 */
size_t check_module(
  const SchemaRegistry & registry, AstContext & ast, FileId file_id, const Module & module,
  DiagnosticBag & diags);

}  // namespace schemaflow
