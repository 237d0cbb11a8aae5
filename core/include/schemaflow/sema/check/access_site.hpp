// schemaflow/sema/check/access_site.hpp - Located column references
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

#include "schemaflow/basic/source_manager.hpp"
#include "schemaflow/sema/schema/schema.hpp"

namespace schemaflow
{

enum class AccessKind : uint8_t {
  LiteralSubscript,       ///< df["name"], df[["a", "b"]], df.select("a"), df.drop(columns=["a"])
  SchemaColumnSubscript,  ///< df[Other.col]
  Attribute,              ///< df.name
};

enum class AccessMode : uint8_t {
  Read,
  Write,
};

[[nodiscard]] constexpr std::string_view to_string(AccessKind k) noexcept
{
  switch (k) {
    case AccessKind::LiteralSubscript:
      return "literal_subscript";
    case AccessKind::SchemaColumnSubscript:
      return "schema_column_subscript";
    case AccessKind::Attribute:
      return "attribute";
  }
  return "";
}

[[nodiscard]] constexpr std::string_view to_string(AccessMode m) noexcept
{
  switch (m) {
    case AccessMode::Read:
      return "read";
    case AccessMode::Write:
      return "write";
  }
  return "";
}

/**
 * One possible column reference on a frame expression.
 *
 * For SchemaColumnSubscript, `name` is the attribute written after the
 * referenced schema (`col` in `Other.col`) and `referenced_schema` is
 * `Other` itself; the checker validates both halves.
 */
struct AccessSite
{
  std::string variable;  ///< Spelled frame expression ("df")
  AccessKind kind = AccessKind::LiteralSubscript;
  AccessMode mode = AccessMode::Read;
  std::string name;
  SourceRange range;  ///< The literal or attribute name

  const SchemaDefinition * referenced_schema = nullptr;
};

struct SchemaBinding;

/// Receives every access site whose frame has a known schema.
class AccessSink
{
public:
  virtual ~AccessSink() = default;

  virtual void on_access(const AccessSite & site, const SchemaBinding & binding) = 0;
};

}  // namespace schemaflow
