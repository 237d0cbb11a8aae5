// schemaflow/sema/schema/value_type.hpp - Declared element type of a column
//
// Only the primitive tag takes part in analysis; the spelling is kept for
// messages and for telling apart two "other" types during composition.
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>

namespace schemaflow
{

enum class TypeTag : uint8_t {
  Int,
  Float,
  Str,
  Bool,
  Other,
};

[[nodiscard]] constexpr std::string_view to_string(TypeTag tag) noexcept
{
  switch (tag) {
    case TypeTag::Int:
      return "int";
    case TypeTag::Float:
      return "float";
    case TypeTag::Str:
      return "str";
    case TypeTag::Bool:
      return "bool";
    case TypeTag::Other:
      return "other";
  }
  return "";
}

struct ValueType
{
  TypeTag tag = TypeTag::Other;
  std::string spelling = "Any";  ///< As written in the declaration ("int", "pl.Int64", "datetime")

  /// Classify a spelled type name. Dotted prefixes are ignored ("pl.Int64" is Int).
  [[nodiscard]] static ValueType from_spelling(std::string_view spelling);

  [[nodiscard]] static ValueType any() { return ValueType{}; }

  /// Primitive types compare by tag; `Other` types also compare spelling.
  [[nodiscard]] bool operator==(const ValueType & other) const noexcept
  {
    return tag == other.tag && (tag != TypeTag::Other || spelling == other.spelling);
  }
  [[nodiscard]] bool operator!=(const ValueType & other) const noexcept
  {
    return !(*this == other);
  }

  /// Name used in messages and exports: the tag for primitives, else the spelling.
  [[nodiscard]] std::string display_name() const;
};

}  // namespace schemaflow
