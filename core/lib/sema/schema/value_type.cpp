// schemaflow/sema/schema/value_type.cpp - Column element type classification
#include "schemaflow/sema/schema/value_type.hpp"

#include <algorithm>
#include <array>
#include <cctype>

namespace schemaflow
{

namespace
{

struct TypeSpelling
{
  std::string_view name;  // lower-case, without dotted prefix
  TypeTag tag;
};

constexpr std::array<TypeSpelling, 27> k_known_types = {{
  {"int", TypeTag::Int},         {"int8", TypeTag::Int},       {"int16", TypeTag::Int},
  {"int32", TypeTag::Int},       {"int64", TypeTag::Int},      {"uint8", TypeTag::Int},
  {"uint16", TypeTag::Int},      {"uint32", TypeTag::Int},     {"uint64", TypeTag::Int},
  {"integer", TypeTag::Int},     {"float", TypeTag::Float},    {"float16", TypeTag::Float},
  {"float32", TypeTag::Float},   {"float64", TypeTag::Float},  {"double", TypeTag::Float},
  {"decimal", TypeTag::Float},   {"str", TypeTag::Str},        {"string", TypeTag::Str},
  {"utf8", TypeTag::Str},        {"object", TypeTag::Str},     {"bool", TypeTag::Bool},
  {"boolean", TypeTag::Bool},    {"int64dtype", TypeTag::Int}, {"float64dtype", TypeTag::Float},
  {"stringdtype", TypeTag::Str}, {"booleandtype", TypeTag::Bool}, {"categorical", TypeTag::Str},
}};

}  // namespace

ValueType ValueType::from_spelling(std::string_view spelling)
{
  ValueType result;
  if (spelling.empty()) {
    return result;
  }
  result.spelling = std::string(spelling);

  std::string_view last = spelling;
  if (const auto dot = last.rfind('.'); dot != std::string_view::npos) {
    last = last.substr(dot + 1);
  }

  std::string lower(last);
  std::transform(lower.begin(), lower.end(), lower.begin(), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });

  for (const auto & known : k_known_types) {
    if (known.name == lower) {
      result.tag = known.tag;
      return result;
    }
  }
  result.tag = TypeTag::Other;
  return result;
}

std::string ValueType::display_name() const
{
  if (tag == TypeTag::Other) {
    return spelling;
  }
  return std::string(to_string(tag));
}

}  // namespace schemaflow
