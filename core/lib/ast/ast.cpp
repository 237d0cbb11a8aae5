// schemaflow/ast/ast.cpp - Syntax tree helper functions
#include "schemaflow/ast/ast.hpp"

namespace schemaflow
{

bool dotted_name(const Expr * expr, std::string & out)
{
  if (const auto * name = dyn_cast<NameExpr>(expr)) {
    out.assign(name->name);
    return true;
  }
  if (const auto * attr = dyn_cast<AttributeExpr>(expr)) {
    if (!dotted_name(attr->base, out)) {
      return false;
    }
    out.push_back('.');
    out.append(attr->attr);
    return true;
  }
  return false;
}

std::string_view terminal_name(const Expr * expr) noexcept
{
  if (const auto * name = dyn_cast<NameExpr>(expr)) {
    return name->name;
  }
  if (const auto * attr = dyn_cast<AttributeExpr>(expr)) {
    return attr->attr;
  }
  return {};
}

}  // namespace schemaflow
