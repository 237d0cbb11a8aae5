// schemaflow/sema/binding/frame_patterns.cpp - Recognized frame expression shapes
#include "schemaflow/sema/binding/frame_patterns.hpp"

#include <array>
#include <unordered_set>

#include "schemaflow/basic/casting.hpp"
#include "schemaflow/syntax/parser.hpp"

namespace schemaflow
{

namespace
{

template <size_t N>
bool contains(const std::array<std::string_view, N> & table, std::string_view name) noexcept
{
  for (const auto entry : table) {
    if (entry == name) {
      return true;
    }
  }
  return false;
}

}  // namespace

bool is_frame_generic_name(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 4> k_generics = {
    "DataFrame", "PandasFrame", "PolarsFrame", "LazyFrame"};
  return contains(k_generics, name);
}

bool is_preserving_method(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 28> k_preserving = {
    "filter",      "query",     "head",      "tail",   "sort_values",     "sort_index",
    "sort",        "copy",      "clone",     "dropna", "fillna",          "fill_null",
    "fill_nan",    "unique",    "sample",    "limit",  "drop_duplicates", "slice",
    "where",       "mask",      "astype",    "round",  "clip",            "abs",
    "lazy",        "collect",   "groupby",   "group_by"};
  return contains(k_preserving, name);
}

bool is_reader_method(std::string_view name) noexcept
{
  static constexpr std::array<std::string_view, 4> k_readers = {
    "read_csv", "read_parquet", "read_json", "read_excel"};
  return contains(k_readers, name);
}

bool is_frame_api_member(std::string_view name) noexcept
{
  // Polars and pandas surface; attribute accesses with these names are never columns.
  static const std::unordered_set<std::string_view> k_api = {
    "shape",          "columns",      "index",         "iloc",         "loc",
    "head",           "tail",         "describe",      "info",         "set_index",
    "merge",          "concat",       "join",          "filter",       "select",
    "with_columns",   "group_by",     "groupby",       "agg",          "sort",
    "sort_values",    "drop",         "rename",        "apply",        "map",
    "pipe",           "transform",    "to_pandas",     "to_df",        "schema",
    "dtypes",         "dtype",        "cast",          "lazy",         "collect",
    "to_dict",        "to_list",      "to_numpy",      "to_arrow",     "write_csv",
    "write_parquet",  "clone",        "clear",         "extend",       "insert",
    "item",           "n_chunks",     "null_count",    "estimated_size", "width",
    "height",         "rows",         "row",           "get_column",   "get_columns",
    "explode",        "unnest",       "pivot",         "unpivot",      "melt",
    "sample",         "slice",        "limit",         "unique",       "n_unique",
    "value_counts",   "is_empty",     "is_duplicated", "unique_counts", "mean",
    "sum",            "min",          "max",           "std",          "var",
    "median",         "quantile",     "fill_null",     "fill_nan",     "interpolate",
    "shift",          "diff",         "pct_change",    "rolling",      "ewm",
    "T",              "values",       "empty",         "size",         "ndim",
    "axes",           "attrs",        "at",            "iat",          "str",
    "dt",             "plot",         "copy",          "assign",       "astype",
    "query",          "where",        "mask",          "dropna",       "fillna",
    "round",          "abs",          "clip",          "count",        "nunique",
    "to_csv",         "to_parquet",   "to_json",       "to_excel",     "iterrows",
    "itertuples",     "items",        "keys",          "reset_index",  "sort_index",
    "pivot_table",    "stack",        "unstack",       "isna",         "notna",
    "isnull",         "notnull",      "any",           "all",          "cumsum",
    "prod",           "corr",         "cov",           "nlargest",     "nsmallest",
    "idxmax",         "idxmin",       "memory_usage",  "equals",       "drop_duplicates",
    "duplicated",     "drop_nulls",   "to_dicts",      "iter_rows",    "hstack",
    "vstack",         "select_dtypes", "validate"};
  return k_api.count(name) != 0;
}

bool is_boolean_mask(const Expr * index) noexcept
{
  if (const auto * bin = dyn_cast<BinaryExpr>(index)) {
    switch (bin->op) {
      case BinaryOp::Eq:
      case BinaryOp::Ne:
      case BinaryOp::Lt:
      case BinaryOp::Le:
      case BinaryOp::Gt:
      case BinaryOp::Ge:
      case BinaryOp::BitAnd:
      case BinaryOp::BitOr:
      case BinaryOp::BitXor:
        return true;
      default:
        return false;
    }
  }
  if (const auto * un = dyn_cast<UnaryExpr>(index)) {
    return un->op == UnaryOp::Invert || un->op == UnaryOp::Not;
  }
  if (const auto * call = dyn_cast<CallExpr>(index)) {
    static constexpr std::array<std::string_view, 7> k_mask_methods = {
      "isin", "notna", "notnull", "isna", "isnull", "between", "duplicated"};
    const auto * attr = dyn_cast<AttributeExpr>(call->callee);
    return attr != nullptr && contains(k_mask_methods, attr->attr);
  }
  return false;
}

const Expr * annotated_schema_expr(AstContext & ast, FileId file_id, const Expr * annotation)
{
  const Expr * expr = annotation;
  // Each step descends into a strictly smaller expression (or a re-parse of
  // a string literal, which cannot itself yield a string literal).
  while (expr != nullptr) {
    if (const auto * lit = dyn_cast<StringLiteralExpr>(expr)) {
      if (lit->is_bytes || lit->is_formatted) {
        return nullptr;
      }
      const uint32_t offset = lit->get_range().get_begin().offset() + 1;
      const Expr * reparsed = syntax::parse_expression_text(ast, file_id, lit->value, offset);
      if (reparsed == nullptr || isa<StringLiteralExpr>(reparsed)) {
        return nullptr;
      }
      expr = reparsed;
      continue;
    }

    // `X | None` / `None | X`
    if (const auto * bin = dyn_cast<BinaryExpr>(expr)) {
      if (bin->op != BinaryOp::BitOr) {
        return nullptr;
      }
      if (isa<NoneLiteralExpr>(bin->rhs)) {
        expr = bin->lhs;
      } else if (isa<NoneLiteralExpr>(bin->lhs)) {
        expr = bin->rhs;
      } else {
        return nullptr;
      }
      continue;
    }

    const auto * sub = dyn_cast<SubscriptExpr>(expr);
    if (sub == nullptr) {
      return nullptr;
    }
    const std::string_view head = terminal_name(sub->base);

    if (head == "Optional") {
      expr = sub->index;
      continue;
    }
    if (head == "Union") {
      // Union[X, None]: only the single non-None alternative is followed.
      const auto * tuple = dyn_cast<TupleExpr>(sub->index);
      if (tuple == nullptr) {
        expr = sub->index;
        continue;
      }
      const Expr * alternative = nullptr;
      for (const auto * e : tuple->elements) {
        if (isa<NoneLiteralExpr>(e)) {
          continue;
        }
        if (alternative != nullptr) {
          return nullptr;
        }
        alternative = e;
      }
      expr = alternative;
      continue;
    }
    if (head == "Annotated") {
      // Annotated[pl.DataFrame, S]
      const auto * tuple = dyn_cast<TupleExpr>(sub->index);
      if (tuple == nullptr || tuple->elements.size() < 2) {
        return nullptr;
      }
      const Expr * frame = tuple->elements[0];
      const std::string_view frame_name =
        isa<SubscriptExpr>(frame) ? terminal_name(cast<SubscriptExpr>(frame)->base)
                                  : terminal_name(frame);
      if (!is_frame_generic_name(frame_name)) {
        return nullptr;
      }
      return tuple->elements[1];
    }
    if (is_frame_generic_name(head)) {
      const Expr * index = sub->index;
      if (const auto * tuple = dyn_cast<TupleExpr>(index)) {
        index = tuple->elements.empty() ? nullptr : tuple->elements[0];
      }
      if (isa<NameExpr>(index) || isa<AttributeExpr>(index)) {
        return index;
      }
      // DataFrame["S"]
      if (const auto * inner = dyn_cast<StringLiteralExpr>(index)) {
        if (inner->is_bytes || inner->is_formatted) {
          return nullptr;
        }
        const uint32_t offset = inner->get_range().get_begin().offset() + 1;
        const Expr * reparsed = syntax::parse_expression_text(ast, file_id, inner->value, offset);
        return isa<NameExpr>(reparsed) || isa<AttributeExpr>(reparsed) ? reparsed : nullptr;
      }
      return nullptr;
    }
    return nullptr;
  }
  return nullptr;
}

}  // namespace schemaflow
