// schemaflow/sema/binding/frame_patterns.hpp - Recognized frame expression shapes
//
// Closed tables of the frame-library vocabulary the binding resolver and the
// reference checker understand: generic frame types, schema-preserving
// methods, the frame API surface and boolean-mask index shapes.
//
#pragma once

#include <string_view>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow
{

/// `DataFrame`, `PandasFrame`, `PolarsFrame`, `LazyFrame` (terminal name).
[[nodiscard]] bool is_frame_generic_name(std::string_view name) noexcept;

/// Methods whose result has the receiver's columns.
[[nodiscard]] bool is_preserving_method(std::string_view name) noexcept;

/// `read_csv`, `read_parquet`, `read_json`, `read_excel`.
[[nodiscard]] bool is_reader_method(std::string_view name) noexcept;

/// Attributes that belong to the frame API rather than to a column.
[[nodiscard]] bool is_frame_api_member(std::string_view name) noexcept;

/**
 * True for index expressions that select rows rather than columns:
 * comparisons, `&`/`|`/`^` combinations, `~mask`, `not mask`, and calls to
 * `isin`, `notna`, `notnull`, `isna`, `isnull`, `between`, `duplicated`.
 */
[[nodiscard]] bool is_boolean_mask(const Expr * index) noexcept;

/**
 * Schema-naming expression inside a frame annotation, or null.
 *
 * Accepts `DataFrame[S]` (and the other frame generics, bare or dotted),
 * `Annotated[<frame>, S]`, `Optional[...]`, `X | None` and quoted forms of
 * all of these. Quoted annotations are re-parsed into `ast`.
 */
[[nodiscard]] const Expr * annotated_schema_expr(
  AstContext & ast, FileId file_id, const Expr * annotation);

}  // namespace schemaflow
