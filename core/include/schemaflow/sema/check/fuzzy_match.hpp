// schemaflow/sema/check/fuzzy_match.hpp - "Did you mean" candidate search
#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace schemaflow
{

/// Largest edit distance that still produces a suggestion.
inline constexpr size_t k_suggestion_threshold = 2;

/**
 * Levenshtein distance counted in code points; UTF-8 sequences are compared
 * whole so a single accented character is one edit.
 */
[[nodiscard]] size_t edit_distance(std::string_view a, std::string_view b);

/**
 * Closest candidate within `threshold` edits of `name`. Ties go to the
 * shorter candidate, then to the lexicographically smaller one. An exact
 * match is never returned (it is not a suggestion).
 */
[[nodiscard]] std::optional<std::string> best_match(
  std::string_view name, const std::vector<std::string> & candidates,
  size_t threshold = k_suggestion_threshold);

}  // namespace schemaflow
