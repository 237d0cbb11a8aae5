// schemaflow/sema/check/fuzzy_match.cpp - "Did you mean" candidate search
#include "schemaflow/sema/check/fuzzy_match.hpp"

#include <algorithm>

namespace schemaflow
{
namespace
{

/// Split UTF-8 text into code point slices. Malformed bytes stand alone.
std::vector<std::string_view> code_points(std::string_view s)
{
  std::vector<std::string_view> out;
  out.reserve(s.size());
  size_t i = 0;
  while (i < s.size()) {
    const auto lead = static_cast<unsigned char>(s[i]);
    size_t len = 1;
    if (lead >= 0xF0) {
      len = 4;
    } else if (lead >= 0xE0) {
      len = 3;
    } else if (lead >= 0xC0) {
      len = 2;
    }
    if (i + len > s.size()) {
      len = 1;
    }
    for (size_t k = 1; k < len; ++k) {
      if ((static_cast<unsigned char>(s[i + k]) & 0xC0) != 0x80) {
        len = 1;
        break;
      }
    }
    out.push_back(s.substr(i, len));
    i += len;
  }
  return out;
}

}  // namespace

size_t edit_distance(std::string_view a, std::string_view b)
{
  const auto ca = code_points(a);
  const auto cb = code_points(b);
  const size_t m = ca.size();
  const size_t n = cb.size();

  std::vector<size_t> prev(n + 1);
  std::vector<size_t> cur(n + 1);
  for (size_t j = 0; j <= n; ++j) {
    prev[j] = j;
  }
  for (size_t i = 1; i <= m; ++i) {
    cur[0] = i;
    for (size_t j = 1; j <= n; ++j) {
      const size_t cost = ca[i - 1] == cb[j - 1] ? 0 : 1;
      cur[j] = std::min({prev[j] + 1, cur[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, cur);
  }
  return prev[n];
}

std::optional<std::string> best_match(
  std::string_view name, const std::vector<std::string> & candidates, size_t threshold)
{
  const std::string * best = nullptr;
  size_t best_distance = threshold + 1;
  size_t best_length = 0;
  const size_t name_length = code_points(name).size();

  for (const auto & candidate : candidates) {
    if (candidate == name) {
      continue;
    }
    // Length difference is a lower bound on the distance.
    const size_t length = code_points(candidate).size();
    const size_t len_gap = length > name_length ? length - name_length : name_length - length;
    if (len_gap > threshold) {
      continue;
    }

    const size_t d = edit_distance(name, candidate);
    if (d > threshold) {
      continue;
    }
    const bool better = best == nullptr || d < best_distance ||
                        (d == best_distance && (length < best_length ||
                                                (length == best_length && candidate < *best)));
    if (better) {
      best = &candidate;
      best_distance = d;
      best_length = length;
    }
  }

  if (best == nullptr) {
    return std::nullopt;
  }
  return *best;
}

}  // namespace schemaflow
