// schemaflow/syntax/lexer.hpp - Indentation-aware lexer for analyzed sources
#pragma once

#include <cstdint>
#include <deque>
#include <string_view>
#include <vector>

#include "schemaflow/syntax/token.hpp"

namespace schemaflow::syntax
{

/**
 * Converts source text into tokens, synthesizing Newline/Indent/Dedent from
 * line structure. Newlines inside brackets and after a backslash
 * continuation are joined; blank and comment-only lines produce nothing.
 *
 * `base_offset` shifts every range, used when re-lexing the contents of a
 * string literal in place.
 */
class Lexer
{
public:
  Lexer(FileId file_id, std::string_view src, uint32_t base_offset = 0)
  : file_id_(file_id), src_(src), base_offset_(base_offset)
  {
  }

  /// Tokenize the whole input. The result always ends with Eof.
  [[nodiscard]] std::vector<Token> lex_all();

private:
  [[nodiscard]] Token next_token();

  [[nodiscard]] bool eof() const noexcept { return pos_ >= src_.size(); }
  [[nodiscard]] char peek(size_t lookahead = 0) const noexcept
  {
    const size_t i = pos_ + lookahead;
    return (i < src_.size()) ? src_[i] : '\0';
  }
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept;

  void advance(size_t n = 1) noexcept { pos_ += n; }

  /// Handles indentation at the start of a logical line. Returns true and
  /// fills `out` when a layout token (Indent/Dedent/Unknown) was produced.
  bool lex_line_start(Token & out);

  void skip_to_line_end() noexcept;

  [[nodiscard]] Token lex_identifier_or_string();
  [[nodiscard]] Token lex_number();
  [[nodiscard]] Token lex_string(size_t start, size_t prefix_len);
  [[nodiscard]] Token lex_operator();

  [[nodiscard]] Token make_token(TokenKind kind, size_t start, size_t end) const noexcept;
  [[nodiscard]] Token make_error(size_t start, size_t end, std::string_view detail) const noexcept;

  FileId file_id_;
  std::string_view src_;
  uint32_t base_offset_ = 0;
  size_t pos_ = 0;

  std::vector<uint32_t> indent_stack_{0};
  std::deque<Token> pending_;
  int bracket_depth_ = 0;
  bool at_line_start_ = true;
  bool finished_ = false;
  TokenKind last_kind_ = TokenKind::Newline;
};

}  // namespace schemaflow::syntax
