// schemaflow/syntax/lexer.cpp - Indentation-aware lexer
#include "schemaflow/syntax/lexer.hpp"

#include <array>
#include <cctype>
#include <utility>

namespace schemaflow::syntax
{
namespace
{

bool is_ident_start(unsigned char c) { return (std::isalpha(c) != 0) || c == '_' || c >= 0x80; }
bool is_ident_continue(unsigned char c)
{
  return (std::isalnum(c) != 0) || c == '_' || c >= 0x80;
}

bool is_digit(char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; }

bool is_string_prefix(std::string_view ident)
{
  if (ident.empty() || ident.size() > 2) {
    return false;
  }
  std::string lower;
  for (const char c : ident) {
    lower.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
  }
  static constexpr std::array<std::string_view, 8> k_prefixes = {"r",  "u",  "b",  "f",
                                                                 "br", "rb", "fr", "rf"};
  for (const auto p : k_prefixes) {
    if (lower == p) {
      return true;
    }
  }
  return false;
}

struct OperatorSpelling
{
  std::string_view text;
  TokenKind kind;
};

// Longest spellings first.
constexpr std::array<OperatorSpelling, 47> k_operators = {{
  {"**=", TokenKind::DoubleStarEq},
  {"//=", TokenKind::DoubleSlashEq},
  {">>=", TokenKind::RShiftEq},
  {"<<=", TokenKind::LShiftEq},
  {"...", TokenKind::Ellipsis},
  {"**", TokenKind::DoubleStar},
  {"//", TokenKind::DoubleSlash},
  {"<<", TokenKind::LShift},
  {">>", TokenKind::RShift},
  {"<=", TokenKind::Le},
  {">=", TokenKind::Ge},
  {"==", TokenKind::EqEq},
  {"!=", TokenKind::Ne},
  {"->", TokenKind::Arrow},
  {":=", TokenKind::ColonEq},
  {"+=", TokenKind::PlusEq},
  {"-=", TokenKind::MinusEq},
  {"*=", TokenKind::StarEq},
  {"/=", TokenKind::SlashEq},
  {"%=", TokenKind::PercentEq},
  {"@=", TokenKind::AtEq},
  {"&=", TokenKind::AmpEq},
  {"|=", TokenKind::PipeEq},
  {"^=", TokenKind::CaretEq},
  {"(", TokenKind::LParen},
  {")", TokenKind::RParen},
  {"[", TokenKind::LBracket},
  {"]", TokenKind::RBracket},
  {"{", TokenKind::LBrace},
  {"}", TokenKind::RBrace},
  {",", TokenKind::Comma},
  {":", TokenKind::Colon},
  {";", TokenKind::Semicolon},
  {".", TokenKind::Dot},
  {"@", TokenKind::At},
  {"+", TokenKind::Plus},
  {"-", TokenKind::Minus},
  {"*", TokenKind::Star},
  {"/", TokenKind::Slash},
  {"%", TokenKind::Percent},
  {"&", TokenKind::Amp},
  {"|", TokenKind::Pipe},
  {"^", TokenKind::Caret},
  {"~", TokenKind::Tilde},
  {"=", TokenKind::Eq},
  {"<", TokenKind::Lt},
  {">", TokenKind::Gt},
}};

}  // namespace

bool Lexer::starts_with(std::string_view s) const noexcept
{
  return src_.size() >= pos_ + s.size() && src_.substr(pos_, s.size()) == s;
}

Token Lexer::make_token(TokenKind kind, size_t start, size_t end) const noexcept
{
  Token t;
  t.kind = kind;
  t.range = SourceRange(
    file_id_, base_offset_ + static_cast<uint32_t>(start), base_offset_ + static_cast<uint32_t>(end));
  t.text = src_.substr(start, end - start);
  return t;
}

Token Lexer::make_error(size_t start, size_t end, std::string_view detail) const noexcept
{
  Token t = make_token(TokenKind::Unknown, start, end);
  t.detail = detail;
  return t;
}

void Lexer::skip_to_line_end() noexcept
{
  while (!eof() && peek() != '\n' && peek() != '\r') {
    advance(1);
  }
}

std::vector<Token> Lexer::lex_all()
{
  std::vector<Token> out;
  while (true) {
    out.push_back(next_token());
    if (out.back().kind == TokenKind::Eof) {
      break;
    }
  }
  return out;
}

bool Lexer::lex_line_start(Token & out)
{
  size_t start = pos_;
  uint32_t column = 0;

  while (true) {
    start = pos_;
    column = 0;
    while (!eof()) {
      const char c = peek();
      if (c == ' ') {
        ++column;
      } else if (c == '\t') {
        column = (column / 8 + 1) * 8;
      } else if (c == '\f') {
        column = 0;
      } else {
        break;
      }
      advance(1);
    }

    if (eof()) {
      return false;
    }

    // Blank and comment-only lines do not take part in indentation.
    const char c = peek();
    if (c == '#' || c == '\n' || c == '\r') {
      skip_to_line_end();
      if (peek() == '\r') {
        advance(1);
      }
      if (peek() == '\n') {
        advance(1);
      }
      continue;
    }
    break;
  }

  at_line_start_ = false;

  const uint32_t current = indent_stack_.back();
  if (column > current) {
    indent_stack_.push_back(column);
    out = make_token(TokenKind::Indent, start, pos_);
    return true;
  }

  if (column < current) {
    size_t popped = 0;
    while (indent_stack_.size() > 1 && indent_stack_.back() > column) {
      indent_stack_.pop_back();
      ++popped;
    }
    if (indent_stack_.back() != column) {
      out = make_error(start, pos_, "unindent does not match any outer indentation level");
      return true;
    }
    out = make_token(TokenKind::Dedent, pos_, pos_);
    for (size_t i = 1; i < popped; ++i) {
      pending_.push_back(make_token(TokenKind::Dedent, pos_, pos_));
    }
    return true;
  }

  return false;
}

Token Lexer::lex_identifier_or_string()
{
  const size_t start = pos_;
  advance(1);
  while (!eof() && is_ident_continue(static_cast<unsigned char>(peek()))) {
    advance(1);
  }

  const std::string_view ident = src_.substr(start, pos_ - start);
  if ((peek() == '"' || peek() == '\'') && is_string_prefix(ident)) {
    return lex_string(start, ident.size());
  }
  return make_token(TokenKind::Identifier, start, pos_);
}

Token Lexer::lex_number()
{
  const size_t start = pos_;

  // Base-prefixed integers: 0x.. 0o.. 0b..
  if (peek() == '0') {
    const char p1 = peek(1);
    if (p1 == 'x' || p1 == 'X' || p1 == 'o' || p1 == 'O' || p1 == 'b' || p1 == 'B') {
      advance(2);
      bool any = false;
      while (!eof() && (std::isalnum(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
        any = any || peek() != '_';
        advance(1);
      }
      if (!any) {
        return make_error(start, pos_, "invalid number literal");
      }
      return make_token(TokenKind::IntLiteral, start, pos_);
    }
  }

  bool is_float = false;
  while (!eof() && (is_digit(peek()) || peek() == '_')) {
    advance(1);
  }

  if (peek() == '.' && peek(1) != '.') {
    is_float = true;
    advance(1);
    while (!eof() && (is_digit(peek()) || peek() == '_')) {
      advance(1);
    }
  }

  if (peek() == 'e' || peek() == 'E') {
    const bool signed_exp = (peek(1) == '+' || peek(1) == '-') && is_digit(peek(2));
    if (is_digit(peek(1)) || signed_exp) {
      is_float = true;
      advance(signed_exp ? 2 : 1);
      while (!eof() && (is_digit(peek()) || peek() == '_')) {
        advance(1);
      }
    }
  }

  if (peek() == 'j' || peek() == 'J') {
    is_float = true;
    advance(1);
  }

  return make_token(is_float ? TokenKind::FloatLiteral : TokenKind::IntLiteral, start, pos_);
}

Token Lexer::lex_string(size_t start, size_t prefix_len)
{
  (void)prefix_len;
  const char quote = peek();
  const bool triple = peek(1) == quote && peek(2) == quote;
  advance(triple ? 3 : 1);

  while (true) {
    if (eof()) {
      return make_error(start, pos_, "unterminated string literal");
    }
    const char c = peek();
    if (c == '\\') {
      // Escapes (including an escaped newline) never terminate the literal.
      advance(pos_ + 1 < src_.size() ? 2 : 1);
      continue;
    }
    if (triple) {
      if (c == quote && peek(1) == quote && peek(2) == quote) {
        advance(3);
        break;
      }
      advance(1);
      continue;
    }
    if (c == quote) {
      advance(1);
      break;
    }
    if (c == '\n' || c == '\r') {
      return make_error(start, pos_, "unterminated string literal");
    }
    advance(1);
  }

  return make_token(TokenKind::StringLiteral, start, pos_);
}

Token Lexer::lex_operator()
{
  const size_t start = pos_;
  for (const auto & op : k_operators) {
    if (!starts_with(op.text)) {
      continue;
    }
    advance(op.text.size());
    switch (op.kind) {
      case TokenKind::LParen:
      case TokenKind::LBracket:
      case TokenKind::LBrace:
        ++bracket_depth_;
        break;
      case TokenKind::RParen:
      case TokenKind::RBracket:
      case TokenKind::RBrace:
        if (bracket_depth_ > 0) {
          --bracket_depth_;
        }
        break;
      default:
        break;
    }
    return make_token(op.kind, start, pos_);
  }

  advance(1);
  return make_error(start, pos_, "invalid character in source text");
}

Token Lexer::next_token()
{
  if (!pending_.empty()) {
    Token t = pending_.front();
    pending_.pop_front();
    last_kind_ = t.kind;
    return t;
  }

  while (true) {
    if (at_line_start_ && bracket_depth_ == 0) {
      Token layout;
      if (lex_line_start(layout)) {
        last_kind_ = layout.kind;
        return layout;
      }
    }

    while (!eof() && (peek() == ' ' || peek() == '\t' || peek() == '\f')) {
      advance(1);
    }
    if (eof()) {
      break;
    }

    const char c = peek();
    if (c == '#') {
      skip_to_line_end();
      continue;
    }
    if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
      advance(peek(1) == '\r' ? 3 : 2);
      continue;
    }
    if (c == '\n' || c == '\r') {
      const size_t start = pos_;
      advance((c == '\r' && peek(1) == '\n') ? 2 : 1);
      if (bracket_depth_ > 0) {
        continue;
      }
      at_line_start_ = true;
      last_kind_ = TokenKind::Newline;
      return make_token(TokenKind::Newline, start, pos_);
    }

    Token t;
    const auto uc = static_cast<unsigned char>(c);
    if (is_ident_start(uc)) {
      t = lex_identifier_or_string();
    } else if (is_digit(c) || (c == '.' && is_digit(peek(1)))) {
      t = lex_number();
    } else if (c == '"' || c == '\'') {
      t = lex_string(pos_, 0);
    } else {
      t = lex_operator();
    }
    last_kind_ = t.kind;
    return t;
  }

  // End of input: close the last logical line, then every open block.
  if (!finished_) {
    finished_ = true;
    const size_t at = src_.size();
    if (
      last_kind_ != TokenKind::Newline && last_kind_ != TokenKind::Indent &&
      last_kind_ != TokenKind::Dedent) {
      pending_.push_back(make_token(TokenKind::Newline, at, at));
    }
    while (indent_stack_.size() > 1) {
      indent_stack_.pop_back();
      pending_.push_back(make_token(TokenKind::Dedent, at, at));
    }
    pending_.push_back(make_token(TokenKind::Eof, at, at));
    return next_token();
  }

  return make_token(TokenKind::Eof, src_.size(), src_.size());
}

}  // namespace schemaflow::syntax
