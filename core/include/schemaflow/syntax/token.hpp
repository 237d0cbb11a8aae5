// schemaflow/syntax/token.hpp - Token kinds produced by the lexer
#pragma once

#include <cstdint>
#include <string_view>

#include "schemaflow/basic/source_manager.hpp"

namespace schemaflow::syntax
{

enum class TokenKind : uint8_t {
  Eof,
  Unknown,  // malformed input; Token::detail says why

  // Layout
  Newline,
  Indent,
  Dedent,

  Identifier,  // keywords are identifiers; the parser checks spelling
  IntLiteral,
  FloatLiteral,   // includes imaginary literals
  StringLiteral,  // token.text is the raw spelling including prefix and quotes

  // Punctuation
  LParen,
  RParen,
  LBracket,
  RBracket,
  LBrace,
  RBrace,

  Comma,
  Colon,
  Semicolon,
  Dot,
  Ellipsis,
  At,
  Arrow,    // ->
  ColonEq,  // :=

  // Operators
  Plus,
  Minus,
  Star,
  DoubleStar,
  Slash,
  DoubleSlash,
  Percent,
  Amp,
  Pipe,
  Caret,
  Tilde,
  LShift,
  RShift,

  Eq,
  EqEq,
  Ne,
  Lt,
  Le,
  Gt,
  Ge,

  // Augmented assignment
  PlusEq,
  MinusEq,
  StarEq,
  SlashEq,
  DoubleSlashEq,
  PercentEq,
  AtEq,
  AmpEq,
  PipeEq,
  CaretEq,
  LShiftEq,
  RShiftEq,
  DoubleStarEq,
};

struct Token
{
  TokenKind kind = TokenKind::Unknown;
  SourceRange range;        // byte range in the original source
  std::string_view text;    // slice of the source
  std::string_view detail;  // Unknown tokens only: static description of the problem

  [[nodiscard]] uint32_t begin() const noexcept { return range.get_begin().offset(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.get_end().offset(); }
};

[[nodiscard]] constexpr bool is_augmented_assign(TokenKind k) noexcept
{
  return k >= TokenKind::PlusEq && k <= TokenKind::DoubleStarEq;
}

[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Eof:
      return "end of file";
    case TokenKind::Unknown:
      return "<unknown>";
    case TokenKind::Newline:
      return "newline";
    case TokenKind::Indent:
      return "indent";
    case TokenKind::Dedent:
      return "dedent";
    case TokenKind::Identifier:
      return "identifier";
    case TokenKind::IntLiteral:
      return "integer";
    case TokenKind::FloatLiteral:
      return "number";
    case TokenKind::StringLiteral:
      return "string";
    case TokenKind::LParen:
      return "(";
    case TokenKind::RParen:
      return ")";
    case TokenKind::LBracket:
      return "[";
    case TokenKind::RBracket:
      return "]";
    case TokenKind::LBrace:
      return "{";
    case TokenKind::RBrace:
      return "}";
    case TokenKind::Comma:
      return ",";
    case TokenKind::Colon:
      return ":";
    case TokenKind::Semicolon:
      return ";";
    case TokenKind::Dot:
      return ".";
    case TokenKind::Ellipsis:
      return "...";
    case TokenKind::At:
      return "@";
    case TokenKind::Arrow:
      return "->";
    case TokenKind::ColonEq:
      return ":=";
    case TokenKind::Plus:
      return "+";
    case TokenKind::Minus:
      return "-";
    case TokenKind::Star:
      return "*";
    case TokenKind::DoubleStar:
      return "**";
    case TokenKind::Slash:
      return "/";
    case TokenKind::DoubleSlash:
      return "//";
    case TokenKind::Percent:
      return "%";
    case TokenKind::Amp:
      return "&";
    case TokenKind::Pipe:
      return "|";
    case TokenKind::Caret:
      return "^";
    case TokenKind::Tilde:
      return "~";
    case TokenKind::LShift:
      return "<<";
    case TokenKind::RShift:
      return ">>";
    case TokenKind::Eq:
      return "=";
    case TokenKind::EqEq:
      return "==";
    case TokenKind::Ne:
      return "!=";
    case TokenKind::Lt:
      return "<";
    case TokenKind::Le:
      return "<=";
    case TokenKind::Gt:
      return ">";
    case TokenKind::Ge:
      return ">=";
    case TokenKind::PlusEq:
      return "+=";
    case TokenKind::MinusEq:
      return "-=";
    case TokenKind::StarEq:
      return "*=";
    case TokenKind::SlashEq:
      return "/=";
    case TokenKind::DoubleSlashEq:
      return "//=";
    case TokenKind::PercentEq:
      return "%=";
    case TokenKind::AtEq:
      return "@=";
    case TokenKind::AmpEq:
      return "&=";
    case TokenKind::PipeEq:
      return "|=";
    case TokenKind::CaretEq:
      return "^=";
    case TokenKind::LShiftEq:
      return "<<=";
    case TokenKind::RShiftEq:
      return ">>=";
    case TokenKind::DoubleStarEq:
      return "**=";
  }
  return "";
}

}  // namespace schemaflow::syntax
