// schemaflow/syntax/parser.cpp - Recursive-descent parser
#include "schemaflow/syntax/parser.hpp"

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>

#include "schemaflow/syntax/lexer.hpp"

namespace schemaflow::syntax
{
namespace
{

SourceRange join_ranges(SourceRange a, SourceRange b)
{
  if (a.is_invalid()) return b;
  if (b.is_invalid()) return a;
  return {a.file_id(), a.get_begin().offset(), b.get_end().offset()};
}

bool is_layout(TokenKind k)
{
  return k == TokenKind::Newline || k == TokenKind::Indent || k == TokenKind::Dedent;
}

std::string describe(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Eof:
    case TokenKind::Newline:
    case TokenKind::Indent:
    case TokenKind::Dedent:
      return std::string(to_string(t.kind));
    default:
      return "'" + std::string(t.text) + "'";
  }
}

void append_utf8(std::string & out, uint32_t cp)
{
  if (cp <= 0x7F) {
    out.push_back(static_cast<char>(cp));
    return;
  }
  if (cp <= 0x7FF) {
    out.push_back(static_cast<char>(0xC0 | ((cp >> 6) & 0x1F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  if (cp <= 0xFFFF) {
    out.push_back(static_cast<char>(0xE0 | ((cp >> 12) & 0x0F)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    return;
  }
  out.push_back(static_cast<char>(0xF0 | ((cp >> 18) & 0x07)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
  out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
}

bool read_digits(std::string_view s, size_t pos, size_t count, int base, uint32_t & out)
{
  if (pos + count > s.size()) {
    return false;
  }
  uint32_t value = 0;
  for (size_t i = 0; i < count; ++i) {
    const char c = s[pos + i];
    int digit = -1;
    if (c >= '0' && c <= '9') {
      digit = c - '0';
    } else if (c >= 'a' && c <= 'f') {
      digit = c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      digit = c - 'A' + 10;
    }
    if (digit < 0 || digit >= base) {
      return false;
    }
    value = value * static_cast<uint32_t>(base) + static_cast<uint32_t>(digit);
  }
  out = value;
  return true;
}

BinaryOp augmented_op(TokenKind k)
{
  switch (k) {
    case TokenKind::PlusEq:
      return BinaryOp::Add;
    case TokenKind::MinusEq:
      return BinaryOp::Sub;
    case TokenKind::StarEq:
      return BinaryOp::Mul;
    case TokenKind::SlashEq:
      return BinaryOp::Div;
    case TokenKind::DoubleSlashEq:
      return BinaryOp::FloorDiv;
    case TokenKind::PercentEq:
      return BinaryOp::Mod;
    case TokenKind::AtEq:
      return BinaryOp::MatMul;
    case TokenKind::AmpEq:
      return BinaryOp::BitAnd;
    case TokenKind::PipeEq:
      return BinaryOp::BitOr;
    case TokenKind::CaretEq:
      return BinaryOp::BitXor;
    case TokenKind::LShiftEq:
      return BinaryOp::LShift;
    case TokenKind::RShiftEq:
      return BinaryOp::RShift;
    default:
      return BinaryOp::Pow;
  }
}

}  // namespace

// ============================================================================
// Token helpers
// ============================================================================

const Token & Parser::cur(size_t lookahead) const
{
  const size_t i = idx_ + lookahead;
  if (i >= tokens_.size()) {
    return tokens_.back();
  }
  return tokens_[i];
}

const Token & Parser::prev() const { return tokens_[idx_ > 0 ? idx_ - 1 : 0]; }

bool Parser::at(TokenKind k) const { return cur().kind == k; }

bool Parser::at_eof() const { return at(TokenKind::Eof); }

bool Parser::at_kw(std::string_view kw, size_t lookahead) const
{
  const Token & t = cur(lookahead);
  return t.kind == TokenKind::Identifier && t.text == kw;
}

const Token & Parser::advance()
{
  const Token & t = cur();
  if (!at_eof()) {
    ++idx_;
  }
  return t;
}

bool Parser::match(TokenKind k)
{
  if (at(k)) {
    advance();
    return true;
  }
  return false;
}

bool Parser::match_kw(std::string_view kw)
{
  if (at_kw(kw)) {
    advance();
    return true;
  }
  return false;
}

const Token & Parser::expect(TokenKind k, std::string_view what)
{
  if (!at(k)) {
    error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));
  }
  return advance();
}

const Token & Parser::expect_kw(std::string_view kw)
{
  if (!at_kw(kw)) {
    error_at(cur(), "expected '" + std::string(kw) + "', found " + describe(cur()));
  }
  return advance();
}

const Token & Parser::expect_name(std::string_view what)
{
  if (!at(TokenKind::Identifier) || is_reserved(cur().text)) {
    error_at(cur(), "expected " + std::string(what) + ", found " + describe(cur()));
  }
  return advance();
}

void Parser::error_at(const Token & t, std::string_view msg)
{
  // Lexer errors carry a more precise description than the parser's expectation.
  if (t.kind == TokenKind::Unknown && !t.detail.empty()) {
    fail(t.range, std::string(t.detail));
  }
  fail(t.range, std::string(msg));
}

void Parser::fail(SourceRange range, std::string msg)
{
  diags_.report_error(range, std::move(msg)).with_code(codes::k_parse_error);
  throw ParseAbort{};
}

void Parser::check_target(const Expr * target)
{
  if (isa<NameExpr>(target) || isa<AttributeExpr>(target) || isa<SubscriptExpr>(target)) {
    return;
  }
  if (const auto * star = dyn_cast<StarredExpr>(target)) {
    check_target(star->value);
    return;
  }
  if (const auto * tuple = dyn_cast<TupleExpr>(target)) {
    for (const auto * e : tuple->elements) check_target(e);
    return;
  }
  if (const auto * list = dyn_cast<ListExpr>(target)) {
    for (const auto * e : list->elements) check_target(e);
    return;
  }
  fail(target->get_range(), "cannot assign to " + std::string(to_string(target->get_kind())));
}

bool Parser::is_reserved(std::string_view ident)
{
  static constexpr std::string_view k_keywords[] = {
    "False", "None",   "True",    "and",      "as",     "assert", "async",  "await",
    "break", "class",  "continue", "def",     "del",    "elif",   "else",   "except",
    "finally", "for",  "from",    "global",   "if",     "import", "in",     "is",
    "lambda", "nonlocal", "not",  "or",       "pass",   "raise",  "return", "try",
    "while", "with",   "yield"};
  return std::any_of(std::begin(k_keywords), std::end(k_keywords), [&](std::string_view k) {
    return ident == k;
  });
}

bool Parser::can_start_expression(const Token & t)
{
  switch (t.kind) {
    case TokenKind::Identifier:
      return !is_reserved(t.text) || t.text == "None" || t.text == "True" || t.text == "False" ||
             t.text == "not" || t.text == "lambda" || t.text == "await";
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
    case TokenKind::StringLiteral:
    case TokenKind::LParen:
    case TokenKind::LBracket:
    case TokenKind::LBrace:
    case TokenKind::Minus:
    case TokenKind::Plus:
    case TokenKind::Tilde:
    case TokenKind::Star:
    case TokenKind::Ellipsis:
      return true;
    default:
      return false;
  }
}

SourceRange Parser::range_from(const Token & start) const { return range_from(start.range); }

SourceRange Parser::range_from(SourceRange start) const
{
  // End at the last significant token; layout tokens sit ahead of it.
  size_t i = idx_;
  while (i > 0 && is_layout(tokens_[i - 1].kind)) {
    --i;
  }
  if (i == 0) {
    return start;
  }
  return join_ranges(start, tokens_[i - 1].range);
}

// ============================================================================
// Entry points
// ============================================================================

Module * Parser::parse_module()
{
  try {
    std::vector<Stmt *> body;
    while (!at_eof()) {
      if (match(TokenKind::Newline)) {
        continue;
      }
      parse_statement(body);
    }
    auto * module = ast_.create<Module>(SourceRange(file_id_, 0, cur().end()));
    module->body = ast_.copy_to_arena(body);
    return module;
  } catch (const ParseAbort &) {
    return nullptr;
  }
}

Expr * Parser::parse_standalone_expression()
{
  try {
    while (at(TokenKind::Indent) || at(TokenKind::Newline)) {
      advance();
    }
    Expr * e = parse_star_expressions();
    while (at(TokenKind::Newline) || at(TokenKind::Dedent)) {
      advance();
    }
    if (!at_eof()) {
      error_at(cur(), "unexpected " + describe(cur()) + " after expression");
    }
    return e;
  } catch (const ParseAbort &) {
    return nullptr;
  }
}

Expr * parse_expression_text(
  AstContext & ast, FileId file_id, std::string_view text, uint32_t base_offset)
{
  Lexer lexer(file_id, text, base_offset);
  DiagnosticBag scratch;
  Parser parser(ast, file_id, scratch, lexer.lex_all());
  return parser.parse_standalone_expression();
}

// ============================================================================
// Statements
// ============================================================================

void Parser::parse_statement(std::vector<Stmt *> & out)
{
  if (at(TokenKind::Indent)) {
    error_at(cur(), "unexpected indent");
  }
  if (Stmt * compound = parse_compound_statement()) {
    out.push_back(compound);
    return;
  }
  parse_simple_statements(out);
}

void Parser::parse_simple_statements(std::vector<Stmt *> & out)
{
  out.push_back(parse_simple_statement());
  while (match(TokenKind::Semicolon)) {
    if (at(TokenKind::Newline) || at_eof()) {
      break;
    }
    out.push_back(parse_simple_statement());
  }
  if (!match(TokenKind::Newline) && !at_eof()) {
    error_at(cur(), "expected newline after statement, found " + describe(cur()));
  }
}

Stmt * Parser::parse_simple_statement()
{
  const Token & start = cur();

  if (match_kw("pass")) return ast_.create<PassStmt>(start.range);
  if (match_kw("break")) return ast_.create<BreakStmt>(start.range);
  if (match_kw("continue")) return ast_.create<ContinueStmt>(start.range);

  if (match_kw("return")) {
    Expr * value = can_start_expression(cur()) ? parse_star_expressions() : nullptr;
    return ast_.create<ReturnStmt>(value, range_from(start));
  }

  if (match_kw("del")) {
    std::vector<Expr *> targets;
    do {
      if (!can_start_expression(cur())) break;
      targets.push_back(parse_bitor());
    } while (match(TokenKind::Comma));
    if (targets.empty()) {
      error_at(cur(), "expected a target after 'del'");
    }
    for (const auto * t : targets) check_target(t);
    return ast_.create<DeleteStmt>(ast_.copy_to_arena(targets), range_from(start));
  }

  if (match_kw("raise")) {
    Expr * exception = nullptr;
    Expr * cause = nullptr;
    if (can_start_expression(cur())) {
      exception = parse_test();
      if (match_kw("from")) {
        cause = parse_test();
      }
    }
    return ast_.create<RaiseStmt>(exception, cause, range_from(start));
  }

  if (match_kw("assert")) {
    Expr * test = parse_test();
    Expr * message = match(TokenKind::Comma) ? parse_test() : nullptr;
    return ast_.create<AssertStmt>(test, message, range_from(start));
  }

  if (at_kw("global") || at_kw("nonlocal")) {
    const bool nonlocal = at_kw("nonlocal");
    advance();
    std::vector<std::string_view> names;
    do {
      names.push_back(ast_.intern(expect_name("name").text));
    } while (match(TokenKind::Comma));
    return ast_.create<GlobalStmt>(ast_.copy_to_arena(names), nonlocal, range_from(start));
  }

  if (at_kw("import")) return parse_import();
  if (at_kw("from")) return parse_from_import();
  if (at_type_alias()) return parse_type_alias();

  return parse_expression_statement();
}

Stmt * Parser::parse_expression_statement()
{
  const Token & start = cur();
  Expr * first = at_kw("yield") ? parse_yield() : parse_star_expressions();

  // target: annotation [= value]
  if (match(TokenKind::Colon)) {
    if (!isa<NameExpr>(first) && !isa<AttributeExpr>(first) && !isa<SubscriptExpr>(first)) {
      fail(first->get_range(), "illegal target for annotation");
    }
    Expr * annotation = parse_test();
    Expr * value = nullptr;
    if (match(TokenKind::Eq)) {
      value = at_kw("yield") ? parse_yield() : parse_star_expressions();
    }
    return ast_.create<AnnAssignStmt>(first, annotation, value, range_from(start));
  }

  if (is_augmented_assign(cur().kind)) {
    const BinaryOp op = augmented_op(advance().kind);
    if (!isa<NameExpr>(first) && !isa<AttributeExpr>(first) && !isa<SubscriptExpr>(first)) {
      fail(first->get_range(), "illegal expression for augmented assignment");
    }
    Expr * value = at_kw("yield") ? parse_yield() : parse_star_expressions();
    return ast_.create<AugAssignStmt>(first, op, value, range_from(start));
  }

  if (at(TokenKind::Eq)) {
    std::vector<Expr *> targets{first};
    while (match(TokenKind::Eq)) {
      targets.push_back(at_kw("yield") ? parse_yield() : parse_star_expressions());
    }
    Expr * value = targets.back();
    targets.pop_back();
    for (const auto * t : targets) check_target(t);
    return ast_.create<AssignStmt>(ast_.copy_to_arena(targets), value, range_from(start));
  }

  return ast_.create<ExprStmt>(first, range_from(start));
}

gsl::span<Stmt *> Parser::parse_block()
{
  expect(TokenKind::Colon, "':'");

  std::vector<Stmt *> body;
  if (!match(TokenKind::Newline)) {
    // Suite on the same line as the header.
    parse_simple_statements(body);
    return ast_.copy_to_arena(body);
  }

  if (!at(TokenKind::Indent)) {
    error_at(cur(), "expected an indented block");
  }
  advance();
  while (!at(TokenKind::Dedent) && !at_eof()) {
    parse_statement(body);
  }
  match(TokenKind::Dedent);
  return ast_.copy_to_arena(body);
}

Stmt * Parser::parse_compound_statement()
{
  const Token & start = cur();

  if (at(TokenKind::At)) return parse_decorated();
  if (at_match_statement()) return parse_match();
  if (at_kw("if")) return parse_if();
  if (at_kw("while")) return parse_while();
  if (at_kw("try")) return parse_try();
  if (match_kw("for")) return parse_for(start, false);
  if (match_kw("with")) return parse_with(start, false);
  if (match_kw("def")) return parse_function_def({}, start, false);
  if (match_kw("class")) return parse_class_def({}, start);

  if (match_kw("async")) {
    if (match_kw("def")) return parse_function_def({}, start, true);
    if (match_kw("for")) return parse_for(start, true);
    if (match_kw("with")) return parse_with(start, true);
    error_at(cur(), "expected 'def', 'for' or 'with' after 'async'");
  }

  return nullptr;
}

Stmt * Parser::parse_decorated()
{
  const Token & start = cur();
  std::vector<Expr *> decorators;
  while (match(TokenKind::At)) {
    decorators.push_back(parse_named());
    expect(TokenKind::Newline, "newline after decorator");
  }

  if (match_kw("def")) return parse_function_def(decorators, start, false);
  if (match_kw("class")) return parse_class_def(decorators, start);
  if (at_kw("async") && at_kw("def", 1)) {
    advance();
    advance();
    return parse_function_def(decorators, start, true);
  }
  error_at(cur(), "expected a function or class definition after decorator");
}

FunctionDefStmt * Parser::parse_function_def(
  const std::vector<Expr *> & decorators, const Token & start, bool is_async)
{
  const Token & name_tok = expect_name("function name");
  auto * fn = ast_.create<FunctionDefStmt>(ast_.intern(name_tok.text), name_tok.range, start.range);
  fn->is_async = is_async;
  fn->decorators = ast_.copy_to_arena(decorators);
  if (at(TokenKind::LBracket)) {
    fn->type_params = parse_type_params();
  }

  expect(TokenKind::LParen, "'(' after function name");
  fn->params = parse_params(TokenKind::RParen, true);
  expect(TokenKind::RParen, "')' after parameters");

  if (match(TokenKind::Arrow)) {
    fn->returns = parse_test();
  }
  fn->body = parse_block();
  fn->range_ = range_from(start);
  return fn;
}

gsl::span<Param *> Parser::parse_params(TokenKind closer, bool allow_annotations)
{
  std::vector<Param *> params;
  while (!at(closer)) {
    const Token & start = cur();

    // Positional-only marker.
    if (match(TokenKind::Slash)) {
      if (!match(TokenKind::Comma)) break;
      continue;
    }

    ParamKind kind = ParamKind::Normal;
    if (match(TokenKind::DoubleStar)) {
      kind = ParamKind::KwArgs;
    } else if (match(TokenKind::Star)) {
      kind = ParamKind::VarArgs;
      // Bare `*` only separates keyword-only parameters.
      if (at(TokenKind::Comma) || at(closer)) {
        if (!match(TokenKind::Comma)) break;
        continue;
      }
    }

    const Token & name = expect_name("parameter name");
    auto * param = ast_.create<Param>(kind, ast_.intern(name.text), name.range);
    if (allow_annotations && match(TokenKind::Colon)) {
      param->annotation = at(TokenKind::Star) ? parse_star_expression() : parse_test();
    }
    if (match(TokenKind::Eq)) {
      param->default_value = parse_test();
    }
    param->range_ = range_from(start);
    params.push_back(param);

    if (!match(TokenKind::Comma)) break;
  }
  return ast_.copy_to_arena(params);
}

gsl::span<Param *> Parser::parse_type_params()
{
  expect(TokenKind::LBracket, "'['");
  std::vector<Param *> params;
  while (!at(TokenKind::RBracket)) {
    const Token & start = cur();
    ParamKind kind = ParamKind::Normal;
    if (match(TokenKind::DoubleStar)) {
      kind = ParamKind::KwArgs;
    } else if (match(TokenKind::Star)) {
      kind = ParamKind::VarArgs;
    }

    const Token & name = expect_name("type parameter name");
    auto * param = ast_.create<Param>(kind, ast_.intern(name.text), name.range);
    if (match(TokenKind::Colon)) {
      param->annotation = parse_test();
    }
    if (match(TokenKind::Eq)) {
      param->default_value = at(TokenKind::Star) ? parse_star_expression() : parse_test();
    }
    param->range_ = range_from(start);
    params.push_back(param);

    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RBracket, "']' to close type parameters");
  if (params.empty()) {
    error_at(prev(), "type parameter list cannot be empty");
  }
  return ast_.copy_to_arena(params);
}

ClassDefStmt * Parser::parse_class_def(const std::vector<Expr *> & decorators, const Token & start)
{
  const Token & name_tok = expect_name("class name");
  auto * cls = ast_.create<ClassDefStmt>(ast_.intern(name_tok.text), name_tok.range, start.range);
  cls->decorators = ast_.copy_to_arena(decorators);
  if (at(TokenKind::LBracket)) {
    cls->type_params = parse_type_params();
  }

  if (match(TokenKind::LParen)) {
    cls->bases = parse_call_args();
    expect(TokenKind::RParen, "')' after class bases");
  }
  cls->body = parse_block();
  cls->range_ = range_from(start);
  return cls;
}

IfStmt * Parser::parse_if()
{
  const Token & start = advance();  // 'if' or 'elif'
  auto * stmt = ast_.create<IfStmt>(parse_named(), start.range);
  stmt->then_body = parse_block();

  if (at_kw("elif")) {
    std::vector<Stmt *> nested{parse_if()};
    stmt->else_body = ast_.copy_to_arena(nested);
  } else if (match_kw("else")) {
    stmt->else_body = parse_block();
  }
  stmt->range_ = range_from(start);
  return stmt;
}

WhileStmt * Parser::parse_while()
{
  const Token & start = advance();
  auto * stmt = ast_.create<WhileStmt>(parse_named(), start.range);
  stmt->body = parse_block();
  if (match_kw("else")) {
    stmt->else_body = parse_block();
  }
  stmt->range_ = range_from(start);
  return stmt;
}

ForStmt * Parser::parse_for(const Token & start, bool is_async)
{
  Expr * target = parse_target_list();
  check_target(target);
  expect_kw("in");
  Expr * iter = parse_star_expressions();

  auto * stmt = ast_.create<ForStmt>(target, iter, start.range);
  stmt->is_async = is_async;
  stmt->body = parse_block();
  if (match_kw("else")) {
    stmt->else_body = parse_block();
  }
  stmt->range_ = range_from(start);
  return stmt;
}

WithStmt * Parser::parse_with(const Token & start, bool is_async)
{
  // `with (a as b, c as d):` needs lookahead to tell it from a parenthesized context.
  bool parenthesized = false;
  if (at(TokenKind::LParen)) {
    int depth = 0;
    bool saw_as = false;
    size_t i = idx_;
    for (; i < tokens_.size(); ++i) {
      const TokenKind k = tokens_[i].kind;
      if (k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace) {
        ++depth;
      } else if (k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace) {
        if (--depth == 0) break;
      } else if (k == TokenKind::Eof) {
        break;
      } else if (depth == 1 && k == TokenKind::Identifier && tokens_[i].text == "as") {
        saw_as = true;
      }
    }
    parenthesized = saw_as && i + 1 < tokens_.size() && tokens_[i + 1].kind == TokenKind::Colon;
  }
  if (parenthesized) {
    advance();
  }

  std::vector<WithItem *> items;
  do {
    if (parenthesized && at(TokenKind::RParen)) break;
    const Token & item_start = cur();
    Expr * context = parse_test();
    Expr * target = nullptr;
    if (match_kw("as")) {
      target = parse_bitor();
      check_target(target);
    }
    items.push_back(ast_.create<WithItem>(context, target, range_from(item_start)));
  } while (match(TokenKind::Comma));

  if (parenthesized) {
    expect(TokenKind::RParen, "')' after with items");
  }

  auto * stmt = ast_.create<WithStmt>(ast_.copy_to_arena(items), start.range);
  stmt->is_async = is_async;
  stmt->body = parse_block();
  stmt->range_ = range_from(start);
  return stmt;
}

TryStmt * Parser::parse_try()
{
  const Token & start = advance();
  auto * stmt = ast_.create<TryStmt>(start.range);
  stmt->body = parse_block();

  std::vector<ExceptHandler *> handlers;
  while (at_kw("except")) {
    const Token & handler_start = advance();
    match(TokenKind::Star);  // except*
    auto * handler = ast_.create<ExceptHandler>(handler_start.range);
    if (!at(TokenKind::Colon)) {
      handler->type = parse_test();
      if (match_kw("as")) {
        handler->name = ast_.intern(expect_name("exception name").text);
      }
    }
    handler->body = parse_block();
    handler->range_ = range_from(handler_start);
    handlers.push_back(handler);
  }
  stmt->handlers = ast_.copy_to_arena(handlers);

  if (!handlers.empty() && match_kw("else")) {
    stmt->else_body = parse_block();
  }
  const bool has_finally = match_kw("finally");
  if (has_finally) {
    stmt->finally_body = parse_block();
  }
  if (handlers.empty() && !has_finally) {
    error_at(cur(), "expected 'except' or 'finally' block");
  }

  stmt->range_ = range_from(start);
  return stmt;
}

bool Parser::at_match_statement() const
{
  // `match` is a soft keyword: only `match <subject>:` ending the line starts a statement.
  if (!at_kw("match") || !can_start_expression(cur(1))) {
    return false;
  }
  int depth = 0;
  for (size_t i = idx_ + 1; i < tokens_.size(); ++i) {
    const TokenKind k = tokens_[i].kind;
    if (k == TokenKind::LParen || k == TokenKind::LBracket || k == TokenKind::LBrace) {
      ++depth;
    } else if (k == TokenKind::RParen || k == TokenKind::RBracket || k == TokenKind::RBrace) {
      --depth;
    } else if (k == TokenKind::Newline || k == TokenKind::Eof) {
      return false;
    } else if (depth == 0 && k == TokenKind::Colon) {
      return i + 1 < tokens_.size() && tokens_[i + 1].kind == TokenKind::Newline;
    }
  }
  return false;
}

MatchStmt * Parser::parse_match()
{
  const Token & start = advance();  // 'match'
  auto * stmt = ast_.create<MatchStmt>(parse_star_expressions(), start.range);
  expect(TokenKind::Colon, "':' after match subject");
  expect(TokenKind::Newline, "newline after match subject");
  if (!at(TokenKind::Indent)) {
    error_at(cur(), "expected an indented block of 'case' clauses");
  }
  advance();

  std::vector<MatchCase *> cases;
  while (!at(TokenKind::Dedent) && !at_eof()) {
    const Token & case_start = cur();
    if (!match_kw("case")) {
      error_at(cur(), "expected 'case', found " + describe(cur()));
    }
    Expr * pattern = parse_case_patterns();
    Expr * guard = match_kw("if") ? parse_named() : nullptr;
    auto * clause = ast_.create<MatchCase>(pattern, guard, case_start.range);
    clause->body = parse_block();
    clause->range_ = range_from(case_start);
    cases.push_back(clause);
  }
  match(TokenKind::Dedent);

  stmt->cases = ast_.copy_to_arena(cases);
  stmt->range_ = range_from(start);
  return stmt;
}

bool Parser::at_type_alias() const
{
  // `type` is a soft keyword: `type Name = ...` or `type Name[...] = ...`.
  return at_kw("type") && cur(1).kind == TokenKind::Identifier && !is_reserved(cur(1).text) &&
         (cur(2).kind == TokenKind::Eq || cur(2).kind == TokenKind::LBracket);
}

TypeAliasStmt * Parser::parse_type_alias()
{
  const Token & start = advance();  // 'type'
  const Token & name = expect_name("type alias name");
  auto * target = ast_.create<NameExpr>(ast_.intern(name.text), name.range);

  gsl::span<Param *> params;
  if (at(TokenKind::LBracket)) {
    params = parse_type_params();
  }
  expect(TokenKind::Eq, "'=' after type alias name");
  Expr * value = parse_test();

  auto * stmt = ast_.create<TypeAliasStmt>(target, value, range_from(start));
  stmt->type_params = params;
  return stmt;
}

// ============================================================================
// Patterns
// ============================================================================

Expr * Parser::parse_case_patterns()
{
  const Token & start = cur();
  Expr * first = parse_maybe_star_pattern();
  if (!at(TokenKind::Comma)) {
    if (isa<StarredExpr>(first)) {
      fail(first->get_range(), "star pattern outside a sequence pattern");
    }
    return first;
  }

  // `case a, *rest:` is an open sequence pattern.
  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::Colon) || at_kw("if")) break;
    elements.push_back(parse_maybe_star_pattern());
  }
  return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_maybe_star_pattern()
{
  if (at(TokenKind::Star)) {
    const Token & start = advance();
    const Token & name = expect_name("name after '*' in pattern");
    auto * target = ast_.create<NameExpr>(ast_.intern(name.text), name.range);
    return ast_.create<StarredExpr>(target, range_from(start));
  }
  return parse_pattern();
}

Expr * Parser::parse_pattern()
{
  const Token & start = cur();
  Expr * pattern = parse_or_pattern();
  if (!match_kw("as")) {
    return pattern;
  }
  const Token & name = expect_name("name after 'as'");
  auto * target = ast_.create<NameExpr>(ast_.intern(name.text), name.range);
  return ast_.create<AsPatternExpr>(pattern, target, range_from(start));
}

Expr * Parser::parse_or_pattern()
{
  Expr * lhs = parse_closed_pattern();
  while (match(TokenKind::Pipe)) {
    Expr * rhs = parse_closed_pattern();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitOr, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_closed_pattern()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Minus:
    case TokenKind::IntLiteral:
    case TokenKind::FloatLiteral:
      return parse_signed_number();
    case TokenKind::StringLiteral:
      return parse_strings();
    case TokenKind::LParen:
      return parse_sequence_pattern(TokenKind::RParen, false);
    case TokenKind::LBracket:
      return parse_sequence_pattern(TokenKind::RBracket, true);
    case TokenKind::LBrace:
      return parse_mapping_pattern();
    case TokenKind::Identifier:
      break;
    default:
      error_at(t, "expected a pattern, found " + describe(t));
  }

  if (t.text == "None" || t.text == "True" || t.text == "False") {
    return parse_atom();
  }

  // Capture, wildcard, or a dotted value pattern; a call is a class pattern.
  const Token & first = expect_name("pattern");
  Expr * e = ast_.create<NameExpr>(ast_.intern(first.text), first.range);
  while (match(TokenKind::Dot)) {
    const Token & name = expect_name("attribute name");
    e = ast_.create<AttributeExpr>(
      e, ast_.intern(name.text), name.range, join_ranges(e->get_range(), name.range));
  }
  if (at(TokenKind::LParen)) {
    return parse_class_pattern(e);
  }
  return e;
}

Expr * Parser::parse_signed_number()
{
  const Token & start = cur();
  const bool negative = match(TokenKind::Minus);
  if (!at(TokenKind::IntLiteral) && !at(TokenKind::FloatLiteral)) {
    error_at(cur(), "expected a number in pattern, found " + describe(cur()));
  }
  Expr * value = parse_atom();
  if (negative) {
    value = ast_.create<UnaryExpr>(UnaryOp::Neg, value, range_from(start));
  }

  // Complex literal: `1 + 2j`, `-1 - 2j`.
  if (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    if (!at(TokenKind::IntLiteral) && !at(TokenKind::FloatLiteral)) {
      error_at(cur(), "expected an imaginary number in pattern, found " + describe(cur()));
    }
    Expr * imaginary = parse_atom();
    value = ast_.create<BinaryExpr>(value, op, imaginary, range_from(start));
  }
  return value;
}

Expr * Parser::parse_sequence_pattern(TokenKind closer, bool is_list)
{
  const Token & start = advance();  // '(' or '['
  std::vector<Expr *> elements;
  bool trailing_comma = false;
  while (!at(closer)) {
    elements.push_back(parse_maybe_star_pattern());
    trailing_comma = match(TokenKind::Comma);
    if (!trailing_comma) break;
  }
  expect(closer, is_list ? "']' to close sequence pattern" : "')' to close pattern");

  // `(p)` groups a pattern; it is not a one-element sequence.
  if (!is_list && elements.size() == 1 && !trailing_comma && !isa<StarredExpr>(elements[0])) {
    return elements[0];
  }
  const auto items = ast_.copy_to_arena(elements);
  if (is_list) {
    return ast_.create<ListExpr>(items, range_from(start));
  }
  return ast_.create<TupleExpr>(items, range_from(start));
}

Expr * Parser::parse_mapping_pattern()
{
  const Token & start = advance();  // '{'
  std::vector<Expr *> keys;
  std::vector<Expr *> values;
  while (!at(TokenKind::RBrace)) {
    if (match(TokenKind::DoubleStar)) {
      const Token & name = expect_name("name after '**' in pattern");
      keys.push_back(nullptr);
      values.push_back(ast_.create<NameExpr>(ast_.intern(name.text), name.range));
    } else {
      keys.push_back(parse_closed_pattern());
      expect(TokenKind::Colon, "':' in mapping pattern");
      values.push_back(parse_pattern());
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RBrace, "'}' to close mapping pattern");
  return ast_.create<DictExpr>(
    ast_.copy_to_arena(keys), ast_.copy_to_arena(values), range_from(start));
}

Expr * Parser::parse_class_pattern(Expr * cls)
{
  advance();  // '('
  std::vector<Argument *> args;
  while (!at(TokenKind::RParen)) {
    const Token & start = cur();
    if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::Eq && !is_reserved(cur().text)) {
      const Token & name = advance();
      advance();  // '='
      Expr * value = parse_pattern();
      args.push_back(ast_.create<Argument>(
        ArgumentKind::Keyword, ast_.intern(name.text), value, range_from(start)));
    } else {
      Expr * value = parse_pattern();
      args.push_back(ast_.create<Argument>(
        ArgumentKind::Positional, std::string_view{}, value, range_from(start)));
    }
    if (!match(TokenKind::Comma)) break;
  }
  expect(TokenKind::RParen, "')' to close class pattern");
  return ast_.create<CallExpr>(
    cls, ast_.copy_to_arena(args), join_ranges(cls->get_range(), prev().range));
}

std::string_view Parser::parse_dotted_name()
{
  std::string dotted(expect_name("module name").text);
  while (match(TokenKind::Dot)) {
    dotted.push_back('.');
    dotted.append(expect_name("module name").text);
  }
  return ast_.intern(dotted);
}

Stmt * Parser::parse_import()
{
  const Token & start = advance();
  std::vector<ImportAlias *> names;
  do {
    const Token & name_start = cur();
    const std::string_view dotted = parse_dotted_name();
    std::string_view asname;
    if (match_kw("as")) {
      asname = ast_.intern(expect_name("alias").text);
    }
    names.push_back(ast_.create<ImportAlias>(dotted, asname, range_from(name_start)));
  } while (match(TokenKind::Comma));
  return ast_.create<ImportStmt>(ast_.copy_to_arena(names), range_from(start));
}

Stmt * Parser::parse_from_import()
{
  const Token & start = advance();

  uint32_t level = 0;
  while (at(TokenKind::Dot) || at(TokenKind::Ellipsis)) {
    level += at(TokenKind::Dot) ? 1 : 3;
    advance();
  }

  std::string_view module;
  if (!at_kw("import")) {
    module = parse_dotted_name();
  } else if (level == 0) {
    error_at(cur(), "expected module name");
  }
  expect_kw("import");

  std::vector<ImportAlias *> names;
  if (at(TokenKind::Star)) {
    const Token & star = advance();
    names.push_back(ast_.create<ImportAlias>(ast_.intern("*"), std::string_view{}, star.range));
  } else {
    const bool parenthesized = match(TokenKind::LParen);
    do {
      if (parenthesized && at(TokenKind::RParen)) break;
      const Token & name = expect_name("imported name");
      std::string_view asname;
      if (match_kw("as")) {
        asname = ast_.intern(expect_name("alias").text);
      }
      names.push_back(ast_.create<ImportAlias>(ast_.intern(name.text), asname, range_from(name)));
    } while (match(TokenKind::Comma));
    if (parenthesized) {
      expect(TokenKind::RParen, "')' after imported names");
    }
  }

  return ast_.create<ImportFromStmt>(module, level, ast_.copy_to_arena(names), range_from(start));
}

// ============================================================================
// Expressions
// ============================================================================

Expr * Parser::parse_star_expressions()
{
  const Token & start = cur();
  Expr * first = parse_star_expression();
  if (!at(TokenKind::Comma)) {
    return first;
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (!can_start_expression(cur())) break;
    elements.push_back(parse_star_expression());
  }
  return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_star_expression()
{
  if (at(TokenKind::Star)) {
    const Token & start = advance();
    Expr * value = parse_bitor();
    return ast_.create<StarredExpr>(value, range_from(start));
  }
  return parse_test();
}

Expr * Parser::parse_target_list()
{
  const Token & start = cur();
  std::vector<Expr *> elements;
  bool trailing_comma = false;
  do {
    if (at_kw("in")) break;
    elements.push_back(at(TokenKind::Star) ? parse_star_expression() : parse_bitor());
    trailing_comma = false;
    if (!at(TokenKind::Comma)) break;
    advance();
    trailing_comma = true;
  } while (true);

  if (elements.empty()) {
    error_at(cur(), "expected a target, found " + describe(cur()));
  }
  if (elements.size() == 1 && !trailing_comma) {
    return elements.front();
  }
  return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_test()
{
  if (at_kw("lambda")) {
    return parse_lambda();
  }

  Expr * body = parse_or();
  if (!match_kw("if")) {
    return body;
  }
  Expr * condition = parse_or();
  expect_kw("else");
  Expr * other = parse_test();
  return ast_.create<ConditionalExpr>(
    condition, body, other, join_ranges(body->get_range(), other->get_range()));
}

Expr * Parser::parse_named()
{
  if (at(TokenKind::Identifier) && cur(1).kind == TokenKind::ColonEq && !is_reserved(cur().text)) {
    const Token & name = advance();
    advance();  // ':='
    auto * target = ast_.create<NameExpr>(ast_.intern(name.text), name.range);
    Expr * value = parse_test();
    return ast_.create<NamedExpr>(target, value, range_from(name));
  }
  return parse_test();
}

Expr * Parser::parse_lambda()
{
  const Token & start = advance();
  const auto params = parse_params(TokenKind::Colon, false);
  expect(TokenKind::Colon, "':' after lambda parameters");
  Expr * body = parse_test();
  return ast_.create<LambdaExpr>(params, body, range_from(start));
}

Expr * Parser::parse_or()
{
  Expr * lhs = parse_and();
  while (match_kw("or")) {
    Expr * rhs = parse_and();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::Or, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_and()
{
  Expr * lhs = parse_not();
  while (match_kw("and")) {
    Expr * rhs = parse_not();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::And, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_not()
{
  if (at_kw("not")) {
    const Token & start = advance();
    Expr * operand = parse_not();
    return ast_.create<UnaryExpr>(UnaryOp::Not, operand, range_from(start));
  }
  return parse_comparison();
}

Expr * Parser::parse_comparison()
{
  Expr * lhs = parse_bitor();
  while (true) {
    BinaryOp op = BinaryOp::Eq;
    switch (cur().kind) {
      case TokenKind::EqEq:
        op = BinaryOp::Eq;
        break;
      case TokenKind::Ne:
        op = BinaryOp::Ne;
        break;
      case TokenKind::Lt:
        op = BinaryOp::Lt;
        break;
      case TokenKind::Le:
        op = BinaryOp::Le;
        break;
      case TokenKind::Gt:
        op = BinaryOp::Gt;
        break;
      case TokenKind::Ge:
        op = BinaryOp::Ge;
        break;
      default:
        if (at_kw("in")) {
          op = BinaryOp::In;
        } else if (at_kw("not") && at_kw("in", 1)) {
          advance();
          op = BinaryOp::NotIn;
        } else if (at_kw("is")) {
          if (at_kw("not", 1)) {
            advance();
            op = BinaryOp::IsNot;
          } else {
            op = BinaryOp::Is;
          }
        } else {
          return lhs;
        }
        break;
    }
    advance();
    Expr * rhs = parse_bitor();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
}

Expr * Parser::parse_bitor()
{
  Expr * lhs = parse_bitxor();
  while (match(TokenKind::Pipe)) {
    Expr * rhs = parse_bitxor();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitOr, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitxor()
{
  Expr * lhs = parse_bitand();
  while (match(TokenKind::Caret)) {
    Expr * rhs = parse_bitand();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitXor, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_bitand()
{
  Expr * lhs = parse_shift();
  while (match(TokenKind::Amp)) {
    Expr * rhs = parse_shift();
    lhs = ast_.create<BinaryExpr>(
      lhs, BinaryOp::BitAnd, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_shift()
{
  Expr * lhs = parse_arith();
  while (at(TokenKind::LShift) || at(TokenKind::RShift)) {
    const BinaryOp op = advance().kind == TokenKind::LShift ? BinaryOp::LShift : BinaryOp::RShift;
    Expr * rhs = parse_arith();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_arith()
{
  Expr * lhs = parse_term();
  while (at(TokenKind::Plus) || at(TokenKind::Minus)) {
    const BinaryOp op = advance().kind == TokenKind::Plus ? BinaryOp::Add : BinaryOp::Sub;
    Expr * rhs = parse_term();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
  return lhs;
}

Expr * Parser::parse_term()
{
  Expr * lhs = parse_factor();
  while (true) {
    BinaryOp op = BinaryOp::Eq;
    switch (cur().kind) {
      case TokenKind::Star:
        op = BinaryOp::Mul;
        break;
      case TokenKind::Slash:
        op = BinaryOp::Div;
        break;
      case TokenKind::DoubleSlash:
        op = BinaryOp::FloorDiv;
        break;
      case TokenKind::Percent:
        op = BinaryOp::Mod;
        break;
      case TokenKind::At:
        op = BinaryOp::MatMul;
        break;
      default:
        return lhs;
    }
    advance();
    Expr * rhs = parse_factor();
    lhs = ast_.create<BinaryExpr>(lhs, op, rhs, join_ranges(lhs->get_range(), rhs->get_range()));
  }
}

Expr * Parser::parse_factor()
{
  UnaryOp op = UnaryOp::Pos;
  switch (cur().kind) {
    case TokenKind::Plus:
      op = UnaryOp::Pos;
      break;
    case TokenKind::Minus:
      op = UnaryOp::Neg;
      break;
    case TokenKind::Tilde:
      op = UnaryOp::Invert;
      break;
    default:
      return parse_power();
  }
  const Token & start = advance();
  Expr * operand = parse_factor();
  return ast_.create<UnaryExpr>(op, operand, range_from(start));
}

Expr * Parser::parse_power()
{
  Expr * base = parse_await();
  if (!match(TokenKind::DoubleStar)) {
    return base;
  }
  Expr * exponent = parse_factor();
  return ast_.create<BinaryExpr>(
    base, BinaryOp::Pow, exponent, join_ranges(base->get_range(), exponent->get_range()));
}

Expr * Parser::parse_await()
{
  if (at_kw("await")) {
    const Token & start = advance();
    Expr * value = parse_postfix();
    return ast_.create<AwaitExpr>(value, range_from(start));
  }
  return parse_postfix();
}

Expr * Parser::parse_postfix()
{
  Expr * e = parse_atom();
  while (true) {
    if (match(TokenKind::LParen)) {
      const auto args = parse_call_args();
      expect(TokenKind::RParen, "')' to close call");
      e = ast_.create<CallExpr>(e, args, join_ranges(e->get_range(), prev().range));
    } else if (match(TokenKind::LBracket)) {
      Expr * index = parse_subscript_index();
      expect(TokenKind::RBracket, "']' to close subscript");
      e = ast_.create<SubscriptExpr>(e, index, join_ranges(e->get_range(), prev().range));
    } else if (match(TokenKind::Dot)) {
      const Token & name = expect_name("attribute name");
      e = ast_.create<AttributeExpr>(
        e, ast_.intern(name.text), name.range, join_ranges(e->get_range(), name.range));
    } else {
      return e;
    }
  }
}

gsl::span<Argument *> Parser::parse_call_args()
{
  std::vector<Argument *> args;
  while (!at(TokenKind::RParen)) {
    const Token & start = cur();

    if (match(TokenKind::DoubleStar)) {
      Expr * value = parse_test();
      args.push_back(ast_.create<Argument>(
        ArgumentKind::DoubleStar, std::string_view{}, value, range_from(start)));
    } else if (match(TokenKind::Star)) {
      Expr * value = parse_test();
      args.push_back(
        ast_.create<Argument>(ArgumentKind::Star, std::string_view{}, value, range_from(start)));
    } else if (
      at(TokenKind::Identifier) && cur(1).kind == TokenKind::Eq && !is_reserved(cur().text)) {
      const Token & name = advance();
      advance();  // '='
      Expr * value = parse_test();
      args.push_back(ast_.create<Argument>(
        ArgumentKind::Keyword, ast_.intern(name.text), value, range_from(start)));
    } else {
      Expr * value = parse_named();
      if (at_kw("for") || (at_kw("async") && at_kw("for", 1))) {
        // Bare generator argument: f(x for x in xs)
        const auto clauses = parse_comprehension_clauses();
        value = ast_.create<ComprehensionExpr>(
          ComprehensionKind::Generator, value, nullptr, clauses, range_from(start));
      }
      args.push_back(ast_.create<Argument>(
        ArgumentKind::Positional, std::string_view{}, value, range_from(start)));
    }

    if (!match(TokenKind::Comma)) break;
  }
  return ast_.copy_to_arena(args);
}

Expr * Parser::parse_subscript_index()
{
  const Token & start = cur();
  Expr * first = parse_slice_item();
  if (!at(TokenKind::Comma)) {
    return first;
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RBracket)) break;
    elements.push_back(parse_slice_item());
  }
  return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_slice_item()
{
  const Token & start = cur();
  Expr * lower = nullptr;
  if (!at(TokenKind::Colon)) {
    lower = at(TokenKind::Star) ? parse_star_expression() : parse_named();
    if (!at(TokenKind::Colon)) {
      return lower;
    }
  }
  advance();  // ':'

  const auto at_item_end = [&] {
    return at(TokenKind::RBracket) || at(TokenKind::Comma) || at(TokenKind::Colon);
  };
  Expr * upper = at_item_end() ? nullptr : parse_test();
  Expr * step = nullptr;
  if (match(TokenKind::Colon)) {
    step = at_item_end() ? nullptr : parse_test();
  }
  return ast_.create<SliceExpr>(lower, upper, step, range_from(start));
}

Expr * Parser::parse_atom()
{
  const Token & t = cur();
  switch (t.kind) {
    case TokenKind::Identifier:
      if (t.text == "None") {
        advance();
        return ast_.create<NoneLiteralExpr>(t.range);
      }
      if (t.text == "True" || t.text == "False") {
        advance();
        return ast_.create<BoolLiteralExpr>(t.text == "True", t.range);
      }
      if (is_reserved(t.text)) {
        error_at(t, "unexpected keyword '" + std::string(t.text) + "'");
      }
      advance();
      return ast_.create<NameExpr>(ast_.intern(t.text), t.range);

    case TokenKind::IntLiteral:
      advance();
      return ast_.create<IntLiteralExpr>(ast_.intern(t.text), t.range);

    case TokenKind::FloatLiteral:
      advance();
      return ast_.create<FloatLiteralExpr>(ast_.intern(t.text), t.range);

    case TokenKind::StringLiteral:
      return parse_strings();

    case TokenKind::Ellipsis:
      advance();
      return ast_.create<EllipsisExpr>(t.range);

    case TokenKind::LParen:
      return parse_paren_atom();
    case TokenKind::LBracket:
      return parse_list_atom();
    case TokenKind::LBrace:
      return parse_brace_atom();

    case TokenKind::Indent:
      error_at(t, "unexpected indent");

    default:
      error_at(t, "expected an expression, found " + describe(t));
  }
}

Expr * Parser::parse_paren_atom()
{
  const Token & start = advance();  // '('
  if (match(TokenKind::RParen)) {
    return ast_.create<TupleExpr>(gsl::span<Expr *>{}, range_from(start));
  }
  if (at_kw("yield")) {
    Expr * y = parse_yield();
    expect(TokenKind::RParen, "')'");
    return y;
  }

  Expr * first = at(TokenKind::Star) ? parse_star_expression() : parse_named();
  if (at_kw("for") || (at_kw("async") && at_kw("for", 1))) {
    const auto clauses = parse_comprehension_clauses();
    expect(TokenKind::RParen, "')' to close generator expression");
    return ast_.create<ComprehensionExpr>(
      ComprehensionKind::Generator, first, nullptr, clauses, range_from(start));
  }
  if (match(TokenKind::RParen)) {
    return first;
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RParen)) break;
    elements.push_back(at(TokenKind::Star) ? parse_star_expression() : parse_named());
  }
  expect(TokenKind::RParen, "')' to close tuple");
  return ast_.create<TupleExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_list_atom()
{
  const Token & start = advance();  // '['
  if (match(TokenKind::RBracket)) {
    return ast_.create<ListExpr>(gsl::span<Expr *>{}, range_from(start));
  }

  Expr * first = at(TokenKind::Star) ? parse_star_expression() : parse_named();
  if (at_kw("for") || (at_kw("async") && at_kw("for", 1))) {
    const auto clauses = parse_comprehension_clauses();
    expect(TokenKind::RBracket, "']' to close list comprehension");
    return ast_.create<ComprehensionExpr>(
      ComprehensionKind::List, first, nullptr, clauses, range_from(start));
  }

  std::vector<Expr *> elements{first};
  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RBracket)) break;
    elements.push_back(at(TokenKind::Star) ? parse_star_expression() : parse_named());
  }
  expect(TokenKind::RBracket, "']' to close list");
  return ast_.create<ListExpr>(ast_.copy_to_arena(elements), range_from(start));
}

Expr * Parser::parse_brace_atom()
{
  const Token & start = advance();  // '{'
  if (match(TokenKind::RBrace)) {
    return ast_.create<DictExpr>(gsl::span<Expr *>{}, gsl::span<Expr *>{}, range_from(start));
  }

  std::vector<Expr *> keys;
  std::vector<Expr *> values;

  if (match(TokenKind::DoubleStar)) {
    keys.push_back(nullptr);
    values.push_back(parse_bitor());
  } else {
    Expr * first = at(TokenKind::Star) ? parse_star_expression() : parse_named();

    if (!match(TokenKind::Colon)) {
      // Set display or set comprehension.
      if (at_kw("for") || (at_kw("async") && at_kw("for", 1))) {
        const auto clauses = parse_comprehension_clauses();
        expect(TokenKind::RBrace, "'}' to close set comprehension");
        return ast_.create<ComprehensionExpr>(
          ComprehensionKind::Set, first, nullptr, clauses, range_from(start));
      }
      std::vector<Expr *> elements{first};
      while (match(TokenKind::Comma)) {
        if (at(TokenKind::RBrace)) break;
        elements.push_back(at(TokenKind::Star) ? parse_star_expression() : parse_named());
      }
      expect(TokenKind::RBrace, "'}' to close set");
      return ast_.create<SetExpr>(ast_.copy_to_arena(elements), range_from(start));
    }

    Expr * value = parse_test();
    if (at_kw("for") || (at_kw("async") && at_kw("for", 1))) {
      const auto clauses = parse_comprehension_clauses();
      expect(TokenKind::RBrace, "'}' to close dict comprehension");
      return ast_.create<ComprehensionExpr>(
        ComprehensionKind::Dict, first, value, clauses, range_from(start));
    }
    keys.push_back(first);
    values.push_back(value);
  }

  while (match(TokenKind::Comma)) {
    if (at(TokenKind::RBrace)) break;
    if (match(TokenKind::DoubleStar)) {
      keys.push_back(nullptr);
      values.push_back(parse_bitor());
      continue;
    }
    keys.push_back(parse_test());
    expect(TokenKind::Colon, "':' in dict display");
    values.push_back(parse_test());
  }
  expect(TokenKind::RBrace, "'}' to close dict");
  return ast_.create<DictExpr>(
    ast_.copy_to_arena(keys), ast_.copy_to_arena(values), range_from(start));
}

gsl::span<ComprehensionClause *> Parser::parse_comprehension_clauses()
{
  std::vector<ComprehensionClause *> clauses;
  while (at_kw("for") || (at_kw("async") && at_kw("for", 1))) {
    const Token & start = cur();
    const bool is_async = match_kw("async");
    expect_kw("for");
    Expr * target = parse_target_list();
    check_target(target);
    expect_kw("in");
    Expr * iter = parse_or();

    std::vector<Expr *> conditions;
    while (match_kw("if")) {
      conditions.push_back(parse_or());
    }

    auto * clause =
      ast_.create<ComprehensionClause>(target, iter, ast_.copy_to_arena(conditions), range_from(start));
    clause->is_async = is_async;
    clauses.push_back(clause);
  }
  return ast_.copy_to_arena(clauses);
}

Expr * Parser::parse_yield()
{
  const Token & start = advance();  // 'yield'
  if (match_kw("from")) {
    Expr * value = parse_test();
    return ast_.create<YieldExpr>(value, true, range_from(start));
  }
  Expr * value = can_start_expression(cur()) ? parse_star_expressions() : nullptr;
  return ast_.create<YieldExpr>(value, false, range_from(start));
}

// ============================================================================
// String literals
// ============================================================================

Expr * Parser::parse_strings()
{
  const Token & start = cur();
  std::string value;
  bool is_bytes = false;
  bool is_formatted = false;

  // Adjacent literals concatenate.
  while (at(TokenKind::StringLiteral)) {
    bool bytes = false;
    bool formatted = false;
    decode_string(advance(), value, bytes, formatted);
    is_bytes = is_bytes || bytes;
    is_formatted = is_formatted || formatted;
  }

  auto * lit = ast_.create<StringLiteralExpr>(ast_.intern(value), range_from(start));
  lit->is_bytes = is_bytes;
  lit->is_formatted = is_formatted;
  return lit;
}

void Parser::decode_string(const Token & t, std::string & out, bool & is_bytes, bool & is_formatted)
{
  const std::string_view text = t.text;

  size_t i = 0;
  bool raw = false;
  while (i < text.size() && text[i] != '\'' && text[i] != '"') {
    const char c = static_cast<char>(std::tolower(static_cast<unsigned char>(text[i])));
    raw = raw || c == 'r';
    is_bytes = is_bytes || c == 'b';
    is_formatted = is_formatted || c == 'f';
    ++i;
  }

  const char quote = text[i];
  const bool triple = text.size() >= i + 6 && text[i + 1] == quote && text[i + 2] == quote;
  const size_t quote_len = triple ? 3 : 1;
  const std::string_view body = text.substr(i + quote_len, text.size() - i - 2 * quote_len);

  if (raw) {
    out.append(body);
    return;
  }

  for (size_t k = 0; k < body.size(); ++k) {
    const char c = body[k];
    if (c != '\\' || k + 1 >= body.size()) {
      out.push_back(c);
      continue;
    }

    const char esc = body[++k];
    uint32_t cp = 0;
    switch (esc) {
      case '\n':
        break;
      case '\r':
        if (k + 1 < body.size() && body[k + 1] == '\n') ++k;
        break;
      case 'n':
        out.push_back('\n');
        break;
      case 't':
        out.push_back('\t');
        break;
      case 'r':
        out.push_back('\r');
        break;
      case 'a':
        out.push_back('\a');
        break;
      case 'b':
        out.push_back('\b');
        break;
      case 'f':
        out.push_back('\f');
        break;
      case 'v':
        out.push_back('\v');
        break;
      case '\\':
      case '\'':
      case '"':
        out.push_back(esc);
        break;
      case 'x':
        if (read_digits(body, k + 1, 2, 16, cp)) {
          if (is_bytes) {
            out.push_back(static_cast<char>(cp));
          } else {
            append_utf8(out, cp);
          }
          k += 2;
        } else {
          out.push_back('\\');
          out.push_back(esc);
        }
        break;
      case 'u':
      case 'U': {
        const size_t count = esc == 'u' ? 4 : 8;
        if (!is_bytes && read_digits(body, k + 1, count, 16, cp) && cp <= 0x10FFFF) {
          append_utf8(out, cp);
          k += count;
        } else {
          out.push_back('\\');
          out.push_back(esc);
        }
        break;
      }
      default:
        if (esc >= '0' && esc <= '7') {
          size_t len = 1;
          while (len < 3 && k + len < body.size() && body[k + len] >= '0' && body[k + len] <= '7') {
            ++len;
          }
          (void)read_digits(body, k, len, 8, cp);
          if (is_bytes) {
            out.push_back(static_cast<char>(cp & 0xFF));
          } else {
            append_utf8(out, cp);
          }
          k += len - 1;
        } else {
          // Unknown escapes keep their backslash.
          out.push_back('\\');
          out.push_back(esc);
        }
        break;
    }
  }
}

}  // namespace schemaflow::syntax
