// schemaflow/syntax/parser.hpp - Recursive-descent parser for analyzed sources
#pragma once

#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "schemaflow/ast/ast.hpp"
#include "schemaflow/ast/ast_context.hpp"
#include "schemaflow/basic/diagnostic.hpp"
#include "schemaflow/basic/source_manager.hpp"
#include "schemaflow/syntax/token.hpp"

namespace schemaflow::syntax
{

/**
 * Builds a Module from a token stream.
 *
 * Parsing stops at the first syntax error: exactly one ParseError diagnostic
 * is reported and parse_module() returns nullptr. There is no recovery; a
 * file with a syntax error takes no further part in analysis.
 */
class Parser
{
public:
  Parser(AstContext & ast, FileId file_id, DiagnosticBag & diags, std::vector<Token> tokens)
  : ast_(ast), file_id_(file_id), diags_(diags), tokens_(std::move(tokens))
  {
  }

  [[nodiscard]] Module * parse_module();

  /// Parse the whole token stream as a single expression (annotation text).
  [[nodiscard]] Expr * parse_standalone_expression();

private:
  struct ParseAbort
  {
  };

  // Token helpers
  [[nodiscard]] const Token & cur(size_t lookahead = 0) const;
  [[nodiscard]] const Token & prev() const;
  [[nodiscard]] bool at(TokenKind k) const;
  [[nodiscard]] bool at_eof() const;
  [[nodiscard]] bool at_kw(std::string_view kw, size_t lookahead = 0) const;

  const Token & advance();
  bool match(TokenKind k);
  bool match_kw(std::string_view kw);
  const Token & expect(TokenKind k, std::string_view what);
  const Token & expect_kw(std::string_view kw);
  const Token & expect_name(std::string_view what);

  [[noreturn]] void error_at(const Token & t, std::string_view msg);
  [[noreturn]] void fail(SourceRange range, std::string msg);
  void check_target(const Expr * target);

  [[nodiscard]] static bool is_reserved(std::string_view ident);
  [[nodiscard]] static bool can_start_expression(const Token & t);
  [[nodiscard]] SourceRange range_from(const Token & start) const;
  [[nodiscard]] SourceRange range_from(SourceRange start) const;

  // Statements
  void parse_statement(std::vector<Stmt *> & out);
  void parse_simple_statements(std::vector<Stmt *> & out);
  [[nodiscard]] Stmt * parse_simple_statement();
  [[nodiscard]] Stmt * parse_expression_statement();
  [[nodiscard]] Stmt * parse_compound_statement();
  [[nodiscard]] gsl::span<Stmt *> parse_block();

  [[nodiscard]] Stmt * parse_decorated();
  [[nodiscard]] FunctionDefStmt * parse_function_def(
    const std::vector<Expr *> & decorators, const Token & start, bool is_async);
  [[nodiscard]] ClassDefStmt * parse_class_def(
    const std::vector<Expr *> & decorators, const Token & start);
  [[nodiscard]] IfStmt * parse_if();
  [[nodiscard]] WhileStmt * parse_while();
  [[nodiscard]] ForStmt * parse_for(const Token & start, bool is_async);
  [[nodiscard]] WithStmt * parse_with(const Token & start, bool is_async);
  [[nodiscard]] TryStmt * parse_try();
  [[nodiscard]] bool at_match_statement() const;
  [[nodiscard]] MatchStmt * parse_match();
  [[nodiscard]] bool at_type_alias() const;
  [[nodiscard]] TypeAliasStmt * parse_type_alias();
  [[nodiscard]] Stmt * parse_import();
  [[nodiscard]] Stmt * parse_from_import();
  [[nodiscard]] std::string_view parse_dotted_name();

  [[nodiscard]] gsl::span<Param *> parse_params(TokenKind closer, bool allow_annotations);
  [[nodiscard]] gsl::span<Param *> parse_type_params();

  // Patterns (`case` clauses)
  [[nodiscard]] Expr * parse_case_patterns();
  [[nodiscard]] Expr * parse_pattern();
  [[nodiscard]] Expr * parse_maybe_star_pattern();
  [[nodiscard]] Expr * parse_or_pattern();
  [[nodiscard]] Expr * parse_closed_pattern();
  [[nodiscard]] Expr * parse_signed_number();
  [[nodiscard]] Expr * parse_sequence_pattern(TokenKind closer, bool is_list);
  [[nodiscard]] Expr * parse_mapping_pattern();
  [[nodiscard]] Expr * parse_class_pattern(Expr * cls);

  // Expressions
  [[nodiscard]] Expr * parse_star_expressions();
  [[nodiscard]] Expr * parse_star_expression();
  [[nodiscard]] Expr * parse_target_list();
  [[nodiscard]] Expr * parse_test();
  [[nodiscard]] Expr * parse_named();
  [[nodiscard]] Expr * parse_lambda();
  [[nodiscard]] Expr * parse_or();
  [[nodiscard]] Expr * parse_and();
  [[nodiscard]] Expr * parse_not();
  [[nodiscard]] Expr * parse_comparison();
  [[nodiscard]] Expr * parse_bitor();
  [[nodiscard]] Expr * parse_bitxor();
  [[nodiscard]] Expr * parse_bitand();
  [[nodiscard]] Expr * parse_shift();
  [[nodiscard]] Expr * parse_arith();
  [[nodiscard]] Expr * parse_term();
  [[nodiscard]] Expr * parse_factor();
  [[nodiscard]] Expr * parse_power();
  [[nodiscard]] Expr * parse_await();
  [[nodiscard]] Expr * parse_postfix();
  [[nodiscard]] Expr * parse_atom();

  [[nodiscard]] gsl::span<Argument *> parse_call_args();
  [[nodiscard]] Expr * parse_subscript_index();
  [[nodiscard]] Expr * parse_slice_item();
  [[nodiscard]] Expr * parse_paren_atom();
  [[nodiscard]] Expr * parse_list_atom();
  [[nodiscard]] Expr * parse_brace_atom();
  [[nodiscard]] gsl::span<ComprehensionClause *> parse_comprehension_clauses();
  [[nodiscard]] Expr * parse_strings();
  [[nodiscard]] Expr * parse_yield();

  void decode_string(const Token & t, std::string & out, bool & is_bytes, bool & is_formatted);

  AstContext & ast_;
  FileId file_id_;
  DiagnosticBag & diags_;
  std::vector<Token> tokens_;
  size_t idx_ = 0;
};

/**
 * Parse the text of a string-literal annotation as an expression. `base_offset`
 * is the offset of the text inside its file. Returns nullptr when the text is
 * not a valid expression; no diagnostic is reported.
 */
[[nodiscard]] Expr * parse_expression_text(
  AstContext & ast, FileId file_id, std::string_view text, uint32_t base_offset);

}  // namespace schemaflow::syntax
