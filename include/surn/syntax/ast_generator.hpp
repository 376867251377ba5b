// surn/syntax/ast_generator.hpp - Recursive-descent parser producing the AST
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <vector>

#include "surn/ast/ast.hpp"
#include "surn/ast/ast_context.hpp"
#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"
#include "surn/driver/context.hpp"
#include "surn/syntax/token_stream.hpp"

namespace surn::syntax
{

// ============================================================================
// Options
// ============================================================================

/**
 * How a chain `a op b op c` is grouped.
 *
 * RightRecursive reparses a full expression after every operator, so every
 * chain nests to the right regardless of the operators involved
 * (`a * b + c` is `a * (b + c)`). PrecedenceClimbing groups by
 * operator_precedence(), left-associative except for `=`.
 */
enum class OperatorPolicy : uint8_t {
  RightRecursive,
  PrecedenceClimbing,
};

[[nodiscard]] constexpr std::string_view to_string(OperatorPolicy p) noexcept
{
  switch (p) {
    case OperatorPolicy::RightRecursive:
      return "right_recursive";
    case OperatorPolicy::PrecedenceClimbing:
      return "precedence_climbing";
  }
  return "";
}

[[nodiscard]] constexpr std::optional<OperatorPolicy> operator_policy_from_string(
  std::string_view s) noexcept
{
  if (s == "right_recursive") return OperatorPolicy::RightRecursive;
  if (s == "precedence_climbing") return OperatorPolicy::PrecedenceClimbing;
  return std::nullopt;
}

struct ParserOptions
{
  OperatorPolicy operator_policy = OperatorPolicy::RightRecursive;
};

// ============================================================================
// Parsed<T> - tri-state production result
// ============================================================================

enum class ParseState : uint8_t {
  NoMatch,  ///< Nothing consumed; the caller may try the next alternative
  Matched,
  Failed,  ///< Committed and hit an error; the diagnostic is on the generator
};

/// Tag returned by AstGenerator::fail(); converts to any Parsed<T>.
struct ParseFailure
{
};

template <typename T>
class Parsed
{
public:
  Parsed() = default;
  Parsed(T value) : state_(ParseState::Matched), value_(std::move(value)) {}
  Parsed(ParseFailure /*tag*/) noexcept : state_(ParseState::Failed) {}

  /// Upcast, e.g. Parsed<VariableStmt *> to Parsed<Stmt *>.
  template <
    typename U, std::enable_if_t<!std::is_same_v<U, T> && std::is_convertible_v<U, T>, int> = 0>
  Parsed(const Parsed<U> & other) : state_(other.state())
  {
    if (other.matched()) {
      value_ = other.value();
    }
  }

  [[nodiscard]] ParseState state() const noexcept { return state_; }
  [[nodiscard]] bool matched() const noexcept { return state_ == ParseState::Matched; }
  [[nodiscard]] bool failed() const noexcept { return state_ == ParseState::Failed; }
  [[nodiscard]] bool no_match() const noexcept { return state_ == ParseState::NoMatch; }

  [[nodiscard]] const T & value() const noexcept { return value_; }
  [[nodiscard]] T & value() noexcept { return value_; }

private:
  ParseState state_ = ParseState::NoMatch;
  T value_{};
};

// ============================================================================
// ParseResult
// ============================================================================

/// The nodes parsed so far, and the error that stopped parsing (if any).
struct ParseResult
{
  AstBody body;
  std::optional<Diagnostic> error;

  [[nodiscard]] bool ok() const noexcept { return !error.has_value(); }
};

// ============================================================================
// AstGenerator
// ============================================================================

/**
 * Turns a token stream into an AstBody.
 *
 * Every production peeks before it consumes. Alternatives are tried in a
 * fixed order and the first match wins; once a production has consumed a
 * token any error is final and no sibling alternative is attempted.
 *
 *   statement  : namespace | static | variable | function | class
 *              | type alias | import
 *   expression : (statement | call | member | new | array | object | literal)
 *                (operator expression)?
 *
 * Parsing stops at the first error. The nodes completed before it are
 * returned alongside the diagnostic.
 */
class AstGenerator
{
public:
  AstGenerator(AstContext & ast, Context & context, ParserOptions options = {})
  : ast_(ast), context_(context), options_(options), file_(context.file_id())
  {
  }

  [[nodiscard]] ParseResult begin_parse(TokenStream tokens);

private:
  // --- Statements ---
  Parsed<Stmt *> parse_statement();
  Parsed<NamespaceStmt *> parse_namespace();
  Parsed<StaticStmt *> parse_static();
  Parsed<VariableStmt *> parse_variable();
  Parsed<FunctionStmt *> parse_function_statement();
  Parsed<FunctionStmt *> parse_function(uint32_t start, Visibility visibility);
  Parsed<std::vector<FunctionInput *>> parse_function_inputs();
  Parsed<ClassStmt *> parse_class();
  Parsed<ClassProperty *> parse_class_property(Visibility visibility);
  Parsed<AstNode *> parse_class_member();
  Parsed<TypeDefStmt *> parse_type_alias();
  Parsed<ImportStmt *> parse_import();
  Parsed<BlockStmt *> parse_block();
  Parsed<ReturnStmt *> parse_return();

  // --- Types ---
  Parsed<TypeNode *> parse_type();
  Parsed<TypeNode *> parse_type_atom();
  Parsed<std::vector<TypeParam *>> parse_type_generics();

  // --- Expressions ---
  Parsed<Expr *> parse_expression();
  Parsed<Expr *> parse_operand();
  Parsed<Expr *> parse_right_recursive(Expr * left, uint32_t start);
  Parsed<Expr *> parse_binary_rhs(int min_precedence, Expr * lhs, uint32_t start);
  Parsed<CallExpr *> parse_call();
  Parsed<std::vector<Expr *>> parse_call_arguments(uint32_t start);
  Parsed<MemberExpr *> parse_member();
  Parsed<NewExpr *> parse_new();
  Parsed<ArrayExpr *> parse_array();
  Parsed<ObjectExpr *> parse_object();
  Parsed<LiteralExpr *> parse_literal();

  // --- Helpers ---
  void skip_trivia();

  /// Skip trivia; if the stream is exhausted, record an error spanning the
  /// unfinished construct that began at `start`.
  bool skip_trivia_required(uint32_t start, std::string_view message);

  /// Record the error that stops the parse.
  ParseFailure fail(SourceRange range, std::string message, std::string label);

  /// Visibility keyword at the front of the stream, if directly followed
  /// (after trivia) by a token satisfying `next`.
  std::optional<Visibility> visibility_before(const TokenPredicate & next) const;

  [[nodiscard]] uint32_t start_offset() const;
  [[nodiscard]] uint32_t end_offset() const;
  [[nodiscard]] SourceRange here() const;
  [[nodiscard]] SourceRange span_from(uint32_t start) const;
  [[nodiscard]] std::string describe_next() const;
  [[nodiscard]] std::string_view intern(const Token & tok) { return ast_.intern(tok.text()); }

  template <typename T>
  gsl::span<T> freeze(const std::vector<T> & items)
  {
    return ast_.copy_to_arena(items);
  }

  AstContext & ast_;
  Context & context_;
  ParserOptions options_;
  FileId file_;
  TokenStream tokens_{std::vector<Token>{}};
  std::optional<Diagnostic> error_;
};

/// Tokenize and parse `source` in one call (no lexical diagnostics).
[[nodiscard]] ParseResult parse_source(
  std::string_view source, AstContext & ast, Context & context, ParserOptions options = {});

}  // namespace surn::syntax
