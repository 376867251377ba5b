// surn/syntax/token_stream.hpp - Lookahead/consumption buffer over tokens
#pragma once

#include <cstddef>
#include <functional>
#include <optional>
#include <utility>
#include <vector>

#include "surn/syntax/token.hpp"

namespace surn::syntax
{

using TokenPredicate = std::function<bool(const Token &)>;

/**
 * Forward-only token buffer used by the AstGenerator.
 *
 * `first`/`second`/`nth` and the `*_if` variants never consume. `peek`
 * consumes exactly one token and remembers it as `prev()`.
 */
class TokenStream
{
public:
  explicit TokenStream(std::vector<Token> tokens) : tokens_(std::move(tokens)) {}

  [[nodiscard]] bool is_eof() const noexcept { return index_ >= tokens_.size(); }

  [[nodiscard]] std::optional<Token> first() const { return nth(0); }
  [[nodiscard]] std::optional<Token> second() const { return nth(1); }
  [[nodiscard]] std::optional<Token> nth(size_t n) const;

  [[nodiscard]] std::optional<Token> first_if(const TokenPredicate & pred) const;
  [[nodiscard]] std::optional<Token> second_if(const TokenPredicate & pred) const;
  [[nodiscard]] std::optional<Token> nth_if(size_t n, const TokenPredicate & pred) const;

  std::optional<Token> peek();
  std::optional<Token> peek_if(const TokenPredicate & pred);

  /**
   * Consume tokens while `pred` is false and return the first token for
   * which it holds, leaving that token unconsumed. Returns std::nullopt when
   * the stream runs out first.
   */
  std::optional<Token> peek_until(const TokenPredicate & pred);

  void peek_inc(size_t n);

  /**
   * Scan ahead (without consuming) past tokens matching `after` and return
   * the distance to, and the value of, the first token matching `find`.
   * A token matching both is treated as skippable.
   */
  [[nodiscard]] std::optional<std::pair<size_t, Token>> find_after(
    const TokenPredicate & find, const TokenPredicate & after) const
  {
    return find_after_nth(0, find, after);
  }

  /// find_after starting `n` tokens ahead.
  [[nodiscard]] std::optional<std::pair<size_t, Token>> find_after_nth(
    size_t n, const TokenPredicate & find, const TokenPredicate & after) const;

  /// Consume a maximal run of tokens satisfying `pred`.
  std::vector<Token> eat_while(const TokenPredicate & pred);

  [[nodiscard]] std::vector<Token> items() const;
  [[nodiscard]] size_t eaten() const noexcept { return index_; }
  [[nodiscard]] size_t remaining() const noexcept { return tokens_.size() - index_; }
  [[nodiscard]] const std::optional<Token> & prev() const noexcept { return prev_; }

private:
  std::vector<Token> tokens_;
  size_t index_ = 0;
  std::optional<Token> prev_;
};

}  // namespace surn::syntax
