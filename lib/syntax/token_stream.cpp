// surn/syntax/token_stream.cpp
#include "surn/syntax/token_stream.hpp"

namespace surn::syntax
{

std::optional<Token> TokenStream::nth(size_t n) const
{
  if (index_ + n >= tokens_.size()) {
    return std::nullopt;
  }
  return tokens_[index_ + n];
}

std::optional<Token> TokenStream::first_if(const TokenPredicate & pred) const
{
  return nth_if(0, pred);
}

std::optional<Token> TokenStream::second_if(const TokenPredicate & pred) const
{
  return nth_if(1, pred);
}

std::optional<Token> TokenStream::nth_if(size_t n, const TokenPredicate & pred) const
{
  auto tok = nth(n);
  if (tok && pred(*tok)) {
    return tok;
  }
  return std::nullopt;
}

std::optional<Token> TokenStream::peek()
{
  if (is_eof()) {
    return std::nullopt;
  }
  prev_ = tokens_[index_++];
  return prev_;
}

std::optional<Token> TokenStream::peek_if(const TokenPredicate & pred)
{
  auto tok = first_if(pred);
  if (tok) {
    (void)peek();
  }
  return tok;
}

std::optional<Token> TokenStream::peek_until(const TokenPredicate & pred)
{
  while (!is_eof()) {
    const Token & next = tokens_[index_];
    if (pred(next)) {
      return next;
    }
    (void)peek();
  }
  return std::nullopt;
}

void TokenStream::peek_inc(size_t n)
{
  for (size_t i = 0; i < n && !is_eof(); ++i) {
    (void)peek();
  }
}

std::optional<std::pair<size_t, Token>> TokenStream::find_after_nth(
  size_t n, const TokenPredicate & find, const TokenPredicate & after) const
{
  for (size_t i = n;; ++i) {
    const auto tok = nth(i);
    if (!tok) {
      return std::nullopt;
    }
    if (after(*tok)) {
      continue;
    }
    if (find(*tok)) {
      return std::make_pair(i, *tok);
    }
    return std::nullopt;
  }
}

std::vector<Token> TokenStream::eat_while(const TokenPredicate & pred)
{
  std::vector<Token> out;
  while (!is_eof() && pred(tokens_[index_])) {
    out.push_back(*peek());
  }
  return out;
}

std::vector<Token> TokenStream::items() const
{
  return {tokens_.begin() + static_cast<std::ptrdiff_t>(index_), tokens_.end()};
}

}  // namespace surn::syntax
