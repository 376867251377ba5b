// surn/syntax/analyzer.cpp
#include "surn/syntax/analyzer.hpp"

#include <fmt/core.h>

namespace surn::syntax
{

size_t Analyzer::run(DiagnosticBag & diags)
{
  const size_t before = diags.size();
  while (!stream_.is_eof()) {
    check_identifiers(diags);
    check_captures(diags);
    (void)stream_.peek();
  }
  return diags.size() - before;
}

void Analyzer::check_identifiers(DiagnosticBag & diags)
{
  const auto token = stream_.first_if([](const Token & t) { return t.is(TokenKind::Identifier); });
  if (!token) {
    return;
  }
  const auto found = stream_.find_after_nth(
    1, [](const Token & t) { return t.is(TokenKind::Identifier); },
    [](const Token & t) { return t.is_trivia(); });
  if (!found) {
    return;
  }

  const Token & second = found->second;
  diags
    .report_error(
      token->range.merge(second.range),
      "Identifiers can never be next to each other in this context.",
      fmt::format(
        "\"{}\" at {} is followed by \"{}\" at {}", token->text(), token->region().to_string(),
        second.text(), second.region().to_string()))
    .with_code(diag_codes::k_adjacent_identifiers)
    .with_help("separate the names with an operator or a comma");

  // Land on the second identifier; run() consumes it, so it is not reported again.
  stream_.peek_inc(found->first);
}

void Analyzer::check_captures(DiagnosticBag & diags)
{
  const auto open = stream_.first_if([](const Token & t) { return t.is(TokenKind::LeftParen); });
  if (!open) {
    return;
  }

  size_t depth = 0;
  for (size_t i = 1;; ++i) {
    const auto tok = stream_.nth(i);
    if (!tok) {
      break;
    }
    if (tok->is(TokenKind::LeftParen)) {
      ++depth;
    } else if (tok->is(TokenKind::RightParen)) {
      if (depth == 0) {
        return;
      }
      --depth;
    }
  }

  diags
    .report_error(
      open->range, fmt::format("Parenthesis at {} is never closed.", open->region().to_string()),
      "this parenthesis is never closed")
    .with_code(diag_codes::k_unclosed_paren);
}

bool analyze(const std::vector<Token> & tokens, DiagnosticBag & diags)
{
  Analyzer analyzer(tokens);
  return analyzer.run(diags) == 0;
}

}  // namespace surn::syntax
