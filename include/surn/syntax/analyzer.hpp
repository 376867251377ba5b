// surn/syntax/analyzer.hpp - Token-level checks run before parsing
//
// The analyzer catches a few mistakes that are cheaper to spot on the flat
// token list than inside the parser, and reports all of them instead of
// stopping at the first.
//
#pragma once

#include <utility>
#include <vector>

#include "surn/basic/diagnostic.hpp"
#include "surn/syntax/token.hpp"
#include "surn/syntax/token_stream.hpp"

namespace surn::syntax
{

/**
 * Walks the token stream once, one token at a time.
 *
 * - A0001: an identifier followed (after trivia only) by another identifier.
 * - A0002: a `(` with no matching `)` before the end of input.
 */
class Analyzer
{
public:
  explicit Analyzer(std::vector<Token> tokens) : stream_(std::move(tokens)) {}

  /// Run every check at every position. Returns the number of problems found.
  size_t run(DiagnosticBag & diags);

private:
  void check_identifiers(DiagnosticBag & diags);
  void check_captures(DiagnosticBag & diags);

  TokenStream stream_;
};

/// Analyze `tokens`, adding findings to `diags`. True if nothing was found.
bool analyze(const std::vector<Token> & tokens, DiagnosticBag & diags);

}  // namespace surn::syntax
