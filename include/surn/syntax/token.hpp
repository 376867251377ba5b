// surn/syntax/token.hpp - Token kinds and the Token record
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "surn/basic/source_manager.hpp"
#include "surn/syntax/keywords.hpp"
#include "surn/syntax/position.hpp"

namespace surn::syntax
{

enum class TokenKind : uint8_t {
  // Trivia; kept in the stream, the parser skips it explicitly
  Whitespace,
  Comment,

  Operator,  // + - * / % = < > & | ^ ~ and or
  KeyWord,
  Boolean,
  Identifier,
  Number,
  String,  // value is the contents, range includes delimiters

  Accessor,  // . or ::
  Colon,
  Range,  // ..

  LeftBracket,
  RightBracket,
  LeftParen,
  RightParen,
  LeftBrace,
  RightBrace,

  StatementEnd,  // ;
  Comma,
  Backslash,
};

struct Token
{
  TokenKind kind = TokenKind::Whitespace;
  KeyWord keyword = KeyWord::Namespace;  // meaningful only when kind == KeyWord
  SourceRange range;
  std::optional<std::string_view> value;  // absent for keywords
  Position start_pos;
  Position end_pos;

  [[nodiscard]] uint32_t begin() const noexcept { return range.start(); }
  [[nodiscard]] uint32_t end() const noexcept { return range.end(); }
  [[nodiscard]] std::string_view text() const noexcept { return value.value_or(""); }

  [[nodiscard]] Region region() const { return Region(start_pos, end_pos); }

  [[nodiscard]] bool is(TokenKind k) const noexcept { return kind == k; }
  [[nodiscard]] bool is_keyword(KeyWord k) const noexcept
  {
    return kind == TokenKind::KeyWord && keyword == k;
  }
  [[nodiscard]] bool is_trivia() const noexcept
  {
    return kind == TokenKind::Whitespace || kind == TokenKind::Comment;
  }
  [[nodiscard]] bool is_operator(std::string_view op) const noexcept
  {
    return kind == TokenKind::Operator && text() == op;
  }
  [[nodiscard]] bool is_visibility() const noexcept
  {
    return kind == TokenKind::KeyWord && syntax::is_visibility(keyword);
  }

  /// Source-like spelling for messages ("var", "(", "foo", ...).
  [[nodiscard]] std::string spelling() const;
};

/// Display name of a token kind.
[[nodiscard]] constexpr std::string_view to_string(TokenKind k) noexcept
{
  switch (k) {
    case TokenKind::Whitespace:
      return "Whitespace";
    case TokenKind::Comment:
      return "Comment";
    case TokenKind::Operator:
      return "Operator";
    case TokenKind::KeyWord:
      return "KeyWord";
    case TokenKind::Boolean:
      return "Boolean";
    case TokenKind::Identifier:
      return "Identifier";
    case TokenKind::Number:
      return "Number";
    case TokenKind::String:
      return "String";
    case TokenKind::Accessor:
      return "Accessor";
    case TokenKind::Colon:
      return "Colon";
    case TokenKind::Range:
      return "Range";
    case TokenKind::LeftBracket:
    case TokenKind::LeftParen:
    case TokenKind::LeftBrace:
      return "Opening Delimiter";
    case TokenKind::RightBracket:
    case TokenKind::RightParen:
    case TokenKind::RightBrace:
      return "Closing Delimiter";
    case TokenKind::StatementEnd:
      return "Statement End";
    case TokenKind::Comma:
      return "Comma";
    case TokenKind::Backslash:
      return "Backslash";
  }
  return "";
}

}  // namespace surn::syntax
