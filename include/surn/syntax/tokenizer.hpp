// surn/syntax/tokenizer.hpp - Source text to token list
#pragma once

#include <cstdint>
#include <string_view>
#include <vector>

#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"
#include "surn/syntax/cursor.hpp"
#include "surn/syntax/position.hpp"
#include "surn/syntax/token.hpp"

namespace surn::syntax
{

enum class LexErrorKind : uint8_t {
  UnknownCharacter,
  UnterminatedString,
  UnterminatedComment,
};

struct LexError
{
  LexErrorKind kind = LexErrorKind::UnknownCharacter;
  SourceRange range;
  Region region;
  std::string_view text;  // offending lexeme
};

struct LexResult
{
  std::vector<Token> tokens;
  std::vector<LexError> errors;
};

/**
 * Splits source text into tokens.
 *
 * Rules are tried in a fixed order at every position and the first one that
 * matches consumes its whole lexeme: whitespace, comment, operator, keyword,
 * boolean, identifier, number, string, accessor/colon/range, punctuation.
 * A character no rule accepts is consumed without producing a token and is
 * recorded as a LexError.
 */
class Tokenizer
{
public:
  Tokenizer(FileId file_id, std::string_view src) noexcept
  : file_id_(file_id), src_(src), cursor_(src)
  {
  }

  [[nodiscard]] LexResult run();

private:
  bool lex_whitespace();
  bool lex_comment();
  bool lex_operator();
  bool lex_keyword();
  bool lex_boolean();
  bool lex_identifier();
  bool lex_number();
  bool lex_string();
  bool lex_value_reserved();
  bool lex_punctuation();
  void skip_unknown();

  /// Emit a token covering [start, current offset).
  void emit(
    TokenKind kind, size_t start, Position start_pos, bool with_value = true,
    KeyWord keyword = KeyWord::Namespace);

  void error(LexErrorKind kind, size_t start, Position start_pos);

  [[nodiscard]] SourceRange make_range(size_t start, size_t end) const noexcept
  {
    return {file_id_, static_cast<uint32_t>(start), static_cast<uint32_t>(end)};
  }

  FileId file_id_;
  std::string_view src_;
  Cursor cursor_;
  LexResult out_;
};

/// Tokenize a detached string (no registered file).
[[nodiscard]] std::vector<Token> tokenize(std::string_view source);

/// Tokenize a registered file.
[[nodiscard]] LexResult tokenize(FileId file_id, std::string_view source);

/// Turn lexical errors into diagnostics (L0001..L0003).
void report_lex_errors(const std::vector<LexError> & errors, DiagnosticBag & diags);

}  // namespace surn::syntax
