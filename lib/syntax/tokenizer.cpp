// surn/syntax/tokenizer.cpp
#include "surn/syntax/tokenizer.hpp"

#include <fmt/core.h>

#include <string>

namespace surn::syntax
{

namespace
{

[[nodiscard]] bool is_operator_char(char32_t c) noexcept
{
  switch (c) {
    case U'+':
    case U'-':
    case U'*':
    case U'/':
    case U'%':
    case U'=':
    case U'<':
    case U'>':
    case U'&':
    case U'|':
    case U'^':
    case U'~':
      return true;
    default:
      return false;
  }
}

[[nodiscard]] bool is_string_delimiter(char32_t c) noexcept
{
  return c == U'"' || c == U'\'' || c == U'`';
}

}  // namespace

LexResult Tokenizer::run()
{
  while (!cursor_.is_eof()) {
    if (lex_whitespace() || lex_comment() || lex_operator() || lex_keyword() || lex_boolean() ||
        lex_identifier() || lex_number() || lex_string() || lex_value_reserved() ||
        lex_punctuation()) {
      continue;
    }
    skip_unknown();
  }
  return std::move(out_);
}

void Tokenizer::emit(
  TokenKind kind, size_t start, Position start_pos, bool with_value, KeyWord keyword)
{
  Token t;
  t.kind = kind;
  t.keyword = keyword;
  t.range = make_range(start, cursor_.offset());
  if (with_value) {
    t.value = src_.substr(start, cursor_.offset() - start);
  }
  t.start_pos = start_pos;
  t.end_pos = cursor_.position();
  out_.tokens.push_back(t);
}

void Tokenizer::error(LexErrorKind kind, size_t start, Position start_pos)
{
  LexError e;
  e.kind = kind;
  e.range = make_range(start, cursor_.offset());
  e.region = Region(start_pos, cursor_.position());
  e.text = src_.substr(start, cursor_.offset() - start);
  out_.errors.push_back(e);
}

bool Tokenizer::lex_whitespace()
{
  if (!is_whitespace(cursor_.first())) {
    return false;
  }
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();
  (void)cursor_.eat_while(is_whitespace);
  emit(TokenKind::Whitespace, start, pos);
  return true;
}

bool Tokenizer::lex_comment()
{
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();

  if (cursor_.starts_with("//")) {
    (void)cursor_.eat_while([](char32_t c) { return c != U'\n'; });
    emit(TokenKind::Comment, start, pos);
    return true;
  }

  if (!cursor_.starts_with("/*")) {
    return false;
  }

  cursor_.peek_inc(2);
  int depth = 1;
  (void)cursor_.eat_while_cursor([&depth](Cursor & c, char32_t ch) {
    if (ch == U'/' && c.second() == U'*') {
      c.peek_inc(2);
      ++depth;
      return true;
    }
    if (ch == U'*' && c.second() == U'/') {
      c.peek_inc(2);
      --depth;
      return depth > 0;
    }
    return true;
  });

  emit(TokenKind::Comment, start, pos);
  if (depth > 0) {
    error(LexErrorKind::UnterminatedComment, start, pos);
  }
  return true;
}

bool Tokenizer::lex_operator()
{
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();

  if (is_operator_char(cursor_.first())) {
    (void)cursor_.peek();
    emit(TokenKind::Operator, start, pos);
    return true;
  }

  for (const std::string_view word : {std::string_view("and"), std::string_view("or")}) {
    if (cursor_.starts_with(word) && !is_ident_continue(cursor_.nth_char(word.size()))) {
      cursor_.peek_inc(word.size());
      emit(TokenKind::Operator, start, pos);
      return true;
    }
  }
  return false;
}

bool Tokenizer::lex_keyword()
{
  if (!is_ident_start(cursor_.first())) {
    return false;
  }

  // Identifier characters are ASCII, so code point count == byte count here.
  size_t len = 0;
  while (len <= k_max_keyword_length && is_ident_continue(cursor_.nth_char(len))) {
    ++len;
  }
  if (len > k_max_keyword_length) {
    return false;
  }

  const auto kw = keyword_from_string(cursor_.rest().substr(0, len));
  if (!kw || !is_whitespace(cursor_.nth_char(len))) {
    return false;
  }

  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();
  cursor_.peek_inc(len);
  emit(TokenKind::KeyWord, start, pos, false, *kw);
  return true;
}

bool Tokenizer::lex_boolean()
{
  for (const std::string_view word : {std::string_view("true"), std::string_view("false")}) {
    if (cursor_.starts_with(word) && !is_ident_continue(cursor_.nth_char(word.size()))) {
      const size_t start = cursor_.offset();
      const Position pos = cursor_.position();
      cursor_.peek_inc(word.size());
      emit(TokenKind::Boolean, start, pos);
      return true;
    }
  }
  return false;
}

bool Tokenizer::lex_identifier()
{
  if (!is_ident_start(cursor_.first())) {
    return false;
  }
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();
  (void)cursor_.eat_while(is_ident_continue);
  emit(TokenKind::Identifier, start, pos);
  return true;
}

bool Tokenizer::lex_number()
{
  if (!is_digit(cursor_.first())) {
    return false;
  }
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();

  (void)cursor_.eat_while(is_digit);
  // A single fractional part; `1..2` and `1.foo` leave the dot to the next rule.
  if (cursor_.first() == U'.' && is_digit(cursor_.second())) {
    (void)cursor_.peek();
    (void)cursor_.eat_while(is_digit);
  }
  emit(TokenKind::Number, start, pos);
  return true;
}

bool Tokenizer::lex_string()
{
  const char32_t delimiter = cursor_.first();
  if (!is_string_delimiter(delimiter)) {
    return false;
  }
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();

  (void)cursor_.peek();
  const std::string_view contents =
    cursor_.eat_while([delimiter](char32_t c) { return c != delimiter; });
  const bool terminated = !cursor_.is_eof();
  if (terminated) {
    (void)cursor_.peek();
  }

  emit(TokenKind::String, start, pos);
  out_.tokens.back().value = contents;
  if (!terminated) {
    error(LexErrorKind::UnterminatedString, start, pos);
  }
  return true;
}

bool Tokenizer::lex_value_reserved()
{
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();

  if (cursor_.first() == U':') {
    if (cursor_.second() == U':') {
      cursor_.peek_inc(2);
      emit(TokenKind::Accessor, start, pos);
    } else {
      (void)cursor_.peek();
      emit(TokenKind::Colon, start, pos);
    }
    return true;
  }

  if (cursor_.first() == U'.') {
    if (cursor_.second() == U'.') {
      cursor_.peek_inc(2);
      emit(TokenKind::Range, start, pos);
    } else {
      (void)cursor_.peek();
      emit(TokenKind::Accessor, start, pos);
    }
    return true;
  }
  return false;
}

bool Tokenizer::lex_punctuation()
{
  TokenKind kind{};
  switch (cursor_.first()) {
    case U'[':
      kind = TokenKind::LeftBracket;
      break;
    case U']':
      kind = TokenKind::RightBracket;
      break;
    case U'(':
      kind = TokenKind::LeftParen;
      break;
    case U')':
      kind = TokenKind::RightParen;
      break;
    case U'{':
      kind = TokenKind::LeftBrace;
      break;
    case U'}':
      kind = TokenKind::RightBrace;
      break;
    case U';':
      kind = TokenKind::StatementEnd;
      break;
    case U',':
      kind = TokenKind::Comma;
      break;
    case U'\\':
      kind = TokenKind::Backslash;
      break;
    default:
      return false;
  }
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();
  (void)cursor_.peek();
  emit(kind, start, pos);
  return true;
}

void Tokenizer::skip_unknown()
{
  const size_t start = cursor_.offset();
  const Position pos = cursor_.position();
  (void)cursor_.peek();
  error(LexErrorKind::UnknownCharacter, start, pos);
}

// ============================================================================
// Free functions
// ============================================================================

std::vector<Token> tokenize(std::string_view source)
{
  return Tokenizer(FileId::invalid(), source).run().tokens;
}

LexResult tokenize(FileId file_id, std::string_view source)
{
  return Tokenizer(file_id, source).run();
}

void report_lex_errors(const std::vector<LexError> & errors, DiagnosticBag & diags)
{
  for (const auto & e : errors) {
    switch (e.kind) {
      case LexErrorKind::UnknownCharacter:
        diags
          .report_warning(
            e.range, fmt::format("Unknown character '{}' was skipped.", e.text),
            "not part of any token")
          .with_code(diag_codes::k_unknown_character);
        break;
      case LexErrorKind::UnterminatedString:
        diags
          .report_error(
            e.range, fmt::format("String starting at {} is never closed.", e.region.to_string()),
            "unterminated string")
          .with_code(diag_codes::k_unterminated_string)
          .with_help(fmt::format("add a closing {}", e.text.substr(0, 1)));
        break;
      case LexErrorKind::UnterminatedComment:
        diags
          .report_error(
            e.range, fmt::format("Comment starting at {} is never closed.", e.region.to_string()),
            "unterminated block comment")
          .with_code(diag_codes::k_unterminated_comment)
          .with_help("add a closing */");
        break;
    }
  }
}

}  // namespace surn::syntax
