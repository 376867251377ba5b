// surn/syntax/cursor.hpp - UTF-8 code point cursor with position tracking
#pragma once

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <string_view>

#include "surn/syntax/position.hpp"

namespace surn::syntax
{

/// Sentinel returned by lookahead past the end of input.
inline constexpr char32_t k_end_of_file = U'\0';

/// Unicode White_Space property.
[[nodiscard]] bool is_whitespace(char32_t c) noexcept;

[[nodiscard]] constexpr bool is_ident_start(char32_t c) noexcept
{
  return (c >= U'a' && c <= U'z') || (c >= U'A' && c <= U'Z') || c == U'_';
}

[[nodiscard]] constexpr bool is_ident_continue(char32_t c) noexcept
{
  return is_ident_start(c) || (c >= U'0' && c <= U'9');
}

[[nodiscard]] constexpr bool is_digit(char32_t c) noexcept { return c >= U'0' && c <= U'9'; }

/**
 * Forward-only reader over an immutable UTF-8 buffer.
 *
 * Lookahead (`first`, `second`, `nth_char`) never consumes. `peek` consumes a
 * single code point and advances the line/column position: a `\n` moves to
 * the next line at column 0, anything else bumps the column. Malformed bytes
 * decode to U+FFFD and consume one byte.
 */
class Cursor
{
public:
  explicit Cursor(std::string_view input) noexcept : input_(input) {}

  [[nodiscard]] char32_t first() const noexcept { return nth_char(0); }
  [[nodiscard]] char32_t second() const noexcept { return nth_char(1); }
  [[nodiscard]] char32_t nth_char(size_t n) const noexcept;

  std::optional<char32_t> peek() noexcept;
  void peek_inc(size_t n) noexcept;

  /// Consume while `pred` holds; returns the consumed bytes.
  std::string_view eat_while(const std::function<bool(char32_t)> & pred);

  /// Like eat_while, but the predicate may itself advance the cursor.
  std::string_view eat_while_cursor(const std::function<bool(Cursor &, char32_t)> & pred);

  [[nodiscard]] bool is_eof() const noexcept { return offset_ >= input_.size(); }

  /// Bytes consumed so far.
  [[nodiscard]] size_t eaten() const noexcept { return offset_; }
  [[nodiscard]] size_t offset() const noexcept { return offset_; }
  [[nodiscard]] Position position() const noexcept { return position_; }
  [[nodiscard]] char32_t prev() const noexcept { return prev_; }
  [[nodiscard]] std::string_view input() const noexcept { return input_; }
  [[nodiscard]] std::string_view rest() const noexcept { return input_.substr(offset_); }

  /// True if the unconsumed input starts with `s` (byte comparison).
  [[nodiscard]] bool starts_with(std::string_view s) const noexcept
  {
    return rest().substr(0, s.size()) == s;
  }

private:
  struct Decoded
  {
    char32_t cp;
    size_t len;
  };

  [[nodiscard]] Decoded decode_at(size_t offset) const noexcept;

  std::string_view input_;
  size_t offset_ = 0;
  Position position_;
  char32_t prev_ = k_end_of_file;
};

}  // namespace surn::syntax
