// surn/syntax/cursor.cpp
#include "surn/syntax/cursor.hpp"

namespace surn::syntax
{

namespace
{

constexpr char32_t k_replacement = 0xFFFD;

[[nodiscard]] bool is_continuation(unsigned char b) noexcept { return (b & 0xC0U) == 0x80U; }

}  // namespace

bool is_whitespace(char32_t c) noexcept
{
  switch (c) {
    case U'\t':
    case U'\n':
    case 0x0B:
    case 0x0C:
    case U'\r':
    case U' ':
    case 0x85:
    case 0xA0:
    case 0x1680:
    case 0x2028:
    case 0x2029:
    case 0x202F:
    case 0x205F:
    case 0x3000:
      return true;
    default:
      return c >= 0x2000 && c <= 0x200A;
  }
}

Cursor::Decoded Cursor::decode_at(size_t offset) const noexcept
{
  const auto b0 = static_cast<unsigned char>(input_[offset]);
  if (b0 < 0x80U) {
    return {b0, 1};
  }

  size_t len = 0;
  char32_t cp = 0;
  if ((b0 & 0xE0U) == 0xC0U) {
    len = 2;
    cp = b0 & 0x1FU;
  } else if ((b0 & 0xF0U) == 0xE0U) {
    len = 3;
    cp = b0 & 0x0FU;
  } else if ((b0 & 0xF8U) == 0xF0U) {
    len = 4;
    cp = b0 & 0x07U;
  } else {
    return {k_replacement, 1};
  }

  if (offset + len > input_.size()) {
    return {k_replacement, 1};
  }
  for (size_t i = 1; i < len; ++i) {
    const auto b = static_cast<unsigned char>(input_[offset + i]);
    if (!is_continuation(b)) {
      return {k_replacement, 1};
    }
    cp = (cp << 6U) | (b & 0x3FU);
  }
  return {cp, len};
}

char32_t Cursor::nth_char(size_t n) const noexcept
{
  size_t off = offset_;
  for (size_t i = 0; i < n && off < input_.size(); ++i) {
    off += decode_at(off).len;
  }
  if (off >= input_.size()) {
    return k_end_of_file;
  }
  return decode_at(off).cp;
}

std::optional<char32_t> Cursor::peek() noexcept
{
  if (is_eof()) {
    return std::nullopt;
  }

  const Decoded d = decode_at(offset_);
  offset_ += d.len;
  prev_ = d.cp;

  if (d.cp == U'\n') {
    ++position_.line;
    position_.column = 0;
  } else {
    ++position_.column;
  }
  return d.cp;
}

void Cursor::peek_inc(size_t n) noexcept
{
  for (size_t i = 0; i < n && peek(); ++i) {
  }
}

std::string_view Cursor::eat_while(const std::function<bool(char32_t)> & pred)
{
  const size_t start = offset_;
  while (!is_eof() && pred(first())) {
    (void)peek();
  }
  return input_.substr(start, offset_ - start);
}

std::string_view Cursor::eat_while_cursor(const std::function<bool(Cursor &, char32_t)> & pred)
{
  const size_t start = offset_;
  while (!is_eof()) {
    const size_t before = offset_;
    if (!pred(*this, first())) {
      break;
    }
    // The predicate may already have consumed; only step when it did not.
    if (offset_ == before) {
      (void)peek();
    }
  }
  return input_.substr(start, offset_ - start);
}

}  // namespace surn::syntax
