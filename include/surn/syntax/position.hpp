// surn/syntax/position.hpp - Line/column positions and labelled regions
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <utility>

namespace surn::syntax
{

/**
 * A line/column position inside a source text.
 *
 * Lines are 1-based, columns are 0-based and count Unicode scalar values.
 */
struct Position
{
  uint32_t line = 1;
  uint32_t column = 0;

  constexpr Position() noexcept = default;
  constexpr Position(uint32_t l, uint32_t c) noexcept : line(l), column(c) {}

  /// True if `a` sits at or before `b`.
  [[nodiscard]] static constexpr bool is_leading(Position a, Position b) noexcept
  {
    return a.line < b.line || (a.line == b.line && a.column <= b.column);
  }

  [[nodiscard]] constexpr Position operator+(Position other) const noexcept
  {
    return {line + other.line, column + other.column};
  }

  /// Component-wise difference, saturating at zero.
  [[nodiscard]] constexpr Position operator-(Position other) const noexcept
  {
    return {
      line > other.line ? line - other.line : 0U,
      column > other.column ? column - other.column : 0U};
  }

  [[nodiscard]] constexpr bool operator==(Position other) const noexcept
  {
    return line == other.line && column == other.column;
  }
  [[nodiscard]] constexpr bool operator!=(Position other) const noexcept
  {
    return !(*this == other);
  }

  [[nodiscard]] std::string to_string() const;
};

/**
 * A labelled [start, end] span of positions.
 */
class Region
{
public:
  static constexpr std::string_view k_default_label = "Region";

  Region() = default;
  Region(Position start, Position end, std::string label = std::string(k_default_label));

  /// Region from column 0 of line `line` to column 0 of line `last`.
  [[nodiscard]] static Region from(uint32_t line, uint32_t last);
  [[nodiscard]] static Region create(Position start, Position end);

  [[nodiscard]] Position start() const noexcept { return start_; }
  [[nodiscard]] Position end() const noexcept { return end_; }
  [[nodiscard]] const std::string & label() const noexcept { return label_; }

  void set_label(std::string label) { label_ = std::move(label); }

  [[nodiscard]] bool includes(Position pos) const noexcept;

  void expand_to(Position pos) noexcept { end_ = pos; }

  /// Pull the end back to `pos`. Throws std::invalid_argument if `pos` is before the start.
  void shrink_to(Position pos);

  /// `[Line: x | Column: y]` of the start position.
  [[nodiscard]] std::string to_string() const;

private:
  Position start_;
  Position end_;
  std::string label_ = std::string(k_default_label);
};

}  // namespace surn::syntax
