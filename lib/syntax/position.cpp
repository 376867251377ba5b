// surn/syntax/position.cpp
#include "surn/syntax/position.hpp"

#include <fmt/core.h>

#include <stdexcept>

namespace surn::syntax
{

std::string Position::to_string() const { return fmt::format("[Line: {} | Column: {}]", line, column); }

Region::Region(Position start, Position end, std::string label)
: start_(start), end_(end), label_(std::move(label))
{
}

Region Region::from(uint32_t line, uint32_t last) { return create({line, 0}, {last, 0}); }

Region Region::create(Position start, Position end) { return Region(start, end); }

bool Region::includes(Position pos) const noexcept
{
  return Position::is_leading(start_, pos) && Position::is_leading(pos, end_);
}

void Region::shrink_to(Position pos)
{
  if (pos != start_ && Position::is_leading(pos, start_)) {
    throw std::invalid_argument(
      fmt::format("cannot shrink region {} to {}: position precedes its start", to_string(),
                  pos.to_string()));
  }
  end_ = pos;
}

std::string Region::to_string() const { return start_.to_string(); }

}  // namespace surn::syntax
