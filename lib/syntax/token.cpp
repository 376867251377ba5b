// surn/syntax/token.cpp
#include "surn/syntax/token.hpp"

namespace surn::syntax
{

std::string Token::spelling() const
{
  if (kind == TokenKind::KeyWord) {
    return std::string(to_string(keyword));
  }
  if (kind == TokenKind::String) {
    return "\"" + std::string(text()) + "\"";
  }
  return std::string(text());
}

}  // namespace surn::syntax
