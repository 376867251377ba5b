// surn/syntax/keywords.hpp - Reserved words and keyword classification
#pragma once

#include <array>
#include <cstdint>
#include <optional>
#include <string_view>
#include <utility>

namespace surn::syntax
{

enum class KeyWord : uint8_t {
  Namespace,
  Const,
  Var,
  Class,
  Interface,
  Type,
  Function,  // `fn` or `function`
  If,
  Else,
  Public,     // pub
  Private,    // priv
  Protected,  // prot
  Static,
  Return,
  Break,
  Continue,
  For,
  While,
  Do,
  New,
  Drop,
  Use,
  Extends,
  Implements,
};

inline constexpr std::array<std::pair<std::string_view, KeyWord>, 25> k_keywords = {{
  {"namespace", KeyWord::Namespace},
  {"const", KeyWord::Const},
  {"var", KeyWord::Var},
  {"class", KeyWord::Class},
  {"interface", KeyWord::Interface},
  {"type", KeyWord::Type},
  {"fn", KeyWord::Function},
  {"function", KeyWord::Function},
  {"if", KeyWord::If},
  {"else", KeyWord::Else},
  {"pub", KeyWord::Public},
  {"priv", KeyWord::Private},
  {"prot", KeyWord::Protected},
  {"static", KeyWord::Static},
  {"return", KeyWord::Return},
  {"break", KeyWord::Break},
  {"continue", KeyWord::Continue},
  {"for", KeyWord::For},
  {"while", KeyWord::While},
  {"do", KeyWord::Do},
  {"new", KeyWord::New},
  {"drop", KeyWord::Drop},
  {"use", KeyWord::Use},
  {"extends", KeyWord::Extends},
  {"implements", KeyWord::Implements},
}};

/// Longest spelling in k_keywords ("implements").
inline constexpr size_t k_max_keyword_length = 10;

[[nodiscard]] constexpr std::optional<KeyWord> keyword_from_string(std::string_view s) noexcept
{
  for (const auto & [text, kw] : k_keywords) {
    if (text == s) {
      return kw;
    }
  }
  return std::nullopt;
}

/// Canonical spelling (the first table entry for the keyword).
[[nodiscard]] constexpr std::string_view to_string(KeyWord k) noexcept
{
  for (const auto & [text, kw] : k_keywords) {
    if (kw == k) {
      return text;
    }
  }
  return "";
}

[[nodiscard]] constexpr bool is_visibility(KeyWord k) noexcept
{
  return k == KeyWord::Public || k == KeyWord::Private || k == KeyWord::Protected;
}

[[nodiscard]] constexpr bool is_declarative(KeyWord k) noexcept
{
  return k == KeyWord::Var || k == KeyWord::Const || k == KeyWord::Function ||
         k == KeyWord::Class || k == KeyWord::Interface || k == KeyWord::Type;
}

[[nodiscard]] constexpr bool is_control(KeyWord k) noexcept
{
  switch (k) {
    case KeyWord::If:
    case KeyWord::Else:
    case KeyWord::Return:
    case KeyWord::Break:
    case KeyWord::Continue:
    case KeyWord::For:
    case KeyWord::While:
    case KeyWord::Do:
      return true;
    default:
      return false;
  }
}

}  // namespace surn::syntax
