// test_cursor.cpp - Cursor, Position and Region
//
#include <gtest/gtest.h>

#include <stdexcept>
#include <string_view>

#include "surn/syntax/cursor.hpp"
#include "surn/syntax/position.hpp"

namespace surn::syntax
{

TEST(SyntaxCursor, LookaheadDoesNotConsume)
{
  Cursor c("abc");
  EXPECT_EQ(c.first(), U'a');
  EXPECT_EQ(c.second(), U'b');
  EXPECT_EQ(c.nth_char(2), U'c');
  EXPECT_EQ(c.nth_char(3), k_end_of_file);
  EXPECT_EQ(c.eaten(), 0U);
  EXPECT_EQ(c.position(), Position(1, 0));
}

TEST(SyntaxCursor, PeekAdvancesColumnAndLine)
{
  Cursor c("a\nb");
  EXPECT_EQ(c.peek(), U'a');
  EXPECT_EQ(c.position(), Position(1, 1));
  EXPECT_EQ(c.peek(), U'\n');
  EXPECT_EQ(c.position(), Position(2, 0));
  EXPECT_EQ(c.prev(), U'\n');
  EXPECT_EQ(c.peek(), U'b');
  EXPECT_EQ(c.position(), Position(2, 1));
  EXPECT_TRUE(c.is_eof());
  EXPECT_FALSE(c.peek().has_value());
}

TEST(SyntaxCursor, DecodesMultiByteCodePoints)
{
  // "é" is two bytes, "€" three.
  Cursor c("\xC3\xA9\xE2\x82\xAC!");
  EXPECT_EQ(c.first(), U'é');
  EXPECT_EQ(c.second(), U'€');
  EXPECT_EQ(c.nth_char(2), U'!');

  (void)c.peek();
  EXPECT_EQ(c.eaten(), 2U);
  EXPECT_EQ(c.position().column, 1U);
  (void)c.peek();
  EXPECT_EQ(c.eaten(), 5U);
  EXPECT_EQ(c.position().column, 2U);
}

TEST(SyntaxCursor, MalformedByteDecodesToReplacement)
{
  Cursor c("\xFF" "a");
  EXPECT_EQ(c.peek(), char32_t{0xFFFD});
  EXPECT_EQ(c.eaten(), 1U);
  EXPECT_EQ(c.peek(), U'a');
}

TEST(SyntaxCursor, EatWhileReturnsConsumedSlice)
{
  Cursor c("abc123 rest");
  EXPECT_EQ(c.eat_while(is_ident_start), "abc");
  EXPECT_EQ(c.eat_while(is_digit), "123");
  EXPECT_EQ(c.eat_while(is_digit), "");
  EXPECT_EQ(c.rest(), " rest");
}

TEST(SyntaxCursor, EatWhileCursorLetsPredicateAdvance)
{
  Cursor c("a--b--c;");
  const auto eaten = c.eat_while_cursor([](Cursor & cur, char32_t ch) {
    if (ch == U'-' && cur.second() == U'-') {
      cur.peek_inc(2);
      return true;
    }
    return ch != U';';
  });
  EXPECT_EQ(eaten, "a--b--c");
  EXPECT_EQ(c.first(), U';');
}

TEST(SyntaxCursor, PeekIncStopsAtEnd)
{
  Cursor c("ab");
  c.peek_inc(10);
  EXPECT_TRUE(c.is_eof());
  EXPECT_EQ(c.eaten(), 2U);
}

TEST(SyntaxCursor, WhitespaceFollowsUnicodeProperty)
{
  EXPECT_TRUE(is_whitespace(U' '));
  EXPECT_TRUE(is_whitespace(U'\t'));
  EXPECT_TRUE(is_whitespace(U'\n'));
  EXPECT_TRUE(is_whitespace(char32_t{0x00A0}));
  EXPECT_TRUE(is_whitespace(char32_t{0x2003}));
  EXPECT_TRUE(is_whitespace(char32_t{0x3000}));
  EXPECT_FALSE(is_whitespace(U'a'));
  EXPECT_FALSE(is_whitespace(char32_t{0x200B}));
}

// ============================================================================
// Position / Region
// ============================================================================

TEST(SyntaxPosition, ArithmeticAndOrdering)
{
  const Position a(2, 5);
  const Position b(1, 3);
  EXPECT_EQ(a + b, Position(3, 8));
  EXPECT_EQ(a - b, Position(1, 2));
  EXPECT_EQ(b - a, Position(0, 0));

  EXPECT_TRUE(Position::is_leading(b, a));
  EXPECT_FALSE(Position::is_leading(a, b));
  EXPECT_TRUE(Position::is_leading(a, a));
  EXPECT_TRUE(Position::is_leading(Position(3, 0), Position(3, 1)));
}

TEST(SyntaxPosition, ToStringNamesLineAndColumn)
{
  EXPECT_EQ(Position(4, 7).to_string(), "[Line: 4 | Column: 7]");
}

TEST(SyntaxRegion, FromBuildsLineSpan)
{
  const Region r = Region::from(2, 5);
  EXPECT_EQ(r.start(), Position(2, 0));
  EXPECT_EQ(r.end(), Position(5, 0));
  EXPECT_EQ(r.label(), "Region");
}

TEST(SyntaxRegion, IncludesIsInclusive)
{
  const Region r(Position(1, 2), Position(3, 4));
  EXPECT_TRUE(r.includes(Position(1, 2)));
  EXPECT_TRUE(r.includes(Position(2, 100)));
  EXPECT_TRUE(r.includes(Position(3, 4)));
  EXPECT_FALSE(r.includes(Position(1, 1)));
  EXPECT_FALSE(r.includes(Position(3, 5)));
}

TEST(SyntaxRegion, ExpandAndShrink)
{
  Region r(Position(1, 0), Position(1, 4), "name");
  r.expand_to(Position(2, 3));
  EXPECT_EQ(r.end(), Position(2, 3));

  r.shrink_to(Position(1, 2));
  EXPECT_EQ(r.end(), Position(1, 2));

  r.shrink_to(Position(1, 0));
  EXPECT_EQ(r.end(), Position(1, 0));
  EXPECT_EQ(r.label(), "name");
}

TEST(SyntaxRegion, ShrinkBeforeStartThrows)
{
  Region r(Position(2, 4), Position(3, 0));
  EXPECT_THROW(r.shrink_to(Position(2, 3)), std::invalid_argument);
  EXPECT_THROW(r.shrink_to(Position(1, 9)), std::invalid_argument);
  EXPECT_EQ(r.end(), Position(3, 0));
}

TEST(SyntaxRegion, ToStringUsesStart)
{
  Region r(Position(7, 1), Position(9, 2));
  r.set_label("block");
  EXPECT_EQ(r.to_string(), "[Line: 7 | Column: 1]");
  EXPECT_EQ(r.label(), "block");
}

}  // namespace surn::syntax
