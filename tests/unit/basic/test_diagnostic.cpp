// test_diagnostic.cpp - DiagnosticBuilder and DiagnosticBag
//
#include <gtest/gtest.h>

#include <utility>

#include "surn/basic/diagnostic.hpp"

namespace surn
{

namespace
{

constexpr FileId k_file{0};

}  // namespace

TEST(DiagnosticBagTest, BuilderAddsOnDestruction)
{
  DiagnosticBag bag;
  {
    auto builder = bag.report_error(SourceRange(k_file, 0, 3), "Bad thing.", "here");
    builder.with_code(diag_codes::k_parse_error).with_help("try this");
    EXPECT_TRUE(bag.empty());
  }
  ASSERT_EQ(bag.size(), 1U);

  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Error);
  EXPECT_EQ(d.code, "P0001");
  EXPECT_EQ(d.message, "Bad thing.");
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "here");
  EXPECT_EQ(d.primary_range(), SourceRange(k_file, 0, 3));
  ASSERT_TRUE(d.help_message.has_value());
  EXPECT_EQ(*d.help_message, "try this");
}

TEST(DiagnosticBagTest, MovedBuilderAddsOnce)
{
  DiagnosticBag bag;
  {
    auto first = bag.report_warning(SourceRange(k_file, 1, 2), "w");
    auto second = std::move(first);
    second.with_secondary_label(SourceRange(k_file, 4, 5), "related")
      .with_fixit(SourceRange(k_file, 1, 2), ";");
  }
  ASSERT_EQ(bag.size(), 1U);
  const Diagnostic & d = bag.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  ASSERT_EQ(d.labels.size(), 2U);
  EXPECT_EQ(d.labels[1].style, LabelStyle::Secondary);
  ASSERT_EQ(d.fixits.size(), 1U);
  EXPECT_EQ(d.fixits[0].replacement_text, ";");
}

TEST(DiagnosticBagTest, ErrorsAndLookup)
{
  DiagnosticBag bag;
  bag.report_warning(SourceRange(k_file, 0, 1), "w").with_code(diag_codes::k_unknown_character);
  EXPECT_FALSE(bag.has_errors());

  bag.report_error(SourceRange(k_file, 2, 3), "e").with_code(diag_codes::k_unclosed_paren);
  EXPECT_TRUE(bag.has_errors());
  EXPECT_EQ(bag.errors().size(), 1U);

  const Diagnostic * found = bag.find_code(diag_codes::k_unclosed_paren);
  ASSERT_NE(found, nullptr);
  EXPECT_EQ(found->message, "e");
  EXPECT_EQ(bag.find_code("X9999"), nullptr);
}

TEST(DiagnosticBagTest, MergeMovesEverything)
{
  DiagnosticBag a;
  DiagnosticBag b;
  a.report_error(SourceRange(k_file, 0, 1), "first");
  b.report_error(SourceRange(k_file, 1, 2), "second");
  b.report_warning(SourceRange(k_file, 2, 3), "third");

  a.merge(std::move(b));
  ASSERT_EQ(a.size(), 3U);
  EXPECT_EQ(a.all()[2].message, "third");
}

TEST(DiagnosticTest, PrimaryLabelFallsBackToFirst)
{
  Diagnostic d;
  EXPECT_EQ(d.primary_label(), nullptr);
  EXPECT_TRUE(d.primary_range().is_invalid());

  d.labels.push_back(Label{SourceRange(k_file, 5, 6), "only", LabelStyle::Secondary});
  ASSERT_NE(d.primary_label(), nullptr);
  EXPECT_EQ(d.primary_label()->message, "only");
  EXPECT_EQ(to_string(Severity::Hint), "hint");
}

}  // namespace surn
