// test_diagnostic_printer.cpp - Terminal output of diagnostics (colors off unless asked)
//
#include <gtest/gtest.h>

#include <rang.hpp>
#include <sstream>
#include <string>

#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"
#include "surn/report/diagnostic_printer.hpp"
#include "surn/test_support/parse_helpers.hpp"

namespace surn
{

class DiagnosticPrinterTest : public ::testing::Test
{
protected:
  std::ostringstream out_;
  DiagnosticPrinter printer_{out_, false};
};

TEST_F(DiagnosticPrinterTest, ParseErrorWithSnippet)
{
  auto unit = test_support::parse("[1, 2,");
  ASSERT_FALSE(unit.success);
  printer_.print_all(unit.diags, unit.sources());
  EXPECT_EQ(
    out_.str(),
    "error[P0001]: An array must be closed.\n"
    "  --> <test>.surn:1:1\n"
    "   1 | [1, 2,\n"
    "     | ~~~~~~ the input ends before this is complete\n"
    " Err | ---> An array must be closed.\n"
    "\n");
}

TEST_F(DiagnosticPrinterTest, DiagnosticWithoutSource)
{
  DiagnosticBag diags;
  diags.report_error(SourceRange{}, "Unable to read 'x'.").with_code(diag_codes::k_io_error);
  SourceRegistry sources;
  printer_.print_all(diags, sources);
  EXPECT_EQ(out_.str(), "error[D0001]: Unable to read 'x'.\n\n");
}

TEST_F(DiagnosticPrinterTest, HelpIsPrinted)
{
  auto unit = test_support::parse("var s = 'abc");
  printer_.print_all(unit.diags, unit.sources());
  const std::string text = out_.str();
  EXPECT_NE(text.find("error[L0002]: String starting at [Line: 1 | Column: 8] is never closed."), std::string::npos);
  EXPECT_NE(text.find("  = help: add a closing '\n"), std::string::npos);
}

TEST_F(DiagnosticPrinterTest, WarningsUseTheirOwnKind)
{
  auto unit = test_support::parse("1; $");
  ASSERT_TRUE(unit.success);
  printer_.print_all(unit.diags, unit.sources());
  EXPECT_EQ(out_.str().rfind("warning[L0001]: Unknown character '$' was skipped.\n", 0), 0U);
}

TEST_F(DiagnosticPrinterTest, SortedBySourcePosition)
{
  auto unit = test_support::parse("x;\nf(\na b");
  ASSERT_FALSE(unit.success);
  ASSERT_GE(unit.diags.size(), 2U);
  printer_.print_all(unit.diags, unit.sources());
  const std::string text = out_.str();

  const size_t paren = text.find("error[A0002]");
  const size_t names = text.find("error[A0001]");
  ASSERT_NE(paren, std::string::npos);
  ASSERT_NE(names, std::string::npos);
  EXPECT_LT(paren, names);
}

TEST(DiagnosticPrinterColor, PlainPrinterLeavesColorModeAlone)
{
  rang::setControlMode(rang::control::Force);
  auto unit = test_support::parse("[1, 2,");
  ASSERT_FALSE(unit.success);

  std::ostringstream plain_out;
  DiagnosticPrinter plain(plain_out, false);
  plain.print_all(unit.diags, unit.sources());

  std::ostringstream colored_out;
  DiagnosticPrinter colored(colored_out, true);
  colored.print_all(unit.diags, unit.sources());
  rang::setControlMode(rang::control::Auto);

  EXPECT_EQ(plain_out.str().find('\x1b'), std::string::npos);
  EXPECT_NE(colored_out.str().find('\x1b'), std::string::npos);
}

}  // namespace surn
