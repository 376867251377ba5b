// surn/report/diagnostic_printer.hpp
//
// Prints diagnostics to a terminal: the text comes from report::Report, the
// colors from rang.
//
#pragma once

#include <iosfwd>
#include <string>
#include <string_view>

#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"
#include "surn/report/report.hpp"

namespace surn
{

/**
 * Prints diagnostics with their source snippets.
 *
 * Produces output like:
 *   error[P0001]: An array must be closed.
 *     --> main.surn:1:1
 *    1 | [1, 2,
 *      | ~~~~~~ the input ends before this is complete
 *  Err | ---> An array must be closed.
 */
class DiagnosticPrinter
{
public:
  /**
   * @param os Output stream (typically std::cerr)
   * @param use_color Whether to use terminal colors. Without it no escape
   *        codes are written, whatever rang's control mode is.
   */
  explicit DiagnosticPrinter(std::ostream & os, bool use_color = true);

  /// Print one diagnostic. Its source is looked up through the primary label.
  void print(const Diagnostic & diag, const SourceRegistry & sources);

  /// Print every diagnostic of `diags`, ordered by source position.
  void print_all(const DiagnosticBag & diags, const SourceRegistry & sources);

private:
  void print_header(const report::Report & report);
  void print_body_line(std::string_view line, report::ReportKind kind);

  [[nodiscard]] std::string display_name(const SourceRegistry & sources, FileId file) const;

  std::ostream & os_;
  bool use_color_;
};

}  // namespace surn
