// surn/report/diagnostic_printer.cpp - Colored diagnostic output
//
// Uses fmt for formatting and rang for terminal colors.
//
#include "surn/report/diagnostic_printer.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <filesystem>
#include <iterator>
#include <ostream>
#include <rang.hpp>
#include <vector>

namespace surn
{

namespace
{

void set_kind_color(std::ostream & os, report::ReportKind kind)
{
  switch (kind) {
    case report::ReportKind::Error:
      os << rang::fg::red;
      break;
    case report::ReportKind::Warning:
      os << rang::fg::yellow;
      break;
    case report::ReportKind::Notice:
      os << rang::fg::cyan;
      break;
  }
}

}  // namespace

DiagnosticPrinter::DiagnosticPrinter(std::ostream & os, bool use_color)
: os_(os), use_color_(use_color)
{
}

void DiagnosticPrinter::print(const Diagnostic & diag, const SourceRegistry & sources)
{
  const FileId file_id = diag.primary_range().file_id();
  const SourceFile * file = file_id.is_valid() ? sources.get_file(file_id) : nullptr;

  report::SourceBuffer buffer;
  if (file != nullptr) {
    buffer = report::SourceBuffer(std::string(file->content()));
  }

  report::Report report =
    report::Report::from_diagnostic(diag, std::move(buffer), display_name(sources, file_id));
  if (file == nullptr) {
    // Without source text only the headline and the help are meaningful.
    report = report::Report()
               .set_kind(report.kind())
               .set_code(report.code())
               .set_message(report.message());
    if (diag.help_message) {
      report.set_help(*diag.help_message);
    }
  }

  print_header(report);

  const std::string body = report.get_body();
  size_t start = 0;
  while (start < body.size()) {
    const size_t end = body.find('\n', start);
    const size_t stop = end == std::string::npos ? body.size() : end;
    print_body_line(std::string_view(body).substr(start, stop - start), report.kind());
    start = stop + 1;
  }
  fmt::print(os_, "\n");
}

void DiagnosticPrinter::print_all(const DiagnosticBag & diags, const SourceRegistry & sources)
{
  std::vector<Diagnostic> sorted_diags;
  sorted_diags.reserve(diags.size());
  std::copy(diags.begin(), diags.end(), std::back_inserter(sorted_diags));

  std::stable_sort(
    sorted_diags.begin(), sorted_diags.end(), [](const Diagnostic & a, const Diagnostic & b) {
      return a.primary_range().get_begin() < b.primary_range().get_begin();
    });

  for (const auto & d : sorted_diags) {
    print(d, sources);
  }
}

// =============================================================================
// Private helpers
// =============================================================================

void DiagnosticPrinter::print_header(const report::Report & report)
{
  if (!use_color_) {
    fmt::print(os_, "{}", report.get_header());
    return;
  }
  os_ << rang::style::bold;
  set_kind_color(os_, report.kind());
  os_ << to_string(report.kind());
  if (!report.code().empty()) {
    os_ << "[" << report.code() << "]";
  }
  os_ << rang::fg::reset << ": " << report.message() << rang::style::reset << "\n";
}

void DiagnosticPrinter::print_body_line(std::string_view line, report::ReportKind kind)
{
  if (!use_color_) {
    fmt::print(os_, "{}\n", line);
    return;
  }

  const size_t bar = line.find('|');
  const bool is_location = line.rfind("  -->", 0) == 0;
  const bool is_help = line.rfind("  =", 0) == 0;

  if (is_location || is_help || bar == std::string_view::npos) {
    os_ << rang::fg::cyan << rang::style::bold << line.substr(0, 5) << rang::style::reset
        << rang::fg::reset << line.substr(std::min<size_t>(5, line.size())) << "\n";
    return;
  }

  // Gutter in cyan; underline and message lines in the severity color.
  const std::string_view gutter = line.substr(0, bar + 1);
  const std::string_view rest = line.substr(bar + 1);
  os_ << rang::fg::cyan << rang::style::bold << gutter << rang::style::reset << rang::fg::reset;

  const bool is_marker = rest.find('~') != std::string_view::npos &&
                         rest.find_first_not_of(' ') == rest.find('~');
  const bool is_message = gutter.find("Err") != std::string_view::npos;
  if (is_marker || is_message) {
    os_ << rang::style::bold;
    set_kind_color(os_, kind);
    os_ << rest << rang::fg::reset << rang::style::reset << "\n";
  } else {
    os_ << rest << "\n";
  }
}

std::string DiagnosticPrinter::display_name(const SourceRegistry & sources, FileId file) const
{
  if (!file.is_valid()) {
    return "<unknown>";
  }
  const auto & abs_path = sources.get_path(file);
  const SourceFile * source = sources.get_file(file);
  if (source != nullptr && source->is_virtual()) {
    return abs_path.string();
  }

  // Relative path for cleaner output
  std::error_code ec;
  auto rel_path = std::filesystem::relative(abs_path, std::filesystem::current_path(), ec);
  return ec ? abs_path.string() : rel_path.string();
}

}  // namespace surn
