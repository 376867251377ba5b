// surn/report/report.cpp - Snippet and report rendering
#include "surn/report/report.hpp"

#include <fmt/core.h>
#include <fmt/ostream.h>

#include <algorithm>
#include <ostream>

namespace surn::report
{

namespace
{

bool is_blank(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f'; }

size_t leading_blanks(std::string_view text)
{
  size_t n = 0;
  while (n < text.size() && is_blank(text[n])) {
    ++n;
  }
  return n;
}

/// Gutter wide enough for the line number and for "Err".
size_t gutter_width(size_t line_number)
{
  return std::max<size_t>(std::to_string(line_number).size(), 3);
}

}  // namespace

// ============================================================================
// SourceLine
// ============================================================================

std::pair<size_t, size_t> SourceLine::offset_relative(SourceRange range) const noexcept
{
  const size_t start = range.start() > offset_ ? range.start() - offset_ : 0;
  const size_t end = range.end() > offset_ ? range.end() - offset_ : 0;
  return {start, end};
}

size_t SourceLine::spaces_until(SourceRange range) const noexcept
{
  const size_t trimmed = leading_blanks(source_);
  const size_t start = offset_relative(range).first;
  if (start < trimmed) {
    return 1;
  }
  return start - trimmed + 1;
}

SourceLine SourceLine::trim() const
{
  return {offset_, len_, line_, source_.substr(leading_blanks(source_))};
}

// ============================================================================
// SourceBuffer
// ============================================================================

std::string SourceBuffer::get(SourceRange range) const
{
  std::string out;
  if (range.is_invalid()) {
    return out;
  }
  out.reserve(range.size());
  for (size_t i = range.start(); i < range.end(); ++i) {
    out.push_back(i < source_.size() ? source_[i] : ' ');
  }
  return out;
}

std::vector<SourceLine> SourceBuffer::get_lines() const
{
  std::vector<SourceLine> lines;
  size_t line_start = 0;
  size_t line = 1;

  const auto push = [&](size_t end) {
    std::string text = source_.substr(line_start, end - line_start);
    if (!text.empty() && text.back() == '\r') {
      text.pop_back();
    }
    lines.emplace_back(line_start, end - line_start, line, std::move(text));
  };

  for (size_t i = 0; i < source_.size(); ++i) {
    if (source_[i] == '\n') {
      push(i);
      ++line;
      line_start = i + 1;
    }
  }
  push(source_.size());
  return lines;
}

SourceLine SourceBuffer::get_line_at(size_t offset) const
{
  auto lines = get_lines();
  for (auto & line : lines) {
    if (offset >= line.offset() && offset <= line.offset_max()) {
      return std::move(line);
    }
  }
  return std::move(lines.back());
}

// ============================================================================
// Snippet
// ============================================================================

std::string Snippet::get_print(const SourceBuffer & buffer) const
{
  const SourceLine line = buffer.get_line_at(range.start());
  const size_t spaces = line.spaces_until(range);
  const size_t width = gutter_width(line.line());
  const size_t underline = std::max<size_t>(range.size(), 1);

  std::string out = fmt::format(" {:>{}} | {}\n", line.line(), width, line.trim().source());
  out += fmt::format(
    " {:>{}} |{}{}", "", width, std::string(spaces, ' '), std::string(underline, '~'));
  if (inline_message && !inline_message->empty()) {
    out += ' ';
    out += *inline_message;
  }
  out += '\n';
  out += fmt::format(" {:>{}} | ---> {}\n", "Err", width, message);
  return out;
}

// ============================================================================
// Report
// ============================================================================

Report & Report::set_code(std::string code)
{
  code_ = std::move(code);
  return *this;
}

Report & Report::set_message(std::string message)
{
  message_ = std::move(message);
  return *this;
}

Report & Report::set_source(SourceBuffer source)
{
  source_ = std::move(source);
  return *this;
}

Report & Report::set_kind(ReportKind kind)
{
  kind_ = kind;
  return *this;
}

Report & Report::set_file_name(std::string file_name)
{
  file_name_ = std::move(file_name);
  return *this;
}

Report & Report::set_help(std::string help)
{
  help_ = std::move(help);
  return *this;
}

Report & Report::make_snippet(
  SourceRange range, std::string message, std::optional<std::string> inline_message)
{
  snippets_.push_back(Snippet{range, std::move(message), std::move(inline_message)});
  return *this;
}

std::string Report::get_print() const { return get_header() + get_body(); }

std::string Report::get_header() const
{
  if (code_.empty()) {
    return fmt::format("{}: {}\n", to_string(kind_), message_);
  }
  return fmt::format("{}[{}]: {}\n", to_string(kind_), code_, message_);
}

std::string Report::get_body() const
{
  std::string out;
  if (!snippets_.empty() && snippets_.front().range.is_valid()) {
    const SourceRange first = snippets_.front().range;
    const SourceLine line = source_.get_line_at(first.start());
    out += fmt::format(
      "  --> {}:{}:{}\n", file_name_.empty() ? "<unknown>" : file_name_, line.line(),
      line.offset_relative(first).first + 1);
  }

  for (const auto & snippet : snippets_) {
    out += snippet.get_print(source_);
  }

  if (help_) {
    out += fmt::format("  = help: {}\n", *help_);
  }
  return out;
}

void Report::print(std::ostream & os) const { fmt::print(os, "{}", get_print()); }

Report Report::from_diagnostic(const Diagnostic & diag, SourceBuffer source, std::string file_name)
{
  Report report;
  report.set_kind(report_kind_of(diag.severity))
    .set_code(diag.code)
    .set_message(diag.message)
    .set_source(std::move(source))
    .set_file_name(std::move(file_name));

  const Label * primary = diag.primary_label();
  if (primary != nullptr && primary->range.is_valid()) {
    std::optional<std::string> hint;
    if (!primary->message.empty()) {
      hint = primary->message;
    }
    report.make_snippet(primary->range, diag.message, std::move(hint));
  }
  for (const auto & label : diag.labels) {
    if (&label != primary && label.style == LabelStyle::Secondary && label.range.is_valid()) {
      report.make_snippet(label.range, label.message);
    }
  }
  if (diag.help_message) {
    report.set_help(*diag.help_message);
  }
  return report;
}

ReportKind report_kind_of(Severity severity) noexcept
{
  switch (severity) {
    case Severity::Error:
      return ReportKind::Error;
    case Severity::Warning:
      return ReportKind::Warning;
    case Severity::Info:
    case Severity::Hint:
      return ReportKind::Notice;
  }
  return ReportKind::Notice;
}

}  // namespace surn::report
