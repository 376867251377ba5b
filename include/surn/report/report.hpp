// surn/report/report.hpp - Source snippets and rendered reports
//
// Maps byte ranges back onto source lines and renders them as underlined
// snippets:
//
//    2 | var apple = 4;
//      |     ~~~~~ unused
//  Err | ---> This variable is never read.
//
// Rendering knows nothing about tokens or the AST; it is a pure function of
// the source text, the range and the messages.
//
#pragma once

#include <cstddef>
#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"

namespace surn::report
{

// ============================================================================
// SourceLine
// ============================================================================

/// One line of a SourceBuffer, without its line feed.
class SourceLine
{
public:
  SourceLine(size_t offset, size_t line, std::string source)
  : offset_(offset), len_(source.size()), line_(line), source_(std::move(source))
  {
  }
  SourceLine(size_t offset, size_t len, size_t line, std::string source)
  : offset_(offset), len_(len), line_(line), source_(std::move(source))
  {
  }

  /// Byte offset of the first character of the line.
  [[nodiscard]] size_t offset() const noexcept { return offset_; }
  [[nodiscard]] size_t len() const noexcept { return len_; }
  /// 1-based line number.
  [[nodiscard]] size_t line() const noexcept { return line_; }
  [[nodiscard]] const std::string & source() const noexcept { return source_; }
  [[nodiscard]] size_t offset_max() const noexcept { return offset_ + len_; }

  /// `range` made relative to the start of this line.
  [[nodiscard]] std::pair<size_t, size_t> offset_relative(SourceRange range) const noexcept;

  /**
   * Column (1-based) at which `range` starts once the line's leading
   * whitespace has been trimmed. Never less than 1.
   */
  [[nodiscard]] size_t spaces_until(SourceRange range) const noexcept;

  /// Copy with the leading whitespace removed. Offset and length are kept.
  [[nodiscard]] SourceLine trim() const;

private:
  size_t offset_;
  size_t len_;
  size_t line_;
  std::string source_;
};

// ============================================================================
// SourceBuffer
// ============================================================================

class SourceBuffer
{
public:
  SourceBuffer() = default;
  explicit SourceBuffer(std::string source) : source_(std::move(source)) {}

  [[nodiscard]] static SourceBuffer empty() { return SourceBuffer(); }

  [[nodiscard]] const std::string & source() const noexcept { return source_; }

  /// Text covered by `range`; bytes past the end of the buffer read as spaces.
  [[nodiscard]] std::string get(SourceRange range) const;

  /// Split on line feeds. Recomputed on every call; never empty.
  [[nodiscard]] std::vector<SourceLine> get_lines() const;

  /**
   * The first line whose [offset, offset + len] contains `offset`. The line
   * feed position therefore belongs to the line it ends. Offsets past the
   * end of the buffer resolve to the last line.
   */
  [[nodiscard]] SourceLine get_line_at(size_t offset) const;

private:
  std::string source_;
};

// ============================================================================
// Snippet
// ============================================================================

struct Snippet
{
  SourceRange range;
  std::string message;
  std::optional<std::string> inline_message;

  /// Render against `buffer` (three lines, each ending in a line feed).
  [[nodiscard]] std::string get_print(const SourceBuffer & buffer) const;
};

// ============================================================================
// Report
// ============================================================================

enum class ReportKind : uint8_t {
  Error,
  Warning,
  Notice,
};

[[nodiscard]] constexpr std::string_view to_string(ReportKind k) noexcept
{
  switch (k) {
    case ReportKind::Error:
      return "error";
    case ReportKind::Warning:
      return "warning";
    case ReportKind::Notice:
      return "notice";
  }
  return "";
}

/**
 * A diagnostic ready to print: a headline plus any number of snippets.
 *
 * @code
 *   Report()
 *     .set_source(SourceBuffer(text))
 *     .set_code("P0001")
 *     .set_message("An array must be closed.")
 *     .make_snippet(range, "An array must be closed.", "opened here")
 *     .get_print();
 * @endcode
 */
class Report
{
public:
  Report() = default;

  Report & set_code(std::string code);
  Report & set_message(std::string message);
  Report & set_source(SourceBuffer source);
  Report & set_kind(ReportKind kind);
  Report & set_file_name(std::string file_name);
  Report & set_help(std::string help);
  Report & make_snippet(
    SourceRange range, std::string message, std::optional<std::string> inline_message = std::nullopt);

  [[nodiscard]] const std::string & code() const noexcept { return code_; }
  [[nodiscard]] const std::string & message() const noexcept { return message_; }
  [[nodiscard]] ReportKind kind() const noexcept { return kind_; }
  [[nodiscard]] const SourceBuffer & source() const noexcept { return source_; }
  [[nodiscard]] const std::string & file_name() const noexcept { return file_name_; }
  [[nodiscard]] const std::vector<Snippet> & snippets() const noexcept { return snippets_; }

  /**
   * Full text:
   *
   *   error[P0001]: message
   *     --> file:line:col
   *   <snippets>
   *     = help: ...
   *
   * The location line points at the first snippet and is omitted when
   * there is none.
   */
  [[nodiscard]] std::string get_print() const;

  /// The `kind[code]: message` line of get_print().
  [[nodiscard]] std::string get_header() const;
  /// Everything in get_print() after the header.
  [[nodiscard]] std::string get_body() const;

  void print(std::ostream & os) const;

  /// Primary label first; secondary labels follow as extra snippets.
  [[nodiscard]] static Report from_diagnostic(
    const Diagnostic & diag, SourceBuffer source, std::string file_name);

private:
  std::string code_;
  std::string message_;
  ReportKind kind_ = ReportKind::Error;
  SourceBuffer source_;
  std::string file_name_;
  std::optional<std::string> help_;
  std::vector<Snippet> snippets_;
};

[[nodiscard]] ReportKind report_kind_of(Severity severity) noexcept;

}  // namespace surn::report
