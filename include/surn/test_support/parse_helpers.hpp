// surn/test_support/parse_helpers.hpp - helpers for unit tests
//
// Runs the full single-file pipeline (Tokenizer -> Analyzer -> AstGenerator)
// through surn::Parser and keeps every owner alive next to the result.
//
#pragma once

#include <memory>
#include <string>
#include <utility>

#include "surn/ast/ast.hpp"
#include "surn/ast/ast_context.hpp"
#include "surn/basic/casting.hpp"
#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"
#include "surn/driver/compiler_options.hpp"
#include "surn/driver/context.hpp"
#include "surn/driver/parser.hpp"

namespace surn::test_support
{

struct TestParseUnit
{
  std::unique_ptr<Parser> parser;
  FileId file_id = FileId::invalid();
  ContextId context_id;
  std::unique_ptr<AstContext> ast;
  DiagnosticBag diags;
  AstBody body;
  bool success = false;

  [[nodiscard]] const SourceRegistry & sources() const noexcept { return parser->sources(); }

  [[nodiscard]] const SourceFile * source_file() const noexcept
  {
    return sources().get_file(file_id);
  }

  [[nodiscard]] std::string_view slice(SourceRange r) const noexcept
  {
    return sources().get_slice(r);
  }

  [[nodiscard]] FullSourceRange full_range(SourceRange r) const noexcept
  {
    return sources().get_full_range(r);
  }

  /// The i-th top-level node, or nullptr.
  [[nodiscard]] const AstNode * node(size_t i) const noexcept
  {
    return i < body.size() ? body.get_program()[i].inner() : nullptr;
  }

  /// The i-th top-level node as T, or nullptr if it is something else.
  template <typename T>
  [[nodiscard]] const T * node_as(size_t i) const noexcept
  {
    const AstNode * n = node(i);
    return n != nullptr ? dyn_cast<T>(n) : nullptr;
  }
};

[[nodiscard]] inline TestParseUnit parse(
  std::string src, CompilerOptions options = CompilerOptions::defaults(),
  std::string name = "<test>.surn")
{
  TestParseUnit out;
  out.parser = std::make_unique<Parser>(std::move(options));
  out.ast = std::make_unique<AstContext>();

  ParseOutput parsed = out.parser->parse_script(std::move(name), std::move(src), *out.ast, out.diags);
  out.file_id = parsed.file_id;
  out.context_id = parsed.context_id;
  out.body = std::move(parsed.body);
  out.success = parsed.success;
  return out;
}

/// Parse with precedence climbing instead of the default right recursion.
[[nodiscard]] inline TestParseUnit parse_with_precedence(std::string src)
{
  CompilerOptions options;
  options.parser.operator_policy = syntax::OperatorPolicy::PrecedenceClimbing;
  return parse(std::move(src), std::move(options));
}

}  // namespace surn::test_support
