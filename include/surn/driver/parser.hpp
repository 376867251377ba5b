// surn/driver/parser.hpp - Source-to-AST pipeline for one file at a time
//
// Owns the SourceRegistry and ContextStore of a compiler session and runs
// Tokenizer -> Analyzer -> AstGenerator for each source handed to it.
//
#pragma once

#include <filesystem>
#include <string>
#include <string_view>
#include <utility>

#include "surn/ast/ast.hpp"
#include "surn/ast/ast_context.hpp"
#include "surn/basic/diagnostic.hpp"
#include "surn/basic/source_manager.hpp"
#include "surn/driver/compiler_options.hpp"
#include "surn/driver/context.hpp"

namespace surn
{

struct ParseOutput
{
  FileId file_id = FileId::invalid();
  ContextId context_id;
  AstBody body;

  /// True if no error was added to the bag for this source.
  bool success = false;
};

class Parser
{
public:
  explicit Parser(CompilerOptions options = CompilerOptions::defaults())
  : options_(std::move(options))
  {
  }

  /**
   * Parse in-memory text registered under `name`.
   *
   * Lexical, analyzer and parse diagnostics are appended to `diags`. Nodes
   * are allocated in `ast`, which must outlive the returned body.
   */
  ParseOutput parse_script(
    std::string name, std::string source, AstContext & ast, DiagnosticBag & diags);

  /// Read and parse `path`. A read failure is reported as D0001.
  ParseOutput parse_file(const std::filesystem::path & path, AstContext & ast, DiagnosticBag & diags);

  /// Forget the context of a finished file. False if it was already released.
  bool release_context(ContextId id) { return contexts_.remove(id); }

  [[nodiscard]] const CompilerOptions & options() const noexcept { return options_; }
  [[nodiscard]] const SourceRegistry & sources() const noexcept { return sources_; }
  [[nodiscard]] const ContextStore & contexts() const noexcept { return contexts_; }

private:
  ParseOutput run(
    Context & context, std::string_view text, AstContext & ast, DiagnosticBag & diags);

  CompilerOptions options_;
  SourceRegistry sources_;
  ContextStore contexts_;
};

}  // namespace surn
