// surn/driver/parser.cpp - Source-to-AST pipeline
#include "surn/driver/parser.hpp"

#include <fmt/core.h>

#include "surn/syntax/analyzer.hpp"
#include "surn/syntax/ast_generator.hpp"
#include "surn/syntax/token_stream.hpp"
#include "surn/syntax/tokenizer.hpp"

namespace surn
{

namespace
{

/// A name seen before keeps its FileId; make sure it holds the new text.
void sync_content(SourceRegistry & sources, FileId id, const std::string & text)
{
  if (const SourceFile * file = sources.get_file(id); file != nullptr && file->content() != text) {
    sources.update_content(id, text);
  }
}

}  // namespace

ParseOutput Parser::parse_script(
  std::string name, std::string source, AstContext & ast, DiagnosticBag & diags)
{
  const FileId file_id = sources_.register_virtual(name, source);
  if (!file_id.is_valid()) {
    diags.report_error(SourceRange{}, fmt::format("Too many sources registered to add '{}'.", name))
      .with_code(diag_codes::k_io_error);
    return {};
  }
  sync_content(sources_, file_id, source);

  Context & context =
    contexts_.new_context(SourceOrigin::from_virtual(std::move(name), std::move(source)));
  context.set_file_id(file_id);
  return run(context, sources_.get_file(file_id)->content(), ast, diags);
}

ParseOutput Parser::parse_file(
  const std::filesystem::path & path, AstContext & ast, DiagnosticBag & diags)
{
  SourceOrigin origin = SourceOrigin::from_path(path);
  auto contents = origin.get_contents();
  if (!contents) {
    diags.report_error(SourceRange{}, fmt::format("Unable to read '{}'.", path.string()))
      .with_code(diag_codes::k_io_error);
    return {};
  }

  const FileId file_id = sources_.register_file(path, *contents);
  if (!file_id.is_valid()) {
    diags
      .report_error(
        SourceRange{}, fmt::format("Too many sources registered to add '{}'.", path.string()))
      .with_code(diag_codes::k_io_error);
    return {};
  }
  sync_content(sources_, file_id, *contents);

  Context & context = contexts_.new_context(std::move(origin));
  context.set_file_id(file_id);
  return run(context, sources_.get_file(file_id)->content(), ast, diags);
}

ParseOutput Parser::run(
  Context & context, std::string_view text, AstContext & ast, DiagnosticBag & diags)
{
  ParseOutput out;
  out.file_id = context.file_id();
  out.context_id = context.id();

  const size_t errors_before = diags.errors().size();

  auto lexed = syntax::tokenize(out.file_id, text);
  syntax::report_lex_errors(lexed.errors, diags);

  if (options_.semantic_checks) {
    (void)syntax::analyze(lexed.tokens, diags);
  }

  syntax::AstGenerator generator(ast, context, options_.parser);
  auto result = generator.begin_parse(syntax::TokenStream(std::move(lexed.tokens)));
  out.body = std::move(result.body);
  if (result.error) {
    diags.add(std::move(*result.error));
  }

  out.success = diags.errors().size() == errors_before;
  return out;
}

}  // namespace surn
