// surnc - surn front-end command line interface
//
// Usage:
//   surnc parse <file.surn> [--dump-ast | --dump-json]
//   surnc tokens <file.surn>
//   surnc check
//
#include <fmt/core.h>
#include <fmt/ostream.h>

#include <filesystem>
#include <iostream>
#include <nlohmann/json.hpp>
#include <string>

#ifdef _WIN32
#include <io.h>
#define isatty _isatty
#define fileno _fileno
#else
#include <unistd.h>
#endif

#include "surn/ast/ast_context.hpp"
#include "surn/ast/ast_dumper.hpp"
#include "surn/ast/json_visitor.hpp"
#include "surn/basic/diagnostic.hpp"
#include "surn/driver/compiler_options.hpp"
#include "surn/driver/context.hpp"
#include "surn/driver/parser.hpp"
#include "surn/project/project_config.hpp"
#include "surn/report/diagnostic_printer.hpp"
#include "surn/syntax/tokenizer.hpp"

namespace fs = std::filesystem;

namespace
{

// ============================================================================
// Output Formatting
// ============================================================================

void print_usage(const char * program_name)
{
  std::cerr << "surn front end v" << surn::k_current_version << "\n\n"
            << "Usage: " << program_name << " <command> [options]\n\n"
            << "Commands:\n"
            << "  parse <file.surn>        Parse a file and report diagnostics\n"
            << "  tokens <file.surn>       Print the token list of a file\n"
            << "  check                    Parse every entry point of surn.yaml\n\n"
            << "Options:\n"
            << "  --dump-ast               Print the AST as a tree\n"
            << "  --dump-json              Print the AST as JSON\n"
            << "  --precedence             Group operators by precedence\n"
            << "  --no-analyzer            Skip the token-level checks\n"
            << "  --no-color               Disable colored diagnostics\n"
            << "  -v, --verbose            Verbose output\n"
            << "  -h, --help               Show this help message\n";
}

// ============================================================================
// Argument Parsing
// ============================================================================

struct CommandArgs
{
  std::string command;
  std::string input_file;
  bool dump_ast = false;
  bool dump_json = false;
  bool precedence = false;
  bool no_analyzer = false;
  bool no_color = false;
  bool verbose = false;
  bool show_help = false;
};

CommandArgs parse_args(int argc, char * argv[])
{
  CommandArgs args;

  if (argc < 2) {
    args.show_help = true;
    return args;
  }

  args.command = argv[1];

  if (args.command == "-h" || args.command == "--help") {
    args.show_help = true;
    return args;
  }

  for (int i = 2; i < argc; ++i) {
    const std::string arg = argv[i];

    if (arg == "--dump-ast") {
      args.dump_ast = true;
    } else if (arg == "--dump-json") {
      args.dump_json = true;
    } else if (arg == "--precedence") {
      args.precedence = true;
    } else if (arg == "--no-analyzer") {
      args.no_analyzer = true;
    } else if (arg == "--no-color") {
      args.no_color = true;
    } else if (arg == "-v" || arg == "--verbose") {
      args.verbose = true;
    } else if (arg == "-h" || arg == "--help") {
      args.show_help = true;
    } else if (arg[0] != '-' && args.input_file.empty()) {
      args.input_file = arg;
    } else {
      std::cerr << "warning: ignoring unknown option '" << arg << "'\n";
    }
  }

  return args;
}

/// Command-line flags win over whatever `options` already holds.
void apply_flags(const CommandArgs & args, surn::CompilerOptions & options)
{
  if (args.dump_ast) {
    options.dump_ast = true;
  }
  if (args.precedence) {
    options.parser.operator_policy = surn::syntax::OperatorPolicy::PrecedenceClimbing;
  }
  if (args.no_analyzer) {
    options.semantic_checks = false;
  }
}

bool use_color(const CommandArgs & args) { return !args.no_color && isatty(fileno(stderr)) != 0; }

/// Parse one file, print its diagnostics and (if asked) its AST. True on success.
bool parse_and_report(
  surn::Parser & parser, const fs::path & path, const CommandArgs & args,
  surn::DiagnosticPrinter & printer)
{
  if (args.verbose) {
    std::cerr << "Parsing: " << path.string() << "\n";
  }

  surn::AstContext ast;
  surn::DiagnosticBag diags;
  const surn::ParseOutput out = parser.parse_file(path, ast, diags);

  printer.print_all(diags, parser.sources());

  if (args.verbose) {
    fmt::print(
      std::cerr, "Parsed {} top-level node(s), {} diagnostic(s)\n", out.body.size(), diags.size());
  }

  if (out.success && parser.options().dump_ast) {
    std::cout << surn::dump_to_string(out.body);
  }
  if (out.success && args.dump_json) {
    std::cout << surn::to_json(out.body).dump(2) << "\n";
  }

  (void)parser.release_context(out.context_id);
  return out.success;
}

// ============================================================================
// Commands
// ============================================================================

int cmd_parse(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: surnc parse <file.surn>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  if (!fs::exists(input_path)) {
    std::cerr << "error: file not found: " << input_path.string() << "\n";
    return 1;
  }

  surn::CompilerOptions options = surn::CompilerOptions::defaults();
  apply_flags(args, options);

  surn::Parser parser(options);
  surn::DiagnosticPrinter printer(std::cerr, use_color(args));
  if (!parse_and_report(parser, input_path, args, printer)) {
    return 1;
  }

  std::cout << args.input_file << ": OK\n";
  return 0;
}

int cmd_tokens(const CommandArgs & args)
{
  if (args.input_file.empty()) {
    std::cerr << "error: input file required\n";
    std::cerr << "usage: surnc tokens <file.surn>\n";
    return 1;
  }

  const fs::path input_path = fs::absolute(args.input_file);
  const auto contents = surn::SourceOrigin::from_path(input_path).get_contents();
  if (!contents) {
    std::cerr << "error: failed to open file: " << input_path.string() << "\n";
    return 1;
  }

  surn::SourceRegistry sources;
  const surn::FileId file_id = sources.register_file(input_path, *contents);
  if (!file_id.is_valid()) {
    std::cerr << "error: failed to register file: " << input_path.string() << "\n";
    return 1;
  }
  const auto lexed = surn::syntax::tokenize(file_id, sources.get_file(file_id)->content());

  if (args.verbose) {
    std::cerr << "Tokens: " << lexed.tokens.size() << "\n";
  }

  for (const auto & tok : lexed.tokens) {
    if (tok.is_trivia()) {
      continue;
    }
    fmt::print(
      std::cout, "{:>5}:{:<4} {:<18} {}\n", tok.start_pos.line, tok.start_pos.column,
      surn::syntax::to_string(tok.kind), tok.spelling());
  }

  surn::DiagnosticBag diags;
  surn::syntax::report_lex_errors(lexed.errors, diags);
  surn::DiagnosticPrinter printer(std::cerr, use_color(args));
  printer.print_all(diags, sources);
  return diags.has_errors() ? 1 : 0;
}

int cmd_check(const CommandArgs & args)
{
  auto config_path = surn::find_project_config(fs::current_path());
  if (!config_path) {
    std::cerr << "error: no " << surn::k_project_config_file_name
              << " found in current directory or parents\n";
    return 1;
  }

  const auto config_result = surn::load_project_config(*config_path);
  if (!config_result.success) {
    std::cerr << "error: " << config_result.error << "\n";
    return 1;
  }
  const surn::ProjectConfig & config = config_result.config;

  if (args.verbose) {
    std::cerr << "Checking project: " << config.package.name << "\n";
  }
  if (config.compiler.entry_points.empty()) {
    std::cerr << "error: compiler.entry_points is empty\n";
    return 1;
  }

  surn::CompilerOptions options = surn::CompilerOptions::defaults();
  config.apply_to(options);
  apply_flags(args, options);

  surn::Parser parser(options);
  surn::DiagnosticPrinter printer(std::cerr, use_color(args));

  bool ok = true;
  for (const auto & entry : config.compiler.entry_points) {
    const fs::path path = entry.is_absolute() ? entry : config.project_root / entry;
    if (!parse_and_report(parser, path, args, printer)) {
      ok = false;
    }
  }

  if (ok) {
    std::cout << (config.package.name.empty() ? "project" : config.package.name) << ": OK\n";
    return 0;
  }
  return 1;
}

}  // namespace

int main(int argc, char * argv[])
{
  const CommandArgs args = parse_args(argc, argv);

  if (args.show_help) {
    print_usage(argv[0]);
    return 0;
  }

  if (args.command == "parse") {
    return cmd_parse(args);
  }
  if (args.command == "tokens") {
    return cmd_tokens(args);
  }
  if (args.command == "check") {
    return cmd_check(args);
  }

  std::cerr << "error: unknown command '" << args.command << "'\n\n";
  print_usage(argv[0]);
  return 1;
}
