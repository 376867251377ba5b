// surn/driver/compiler_options.hpp - Flags read once before parsing
#pragma once

#include <string_view>

#include "surn/syntax/ast_generator.hpp"

namespace surn
{

inline constexpr std::string_view k_current_version = "0.0.1-alpha.rc.1";
inline constexpr std::string_view k_nightly_version = "0.0.1-alpha.rc.1";

struct CompilerOptions
{
  /// Language version the source is compiled against.
  std::string_view version = k_nightly_version;

  /// Run the token-level Analyzer before parsing.
  bool semantic_checks = true;

  /// Optimize after parsing. No pass consumes this yet.
  bool optimize = true;

  /// Print the AST once parsing succeeds.
  bool dump_ast = false;

  /// Checks that run on the finished AST (unused names and the like).
  bool post_semantic_checks = true;

  /// Stop after the AST is built.
  bool ast_only = false;

  bool detect_bleeding_declarations = false;

  syntax::ParserOptions parser;

  [[nodiscard]] static CompilerOptions defaults() { return CompilerOptions{}; }

  /// Development profile: current version, AST dump on, post checks off.
  [[nodiscard]] static CompilerOptions dev()
  {
    CompilerOptions options;
    options.version = k_current_version;
    options.dump_ast = true;
    options.post_semantic_checks = false;
    return options;
  }
};

}  // namespace surn
