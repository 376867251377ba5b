// surn/project/project_config.hpp - Project configuration (surn.yaml)
//
// Parses and validates surn.yaml. A project lists its entry points and may
// override any compiler flag; flags it leaves out keep the caller's value.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "surn/driver/compiler_options.hpp"
#include "surn/syntax/ast_generator.hpp"

namespace surn
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Compiler configuration section.
 */
struct CompilerConfig
{
  /// Source files to parse, relative to the project root
  std::vector<std::filesystem::path> entry_points;

  std::optional<bool> semantic_checks;
  std::optional<bool> optimize;
  std::optional<bool> dump_ast;
  std::optional<bool> post_semantic_checks;
  std::optional<bool> ast_only;
  std::optional<bool> detect_bleeding_declarations;

  /// `right_recursive` or `precedence_climbing`
  std::optional<syntax::OperatorPolicy> operator_precedence;
};

struct PackageConfig
{
  std::string name;
  std::string version;
};

struct ProjectConfig
{
  PackageConfig package;
  CompilerConfig compiler;

  /// Directory containing surn.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Overwrite every flag of `options` that this config sets.
  void apply_to(CompilerOptions & options) const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

struct ConfigLoadResult
{
  /// Loaded configuration (only valid if success == true)
  ProjectConfig config;

  bool success = false;

  /// Error message if loading failed
  std::string error;

  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  static ConfigLoadResult fail(std::string msg)
  {
    ConfigLoadResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// Configuration Loading API
// ============================================================================

/**
 * Load a project configuration from a surn.yaml file.
 *
 * @param config_path Path to surn.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Search for surn.yaml in start_dir and then in each parent directory up
 * to the filesystem root.
 *
 * @return Path to surn.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

inline constexpr const char * k_project_config_file_name = "surn.yaml";

}  // namespace surn
