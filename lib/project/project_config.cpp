// surn/project/project_config.cpp - Project configuration implementation
//
#include "surn/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace surn
{

namespace
{

void read_flag(const YAML::Node & section, const char * key, std::optional<bool> & out)
{
  if (section[key]) {
    out = section[key].as<bool>();
  }
}

/// Parse the 'compiler' section. Returns an error message on failure.
std::optional<std::string> parse_compiler(const YAML::Node & comp, CompilerConfig & out)
{
  if (!comp.IsMap()) {
    return "compiler must be a map";
  }

  if (comp["entry_points"]) {
    if (!comp["entry_points"].IsSequence()) {
      return "compiler.entry_points must be a list";
    }
    for (const auto & ep : comp["entry_points"]) {
      out.entry_points.emplace_back(ep.as<std::string>());
    }
  }

  read_flag(comp, "semantic_checks", out.semantic_checks);
  read_flag(comp, "optimize", out.optimize);
  read_flag(comp, "dump_ast", out.dump_ast);
  read_flag(comp, "post_semantic_checks", out.post_semantic_checks);
  read_flag(comp, "ast_only", out.ast_only);
  read_flag(comp, "detect_bleeding_declarations", out.detect_bleeding_declarations);

  if (comp["operator_precedence"]) {
    const auto text = comp["operator_precedence"].as<std::string>();
    out.operator_precedence = syntax::operator_policy_from_string(text);
    if (!out.operator_precedence) {
      return "invalid compiler.operator_precedence: '" + text +
             "' (must be 'right_recursive' or 'precedence_climbing')";
    }
  }
  return std::nullopt;
}

}  // namespace

void ProjectConfig::apply_to(CompilerOptions & options) const
{
  const auto set = [](bool & target, const std::optional<bool> & value) {
    if (value) {
      target = *value;
    }
  };
  set(options.semantic_checks, compiler.semantic_checks);
  set(options.optimize, compiler.optimize);
  set(options.dump_ast, compiler.dump_ast);
  set(options.post_semantic_checks, compiler.post_semantic_checks);
  set(options.ast_only, compiler.ast_only);
  set(options.detect_bleeding_declarations, compiler.detect_bleeding_declarations);
  if (compiler.operator_precedence) {
    options.parser.operator_policy = *compiler.operator_precedence;
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  ProjectConfig config;
  config.project_root = fs::absolute(config_path).parent_path();

  // Scalar conversions throw YAML::BadConversion, so the whole read is guarded.
  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());

    if (root["package"]) {
      const auto & pkg = root["package"];
      if (pkg["name"]) {
        config.package.name = pkg["name"].as<std::string>();
      }
      if (pkg["version"]) {
        config.package.version = pkg["version"].as<std::string>();
      }
    }

    if (root["compiler"]) {
      if (auto error = parse_compiler(root["compiler"], config.compiler)) {
        return ConfigLoadResult::fail(std::move(*error));
      }
    }
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  return ConfigLoadResult::ok(std::move(config));
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If start_dir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    const fs::path parent = current.parent_path();
    if (parent == current) {
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace surn
