// recval/project/project_config.cpp - Project configuration implementation
//
#include "recval/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include <system_error>

namespace recval
{

namespace
{

/// Parse a list of strings; fails if the node is not a sequence
bool parse_string_list(
  const YAML::Node & node, std::vector<std::string> & out, const char * key, std::string & error)
{
  if (!node.IsSequence()) {
    error = std::string(key) + " must be a list";
    return false;
  }
  for (const auto & item : node) {
    out.push_back(item.as<std::string>());
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration root must be a map");
  }

  // Parse 'package' section
  if (root["package"]) {
    const auto & pkg = root["package"];
    if (pkg["name"]) {
      config.package.name = pkg["name"].as<std::string>();
    }
    if (pkg["version"]) {
      config.package.version = pkg["version"].as<std::string>();
    }
  }

  // Parse 'analysis' section
  if (root["analysis"]) {
    const auto & analysis = root["analysis"];
    std::string error;

    if (analysis["models"]) {
      std::vector<std::string> models;
      if (!parse_string_list(analysis["models"], models, "analysis.models", error)) {
        return ConfigLoadResult::fail(error);
      }
      for (auto & m : models) {
        config.analysis.models.emplace_back(std::move(m));
      }
    }

    if (analysis["severity"]) {
      const auto severity = analysis["severity"].as<std::string>();
      if (severity == "warning") {
        config.analysis.severity = Severity::Warning;
      } else if (severity == "error") {
        config.analysis.severity = Severity::Error;
      } else {
        return ConfigLoadResult::fail(
          "invalid analysis.severity: '" + severity + "' (must be 'warning' or 'error')");
      }
    }

    if (analysis["ignore"]) {
      if (!parse_string_list(analysis["ignore"], config.analysis.ignore, "analysis.ignore", error)) {
        return ConfigLoadResult::fail(error);
      }
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

std::vector<std::filesystem::path> ProjectConfig::resolved_models() const
{
  std::vector<std::filesystem::path> out;
  out.reserve(analysis.models.size());
  for (const auto & m : analysis.models) {
    out.push_back(m.is_absolute() ? m : (project_root / m).lexically_normal());
  }
  return out;
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  std::error_code ec;
  if (!fs::exists(config_path, ec)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
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

}  // namespace recval
