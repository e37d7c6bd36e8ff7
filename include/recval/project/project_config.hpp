// recval/project/project_config.hpp - Project configuration (recval.yaml)
//
// Parses and validates recval.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "recval/basic/diagnostic.hpp"

namespace recval
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Analysis configuration section.
 */
struct AnalysisConfig
{
  /// Model files to check (relative to recval.yaml)
  std::vector<std::filesystem::path> models;

  /// Severity of value-semantics findings
  Severity severity = Severity::Warning;

  /// Record type names that are never checked
  std::vector<std::string> ignore;
};

/**
 * Package metadata section.
 */
struct PackageConfig
{
  std::string name;
  std::string version;
};

/**
 * Complete project configuration (recval.yaml).
 */
struct ProjectConfig
{
  PackageConfig package;
  AnalysisConfig analysis;

  /// Directory containing recval.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Model paths resolved against project_root
  [[nodiscard]] std::vector<std::filesystem::path> resolved_models() const;
};

// ============================================================================
// Configuration Loading Result
// ============================================================================

/**
 * Result of loading a project configuration file.
 */
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
 * Load a project configuration from a recval.yaml file.
 *
 * @param config_path Path to recval.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse project configuration text. `project_root` anchors relative model paths.
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory (or file) to start searching from
 * @return Path to recval.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "recval.yaml";

}  // namespace recval
