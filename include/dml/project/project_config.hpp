// dml/project/project_config.hpp - Project configuration (dml.yaml)
//
// Parses and validates dml.yaml project configuration files.
//
#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

#include "dml/sema/resolver_options.hpp"

namespace dml
{

// ============================================================================
// Configuration Structures
// ============================================================================

/**
 * Complete project configuration (dml.yaml).
 */
struct ProjectConfig
{
  /// Model files to load when none are given on the command line
  std::vector<std::filesystem::path> sources;

  /// `resolver` and `severities` sections
  ResolverOptions resolver;

  /// Directory containing dml.yaml (for resolving relative paths)
  std::filesystem::path project_root;
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

  /// Whether loading succeeded
  bool success = false;

  /// Error message if loading failed
  std::string error;

  /// Create a successful result
  static ConfigLoadResult ok(ProjectConfig cfg)
  {
    ConfigLoadResult r;
    r.config = std::move(cfg);
    r.success = true;
    return r;
  }

  /// Create a failed result
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
 * Load a project configuration from a dml.yaml file.
 *
 * @param config_path Path to dml.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse a project configuration from YAML text.
 *
 * @param text YAML document
 * @param project_root Directory relative source paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to dml.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "dml.yaml";

}  // namespace dml
