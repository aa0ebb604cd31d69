// dml/project/project_config.cpp - Project configuration implementation
//
#include "dml/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

#include "dml/basic/message_registry.hpp"

namespace dml
{

namespace
{

std::optional<Severity> parse_severity(const std::string & name)
{
  if (name == "error") return Severity::Error;
  if (name == "warning") return Severity::Warning;
  if (name == "info") return Severity::Info;
  if (name == "hint") return Severity::Hint;
  return std::nullopt;
}

/// Read an optional boolean flag of the `resolver` section
bool read_flag(const YAML::Node & section, const char * key, bool & out, std::string & error)
{
  const YAML::Node value = section[key];
  if (!value) return true;
  try {
    out = value.as<bool>();
  } catch (const YAML::Exception &) {
    error = std::string("resolver.") + key + " must be a boolean";
    return false;
  }
  return true;
}

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("configuration must be a map");
  }

  // Parse 'sources' section
  if (root["sources"]) {
    if (!root["sources"].IsSequence()) {
      return ConfigLoadResult::fail("sources must be a list");
    }
    for (const auto & src : root["sources"]) {
      std::filesystem::path p = src.as<std::string>();
      config.sources.push_back(p.is_absolute() ? p : project_root / p);
    }
  }

  // Parse 'resolver' section
  if (const YAML::Node res = root["resolver"]) {
    if (!res.IsMap()) {
      return ConfigLoadResult::fail("resolver must be a map");
    }
    std::string error;
    ResolverOptions & opts = config.resolver;
    if (
      !read_flag(res, "test_mode", opts.test_mode, error) ||
      !read_flag(res, "attach_valid_names", opts.attach_valid_names, error) ||
      !read_flag(res, "autoexpose_compositions", opts.autoexpose_compositions, error) ||
      !read_flag(res, "scoped_redirections", opts.scoped_redirections, error)) {
      return ConfigLoadResult::fail(error);
    }
  }

  // Parse 'severities' section
  if (const YAML::Node sev = root["severities"]) {
    if (!sev.IsMap()) {
      return ConfigLoadResult::fail("severities must be a map");
    }
    for (const auto & entry : sev) {
      const std::string id = entry.first.as<std::string>();
      const std::string level = entry.second.as<std::string>();
      const MessageSpec * spec = MessageRegistry::instance().find(id);
      if (spec == nullptr) {
        return ConfigLoadResult::fail("unknown message id in severities: '" + id + "'");
      }
      auto severity = parse_severity(level);
      if (!severity) {
        return ConfigLoadResult::fail(
          "invalid severity for '" + id + "': '" + level +
          "' (must be 'error', 'warning', 'info' or 'hint')");
      }
      // Non-configurable ids are accepted here and ignored by the reporter.
      config.resolver.severities[id] = *severity;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  // Load YAML
  YAML::Node root;
  try {
    root = YAML::LoadFile(config_path.string());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }

  try {
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("invalid configuration: " + std::string(e.what()));
  }
}

ConfigLoadResult parse_project_config(
  const std::string & text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(text), project_root);
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
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace dml
