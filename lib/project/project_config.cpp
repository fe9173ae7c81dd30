// lsconf/project/project_config.cpp - Project configuration implementation
//
#include "lsconf/project/project_config.hpp"

#include <yaml-cpp/yaml.h>

namespace lsconf
{

std::optional<ColorMode> color_mode_from_string(std::string_view s) noexcept
{
  if (s == "auto") return ColorMode::Auto;
  if (s == "always") return ColorMode::Always;
  if (s == "never") return ColorMode::Never;
  return std::nullopt;
}

namespace
{

ConfigLoadResult parse_root(const YAML::Node & root, const std::filesystem::path & project_root)
{
  ProjectConfig config;
  config.project_root = project_root;

  // An empty file is a valid configuration with all defaults.
  if (!root || root.IsNull()) {
    return ConfigLoadResult::ok(std::move(config));
  }
  if (!root.IsMap()) {
    return ConfigLoadResult::fail("top level of lsconf.yaml must be a map");
  }

  // Parse 'registry' section
  if (root["registry"]) {
    const auto & reg = root["registry"];
    if (!reg.IsMap()) {
      return ConfigLoadResult::fail("registry must be a map");
    }
    if (reg["directory"]) {
      config.registry.directory = reg["directory"].as<std::string>();
    }
    if (reg["default_version"]) {
      config.registry.default_version = reg["default_version"].as<std::string>();
    }
  }

  // Parse 'diagnostics' section
  if (root["diagnostics"]) {
    const auto & diag = root["diagnostics"];
    if (!diag.IsMap()) {
      return ConfigLoadResult::fail("diagnostics must be a map");
    }
    if (diag["color"]) {
      const auto color = diag["color"].as<std::string>();
      const auto mode = color_mode_from_string(color);
      if (!mode) {
        return ConfigLoadResult::fail(
          "invalid diagnostics.color: '" + color + "' (must be 'auto', 'always' or 'never')");
      }
      config.diagnostics.color = *mode;
    }
  }

  return ConfigLoadResult::ok(std::move(config));
}

}  // namespace

ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root)
{
  try {
    return parse_root(YAML::Load(yaml_text), project_root);
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

ConfigLoadResult load_project_config(const std::filesystem::path & config_path)
{
  namespace fs = std::filesystem;

  // Check if file exists
  if (!fs::exists(config_path)) {
    return ConfigLoadResult::fail("configuration file not found: " + config_path.string());
  }

  try {
    const YAML::Node root = YAML::LoadFile(config_path.string());
    return parse_root(root, fs::absolute(config_path).parent_path());
  } catch (const YAML::Exception & e) {
    return ConfigLoadResult::fail("failed to parse YAML: " + std::string(e.what()));
  }
}

std::optional<std::filesystem::path> find_project_config(const std::filesystem::path & start_dir)
{
  namespace fs = std::filesystem;

  fs::path current = fs::absolute(start_dir);

  // If startDir is a file, start from its parent
  if (fs::is_regular_file(current)) {
    current = current.parent_path();
  }

  while (true) {
    fs::path candidate = current / k_project_config_file_name;
    if (fs::exists(candidate)) {
      return candidate;
    }

    // Move up to parent
    const fs::path parent = current.parent_path();
    if (parent == current) {
      // Reached filesystem root
      break;
    }
    current = parent;
  }

  return std::nullopt;
}

}  // namespace lsconf
