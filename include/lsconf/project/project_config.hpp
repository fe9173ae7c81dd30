// lsconf/project/project_config.hpp - Project configuration (lsconf.yaml)
//
// Parses and validates lsconf.yaml project configuration files.
// Shared by the CLI and the stdio server.
//
#pragma once

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <utility>

namespace lsconf
{

// ============================================================================
// Configuration Structures
// ============================================================================

enum class ColorMode : uint8_t {
  Auto,    ///< Colour when stderr is a terminal
  Always,
  Never,
};

[[nodiscard]] std::optional<ColorMode> color_mode_from_string(std::string_view s) noexcept;

/**
 * Schema registry section.
 */
struct RegistryConfig
{
  /// Directory with one <version>.json per schema version (relative to lsconf.yaml)
  std::filesystem::path directory = "registry";

  /// Version to activate at startup; the highest version when unset
  std::optional<std::string> default_version;
};

/**
 * Diagnostic output section.
 */
struct DiagnosticsConfig
{
  ColorMode color = ColorMode::Auto;
};

/**
 * Complete project configuration (lsconf.yaml).
 */
struct ProjectConfig
{
  RegistryConfig registry;
  DiagnosticsConfig diagnostics;

  /// Directory containing lsconf.yaml (for resolving relative paths)
  std::filesystem::path project_root;

  /// Registry directory resolved against project_root.
  [[nodiscard]] std::filesystem::path registry_directory() const
  {
    if (registry.directory.is_absolute() || project_root.empty()) {
      return registry.directory;
    }
    return project_root / registry.directory;
  }
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
 * Load a project configuration from an lsconf.yaml file.
 *
 * @param config_path Path to lsconf.yaml
 * @return ConfigLoadResult with the loaded config or error message
 */
[[nodiscard]] ConfigLoadResult load_project_config(const std::filesystem::path & config_path);

/**
 * Parse project configuration from YAML text.
 *
 * @param yaml_text    Contents of an lsconf.yaml file
 * @param project_root Directory relative paths are resolved against
 */
[[nodiscard]] ConfigLoadResult parse_project_config(
  const std::string & yaml_text, const std::filesystem::path & project_root);

/**
 * Find a project configuration file by searching upward from a directory.
 *
 * @param start_dir Directory to start searching from
 * @return Path to lsconf.yaml if found, std::nullopt otherwise
 */
[[nodiscard]] std::optional<std::filesystem::path> find_project_config(
  const std::filesystem::path & start_dir);

/**
 * Default name of the project configuration file.
 */
inline constexpr const char * k_project_config_file_name = "lsconf.yaml";

}  // namespace lsconf
