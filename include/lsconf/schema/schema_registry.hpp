// lsconf/schema/schema_registry.hpp - Active schema version with atomic switching
//
#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <string_view>
#include <vector>

#include "lsconf/schema/schema_snapshot.hpp"
#include "lsconf/schema/schema_source.hpp"

namespace lsconf
{

// ============================================================================
// Load Result
// ============================================================================

enum class RegistryStatus : uint8_t {
  Ok,
  NotFound,   ///< Requested version is absent
  Malformed,  ///< Version data exists but is not a valid schema
};

/// Stable name used on the wire, e.g. "RegistryNotFound".
[[nodiscard]] std::string_view registry_status_to_string(RegistryStatus s) noexcept;

/**
 * Result of switching the active schema version.
 */
struct RegistryLoadResult
{
  bool success = false;
  RegistryStatus status = RegistryStatus::Ok;

  /// Error message if loading failed
  std::string error;

  static RegistryLoadResult ok()
  {
    RegistryLoadResult r;
    r.success = true;
    return r;
  }

  static RegistryLoadResult fail(RegistryStatus status, std::string msg)
  {
    RegistryLoadResult r;
    r.status = status;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

// ============================================================================
// SchemaRegistry
// ============================================================================

/**
 * Owns the active SchemaSnapshot and the list of available versions.
 *
 * Readers take the snapshot pointer under a shared lock and keep using that
 * one snapshot for a whole computation. A switch builds the new snapshot
 * first and swaps the pointer under an exclusive lock, so readers never see
 * a partially loaded schema. A failed switch leaves the previous snapshot
 * active.
 */
class SchemaRegistry
{
public:
  explicit SchemaRegistry(std::unique_ptr<SchemaSource> source);

  SchemaRegistry(const SchemaRegistry &) = delete;
  SchemaRegistry & operator=(const SchemaRegistry &) = delete;

  // ===========================================================================
  // Versions
  // ===========================================================================

  /// Available versions, sorted ascending.
  [[nodiscard]] std::vector<std::string> list_versions() const;

  /// Re-read the version list from the source.
  void refresh_versions();

  /// Name of the active version, empty if none is loaded.
  [[nodiscard]] std::string current_version() const;

  /**
   * Replace the active snapshot with version `version`.
   *
   * On failure the previous snapshot stays active.
   */
  RegistryLoadResult load_version(const std::string & version);

  /**
   * Load the highest available version.
   *
   * If there are no versions, or the highest one fails to load, the registry
   * falls back to an empty snapshot.
   */
  RegistryLoadResult load_latest();

  // ===========================================================================
  // Read Accessors
  // ===========================================================================

  /// The active snapshot. Never null.
  [[nodiscard]] std::shared_ptr<const SchemaSnapshot> snapshot() const;

  [[nodiscard]] bool is_known_plugin(SectionType section, std::string_view name) const;
  [[nodiscard]] bool known_codec(std::string_view name) const;
  [[nodiscard]] std::optional<NameSet> options_for(
    SectionType section, std::string_view plugin_name) const;

  [[nodiscard]] std::optional<PluginDoc> plugin_doc(
    SectionType section, std::string_view name) const;
  [[nodiscard]] std::optional<PluginDoc> codec_doc(std::string_view name) const;
  [[nodiscard]] std::optional<OptionDoc> option_doc(
    SectionType section, std::string_view plugin_name, std::string_view option_name) const;

  [[nodiscard]] const SchemaSource & source() const noexcept { return *source_; }

private:
  void install(std::shared_ptr<const SchemaSnapshot> snap, std::string version);

  std::unique_ptr<SchemaSource> source_;

  mutable std::shared_mutex mutex_;
  std::shared_ptr<const SchemaSnapshot> snapshot_;
  std::string current_version_;
  std::vector<std::string> versions_;
};

}  // namespace lsconf
