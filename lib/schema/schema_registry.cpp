// lsconf/schema/schema_registry.cpp - Registry implementation
//
#include "lsconf/schema/schema_registry.hpp"

#include <mutex>
#include <utility>

namespace lsconf
{

std::string_view registry_status_to_string(RegistryStatus s) noexcept
{
  switch (s) {
    case RegistryStatus::Ok:
      return "Ok";
    case RegistryStatus::NotFound:
      return "RegistryNotFound";
    case RegistryStatus::Malformed:
      return "RegistryMalformed";
  }
  return "RegistryNotFound";
}

SchemaRegistry::SchemaRegistry(std::unique_ptr<SchemaSource> source)
: source_(std::move(source)), snapshot_(std::make_shared<const SchemaSnapshot>())
{
  versions_ = source_->versions();
}

// ============================================================================
// Versions
// ============================================================================

std::vector<std::string> SchemaRegistry::list_versions() const
{
  std::shared_lock lock(mutex_);
  return versions_;
}

void SchemaRegistry::refresh_versions()
{
  auto versions = source_->versions();
  std::unique_lock lock(mutex_);
  versions_ = std::move(versions);
}

std::string SchemaRegistry::current_version() const
{
  std::shared_lock lock(mutex_);
  return current_version_;
}

RegistryLoadResult SchemaRegistry::load_version(const std::string & version)
{
  const std::optional<std::string> text = source_->read(version);
  if (!text) {
    return RegistryLoadResult::fail(
      RegistryStatus::NotFound, "registry version \"" + version + "\" not found");
  }

  SnapshotParseResult parsed = SchemaSnapshot::parse(*text);
  if (!parsed.success) {
    return RegistryLoadResult::fail(
      RegistryStatus::Malformed,
      "failed to parse registry \"" + version + "\": " + parsed.error);
  }

  install(std::make_shared<const SchemaSnapshot>(std::move(parsed.snapshot)), version);
  return RegistryLoadResult::ok();
}

RegistryLoadResult SchemaRegistry::load_latest()
{
  const auto versions = list_versions();
  if (versions.empty()) {
    install(std::make_shared<const SchemaSnapshot>(), "");
    return RegistryLoadResult::fail(
      RegistryStatus::NotFound, "no registry versions in " + source_->describe());
  }

  RegistryLoadResult result = load_version(versions.back());
  if (!result.success) {
    install(std::make_shared<const SchemaSnapshot>(), "");
  }
  return result;
}

void SchemaRegistry::install(std::shared_ptr<const SchemaSnapshot> snap, std::string version)
{
  std::unique_lock lock(mutex_);
  snapshot_ = std::move(snap);
  current_version_ = std::move(version);
}

// ============================================================================
// Read Accessors
// ============================================================================

std::shared_ptr<const SchemaSnapshot> SchemaRegistry::snapshot() const
{
  std::shared_lock lock(mutex_);
  return snapshot_;
}

bool SchemaRegistry::is_known_plugin(SectionType section, std::string_view name) const
{
  return snapshot()->is_known_plugin(section, name);
}

bool SchemaRegistry::known_codec(std::string_view name) const
{
  return snapshot()->known_codec(name);
}

std::optional<NameSet> SchemaRegistry::options_for(
  SectionType section, std::string_view plugin_name) const
{
  return snapshot()->options_for(section, plugin_name);
}

std::optional<PluginDoc> SchemaRegistry::plugin_doc(
  SectionType section, std::string_view name) const
{
  const auto snap = snapshot();
  if (const PluginDoc * doc = snap->plugin_doc(section, name)) {
    return *doc;
  }
  return std::nullopt;
}

std::optional<PluginDoc> SchemaRegistry::codec_doc(std::string_view name) const
{
  const auto snap = snapshot();
  if (const PluginDoc * doc = snap->codec_doc(name)) {
    return *doc;
  }
  return std::nullopt;
}

std::optional<OptionDoc> SchemaRegistry::option_doc(
  SectionType section, std::string_view plugin_name, std::string_view option_name) const
{
  const auto snap = snapshot();
  if (const OptionDoc * doc = snap->option_doc(section, plugin_name, option_name)) {
    return *doc;
  }
  return std::nullopt;
}

}  // namespace lsconf
