// lsconf/schema/schema_snapshot.hpp - One immutable version of the plugin schema
//
// A snapshot holds the valid plugin, option and codec names of one
// release, plus the optional documentation shown in the help panel.
//
#pragma once

#include <array>
#include <cstddef>
#include <functional>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <utility>

#include "lsconf/syntax/keywords.hpp"

namespace lsconf
{

// ============================================================================
// Schema Structures
// ============================================================================

/// Sorted name set with string_view lookup.
using NameSet = std::set<std::string, std::less<>>;

/**
 * Documentation for a single option.
 */
struct OptionDoc
{
  std::string type;
  bool required = false;
  std::string default_value;
  std::string description;
  bool deprecated = false;
};

/**
 * Documentation for a plugin or a codec.
 */
struct PluginDoc
{
  std::string description;
  std::map<std::string, OptionDoc, std::less<>> options;
};

struct SnapshotParseResult;

// ============================================================================
// SchemaSnapshot
// ============================================================================

/**
 * Valid names of one schema version.
 *
 * Built once by parse() and never mutated afterwards. A section whose plugin
 * list is absent from the source data is "unlisted": plugin names in it are
 * never reported as unknown.
 */
class SchemaSnapshot
{
public:
  SchemaSnapshot() = default;

  /**
   * Parse a snapshot from its JSON form.
   *
   * Expected shape:
   *   {version, plugins:{input:[..],filter:[..],output:[..]}, codecs:[..],
   *    commonOptions:{<section>:[..]}, pluginOptions:{"<section>/<name>":[..]},
   *    pluginDocs?, codecDocs?, commonOptionDocs?}
   *
   * Unknown section keys are ignored.
   */
  [[nodiscard]] static SnapshotParseResult parse(std::string_view json_text);

  [[nodiscard]] const std::string & version() const noexcept { return version_; }

  /// Plugin names of a section, nullptr if the section is unlisted.
  [[nodiscard]] const NameSet * plugins(SectionType section) const noexcept;

  [[nodiscard]] bool has_plugin_list(SectionType section) const noexcept
  {
    return plugins(section) != nullptr;
  }

  /// True if the section lists `name`.
  [[nodiscard]] bool is_known_plugin(SectionType section, std::string_view name) const;

  /// Codec names; empty when the snapshot lists none.
  [[nodiscard]] const NameSet & codecs() const noexcept;

  /// True if the snapshot carries a codec list, even an empty one.
  [[nodiscard]] bool has_codec_list() const noexcept { return codecs_.has_value(); }

  [[nodiscard]] bool known_codec(std::string_view name) const;

  /**
   * Valid options of a plugin: the section's common options merged with the
   * plugin's own options.
   *
   * @return std::nullopt if the plugin is unknown in a listed section, or if
   *         the snapshot carries neither common nor plugin-specific options
   *         for it (nothing to check against)
   */
  [[nodiscard]] std::optional<NameSet> options_for(
    SectionType section, std::string_view plugin_name) const;

  // Documentation lookups (nullptr when absent)
  [[nodiscard]] const PluginDoc * plugin_doc(SectionType section, std::string_view name) const;
  [[nodiscard]] const PluginDoc * codec_doc(std::string_view name) const;

  /// Plugin-level option doc first, then the section's common option doc.
  [[nodiscard]] const OptionDoc * option_doc(
    SectionType section, std::string_view plugin_name, std::string_view option_name) const;

  /// Key used by pluginOptions/pluginDocs, e.g. "filter/grok".
  [[nodiscard]] static std::string plugin_key(SectionType section, std::string_view name);

private:
  static constexpr size_t index_of(SectionType s) noexcept { return static_cast<size_t>(s); }

  std::string version_;
  std::array<std::optional<NameSet>, 3> plugins_;
  std::optional<NameSet> codecs_;
  std::array<std::optional<NameSet>, 3> common_options_;
  std::map<std::string, NameSet, std::less<>> plugin_options_;
  std::map<std::string, PluginDoc, std::less<>> plugin_docs_;
  std::map<std::string, PluginDoc, std::less<>> codec_docs_;
  std::array<std::map<std::string, OptionDoc, std::less<>>, 3> common_option_docs_;
};

/**
 * Result of parsing a snapshot from its JSON form.
 */
struct SnapshotParseResult
{
  /// Parsed snapshot (only valid if success == true)
  SchemaSnapshot snapshot;

  bool success = false;

  /// Error message if parsing failed
  std::string error;

  static SnapshotParseResult ok(SchemaSnapshot s)
  {
    SnapshotParseResult r;
    r.snapshot = std::move(s);
    r.success = true;
    return r;
  }

  static SnapshotParseResult fail(std::string msg)
  {
    SnapshotParseResult r;
    r.error = std::move(msg);
    r.success = false;
    return r;
  }
};

}  // namespace lsconf
