// lsconf/lsp/context_info.hpp - Help-panel payload for the cursor position
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsconf/analysis/context_scanner.hpp"
#include "lsconf/schema/schema_snapshot.hpp"

namespace lsconf::lsp
{

enum class ContextInfoKind : uint8_t {
  TopLevel,  ///< "top-level": the three sections
  Section,   ///< "section": plugins of one section
  Plugin,    ///< "plugin": options of one plugin
  Codec,     ///< "codec": all codecs
  None,      ///< "none"
};

[[nodiscard]] std::string_view context_info_kind_to_string(ContextInfoKind k) noexcept;

/// A named entry with an optional one-line description.
struct NamedEntry
{
  std::string name;
  std::string description;
};

struct OptionInfo
{
  std::string name;
  OptionDoc doc;
};

struct ContextInfo
{
  ContextInfoKind kind = ContextInfoKind::None;
  std::optional<SectionType> section_type;

  // Plugin payload
  std::string plugin_name;
  std::optional<PluginDoc> plugin_doc;
  std::string option_name;  ///< Known option under the cursor, if any
  std::optional<OptionDoc> option_doc;
  std::vector<OptionInfo> options;  ///< Required first, then by name

  /// Sections (top-level), plugins (section) or codecs (codec), by name.
  std::vector<NamedEntry> entries;
};

/**
 * Builds the help-panel payload from the tolerant structural scan.
 */
class ContextInfoBuilder
{
public:
  explicit ContextInfoBuilder(const SchemaSnapshot & schema) : schema_(schema) {}

  /// Classify with detect_structural_context() and build the payload.
  [[nodiscard]] ContextInfo build(std::string_view text, uint64_t offset) const;

  /// Build the payload for an already classified context.
  [[nodiscard]] ContextInfo build(
    const analysis::Context & ctx, std::string_view text, uint64_t offset) const;

private:
  [[nodiscard]] std::vector<NamedEntry> plugin_entries(SectionType section) const;
  [[nodiscard]] std::vector<NamedEntry> codec_entries() const;
  [[nodiscard]] std::vector<OptionInfo> option_entries(
    SectionType section, std::string_view plugin_name) const;

  const SchemaSnapshot & schema_;
};

/// Static descriptions of the three sections.
[[nodiscard]] const std::vector<NamedEntry> & top_level_sections();

[[nodiscard]] nlohmann::json to_json(const ContextInfo & info);

}  // namespace lsconf::lsp
