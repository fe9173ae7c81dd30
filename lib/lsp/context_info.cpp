// lsconf/lsp/context_info.cpp
//
#include "lsconf/lsp/context_info.hpp"

#include <algorithm>
#include <utility>

namespace lsconf::lsp
{

using json = nlohmann::json;

std::string_view context_info_kind_to_string(ContextInfoKind k) noexcept
{
  switch (k) {
    case ContextInfoKind::TopLevel:
      return "top-level";
    case ContextInfoKind::Section:
      return "section";
    case ContextInfoKind::Plugin:
      return "plugin";
    case ContextInfoKind::Codec:
      return "codec";
    case ContextInfoKind::None:
      return "none";
  }
  return "none";
}

const std::vector<NamedEntry> & top_level_sections()
{
  static const std::vector<NamedEntry> sections = {
    {"input", "Plugins that read events into the pipeline"},
    {"filter", "Plugins that parse, enrich and transform events"},
    {"output", "Plugins that send events to their destinations"},
  };
  return sections;
}

// ============================================================================
// ContextInfoBuilder
// ============================================================================

ContextInfo ContextInfoBuilder::build(std::string_view text, uint64_t offset) const
{
  return build(analysis::detect_structural_context(text, offset), text, offset);
}

ContextInfo ContextInfoBuilder::build(
  const analysis::Context & ctx, std::string_view text, uint64_t offset) const
{
  using analysis::ContextKind;

  ContextInfo info;

  switch (ctx.kind) {
    case ContextKind::Section:
      if (!ctx.section_type) {
        info.kind = ContextInfoKind::TopLevel;
        info.entries = top_level_sections();
        return info;
      }
      [[fallthrough]];

    case ContextKind::Plugin:
      if (!ctx.section_type) {
        return info;
      }
      info.kind = ContextInfoKind::Section;
      info.section_type = ctx.section_type;
      info.entries = plugin_entries(*ctx.section_type);
      return info;

    case ContextKind::Option: {
      if (!ctx.section_type) {
        return info;
      }
      const SectionType section = *ctx.section_type;
      info.kind = ContextInfoKind::Plugin;
      info.section_type = section;
      info.plugin_name = ctx.plugin_name;
      if (const PluginDoc * doc = schema_.plugin_doc(section, ctx.plugin_name)) {
        info.plugin_doc = *doc;
      }
      info.options = option_entries(section, ctx.plugin_name);

      const std::string_view word = analysis::word_at(text, offset);
      const bool is_option =
        !word.empty() && std::any_of(info.options.begin(), info.options.end(),
                                     [word](const OptionInfo & o) { return o.name == word; });
      if (is_option) {
        info.option_name = std::string(word);
        if (const OptionDoc * doc = schema_.option_doc(section, ctx.plugin_name, word)) {
          info.option_doc = *doc;
        }
      }
      return info;
    }

    case ContextKind::Codec:
      info.kind = ContextInfoKind::Codec;
      info.entries = codec_entries();
      return info;

    case ContextKind::None:
      break;
  }

  return info;
}

std::vector<NamedEntry> ContextInfoBuilder::plugin_entries(SectionType section) const
{
  std::vector<NamedEntry> entries;
  const NameSet * plugins = schema_.plugins(section);
  if (plugins == nullptr) {
    return entries;
  }
  entries.reserve(plugins->size());
  for (const auto & name : *plugins) {
    NamedEntry e{name, {}};
    if (const PluginDoc * doc = schema_.plugin_doc(section, name)) {
      e.description = doc->description;
    }
    entries.push_back(std::move(e));
  }
  return entries;
}

std::vector<NamedEntry> ContextInfoBuilder::codec_entries() const
{
  std::vector<NamedEntry> entries;
  entries.reserve(schema_.codecs().size());
  for (const auto & name : schema_.codecs()) {
    NamedEntry e{name, {}};
    if (const PluginDoc * doc = schema_.codec_doc(name)) {
      e.description = doc->description;
    }
    entries.push_back(std::move(e));
  }
  return entries;
}

std::vector<OptionInfo> ContextInfoBuilder::option_entries(
  SectionType section, std::string_view plugin_name) const
{
  std::vector<OptionInfo> entries;
  const auto known = schema_.options_for(section, plugin_name);
  if (!known) {
    return entries;
  }

  entries.reserve(known->size());
  for (const auto & name : *known) {
    OptionInfo o{name, {}};
    if (const OptionDoc * doc = schema_.option_doc(section, plugin_name, name)) {
      o.doc = *doc;
    }
    entries.push_back(std::move(o));
  }

  std::stable_sort(entries.begin(), entries.end(), [](const OptionInfo & a, const OptionInfo & b) {
    if (a.doc.required != b.doc.required) {
      return a.doc.required;
    }
    return a.name < b.name;
  });
  return entries;
}

// ============================================================================
// JSON
// ============================================================================

namespace
{

json option_doc_to_json(const OptionDoc & doc)
{
  json out = json::object();
  if (!doc.type.empty()) out["type"] = doc.type;
  if (doc.required) out["required"] = true;
  if (!doc.default_value.empty()) out["default"] = doc.default_value;
  if (!doc.description.empty()) out["description"] = doc.description;
  if (doc.deprecated) out["deprecated"] = true;
  return out;
}

json plugin_doc_to_json(const PluginDoc & doc)
{
  json out = json::object();
  if (!doc.description.empty()) {
    out["description"] = doc.description;
  }
  if (!doc.options.empty()) {
    json options = json::object();
    for (const auto & [name, od] : doc.options) {
      options[name] = option_doc_to_json(od);
    }
    out["options"] = std::move(options);
  }
  return out;
}

json entries_to_json(const std::vector<NamedEntry> & entries)
{
  json out = json::array();
  for (const auto & e : entries) {
    json item;
    item["name"] = e.name;
    if (!e.description.empty()) {
      item["description"] = e.description;
    }
    out.push_back(std::move(item));
  }
  return out;
}

}  // namespace

json to_json(const ContextInfo & info)
{
  json out;
  out["kind"] = std::string(context_info_kind_to_string(info.kind));

  switch (info.kind) {
    case ContextInfoKind::TopLevel:
      out["sections"] = entries_to_json(info.entries);
      break;

    case ContextInfoKind::Section:
      out["sectionType"] = std::string(section_type_to_string(*info.section_type));
      out["plugins"] = entries_to_json(info.entries);
      break;

    case ContextInfoKind::Plugin: {
      out["sectionType"] = std::string(section_type_to_string(*info.section_type));
      out["pluginName"] = info.plugin_name;
      if (info.plugin_doc) {
        out["pluginDoc"] = plugin_doc_to_json(*info.plugin_doc);
      }
      if (!info.option_name.empty()) {
        out["optionName"] = info.option_name;
      }
      if (info.option_doc) {
        out["optionDoc"] = option_doc_to_json(*info.option_doc);
      }
      json options = json::array();
      for (const auto & o : info.options) {
        json item = option_doc_to_json(o.doc);
        item["name"] = o.name;
        options.push_back(std::move(item));
      }
      out["options"] = std::move(options);
      break;
    }

    case ContextInfoKind::Codec:
      out["plugins"] = entries_to_json(info.entries);
      break;

    case ContextInfoKind::None:
      break;
  }

  return out;
}

}  // namespace lsconf::lsp
