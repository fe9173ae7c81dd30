// lsconf/schema/schema_snapshot.cpp - Snapshot parsing and lookups
//
#include "lsconf/schema/schema_snapshot.hpp"

#include <nlohmann/json.hpp>
#include <stdexcept>

namespace lsconf
{

namespace
{

using json = nlohmann::json;

/// Raised for data that is valid JSON but not a valid schema.
class SchemaFormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

void require(bool cond, const std::string & what)
{
  if (!cond) {
    throw SchemaFormatError(what);
  }
}

NameSet read_name_set(const json & j, const std::string & where)
{
  require(j.is_array(), where + " must be a list of names");
  NameSet names;
  for (const auto & item : j) {
    names.insert(item.get<std::string>());
  }
  return names;
}

OptionDoc read_option_doc(const json & j)
{
  OptionDoc doc;
  doc.type = j.value("type", std::string{});
  doc.required = j.value("required", false);
  doc.description = j.value("description", std::string{});
  doc.deprecated = j.value("deprecated", false);

  // Defaults are written as strings by the snapshot tool, but accept any scalar.
  if (auto it = j.find("default"); it != j.end() && !it->is_null()) {
    doc.default_value = it->is_string() ? it->get<std::string>() : it->dump();
  }
  return doc;
}

std::map<std::string, OptionDoc, std::less<>> read_option_docs(
  const json & j, const std::string & where)
{
  require(j.is_object(), where + " must be an object");
  std::map<std::string, OptionDoc, std::less<>> docs;
  for (const auto & [name, value] : j.items()) {
    if (value.is_null()) {
      continue;
    }
    require(value.is_object(), where + "." + name + " must be an object");
    docs.emplace(name, read_option_doc(value));
  }
  return docs;
}

std::map<std::string, PluginDoc, std::less<>> read_plugin_docs(
  const json & j, const std::string & where)
{
  require(j.is_object(), where + " must be an object");
  std::map<std::string, PluginDoc, std::less<>> docs;
  for (const auto & [key, value] : j.items()) {
    if (value.is_null()) {
      continue;
    }
    require(value.is_object(), where + "." + key + " must be an object");
    PluginDoc doc;
    doc.description = value.value("description", std::string{});
    if (auto it = value.find("options"); it != value.end() && !it->is_null()) {
      doc.options = read_option_docs(*it, where + "." + key + ".options");
    }
    docs.emplace(key, std::move(doc));
  }
  return docs;
}

}  // namespace

// ============================================================================
// Parsing
// ============================================================================

SnapshotParseResult SchemaSnapshot::parse(std::string_view json_text)
{
  json root;
  try {
    root = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    return SnapshotParseResult::fail("invalid JSON: " + std::string(e.what()));
  }

  if (!root.is_object()) {
    return SnapshotParseResult::fail("schema root must be an object");
  }

  SchemaSnapshot snap;
  try {
    snap.version_ = root.value("version", std::string{});

    if (auto it = root.find("plugins"); it != root.end() && !it->is_null()) {
      require(it->is_object(), "plugins must be an object");
      for (const auto & [section_name, names] : it->items()) {
        if (auto section = section_type_from_string(section_name)) {
          snap.plugins_[index_of(*section)] = read_name_set(names, "plugins." + section_name);
        }
      }
    }

    if (auto it = root.find("codecs"); it != root.end() && !it->is_null()) {
      snap.codecs_ = read_name_set(*it, "codecs");
    }

    if (auto it = root.find("commonOptions"); it != root.end() && !it->is_null()) {
      require(it->is_object(), "commonOptions must be an object");
      for (const auto & [section_name, names] : it->items()) {
        if (auto section = section_type_from_string(section_name)) {
          snap.common_options_[index_of(*section)] =
            read_name_set(names, "commonOptions." + section_name);
        }
      }
    }

    if (auto it = root.find("pluginOptions"); it != root.end() && !it->is_null()) {
      require(it->is_object(), "pluginOptions must be an object");
      for (const auto & [key, names] : it->items()) {
        snap.plugin_options_.emplace(key, read_name_set(names, "pluginOptions." + key));
      }
    }

    if (auto it = root.find("pluginDocs"); it != root.end() && !it->is_null()) {
      snap.plugin_docs_ = read_plugin_docs(*it, "pluginDocs");
    }

    if (auto it = root.find("codecDocs"); it != root.end() && !it->is_null()) {
      snap.codec_docs_ = read_plugin_docs(*it, "codecDocs");
    }

    if (auto it = root.find("commonOptionDocs"); it != root.end() && !it->is_null()) {
      require(it->is_object(), "commonOptionDocs must be an object");
      for (const auto & [section_name, docs] : it->items()) {
        if (auto section = section_type_from_string(section_name)) {
          snap.common_option_docs_[index_of(*section)] =
            read_option_docs(docs, "commonOptionDocs." + section_name);
        }
      }
    }
  } catch (const SchemaFormatError & e) {
    return SnapshotParseResult::fail(e.what());
  } catch (const json::exception & e) {
    return SnapshotParseResult::fail("malformed schema: " + std::string(e.what()));
  }

  return SnapshotParseResult::ok(std::move(snap));
}

// ============================================================================
// Lookups
// ============================================================================

std::string SchemaSnapshot::plugin_key(SectionType section, std::string_view name)
{
  std::string key(section_type_to_string(section));
  key += '/';
  key += name;
  return key;
}

const NameSet * SchemaSnapshot::plugins(SectionType section) const noexcept
{
  const auto & list = plugins_[index_of(section)];
  return list ? &*list : nullptr;
}

bool SchemaSnapshot::is_known_plugin(SectionType section, std::string_view name) const
{
  const NameSet * list = plugins(section);
  return list != nullptr && list->find(name) != list->end();
}

const NameSet & SchemaSnapshot::codecs() const noexcept
{
  static const NameSet k_none;
  return codecs_ ? *codecs_ : k_none;
}

bool SchemaSnapshot::known_codec(std::string_view name) const
{
  return codecs_ && codecs_->find(name) != codecs_->end();
}

std::optional<NameSet> SchemaSnapshot::options_for(
  SectionType section, std::string_view plugin_name) const
{
  if (has_plugin_list(section) && !is_known_plugin(section, plugin_name)) {
    return std::nullopt;
  }

  const auto & common = common_options_[index_of(section)];
  const auto specific = plugin_options_.find(plugin_key(section, plugin_name));

  if (specific == plugin_options_.end()) {
    return common;
  }

  NameSet merged = specific->second;
  if (common) {
    merged.insert(common->begin(), common->end());
  }
  return merged;
}

const PluginDoc * SchemaSnapshot::plugin_doc(SectionType section, std::string_view name) const
{
  const auto it = plugin_docs_.find(plugin_key(section, name));
  return it != plugin_docs_.end() ? &it->second : nullptr;
}

const PluginDoc * SchemaSnapshot::codec_doc(std::string_view name) const
{
  const auto it = codec_docs_.find(name);
  return it != codec_docs_.end() ? &it->second : nullptr;
}

const OptionDoc * SchemaSnapshot::option_doc(
  SectionType section, std::string_view plugin_name, std::string_view option_name) const
{
  if (const PluginDoc * pd = plugin_doc(section, plugin_name)) {
    if (const auto it = pd->options.find(option_name); it != pd->options.end()) {
      return &it->second;
    }
  }

  const auto & common = common_option_docs_[index_of(section)];
  const auto it = common.find(option_name);
  return it != common.end() ? &it->second : nullptr;
}

}  // namespace lsconf
