// lsconf/lsp/completion.cpp
//
#include "lsconf/lsp/completion.hpp"

#include <algorithm>
#include <utility>

namespace lsconf::lsp
{

std::string_view completion_item_kind_to_string(CompletionItemKind k) noexcept
{
  switch (k) {
    case CompletionItemKind::Keyword:
      return "keyword";
    case CompletionItemKind::Type:
      return "type";
    case CompletionItemKind::Property:
      return "property";
    case CompletionItemKind::Enum:
      return "enum";
  }
  return "keyword";
}

CompletionResult CompletionEngine::complete(std::string_view text, uint64_t offset) const
{
  CompletionResult result;
  result.from = analysis::completion_from(text, offset);
  result.options = items_for(analysis::detect_context(text, offset));
  return result;
}

std::vector<CompletionItem> CompletionEngine::items_for(const analysis::Context & ctx) const
{
  using analysis::ContextKind;

  std::vector<CompletionItem> items;

  switch (ctx.kind) {
    case ContextKind::Section:
      for (const auto kw : syntax::k_section_keywords) {
        items.push_back({std::string(kw), CompletionItemKind::Keyword, "section"});
      }
      return items;

    case ContextKind::Plugin: {
      if (!ctx.section_type) {
        return items;
      }
      const NameSet * plugins = schema_.plugins(*ctx.section_type);
      if (plugins == nullptr) {
        return items;
      }
      const std::string detail =
        std::string(section_type_to_string(*ctx.section_type)) + " plugin";
      items.reserve(plugins->size());
      for (const auto & name : *plugins) {
        items.push_back({name, CompletionItemKind::Type, detail});
      }
      break;
    }

    case ContextKind::Option: {
      if (!ctx.section_type) {
        return items;
      }
      const auto options = schema_.options_for(*ctx.section_type, ctx.plugin_name);
      if (!options) {
        return items;
      }
      items.reserve(options->size());
      for (const auto & name : *options) {
        items.push_back({name, CompletionItemKind::Property, "option"});
      }
      break;
    }

    case ContextKind::Codec:
      items.reserve(schema_.codecs().size());
      for (const auto & name : schema_.codecs()) {
        items.push_back({name, CompletionItemKind::Enum, "codec"});
      }
      break;

    case ContextKind::None:
      return items;
  }

  std::sort(items.begin(), items.end(), [](const CompletionItem & a, const CompletionItem & b) {
    return a.label < b.label;
  });
  return items;
}

nlohmann::json to_json(const CompletionResult & result)
{
  nlohmann::json out;
  out["from"] = result.from;
  out["options"] = nlohmann::json::array();
  for (const auto & item : result.options) {
    nlohmann::json o;
    o["label"] = item.label;
    o["kind"] = std::string(completion_item_kind_to_string(item.kind));
    if (!item.detail.empty()) {
      o["detail"] = item.detail;
    }
    out["options"].push_back(std::move(o));
  }
  return out;
}

}  // namespace lsconf::lsp
