// lsconf/lsp/completion.hpp - Name completion for a classified cursor
//
#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

#include "lsconf/analysis/context_scanner.hpp"
#include "lsconf/schema/schema_snapshot.hpp"

namespace lsconf::lsp
{

enum class CompletionItemKind : uint8_t {
  Keyword,   ///< section names
  Type,      ///< plugin names
  Property,  ///< option names
  Enum,      ///< codec names
};

[[nodiscard]] std::string_view completion_item_kind_to_string(CompletionItemKind k) noexcept;

struct CompletionItem
{
  std::string label;
  CompletionItemKind kind = CompletionItemKind::Keyword;
  std::string detail;  ///< Omitted from JSON when empty
};

struct CompletionResult
{
  /// Start of the text the chosen item replaces.
  uint32_t from = 0;
  std::vector<CompletionItem> options;
};

/**
 * Turns a cursor context into candidate names from one schema snapshot.
 */
class CompletionEngine
{
public:
  explicit CompletionEngine(const SchemaSnapshot & schema) : schema_(schema) {}

  /// Classify the cursor and list candidates.
  [[nodiscard]] CompletionResult complete(std::string_view text, uint64_t offset) const;

  /// Candidates for an already classified context, sorted by label.
  [[nodiscard]] std::vector<CompletionItem> items_for(const analysis::Context & ctx) const;

private:
  const SchemaSnapshot & schema_;
};

[[nodiscard]] nlohmann::json to_json(const CompletionResult & result);

}  // namespace lsconf::lsp
