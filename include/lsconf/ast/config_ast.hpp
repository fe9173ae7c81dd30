// lsconf/ast/config_ast.hpp - Parsed configuration tree
//
// The tree produced by the external parser on success. Offsets are byte
// offsets into the document the parser was given.
//
#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace lsconf::ast
{

/**
 * How an attribute's value was written.
 */
enum class ValueKind : uint8_t {
  String,    ///< "json" or 'json'
  Number,    ///< 42
  Bool,      ///< true
  Array,     ///< [ ... ]
  Hash,      ///< { ... }
  Plugin,    ///< json { ... } (codec block)
  Bareword,  ///< json
};

[[nodiscard]] std::string_view value_kind_to_string(ValueKind k) noexcept;
[[nodiscard]] std::optional<ValueKind> value_kind_from_string(std::string_view s) noexcept;

/**
 * One `name => value` line inside a plugin block.
 */
struct Attribute
{
  std::string name;
  uint64_t offset = 0;  ///< Offset of the attribute name
  ValueKind kind = ValueKind::Bareword;

  /// Source-like rendering of the value, e.g. `"json"` or `json {\n}`.
  std::string value;

  /// Offset of the value's first character, when the parser reports it.
  std::optional<uint64_t> value_offset;
};

/**
 * A named plugin block, e.g. `grok { match => ... }`.
 */
struct Plugin
{
  std::string name;
  uint64_t offset = 0;  ///< Offset of the plugin name
  std::vector<Attribute> attributes;
};

struct Block;

/**
 * if / else if / else with nested blocks.
 */
struct Branch
{
  std::vector<Block> if_blocks;
  std::vector<std::vector<Block>> else_if_blocks;
  std::vector<Block> else_blocks;
};

/**
 * Either a plugin or a conditional.
 */
struct Block
{
  std::variant<Plugin, Branch> node;

  [[nodiscard]] const Plugin * as_plugin() const noexcept { return std::get_if<Plugin>(&node); }
  [[nodiscard]] const Branch * as_branch() const noexcept { return std::get_if<Branch>(&node); }
};

/**
 * One `input { ... }` (or filter/output) occurrence.
 */
struct PluginSection
{
  std::vector<Block> blocks;
};

/**
 * Whole document. A section keyword may appear several times.
 */
struct Config
{
  std::vector<PluginSection> input;
  std::vector<PluginSection> filter;
  std::vector<PluginSection> output;
};

/**
 * What the external parser returned for one document.
 */
struct ParseOutcome
{
  bool ok = false;

  /// Valid when ok == true
  Config config;

  /// Multi-line failure report (ok == false)
  std::string error;

  /// Optional farthest-failure report (ok == false)
  std::optional<std::string> farthest;
};

}  // namespace lsconf::ast
