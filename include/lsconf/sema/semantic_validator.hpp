// lsconf/sema/semantic_validator.hpp - Check names in a parsed config against the schema
//
#pragma once

#include <string>
#include <string_view>
#include <vector>

#include "lsconf/ast/config_ast.hpp"
#include "lsconf/basic/diagnostic.hpp"
#include "lsconf/schema/schema_snapshot.hpp"

namespace lsconf
{

/**
 * Walks a parsed configuration and warns about plugin, option and codec
 * names that the schema does not know.
 *
 * - An unknown plugin yields exactly one warning on its name; its
 *   attributes are not checked.
 * - Options are checked against the section's common options merged with
 *   the plugin's own options. Plugins without option data are skipped.
 * - `codec` values are checked against the codec list.
 *
 * Validation is a pure function of (config, document, schema).
 */
class SemanticValidator
{
public:
  explicit SemanticValidator(const SchemaSnapshot & schema) : schema_(schema) {}

  /**
   * Validate a configuration.
   *
   * @param config   Tree produced by the external parser
   * @param document The text the tree was parsed from (for range clamping)
   * @return Warnings in walk order: input, filter, then output sections
   */
  [[nodiscard]] DiagnosticBag validate(const ast::Config & config, std::string_view document) const;

private:
  void walk_blocks(
    const std::vector<ast::Block> & blocks, SectionType section, DiagnosticBag & diags) const;
  void validate_plugin(
    const ast::Plugin & plugin, SectionType section, DiagnosticBag & diags) const;
  void validate_codec(const ast::Attribute & attr, DiagnosticBag & diags) const;

  const SchemaSnapshot & schema_;
};

/**
 * Codec name from an attribute value rendering.
 *
 * Surrounding quotes are removed and the leading token up to the first
 * space, tab, newline or `{` is returned: `"json"` -> json,
 * `json {\n}` -> json.
 */
[[nodiscard]] std::string extract_codec_name(std::string_view value);

/// Width of `codec => ` when the parser gives no value offset.
inline constexpr size_t k_codec_value_gap = 9;

}  // namespace lsconf
