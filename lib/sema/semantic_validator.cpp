// lsconf/sema/semantic_validator.cpp - Schema validation walk
//
#include "lsconf/sema/semantic_validator.hpp"

#include <fmt/format.h>

#include "lsconf/syntax/keywords.hpp"

namespace lsconf
{

std::string extract_codec_name(std::string_view value)
{
  std::string_view s = syntax::trim(value);

  if (s.size() >= 2 && (s.front() == '"' || s.front() == '\'')) {
    s = s.substr(1, s.size() - 2);
  }

  const size_t end = s.find_first_of(" \t\n{");
  return std::string(s.substr(0, end));
}

DiagnosticBag SemanticValidator::validate(
  const ast::Config & config, std::string_view document) const
{
  DiagnosticBag diags(document.size());

  for (const auto & section : config.input) {
    walk_blocks(section.blocks, SectionType::Input, diags);
  }
  for (const auto & section : config.filter) {
    walk_blocks(section.blocks, SectionType::Filter, diags);
  }
  for (const auto & section : config.output) {
    walk_blocks(section.blocks, SectionType::Output, diags);
  }

  return diags;
}

void SemanticValidator::walk_blocks(
  const std::vector<ast::Block> & blocks, SectionType section, DiagnosticBag & diags) const
{
  for (const auto & block : blocks) {
    if (const ast::Plugin * plugin = block.as_plugin()) {
      validate_plugin(*plugin, section, diags);
      continue;
    }

    const ast::Branch * branch = block.as_branch();
    walk_blocks(branch->if_blocks, section, diags);
    for (const auto & else_if : branch->else_if_blocks) {
      walk_blocks(else_if, section, diags);
    }
    walk_blocks(branch->else_blocks, section, diags);
  }
}

void SemanticValidator::validate_plugin(
  const ast::Plugin & plugin, SectionType section, DiagnosticBag & diags) const
{
  if (schema_.has_plugin_list(section) && !schema_.is_known_plugin(section, plugin.name)) {
    diags
      .report_warning(
        plugin.offset, plugin.offset + plugin.name.size(),
        fmt::format("unknown {} plugin \"{}\"", section_type_to_string(section), plugin.name))
      .with_code(diag_code::k_unknown_plugin);
    return;
  }

  const auto known_options = schema_.options_for(section, plugin.name);

  for (const auto & attr : plugin.attributes) {
    if (attr.name == syntax::k_codec_option) {
      validate_codec(attr, diags);
      continue;
    }

    if (!known_options) {
      continue;
    }
    if (known_options->find(attr.name) == known_options->end()) {
      diags
        .report_warning(
          attr.offset, attr.offset + attr.name.size(),
          fmt::format("unknown option \"{}\"", attr.name))
        .with_code(diag_code::k_unknown_option);
    }
  }
}

void SemanticValidator::validate_codec(const ast::Attribute & attr, DiagnosticBag & diags) const
{
  // Without a codec list there is nothing to check against.
  if (!schema_.has_codec_list()) {
    return;
  }

  const std::string name = extract_codec_name(attr.value);
  if (name.empty() || schema_.known_codec(name)) {
    return;
  }

  uint64_t from = 0;
  if (attr.value_offset) {
    // Point at the name itself, past leading blanks and an opening quote.
    const std::string_view value = attr.value;
    size_t skip = 0;
    while (skip < value.size() && syntax::is_blank(value[skip])) {
      ++skip;
    }
    if (skip < value.size() && (value[skip] == '"' || value[skip] == '\'')) {
      ++skip;
    }
    from = *attr.value_offset + skip;
  } else {
    from = attr.offset + k_codec_value_gap;
  }

  diags.report_warning(from, from + name.size(), fmt::format("unknown codec \"{}\"", name))
    .with_code(diag_code::k_unknown_codec);
}

}  // namespace lsconf
