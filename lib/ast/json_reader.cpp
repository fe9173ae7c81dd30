// lsconf/ast/json_reader.cpp - Parse outcome decoding
//
#include "lsconf/ast/json_reader.hpp"

#include <stdexcept>

namespace lsconf::ast
{

namespace
{

using json = nlohmann::json;

class OutcomeFormatError : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

void require(bool cond, const std::string & what)
{
  if (!cond) {
    throw OutcomeFormatError(what);
  }
}

uint64_t read_offset(const json & j, const char * field)
{
  const auto it = j.find(field);
  require(it != j.end(), std::string("missing \"") + field + "\"");
  require(it->is_number_unsigned(), std::string("\"") + field + "\" must be a non-negative integer");
  return it->get<uint64_t>();
}

Attribute read_attribute(const json & j)
{
  require(j.is_object(), "attribute must be an object");

  Attribute attr;
  attr.name = j.at("name").get<std::string>();
  attr.offset = read_offset(j, "offset");

  const std::string kind_name = j.value("kind", std::string("bareword"));
  const auto kind = value_kind_from_string(kind_name);
  require(kind.has_value(), "unknown attribute kind \"" + kind_name + "\"");
  attr.kind = *kind;

  if (auto it = j.find("value"); it != j.end() && !it->is_null()) {
    attr.value = it->is_string() ? it->get<std::string>() : it->dump();
  }
  if (auto it = j.find("valueOffset"); it != j.end() && !it->is_null()) {
    attr.value_offset = read_offset(j, "valueOffset");
  }
  return attr;
}

std::vector<Block> read_blocks(const json & j);

Block read_block(const json & j)
{
  require(j.is_object(), "block must be an object");

  if (auto it = j.find("plugin"); it != j.end()) {
    const json & p = *it;
    require(p.is_object(), "plugin must be an object");

    Plugin plugin;
    plugin.name = p.at("name").get<std::string>();
    plugin.offset = read_offset(p, "offset");
    if (auto attrs = p.find("attributes"); attrs != p.end() && !attrs->is_null()) {
      require(attrs->is_array(), "attributes must be a list");
      for (const auto & a : *attrs) {
        plugin.attributes.push_back(read_attribute(a));
      }
    }
    return Block{std::move(plugin)};
  }

  if (auto it = j.find("branch"); it != j.end()) {
    const json & b = *it;
    require(b.is_object(), "branch must be an object");

    Branch branch;
    if (auto f = b.find("if"); f != b.end()) {
      branch.if_blocks = read_blocks(*f);
    }
    if (auto f = b.find("elseIf"); f != b.end() && !f->is_null()) {
      require(f->is_array(), "elseIf must be a list of block lists");
      for (const auto & blocks : *f) {
        branch.else_if_blocks.push_back(read_blocks(blocks));
      }
    }
    if (auto f = b.find("else"); f != b.end()) {
      branch.else_blocks = read_blocks(*f);
    }
    return Block{std::move(branch)};
  }

  throw OutcomeFormatError("block must contain \"plugin\" or \"branch\"");
}

std::vector<Block> read_blocks(const json & j)
{
  std::vector<Block> blocks;
  if (j.is_null()) {
    return blocks;
  }
  require(j.is_array(), "blocks must be a list");
  blocks.reserve(j.size());
  for (const auto & b : j) {
    blocks.push_back(read_block(b));
  }
  return blocks;
}

std::vector<PluginSection> read_sections(const json & config, const char * key)
{
  std::vector<PluginSection> sections;
  const auto it = config.find(key);
  if (it == config.end() || it->is_null()) {
    return sections;
  }
  require(it->is_array(), std::string(key) + " must be a list of sections");
  for (const auto & s : *it) {
    require(s.is_object(), std::string(key) + " section must be an object");
    PluginSection section;
    if (auto blocks = s.find("blocks"); blocks != s.end()) {
      section.blocks = read_blocks(*blocks);
    }
    sections.push_back(std::move(section));
  }
  return sections;
}

}  // namespace

OutcomeReadResult read_parse_outcome(std::string_view json_text)
{
  json root;
  try {
    root = json::parse(json_text.begin(), json_text.end());
  } catch (const json::parse_error & e) {
    return OutcomeReadResult::fail("invalid JSON: " + std::string(e.what()));
  }
  return read_parse_outcome(root);
}

OutcomeReadResult read_parse_outcome(const json & j)
{
  if (!j.is_object()) {
    return OutcomeReadResult::fail("parse outcome must be an object");
  }

  ParseOutcome outcome;
  try {
    const auto ok = j.find("ok");
    require(ok != j.end() && ok->is_boolean(), "\"ok\" must be a boolean");
    outcome.ok = ok->get<bool>();

    if (outcome.ok) {
      const auto cfg = j.find("config");
      require(cfg != j.end() && cfg->is_object(), "\"config\" must be an object");
      outcome.config.input = read_sections(*cfg, "input");
      outcome.config.filter = read_sections(*cfg, "filter");
      outcome.config.output = read_sections(*cfg, "output");
    } else {
      outcome.error = j.value("error", std::string{});
      if (auto f = j.find("farthest"); f != j.end() && !f->is_null()) {
        outcome.farthest = f->get<std::string>();
      }
    }
  } catch (const OutcomeFormatError & e) {
    return OutcomeReadResult::fail(e.what());
  } catch (const json::exception & e) {
    return OutcomeReadResult::fail("malformed parse outcome: " + std::string(e.what()));
  }

  return OutcomeReadResult::ok(std::move(outcome));
}

}  // namespace lsconf::ast
