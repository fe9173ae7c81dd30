// tests/unit/test_support.hpp - Shared fixtures for unit tests
#pragma once

#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

#include "lsconf/ast/config_ast.hpp"
#include "lsconf/schema/schema_snapshot.hpp"

namespace lsconf::test
{

/// A small schema with docs for grok and the json codec.
inline const char * const k_schema_v1 = R"json({
  "version": "1.0",
  "plugins": {
    "input": ["beats", "file", "stdin"],
    "filter": ["mutate", "grok", "date", "json"],
    "output": ["stdout", "elasticsearch"]
  },
  "codecs": ["json", "line", "plain", "rubydebug"],
  "commonOptions": {
    "input": ["codec", "id", "tags", "type"],
    "filter": ["add_tag", "id", "remove_field"],
    "output": ["codec", "id"]
  },
  "pluginOptions": {
    "input/file": ["path", "start_position"],
    "filter/grok": ["match", "overwrite", "patterns_dir"],
    "filter/mutate": ["rename", "replace"],
    "output/elasticsearch": ["hosts", "index"]
  },
  "pluginDocs": {
    "filter/grok": {
      "description": "Parses unstructured event data into fields.",
      "options": {
        "match": {"type": "hash", "default": "{}", "description": "Field to pattern mapping."},
        "patterns_dir": {"type": "array", "required": true}
      }
    }
  },
  "codecDocs": {
    "json": {"description": "Reads and writes JSON."}
  },
  "commonOptionDocs": {
    "filter": {"id": {"type": "string", "description": "Unique plugin ID."}}
  }
})json";

/// Same as v1 plus the truncate filter and the cef codec.
inline const char * const k_schema_v2 = R"json({
  "version": "2.0",
  "plugins": {
    "input": ["beats", "file", "stdin"],
    "filter": ["date", "grok", "json", "mutate", "truncate"],
    "output": ["elasticsearch", "stdout"]
  },
  "codecs": ["cef", "json", "line", "plain", "rubydebug"],
  "commonOptions": {
    "input": ["codec", "id", "tags", "type"],
    "filter": ["add_tag", "id", "remove_field"],
    "output": ["codec", "id"]
  },
  "pluginOptions": {
    "filter/grok": ["match", "overwrite"],
    "filter/truncate": ["fields", "length_bytes"]
  }
})json";

inline SchemaSnapshot parse_schema(const char * text)
{
  auto r = SchemaSnapshot::parse(text);
  EXPECT_TRUE(r.success) << r.error;
  return std::move(r.snapshot);
}

inline uint64_t offset_of(const std::string & s, const std::string & needle)
{
  const auto pos = s.find(needle);
  EXPECT_NE(pos, std::string::npos) << "missing '" << needle << "'";
  return pos;
}

inline ast::Attribute attribute(
  const std::string & doc, const std::string & name, ast::ValueKind kind, std::string value)
{
  ast::Attribute a;
  a.name = name;
  a.offset = offset_of(doc, name + " =>");
  a.kind = kind;
  a.value = std::move(value);
  return a;
}

inline ast::Plugin plugin(
  const std::string & doc, const std::string & name, std::vector<ast::Attribute> attrs = {})
{
  ast::Plugin p;
  p.name = name;
  p.offset = offset_of(doc, name + " {");
  p.attributes = std::move(attrs);
  return p;
}

inline ast::PluginSection section_of(std::vector<ast::Block> blocks)
{
  ast::PluginSection s;
  s.blocks = std::move(blocks);
  return s;
}

}  // namespace lsconf::test
