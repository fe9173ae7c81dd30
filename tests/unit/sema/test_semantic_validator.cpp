#include <gtest/gtest.h>

#include <string>

#include "../test_support.hpp"
#include "lsconf/sema/semantic_validator.hpp"

using lsconf::DiagnosticBag;
using lsconf::SemanticValidator;
using lsconf::Severity;
using lsconf::ast::Block;
using lsconf::ast::Branch;
using lsconf::ast::Config;
using lsconf::ast::ValueKind;
using lsconf::test::attribute;
using lsconf::test::plugin;
using lsconf::test::section_of;

namespace
{

class SemaValidatorTest : public ::testing::Test
{
protected:
  lsconf::SchemaSnapshot schema_ = lsconf::test::parse_schema(lsconf::test::k_schema_v1);

  DiagnosticBag validate(const Config & cfg, const std::string & doc) const
  {
    return SemanticValidator(schema_).validate(cfg, doc);
  }
};

std::string slice(const std::string & doc, const lsconf::Diagnostic & d)
{
  return doc.substr(d.from(), d.to() - d.from());
}

}  // namespace

TEST_F(SemaValidatorTest, UnknownPluginIsTheOnlyWarning)
{
  const std::string doc = "filter { grop { matchh => {} } }";
  Config cfg;
  cfg.filter.push_back(
    section_of({Block{plugin(doc, "grop", {attribute(doc, "matchh", ValueKind::Hash, "{}")})}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all()[0];
  EXPECT_EQ(d.severity, Severity::Warning);
  EXPECT_EQ(d.code, "W001");
  EXPECT_EQ(slice(doc, d), "grop");
  EXPECT_EQ(d.message, "unknown filter plugin \"grop\"");
}

TEST_F(SemaValidatorTest, UnknownOptionOnKnownPlugin)
{
  const std::string doc = "filter { grok { matchh => {} } }";
  Config cfg;
  cfg.filter.push_back(
    section_of({Block{plugin(doc, "grok", {attribute(doc, "matchh", ValueKind::Hash, "{}")})}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "W002");
  EXPECT_EQ(slice(doc, diags.all()[0]), "matchh");
}

TEST_F(SemaValidatorTest, KnownNamesProduceNothing)
{
  const std::string doc = "filter { grok { match => {} add_tag => [\"x\"] } }";
  Config cfg;
  cfg.filter.push_back(section_of({Block{plugin(
    doc, "grok",
    {attribute(doc, "match", ValueKind::Hash, "{}"),
     attribute(doc, "add_tag", ValueKind::Array, "[\"x\"]")})}}));

  EXPECT_TRUE(validate(cfg, doc).empty());
}

TEST_F(SemaValidatorTest, UnknownCodec)
{
  const std::string doc = "input { stdin { codec => jsn {} } }";
  Config cfg;
  cfg.input.push_back(
    section_of({Block{plugin(doc, "stdin", {attribute(doc, "codec", ValueKind::Plugin, "jsn {}")})}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "W003");
  EXPECT_EQ(slice(doc, diags.all()[0]), "jsn");
}

TEST_F(SemaValidatorTest, KnownCodec)
{
  const std::string doc = "input { stdin { codec => json {} } }";
  Config cfg;
  cfg.input.push_back(
    section_of({Block{plugin(doc, "stdin", {attribute(doc, "codec", ValueKind::Plugin, "json {}")})}}));

  EXPECT_TRUE(validate(cfg, doc).empty());
}

TEST_F(SemaValidatorTest, QuotedCodecUsesValueOffset)
{
  const std::string doc = "output { stdout { codec =>   \"rubydebugg\" } }";
  auto codec = attribute(doc, "codec", ValueKind::String, "\"rubydebugg\"");
  codec.value_offset = doc.find('"');
  Config cfg;
  cfg.output.push_back(section_of({Block{plugin(doc, "stdout", {codec})}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(slice(doc, diags.all()[0]), "rubydebugg");
  EXPECT_EQ(diags.all()[0].message, "unknown codec \"rubydebugg\"");
}

TEST_F(SemaValidatorTest, WalksBranchesWithSectionContext)
{
  const std::string doc =
    "output { if [a] { stdot {} } else if [b] { stdout { idd => 1 } } else { elastic {} } }";
  Branch branch;
  branch.if_blocks.push_back(Block{plugin(doc, "stdot")});
  branch.else_if_blocks.push_back(
    {Block{plugin(doc, "stdout", {attribute(doc, "idd", ValueKind::Number, "1")})}});
  branch.else_blocks.push_back(Block{plugin(doc, "elastic")});

  Config cfg;
  cfg.output.push_back(section_of({Block{std::move(branch)}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 3U);
  EXPECT_EQ(slice(doc, diags.all()[0]), "stdot");
  EXPECT_EQ(slice(doc, diags.all()[1]), "idd");
  EXPECT_EQ(slice(doc, diags.all()[2]), "elastic");
  EXPECT_EQ(diags.all()[0].message, "unknown output plugin \"stdot\"");
}

TEST_F(SemaValidatorTest, SectionsAreWalkedInOrder)
{
  const std::string doc = "output { outx {} } input { inx {} } filter { filx {} }";
  Config cfg;
  cfg.output.push_back(section_of({Block{plugin(doc, "outx")}}));
  cfg.input.push_back(section_of({Block{plugin(doc, "inx")}}));
  cfg.filter.push_back(section_of({Block{plugin(doc, "filx")}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 3U);
  EXPECT_EQ(slice(doc, diags.all()[0]), "inx");
  EXPECT_EQ(slice(doc, diags.all()[1]), "filx");
  EXPECT_EQ(slice(doc, diags.all()[2]), "outx");
}

TEST_F(SemaValidatorTest, ValidationIsRepeatable)
{
  const std::string doc = "filter { grok { matchh => {} } grop {} }";
  Config cfg;
  cfg.filter.push_back(section_of(
    {Block{plugin(doc, "grok", {attribute(doc, "matchh", ValueKind::Hash, "{}")})},
     Block{plugin(doc, "grop")}}));

  const auto a = validate(cfg, doc);
  const auto b = validate(cfg, doc);
  EXPECT_EQ(a.all(), b.all());
  EXPECT_EQ(a.size(), 2U);
}

TEST_F(SemaValidatorTest, OffsetsPastDocumentAreClamped)
{
  const std::string doc = "filter { grop {} }";
  Config cfg;
  auto p = plugin(doc, "grop");
  p.offset = 500;
  cfg.filter.push_back(section_of({Block{p}}));

  const auto diags = validate(cfg, doc);
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_LE(diags.all()[0].to(), doc.size());
  EXPECT_LE(diags.all()[0].from(), diags.all()[0].to());
}

TEST(SemaValidatorSchemaGaps, UnlistedSectionsAndMissingCodecsAreSkipped)
{
  const auto schema = lsconf::test::parse_schema(R"({"plugins": {"filter": ["grok"]}})");
  const std::string doc =
    "input { anything { codec => whatever {} } } filter { grok { codec => nope x => 1 } }";

  Config cfg;
  cfg.input.push_back(section_of({Block{plugin(
    doc, "anything", {attribute(doc, "codec", ValueKind::Plugin, "whatever {}")})}}));
  cfg.filter.push_back(section_of({Block{plugin(
    doc, "grok",
    {attribute(doc, "codec", ValueKind::Bareword, "nope"),
     attribute(doc, "x", ValueKind::Number, "1")})}}));

  EXPECT_TRUE(SemanticValidator(schema).validate(cfg, doc).empty());
}

TEST(SemaValidatorSchemaGaps, EmptyCodecListIsStillEnforced)
{
  const auto schema =
    lsconf::test::parse_schema(R"({"plugins": {"input": ["stdin"]}, "codecs": []})");
  const std::string doc = "input { stdin { codec => jsn {} } }";

  Config cfg;
  cfg.input.push_back(section_of({Block{
    plugin(doc, "stdin", {attribute(doc, "codec", ValueKind::Plugin, "jsn {}")})}}));

  const auto diags = SemanticValidator(schema).validate(cfg, doc);
  ASSERT_EQ(diags.size(), 1U);
  const auto & d = diags.all()[0];
  EXPECT_EQ(d.code, "W003");
  EXPECT_EQ(doc.substr(d.from(), d.to() - d.from()), "jsn");
}

TEST(SemaExtractCodecName, StripsQuotesAndBlocks)
{
  EXPECT_EQ(lsconf::extract_codec_name("\"json\""), "json");
  EXPECT_EQ(lsconf::extract_codec_name("'plain'"), "plain");
  EXPECT_EQ(lsconf::extract_codec_name("json {\n  charset => \"UTF-8\"\n}"), "json");
  EXPECT_EQ(lsconf::extract_codec_name("  line  "), "line");
  EXPECT_EQ(lsconf::extract_codec_name(""), "");
}
