#include <gtest/gtest.h>

#include <atomic>
#include <map>
#include <memory>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

#include <nlohmann/json.hpp>

#include "../test_support.hpp"
#include "lsconf/ast/json_reader.hpp"
#include "lsconf/lsp/language_service.hpp"
#include "lsconf/schema/schema_source.hpp"

using json = nlohmann::json;
using lsconf::SchemaRegistry;
using lsconf::lsp::LanguageService;
using namespace std::string_view_literals;

namespace
{

class LspLanguageServiceTest : public ::testing::Test
{
protected:
  LspLanguageServiceTest()
  : registry_(std::make_unique<lsconf::InMemorySchemaSource>(std::map<std::string, std::string>{
      {"1.0", lsconf::test::k_schema_v1},
      {"2.0", lsconf::test::k_schema_v2},
    }))
  {
    EXPECT_TRUE(registry_.load_version("1.0").success);
  }

  SchemaRegistry registry_;
};

const std::string k_truncate_doc = "filter { truncate { fields => \"x\" } }";

lsconf::ast::ParseOutcome truncate_outcome()
{
  const auto r = lsconf::ast::read_parse_outcome(R"({"ok": true, "config": {"filter": [{"blocks": [
    {"plugin": {"name": "truncate", "offset": 9, "attributes": [
      {"name": "fields", "offset": 20, "kind": "string", "value": "\"x\""}
    ]}}
  ]}]}})"sv);
  EXPECT_TRUE(r.success) << r.error;
  return r.outcome;
}

}  // namespace

TEST_F(LspLanguageServiceTest, FailedParseIsDecoded)
{
  const LanguageService service(registry_);

  lsconf::ast::ParseOutcome outcome;
  outcome.ok = false;
  outcome.error = "1:10 (9): rule plugin: expected '{'";

  const auto j = json::parse(service.diagnostics_json("filter { grok", outcome));
  EXPECT_EQ(j["ok"], false);
  ASSERT_EQ(j["diagnostics"].size(), 1U);
  EXPECT_EQ(j["diagnostics"][0]["from"], 9);
  EXPECT_EQ(j["diagnostics"][0]["to"], 10);
  EXPECT_EQ(j["diagnostics"][0]["severity"], "error");
  EXPECT_EQ(j["diagnostics"][0]["message"], "expected '{'");
  EXPECT_EQ(j["diagnostics"][0]["code"], "E001");
}

TEST_F(LspLanguageServiceTest, SuccessfulParseIsValidated)
{
  const LanguageService service(registry_);

  const auto diags = service.diagnostics(k_truncate_doc, truncate_outcome());
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags.all()[0].code, "W001");
  EXPECT_EQ(diags.all()[0].from(), 9U);
  EXPECT_EQ(diags.all()[0].to(), 17U);

  const auto j = json::parse(service.diagnostics_json(k_truncate_doc, truncate_outcome()));
  EXPECT_EQ(j["ok"], true);
  EXPECT_EQ(j["diagnostics"][0]["severity"], "warning");
}

TEST_F(LspLanguageServiceTest, SwitchVersionChangesDiagnosticsAndBack)
{
  LanguageService service(registry_);
  const auto before = service.diagnostics(k_truncate_doc, truncate_outcome());

  const auto sw = json::parse(service.switch_version_json("2.0"));
  EXPECT_EQ(sw["ok"], true);
  EXPECT_EQ(sw["version"], "2.0");
  EXPECT_TRUE(service.diagnostics(k_truncate_doc, truncate_outcome()).empty());

  ASSERT_TRUE(service.switch_version("1.0").success);
  EXPECT_EQ(service.diagnostics(k_truncate_doc, truncate_outcome()).all(), before.all());
}

TEST_F(LspLanguageServiceTest, SwitchToMissingVersionReportsStatus)
{
  LanguageService service(registry_);

  const auto j = json::parse(service.switch_version_json("7.0"));
  EXPECT_EQ(j["ok"], false);
  EXPECT_EQ(j["error"], "RegistryNotFound");
  EXPECT_TRUE(j["message"].is_string());
  EXPECT_EQ(registry_.current_version(), "1.0");
}

TEST_F(LspLanguageServiceTest, VersionsJson)
{
  const LanguageService service(registry_);
  const auto j = json::parse(service.versions_json());
  EXPECT_EQ(j["versions"], json::array({"1.0", "2.0"}));
  EXPECT_EQ(j["current"], "1.0");
}

TEST_F(LspLanguageServiceTest, CompletionAndContextUseActiveSnapshot)
{
  LanguageService service(registry_);

  EXPECT_EQ(service.completion("filter { ", 9).options.size(), 4U);
  ASSERT_TRUE(service.switch_version("2.0").success);
  EXPECT_EQ(service.completion("filter { ", 9).options.size(), 5U);

  const auto ctx = json::parse(service.context_info_json("filter { truncate { } }", 20));
  EXPECT_EQ(ctx["kind"], "plugin");
  EXPECT_EQ(ctx["pluginName"], "truncate");

  const auto comp = json::parse(service.completion_json("input { stdin { codec => ", 25));
  EXPECT_EQ(comp["options"].size(), 5U);
}

TEST_F(LspLanguageServiceTest, ServiceIsMovable)
{
  LanguageService a(registry_);
  LanguageService b(std::move(a));
  EXPECT_EQ(b.completion("", 0).options.size(), 3U);
}

TEST_F(LspLanguageServiceTest, DiagnosticsSeeOneSnapshotWhileSwitching)
{
  const LanguageService service(registry_);
  const auto outcome = truncate_outcome();

  // Per-version results, computed before any switching starts.
  const auto v1 = service.diagnostics(k_truncate_doc, outcome).all();
  ASSERT_TRUE(registry_.load_version("2.0").success);
  const auto v2 = service.diagnostics(k_truncate_doc, outcome).all();
  ASSERT_TRUE(registry_.load_version("1.0").success);
  ASSERT_NE(v1, v2);

  std::atomic<bool> done{false};
  std::atomic<int> mismatches{0};
  std::atomic<int> failed_loads{0};

  std::thread switcher([&] {
    for (int i = 0; i < 200; ++i) {
      if (!registry_.load_version(i % 2 == 0 ? "2.0" : "1.0").success) {
        ++failed_loads;
      }
    }
    done = true;
  });

  std::vector<std::thread> readers;
  for (int t = 0; t < 4; ++t) {
    readers.emplace_back([&] {
      do {
        const auto got = service.diagnostics(k_truncate_doc, outcome).all();
        if (got != v1 && got != v2) {
          ++mismatches;
        }
      } while (!done);
    });
  }

  switcher.join();
  for (auto & r : readers) {
    r.join();
  }

  EXPECT_EQ(failed_loads.load(), 0);
  EXPECT_EQ(mismatches.load(), 0);
}
