#include <gtest/gtest.h>

#include <map>
#include <memory>
#include <sstream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "../test_support.hpp"
#include "lsconf/lsp/server.hpp"
#include "lsconf/schema/schema_source.hpp"

using json = nlohmann::json;
using lsconf::lsp::JsonRpcConnection;
using lsconf::lsp::Server;

namespace
{

std::string frame(const json & msg)
{
  const std::string body = msg.dump();
  return "Content-Length: " + std::to_string(body.size()) + "\r\n\r\n" + body;
}

json request(int id, const std::string & method, json params = json::object())
{
  return json{{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", std::move(params)}};
}

json notification(const std::string & method)
{
  return json{{"jsonrpc", "2.0"}, {"method", method}};
}

/// Split server output back into JSON payloads.
std::vector<json> read_all(const std::string & out)
{
  std::istringstream in(out);
  std::ostringstream sink;
  JsonRpcConnection conn(in, sink);
  std::vector<json> msgs;
  while (auto m = conn.read_message()) {
    msgs.push_back(m->payload);
  }
  return msgs;
}

class LspServerTest : public ::testing::Test
{
protected:
  LspServerTest()
  : registry_(std::make_unique<lsconf::InMemorySchemaSource>(std::map<std::string, std::string>{
      {"1.0", lsconf::test::k_schema_v1},
      {"2.0", lsconf::test::k_schema_v2},
    })),
    service_(registry_)
  {
    EXPECT_TRUE(registry_.load_version("1.0").success);
  }

  /// Run the server over `messages` and return its replies.
  std::vector<json> run(const std::vector<json> & messages)
  {
    std::string input;
    for (const auto & m : messages) {
      input += frame(m);
    }
    std::istringstream in(input);
    std::ostringstream out;
    Server server(service_, log_);
    exit_code_ = server.run(in, out);
    return read_all(out.str());
  }

  lsconf::SchemaRegistry registry_;
  lsconf::lsp::LanguageService service_;
  std::ostringstream log_;
  int exit_code_ = -1;
};

}  // namespace

TEST_F(LspServerTest, InitializeShutdownExit)
{
  const auto replies = run({
    request(1, "initialize"),
    notification("initialized"),
    request(2, "shutdown"),
    notification("exit"),
  });

  ASSERT_EQ(replies.size(), 2U);
  EXPECT_EQ(replies[0]["id"], 1);
  EXPECT_EQ(replies[0]["result"]["serverInfo"]["name"], "lsconf");
  EXPECT_EQ(replies[0]["result"]["capabilities"]["diagnosticsProvider"], true);
  EXPECT_EQ(replies[1]["id"], 2);
  EXPECT_TRUE(replies[1]["result"].is_null());
  EXPECT_EQ(exit_code_, 0);
}

TEST_F(LspServerTest, ExitWithoutShutdownFails)
{
  run({notification("exit")});
  EXPECT_EQ(exit_code_, 1);
}

TEST_F(LspServerTest, EndOfInputStopsCleanly)
{
  const auto replies = run({request(1, "lsconf/versions")});
  ASSERT_EQ(replies.size(), 1U);
  EXPECT_EQ(replies[0]["result"]["current"], "1.0");
  EXPECT_EQ(exit_code_, 0);
}

TEST_F(LspServerTest, DiagnosticsForFailedParse)
{
  const json outcome = {{"ok", false}, {"error", "1:10 (9): rule plugin: expected '{'"}};
  const auto replies =
    run({request(1, "lsconf/diagnostics", {{"text", "filter { grok"}, {"outcome", outcome}})});

  ASSERT_EQ(replies.size(), 1U);
  const auto & result = replies[0]["result"];
  EXPECT_EQ(result["ok"], false);
  ASSERT_EQ(result["diagnostics"].size(), 1U);
  EXPECT_EQ(result["diagnostics"][0]["from"], 9);
}

TEST_F(LspServerTest, DiagnosticsAcceptOutcomeAsString)
{
  const std::string text = "filter { grop {} }";
  const json outcome = json::parse(R"({"ok": true, "config": {"filter": [
    {"blocks": [{"plugin": {"name": "grop", "offset": 9}}]}
  ]}})");
  const auto replies =
    run({request(1, "lsconf/diagnostics", {{"text", text}, {"outcome", outcome.dump()}})});

  ASSERT_EQ(replies.size(), 1U);
  const auto & diags = replies[0]["result"]["diagnostics"];
  ASSERT_EQ(diags.size(), 1U);
  EXPECT_EQ(diags[0]["code"], "W001");
  EXPECT_EQ(diags[0]["severity"], "warning");
}

TEST_F(LspServerTest, CompletionAndContextInfo)
{
  const auto replies = run({
    request(1, "lsconf/completion", {{"text", "filter { "}, {"offset", 9}}),
    request(2, "lsconf/contextInfo", {{"text", "filter { grok { } }"}, {"offset", 16}}),
  });

  ASSERT_EQ(replies.size(), 2U);
  EXPECT_EQ(replies[0]["result"]["options"].size(), 4U);
  EXPECT_EQ(replies[0]["result"]["options"][0]["label"], "date");
  EXPECT_EQ(replies[1]["result"]["kind"], "plugin");
  EXPECT_EQ(replies[1]["result"]["pluginName"], "grok");
}

TEST_F(LspServerTest, SwitchVersion)
{
  const auto replies = run({
    request(1, "lsconf/switchVersion", {{"version", "2.0"}}),
    request(2, "lsconf/switchVersion", {{"version", "nope"}}),
    request(3, "lsconf/versions"),
  });

  ASSERT_EQ(replies.size(), 3U);
  EXPECT_EQ(replies[0]["result"]["ok"], true);
  EXPECT_EQ(replies[1]["result"]["ok"], false);
  EXPECT_EQ(replies[1]["result"]["error"], "RegistryNotFound");
  EXPECT_EQ(replies[2]["result"]["current"], "2.0");
}

TEST_F(LspServerTest, StaleGenerationIsSuperseded)
{
  const auto replies = run({
    request(1, "lsconf/completion", {{"text", "filter { "}, {"offset", 9}, {"generation", 5}}),
    request(2, "lsconf/completion", {{"text", "filter { "}, {"offset", 9}, {"generation", 3}}),
    request(3, "lsconf/contextInfo", {{"text", ""}, {"offset", 0}, {"generation", 3}}),
  });

  ASSERT_EQ(replies.size(), 3U);
  EXPECT_TRUE(replies[0]["result"].contains("options"));
  EXPECT_EQ(replies[1]["result"]["superseded"], true);
  // Each method keeps its own counter.
  EXPECT_EQ(replies[2]["result"]["kind"], "top-level");
}

TEST_F(LspServerTest, InvalidParamsAndUnknownMethod)
{
  const auto replies = run({
    request(1, "lsconf/completion", {{"text", "x"}}),
    request(2, "lsconf/diagnostics", {{"text", "x"}, {"outcome", {{"ok", "maybe"}}}}),
    request(3, "lsconf/hover"),
    notification("lsconf/unknownNotification"),
  });

  ASSERT_EQ(replies.size(), 3U);
  EXPECT_EQ(replies[0]["error"]["code"], lsconf::lsp::rpc_error::k_invalid_params);
  EXPECT_EQ(replies[1]["error"]["code"], lsconf::lsp::rpc_error::k_invalid_params);
  EXPECT_EQ(replies[2]["error"]["code"], lsconf::lsp::rpc_error::k_method_not_found);
  EXPECT_NE(log_.str().find("lsconf_server: error handling 'lsconf/completion'"), std::string::npos);
}

TEST_F(LspServerTest, MalformedFrameIsSkipped)
{
  std::string input = "Content-Length: 5\r\n\r\n{bad}";
  input += frame(request(7, "lsconf/versions"));

  std::istringstream in(input);
  std::ostringstream out;
  Server server(service_, log_);
  EXPECT_EQ(server.run(in, out), 0);

  const auto replies = read_all(out.str());
  ASSERT_EQ(replies.size(), 1U);
  EXPECT_EQ(replies[0]["id"], 7);
}

TEST_F(LspServerTest, OversizedFrameEndsInputWithoutThrowing)
{
  std::string input = "Content-Length: 9223372036854775807\r\n\r\n";
  input += frame(request(8, "lsconf/versions"));

  std::istringstream in(input);
  std::ostringstream out;
  Server server(service_, log_);
  int code = -1;
  EXPECT_NO_THROW(code = server.run(in, out));
  EXPECT_EQ(code, 0);
  EXPECT_TRUE(read_all(out.str()).empty());
}
