// lsconf/lsp/server.cpp - JSON-RPC dispatch
//
#include "lsconf/lsp/server.hpp"

#include <cctype>
#include <cstdint>
#include <cstdlib>
#include <string_view>
#include <utility>

#include "lsconf/ast/json_reader.hpp"

namespace lsconf::lsp
{

namespace
{

using json = nlohmann::json;

std::string trim_cr(std::string s)
{
  if (!s.empty() && s.back() == '\r') {
    s.pop_back();
  }
  return s;
}

bool starts_with(std::string_view s, std::string_view p)
{
  return s.size() >= p.size() && s.substr(0, p.size()) == p;
}

std::string require_string(const json & params, const char * field)
{
  const auto it = params.find(field);
  if (it == params.end() || !it->is_string()) {
    throw InvalidParams(std::string("\"") + field + "\" must be a string");
  }
  return it->get<std::string>();
}

std::optional<uint64_t> as_unsigned(const json & j)
{
  if (j.is_number_unsigned()) {
    return j.get<uint64_t>();
  }
  if (j.is_number_integer() && j.get<int64_t>() >= 0) {
    return static_cast<uint64_t>(j.get<int64_t>());
  }
  return std::nullopt;
}

uint64_t require_offset(const json & params)
{
  const auto it = params.find("offset");
  const auto offset = it != params.end() ? as_unsigned(*it) : std::nullopt;
  if (!offset) {
    throw InvalidParams("\"offset\" must be a non-negative integer");
  }
  return *offset;
}

/// @return false if the request carries a generation older than the newest seen.
bool accept_generation(RequestGeneration & gen, const json & params)
{
  const auto it = params.find("generation");
  if (it == params.end() || it->is_null()) {
    return true;
  }
  const auto g = as_unsigned(*it);
  if (!g) {
    throw InvalidParams("\"generation\" must be a non-negative integer");
  }
  if (!gen.is_current(*g)) {
    return false;
  }
  gen.observe(*g);
  return true;
}

// Frames above this size are skipped unread.
constexpr long k_max_content_length = 64L * 1024 * 1024;

const json & superseded()
{
  static const json k_superseded = json{{"superseded", true}};
  return k_superseded;
}

}  // namespace

// ============================================================================
// JsonRpcConnection
// ============================================================================

std::optional<RpcMessage> JsonRpcConnection::read_message()
{
  std::string line;
  long content_length = -1;

  // Read headers
  while (std::getline(in_, line)) {
    line = trim_cr(line);
    if (line.empty()) {
      break;
    }

    const std::string_view sv(line);
    constexpr std::string_view k_content_length = "Content-Length:";
    if (starts_with(sv, k_content_length)) {
      std::string_view rest = sv.substr(k_content_length.size());
      while (!rest.empty() && std::isspace(static_cast<unsigned char>(rest.front()))) {
        rest.remove_prefix(1);
      }
      content_length = std::strtol(std::string(rest).c_str(), nullptr, 10);
    }
  }

  if (!in_) {
    return std::nullopt;
  }

  if (content_length <= 0) {
    // Invalid message. Try to continue.
    return std::nullopt;
  }

  if (content_length > k_max_content_length) {
    in_.ignore(static_cast<std::streamsize>(content_length));
    return std::nullopt;
  }

  std::string body;
  body.resize(static_cast<size_t>(content_length));
  in_.read(body.data(), static_cast<std::streamsize>(body.size()));
  if (in_.gcount() != static_cast<std::streamsize>(body.size())) {
    return std::nullopt;
  }

  RpcMessage msg;
  try {
    msg.payload = json::parse(body);
  } catch (const json::parse_error &) {
    return std::nullopt;
  }
  return msg;
}

void JsonRpcConnection::write_response(const json & id, const json & result)
{
  json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = id;
  resp["result"] = result;
  write_payload(resp);
}

void JsonRpcConnection::write_error(const json & id, int code, std::string message)
{
  json resp;
  resp["jsonrpc"] = "2.0";
  resp["id"] = id;
  resp["error"] = json{{"code", code}, {"message", std::move(message)}};
  write_payload(resp);
}

void JsonRpcConnection::write_payload(const json & payload)
{
  const std::string body = payload.dump();
  out_ << "Content-Length: " << body.size() << "\r\n\r\n";
  out_ << body;
  out_.flush();
}

// ============================================================================
// Handlers
// ============================================================================

void Server::log_handler_error(const std::string & method, const std::string & what)
{
  log_ << "lsconf_server: error handling '" << method << "': " << what << "\n";
}

json Server::handle_initialize(const json & params)
{
  (void)params;

  json caps;
  caps["diagnosticsProvider"] = true;
  caps["completionProvider"] = json{{"resolveProvider", false}};
  caps["contextInfoProvider"] = true;
  caps["versionProvider"] = true;

  json result;
  result["capabilities"] = caps;
  result["serverInfo"] = json{{"name", "lsconf"}, {"version", "0.1.0"}};
  return result;
}

json Server::handle_diagnostics(const json & params)
{
  if (!accept_generation(diagnostics_generation_, params)) {
    return superseded();
  }

  const std::string text = require_string(params, "text");
  const auto it = params.find("outcome");
  if (it == params.end()) {
    throw InvalidParams("\"outcome\" is required");
  }

  const auto read = it->is_string() ? ast::read_parse_outcome(std::string_view{it->get<std::string>()})
                                    : ast::read_parse_outcome(*it);
  if (!read.success) {
    throw InvalidParams("bad parse outcome: " + read.error);
  }

  return json::parse(service_.diagnostics_json(text, read.outcome));
}

json Server::handle_completion(const json & params)
{
  if (!accept_generation(completion_generation_, params)) {
    return superseded();
  }
  const std::string text = require_string(params, "text");
  return json::parse(service_.completion_json(text, require_offset(params)));
}

json Server::handle_context_info(const json & params)
{
  if (!accept_generation(context_generation_, params)) {
    return superseded();
  }
  const std::string text = require_string(params, "text");
  return json::parse(service_.context_info_json(text, require_offset(params)));
}

json Server::handle_switch_version(const json & params)
{
  const std::string version = require_string(params, "version");
  return json::parse(service_.switch_version_json(version));
}

// ============================================================================
// Dispatch
// ============================================================================

std::optional<int> Server::handle_message(
  JsonRpcConnection & conn, const std::string & method, bool is_request, const json & id,
  const json & params)
{
  // -----------------------------
  // Lifecycle
  // -----------------------------

  if (method == "initialize") {
    if (is_request) {
      conn.write_response(id, handle_initialize(params));
    }
    return std::nullopt;
  }

  if (method == "initialized") {
    return std::nullopt;
  }

  if (method == "shutdown") {
    shutdown_requested_ = true;
    if (is_request) {
      conn.write_response(id, nullptr);
    }
    return std::nullopt;
  }

  if (method == "exit") {
    return shutdown_requested_ ? 0 : 1;
  }

  // -----------------------------
  // Language features
  // -----------------------------

  using Handler = json (Server::*)(const json &);
  Handler handler = nullptr;

  if (method == "lsconf/diagnostics") {
    handler = &Server::handle_diagnostics;
  } else if (method == "lsconf/completion") {
    handler = &Server::handle_completion;
  } else if (method == "lsconf/contextInfo") {
    handler = &Server::handle_context_info;
  } else if (method == "lsconf/switchVersion") {
    handler = &Server::handle_switch_version;
  } else if (method == "lsconf/versions") {
    if (is_request) {
      conn.write_response(id, json::parse(service_.versions_json()));
    }
    return std::nullopt;
  }

  if (handler == nullptr) {
    // Unknown request: return method not found
    if (is_request) {
      conn.write_error(id, rpc_error::k_method_not_found, "Method not found");
    }
    return std::nullopt;
  }

  if (!is_request) {
    return std::nullopt;
  }

  try {
    conn.write_response(id, (this->*handler)(params));
  } catch (const InvalidParams & e) {
    log_handler_error(method, e.what());
    conn.write_error(id, rpc_error::k_invalid_params, e.what());
  } catch (const json::exception & e) {
    log_handler_error(method, e.what());
    conn.write_error(id, rpc_error::k_invalid_params, "Invalid params");
  } catch (const std::exception & e) {
    log_handler_error(method, e.what());
    conn.write_error(id, rpc_error::k_internal_error, "Internal error");
  }
  return std::nullopt;
}

int Server::run(std::istream & in, std::ostream & out)
{
  JsonRpcConnection conn(in, out);

  for (;;) {
    const auto msg_opt = conn.read_message();
    if (!msg_opt) {
      if (!conn.good()) {
        break;
      }
      continue;
    }

    const json & m = msg_opt->payload;
    if (!m.is_object()) {
      continue;
    }
    const auto method_it = m.find("method");
    const bool has_method = method_it != m.end() && method_it->is_string();
    const std::string method = has_method ? method_it->get<std::string>() : std::string();

    const bool is_request = m.contains("id");
    const json id = is_request ? m.at("id") : json();
    const json params = m.contains("params") ? m.at("params") : json::object();

    const auto exit_code = handle_message(conn, method, is_request, id, params);
    if (exit_code) {
      return *exit_code;
    }
  }

  return 0;
}

}  // namespace lsconf::lsp
