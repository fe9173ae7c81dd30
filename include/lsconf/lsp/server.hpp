// lsconf/lsp/server.hpp - JSON-RPC over stdio (Content-Length framing)
//
// Methods:
//   initialize, shutdown, exit
//   lsconf/diagnostics   {text, outcome, generation?}
//   lsconf/completion    {text, offset, generation?}
//   lsconf/contextInfo   {text, offset, generation?}
//   lsconf/versions      {}
//   lsconf/switchVersion {version}
//
#pragma once

#include <istream>
#include <optional>
#include <ostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>

#include "lsconf/lsp/language_service.hpp"
#include "lsconf/lsp/request_generation.hpp"

namespace lsconf::lsp
{

struct RpcMessage
{
  nlohmann::json payload;
};

class JsonRpcConnection
{
public:
  explicit JsonRpcConnection(std::istream & in, std::ostream & out) : in_(in), out_(out) {}

  /// Next framed message; std::nullopt on EOF or an unreadable frame.
  std::optional<RpcMessage> read_message();

  void write_response(const nlohmann::json & id, const nlohmann::json & result);
  void write_error(const nlohmann::json & id, int code, std::string message);

  [[nodiscard]] bool good() const { return in_.good(); }

private:
  void write_payload(const nlohmann::json & payload);

  std::istream & in_;
  std::ostream & out_;
};

/// JSON-RPC error codes used by the server.
namespace rpc_error
{
inline constexpr int k_method_not_found = -32601;
inline constexpr int k_invalid_params = -32602;
inline constexpr int k_internal_error = -32603;
}  // namespace rpc_error

/**
 * Dispatches requests to a LanguageService.
 *
 * Requests that carry a `generation` older than one already seen on the same
 * method are answered with `{"superseded": true}` instead of being computed.
 */
class Server
{
public:
  /**
   * @param service Language service; must outlive the server
   * @param log     Stream for error and progress lines (typically std::cerr)
   */
  Server(LanguageService & service, std::ostream & log) : service_(service), log_(log) {}

  /// Serve until `exit` or EOF. Returns the process exit code.
  int run(std::istream & in, std::ostream & out);

  /**
   * Handle one message.
   *
   * @return exit code once `exit` has been received, std::nullopt otherwise
   */
  std::optional<int> handle_message(
    JsonRpcConnection & conn, const std::string & method, bool is_request,
    const nlohmann::json & id, const nlohmann::json & params);

  [[nodiscard]] bool shutdown_requested() const noexcept { return shutdown_requested_; }

private:
  nlohmann::json handle_initialize(const nlohmann::json & params);
  nlohmann::json handle_diagnostics(const nlohmann::json & params);
  nlohmann::json handle_completion(const nlohmann::json & params);
  nlohmann::json handle_context_info(const nlohmann::json & params);
  nlohmann::json handle_switch_version(const nlohmann::json & params);

  void log_handler_error(const std::string & method, const std::string & what);

  LanguageService & service_;
  std::ostream & log_;
  bool shutdown_requested_ = false;

  RequestGeneration diagnostics_generation_;
  RequestGeneration completion_generation_;
  RequestGeneration context_generation_;
};

/// Thrown by handlers for well-formed JSON with unusable params.
class InvalidParams : public std::runtime_error
{
public:
  using std::runtime_error::runtime_error;
};

}  // namespace lsconf::lsp
