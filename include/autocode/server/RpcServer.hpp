#pragma once
#include "autocode/server/AuditLog.hpp"
#include "autocode/server/OutputChannel.hpp"
#include "autocode/server/StreamSessionManager.hpp"
#include "autocode/server/ToolRegistry.hpp"

#include <atomic>
#include <istream>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace autocode {
namespace server {

// JSON-RPC error codes
constexpr int PARSE_ERROR = -32700;
constexpr int INVALID_REQUEST = -32600;
constexpr int METHOD_NOT_FOUND = -32601;
constexpr int INVALID_PARAMS = -32602;
constexpr int SERVER_ERROR = -32000;

constexpr const char *PROTOCOL_VERSION = "2024-11-05";

struct ServerInfo {
  std::string name{"autocode-mcp"};
  std::string version{"0.1.0"};
};

nlohmann::json make_result(const nlohmann::json &id,
                           const nlohmann::json &result);
nlohmann::json make_error(const nlohmann::json &id, int code,
                          const std::string &message,
                          const nlohmann::json &data = nullptr);

/// Line-delimited JSON-RPC dispatcher over a tool registry.
///
/// Requests are read and answered on one thread, in order. Streaming tool
/// calls are acknowledged immediately and continue on their own threads;
/// their notifications share the same OutputChannel.
class RpcServer {
public:
  RpcServer(const ToolRegistry &registry, OutputChannel &output,
            AuditLog &audit, ServerInfo info = {});

  /// Read requests until end of input or a `shutdown` request.
  void serve(std::istream &in);

  /// Handle one line, write its response, then start any streaming calls
  /// it opened so their notifications follow the acknowledgement.
  std::optional<nlohmann::json> process_line(const std::string &line);

  /// Handle one raw input line without writing or launching streams.
  /// std::nullopt when nothing is answered
  /// (blank line, notification, batch of notifications).
  std::optional<nlohmann::json> handle_line(const std::string &line);

  /// Handle one decoded request object. std::nullopt for notifications.
  std::optional<nlohmann::json> handle_request(const nlohmann::json &request);

  bool shutdown_requested() const { return shutdown_requested_.load(); }

  /// Make serve() return before it handles another line. Safe to call from
  /// any thread; a blocked read still has to be interrupted by the caller.
  void request_stop() { stop_requested_ = true; }
  bool stop_requested() const { return stop_requested_.load(); }

  StreamSessionManager &sessions() { return sessions_; }

private:
  nlohmann::json dispatch(const nlohmann::json &id, const std::string &method,
                          const nlohmann::json &params);
  nlohmann::json handle_tools_call(const nlohmann::json &id,
                                   const nlohmann::json &params);
  nlohmann::json handle_tools_cancel(const nlohmann::json &id,
                                     const nlohmann::json &params);
  nlohmann::json handle_batch(const nlohmann::json &batch);

  void send_notification(const nlohmann::json &call_id,
                         const std::string &event, const nlohmann::json &data);

  const ToolRegistry &registry_;
  OutputChannel &output_;
  AuditLog &audit_;
  ServerInfo info_;
  std::atomic<bool> shutdown_requested_{false};
  std::atomic<bool> stop_requested_{false};

  // Declared last: its destructor waits for handler threads that still
  // write through output_ and audit_.
  StreamSessionManager sessions_;
};

} // namespace server
} // namespace autocode
