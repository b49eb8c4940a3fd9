#pragma once
#include "autocode/server/AuditLog.hpp"
#include "autocode/server/ToolRegistry.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_map>
#include <vector>

namespace autocode {
namespace server {

/// Handle given to a streaming handler for one call.
///
/// Enforces the event contract: any number of `chunk` events, then exactly
/// one terminal event (`complete`, `error` or `cancelled`). Events after
/// the terminal one are dropped and the emitting call returns false.
class StreamContext {
public:
  using Emitter =
      std::function<void(const std::string &event, const nlohmann::json &)>;

  StreamContext(nlohmann::json call_id,
                std::shared_ptr<std::atomic<bool>> cancel_flag,
                Emitter emitter);

  const nlohmann::json &call_id() const { return call_id_; }

  /// Checkpoint for handlers: true once `tools/cancel` hit this call.
  bool cancel_requested() const { return cancel_flag_->load(); }

  bool chunk(const nlohmann::json &data);
  bool complete(const nlohmann::json &data);
  bool error(const nlohmann::json &data);
  bool error(const std::string &message);
  bool cancelled(const nlohmann::json &data);

  /// True once a terminal event has been emitted.
  bool finished() const;

private:
  bool emit(const std::string &event, const nlohmann::json &data,
            bool terminal);

  nlohmann::json call_id_;
  std::shared_ptr<std::atomic<bool>> cancel_flag_;
  Emitter emitter_;
  mutable std::mutex mutex_;
  bool finished_{false};
};

/// Runs streaming tool calls on background threads and tracks them by
/// call id until their handler returns.
class StreamSessionManager {
public:
  using Notifier = std::function<void(const nlohmann::json &call_id,
                                      const std::string &event,
                                      const nlohmann::json &data)>;

  StreamSessionManager(Notifier notifier, AuditLog *audit = nullptr);

  /// Cancels every session and waits for all handler threads.
  ~StreamSessionManager();

  StreamSessionManager(const StreamSessionManager &) = delete;
  StreamSessionManager &operator=(const StreamSessionManager &) = delete;

  /// Register a session for the tool's stream handler. Its thread starts
  /// at the next launch_pending(), after the acknowledgement is written.
  /// Returns false if `call_id` already names an active session.
  bool start(const nlohmann::json &call_id, const Tool &tool,
             const nlohmann::json &arguments);

  /// Start the handler threads of every session registered since the last
  /// call.
  void launch_pending();

  /// Set the session's cancellation flag. Never waits for the handler.
  bool cancel(const nlohmann::json &call_id);

  bool is_active(const nlohmann::json &call_id) const;
  size_t active_count() const;

  void cancel_all();

  /// Block until no session is active. Returns false on timeout.
  bool wait_idle(std::chrono::milliseconds timeout);

private:
  struct Session {
    nlohmann::json call_id;
    std::string tool;
    std::shared_ptr<std::atomic<bool>> cancel_flag;
    std::chrono::steady_clock::time_point started_at;
    StreamHandler handler;
    nlohmann::json arguments;
  };

  void run_session(const nlohmann::json &call_id, std::string tool_name,
                   StreamHandler handler, nlohmann::json arguments,
                   std::shared_ptr<std::atomic<bool>> cancel_flag);
  void finish_session(const std::string &key, const std::string &tool_name);

  Notifier notifier_;
  AuditLog *audit_;

  mutable std::mutex mutex_;
  std::condition_variable idle_cv_;
  std::unordered_map<std::string, Session> sessions_; // key: call_id.dump()
  std::vector<std::string> pending_;                   // not yet launched
};

} // namespace server
} // namespace autocode
