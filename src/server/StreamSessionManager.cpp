#include "autocode/server/StreamSessionManager.hpp"
#include "autocode/Logger.hpp"
#include "autocode/errors.hpp"

#include <thread>

using json = nlohmann::json;

namespace autocode {
namespace server {

// ---------------------------------------------------------------------------
// StreamContext
// ---------------------------------------------------------------------------

StreamContext::StreamContext(json call_id,
                             std::shared_ptr<std::atomic<bool>> cancel_flag,
                             Emitter emitter)
    : call_id_(std::move(call_id)), cancel_flag_(std::move(cancel_flag)),
      emitter_(std::move(emitter)) {}

bool StreamContext::emit(const std::string &event, const json &data,
                         bool terminal) {
  std::lock_guard lock(mutex_);
  if (finished_) {
    LOG_DEBUG("STREAM", call_id_.dump(), "Dropping '{}' after terminal event",
              event);
    return false;
  }
  if (terminal)
    finished_ = true;
  emitter_(event, data);
  return true;
}

bool StreamContext::chunk(const json &data) {
  return emit("chunk", data, false);
}

bool StreamContext::complete(const json &data) {
  return emit("complete", data, true);
}

bool StreamContext::error(const json &data) {
  return emit("error", data, true);
}

bool StreamContext::error(const std::string &message) {
  return error(json{{"error", message}});
}

bool StreamContext::cancelled(const json &data) {
  return emit("cancelled", data, true);
}

bool StreamContext::finished() const {
  std::lock_guard lock(mutex_);
  return finished_;
}

// ---------------------------------------------------------------------------
// StreamSessionManager
// ---------------------------------------------------------------------------

StreamSessionManager::StreamSessionManager(Notifier notifier, AuditLog *audit)
    : notifier_(std::move(notifier)), audit_(audit) {}

StreamSessionManager::~StreamSessionManager() {
  std::unique_lock lock(mutex_);
  // Sessions that never launched have no thread to remove them.
  for (const auto &key : pending_)
    sessions_.erase(key);
  pending_.clear();
  for (auto &[key, session] : sessions_)
    session.cancel_flag->store(true);
  idle_cv_.wait(lock, [this]() { return sessions_.empty(); });
}

bool StreamSessionManager::start(const json &call_id, const Tool &tool,
                                 const json &arguments) {
  std::string key = call_id.dump();
  {
    std::lock_guard lock(mutex_);
    if (sessions_.count(key))
      return false;
    sessions_[key] = Session{call_id,
                             tool.name,
                             std::make_shared<std::atomic<bool>>(false),
                             std::chrono::steady_clock::now(),
                             tool.stream_handler,
                             arguments};
    pending_.push_back(key);
  }

  LOG_INFO("STREAM", key, "Starting stream for tool {}", tool.name);
  if (audit_) {
    audit_->record("stream_start", {{"callId", call_id},
                                    {"tool", tool.name},
                                    {"arguments", arguments}});
  }
  return true;
}

void StreamSessionManager::launch_pending() {
  std::lock_guard lock(mutex_);
  for (const auto &key : pending_) {
    auto it = sessions_.find(key);
    if (it == sessions_.end())
      continue;
    Session &session = it->second;
    std::thread(&StreamSessionManager::run_session, this, session.call_id,
                session.tool, std::move(session.handler),
                std::move(session.arguments), session.cancel_flag)
        .detach();
  }
  pending_.clear();
}

void StreamSessionManager::run_session(
    const json &call_id, std::string tool_name, StreamHandler handler,
    json arguments, std::shared_ptr<std::atomic<bool>> cancel_flag) {
  std::string key = call_id.dump();

  StreamContext ctx(call_id, cancel_flag,
                    [this, &call_id](const std::string &event,
                                     const json &data) {
                      notifier_(call_id, event, data);
                      if (audit_) {
                        audit_->record("stream_event", {{"callId", call_id},
                                                        {"event", event},
                                                        {"data", data}});
                      }
                    });

  try {
    handler(arguments, ctx);
    if (!ctx.finished()) {
      LOG_WARN("STREAM", key, "Handler for {} returned without terminal event",
               tool_name);
      ctx.error(std::string("stream ended without a terminal event"));
    }
  } catch (const ToolError &ex) {
    LOG_WARN("STREAM", key, "Tool error in {}: {}", tool_name, ex.what());
    ctx.error(json{{"error", ex.what()}, {"type", ex.kind()}});
  } catch (const std::exception &ex) {
    LOG_ERROR("STREAM", key, "Handler for {} threw: {}", tool_name, ex.what());
    ctx.error(std::string(ex.what()));
  }

  finish_session(key, tool_name);
}

void StreamSessionManager::finish_session(const std::string &key,
                                          const std::string &tool_name) {
  json call_id;
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(key);
    if (it != sessions_.end())
      call_id = it->second.call_id;
  }
  if (audit_)
    audit_->record("stream_end", {{"callId", call_id}, {"tool", tool_name}});
  LOG_INFO("STREAM", key, "Stream finished");

  // Erase and notify under the lock; after this the thread must not touch
  // the manager, which the destructor may now release.
  std::lock_guard lock(mutex_);
  sessions_.erase(key);
  idle_cv_.notify_all();
}

bool StreamSessionManager::cancel(const json &call_id) {
  std::string key = call_id.dump();
  {
    std::lock_guard lock(mutex_);
    auto it = sessions_.find(key);
    if (it == sessions_.end())
      return false;
    it->second.cancel_flag->store(true);
  }
  LOG_INFO("STREAM", key, "Cancellation requested");
  if (audit_)
    audit_->record("stream_cancel", {{"callId", call_id}});
  return true;
}

bool StreamSessionManager::is_active(const json &call_id) const {
  std::lock_guard lock(mutex_);
  return sessions_.count(call_id.dump()) > 0;
}

size_t StreamSessionManager::active_count() const {
  std::lock_guard lock(mutex_);
  return sessions_.size();
}

void StreamSessionManager::cancel_all() {
  std::lock_guard lock(mutex_);
  for (auto &[key, session] : sessions_)
    session.cancel_flag->store(true);
}

bool StreamSessionManager::wait_idle(std::chrono::milliseconds timeout) {
  std::unique_lock lock(mutex_);
  return idle_cv_.wait_for(lock, timeout,
                           [this]() { return sessions_.empty(); });
}

} // namespace server
} // namespace autocode
