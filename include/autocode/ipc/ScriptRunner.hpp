#pragma once
#include "autocode/ipc/RuntimeProfile.hpp"
#include "autocode/ipc/WorkerProcess.hpp"
#include "autocode/ipc/WorkerProtocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace autocode {
namespace ipc {

constexpr const char *TIMEOUT_MESSAGE = "Timeout waiting for response";
constexpr const char *WORKER_EXITED_MESSAGE = "Worker process exited";

/// Outcome of one runner call. On failure `payload` holds the message.
struct RunResult {
  bool success{false};
  std::string payload;
};

struct RunnerOptions {
  size_t wrap_threshold{DEFAULT_WRAP_THRESHOLD};
  std::chrono::milliseconds stop_grace{2000};
  std::chrono::milliseconds poll_interval{50};
};

/// Runs expressions one at a time against a persistent interpreter.
///
/// The worker is started lazily on the first call and replaced whenever a
/// call finds it dead. Every request carries a sequence number that the
/// worker echoes in its reply. A timed-out call leaves the process running
/// and interrupts the evaluation; its late reply, if any, carries a stale
/// number and is discarded by the next call's reader.
class ScriptRunner {
public:
  explicit ScriptRunner(RuntimeProfile profile, RunnerOptions options = {});
  ~ScriptRunner();

  ScriptRunner(const ScriptRunner &) = delete;
  ScriptRunner &operator=(const ScriptRunner &) = delete;

  RunResult run(const std::string &expression,
                std::chrono::milliseconds timeout);

  /// Start the worker now instead of on the first call.
  bool start();
  void stop();
  bool restart();

  bool is_alive() const;
  WorkerState state() const;
  ProcessId pid() const;
  const RuntimeProfile &profile() const { return profile_; }

  struct Stats {
    uint64_t calls{0};
    uint64_t succeeded{0};
    uint64_t failed{0};
    uint64_t timeouts{0};
    uint64_t restarts{0};
  };
  Stats get_stats() const;

private:
  RuntimeProfile profile_;
  RunnerOptions options_;

  // Held for the whole of a call, and for start/stop.
  std::mutex call_mutex_;

  // Guards the pointer itself so status reads never wait on a call.
  mutable std::mutex worker_mutex_;
  std::unique_ptr<WorkerProcess> worker_;

  mutable std::mutex stats_mutex_;
  Stats stats_;

  // Never reset, so a reply from a previous worker can never match.
  uint64_t next_seq_{1};

  bool ensure_worker_locked(std::string &error);
  void stop_locked();
  void record(const RunResult &result);
  RunResult timed_out();
};

} // namespace ipc
} // namespace autocode
