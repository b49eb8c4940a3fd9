#pragma once
#include "autocode/ipc/ReplyChannel.hpp"
#include "autocode/ipc/RuntimeProfile.hpp"
#include "autocode/ipc/WorkerProtocol.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <sys/types.h>

namespace autocode {
namespace ipc {

using ProcessId = pid_t;

enum class WorkerState { Stopped, Starting, Running, Dead };

enum class WriteStatus { Written, Timeout, Failed };

const char *to_string(WorkerState state);

/// One interpreter child process running the bootstrap loop.
///
/// The child's stdin is the request pipe; its stdout and stderr are merged
/// into a single reply pipe wrapped by a ReplyChannel. Writes must be
/// serialized by the caller; the status accessors are safe from any thread.
class WorkerProcess {
public:
  explicit WorkerProcess(RuntimeProfile profile);
  ~WorkerProcess();

  WorkerProcess(const WorkerProcess &) = delete;
  WorkerProcess &operator=(const WorkerProcess &) = delete;

  /// Write the bootstrap program and spawn the interpreter.
  /// Returns false and records last_error() on failure.
  bool start();

  /// Close stdin, SIGTERM, wait up to `grace`, then SIGKILL and reap.
  /// Removes the bootstrap file. Safe to call more than once.
  void stop(std::chrono::milliseconds grace);

  /// Non-blocking liveness check; reaps the child when it has exited.
  bool is_alive();

  /// Send one line (a newline is appended) to the interpreter's stdin.
  /// The pipe is non-blocking; a worker that stops reading makes this
  /// return Timeout at `deadline`, possibly after a partial write.
  WriteStatus write_line(const std::string &line,
                         std::chrono::steady_clock::time_point deadline,
                         std::string &error);

  /// Deliver SIGINT so the in-flight evaluation aborts.
  bool interrupt();

  /// Record that the process can no longer be used.
  void mark_dead();

  WorkerState state() const;
  ProcessId pid() const;
  const Markers &markers() const { return markers_; }
  std::shared_ptr<ReplyChannel> channel() const { return channel_; }
  const std::string &bootstrap_path() const { return bootstrap_path_; }
  const std::string &last_error() const { return last_error_; }

private:
  RuntimeProfile profile_;
  Markers markers_;
  std::string bootstrap_path_;
  std::string last_error_;

  int stdin_fd_{-1};
  std::shared_ptr<ReplyChannel> channel_;

  mutable std::mutex state_mutex_;
  WorkerState state_{WorkerState::Stopped};
  ProcessId pid_{0};
  bool reaped_{true};

  bool write_bootstrap_file();
  bool spawn_process();
  bool poll_exit_locked();
  void remove_bootstrap_file();
};

} // namespace ipc
} // namespace autocode
