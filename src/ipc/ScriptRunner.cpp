#include "autocode/ipc/ScriptRunner.hpp"
#include "autocode/Logger.hpp"

#include <algorithm>
#include <atomic>
#include <future>
#include <thread>
#include <vector>

namespace autocode {
namespace ipc {

namespace {

struct ReaderOutcome {
  enum class Status { Marker, Eof, Error, Aborted };
  Status status{Status::Aborted};
  bool ok{false};
  std::string payload;
  std::vector<std::string> captured;
  std::string error;
};

std::string join_lines(const std::vector<std::string> &lines) {
  std::string out;
  for (size_t i = 0; i < lines.size(); i++) {
    if (i > 0)
      out += '\n';
    out += lines[i];
  }
  return out;
}

// Body of the per-call reader thread. Reads until the reply numbered `seq`
// arrives, checking `abort` once per slice. Replies with another number are
// late answers to timed-out calls and are dropped with their output.
ReaderOutcome read_reply(ReplyChannel &channel, const Markers &markers,
                         uint64_t seq, const std::atomic<bool> &abort,
                         std::chrono::milliseconds slice) {
  ReaderOutcome outcome;
  try {
    std::string line;
    while (!abort.load()) {
      auto status = channel.read_line(line, outcome.error,
                                      ReplyChannel::Clock::now() + slice);
      if (status == ReplyChannel::ReadStatus::Timeout)
        continue;
      if (status == ReplyChannel::ReadStatus::Eof) {
        outcome.status = ReaderOutcome::Status::Eof;
        return outcome;
      }
      if (status == ReplyChannel::ReadStatus::Error) {
        outcome.status = ReaderOutcome::Status::Error;
        return outcome;
      }

      auto reply = classify_reply_line(line, markers);
      if (reply.kind == ReplyLine::Kind::Output) {
        outcome.captured.push_back(std::move(reply.text));
        continue;
      }
      if (reply.seq != seq) {
        LOG_DEBUG("RUNNER", "reader", "Discarding stale reply {} (want {})",
                  reply.seq ? std::to_string(*reply.seq) : "unnumbered",
                  seq);
        outcome.captured.clear();
        continue;
      }
      outcome.status = ReaderOutcome::Status::Marker;
      outcome.ok = reply.kind == ReplyLine::Kind::Result;
      outcome.payload = std::move(reply.text);
      return outcome;
    }
  } catch (const std::exception &ex) {
    outcome.status = ReaderOutcome::Status::Error;
    outcome.error = ex.what();
  }
  return outcome;
}

// Joined on every path out of run(), so at most one reader ever touches
// the channel.
struct ReaderThread {
  std::atomic<bool> abort{false};
  std::thread thread;

  ~ReaderThread() { stop(); }

  void stop() {
    abort = true;
    if (thread.joinable())
      thread.join();
  }
};

} // namespace

ScriptRunner::ScriptRunner(RuntimeProfile profile, RunnerOptions options)
    : profile_(std::move(profile)), options_(options) {}

ScriptRunner::~ScriptRunner() { stop(); }

bool ScriptRunner::start() {
  std::lock_guard call_lock(call_mutex_);
  std::string error;
  return ensure_worker_locked(error);
}

void ScriptRunner::stop() {
  std::lock_guard call_lock(call_mutex_);
  stop_locked();
}

bool ScriptRunner::restart() {
  std::lock_guard call_lock(call_mutex_);
  LOG_INFO("RUNNER", profile_.name, "Restart requested");
  stop_locked();
  std::string error;
  return ensure_worker_locked(error);
}

void ScriptRunner::stop_locked() {
  std::unique_ptr<WorkerProcess> old;
  {
    std::lock_guard lock(worker_mutex_);
    old = std::move(worker_);
  }
  if (old)
    old->stop(options_.stop_grace);
}

bool ScriptRunner::ensure_worker_locked(std::string &error) {
  {
    std::lock_guard lock(worker_mutex_);
    if (worker_ && worker_->is_alive())
      return true;
  }

  bool replacing = false;
  {
    std::lock_guard lock(worker_mutex_);
    replacing = worker_ != nullptr;
  }
  if (replacing) {
    LOG_WARN("RUNNER", profile_.name, "Worker not alive, restarting");
    stop_locked();
    std::lock_guard stats_lock(stats_mutex_);
    stats_.restarts++;
  }

  auto worker = std::make_unique<WorkerProcess>(profile_);
  bool started = worker->start();
  if (!started)
    error = worker->last_error();

  std::lock_guard lock(worker_mutex_);
  worker_ = std::move(worker);
  return started;
}

RunResult ScriptRunner::run(const std::string &expression,
                            std::chrono::milliseconds timeout) {
  std::lock_guard call_lock(call_mutex_);
  {
    std::lock_guard stats_lock(stats_mutex_);
    stats_.calls++;
  }

  std::string error;
  if (!ensure_worker_locked(error)) {
    RunResult result{false, "Worker process not available: " + error};
    record(result);
    return result;
  }

  // worker_ is only replaced under call_mutex_, which we hold.
  WorkerProcess &worker = *worker_;

  uint64_t seq = next_seq_++;
  auto deadline = std::chrono::steady_clock::now() + timeout;

  std::string line =
      frame_expression(profile_, seq, expression, options_.wrap_threshold);
  auto written = worker.write_line(line, deadline, error);
  if (written == WriteStatus::Timeout) {
    // A partly written request would corrupt the framing of the next one.
    LOG_WARN("RUNNER", profile_.name,
             "Worker not reading stdin after {}ms, marking it dead",
             timeout.count());
    worker.mark_dead();
    RunResult result = timed_out();
    record(result);
    return result;
  }
  if (written == WriteStatus::Failed) {
    worker.mark_dead();
    RunResult result{false, "Failed to write to worker stdin: " + error};
    record(result);
    return result;
  }

  auto channel = worker.channel();
  Markers markers = worker.markers();
  std::promise<ReaderOutcome> promise;
  auto future = promise.get_future();
  ReaderThread reader;
  reader.thread = std::thread([&]() {
    promise.set_value(read_reply(*channel, markers, seq, reader.abort,
                                 options_.poll_interval));
  });

  bool exited = false;
  while (true) {
    auto now = std::chrono::steady_clock::now();
    if (now >= deadline)
      break;
    auto slice = std::min<std::chrono::steady_clock::duration>(
        options_.poll_interval, deadline - now);
    if (future.wait_for(slice) == std::future_status::ready)
      break;
    if (!worker.is_alive()) {
      // Let the reader drain whatever the worker wrote before exiting.
      future.wait_for(options_.poll_interval);
      exited = true;
      break;
    }
  }

  // Returns within one poll slice; a reply that landed meanwhile is kept.
  reader.stop();
  ReaderOutcome outcome = future.get();

  RunResult result;
  switch (outcome.status) {
  case ReaderOutcome::Status::Marker:
    if (outcome.ok && !outcome.captured.empty())
      result = {true, join_lines(outcome.captured)};
    else
      result = {outcome.ok, std::move(outcome.payload)};
    break;
  case ReaderOutcome::Status::Eof:
    worker.mark_dead();
    result = {false, WORKER_EXITED_MESSAGE};
    if (!outcome.captured.empty())
      result.payload += "\n" + join_lines(outcome.captured);
    break;
  case ReaderOutcome::Status::Error:
    worker.mark_dead();
    result = {false, "Reader thread error: " + outcome.error};
    break;
  case ReaderOutcome::Status::Aborted:
    if (exited) {
      worker.mark_dead();
      result = {false, WORKER_EXITED_MESSAGE};
    } else {
      LOG_WARN("RUNNER", profile_.name,
               "Call timed out after {}ms, interrupting worker",
               timeout.count());
      worker.interrupt();
      result = timed_out();
    }
    break;
  }

  record(result);
  return result;
}

RunResult ScriptRunner::timed_out() {
  std::lock_guard stats_lock(stats_mutex_);
  stats_.timeouts++;
  return {false, TIMEOUT_MESSAGE};
}

void ScriptRunner::record(const RunResult &result) {
  std::lock_guard lock(stats_mutex_);
  if (result.success)
    stats_.succeeded++;
  else
    stats_.failed++;
}

bool ScriptRunner::is_alive() const {
  std::lock_guard lock(worker_mutex_);
  return worker_ && worker_->is_alive();
}

WorkerState ScriptRunner::state() const {
  std::lock_guard lock(worker_mutex_);
  return worker_ ? worker_->state() : WorkerState::Stopped;
}

ProcessId ScriptRunner::pid() const {
  std::lock_guard lock(worker_mutex_);
  return worker_ ? worker_->pid() : 0;
}

ScriptRunner::Stats ScriptRunner::get_stats() const {
  std::lock_guard lock(stats_mutex_);
  return stats_;
}

} // namespace ipc
} // namespace autocode
