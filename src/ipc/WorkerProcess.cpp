#include "autocode/ipc/WorkerProcess.hpp"
#include "autocode/Logger.hpp"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <spawn.h>
#include <sys/wait.h>
#include <thread>
#include <unistd.h>
#include <vector>

extern char **environ;

namespace autocode {
namespace ipc {

namespace {

void close_fd(int &fd) {
  if (fd >= 0) {
    ::close(fd);
    fd = -1;
  }
}

bool write_all(int fd, const char *data, size_t size, std::string &error) {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n < 0) {
      if (errno == EINTR)
        continue;
      error = std::strerror(errno);
      return false;
    }
    data += n;
    size -= static_cast<size_t>(n);
  }
  return true;
}

WriteStatus write_until(int fd, const char *data, size_t size,
                        std::chrono::steady_clock::time_point deadline,
                        std::string &error) {
  while (size > 0) {
    ssize_t n = ::write(fd, data, size);
    if (n >= 0) {
      data += n;
      size -= static_cast<size_t>(n);
      continue;
    }
    if (errno == EINTR)
      continue;
    if (errno != EAGAIN && errno != EWOULDBLOCK) {
      error = std::strerror(errno);
      return WriteStatus::Failed;
    }

    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) {
      error = "worker is not reading its stdin";
      return WriteStatus::Timeout;
    }
    pollfd pfd{fd, POLLOUT, 0};
    if (::poll(&pfd, 1, static_cast<int>(remaining.count())) < 0 &&
        errno != EINTR) {
      error = std::strerror(errno);
      return WriteStatus::Failed;
    }
  }
  return WriteStatus::Written;
}

} // namespace

const char *to_string(WorkerState state) {
  switch (state) {
  case WorkerState::Stopped:
    return "stopped";
  case WorkerState::Starting:
    return "starting";
  case WorkerState::Running:
    return "running";
  case WorkerState::Dead:
    return "dead";
  }
  return "unknown";
}

WorkerProcess::WorkerProcess(RuntimeProfile profile)
    : profile_(std::move(profile)), markers_(Markers::generate()) {}

WorkerProcess::~WorkerProcess() { stop(std::chrono::milliseconds(500)); }

bool WorkerProcess::start() {
  {
    std::lock_guard lock(state_mutex_);
    if (state_ == WorkerState::Running || state_ == WorkerState::Starting)
      return true;
    state_ = WorkerState::Starting;
  }

  // A write to a dead worker must fail with EPIPE, not kill the server.
  std::signal(SIGPIPE, SIG_IGN);

  LOG_INFO("WORKER", profile_.name, "Starting worker: {}", profile_.executable);

  if (!write_bootstrap_file() || !spawn_process()) {
    LOG_ERROR("WORKER", profile_.name, "Failed to start worker: {}",
              last_error_);
    remove_bootstrap_file();
    std::lock_guard lock(state_mutex_);
    state_ = WorkerState::Dead;
    return false;
  }

  std::lock_guard lock(state_mutex_);
  state_ = WorkerState::Running;
  LOG_INFO("WORKER", profile_.name, "Worker spawned: PID={}", pid_);
  return true;
}

bool WorkerProcess::write_bootstrap_file() {
  std::error_code ec;
  auto dir = std::filesystem::temp_directory_path(ec);
  if (ec)
    dir = "/tmp";

  std::string path =
      (dir / ("autocode_bootstrap_XXXXXX" + profile_.bootstrap_extension))
          .string();
  std::vector<char> templ(path.begin(), path.end());
  templ.push_back('\0');

  int fd = ::mkstemps(templ.data(),
                      static_cast<int>(profile_.bootstrap_extension.size()));
  if (fd < 0) {
    last_error_ = fmt::format("mkstemps failed: {}", std::strerror(errno));
    return false;
  }
  bootstrap_path_ = templ.data();

  std::string program = render_bootstrap(profile_, markers_);
  std::string error;
  bool ok = write_all(fd, program.data(), program.size(), error);
  ::close(fd);
  if (!ok) {
    last_error_ = fmt::format("Failed to write bootstrap {}: {}",
                              bootstrap_path_, error);
    return false;
  }
  return true;
}

bool WorkerProcess::spawn_process() {
  int in_pipe[2];
  int out_pipe[2];
  if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
    last_error_ = fmt::format("pipe2 failed: {}", std::strerror(errno));
    return false;
  }
  if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
    last_error_ = fmt::format("pipe2 failed: {}", std::strerror(errno));
    ::close(in_pipe[0]);
    ::close(in_pipe[1]);
    return false;
  }

  std::vector<std::string> args;
  args.push_back(profile_.executable);
  args.insert(args.end(), profile_.launch_args.begin(),
              profile_.launch_args.end());
  args.push_back(bootstrap_path_);

  std::vector<char *> argv;
  for (auto &arg : args)
    argv.push_back(const_cast<char *>(arg.c_str()));
  argv.push_back(nullptr);

  posix_spawn_file_actions_t actions;
  posix_spawn_file_actions_init(&actions);
  posix_spawn_file_actions_adddup2(&actions, in_pipe[0], STDIN_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDOUT_FILENO);
  posix_spawn_file_actions_adddup2(&actions, out_pipe[1], STDERR_FILENO);

  // Own process group so a terminal Ctrl-C does not reach the worker, and
  // default dispositions so the child does not inherit our ignored SIGPIPE.
  posix_spawnattr_t attr;
  posix_spawnattr_init(&attr);
  sigset_t empty_mask;
  sigset_t default_signals;
  sigemptyset(&empty_mask);
  sigemptyset(&default_signals);
  sigaddset(&default_signals, SIGPIPE);
  sigaddset(&default_signals, SIGINT);
  posix_spawnattr_setsigmask(&attr, &empty_mask);
  posix_spawnattr_setsigdefault(&attr, &default_signals);
  posix_spawnattr_setpgroup(&attr, 0);
  posix_spawnattr_setflags(&attr, POSIX_SPAWN_SETSIGMASK |
                                      POSIX_SPAWN_SETSIGDEF |
                                      POSIX_SPAWN_SETPGROUP);

  pid_t pid = 0;
  int status =
      posix_spawnp(&pid, argv[0], &actions, &attr, argv.data(), environ);

  posix_spawn_file_actions_destroy(&actions);
  posix_spawnattr_destroy(&attr);

  ::close(in_pipe[0]);
  ::close(out_pipe[1]);

  if (status != 0) {
    last_error_ = fmt::format("posix_spawnp({}) failed: {}",
                              profile_.executable, std::strerror(status));
    ::close(in_pipe[1]);
    ::close(out_pipe[0]);
    return false;
  }

  // Writes are bounded by the call's deadline, so they must never block.
  int flags = ::fcntl(in_pipe[1], F_GETFL);
  if (flags < 0 || ::fcntl(in_pipe[1], F_SETFL, flags | O_NONBLOCK) < 0) {
    LOG_WARN("WORKER", profile_.name, "Failed to make stdin non-blocking: {}",
             std::strerror(errno));
  }

  stdin_fd_ = in_pipe[1];
  channel_ = std::make_shared<ReplyChannel>(out_pipe[0]);

  std::lock_guard lock(state_mutex_);
  pid_ = pid;
  reaped_ = false;
  return true;
}

bool WorkerProcess::poll_exit_locked() {
  if (reaped_)
    return true;
  int status = 0;
  pid_t result = ::waitpid(pid_, &status, WNOHANG);
  if (result == 0)
    return false;
  reaped_ = true;
  if (result == pid_ && WIFSIGNALED(status)) {
    LOG_WARN("WORKER", profile_.name, "Worker PID={} terminated by signal {}",
             pid_, WTERMSIG(status));
  } else if (result == pid_ && WIFEXITED(status)) {
    LOG_INFO("WORKER", profile_.name, "Worker PID={} exited with status {}",
             pid_, WEXITSTATUS(status));
  }
  return true;
}

bool WorkerProcess::is_alive() {
  std::lock_guard lock(state_mutex_);
  if (state_ != WorkerState::Running)
    return false;
  if (poll_exit_locked()) {
    state_ = WorkerState::Dead;
    return false;
  }
  return true;
}

WriteStatus
WorkerProcess::write_line(const std::string &line,
                          std::chrono::steady_clock::time_point deadline,
                          std::string &error) {
  if (stdin_fd_ < 0) {
    error = "worker stdin is closed";
    return WriteStatus::Failed;
  }
  std::string framed = line + "\n";
  return write_until(stdin_fd_, framed.data(), framed.size(), deadline,
                     error);
}

bool WorkerProcess::interrupt() {
  std::lock_guard lock(state_mutex_);
  if (reaped_ || pid_ <= 0)
    return false;
  LOG_DEBUG("WORKER", profile_.name, "Interrupting PID={}", pid_);
  return ::kill(pid_, SIGINT) == 0;
}

void WorkerProcess::mark_dead() {
  std::lock_guard lock(state_mutex_);
  if (state_ == WorkerState::Running || state_ == WorkerState::Starting)
    state_ = WorkerState::Dead;
}

WorkerState WorkerProcess::state() const {
  std::lock_guard lock(state_mutex_);
  return state_;
}

ProcessId WorkerProcess::pid() const {
  std::lock_guard lock(state_mutex_);
  return reaped_ ? 0 : pid_;
}

void WorkerProcess::stop(std::chrono::milliseconds grace) {
  // EOF on stdin ends the bootstrap loop on its own.
  close_fd(stdin_fd_);

  ProcessId pid = 0;
  {
    std::lock_guard lock(state_mutex_);
    if (!reaped_)
      pid = pid_;
  }

  if (pid > 0) {
    LOG_INFO("WORKER", profile_.name, "Stopping worker PID={}", pid);
    ::kill(pid, SIGTERM);

    auto deadline = std::chrono::steady_clock::now() + grace;
    bool exited = false;
    while (true) {
      {
        std::lock_guard lock(state_mutex_);
        exited = poll_exit_locked();
      }
      if (exited || std::chrono::steady_clock::now() >= deadline)
        break;
      std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }

    if (!exited) {
      LOG_WARN("WORKER", profile_.name, "Force killing worker PID={}", pid);
      ::kill(pid, SIGKILL);
      std::lock_guard lock(state_mutex_);
      int status = 0;
      while (::waitpid(pid, &status, 0) < 0 && errno == EINTR) {
      }
      reaped_ = true;
    }
  }

  remove_bootstrap_file();

  std::lock_guard lock(state_mutex_);
  state_ = WorkerState::Stopped;
}

void WorkerProcess::remove_bootstrap_file() {
  if (bootstrap_path_.empty())
    return;
  std::error_code ec;
  std::filesystem::remove(bootstrap_path_, ec);
  if (ec) {
    LOG_WARN("WORKER", profile_.name, "Failed to remove {}: {}",
             bootstrap_path_, ec.message());
  }
  bootstrap_path_.clear();
}

} // namespace ipc
} // namespace autocode
