#pragma once
#include <chrono>
#include <string>

namespace autocode {
namespace ipc {

/// Buffered line reader over the worker's combined stdout/stderr pipe.
///
/// Not thread-safe: the runner keeps at most one reader on a channel at a
/// time. Bytes left in the buffer after a reader gives up (a late reply)
/// are handed to the next reader, which discards what is not its own.
class ReplyChannel {
public:
  using Clock = std::chrono::steady_clock;

  enum class ReadStatus { Line, Eof, Timeout, Error };

  /// Takes ownership of `fd`; it is closed on destruction.
  explicit ReplyChannel(int fd);
  ~ReplyChannel();

  ReplyChannel(const ReplyChannel &) = delete;
  ReplyChannel &operator=(const ReplyChannel &) = delete;

  /// Read one line (without the trailing newline), blocking until it is
  /// complete or EOF.
  ReadStatus read_line(std::string &line, std::string &error);

  /// As above, but gives up with Timeout once `deadline` passes. A partial
  /// line stays buffered for the next read.
  ReadStatus read_line(std::string &line, std::string &error,
                       Clock::time_point deadline);

private:
  int fd_;
  std::string buffer_;
  bool eof_{false};

  bool take_buffered_line(std::string &line);
};

} // namespace ipc
} // namespace autocode
