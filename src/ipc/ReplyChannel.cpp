#include "autocode/ipc/ReplyChannel.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <poll.h>
#include <unistd.h>

namespace autocode {
namespace ipc {

ReplyChannel::ReplyChannel(int fd) : fd_(fd) {}

ReplyChannel::~ReplyChannel() {
  if (fd_ >= 0)
    ::close(fd_);
}

bool ReplyChannel::take_buffered_line(std::string &line) {
  auto pos = buffer_.find('\n');
  if (pos == std::string::npos)
    return false;
  line = buffer_.substr(0, pos);
  buffer_.erase(0, pos + 1);
  if (!line.empty() && line.back() == '\r')
    line.pop_back();
  return true;
}

ReplyChannel::ReadStatus ReplyChannel::read_line(std::string &line,
                                                 std::string &error) {
  return read_line(line, error, Clock::time_point::max());
}

ReplyChannel::ReadStatus ReplyChannel::read_line(std::string &line,
                                                 std::string &error,
                                                 Clock::time_point deadline) {
  char chunk[4096];
  while (true) {
    if (take_buffered_line(line))
      return ReadStatus::Line;

    if (eof_) {
      // Hand out an unterminated final line once, then report EOF.
      if (!buffer_.empty()) {
        line.swap(buffer_);
        buffer_.clear();
        return ReadStatus::Line;
      }
      return ReadStatus::Eof;
    }

    int wait_ms = -1;
    if (deadline != Clock::time_point::max()) {
      auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
          deadline - Clock::now());
      if (remaining.count() <= 0)
        return ReadStatus::Timeout;
      wait_ms = static_cast<int>(std::min<long long>(remaining.count(), 60000));
    }

    pollfd pfd{fd_, POLLIN, 0};
    int ready = ::poll(&pfd, 1, wait_ms);
    if (ready == 0)
      continue; // re-check the deadline
    if (ready < 0) {
      if (errno == EINTR)
        continue;
      error = std::strerror(errno);
      return ReadStatus::Error;
    }

    ssize_t n = ::read(fd_, chunk, sizeof(chunk));
    if (n > 0) {
      buffer_.append(chunk, static_cast<size_t>(n));
    } else if (n == 0) {
      eof_ = true;
    } else if (errno != EINTR && errno != EAGAIN) {
      error = std::strerror(errno);
      return ReadStatus::Error;
    }
  }
}

} // namespace ipc
} // namespace autocode
