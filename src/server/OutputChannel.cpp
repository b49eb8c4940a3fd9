#include "autocode/server/OutputChannel.hpp"

namespace autocode {
namespace server {

void OutputChannel::write_json(const nlohmann::json &message) {
  // Invalid UTF-8 from interpreter output is replaced rather than thrown.
  write_line(
      message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace));
}

void OutputChannel::write_line(const std::string &line) {
  std::lock_guard lock(mutex_);
  out_ << line << '\n';
  out_.flush();
  lines_written_++;
}

size_t OutputChannel::lines_written() const {
  std::lock_guard lock(mutex_);
  return lines_written_;
}

} // namespace server
} // namespace autocode
