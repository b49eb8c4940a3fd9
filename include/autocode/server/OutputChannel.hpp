#pragma once
#include <mutex>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>

namespace autocode {
namespace server {

/// The single writer for the outbound protocol stream.
///
/// Every response, batch array and stream notification is written here so
/// each JSON document lands on the stream as one uninterrupted line.
class OutputChannel {
public:
  explicit OutputChannel(std::ostream &out) : out_(out) {}

  OutputChannel(const OutputChannel &) = delete;
  OutputChannel &operator=(const OutputChannel &) = delete;

  void write_json(const nlohmann::json &message);
  void write_line(const std::string &line);

  /// Number of lines written so far.
  size_t lines_written() const;

private:
  std::ostream &out_;
  mutable std::mutex mutex_;
  size_t lines_written_{0};
};

} // namespace server
} // namespace autocode
