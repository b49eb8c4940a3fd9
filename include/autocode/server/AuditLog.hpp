#pragma once
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>

namespace autocode {
namespace server {

/// Append-only NDJSON audit trail: `{"ts", "event", "data"}` per line.
///
/// The file is opened for append on every record so external rotation or
/// deletion is harmless. Write failures are ignored; auditing never
/// affects request handling.
class AuditLog {
public:
  /// An empty path disables auditing.
  explicit AuditLog(std::string path) : path_(std::move(path)) {}

  void record(const std::string &event, const nlohmann::json &data);

  const std::string &path() const { return path_; }
  bool enabled() const { return !path_.empty(); }

  /// UTC ISO-8601 timestamp with milliseconds and a trailing `Z`.
  static std::string timestamp();

private:
  std::string path_;
  std::mutex mutex_;
};

} // namespace server
} // namespace autocode
