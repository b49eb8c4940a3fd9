#include "autocode/server/AuditLog.hpp"

#include <chrono>
#include <ctime>
#include <fmt/format.h>
#include <fstream>

namespace autocode {
namespace server {

std::string AuditLog::timestamp() {
  auto now = std::chrono::system_clock::now();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                now.time_since_epoch())
                .count() %
            1000;
  std::time_t t = std::chrono::system_clock::to_time_t(now);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  return fmt::format("{}.{:03d}Z", buf, static_cast<int>(ms));
}

void AuditLog::record(const std::string &event, const nlohmann::json &data) {
  if (path_.empty())
    return;

  nlohmann::json entry;
  entry["ts"] = timestamp();
  entry["event"] = event;
  entry["data"] = data;
  std::string line =
      entry.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);

  std::lock_guard lock(mutex_);
  std::ofstream out(path_, std::ios::app);
  if (!out)
    return;
  out << line << '\n';
}

} // namespace server
} // namespace autocode
