#pragma once
#include <fmt/format.h>
#include <memory>
#include <mutex>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>
#include <string>

namespace autocode {

/// Centralized logging with component and call/correlation id context.
///
/// The console sink writes to stderr: stdout carries the JSON-RPC channel
/// and must never receive log lines.
class Logger {
public:
  static Logger &instance();

  // Initialize with file and console sinks
  void init(const std::string &log_file = "autocode_server.log",
            spdlog::level::level_enum level = spdlog::level::info) {
    std::lock_guard<std::mutex> lock(mutex_);

    // If already initialized, just update level
    if (logger_) {
      logger_->set_level(level);
      logger_->flush_on(level);
      return;
    }

    try {
      auto console_sink =
          std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
      console_sink->set_level(spdlog::level::info);

      std::vector<spdlog::sink_ptr> sinks{console_sink};
      if (!log_file.empty()) {
        auto file_sink =
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_file, 1024 * 1024 * 10, 3); // 10MB, 3 files
        file_sink->set_level(spdlog::level::trace);
        sinks.push_back(file_sink);
      }

      logger_ = std::make_shared<spdlog::logger>("autocode", sinks.begin(),
                                                 sinks.end());
      logger_->set_level(level);
      // flush on the requested level so tests can rely on timely flushes
      logger_->flush_on(level);

      if (!spdlog::get("autocode")) {
        spdlog::register_logger(logger_);
      }
    } catch (const spdlog::spdlog_ex &ex) {
      fmt::print(stderr, "Log initialization failed: {}\n", ex.what());
    }
  }

  // Drop from the spdlog registry so a later init() recreates the sinks.
  void shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    spdlog::drop("autocode");
    logger_.reset();
  }

  template <typename... Args>
  void trace(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::trace, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void debug(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::debug, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void info(const std::string &component, const std::string &id,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::info, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void warn(const std::string &component, const std::string &id,
            const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::warn, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

  template <typename... Args>
  void error(const std::string &component, const std::string &id,
             const std::string &fmt_str, Args &&...args) {
    log(spdlog::level::err, component, id, fmt_str,
        std::forward<Args>(args)...);
  }

private:
  Logger() = default;

  template <typename... Args>
  void log(spdlog::level::level_enum level, const std::string &component,
           const std::string &id, const std::string &fmt_str,
           Args &&...args) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!logger_)
      return;

    // Format:  [component] [id] message
    std::string prefix = fmt::format("[{}] [{}] ", component, id);
    std::string full_msg = prefix + fmt::format(fmt::runtime(fmt_str),
                                                std::forward<Args>(args)...);
    logger_->log(level, full_msg);
  }

  std::shared_ptr<spdlog::logger> logger_;
  std::mutex mutex_;
};

// Convenience macros
#define LOG_TRACE(component, id, ...)                                          \
  autocode::Logger::instance().trace(component, id, __VA_ARGS__)
#define LOG_DEBUG(component, id, ...)                                          \
  autocode::Logger::instance().debug(component, id, __VA_ARGS__)
#define LOG_INFO(component, id, ...)                                           \
  autocode::Logger::instance().info(component, id, __VA_ARGS__)
#define LOG_WARN(component, id, ...)                                           \
  autocode::Logger::instance().warn(component, id, __VA_ARGS__)
#define LOG_ERROR(component, id, ...)                                          \
  autocode::Logger::instance().error(component, id, __VA_ARGS__)

} // namespace autocode
