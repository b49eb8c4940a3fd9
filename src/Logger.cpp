#include "autocode/Logger.hpp"

namespace autocode {

// Out-of-line so every translation unit shares one instance
Logger &Logger::instance() {
  static Logger logger;
  return logger;
}

} // namespace autocode
