#pragma once
#include "autocode/ipc/RuntimeProfile.hpp"
#include "autocode/ipc/ScriptRunner.hpp"
#include "autocode/lint/Linter.hpp"

#include <string>
#include <vector>

namespace YAML {
class Node;
}

namespace autocode {

struct ValidationError {
  std::string path;
  std::string message;
  int line;
  int column;
};

struct ValidationResult {
  bool valid{true};
  std::vector<ValidationError> errors;
  std::vector<std::string> warnings;
};

struct RuntimeConfig {
  std::string profile{"julia"};
  std::string executable; // empty: the profile's default
  size_t wrap_threshold{800};
  int default_timeout_ms{10000};
  int test_timeout_ms{60000};
  int stop_grace_ms{2000};
};

struct ServerConfig {
  RuntimeConfig runtime;
  std::string audit_path{"autocode_audit.log"};
  std::string log_file{"autocode_server.log"};
  std::string log_level{"info"};
  std::string store_path; // empty: in-memory only
  lint::LinterOptions linter;
};

/// Checks a YAML configuration document and reports every problem.
class ConfigValidator {
public:
  static ValidationResult validate_file(const std::string &yaml_path);
  static ValidationResult validate(const YAML::Node &doc);
};

/// Overlay a YAML file onto `config`. Throws std::runtime_error listing the
/// validation errors, or YAML::Exception if the file cannot be parsed.
void load_config_file(const std::string &yaml_path, ServerConfig &config);

/// Overlay AUTOCODE_* environment variables onto `config`.
void apply_environment(ServerConfig &config);

/// Runtime profile named by the config, with the executable override.
/// Throws std::invalid_argument for an unknown profile.
ipc::RuntimeProfile resolve_profile(const ServerConfig &config);

ipc::RunnerOptions runner_options(const ServerConfig &config);

} // namespace autocode
