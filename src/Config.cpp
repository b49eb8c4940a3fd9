#include "autocode/Config.hpp"

#include <cstdlib>
#include <set>
#include <stdexcept>
#include <yaml-cpp/yaml.h>

namespace autocode {

namespace {

const std::set<std::string> LOG_LEVELS = {"trace", "debug", "info", "warn",
                                          "error", "critical", "off"};
const std::set<std::string> PROFILES = {"julia", "python"};

std::string node_path(const std::vector<std::string> &path) {
  std::string out;
  for (const auto &p : path)
    out += "/" + p;
  return out;
}

void add_error(ValidationResult &result, const std::vector<std::string> &path,
               const std::string &msg, const YAML::Node &node) {
  result.valid = false;
  auto mark = node.Mark();
  result.errors.push_back({node_path(path), msg, mark.line + 1,
                           mark.column + 1});
}

void check_string(const YAML::Node &section, const std::string &key,
                  const std::vector<std::string> &path,
                  ValidationResult &result) {
  const YAML::Node node = section[key];
  if (node && !node.IsScalar())
    add_error(result, path, "'" + key + "' must be a string", node);
}

void check_positive_int(const YAML::Node &section, const std::string &key,
                        const std::vector<std::string> &path,
                        ValidationResult &result) {
  const YAML::Node node = section[key];
  if (!node)
    return;
  try {
    if (node.as<long>() <= 0)
      add_error(result, path, "'" + key + "' must be positive", node);
  } catch (const YAML::BadConversion &) {
    add_error(result, path, "'" + key + "' must be an integer", node);
  }
}

void check_bool(const YAML::Node &section, const std::string &key,
                const std::vector<std::string> &path,
                ValidationResult &result) {
  const YAML::Node node = section[key];
  if (!node)
    return;
  try {
    node.as<bool>();
  } catch (const YAML::BadConversion &) {
    add_error(result, path, "'" + key + "' must be a boolean", node);
  }
}

void check_one_of(const YAML::Node &section, const std::string &key,
                  const std::set<std::string> &allowed,
                  const std::vector<std::string> &path,
                  ValidationResult &result) {
  const YAML::Node node = section[key];
  if (!node)
    return;
  if (!node.IsScalar() || !allowed.count(node.as<std::string>())) {
    std::string list;
    for (const auto &a : allowed)
      list += (list.empty() ? "" : ", ") + a;
    add_error(result, path, "'" + key + "' must be one of: " + list, node);
  }
}

void warn_unknown_keys(const YAML::Node &section,
                       const std::set<std::string> &known,
                       const std::vector<std::string> &path,
                       ValidationResult &result) {
  for (const auto &kv : section) {
    auto key = kv.first.as<std::string>();
    if (!known.count(key))
      result.warnings.push_back(node_path(path) + "/" + key +
                                ": unknown key ignored");
  }
}

const char *env_value(const char *name) {
  const char *value = std::getenv(name);
  return (value && value[0]) ? value : nullptr;
}

} // namespace

ValidationResult ConfigValidator::validate(const YAML::Node &doc) {
  ValidationResult result;
  if (!doc || doc.IsNull())
    return result; // an empty file means all defaults
  if (!doc.IsMap()) {
    add_error(result, {}, "Configuration must be a map", doc);
    return result;
  }

  warn_unknown_keys(doc, {"runtime", "audit", "log", "store", "linter"}, {},
                    result);

  struct Section {
    const char *name;
    std::set<std::string> keys;
  };
  for (const auto &section :
       {Section{"runtime",
                {"profile", "executable", "wrap_threshold",
                 "default_timeout_ms", "test_timeout_ms", "stop_grace_ms"}},
        Section{"audit", {"path"}}, Section{"log", {"file", "level"}},
        Section{"store", {"path"}},
        Section{"linter",
                {"shadow_suffix", "block_unsafe", "allow_warnings"}}}) {
    const YAML::Node node = doc[section.name];
    if (node && !node.IsMap() && !node.IsNull()) {
      add_error(result, {section.name},
                std::string("'") + section.name + "' must be a map", node);
      continue;
    }
    if (node && node.IsMap())
      warn_unknown_keys(node, section.keys, {section.name}, result);
  }
  if (!result.valid)
    return result;

  if (const YAML::Node rt = doc["runtime"]) {
    std::vector<std::string> path{"runtime"};
    check_one_of(rt, "profile", PROFILES, path, result);
    check_string(rt, "executable", path, result);
    for (const auto &key : {"wrap_threshold", "default_timeout_ms",
                            "test_timeout_ms", "stop_grace_ms"})
      check_positive_int(rt, key, path, result);
  }
  if (const YAML::Node audit = doc["audit"])
    check_string(audit, "path", {"audit"}, result);
  if (const YAML::Node log = doc["log"]) {
    check_string(log, "file", {"log"}, result);
    check_one_of(log, "level", LOG_LEVELS, {"log"}, result);
  }
  if (const YAML::Node store = doc["store"])
    check_string(store, "path", {"store"}, result);
  if (const YAML::Node linter = doc["linter"]) {
    std::vector<std::string> path{"linter"};
    check_string(linter, "shadow_suffix", path, result);
    check_bool(linter, "block_unsafe", path, result);
    check_bool(linter, "allow_warnings", path, result);
  }
  return result;
}

ValidationResult ConfigValidator::validate_file(const std::string &yaml_path) {
  ValidationResult result;
  try {
    YAML::Node doc = YAML::LoadFile(yaml_path);
    result = validate(doc);
  } catch (const YAML::Exception &e) {
    result.valid = false;
    result.errors.push_back(
        {"", std::string("YAML parse error: ") + e.what(), 0, 0});
  }
  return result;
}

void load_config_file(const std::string &yaml_path, ServerConfig &config) {
  YAML::Node doc = YAML::LoadFile(yaml_path);
  ValidationResult result = ConfigValidator::validate(doc);
  if (!result.valid) {
    std::string msg = "Invalid configuration " + yaml_path + ":";
    for (const auto &err : result.errors)
      msg += "\n  " + err.path + ": " + err.message;
    throw std::runtime_error(msg);
  }
  if (!doc || doc.IsNull())
    return;

  if (const YAML::Node rt = doc["runtime"]) {
    if (rt["profile"])
      config.runtime.profile = rt["profile"].as<std::string>();
    if (rt["executable"])
      config.runtime.executable = rt["executable"].as<std::string>();
    if (rt["wrap_threshold"])
      config.runtime.wrap_threshold = rt["wrap_threshold"].as<size_t>();
    if (rt["default_timeout_ms"])
      config.runtime.default_timeout_ms = rt["default_timeout_ms"].as<int>();
    if (rt["test_timeout_ms"])
      config.runtime.test_timeout_ms = rt["test_timeout_ms"].as<int>();
    if (rt["stop_grace_ms"])
      config.runtime.stop_grace_ms = rt["stop_grace_ms"].as<int>();
  }
  if (doc["audit"] && doc["audit"]["path"])
    config.audit_path = doc["audit"]["path"].as<std::string>();
  if (const YAML::Node log = doc["log"]) {
    if (log["file"])
      config.log_file = log["file"].as<std::string>();
    if (log["level"])
      config.log_level = log["level"].as<std::string>();
  }
  if (doc["store"] && doc["store"]["path"])
    config.store_path = doc["store"]["path"].as<std::string>();
  if (const YAML::Node linter = doc["linter"]) {
    if (linter["shadow_suffix"])
      config.linter.shadow_suffix = linter["shadow_suffix"].as<std::string>();
    if (linter["block_unsafe"])
      config.linter.block_unsafe = linter["block_unsafe"].as<bool>();
    if (linter["allow_warnings"])
      config.linter.allow_warnings = linter["allow_warnings"].as<bool>();
  }
}

void apply_environment(ServerConfig &config) {
  if (const char *v = env_value("AUTOCODE_RUNTIME"))
    config.runtime.profile = v;
  if (const char *v = env_value("AUTOCODE_RUNTIME_EXE"))
    config.runtime.executable = v;
  // MCP_AUTOCODE_LOG is the older name; AUTOCODE_AUDIT_LOG wins.
  if (const char *v = env_value("MCP_AUTOCODE_LOG"))
    config.audit_path = v;
  if (const char *v = env_value("AUTOCODE_AUDIT_LOG"))
    config.audit_path = v;
  if (const char *v = env_value("AUTOCODE_LOG_LEVEL"))
    config.log_level = v;
  if (const char *v = env_value("AUTOCODE_STORE"))
    config.store_path = v;
}

ipc::RuntimeProfile resolve_profile(const ServerConfig &config) {
  ipc::RuntimeProfile profile = ipc::profile_by_name(config.runtime.profile);
  if (!config.runtime.executable.empty())
    profile.executable = config.runtime.executable;
  return profile;
}

ipc::RunnerOptions runner_options(const ServerConfig &config) {
  ipc::RunnerOptions options;
  options.wrap_threshold = config.runtime.wrap_threshold;
  options.stop_grace = std::chrono::milliseconds(config.runtime.stop_grace_ms);
  return options;
}

} // namespace autocode
