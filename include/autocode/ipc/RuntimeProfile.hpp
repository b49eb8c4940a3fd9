#pragma once
#include <string>
#include <vector>

namespace autocode {
namespace ipc {

/// Describes how to drive one kind of interpreter as a persistent worker.
///
/// Templates use `{result_marker}` and `{error_marker}` (bootstrap) and
/// `{payload}` (wrapper) placeholders.
struct RuntimeProfile {
  std::string name;
  std::string executable;
  std::vector<std::string> launch_args; // placed before the bootstrap path
  std::string bootstrap_extension;
  std::string bootstrap_template;
  std::string wrapper_template; // one-line decode-and-evaluate for scripts
};

/// Built-in Julia profile (`julia --startup-file=no --quiet`).
RuntimeProfile julia_profile();

/// Built-in Python profile (`python3 -u -q`).
RuntimeProfile python_profile();

/// Lookup by name ("julia" or "python"); throws std::invalid_argument.
RuntimeProfile profile_by_name(const std::string &name);

} // namespace ipc
} // namespace autocode
