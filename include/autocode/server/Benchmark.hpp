#pragma once
#include "autocode/ipc/RuntimeProfile.hpp"
#include "autocode/types.hpp"

#include <string>
#include <vector>

namespace autocode {
namespace server {

constexpr const char *BENCHMARK_RUN_START = "===BENCHMARK_RUN_START===";
constexpr const char *BENCHMARK_RUN_END = "===BENCHMARK_RUN_END===";

/// True when `code` contains a call `name(` (whitespace allowed before the
/// parenthesis).
bool calls_function(const std::string &code, const std::string &name);

/// Script that defines the function, then runs `input` `iterations` times.
/// Each run prints BENCHMARK_RUN_START, the input's own output, and
/// BENCHMARK_RUN_END followed by the elapsed seconds.
std::string render_benchmark_script(const ipc::RuntimeProfile &profile,
                                    const FunctionRecord &function,
                                    const std::string &input, int iterations);

struct BenchmarkRun {
  double seconds{0.0};
  std::string output; // lines printed by the input during this run
};

/// Runs in order. A run without an end line is dropped.
std::vector<BenchmarkRun> parse_benchmark_output(const std::string &output);

struct BenchmarkStats {
  double min_seconds{0.0};
  double max_seconds{0.0};
  double mean_seconds{0.0};
  double total_seconds{0.0};
};

BenchmarkStats summarize_runs(const std::vector<BenchmarkRun> &runs);

} // namespace server
} // namespace autocode
