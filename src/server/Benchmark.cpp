#include "autocode/server/Benchmark.hpp"
#include "autocode/ipc/WorkerProtocol.hpp"

#include <algorithm>
#include <cstdlib>
#include <fmt/format.h>
#include <regex>
#include <sstream>

namespace autocode {
namespace server {

namespace {

std::string escape_regex(const std::string &text) {
  static const std::regex special(R"([.^$|()\[\]{}*+?\\])");
  return std::regex_replace(text, special, R"(\$&)");
}

bool starts_with(const std::string &s, const char *prefix) {
  return s.rfind(prefix, 0) == 0;
}

} // namespace

bool calls_function(const std::string &code, const std::string &name) {
  if (name.empty())
    return false;
  std::regex call("(^|[^A-Za-z0-9_])" + escape_regex(name) + R"(\s*\()");
  return std::regex_search(code, call);
}

// The input travels base64-encoded so quoting and indentation never matter.
std::string render_benchmark_script(const ipc::RuntimeProfile &profile,
                                    const FunctionRecord &function,
                                    const std::string &input,
                                    int iterations) {
  std::string encoded = ipc::base64_encode(input);
  if (profile.name == "julia") {
    return fmt::format(R"({code}
let _src = String(Base64.base64decode("{input}"))
    for _i in 1:{iterations}
        println("{start}")
        _t = @elapsed include_string(Main, _src)
        println("{end} ", _t)
    end
end
nothing
)",
                       fmt::arg("code", function.code),
                       fmt::arg("input", encoded),
                       fmt::arg("iterations", iterations),
                       fmt::arg("start", BENCHMARK_RUN_START),
                       fmt::arg("end", BENCHMARK_RUN_END));
  }
  return fmt::format(R"({code}
import base64 as _bench_base64
import time as _bench_time
_bench_src = compile(_bench_base64.b64decode("{input}").decode("utf-8"), "<benchmark>", "exec")
for _bench_i in range({iterations}):
    print("{start}")
    _bench_t0 = _bench_time.perf_counter()
    exec(_bench_src, globals())
    print("{end}", _bench_time.perf_counter() - _bench_t0)
)",
                     fmt::arg("code", function.code),
                     fmt::arg("input", encoded),
                     fmt::arg("iterations", iterations),
                     fmt::arg("start", BENCHMARK_RUN_START),
                     fmt::arg("end", BENCHMARK_RUN_END));
}

std::vector<BenchmarkRun> parse_benchmark_output(const std::string &output) {
  std::vector<BenchmarkRun> runs;
  std::istringstream in(output);
  bool in_run = false;
  std::string captured;
  for (std::string line; std::getline(in, line);) {
    if (!line.empty() && line.back() == '\r')
      line.pop_back();
    if (starts_with(line, BENCHMARK_RUN_START)) {
      in_run = true;
      captured.clear();
    } else if (in_run && starts_with(line, BENCHMARK_RUN_END)) {
      BenchmarkRun run;
      run.seconds =
          std::strtod(line.c_str() + std::string(BENCHMARK_RUN_END).size(),
                      nullptr);
      run.output = captured;
      runs.push_back(run);
      in_run = false;
    } else if (in_run) {
      if (!captured.empty())
        captured += '\n';
      captured += line;
    }
  }
  return runs;
}

BenchmarkStats summarize_runs(const std::vector<BenchmarkRun> &runs) {
  BenchmarkStats stats;
  if (runs.empty())
    return stats;
  stats.min_seconds = runs.front().seconds;
  stats.max_seconds = runs.front().seconds;
  for (const auto &run : runs) {
    stats.min_seconds = std::min(stats.min_seconds, run.seconds);
    stats.max_seconds = std::max(stats.max_seconds, run.seconds);
    stats.total_seconds += run.seconds;
  }
  stats.mean_seconds = stats.total_seconds / static_cast<double>(runs.size());
  return stats;
}

} // namespace server
} // namespace autocode
