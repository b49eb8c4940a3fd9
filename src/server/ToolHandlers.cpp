#include "autocode/server/ToolHandlers.hpp"
#include "autocode/Logger.hpp"
#include "autocode/errors.hpp"
#include "autocode/server/Benchmark.hpp"
#include "autocode/server/PropertyTest.hpp"
#include "autocode/server/StreamSessionManager.hpp"
#include "autocode/store/Serialization.hpp"

#include <fstream>
#include <iterator>
#include <sstream>
#include <string>
#include <vector>

using json = nlohmann::json;

namespace autocode {
namespace server {

namespace {

/*
  Each handler takes the tool arguments (already checked for the schema's
  required keys) and returns the structured payload placed in the content
  envelope. Domain failures are thrown as ToolError.
*/

constexpr size_t ERROR_SNIPPET_CHARS = 2000;

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

std::string string_arg(const json &args, const char *key) {
  auto it = args.find(key);
  if (it == args.end() || !it->is_string())
    throw ToolError("InvalidArgument",
                    std::string("Argument '") + key + "' must be a string");
  return it->get<std::string>();
}

std::string optional_string_arg(const json &args, const char *key) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null())
    return "";
  if (!it->is_string())
    throw ToolError("InvalidArgument",
                    std::string("Argument '") + key + "' must be a string");
  return it->get<std::string>();
}

int int_arg(const json &args, const char *key, int fallback) {
  auto it = args.find(key);
  if (it == args.end() || it->is_null())
    return fallback;
  if (!it->is_number_integer())
    throw ToolError("InvalidArgument",
                    std::string("Argument '") + key + "' must be an integer");
  return it->get<int>();
}

std::vector<std::string> string_list_arg(const json &args, const char *key) {
  std::vector<std::string> out;
  auto it = args.find(key);
  if (it == args.end() || it->is_null())
    return out;
  if (!it->is_array())
    throw ToolError("InvalidArgument",
                    std::string("Argument '") + key + "' must be an array");
  for (const auto &item : *it) {
    if (!item.is_string())
      throw ToolError("InvalidArgument", std::string("Argument '") + key +
                                             "' must contain strings");
    out.push_back(item.get<std::string>());
  }
  return out;
}

std::chrono::milliseconds timeout_arg(const json &args, int fallback_ms) {
  int ms = int_arg(args, "timeout_ms", fallback_ms);
  if (ms <= 0)
    throw ToolError("InvalidArgument", "Argument 'timeout_ms' must be positive");
  return std::chrono::milliseconds(ms);
}

// ---------------------------------------------------------------------------
// Error translation
// ---------------------------------------------------------------------------

std::string suggestion_for(StoreError::Kind kind) {
  switch (kind) {
  case StoreError::Kind::FunctionNotFound:
    return "Check the function ID or create the function first";
  case StoreError::Kind::TestNotFound:
    return "Check the test ID";
  case StoreError::Kind::DependencyCycle:
    return "Review the dependency graph and avoid cycles";
  case StoreError::Kind::InvalidArgument:
    return "Check the arguments";
  case StoreError::Kind::Persistence:
    return "Check the store path and its permissions";
  }
  return "";
}

ToolHandler with_store_errors(ToolHandler handler) {
  return [handler = std::move(handler)](const json &args) {
    try {
      return handler(args);
    } catch (const StoreError &ex) {
      throw ToolError(to_string(ex.kind()), ex.what(),
                      suggestion_for(ex.kind()));
    }
  };
}

StreamHandler with_store_errors(StreamHandler handler) {
  return [handler = std::move(handler)](const json &args, StreamContext &ctx) {
    try {
      handler(args, ctx);
    } catch (const StoreError &ex) {
      throw ToolError(to_string(ex.kind()), ex.what(),
                      suggestion_for(ex.kind()));
    }
  };
}

bool starts_with(const std::string &s, const std::string &prefix) {
  return s.rfind(prefix, 0) == 0;
}

bool is_worker_failure(const ipc::RunResult &result) {
  return starts_with(result.payload, ipc::WORKER_EXITED_MESSAGE) ||
         starts_with(result.payload, "Worker process not available") ||
         starts_with(result.payload, "Failed to write to worker stdin") ||
         starts_with(result.payload, "Reader thread error");
}

ToolError run_failure(const ipc::RunResult &result) {
  if (result.payload == ipc::TIMEOUT_MESSAGE)
    return ToolError("ExecutionTimeout", result.payload,
                     "Increase timeout_ms or simplify the script");
  if (is_worker_failure(result))
    return ToolError("InterpreterCrashed", result.payload,
                     "The worker is restarted on the next call; retry");
  return ToolError("ExecutionFailed", result.payload,
                   "Check the code for errors");
}

std::string tail(const std::string &text, size_t max_chars) {
  return text.size() <= max_chars ? text
                                  : text.substr(text.size() - max_chars);
}

FunctionRecord require_function(const ToolContext &ctx, const std::string &id) {
  auto record = ctx.store.get_function(id);
  if (!record)
    throw ToolError("FunctionNotFound", "Function " + id + " not found",
                    "Check the function ID or create the function first");
  return *record;
}

json summaries(const std::vector<FunctionRecord> &records) {
  json out = json::array();
  for (const auto &r : records)
    out.push_back(summary_json(r));
  return out;
}

// ---------------------------------------------------------------------------
// Function catalogue
// ---------------------------------------------------------------------------

json handle_list_functions(const ToolContext &ctx, const json &args) {
  auto records = ctx.store.list_functions(optional_string_arg(args, "module"),
                                          optional_string_arg(args, "tag"));
  return structured_success(summaries(records), {{"count", records.size()}});
}

json handle_get_function(const ToolContext &ctx, const json &args) {
  return structured_success(require_function(ctx, string_arg(args, "id")));
}

json handle_add_function(const ToolContext &ctx, const json &args) {
  std::string id = ctx.store.add_function(
      string_arg(args, "name"), string_arg(args, "description"),
      string_arg(args, "code"), string_list_arg(args, "modules"),
      string_list_arg(args, "tags"));
  return structured_success({{"function_id", id}}, {{"function_id", id}});
}

json handle_modify_function(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "id");
  ctx.store.modify_function(id, string_arg(args, "modifier"),
                            string_arg(args, "description"),
                            string_arg(args, "code"));
  return structured_success({{"status", "modified"}}, {{"function_id", id}});
}

json handle_delete_function(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  if (!ctx.store.delete_function(id))
    throw ToolError("FunctionNotFound", "Function " + id + " not found",
                    "Check the function ID");
  return structured_success({{"deleted", true}}, {{"function_id", id}});
}

json handle_search_functions(const ToolContext &ctx, const json &args) {
  std::string query = string_arg(args, "query");
  auto records = ctx.store.search(query);
  return structured_success(summaries(records),
                            {{"query", query}, {"result_count", records.size()}});
}

json handle_list_modules(const ToolContext &ctx, const json &) {
  auto modules = ctx.store.list_modules();
  return structured_success(modules, {{"count", modules.size()}});
}

json handle_list_tags(const ToolContext &ctx, const json &) {
  auto tags = ctx.store.list_tags();
  return structured_success(tags, {{"count", tags.size()}});
}

json handle_add_tag(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  ctx.store.add_tag(id, string_arg(args, "tag"));
  return structured_success({{"tags", require_function(ctx, id).tags}},
                            {{"function_id", id}});
}

// ---------------------------------------------------------------------------
// Dependencies
// ---------------------------------------------------------------------------

json handle_add_dependency(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  std::string dep = string_arg(args, "depends_on_id");
  ctx.store.add_dependency(id, dep);
  return structured_success(
      {{"message", "Added dependency: " + id + " depends on " + dep}},
      {{"function_id", id}});
}

json handle_remove_dependency(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  std::string dep = string_arg(args, "depends_on_id");
  ctx.store.remove_dependency(id, dep);
  return structured_success(
      {{"message",
        "Removed dependency: " + id + " no longer depends on " + dep}},
      {{"function_id", id}});
}

json handle_list_dependencies(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  auto deps = ctx.store.list_dependencies(id);
  return structured_success(
      {{"dependencies", deps}},
      {{"function_id", id}, {"dependency_count", deps.size()}});
}

json handle_find_cycles(const ToolContext &ctx, const json &) {
  auto cycles = ctx.store.find_cycles();
  return structured_success({{"cycles", cycles}},
                            {{"cycle_count", cycles.size()}});
}

json handle_detect_recursion(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  return structured_success(ctx.store.detect_recursion(id),
                            {{"function_id", id}});
}

std::string dot_quote(const std::string &text) {
  std::string out = "\"";
  for (char c : text) {
    if (c == '"' || c == '\\')
      out += '\\';
    out += c;
  }
  return out + "\"";
}

// Graphviz digraph: one labelled node per function, one edge per
// dependency pointing at the function depended on.
std::string dependency_dot(const std::vector<FunctionRecord> &records,
                           size_t &edge_count) {
  std::string dot = "digraph dependencies {\n";
  for (const auto &r : records)
    dot += "  " + dot_quote(r.id) + " [label=" + dot_quote(r.name) + "];\n";
  edge_count = 0;
  for (const auto &r : records) {
    for (const auto &dep : r.dependencies) {
      dot += "  " + dot_quote(r.id) + " -> " + dot_quote(dep) + ";\n";
      edge_count++;
    }
  }
  return dot + "}\n";
}

json handle_visualize_dependencies(const ToolContext &ctx, const json &args) {
  std::string path = optional_string_arg(args, "file_path");
  auto records = ctx.store.list_functions();
  size_t edges = 0;
  std::string dot = dependency_dot(records, edges);

  json data = {{"dot", dot},
               {"node_count", records.size()},
               {"edge_count", edges}};
  if (!path.empty()) {
    std::ofstream out(path, std::ios::trunc);
    out << dot;
    out.close();
    if (!out)
      throw ToolError("WriteFailed", "Could not write " + path,
                      "Check the path and its permissions");
    LOG_INFO("TOOLS", "DOT", "Wrote dependency graph ({} edges) to {}", edges,
             path);
    data["file_path"] = path;
  }
  return structured_success(data, {{"edge_count", edges}});
}

// ---------------------------------------------------------------------------
// Tests
// ---------------------------------------------------------------------------

json handle_add_test(const ToolContext &ctx, const json &args) {
  std::string id = string_arg(args, "function_id");
  std::string test_id =
      ctx.store.add_test(id, string_arg(args, "name"),
                         string_arg(args, "description"),
                         string_arg(args, "test_code"));
  return structured_success({{"test_id", test_id}},
                            {{"test_id", test_id}, {"function_id", id}});
}

struct TestPlan {
  std::vector<FunctionRecord> functions;
  size_t total{0};
  std::string empty_message; // set when nothing matched the filter
};

TestPlan plan_tests(const ToolContext &ctx, const json &args) {
  TestPlan plan;
  std::string function_id = optional_string_arg(args, "function_id");
  std::string module = optional_string_arg(args, "module");

  if (!module.empty()) {
    plan.functions = ctx.store.list_functions(module);
    if (plan.functions.empty())
      plan.empty_message = "no functions in module '" + module + "'";
  } else if (!function_id.empty()) {
    plan.functions.push_back(require_function(ctx, function_id));
  } else {
    plan.functions = ctx.store.list_functions();
  }

  for (const auto &f : plan.functions)
    plan.total += f.tests.size();
  if (plan.total == 0 && plan.empty_message.empty())
    plan.empty_message = "no tests";
  return plan;
}

void clear_previous_results(const ToolContext &ctx, const TestPlan &plan) {
  std::vector<std::string> ids;
  for (const auto &f : plan.functions)
    ids.push_back(f.id);
  ctx.store.clear_results(ids);
}

TestResult run_unit_test(const ToolContext &ctx, const FunctionRecord &function,
                         const UnitTest &test,
                         std::chrono::milliseconds timeout) {
  LOG_DEBUG("TOOLS", test.id, "Running test {} for {}", test.name,
            function.name);
  ipc::RunResult run = ctx.runner.run(function.code + "\n" + test.code, timeout);

  TestResult result;
  result.test_id = test.id;
  result.function_id = function.id;
  result.executed_at = std::chrono::system_clock::now();
  if (run.success) {
    result.status = TestStatus::Passed;
    result.output = run.payload.empty() ? "Test Passed." : run.payload;
  } else {
    result.status = TestStatus::Failed;
    result.output = run.payload;
  }
  ctx.store.record_result(result);
  return result;
}

json handle_run_tests(const ToolContext &ctx, const json &args) {
  auto timeout = timeout_arg(args, ctx.runtime.test_timeout_ms);
  TestPlan plan = plan_tests(ctx, args);
  if (plan.functions.empty() && !optional_string_arg(args, "module").empty())
    throw ToolError("NoFunctionsFound", plan.empty_message,
                    "Check the module name or add functions to this module");

  clear_previous_results(ctx, plan);
  json results = json::array();
  for (const auto &f : plan.functions) {
    for (const auto &t : f.tests)
      results.push_back(run_unit_test(ctx, f, t, timeout));
  }
  return structured_success({{"results", results}},
                            {{"test_count", results.size()}});
}

void stream_run_tests(const ToolContext &ctx, const json &args,
                      StreamContext &stream) {
  auto timeout = timeout_arg(args, ctx.runtime.test_timeout_ms);
  TestPlan plan = plan_tests(ctx, args);
  if (plan.total == 0) {
    stream.complete({{"results", json::array()},
                     {"message", plan.empty_message}});
    return;
  }

  clear_previous_results(ctx, plan);
  json aggregated = json::array();
  size_t done = 0;
  for (const auto &f : plan.functions) {
    for (const auto &t : f.tests) {
      if (stream.cancel_requested()) {
        stream.cancelled({{"completed", done}, {"total", plan.total}});
        return;
      }
      json chunk = run_unit_test(ctx, f, t, timeout);
      aggregated.push_back(chunk);
      done++;
      stream.chunk({{"index", done},
                    {"total", plan.total},
                    {"result", chunk},
                    {"progress", static_cast<double>(done) /
                                     static_cast<double>(plan.total)}});
    }
  }
  stream.complete({{"results", aggregated}, {"total", plan.total}});
}

json handle_get_test_results(const ToolContext &ctx, const json &args) {
  auto results = ctx.store.test_results(optional_string_arg(args, "function_id"));
  return structured_success(results, {{"count", results.size()}});
}

json handle_coverage_report(const ToolContext &ctx, const json &) {
  auto report = ctx.store.coverage_report();
  return structured_success(report, {{"function_count", report.size()}});
}

// ---------------------------------------------------------------------------
// Property tests
// ---------------------------------------------------------------------------

struct PropertyRun {
  std::vector<PropertyTrial> trials;
  int num_tests{0};
  int seed{0};
};

PropertyRun run_property_test(const ToolContext &ctx, const json &args) {
  FunctionRecord function = require_function(ctx, string_arg(args, "function_id"));
  PropertyRun run;
  run.num_tests = int_arg(args, "num_tests", 50);
  run.seed = int_arg(args, "seed", 42);
  if (run.num_tests <= 0)
    throw ToolError("InvalidArgument", "Argument 'num_tests' must be positive");

  std::string script = render_property_script(ctx.runner.profile(), function,
                                              run.num_tests, run.seed);
  auto result = ctx.runner.run(
      script, std::chrono::milliseconds(ctx.runtime.test_timeout_ms));
  if (!result.success) {
    if (result.payload == ipc::TIMEOUT_MESSAGE || is_worker_failure(result))
      throw run_failure(result);
    FailureClass failure = classify_failure(result.payload);
    throw ToolError(failure.type, tail(result.payload, ERROR_SNIPPET_CHARS),
                    failure.suggested_action,
                    {{"function_id", function.id}});
  }
  run.trials = parse_property_output(result.payload);
  return run;
}

json trial_json(const PropertyTrial &trial) {
  return {{"status", trial.passed ? "pass" : "fail"}, {"info", trial.info}};
}

json handle_property_test(const ToolContext &ctx, const json &args) {
  PropertyRun run = run_property_test(ctx, args);
  json results = json::array();
  size_t passes = 0;
  for (const auto &trial : run.trials) {
    results.push_back(trial_json(trial));
    if (trial.passed)
      passes++;
  }
  return structured_success({{"results", results},
                             {"total", run.trials.size()},
                             {"passes", passes},
                             {"fails", run.trials.size() - passes}},
                            {{"num_tests", run.num_tests}, {"seed", run.seed}});
}

void stream_property_test(const ToolContext &ctx, const json &args,
                          StreamContext &stream) {
  if (stream.cancel_requested()) {
    stream.cancelled({{"completed", 0}, {"total", 0}});
    return;
  }

  PropertyRun run;
  try {
    run = run_property_test(ctx, args);
  } catch (const ToolError &ex) {
    stream.error(json{{"error", ex.what()},
                      {"type", ex.kind()},
                      {"suggested_action", ex.suggested_action()}});
    return;
  }

  size_t total = run.trials.size();
  size_t passes = 0;
  for (size_t i = 0; i < total; i++) {
    if (stream.cancel_requested()) {
      stream.cancelled({{"completed", i}, {"total", total}});
      return;
    }
    const auto &trial = run.trials[i];
    if (trial.passed)
      passes++;
    stream.chunk({{"index", i + 1},
                  {"total", total},
                  {"status", trial.passed ? "pass" : "fail"},
                  {"info", trial.info},
                  {"progress",
                   static_cast<double>(i + 1) / static_cast<double>(total)}});
  }
  stream.complete(
      {{"total", total}, {"passes", passes}, {"fails", total - passes}});
}

// ---------------------------------------------------------------------------
// Benchmarks
// ---------------------------------------------------------------------------

constexpr int MAX_BENCHMARK_ITERATIONS = 10000;

std::string benchmark_input(const json &args) {
  std::string input = optional_string_arg(args, "input_code");
  std::string path = optional_string_arg(args, "input_file");
  if (input.empty() && !path.empty()) {
    std::ifstream in(path);
    if (!in)
      throw ToolError("InvalidArgument", "Could not read input file " + path,
                      "Check the input_file path");
    input.assign(std::istreambuf_iterator<char>(in),
                 std::istreambuf_iterator<char>());
  } else if (input.empty() && !args.contains("input_code")) {
    throw ToolError("InvalidArgument",
                    "Either 'input_code' or 'input_file' is required",
                    "Pass the code that calls the function");
  }
  return input;
}

json handle_benchmark_function(const ToolContext &ctx, const json &args) {
  FunctionRecord function =
      require_function(ctx, string_arg(args, "function_id"));
  int iterations = int_arg(args, "iterations", 1);
  if (iterations <= 0 || iterations > MAX_BENCHMARK_ITERATIONS)
    throw ToolError("InvalidArgument",
                    "Argument 'iterations' must be between 1 and " +
                        std::to_string(MAX_BENCHMARK_ITERATIONS));
  auto timeout = timeout_arg(args, ctx.runtime.test_timeout_ms);

  std::string input = benchmark_input(args);
  if (input.find_first_not_of(" \t\r\n") == std::string::npos)
    throw ToolError("EmptyInput", "Benchmark input is empty",
                    "Provide code that calls " + function.name,
                    {{"function_id", function.id}});
  if (!calls_function(input, function.name))
    throw ToolError("InputDoesNotCallFunction",
                    "Benchmark input does not call " + function.name,
                    "Call " + function.name + "(...) in the input",
                    {{"function_id", function.id}});

  LOG_DEBUG("TOOLS", function.id, "Benchmarking {} for {} iteration(s)",
            function.name, iterations);
  std::string script = render_benchmark_script(ctx.runner.profile(), function,
                                               input, iterations);
  auto result = ctx.runner.run(script, timeout);
  if (!result.success)
    throw run_failure(result);

  auto runs = parse_benchmark_output(result.payload);
  if (runs.empty())
    throw ToolError("ExecutionFailed", "Benchmark produced no timed runs",
                    "Check that the input completes without printing "
                    "benchmark markers",
                    {{"output", tail(result.payload, ERROR_SNIPPET_CHARS)}});

  json run_list = json::array();
  for (size_t i = 0; i < runs.size(); i++)
    run_list.push_back({{"run", i + 1},
                        {"seconds", runs[i].seconds},
                        {"output", runs[i].output}});
  BenchmarkStats stats = summarize_runs(runs);
  return structured_success(
      {{"function_id", function.id},
       {"function_name", function.name},
       {"iterations", iterations},
       {"runs", run_list},
       {"stats",
        {{"min_seconds", stats.min_seconds},
         {"max_seconds", stats.max_seconds},
         {"mean_seconds", stats.mean_seconds},
         {"total_seconds", stats.total_seconds}}}},
      {{"function_id", function.id}, {"run_count", runs.size()}});
}

// ---------------------------------------------------------------------------
// Runner and linter
// ---------------------------------------------------------------------------

json handle_eval(const ToolContext &ctx, const json &args) {
  auto timeout = timeout_arg(args, ctx.runtime.default_timeout_ms);
  auto result = ctx.runner.run(string_arg(args, "expression"), timeout);
  if (!result.success)
    throw run_failure(result);
  return structured_success({{"output", result.payload}});
}

json worker_status_json(const ToolContext &ctx) {
  auto stats = ctx.runner.get_stats();
  return {{"profile", ctx.runner.profile().name},
          {"executable", ctx.runner.profile().executable},
          {"state", ipc::to_string(ctx.runner.state())},
          {"alive", ctx.runner.is_alive()},
          {"pid", ctx.runner.pid()},
          {"stats",
           {{"calls", stats.calls},
            {"succeeded", stats.succeeded},
            {"failed", stats.failed},
            {"timeouts", stats.timeouts},
            {"restarts", stats.restarts}}}};
}

json handle_worker_status(const ToolContext &ctx, const json &) {
  return structured_success(worker_status_json(ctx));
}

json handle_restart_worker(const ToolContext &ctx, const json &) {
  if (!ctx.runner.restart())
    throw ToolError("InterpreterCrashed", "Worker failed to start",
                    "Check the runtime executable and its installation",
                    worker_status_json(ctx));
  return structured_success(worker_status_json(ctx), {{"restarted", true}});
}

json handle_lint_code(const ToolContext &ctx, const json &args) {
  bool fix = args.contains("fix") && args["fix"].is_boolean() &&
             args["fix"].get<bool>();
  LintResult result = ctx.linter.lint(string_arg(args, "code"), fix);
  return structured_success(result, {{"issue_count", result.issues.size()}});
}

// ---------------------------------------------------------------------------
// Generation
// ---------------------------------------------------------------------------

json lint_issue_summary(const std::vector<LintIssue> &issues,
                        LintSeverity only) {
  json out = json::array();
  for (const auto &i : issues) {
    if (i.severity == only)
      out.push_back({{"type", i.type},
                     {"message", i.message},
                     {"severity", to_string(i.severity)}});
  }
  return out;
}

struct PreparedFunction {
  GeneratedFunction generated;
  LintResult lint;
  std::string final_code;
  std::vector<std::string> modules;
};

PreparedFunction prepare_generated(const ToolContext &ctx, const json &args) {
  std::string description = string_arg(args, "description");
  std::string module = optional_string_arg(args, "module");

  PreparedFunction prepared;
  try {
    prepared.generated = ctx.generator->generate(description);
  } catch (const std::runtime_error &ex) {
    throw ToolError("GenerationFailed",
                    std::string("Failed to generate function: ") + ex.what(),
                    "Check the description or try a simpler one",
                    {{"description", description}});
  }

  prepared.lint = ctx.linter.lint(prepared.generated.code, true);
  if (!prepared.lint.success) {
    std::string messages;
    for (const auto &i : prepared.lint.issues) {
      if (i.severity == LintSeverity::Error)
        messages += (messages.empty() ? "" : ", ") + i.message;
    }
    json issues = json::array();
    for (const auto &i : prepared.lint.issues)
      issues.push_back({{"type", i.type},
                        {"message", i.message},
                        {"severity", to_string(i.severity)}});
    throw ToolError(
        "LintingFailed",
        "Generated function contains compatibility errors: " + messages,
        "The generated code has compatibility issues that cannot be "
        "automatically fixed. Try a different description or check the "
        "linting configuration.",
        {{"description", description}, {"lint_issues", issues}});
  }

  prepared.final_code = prepared.lint.fixed_code.value_or(prepared.generated.code);
  if (!module.empty())
    prepared.modules.push_back(module);
  return prepared;
}

json store_generated(const ToolContext &ctx, const PreparedFunction &p) {
  const GeneratedFunction &g = p.generated;
  std::string id = ctx.store.add_function(g.function_name, g.short_description,
                                          p.final_code, p.modules, {});
  json data = {{"function_id", id},
               {"name", g.function_name},
               {"short_description", g.short_description},
               {"code", p.final_code},
               {"test", g.tests},
               {"modules", p.modules}};
  if (!g.tests.empty()) {
    data["test_id"] = ctx.store.add_test(
        id, g.test_name.empty() ? g.function_name + "_test" : g.test_name,
        g.test_description, g.tests);
  }
  if (!p.lint.issues.empty()) {
    data["lint_warnings"] =
        lint_issue_summary(p.lint.issues, LintSeverity::Warning);
    if (p.lint.fixed_code)
      data["lint_fixes_applied"] = true;
  }
  return data;
}

json handle_generate_function(const ToolContext &ctx, const json &args) {
  PreparedFunction prepared = prepare_generated(ctx, args);
  json data = store_generated(ctx, prepared);
  return structured_success(data, {{"function_id", data["function_id"]}});
}

void stream_generate_function(const ToolContext &ctx, const json &args,
                              StreamContext &stream) {
  stream.chunk({{"progress", 0.05}, {"message", "requesting model"}});

  PreparedFunction prepared;
  try {
    prepared = prepare_generated(ctx, args);
  } catch (const ToolError &ex) {
    stream.error(json{{"error", ex.what()},
                      {"type", ex.kind()},
                      {"details", ex.details()}});
    return;
  }

  std::vector<std::string> lines;
  std::istringstream in(prepared.final_code);
  for (std::string line; std::getline(in, line);)
    lines.push_back(line);

  for (size_t i = 0; i < lines.size(); i++) {
    if (stream.cancel_requested()) {
      stream.cancelled({{"at", i + 1}});
      return;
    }
    stream.chunk({{"type", "code_line"},
                  {"line_no", i + 1},
                  {"line", lines[i]},
                  {"progress", 0.1 + 0.6 * static_cast<double>(i + 1) /
                                         static_cast<double>(lines.size())}});
  }

  json data = store_generated(ctx, prepared);
  stream.chunk({{"progress", 0.9},
                {"message", "function stored"},
                {"function_id", data["function_id"]}});
  stream.complete(data);
}

json handle_generate_test(const ToolContext &ctx, const json &args) {
  FunctionRecord function =
      require_function(ctx, string_arg(args, "function_id"));
  std::string name = string_arg(args, "name");
  std::string description = string_arg(args, "description");

  std::string code;
  try {
    code = ctx.generator->generate_test(function, description);
  } catch (const std::runtime_error &ex) {
    throw ToolError("GenerationFailed",
                    std::string("Failed to generate test: ") + ex.what(),
                    "Check the description or try a simpler one",
                    {{"function_id", function.id}});
  }
  if (code.find_first_not_of(" \t\r\n") == std::string::npos)
    throw ToolError("GenerationFailed", "Generator returned no test code",
                    "Try a more specific description",
                    {{"function_id", function.id}});

  std::string test_id = ctx.store.add_test(function.id, name, description, code);
  return structured_success(
      {{"test_id", test_id}, {"name", name}, {"test_code", code}},
      {{"test_id", test_id}, {"function_id", function.id}});
}

// ---------------------------------------------------------------------------
// Registration helpers
// ---------------------------------------------------------------------------

using Handler = json (*)(const ToolContext &, const json &);
using Streamer = void (*)(const ToolContext &, const json &, StreamContext &);

Tool make_tool(const ToolContext &ctx, const std::string &name,
               const std::string &description, json schema, Handler handler,
               Streamer streamer = nullptr) {
  Tool tool;
  tool.name = name;
  tool.description = description;
  tool.input_schema = std::move(schema);
  tool.handler = with_store_errors(ToolHandler(
      [ctx, handler](const json &args) { return handler(ctx, args); }));
  if (streamer) {
    tool.stream_handler = with_store_errors(StreamHandler(
        [ctx, streamer](const json &args, StreamContext &stream) {
          streamer(ctx, args, stream);
        }));
  }
  return tool;
}

} // namespace

void register_builtin_tools(ToolRegistry &registry, const ToolContext &ctx) {
  registry.add(make_tool(ctx, "list_functions",
                         "List functions (optionally filtered by module or tag).",
                         make_schema({{"module", "string"}, {"tag", "string"}}),
                         handle_list_functions));
  registry.add(make_tool(ctx, "get_function",
                         "Get full details of a function by ID.",
                         make_schema({{"id", "string"}}, {"id"}),
                         handle_get_function));
  registry.add(make_tool(
      ctx, "add_function",
      "Add a function with provided name, description, and code.",
      make_schema({{"name", "string"},
                   {"description", "string"},
                   {"code", "string"},
                   {"modules", "array"},
                   {"tags", "array"}},
                  {"name", "description", "code"}),
      handle_add_function));
  registry.add(make_tool(
      ctx, "modify_function",
      "Modify the code for an existing function (overwrites code).",
      make_schema({{"id", "string"},
                   {"modifier", "string"},
                   {"description", "string"},
                   {"code", "string"}},
                  {"id", "modifier", "description", "code"}),
      handle_modify_function));
  registry.add(make_tool(
      ctx, "delete_function",
      "Delete a function by ID with its tests, results and dependency edges.",
      make_schema({{"function_id", "string"}}, {"function_id"}),
      handle_delete_function));
  registry.add(make_tool(ctx, "search_functions",
                         "Keyword search across name, description, code.",
                         make_schema({{"query", "string"}}, {"query"}),
                         handle_search_functions));
  registry.add(make_tool(ctx, "list_modules", "List all module names.",
                         make_schema({}), handle_list_modules));
  registry.add(make_tool(ctx, "list_tags", "List all tags in use.",
                         make_schema({}), handle_list_tags));
  registry.add(make_tool(
      ctx, "add_tag", "Attach a tag to a function.",
      make_schema({{"function_id", "string"}, {"tag", "string"}},
                  {"function_id", "tag"}),
      handle_add_tag));

  registry.add(make_tool(
      ctx, "add_dependency",
      "Record that one function depends on another (cycles are rejected).",
      make_schema({{"function_id", "string"}, {"depends_on_id", "string"}},
                  {"function_id", "depends_on_id"}),
      handle_add_dependency));
  registry.add(make_tool(
      ctx, "remove_dependency", "Remove a dependency between two functions.",
      make_schema({{"function_id", "string"}, {"depends_on_id", "string"}},
                  {"function_id", "depends_on_id"}),
      handle_remove_dependency));
  registry.add(make_tool(
      ctx, "list_dependencies", "List dependencies for a function.",
      make_schema({{"function_id", "string"}}, {"function_id"}),
      handle_list_dependencies));
  registry.add(make_tool(ctx, "find_cycles",
                         "Detect and return dependency cycles in the store.",
                         make_schema({}), handle_find_cycles));
  registry.add(make_tool(
      ctx, "detect_recursion",
      "Detect direct or mutual recursion for a function.",
      make_schema({{"function_id", "string"}}, {"function_id"}),
      handle_detect_recursion));
  registry.add(make_tool(
      ctx, "visualize_dependencies",
      "Render the dependency graph as Graphviz DOT, optionally to a file.",
      make_schema({{"file_path", "string"}}), handle_visualize_dependencies));

  registry.add(make_tool(
      ctx, "add_test", "Attach a unit test to a function.",
      make_schema({{"function_id", "string"},
                   {"name", "string"},
                   {"description", "string"},
                   {"test_code", "string"}},
                  {"function_id", "name", "description", "test_code"}),
      handle_add_test));
  registry.add(make_tool(
      ctx, "run_tests",
      "Run tests for a function, module, or all. (Supports streaming)",
      make_schema({{"function_id", "string"},
                   {"module", "string"},
                   {"timeout_ms", "integer"}}),
      handle_run_tests, stream_run_tests));
  registry.add(make_tool(
      ctx, "get_test_results",
      "Get the recorded test results for all or one function.",
      make_schema({{"function_id", "string"}}), handle_get_test_results));
  registry.add(make_tool(
      ctx, "coverage_report",
      "Get coverage (tests passed/failed) for all functions.", make_schema({}),
      handle_coverage_report));
  registry.add(make_tool(
      ctx, "property_test",
      "Run property-based tests for a function. (Supports streaming)",
      make_schema({{"function_id", "string"},
                   {"num_tests", "integer"},
                   {"seed", "integer"}},
                  {"function_id"}),
      handle_property_test, stream_property_test));
  registry.add(make_tool(
      ctx, "benchmark_function",
      "Time a function by running input code that calls it N times.",
      make_schema({{"function_id", "string"},
                   {"input_code", "string"},
                   {"input_file", "string"},
                   {"iterations", "integer"},
                   {"timeout_ms", "integer"}},
                  {"function_id"}),
      handle_benchmark_function));

  registry.add(make_tool(
      ctx, "lint_code", "Check code for compatibility issues.",
      make_schema({{"code", "string"}, {"fix", "boolean"}}, {"code"}),
      handle_lint_code));
  registry.add(make_tool(
      ctx, "eval", "Evaluate an expression in the persistent worker.",
      make_schema({{"expression", "string"}, {"timeout_ms", "integer"}},
                  {"expression"}),
      handle_eval));
  registry.add(make_tool(ctx, "worker_status",
                         "Report the worker process state and call counters.",
                         make_schema({}), handle_worker_status));
  registry.add(make_tool(ctx, "restart_worker",
                         "Stop the worker process and start a fresh one.",
                         make_schema({}), handle_restart_worker));

  if (ctx.generator) {
    registry.add(make_tool(
        ctx, "generate_function",
        "Generate a new function from a natural language description and "
        "add it to the store. (Supports streaming)",
        make_schema({{"description", "string"}, {"module", "string"}},
                    {"description"}),
        handle_generate_function, stream_generate_function));
    registry.add(make_tool(
        ctx, "generate_test",
        "Generate a unit test for a function from a description and attach "
        "it.",
        make_schema({{"function_id", "string"},
                     {"name", "string"},
                     {"description", "string"}},
                    {"function_id", "name", "description"}),
        handle_generate_test));
  }

  LOG_INFO("TOOLS", "REGISTER", "Registered {} tools", registry.size());
}

} // namespace server
} // namespace autocode
