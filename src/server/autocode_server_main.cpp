#include "autocode/Config.hpp"
#include "autocode/Logger.hpp"
#include "autocode/errors.hpp"
#include "autocode/ipc/ScriptRunner.hpp"
#include "autocode/lint/Linter.hpp"
#include "autocode/server/AuditLog.hpp"
#include "autocode/server/OutputChannel.hpp"
#include "autocode/server/RpcServer.hpp"
#include "autocode/server/ToolHandlers.hpp"
#include "autocode/server/ToolRegistry.hpp"
#include "autocode/store/InMemoryFunctionStore.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstring>
#include <iostream>
#include <pthread.h>
#include <string>
#include <thread>
#include <yaml-cpp/yaml.h>

using namespace autocode;

static std::atomic<bool> g_signalled{false};

extern "C" void wake_handler(int) {}

sigset_t shutdown_signals() {
  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  return set;
}

// Must run before any thread starts: every thread inherits the blocked
// SIGINT/SIGTERM, and only the watcher thread collects them. SIGUSR1 is
// installed without SA_RESTART so it interrupts the stdin read.
void install_signal_handlers() {
  sigset_t set = shutdown_signals();
  pthread_sigmask(SIG_BLOCK, &set, nullptr);

  struct sigaction sa;
  std::memset(&sa, 0, sizeof(sa));
  sa.sa_handler = wake_handler;
  sigemptyset(&sa.sa_mask);
  sa.sa_flags = 0;
  sigaction(SIGUSR1, &sa, nullptr);
  std::signal(SIGPIPE, SIG_IGN);
}

// Waits for SIGINT/SIGTERM. On one, stops the serve loop and keeps poking
// the main thread until its blocked read returns. Returns quietly when
// `serving` is already false (main sends SIGTERM to end the wait).
void watch_shutdown_signals(server::RpcServer &rpc,
                            const std::atomic<bool> &serving,
                            pthread_t main_thread) {
  sigset_t set = shutdown_signals();
  int sig = 0;
  if (sigwait(&set, &sig) != 0 || !serving)
    return;

  g_signalled = true;
  LOG_INFO("MAIN", "SIGNAL", "Received signal {}, stopping", sig);
  rpc.request_stop();
  while (serving) {
    pthread_kill(main_thread, SIGUSR1);
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

void print_usage() {
  std::cout << "Usage: autocode-server [serve] [options]\n\n";
  std::cout << "Serves JSON-RPC requests, one per line, on stdin/stdout.\n";
  std::cout << "\nOptions:\n";
  std::cout << "  --config <path>        YAML configuration file\n";
  std::cout << "  --runtime <name>       Worker runtime: julia | python "
               "(default: julia)\n";
  std::cout << "  --runtime-exe <path>   Interpreter executable override\n";
  std::cout << "  --audit-log <path>     Audit log (NDJSON), empty disables\n";
  std::cout << "  --log-file <path>      Operational log file\n";
  std::cout << "  --log-level <level>    trace|debug|info|warn|error "
               "(default: info)\n";
  std::cout << "  --store <path>         JSON file backing the function "
               "store\n";
  std::cout << "  --help                 Show this message\n";
  std::cout << "\nEnvironment:\n";
  std::cout << "  AUTOCODE_RUNTIME, AUTOCODE_RUNTIME_EXE, AUTOCODE_AUDIT_LOG\n";
  std::cout << "  (alias MCP_AUTOCODE_LOG), AUTOCODE_LOG_LEVEL, "
               "AUTOCODE_STORE\n";
  std::cout << "\nPrecedence: defaults < --config file < environment < "
               "flags\n";
}

spdlog::level::level_enum parse_log_level(const std::string &level) {
  if (level == "debug")
    return spdlog::level::debug;
  if (level == "warn")
    return spdlog::level::warn;
  if (level == "error")
    return spdlog::level::err;
  if (level == "trace")
    return spdlog::level::trace;
  return spdlog::level::info;
}

struct CommandLine {
  std::string config_path;
  std::string runtime;
  std::string runtime_exe;
  std::string audit_log;
  std::string log_file;
  std::string log_level;
  std::string store;
  bool audit_log_set{false};
  bool log_file_set{false};
  bool help{false};
};

// Returns false (after printing the problem) on a malformed command line.
bool parse_command_line(int argc, char **argv, CommandLine &cli) {
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "serve" && i == 1)
      continue;
    if (arg == "--help" || arg == "-h") {
      cli.help = true;
      continue;
    }

    std::string *target = nullptr;
    if (arg == "--config") {
      target = &cli.config_path;
    } else if (arg == "--runtime") {
      target = &cli.runtime;
    } else if (arg == "--runtime-exe") {
      target = &cli.runtime_exe;
    } else if (arg == "--audit-log") {
      target = &cli.audit_log;
      cli.audit_log_set = true;
    } else if (arg == "--log-file") {
      target = &cli.log_file;
      cli.log_file_set = true;
    } else if (arg == "--log-level") {
      target = &cli.log_level;
    } else if (arg == "--store") {
      target = &cli.store;
    } else {
      std::cerr << "Error: unknown argument '" << arg << "'\n";
      return false;
    }

    if (i + 1 >= argc) {
      std::cerr << "Error: " << arg << " requires a value\n";
      return false;
    }
    *target = argv[++i];
  }
  return true;
}

void apply_command_line(const CommandLine &cli, ServerConfig &config) {
  if (!cli.runtime.empty())
    config.runtime.profile = cli.runtime;
  if (!cli.runtime_exe.empty())
    config.runtime.executable = cli.runtime_exe;
  if (cli.audit_log_set)
    config.audit_path = cli.audit_log;
  if (cli.log_file_set)
    config.log_file = cli.log_file;
  if (!cli.log_level.empty())
    config.log_level = cli.log_level;
  if (!cli.store.empty())
    config.store_path = cli.store;
}

int main(int argc, char **argv) {
  CommandLine cli;
  if (!parse_command_line(argc, argv, cli)) {
    print_usage();
    return 1;
  }
  if (cli.help) {
    print_usage();
    return 0;
  }

  ServerConfig config;
  try {
    if (!cli.config_path.empty())
      load_config_file(cli.config_path, config);
    apply_environment(config);
    apply_command_line(cli, config);
  } catch (const YAML::Exception &ex) {
    std::cerr << "Error: failed to parse " << cli.config_path << ": "
              << ex.what() << "\n";
    return 1;
  } catch (const std::exception &ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }

  install_signal_handlers();
  Logger::instance().init(config.log_file, parse_log_level(config.log_level));

  ipc::RuntimeProfile profile;
  try {
    profile = resolve_profile(config);
  } catch (const std::invalid_argument &ex) {
    LOG_ERROR("MAIN", "CONFIG", "{}", ex.what());
    Logger::instance().shutdown();
    return 1;
  }

  store::InMemoryFunctionStore store(config.store_path);
  try {
    store.load();
  } catch (const StoreError &ex) {
    LOG_ERROR("MAIN", "STORE", "Failed to load store {}: {}",
              config.store_path, ex.what());
    Logger::instance().shutdown();
    return 1;
  }

  LOG_INFO("MAIN", "STARTUP",
           "Runtime '{}' ({}), audit log '{}', store '{}'", profile.name,
           profile.executable, config.audit_path,
           config.store_path.empty() ? "<memory>" : config.store_path);

  ipc::ScriptRunner runner(profile, runner_options(config));
  lint::JuliaLinter linter(config.linter);

  server::ToolRegistry registry;
  server::register_builtin_tools(
      registry, server::ToolContext{runner, store, linter, nullptr,
                                    config.runtime});

  server::OutputChannel output(std::cout);
  server::AuditLog audit(config.audit_path);

  {
    server::RpcServer rpc(registry, output, audit);
    std::atomic<bool> serving{true};
    pthread_t main_thread = pthread_self();
    std::thread watcher(
        [&]() { watch_shutdown_signals(rpc, serving, main_thread); });

    rpc.serve(std::cin);
    serving = false;
    pthread_kill(watcher.native_handle(), SIGTERM);
    watcher.join();

    if (g_signalled)
      LOG_INFO("MAIN", "SHUTDOWN", "Interrupted by signal");

    auto &sessions = rpc.sessions();
    if (sessions.active_count() > 0) {
      LOG_INFO("MAIN", "SHUTDOWN", "Cancelling {} streaming call(s)",
               sessions.active_count());
      sessions.cancel_all();
      if (!sessions.wait_idle(
              std::chrono::milliseconds(config.runtime.stop_grace_ms)))
        LOG_WARN("MAIN", "SHUTDOWN",
                 "Streaming calls still running after grace period");
    }
    runner.stop();
  }

  LOG_INFO("MAIN", "SHUTDOWN", "Server stopped");
  Logger::instance().shutdown();
  return 0;
}
