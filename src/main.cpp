#include <signal.h>
#include <pthread.h>
#include <memory>
#include <thread>
#include <fstream>
#include <iostream>
#include <filesystem>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <coderun/paths.h>
#include <coderun/logger.h>
#include <coderun/process.h>
#include <coderun/dispatcher.h>
#ifdef CODERUN_HAVE_CJAIL
#include <coderun/sandbox.h>
#endif
#include "server_io.h"

namespace {

const char kDefaultConfig[] = "/etc/coderun.conf";
int kMaxParallel = 4;
size_t kMaxQueue = 20;
std::string kSandbox = "none";

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  std::string workspace_root = ini[""]["workspace_root"] | "";
  if (workspace_root.size()) kWorkspaceRoot = workspace_root;
  kMaxParallel = ini[""]["parallel"] | kMaxParallel;
  kMaxQueue = ini[""]["max_queue"] | kMaxQueue;
  kCompileTimeLimit = (ini[""]["compile_time_limit_ms"] | (kCompileTimeLimit / 1000)) * 1000;
  kRunTimeLimit = (ini[""]["run_time_limit_ms"] | (kRunTimeLimit / 1000)) * 1000;
  kBuildTimeLimit = (ini[""]["build_time_limit_ms"] | (kBuildTimeLimit / 1000)) * 1000;
  kMaxOutput = ini[""]["max_output_kib"] | kMaxOutput;
  kHost = ini[""]["host"] | kHost;
  kPort = ini[""]["port"] | kPort;
  kSandbox = ini[""]["sandbox"] | kSandbox;
  return true;
}

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "coderun-server");
  parser.add_argument("-c", "--config")
    .default_value(std::string(kDefaultConfig))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("-p", "--parallel")
    .scan<'d', int>()
    .help("Number of maximum parallel executions");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("--port")
    .scan<'d', int>()
    .help("Port to listen on");

  try {
    parser.parse_args(argc, argv);
  } catch (const std::runtime_error& err) {
    std::cerr << err.what() << std::endl;
    std::cerr << parser;
    exit(1);
  }

  switch (verbosity) {
    case 0: spdlog::set_level(spdlog::level::warn); break;
    case 1: spdlog::set_level(spdlog::level::info); break;
    default: spdlog::set_level(spdlog::level::debug); break;
  }
  fs::path config_file = parser.get<std::string>("--config");
  if (!ParseConfig(config_file)) {
    // the defaults are usable without a configuration file
    if (config_file != kDefaultConfig) {
      spdlog::error("Failed to parse configuration file {}", std::string(config_file));
      exit(1);
    }
    spdlog::info("Configuration file {} not found, using defaults", std::string(config_file));
  }
  if (auto val = parser.present<int>("--parallel")) {
    kMaxParallel = val.value();
  }
  if (auto val = parser.present("--host")) {
    kHost = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kPort = val.value();
  }
}

std::unique_ptr<ProcessRunner> MakeRunner() {
  if (kSandbox == "none") return std::make_unique<LocalProcessRunner>();
#ifdef CODERUN_HAVE_CJAIL
  if (kSandbox == "cjail") return std::make_unique<JailProcessRunner>();
#endif
  spdlog::error("Unsupported sandbox '{}'", kSandbox);
  return nullptr;
}

// SIGINT / SIGTERM stop the server; blocked in every thread, delivered through sigwait
void HandleSignals(sigset_t set) {
  int sig;
  if (sigwait(&set, &sig) == 0) {
    spdlog::warn("Received signal {}, shutting down", sig);
    StopServer();
  }
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  InitLogger();
  ParseArgs(argc, argv);
  auto runner = MakeRunner();
  if (!runner) return 1;

  sigset_t set;
  sigemptyset(&set);
  sigaddset(&set, SIGINT);
  sigaddset(&set, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &set, nullptr);
  std::thread signal_thread(HandleSignals, set);
  signal_thread.detach();

  ExecutionLimiter limiter(kMaxParallel, kMaxQueue);
  Dispatcher dispatcher(*runner, &limiter);
  spdlog::info("Workspace root {}, parallel {}, sandbox {}", kWorkspaceRoot.c_str(), kMaxParallel, kSandbox);
  return ServerWorkLoop(dispatcher, limiter) ? 0 : 1;
}
