#include <signal.h>
#include <memory>
#include <iostream>

#include <spdlog/spdlog.h>
#include <argparse/argparse.hpp>
#include <sandpool/errors.h>
#include <sandpool/dispatcher.h>
#include <sandpool/session_pool.h>

#include "config.h"
#include "server.h"
#include "docker_provider.h"
#include "signal_watcher.h"

namespace {

void ParseArgs(int argc, char** argv) {
  int verbosity = 0;
  argparse::ArgumentParser parser(argc ? argv[0] : "sandpool-server");
  parser.add_argument("-c", "--config")
    .required().default_value(std::string("/etc/sandpool.conf"))
    .help("Path of configuration file");
  parser.add_argument("-v", "--verbose")
    .action([&](const auto &) { ++verbosity; })
    .append().default_value(false).implicit_value(true).nargs(0)
    .help("Verbose level");
  parser.add_argument("--host")
    .help("Address to listen on");
  parser.add_argument("-p", "--port")
    .scan<'d', int>()
    .help("Port to listen on");
  parser.add_argument("--max-sessions")
    .scan<'d', int>()
    .help("Maximum number of pooled sessions per language");

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
    spdlog::error("Failed to parse configuration file {}", std::string(config_file));
    exit(1);
  }
  if (auto val = parser.present<std::string>("--host")) {
    kHost = val.value();
  }
  if (auto val = parser.present<int>("--port")) {
    kPort = val.value();
  }
  if (auto val = parser.present<int>("--max-sessions")) {
    kMaxSessionsPerLanguage = val.value();
  }
  ApplyEnvironment();
}

} // namespace

int main(int argc, char** argv) {
  spdlog::set_pattern("[%t] %+");
  ParseArgs(argc, argv);
  if (kAuthToken.empty()) {
    spdlog::error("No authentication token configured; set auth_token or AUTH_TOKEN.");
    return 1;
  }

  // blocked before any thread starts so that only the watcher receives them
  sigset_t sigset;
  sigemptyset(&sigset);
  sigaddset(&sigset, SIGINT);
  sigaddset(&sigset, SIGTERM);
  pthread_sigmask(SIG_BLOCK, &sigset, nullptr);

  std::unique_ptr<SessionPool> pool;
  try {
    pool = std::make_unique<SessionPool>(std::make_shared<DockerProvider>(kDockerOptions), MakePoolConfig());
  } catch (const std::invalid_argument& err) {
    spdlog::error("Invalid pool configuration: {}", err.what());
    return 1;
  }
  ExecutionDispatcher dispatcher(*pool, kLanguages, std::chrono::seconds(kMaxTimeout));
  ApiServer server(dispatcher, kAuthToken, std::chrono::seconds(kDefaultTimeout));
  SignalWatcher signal_watcher({SIGTERM, SIGINT}, [&server](int) { server.Stop(); });

  spdlog::warn("Serving {} language(s) on {}:{}", kLanguages.size(), kHost, kPort);
  bool ok = server.Listen(kHost, kPort);
  if (!ok) spdlog::error("Failed to listen on {}:{}", kHost, kPort);
  signal_watcher.Stop();
  pool->Shutdown();
  return ok ? 0 : 1;
}
