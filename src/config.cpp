#include "config.h"

#include <cstdlib>
#include <fstream>

#include <tortellini.hh>
#include <spdlog/spdlog.h>
#include <sandpool/utils.h>

#include "languages.h"

std::string kHost = "0.0.0.0";
int kPort = 8080;
std::string kAuthToken = "";
int kMaxSessionsPerLanguage = 5;
long kSessionTimeout = 300;
long kCleanupInterval = 60;
long kDefaultTimeout = 30;
long kMaxTimeout = 300;
std::vector<std::string> kLanguages = AllLanguageNames();
DockerOptions kDockerOptions;

bool ParseConfig(const fs::path& conf_path) {
  std::ifstream fin(conf_path);
  if (!fin) return false;
  tortellini::ini ini;
  fin >> ini;
  kHost = ini[""]["host"] | kHost;
  kPort = ini[""]["port"] | kPort;
  kAuthToken = ini[""]["auth_token"] | kAuthToken;
  kMaxSessionsPerLanguage = ini[""]["max_sessions_per_language"] | kMaxSessionsPerLanguage;
  kSessionTimeout = ini[""]["session_timeout"] | kSessionTimeout;
  kCleanupInterval = ini[""]["cleanup_interval"] | kCleanupInterval;
  kDefaultTimeout = ini[""]["default_timeout"] | kDefaultTimeout;
  kMaxTimeout = ini[""]["max_timeout"] | kMaxTimeout;
  std::string languages = ini[""]["languages"] | "";
  if (languages.size()) kLanguages = SplitList(languages);

  kDockerOptions.socket_path = ini[""]["docker_socket"] | kDockerOptions.socket_path;
  kDockerOptions.data_mount_source = ini[""]["data_mount_source"] | kDockerOptions.data_mount_source;
  kDockerOptions.data_mount_target = ini[""]["data_mount_target"] | kDockerOptions.data_mount_target;
  kDockerOptions.memory_limit_mb = ini[""]["memory_limit_mb"] | kDockerOptions.memory_limit_mb;
  kDockerOptions.network_mode = ini[""]["network_mode"] | kDockerOptions.network_mode;
  for (auto& name : AllLanguageNames()) {
    std::string image = ini["images"][name] | "";
    if (image.size()) kDockerOptions.images[name] = image;
  }

  for (auto& i : kLanguages) {
    if (!GetLanguage(i)) {
      spdlog::error("Unknown language in configuration: {}", i);
      return false;
    }
  }
  if (kLanguages.empty()) {
    spdlog::error("No language enabled");
    return false;
  }
  if (kPort <= 0 || kPort > 65535 || kMaxSessionsPerLanguage <= 0 || kSessionTimeout < 0 ||
      kCleanupInterval < 0 || kMaxTimeout <= 0 || kDefaultTimeout <= 0 || kDefaultTimeout > kMaxTimeout) {
    spdlog::error("Invalid numeric value in configuration");
    return false;
  }
  return true;
}

void ApplyEnvironment() {
  if (const char* token = std::getenv("AUTH_TOKEN"); token && token[0]) kAuthToken = token;
}

PoolConfig MakePoolConfig() {
  PoolConfig config;
  config.max_sessions_per_language = kMaxSessionsPerLanguage;
  config.session_timeout = std::chrono::seconds(kSessionTimeout);
  config.cleanup_interval = std::chrono::seconds(kCleanupInterval);
  return config;
}
