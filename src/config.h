#ifndef CONFIG_H_
#define CONFIG_H_

#include <string>
#include <vector>
#include <filesystem>
#include <sandpool/session_pool.h>

#include "docker_provider.h"

namespace fs = std::filesystem;

extern std::string kHost;
extern int kPort;
extern std::string kAuthToken;
extern int kMaxSessionsPerLanguage;
// seconds
extern long kSessionTimeout;
extern long kCleanupInterval;
extern long kDefaultTimeout;
extern long kMaxTimeout;
extern std::vector<std::string> kLanguages;
extern DockerOptions kDockerOptions;

// Read the INI file into the globals above; keys absent from the file keep their
//  current values. Returns false if the file cannot be opened or holds invalid values.
bool ParseConfig(const fs::path& conf_path);
// AUTH_TOKEN overrides the file
void ApplyEnvironment();
PoolConfig MakePoolConfig();

#endif  // CONFIG_H_
