#ifndef INCLUDE_SANDPOOL_DISPATCHER_H_
#define INCLUDE_SANDPOOL_DISPATCHER_H_

#include <chrono>
#include <string>
#include <vector>
#include <optional>

#include <sandpool/session_pool.h>

struct ExecutionRequest {
  std::string language;
  std::string code;
  LibrarySet libraries;
  std::chrono::seconds timeout;
  std::string session_id; // empty = no preference

  ExecutionRequest() : language("python"), timeout(30) {}
};

class ExecutionResult {
 public:
  bool success;
  std::string std_out, std_err;
  std::optional<int> exit_code; // empty if the program never finished
  double execution_time; // seconds
  std::string error; // set on provider-level failure or timeout
  std::string session_id;
  bool timed_out;

  ExecutionResult() : success(false), execution_time(0), timed_out(false) {}
};

struct SessionInfo {
  std::string session_id;
  std::string language;
  LibrarySet libraries;
  double created_at; // UNIX timestamp, seconds
};

class ExecutionDispatcher {
  SessionPool& pool_;
  const std::vector<std::string> languages_;
  const std::chrono::seconds max_timeout_;

  void CheckLanguage_(const std::string& language) const;

 public:
  ExecutionDispatcher(SessionPool& pool, std::vector<std::string> languages,
                      std::chrono::seconds max_timeout = std::chrono::seconds(300));

  // Failures inside user code are reported in the result; only system faults
  //  (creation failure, shutdown, invalid request) throw.
  ExecutionResult Execute(const ExecutionRequest&);
  SessionInfo CreateSession(const std::string& language, const LibrarySet& libraries);
  bool CloseSession(const std::string& session_id);
  PoolStats PoolStatistics() const;
  const std::vector<std::string>& SupportedLanguages() const { return languages_; }
  std::chrono::seconds MaxTimeout() const { return max_timeout_; }
};

#endif  // INCLUDE_SANDPOOL_DISPATCHER_H_
