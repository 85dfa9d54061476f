#ifndef SERVER_H_
#define SERVER_H_

#include <chrono>
#include <string>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <sandpool/dispatcher.h>

constexpr char kApiVersion[] = "1.0.0";

// Accepts a JSON array, a string holding a JSON array, or a comma-separated string.
// null yields an empty set; throws std::invalid_argument on anything else or on an
//  unsafe library name.
LibrarySet CleanLibraries(const nlohmann::json& value);

nlohmann::json ToJson(const ExecutionResult&);
nlohmann::json ToJson(const SessionInfo&);
nlohmann::json ToJson(const PoolStats&);

class ApiServer {
  ExecutionDispatcher& dispatcher_;
  const std::string token_;
  // used when an execution request names none
  const std::chrono::seconds default_timeout_;
  httplib::Server svr_;

  bool Authorized_(const httplib::Request&) const;
  void SetupRoutes_();

 public:
  ApiServer(ExecutionDispatcher& dispatcher, std::string token,
            std::chrono::seconds default_timeout = std::chrono::seconds(30));
  ApiServer(const ApiServer&) = delete;
  ApiServer& operator=(const ApiServer&) = delete;

  // blocks until Stop
  bool Listen(const std::string& host, int port);
  // for tests: bind first, then serve on the returned port
  int BindToAnyPort(const std::string& host);
  bool ListenAfterBind();
  void WaitUntilReady() const;
  void Stop();
};

#endif  // SERVER_H_
