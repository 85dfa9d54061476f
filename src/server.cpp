#include "server.h"

#include <chrono>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <sandpool/errors.h>
#include <sandpool/utils.h>

#include "http_utils.h"

namespace {

using nlohmann::json;

// carries a status code other than the generic mapping
class HTTPError : public std::runtime_error {
 public:
  const int status;
  HTTPError(int status, const std::string& detail) : std::runtime_error(detail), status(status) {}
};

void SetError(httplib::Response& res, int status, const std::string& detail) {
  res.status = status;
  res.set_content(json{{"detail", detail}}.dump(), "application/json");
}

template <class Func>
void Respond(const httplib::Request& req, httplib::Response& res, Func&& func) {
  try {
    json body = func();
    res.set_content(body.dump(-1, ' ', false, json::error_handler_t::replace), "application/json");
  } catch (const HTTPError& err) {
    SetError(res, err.status, err.what());
  } catch (const UnsupportedLanguageError& err) {
    SetError(res, 400, err.what());
  } catch (const std::invalid_argument& err) {
    SetError(res, 400, err.what());
  } catch (const json::exception& err) {
    SetError(res, 400, std::string("Invalid request: ") + err.what());
  } catch (const PoolShutdownError& err) {
    SetError(res, 503, err.what());
  } catch (const std::exception& err) {
    spdlog::error("{} {} failed: {}", req.method, req.path, err.what());
    SetError(res, 500, err.what());
  }
}

json ParseObject(const std::string& body) {
  json ret = json::parse(body);
  if (!ret.is_object()) throw std::invalid_argument("Request body must be a JSON object");
  return ret;
}

// missing or null -> default
template <class T>
T GetOptional(const json& body, const char* key, T def) {
  auto it = body.find(key);
  if (it == body.end() || it->is_null()) return def;
  return it->get<T>();
}

} // namespace

LibrarySet CleanLibraries(const json& value) {
  std::vector<std::string> names;
  if (value.is_null()) {
    // nothing
  } else if (value.is_array()) {
    for (auto& i : value) {
      if (i.is_null()) continue;
      names.push_back(i.is_string() ? i.get<std::string>() : i.dump());
    }
  } else if (value.is_string()) {
    std::string str = value.get<std::string>();
    json parsed = json::parse(str, nullptr, false);
    if (parsed.is_array()) return CleanLibraries(parsed);
    names = SplitList(str);
  } else {
    throw std::invalid_argument("Libraries must be a list or a string");
  }
  LibrarySet ret = NormalizeLibraries(names);
  for (auto& i : ret) {
    if (!IsValidLibraryName(i)) throw std::invalid_argument("Invalid library name: " + i);
  }
  return ret;
}

json ToJson(const ExecutionResult& result) {
  return json{
    {"success", result.success},
    {"stdout", result.std_out},
    {"stderr", result.std_err},
    {"exit_code", result.exit_code ? json(*result.exit_code) : json(nullptr)},
    {"execution_time", result.execution_time},
    {"error", result.error.size() ? json(result.error) : json(nullptr)},
    {"session_id", result.session_id},
  };
}

json ToJson(const SessionInfo& info) {
  return json{
    {"session_id", info.session_id},
    {"language", info.language},
    {"libraries", info.libraries},
    {"created_at", info.created_at},
  };
}

json ToJson(const PoolStats& stats) {
  using std::chrono::duration_cast;
  using std::chrono::seconds;
  return json{
    {"total_sessions", stats.total_sessions},
    {"sessions_by_language", stats.sessions_by_language},
    {"config", {
      {"max_sessions_per_language", stats.config.max_sessions_per_language},
      {"session_timeout", duration_cast<seconds>(stats.config.session_timeout).count()},
      {"cleanup_interval", duration_cast<seconds>(stats.config.cleanup_interval).count()},
    }},
  };
}

ApiServer::ApiServer(ExecutionDispatcher& dispatcher, std::string token,
                     std::chrono::seconds default_timeout) :
    dispatcher_(dispatcher), token_(std::move(token)), default_timeout_(default_timeout) {
  SetupRoutes_();
}

bool ApiServer::Authorized_(const httplib::Request& req) const {
  std::string token = http_utils::BearerToken(req);
  if (token.size() != token_.size() || token_.empty()) return false;
  unsigned char diff = 0;
  for (size_t i = 0; i < token.size(); i++) diff |= token[i] ^ token_[i];
  return diff == 0;
}

void ApiServer::SetupRoutes_() {
  svr_.set_pre_routing_handler([this](const httplib::Request& req, httplib::Response& res) {
    if (req.path == "/" || Authorized_(req)) return httplib::Server::HandlerResponse::Unhandled;
    spdlog::info("Rejected unauthenticated request: {} {} from {}", req.method, req.path, req.remote_addr);
    res.set_header("WWW-Authenticate", "Bearer");
    SetError(res, 401, "Invalid authentication token");
    return httplib::Server::HandlerResponse::Handled;
  });
  svr_.set_logger([](const httplib::Request& req, const httplib::Response& res) {
    spdlog::debug("{} {} -> {}", req.method, req.path, res.status);
  });

  svr_.Get("/", [](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [] {
      return json{
        {"message", "Remote Code Execution API"},
        {"version", kApiVersion},
        {"authentication", "required"},
      };
    });
  });
  svr_.Get("/health", [](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [] { return json{{"status", "healthy"}}; });
  });
  svr_.Get("/pool/stats", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [&] { return ToJson(dispatcher_.PoolStatistics()); });
  });
  svr_.Get("/languages", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [&] { return json{{"languages", dispatcher_.SupportedLanguages()}}; });
  });

  svr_.Post("/execute", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [&] {
      json body = ParseObject(req.body);
      auto code = body.find("code");
      if (code == body.end() || !code->is_string()) {
        throw std::invalid_argument("Field 'code' is required and must be a string");
      }
      ExecutionRequest exec;
      exec.code = code->get<std::string>();
      exec.language = GetOptional<std::string>(body, "language", exec.language);
      if (auto it = body.find("libraries"); it != body.end()) exec.libraries = CleanLibraries(*it);
      exec.timeout = std::chrono::seconds(GetOptional<long>(body, "timeout", default_timeout_.count()));
      exec.session_id = GetOptional<std::string>(body, "session_id", "");
      return ToJson(dispatcher_.Execute(exec));
    });
  });

  svr_.Post("/session/create", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [&] {
      std::string language = "python";
      json libraries = json::array();
      if (req.has_param("language")) language = req.get_param_value("language");
      size_t cnt = req.get_param_value_count("libraries");
      for (size_t i = 0; i < cnt; i++) libraries.push_back(req.get_param_value("libraries", i));
      if (Trim(req.body).size()) {
        json body = ParseObject(req.body);
        language = GetOptional<std::string>(body, "language", language);
        if (auto it = body.find("libraries"); it != body.end()) libraries = *it;
      }
      return ToJson(dispatcher_.CreateSession(language, CleanLibraries(libraries)));
    });
  });

  svr_.Delete(R"(/session/([^/]+))", [this](const httplib::Request& req, httplib::Response& res) {
    Respond(req, res, [&] {
      std::string id = req.matches[1];
      if (!dispatcher_.CloseSession(id)) throw HTTPError(404, "Session " + id + " not found");
      return json{{"message", "Session " + id + " closed"}};
    });
  });
}

bool ApiServer::Listen(const std::string& host, int port) {
  spdlog::info("Listening on {}:{}", host, port);
  return svr_.listen(host, port);
}

int ApiServer::BindToAnyPort(const std::string& host) {
  return svr_.bind_to_any_port(host);
}

bool ApiServer::ListenAfterBind() {
  return svr_.listen_after_bind();
}

void ApiServer::WaitUntilReady() const {
  svr_.wait_until_ready();
}

void ApiServer::Stop() {
  svr_.stop();
}
