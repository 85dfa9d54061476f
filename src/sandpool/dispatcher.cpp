#include <sandpool/dispatcher.h>

#include <mutex>
#include <future>
#include <thread>
#include <algorithm>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <sandpool/utils.h>
#include <sandpool/errors.h>

namespace {

inline double SecondsSince(std::chrono::steady_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - start).count();
}

// Shared between Execute and its worker; the flags are guarded by mtx.
struct RunState {
  std::mutex mtx;
  bool started = false;   // the program was handed to the provider
  bool cancelled = false; // the caller gave up before that happened
  std::promise<RunOutput> promise;
};

// Run on an independent thread so that a hung program never blocks the caller
//  past its timeout. The thread keeps the session (and thus the handle) alive
//  until the provider returns.
void RunDetached(std::shared_ptr<SandboxProvider> provider, SessionPool::SessionPtr session,
                 std::string code, std::shared_ptr<RunState> state) {
  std::thread([provider = std::move(provider), session = std::move(session),
               code = std::move(code), state = std::move(state)]() {
    std::lock_guard lck(session->ExecMutex());
    {
      std::lock_guard state_lck(state->mtx);
      if (state->cancelled) return;
      state->started = true;
    }
    try {
      if (session->IsClosed()) throw ProviderError("Session was closed before the execution started");
      state->promise.set_value(provider->Run(session->Handle(), code));
    } catch (...) {
      state->promise.set_exception(std::current_exception());
    }
  }).detach();
}

} // namespace

ExecutionDispatcher::ExecutionDispatcher(
    SessionPool& pool, std::vector<std::string> languages, std::chrono::seconds max_timeout) :
    pool_(pool), languages_(std::move(languages)), max_timeout_(max_timeout) {}

void ExecutionDispatcher::CheckLanguage_(const std::string& language) const {
  if (std::find(languages_.begin(), languages_.end(), language) == languages_.end()) {
    throw UnsupportedLanguageError(language);
  }
}

ExecutionResult ExecutionDispatcher::Execute(const ExecutionRequest& req) {
  CheckLanguage_(req.language);
  if (Trim(req.code).empty()) throw std::invalid_argument("Code cannot be empty");
  if (req.timeout.count() <= 0 || req.timeout > max_timeout_) {
    throw std::invalid_argument("Timeout must be between 1 and " +
                                std::to_string(max_timeout_.count()) + " seconds");
  }

  SessionPool::SessionPtr session = pool_.Acquire(req.language, req.libraries, req.session_id);
  ExecutionResult result;
  result.session_id = session->Id();
  spdlog::debug("Executing: session={} language={} code_size={}",
                session->Id(), req.language, req.code.size());

  auto start = std::chrono::steady_clock::now();
  auto state = std::make_shared<RunState>();
  std::future<RunOutput> future = state->promise.get_future();
  RunDetached(pool_.Provider(), session, req.code, state);
  if (future.wait_for(req.timeout) == std::future_status::timeout) {
    result.execution_time = SecondsSince(start);
    result.timed_out = true;
    result.error = "Execution timed out after " + std::to_string(req.timeout.count()) + " seconds";
    bool started;
    {
      std::lock_guard lck(state->mtx);
      started = state->started;
      if (!started) state->cancelled = true;
    }
    if (!started) {
      // still queued behind another execution on the same session; the session is intact
      spdlog::warn("Execution timed out before it started: session={}", session->Id());
      pool_.Release(session->Id(), req.language);
    } else {
      // the environment may still be running the program; never hand it out again
      spdlog::warn("Execution timed out, discarding session: id={}", session->Id());
      pool_.CloseById(session->Id());
    }
    return result;
  }
  try {
    RunOutput out = future.get();
    result.execution_time = SecondsSince(start);
    result.success = out.exit_code == 0;
    result.std_out = std::move(out.std_out);
    result.std_err = std::move(out.std_err);
    result.exit_code = out.exit_code;
  } catch (std::exception& err) {
    result.execution_time = SecondsSince(start);
    result.success = false;
    result.error = err.what();
    spdlog::warn("Execution failed: session={} error={}", session->Id(), err.what());
  }
  pool_.Release(session->Id(), req.language);
  spdlog::info("Execution finished: session={} language={} success={} time={:.3f}s",
               session->Id(), req.language, result.success, result.execution_time);
  return result;
}

SessionInfo ExecutionDispatcher::CreateSession(const std::string& language, const LibrarySet& libraries) {
  CheckLanguage_(language);
  SessionPool::SessionPtr session = pool_.Acquire(language, libraries);
  pool_.Release(session->Id(), language);
  return {session->Id(), language, libraries, session->CreatedAtUnix()};
}

bool ExecutionDispatcher::CloseSession(const std::string& session_id) {
  return pool_.CloseById(session_id);
}

PoolStats ExecutionDispatcher::PoolStatistics() const {
  return pool_.Stats();
}
