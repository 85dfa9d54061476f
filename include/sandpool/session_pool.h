#ifndef INCLUDE_SANDPOOL_SESSION_POOL_H_
#define INCLUDE_SANDPOOL_SESSION_POOL_H_

#include <map>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>
#include <vector>
#include <optional>
#include <unordered_map>
#include <condition_variable>

#include <sandpool/session.h>
#include <sandpool/provider.h>

struct PoolConfig {
  int max_sessions_per_language;
  std::chrono::milliseconds session_timeout;
  // 0 = no background reaper; call ReapExpired manually
  std::chrono::milliseconds cleanup_interval;

  PoolConfig() :
      max_sessions_per_language(5),
      session_timeout(std::chrono::seconds(300)),
      cleanup_interval(std::chrono::seconds(60)) {}
};

struct PoolStats {
  size_t total_sessions;
  std::map<std::string, size_t> sessions_by_language;
  PoolConfig config;
};

class IdleReaper;

// Owns every live PooledSession, partitioned by language.
// The mutex only guards bookkeeping; provider calls are always made without it.
class SessionPool {
 public:
  using SessionPtr = std::shared_ptr<PooledSession>;
  using Clock = PooledSession::Clock;

 private:
  using Bucket = std::unordered_map<std::string, SessionPtr>;

  const std::shared_ptr<SandboxProvider> provider_;
  const PoolConfig config_;

  mutable std::mutex mtx_;
  // signalled when a reservation resolves or shutdown begins
  std::condition_variable cv_;
  std::map<std::string, Bucket> sessions_;
  // slots reserved by in-flight creations, per language
  std::unordered_map<std::string, int> reserved_;
  int total_reserved_;
  long sequence_;
  bool shutting_down_;

  std::unique_ptr<IdleReaper> reaper_;
  std::once_flag shutdown_once_;

  SessionPtr Create_(const std::string& language, const LibrarySet& libraries);
  // caller holds mtx_
  SessionPtr FindMatch_(Bucket& bucket, const LibrarySet& libraries) const;
  SessionPtr PopLeastRecentlyUsed_(Bucket& bucket);
  void ReleaseReservation_(const std::string& language);
  // caller must NOT hold mtx_
  void Teardown_(const SessionPtr& session, const char* reason) noexcept;
  void DoShutdown_();

 public:
  SessionPool(std::shared_ptr<SandboxProvider> provider, const PoolConfig& config = PoolConfig());
  ~SessionPool();
  SessionPool(const SessionPool&) = delete;
  SessionPool& operator=(const SessionPool&) = delete;

  // Throws ProviderCreationError if a new environment was needed and could not be created,
  //  PoolShutdownError once Shutdown has begun.
  SessionPtr Acquire(const std::string& language, const LibrarySet& libraries,
                     const std::string& preferred_id = "");
  // Refresh last-used time; no-op if the session is gone
  void Release(const std::string& id, const std::string& language);
  bool CloseById(const std::string& id);
  PoolStats Stats() const;
  // one pass of idle expiry; returns the number of sessions reclaimed
  size_t ReapExpired();
  // idempotent
  void Shutdown();

  std::optional<Clock::time_point> LastUsedAt(const std::string& id) const;
  bool IsShuttingDown() const;
  const PoolConfig& Config() const { return config_; }
  const std::shared_ptr<SandboxProvider>& Provider() const { return provider_; }
};

#endif  // INCLUDE_SANDPOOL_SESSION_POOL_H_
