#ifndef INCLUDE_SANDPOOL_SESSION_H_
#define INCLUDE_SANDPOOL_SESSION_H_

#include <set>
#include <atomic>
#include <mutex>
#include <chrono>
#include <memory>
#include <string>

// library names; ordering and duplicates in requests do not matter
using LibrarySet = std::set<std::string>;

class SandboxHandle;
class SessionPool;

class PooledSession {
 public:
  using Clock = std::chrono::steady_clock;

 private:
  const std::string id_;
  const std::string language_;
  const LibrarySet libraries_;
  const std::unique_ptr<SandboxHandle> handle_;
  const Clock::time_point created_at_;
  const std::chrono::system_clock::time_point created_wall_;
  const long sequence_; // creation order; final tie-breaker
  // guarded by the owning pool's mutex
  Clock::time_point last_used_at_;
  // serializes executions against the handle
  mutable std::mutex exec_mtx_;
  // set once teardown begins
  std::atomic<bool> closed_{false};

  // never moves backwards
  void Touch_(Clock::time_point now);
  friend class SessionPool;

 public:
  PooledSession(std::string id, std::string language, LibrarySet libraries,
                std::unique_ptr<SandboxHandle> handle, Clock::time_point now, long sequence);
  ~PooledSession();
  PooledSession(const PooledSession&) = delete;
  PooledSession& operator=(const PooledSession&) = delete;

  const std::string& Id() const { return id_; }
  const std::string& Language() const { return language_; }
  const LibrarySet& Libraries() const { return libraries_; }
  SandboxHandle& Handle() const { return *handle_; }
  Clock::time_point CreatedAt() const { return created_at_; }
  // UNIX timestamp in seconds, for reporting
  double CreatedAtUnix() const;
  long Sequence() const { return sequence_; }
  // true once the pool has started destroying the handle
  bool IsClosed() const { return closed_; }
  std::mutex& ExecMutex() const { return exec_mtx_; }
};

#endif  // INCLUDE_SANDPOOL_SESSION_H_
