#include <sandpool/session_pool.h>

#include <tuple>
#include <stdexcept>

#include <spdlog/spdlog.h>
#include <sandpool/utils.h>
#include <sandpool/errors.h>
#include "reaper.h"

namespace {

inline double SecondsSince(PooledSession::Clock::time_point start) {
  return std::chrono::duration<double>(PooledSession::Clock::now() - start).count();
}

} // namespace

SessionPool::SessionPool(std::shared_ptr<SandboxProvider> provider, const PoolConfig& config) :
    provider_(std::move(provider)),
    config_(config),
    total_reserved_(0),
    sequence_(0),
    shutting_down_(false) {
  if (!provider_) throw std::invalid_argument("SessionPool requires a provider");
  if (config_.max_sessions_per_language <= 0) {
    throw std::invalid_argument("max_sessions_per_language must be positive");
  }
  if (config_.session_timeout.count() < 0 || config_.cleanup_interval.count() < 0) {
    throw std::invalid_argument("session_timeout and cleanup_interval must not be negative");
  }
  if (config_.cleanup_interval.count() > 0) {
    reaper_ = std::make_unique<IdleReaper>(*this, config_.cleanup_interval);
    reaper_->Start();
  }
}

SessionPool::~SessionPool() {
  Shutdown();
}

/// --- helpers (mtx_ held) ---
SessionPool::SessionPtr SessionPool::FindMatch_(Bucket& bucket, const LibrarySet& libraries) const {
  SessionPtr ret;
  for (auto& [id, session] : bucket) {
    if (session->Libraries() != libraries) continue;
    if (!ret || std::make_tuple(session->CreatedAt(), session->Sequence()) <
                std::make_tuple(ret->CreatedAt(), ret->Sequence())) {
      ret = session;
    }
  }
  return ret;
}

SessionPool::SessionPtr SessionPool::PopLeastRecentlyUsed_(Bucket& bucket) {
  auto lru = bucket.end();
  for (auto it = bucket.begin(); it != bucket.end(); ++it) {
    auto& s = it->second;
    if (lru == bucket.end() ||
        std::make_tuple(s->last_used_at_, s->CreatedAt(), s->Sequence()) <
        std::make_tuple(lru->second->last_used_at_, lru->second->CreatedAt(), lru->second->Sequence())) {
      lru = it;
    }
  }
  if (lru == bucket.end()) return nullptr;
  SessionPtr ret = std::move(lru->second);
  bucket.erase(lru);
  return ret;
}

void SessionPool::ReleaseReservation_(const std::string& language) {
  reserved_[language]--;
  total_reserved_--;
}

/// --- helpers (mtx_ not held) ---
void SessionPool::Teardown_(const SessionPtr& session, const char* reason) noexcept {
  session->closed_ = true;
  try {
    provider_->Destroy(session->Handle());
    spdlog::info("Session closed: id={} language={} reason={}",
                 session->Id(), session->Language(), reason);
  } catch (std::exception& err) {
    spdlog::error("Error closing session {} ({}): {}", session->Id(), reason, err.what());
  }
}

// Called with one slot reserved for `language`; the reservation is always
//  resolved (committed or released) before returning.
SessionPool::SessionPtr SessionPool::Create_(const std::string& language, const LibrarySet& libraries) {
  auto start = Clock::now();
  std::unique_ptr<SandboxHandle> handle;
  try {
    handle = provider_->Create(language, libraries);
    if (!handle) throw ProviderError("provider returned an empty handle");
  } catch (std::exception& err) {
    spdlog::error("Failed to create session: language={} error={}", language, err.what());
    {
      std::lock_guard lck(mtx_);
      ReleaseReservation_(language);
    }
    cv_.notify_all();
    throw ProviderCreationError(std::string("Failed to create session: ") + err.what());
  }

  if (libraries.size()) {
    try {
      InstallOutput res = provider_->InstallLibraries(*handle, libraries);
      if (res.exit_code != 0) {
        spdlog::warn("Failed to install libraries {}: exit_code={} {}",
                     FormatLibraries(libraries), res.exit_code, res.std_err);
      }
    } catch (std::exception& err) {
      spdlog::warn("Error installing libraries {}: {}", FormatLibraries(libraries), err.what());
    }
  }

  SessionPtr session;
  {
    std::lock_guard lck(mtx_);
    if (!shutting_down_) {
      session = std::make_shared<PooledSession>(
          GenerateSessionId(), language, libraries, std::move(handle), Clock::now(), ++sequence_);
      sessions_[language].emplace(session->Id(), session);
      ReleaseReservation_(language);
    }
  }
  if (!session) {
    // shutdown began while creating; do not leave an orphan behind
    auto orphan = std::make_shared<PooledSession>(
        GenerateSessionId(), language, libraries, std::move(handle), Clock::now(), -1);
    Teardown_(orphan, "shutdown");
    {
      std::lock_guard lck(mtx_);
      ReleaseReservation_(language);
    }
    cv_.notify_all();
    throw PoolShutdownError();
  }
  cv_.notify_all();
  spdlog::info("Session created: id={} language={} libraries={} time={:.3f}s",
               session->Id(), language, FormatLibraries(libraries), SecondsSince(start));
  return session;
}

/// --- public ---
SessionPool::SessionPtr SessionPool::Acquire(
    const std::string& language, const LibrarySet& libraries, const std::string& preferred_id) {
  std::vector<SessionPtr> to_destroy;
  SessionPtr found;
  bool rejected = false;
  {
    std::unique_lock lck(mtx_);
    if (shutting_down_) throw PoolShutdownError();
    if (preferred_id.size()) {
      Bucket& bucket = sessions_[language];
      if (auto it = bucket.find(preferred_id); it != bucket.end()) {
        if (it->second->Libraries() == libraries) {
          it->second->Touch_(Clock::now());
          spdlog::debug("Reusing requested session: id={}", preferred_id);
          return it->second;
        }
        spdlog::info("Library set changed, replacing session: id={} old={} new={}", preferred_id,
                     FormatLibraries(it->second->Libraries()), FormatLibraries(libraries));
        to_destroy.push_back(std::move(it->second));
        bucket.erase(it);
      }
    }
    while (true) {
      Bucket& bucket = sessions_[language];
      if ((found = FindMatch_(bucket, libraries))) {
        found->Touch_(Clock::now());
        spdlog::debug("Reusing matching session: id={}", found->Id());
        break;
      }
      int& reserved = reserved_[language];
      if ((int)bucket.size() + reserved < config_.max_sessions_per_language) {
        reserved++;
        total_reserved_++;
        break;
      }
      if (auto lru = PopLeastRecentlyUsed_(bucket)) {
        spdlog::info("Pool full for {}, evicting least recently used session: id={}",
                     language, lru->Id());
        to_destroy.push_back(std::move(lru));
        reserved++;
        total_reserved_++;
        break;
      }
      // every slot is held by an in-flight creation
      spdlog::debug("Waiting for a free slot: language={}", language);
      cv_.wait(lck);
      if (shutting_down_) {
        rejected = true;
        break;
      }
    }
  }
  for (auto& session : to_destroy) Teardown_(session, "evicted");
  if (rejected) throw PoolShutdownError();
  if (found) return found;
  return Create_(language, libraries);
}

void SessionPool::Release(const std::string& id, const std::string& language) {
  std::lock_guard lck(mtx_);
  if (auto bucket = sessions_.find(language); bucket != sessions_.end()) {
    if (auto it = bucket->second.find(id); it != bucket->second.end()) {
      it->second->Touch_(Clock::now());
      return;
    }
  }
  spdlog::debug("Release of unknown session ignored: id={} language={}", id, language);
}

bool SessionPool::CloseById(const std::string& id) {
  SessionPtr session;
  {
    std::lock_guard lck(mtx_);
    for (auto& [language, bucket] : sessions_) {
      if (auto it = bucket.find(id); it != bucket.end()) {
        session = std::move(it->second);
        bucket.erase(it);
        break;
      }
    }
  }
  if (!session) return false;
  Teardown_(session, "closed");
  return true;
}

PoolStats SessionPool::Stats() const {
  PoolStats stats{0, {}, config_};
  std::lock_guard lck(mtx_);
  for (auto& [language, bucket] : sessions_) {
    stats.sessions_by_language[language] = bucket.size();
    stats.total_sessions += bucket.size();
  }
  return stats;
}

size_t SessionPool::ReapExpired() {
  std::vector<SessionPtr> expired;
  {
    auto now = Clock::now();
    std::lock_guard lck(mtx_);
    for (auto& [language, bucket] : sessions_) {
      for (auto it = bucket.begin(); it != bucket.end();) {
        if (now - it->second->last_used_at_ > config_.session_timeout) {
          expired.push_back(std::move(it->second));
          it = bucket.erase(it);
        } else {
          ++it;
        }
      }
    }
  }
  for (auto& session : expired) Teardown_(session, "expired");
  return expired.size();
}

void SessionPool::Shutdown() {
  std::call_once(shutdown_once_, [this]() { DoShutdown_(); });
}

void SessionPool::DoShutdown_() {
  {
    std::lock_guard lck(mtx_);
    shutting_down_ = true;
  }
  cv_.notify_all();
  if (reaper_) reaper_->Stop();

  std::vector<SessionPtr> live;
  {
    std::unique_lock lck(mtx_);
    // in-flight creations either commit (and are collected below) or destroy themselves
    cv_.wait(lck, [this]() { return total_reserved_ == 0; });
    for (auto& [language, bucket] : sessions_) {
      for (auto& [id, session] : bucket) live.push_back(std::move(session));
      bucket.clear();
    }
  }
  spdlog::info("Session pool shutting down: closing {} sessions", live.size());
  for (auto& session : live) Teardown_(session, "shutdown");
}

std::optional<SessionPool::Clock::time_point> SessionPool::LastUsedAt(const std::string& id) const {
  std::lock_guard lck(mtx_);
  for (auto& [language, bucket] : sessions_) {
    if (auto it = bucket.find(id); it != bucket.end()) return it->second->last_used_at_;
  }
  return std::nullopt;
}

bool SessionPool::IsShuttingDown() const {
  std::lock_guard lck(mtx_);
  return shutting_down_;
}
