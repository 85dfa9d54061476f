#include <sandpool/session.h>

#include <sandpool/provider.h>

PooledSession::PooledSession(
    std::string id, std::string language, LibrarySet libraries,
    std::unique_ptr<SandboxHandle> handle, Clock::time_point now, long sequence) :
    id_(std::move(id)),
    language_(std::move(language)),
    libraries_(std::move(libraries)),
    handle_(std::move(handle)),
    created_at_(now),
    created_wall_(std::chrono::system_clock::now()),
    sequence_(sequence),
    last_used_at_(now) {}

PooledSession::~PooledSession() = default;

void PooledSession::Touch_(Clock::time_point now) {
  if (now > last_used_at_) last_used_at_ = now;
}

double PooledSession::CreatedAtUnix() const {
  return std::chrono::duration<double>(created_wall_.time_since_epoch()).count();
}
