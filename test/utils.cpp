#include "utils.h"

#include <thread>
#include <algorithm>

FakeProvider::FakeProvider() :
    next_serial_(0), live_(0), max_live_(0), pending_creates_(0), hold_creates_(false),
    runs_on_destroyed_(0), fail_create(false), install_exit_code(0), fail_destroy(false),
    create_delay(0) {}

std::unique_ptr<SandboxHandle> FakeProvider::Create(
    const std::string& language, const LibrarySet&) {
  {
    std::unique_lock lck(mtx_);
    pending_creates_++;
    cv_.notify_all();
    cv_.wait(lck, [this]() { return !hold_creates_; });
    pending_creates_--;
  }
  if (create_delay.count()) std::this_thread::sleep_for(create_delay);
  if (fail_create) throw ProviderError("create refused");
  std::lock_guard lck(mtx_);
  live_++;
  max_live_ = std::max(max_live_, live_);
  return std::make_unique<FakeHandle>(++next_serial_, language);
}

InstallOutput FakeProvider::InstallLibraries(SandboxHandle&, const LibrarySet& libraries) {
  {
    std::lock_guard lck(mtx_);
    installs_.push_back(libraries);
  }
  InstallOutput ret;
  ret.exit_code = install_exit_code;
  if (ret.exit_code) ret.std_err = "no such package";
  return ret;
}

RunOutput FakeProvider::Run(SandboxHandle& handle, const std::string& code) {
  auto& fake = dynamic_cast<FakeHandle&>(handle);
  RunOutput ret;
  {
    std::lock_guard lck(mtx_);
    if (fake.destroyed) {
      runs_on_destroyed_++;
      throw ProviderError("no such container");
    }
  }
  if (code == "hang") {
    std::unique_lock lck(mtx_);
    cv_.wait(lck, [&]() { return fake.destroyed; });
    throw ProviderError("container removed");
  }
  if (code == "fail") throw ProviderError("exec failed");
  if (code.compare(0, 6, "sleep:") == 0) {
    std::unique_lock lck(mtx_);
    if (cv_.wait_for(lck, std::chrono::milliseconds(std::stoi(code.substr(6))),
                     [&]() { return fake.destroyed; })) {
      throw ProviderError("container removed");
    }
    ret.std_out = code + "\n";
    return ret;
  }
  if (code.compare(0, 5, "exit:") == 0) {
    ret.exit_code = std::stoi(code.substr(5));
    ret.std_err = "boom";
    return ret;
  }
  ret.std_out = code + "\n";
  return ret;
}

void FakeProvider::Destroy(SandboxHandle& handle) {
  auto& fake = dynamic_cast<FakeHandle&>(handle);
  {
    std::lock_guard lck(mtx_);
    if (!fake.destroyed) live_--;
    fake.destroyed = true;
    destroy_counts_[fake.serial]++;
  }
  cv_.notify_all();
  if (fail_destroy) throw ProviderError("destroy refused");
}

void FakeProvider::HoldCreates() {
  std::lock_guard lck(mtx_);
  hold_creates_ = true;
}

void FakeProvider::ReleaseCreates() {
  {
    std::lock_guard lck(mtx_);
    hold_creates_ = false;
  }
  cv_.notify_all();
}

bool FakeProvider::WaitForPendingCreates(int count, std::chrono::milliseconds timeout) {
  std::unique_lock lck(mtx_);
  return cv_.wait_for(lck, timeout, [&]() { return pending_creates_ >= count; });
}

int FakeProvider::Created() const {
  std::lock_guard lck(mtx_);
  return next_serial_;
}

int FakeProvider::Destroyed() const {
  std::lock_guard lck(mtx_);
  int ret = 0;
  for (auto& [serial, cnt] : destroy_counts_) ret += cnt;
  return ret;
}

int FakeProvider::DestroyCount(int serial) const {
  std::lock_guard lck(mtx_);
  auto it = destroy_counts_.find(serial);
  return it == destroy_counts_.end() ? 0 : it->second;
}

int FakeProvider::MaxLive() const {
  std::lock_guard lck(mtx_);
  return max_live_;
}

int FakeProvider::RunsOnDestroyed() const {
  std::lock_guard lck(mtx_);
  return runs_on_destroyed_;
}

std::vector<LibrarySet> FakeProvider::Installs() const {
  std::lock_guard lck(mtx_);
  return installs_;
}

int SerialOf(const SessionPool::SessionPtr& session) {
  return dynamic_cast<FakeHandle&>(session->Handle()).serial;
}

PoolConfig TestPoolConfig(int max_sessions, std::chrono::milliseconds session_timeout,
                          std::chrono::milliseconds cleanup_interval) {
  PoolConfig config;
  config.max_sessions_per_language = max_sessions;
  config.session_timeout = session_timeout;
  config.cleanup_interval = cleanup_interval;
  return config;
}
