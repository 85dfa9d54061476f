#ifndef TEST_UTILS_H_
#define TEST_UTILS_H_

#include <map>
#include <mutex>
#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include <condition_variable>

#include <gtest/gtest.h>
#include <sandpool/errors.h>
#include <sandpool/provider.h>
#include <sandpool/session_pool.h>

class FakeHandle : public SandboxHandle {
 public:
  const int serial;
  const std::string language;
  bool destroyed; // guarded by the provider's mutex
  FakeHandle(int serial, std::string language) :
      serial(serial), language(std::move(language)), destroyed(false) {}
  std::string Describe() const override { return "fake #" + std::to_string(serial); }
};

// In-memory provider. Run understands a few magic programs:
//  "hang"    blocks until the handle is destroyed, then throws
//  "fail"    throws ProviderError
//  "sleep:MS" echoes after MS milliseconds, or throws if destroyed meanwhile
//  "exit:N"  exits with status N and writes "boom" to stderr
// anything else echoes the program to stdout and exits with 0.
class FakeProvider : public SandboxProvider {
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  int next_serial_;
  int live_, max_live_;
  int pending_creates_;
  bool hold_creates_;
  std::map<int, int> destroy_counts_;
  std::vector<LibrarySet> installs_;
  int runs_on_destroyed_;

 public:
  std::atomic<bool> fail_create;
  std::atomic<int> install_exit_code;
  // Destroy still releases the handle but then throws
  std::atomic<bool> fail_destroy;
  std::chrono::milliseconds create_delay;

  FakeProvider();

  std::unique_ptr<SandboxHandle> Create(
      const std::string& language, const LibrarySet& libraries) override;
  InstallOutput InstallLibraries(SandboxHandle&, const LibrarySet& libraries) override;
  RunOutput Run(SandboxHandle&, const std::string& code) override;
  void Destroy(SandboxHandle&) override;

  // Create blocks until ReleaseCreates
  void HoldCreates();
  void ReleaseCreates();
  bool WaitForPendingCreates(int count, std::chrono::milliseconds timeout = std::chrono::seconds(5));

  int Created() const;
  int Destroyed() const;
  int DestroyCount(int serial) const;
  int MaxLive() const;
  // Run calls that were handed an already destroyed handle
  int RunsOnDestroyed() const;
  std::vector<LibrarySet> Installs() const;
};

int SerialOf(const SessionPool::SessionPtr&);

PoolConfig TestPoolConfig(int max_sessions = 5,
                          std::chrono::milliseconds session_timeout = std::chrono::seconds(300),
                          std::chrono::milliseconds cleanup_interval = std::chrono::milliseconds(0));

// poll until pred() holds or the timeout elapses
template <class Pred>
bool WaitFor(Pred&& pred, std::chrono::milliseconds timeout = std::chrono::seconds(5)) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (!pred()) {
    if (std::chrono::steady_clock::now() > deadline) return false;
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  return true;
}

#endif // TEST_UTILS_H_
