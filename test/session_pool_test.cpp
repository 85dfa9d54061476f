#include <set>
#include <thread>
#include <sandpool/utils.h>

#include "utils.h"

namespace {

using namespace std::chrono_literals;

class SessionPoolTest : public ::testing::Test {
 protected:
  std::shared_ptr<FakeProvider> provider;
  std::unique_ptr<SessionPool> pool;

  void MakePool(int max_sessions = 5) {
    provider = std::make_shared<FakeProvider>();
    pool = std::make_unique<SessionPool>(provider, TestPoolConfig(max_sessions));
  }
  void SetUp() override { MakePool(); }
  void TearDown() override {
    if (pool) pool->Shutdown();
  }
};

} // namespace

TEST(SessionPoolConfigTest, RejectsInvalidConfig) {
  EXPECT_THROW(SessionPool(nullptr), std::invalid_argument);
  auto provider = std::make_shared<FakeProvider>();
  EXPECT_THROW(SessionPool(provider, TestPoolConfig(0)), std::invalid_argument);
  EXPECT_THROW(SessionPool(provider, TestPoolConfig(1, -1ms)), std::invalid_argument);
}

TEST_F(SessionPoolTest, CreatesOnMiss) {
  auto session = pool->Acquire("python", {});
  EXPECT_EQ(session->Language(), "python");
  EXPECT_EQ(provider->Created(), 1);
  auto stats = pool->Stats();
  EXPECT_EQ(stats.total_sessions, 1);
  EXPECT_EQ(stats.sessions_by_language["python"], 1);
}

TEST_F(SessionPoolTest, ReusesMatchingSession) {
  auto first = pool->Acquire("python", {"numpy"});
  pool->Release(first->Id(), "python");
  auto second = pool->Acquire("python", {"numpy"});
  EXPECT_EQ(first->Id(), second->Id());
  EXPECT_EQ(provider->Created(), 1);
}

TEST_F(SessionPoolTest, LibraryOrderDoesNotMatter) {
  auto first = pool->Acquire("python", NormalizeLibraries({"pandas", "numpy", "numpy"}));
  auto second = pool->Acquire("python", NormalizeLibraries({" numpy", "pandas "}));
  EXPECT_EQ(first->Id(), second->Id());
  EXPECT_EQ(provider->Created(), 1);
}

TEST_F(SessionPoolTest, DifferentLibrariesOrLanguagesCreateNew) {
  auto a = pool->Acquire("python", {"numpy"});
  auto b = pool->Acquire("python", {});
  auto c = pool->Acquire("javascript", {"numpy"});
  EXPECT_NE(a->Id(), b->Id());
  EXPECT_NE(a->Id(), c->Id());
  EXPECT_EQ(provider->Created(), 3);
  auto stats = pool->Stats();
  EXPECT_EQ(stats.total_sessions, 3);
  EXPECT_EQ(stats.sessions_by_language["python"], 2);
  EXPECT_EQ(stats.sessions_by_language["javascript"], 1);
}

TEST_F(SessionPoolTest, InstallsLibrariesOnCreation) {
  pool->Acquire("python", {"numpy", "pandas"});
  pool->Acquire("python", {});
  auto installs = provider->Installs();
  ASSERT_EQ(installs.size(), 1);
  EXPECT_EQ(installs[0], LibrarySet({"numpy", "pandas"}));
}

TEST_F(SessionPoolTest, InstallFailureKeepsSession) {
  provider->install_exit_code = 1;
  auto session = pool->Acquire("python", {"no-such-package"});
  EXPECT_EQ(session->Libraries(), LibrarySet({"no-such-package"}));
  EXPECT_EQ(pool->Stats().total_sessions, 1);
}

TEST_F(SessionPoolTest, EvictsLeastRecentlyUsed) {
  MakePool(2);
  auto a = pool->Acquire("python", {"a"});
  std::this_thread::sleep_for(2ms);
  auto b = pool->Acquire("python", {"b"});
  std::this_thread::sleep_for(2ms);
  auto c = pool->Acquire("python", {"c"});
  EXPECT_EQ(pool->Stats().total_sessions, 2);
  EXPECT_EQ(provider->DestroyCount(SerialOf(a)), 1);
  EXPECT_EQ(provider->DestroyCount(SerialOf(b)), 0);
  EXPECT_FALSE(pool->LastUsedAt(a->Id()));
  EXPECT_TRUE(pool->LastUsedAt(b->Id()));
  EXPECT_TRUE(pool->LastUsedAt(c->Id()));
}

TEST_F(SessionPoolTest, ReleaseRefreshesRecency) {
  MakePool(2);
  auto a = pool->Acquire("python", {"a"});
  std::this_thread::sleep_for(2ms);
  auto b = pool->Acquire("python", {"b"});
  std::this_thread::sleep_for(2ms);
  pool->Release(a->Id(), "python");
  auto c = pool->Acquire("python", {"c"});
  EXPECT_EQ(provider->DestroyCount(SerialOf(a)), 0);
  EXPECT_EQ(provider->DestroyCount(SerialOf(b)), 1);
}

TEST_F(SessionPoolTest, ReleaseMovesLastUsedForward) {
  auto a = pool->Acquire("python", {});
  auto before = pool->LastUsedAt(a->Id());
  ASSERT_TRUE(before);
  std::this_thread::sleep_for(2ms);
  pool->Release(a->Id(), "python");
  auto after = pool->LastUsedAt(a->Id());
  ASSERT_TRUE(after);
  EXPECT_GT(*after, *before);
}

TEST_F(SessionPoolTest, ReleaseOfUnknownSessionIsNoop) {
  pool->Release("does-not-exist", "python");
  pool->Release("does-not-exist", "klingon");
  EXPECT_EQ(pool->Stats().total_sessions, 0);
}

TEST_F(SessionPoolTest, PreferredSessionIsReused) {
  auto a = pool->Acquire("python", {"x"});
  auto b = pool->Acquire("python", {"x"}, a->Id());
  EXPECT_EQ(a->Id(), b->Id());
  EXPECT_EQ(provider->Created(), 1);
}

TEST_F(SessionPoolTest, PreferredSessionReplacedOnLibraryChange) {
  auto a = pool->Acquire("python", {"x"});
  auto b = pool->Acquire("python", {"y"}, a->Id());
  EXPECT_NE(a->Id(), b->Id());
  EXPECT_EQ(b->Libraries(), LibrarySet({"y"}));
  EXPECT_EQ(provider->DestroyCount(SerialOf(a)), 1);
  EXPECT_EQ(pool->Stats().total_sessions, 1);
  EXPECT_FALSE(pool->CloseById(a->Id()));
}

TEST_F(SessionPoolTest, UnknownPreferredSessionFallsBackToMatch) {
  auto a = pool->Acquire("python", {});
  auto b = pool->Acquire("python", {}, "not-a-session");
  EXPECT_EQ(a->Id(), b->Id());
}

TEST_F(SessionPoolTest, SessionIdsAreUnique) {
  std::set<std::string> ids;
  for (int i = 0; i < 5; i++) ids.insert(pool->Acquire("go", {"lib" + std::to_string(i)})->Id());
  EXPECT_EQ(ids.size(), 5);
}

TEST_F(SessionPoolTest, CloseById) {
  auto a = pool->Acquire("python", {});
  EXPECT_TRUE(pool->CloseById(a->Id()));
  EXPECT_FALSE(pool->CloseById(a->Id()));
  EXPECT_EQ(provider->DestroyCount(SerialOf(a)), 1);
  EXPECT_EQ(pool->Stats().total_sessions, 0);
}

TEST_F(SessionPoolTest, CreationFailureLeavesNoEntry) {
  MakePool(1);
  provider->fail_create = true;
  EXPECT_THROW(pool->Acquire("python", {}), ProviderCreationError);
  EXPECT_EQ(pool->Stats().total_sessions, 0);
  // the reserved slot must have been given back
  provider->fail_create = false;
  auto a = pool->Acquire("python", {});
  EXPECT_EQ(pool->Stats().total_sessions, 1);
  EXPECT_EQ(provider->Destroyed(), 0);
}

TEST_F(SessionPoolTest, ShutdownClosesEverySessionOnce) {
  auto a = pool->Acquire("python", {});
  auto b = pool->Acquire("cpp", {});
  pool->Shutdown();
  pool->Shutdown();
  EXPECT_TRUE(pool->IsShuttingDown());
  EXPECT_EQ(provider->DestroyCount(SerialOf(a)), 1);
  EXPECT_EQ(provider->DestroyCount(SerialOf(b)), 1);
  EXPECT_EQ(pool->Stats().total_sessions, 0);
  pool.reset();
  EXPECT_EQ(provider->Destroyed(), 2);
}

TEST_F(SessionPoolTest, FailedTeardownStillRemovesSession) {
  MakePool(2);
  provider->fail_destroy = true;
  auto a = pool->Acquire("python", {"a"});
  std::this_thread::sleep_for(2ms);
  auto b = pool->Acquire("python", {"b"});
  std::this_thread::sleep_for(2ms);
  // eviction of a goes ahead even though its teardown fails
  auto c = pool->Acquire("python", {"c"});
  EXPECT_EQ(c->Libraries(), LibrarySet({"c"}));
  EXPECT_EQ(provider->DestroyCount(SerialOf(a)), 1);
  EXPECT_FALSE(pool->LastUsedAt(a->Id()));
  EXPECT_EQ(pool->Stats().total_sessions, 2);

  EXPECT_TRUE(pool->CloseById(b->Id()));
  EXPECT_FALSE(pool->LastUsedAt(b->Id()));
  EXPECT_FALSE(pool->CloseById(b->Id()));
  EXPECT_EQ(provider->DestroyCount(SerialOf(b)), 1);

  EXPECT_NO_THROW(pool->Shutdown());
  EXPECT_EQ(provider->DestroyCount(SerialOf(c)), 1);
  EXPECT_EQ(pool->Stats().total_sessions, 0);
}

TEST_F(SessionPoolTest, AcquireAfterShutdownFails) {
  pool->Shutdown();
  EXPECT_THROW(pool->Acquire("python", {}), PoolShutdownError);
  EXPECT_EQ(provider->Created(), 0);
}

TEST_F(SessionPoolTest, ConcurrentAcquiresNeverExceedCapacity) {
  MakePool(3);
  provider->create_delay = 20ms;
  std::vector<std::thread> threads;
  std::atomic<int> failures = 0;
  for (int i = 0; i < 12; i++) {
    threads.emplace_back([&, i]() {
      try {
        auto session = pool->Acquire("python", {"lib" + std::to_string(i % 6)});
        pool->Release(session->Id(), "python");
      } catch (std::exception&) {
        failures++;
      }
    });
  }
  for (auto& i : threads) i.join();
  EXPECT_EQ(failures, 0);
  EXPECT_LE(pool->Stats().total_sessions, 3);
  EXPECT_LE(provider->MaxLive(), 3);
}

TEST_F(SessionPoolTest, WaitsWhileAllSlotsAreBeingCreated) {
  MakePool(1);
  provider->HoldCreates();
  SessionPool::SessionPtr first, second;
  std::thread t1([&]() { first = pool->Acquire("python", {"a"}); });
  ASSERT_TRUE(provider->WaitForPendingCreates(1));
  std::thread t2([&]() { second = pool->Acquire("python", {"b"}); });
  std::this_thread::sleep_for(50ms);
  // t2 cannot evict anything while the only slot is reserved
  EXPECT_EQ(provider->Created(), 0);
  provider->ReleaseCreates();
  t1.join();
  t2.join();
  ASSERT_TRUE(first && second);
  EXPECT_NE(first->Id(), second->Id());
  EXPECT_EQ(provider->Created(), 2);
  EXPECT_EQ(provider->DestroyCount(SerialOf(first)), 1);
  EXPECT_EQ(pool->Stats().total_sessions, 1);
}

TEST_F(SessionPoolTest, ShutdownWaitsForInFlightCreation) {
  provider->HoldCreates();
  bool acquire_rejected = false;
  std::thread acquirer([&]() {
    try {
      pool->Acquire("python", {});
    } catch (PoolShutdownError&) {
      acquire_rejected = true;
    }
  });
  ASSERT_TRUE(provider->WaitForPendingCreates(1));
  std::atomic<bool> shutdown_done = false;
  std::thread stopper([&]() {
    pool->Shutdown();
    shutdown_done = true;
  });
  std::this_thread::sleep_for(50ms);
  EXPECT_FALSE(shutdown_done);
  provider->ReleaseCreates();
  acquirer.join();
  stopper.join();
  EXPECT_TRUE(acquire_rejected);
  EXPECT_EQ(provider->Created(), 1);
  EXPECT_EQ(provider->Destroyed(), 1);
  EXPECT_EQ(pool->Stats().total_sessions, 0);
}
