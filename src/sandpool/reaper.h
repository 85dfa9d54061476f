#ifndef SANDPOOL_REAPER_H_
#define SANDPOOL_REAPER_H_

#include <mutex>
#include <chrono>
#include <thread>
#include <condition_variable>

class SessionPool;

// Background thread calling SessionPool::ReapExpired every interval.
// Stop() wakes it immediately and joins; after Stop() returns no tick is running.
class IdleReaper {
  SessionPool& pool_;
  const std::chrono::milliseconds interval_;
  std::mutex mtx_;
  std::condition_variable cv_;
  bool stop_;
  std::thread thr_;

  void Loop_();

 public:
  IdleReaper(SessionPool& pool, std::chrono::milliseconds interval);
  ~IdleReaper();

  void Start();
  void Stop();
};

#endif  // SANDPOOL_REAPER_H_
