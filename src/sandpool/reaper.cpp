#include "reaper.h"

#include <spdlog/spdlog.h>
#include <sandpool/session_pool.h>

IdleReaper::IdleReaper(SessionPool& pool, std::chrono::milliseconds interval) :
    pool_(pool), interval_(interval), stop_(false) {}

IdleReaper::~IdleReaper() {
  Stop();
}

void IdleReaper::Start() {
  std::lock_guard lck(mtx_);
  if (thr_.joinable() || stop_) return;
  thr_ = std::thread(&IdleReaper::Loop_, this);
}

void IdleReaper::Stop() {
  {
    std::lock_guard lck(mtx_);
    stop_ = true;
  }
  cv_.notify_all();
  if (thr_.joinable() && thr_.get_id() != std::this_thread::get_id()) thr_.join();
}

void IdleReaper::Loop_() {
  spdlog::debug("Idle reaper started: interval={}ms", interval_.count());
  std::unique_lock lck(mtx_);
  while (true) {
    if (cv_.wait_for(lck, interval_, [this]() { return stop_; })) break;
    lck.unlock();
    try {
      size_t reaped = pool_.ReapExpired();
      if (reaped) spdlog::info("Idle reaper reclaimed {} sessions", reaped);
    } catch (std::exception& err) {
      spdlog::error("Idle reaper error: {}", err.what());
    }
    lck.lock();
  }
  spdlog::debug("Idle reaper stopped");
}
