#include "signal_watcher.h"

#include <cstring>
#include <stdexcept>
#include <spdlog/spdlog.h>

SignalWatcher::SignalWatcher(const std::vector<int>& signals, std::function<void(int)> on_signal) :
    stopping_(false), fired_(false) {
  if (signals.empty()) throw std::invalid_argument("no signals to watch");
  wake_signal_ = signals[0];
  sigemptyset(&sigset_);
  for (int sig : signals) sigaddset(&sigset_, sig);
  if (int ret = pthread_sigmask(SIG_BLOCK, &sigset_, nullptr); ret != 0) {
    throw std::runtime_error(std::string("pthread_sigmask: ") + strerror(ret));
  }
  thread_ = std::thread(&SignalWatcher::Loop_, this, std::move(on_signal));
}

SignalWatcher::~SignalWatcher() {
  Stop();
}

void SignalWatcher::Loop_(std::function<void(int)> on_signal) {
  int sig = 0;
  if (int ret = sigwait(&sigset_, &sig); ret != 0) {
    spdlog::error("sigwait failed: {}", strerror(ret));
    return;
  }
  if (stopping_) return;
  fired_ = true;
  spdlog::warn("Received signal {}, shutting down", sig);
  on_signal(sig);
}

void SignalWatcher::Deliver(int sig) {
  if (!thread_.joinable()) return;
  if (int ret = pthread_kill(thread_.native_handle(), sig); ret != 0) {
    spdlog::error("pthread_kill failed: {}", strerror(ret));
  }
}

void SignalWatcher::Stop() {
  if (!thread_.joinable()) return;
  stopping_ = true;
  // the signal stays blocked, so an exiting thread simply discards it
  if (!fired_) Deliver(wake_signal_);
  thread_.join();
}
