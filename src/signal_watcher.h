#ifndef SIGNAL_WATCHER_H_
#define SIGNAL_WATCHER_H_

#include <signal.h>
#include <atomic>
#include <thread>
#include <vector>
#include <functional>

// Waits on a dedicated thread for one of `signals` and calls on_signal once.
// The constructor blocks the signals in the calling thread; construct it (or
//  block them yourself) before starting other threads so that no thread
//  receives them asynchronously.
class SignalWatcher {
  sigset_t sigset_;
  int wake_signal_;
  std::atomic<bool> stopping_, fired_;
  std::thread thread_;

  void Loop_(std::function<void(int)> on_signal);

 public:
  SignalWatcher(const std::vector<int>& signals, std::function<void(int)> on_signal);
  ~SignalWatcher();
  SignalWatcher(const SignalWatcher&) = delete;
  SignalWatcher& operator=(const SignalWatcher&) = delete;

  // send sig to the watching thread
  void Deliver(int sig);
  // wake the thread without calling on_signal (if it has not fired yet), then join; idempotent
  void Stop();
  bool Fired() const { return fired_; }
};

#endif  // SIGNAL_WATCHER_H_
