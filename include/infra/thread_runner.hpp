#pragma once
#include <atomic>
#include <functional>
#include <mutex>
#include <string>
#include <thread>

#include "infra/stop_token.hpp"

/*
    ThreadRunner owns one worker thread for one pipeline stage. It provides:
        - Consistent start/stop/join behavior
        - A local_stop flag for stopping this worker only
        - Read-only access to a global_stop flag for whole-pipeline shutdown
        - Capture of an exception escaping the worker, so the owner can notice and shut down
*/

namespace occ {

class ThreadRunner {
public:
  // Any callable that takes a global stop token and a local stop flag, and returns nothing
  using Fn = std::function<void(const StopToken&, const std::atomic_bool&)>;

  ThreadRunner() = default;
  explicit ThreadRunner(std::string name);

  // Remove copy/move
  ThreadRunner(const ThreadRunner&) = delete;
  ThreadRunner& operator=(const ThreadRunner&) = delete;

  ~ThreadRunner();

  // Throws if already started
  void start(StopToken global_stop, Fn fn);

  // Request this specific thread to stop. Does NOT affect other threads
  void request_stop();
  // Returns true if either global or local stop flags are true
  bool stop_requested() const;

  void join();
  bool joinable() const;

  // True once the worker function has returned or thrown
  bool finished() const { return finished_.load(std::memory_order_acquire); }
  bool failed() const { return failed_.load(std::memory_order_acquire); }
  std::string error() const;

  const std::string& name() const { return name_; }

private:
  std::thread thread_;
  std::atomic_bool local_stop_{false};    // Stops this thread only
  StopToken global_stop_{};               // View of the app's StopSource
  std::string name_{"thread"};

  std::atomic_bool finished_{false};
  std::atomic_bool failed_{false};
  mutable std::mutex error_mu_;
  std::string error_;
};

} // namespace occ
