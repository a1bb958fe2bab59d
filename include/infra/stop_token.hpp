#pragma once
#include <atomic>
#include <mutex>
#include <string>

/*
    Cooperative shutdown for the replay pipeline.

    The app owns one StopSource. Any party may end the run through it: the signal handler loop on
    Ctrl-C, the app when the replay drains, or a stage whose loop threw. Each request carries a reason;
    the first one is kept so the app can report why the pipeline stopped.

    Stage threads only get a StopToken, a read-only view of the same flag, next to the local flag their
    ThreadRunner owns. A stage loop exits when either is set.
*/

namespace occ {

class StopToken {
public:
  StopToken() = default;
  explicit StopToken(const std::atomic_bool* flag) : flag_(flag) {}

  bool stop_requested() const {
    return flag_ && flag_->load(std::memory_order_acquire);
  }

private:
  const std::atomic_bool* flag_ = nullptr;
};

class StopSource {
public:
  StopSource() = default;

  StopSource(const StopSource&) = delete;
  StopSource& operator=(const StopSource&) = delete;

  StopToken token() const { return StopToken(&stop_); }

  // Later requests keep the first reason
  void request_stop(const std::string& reason = "stop requested") {
    std::lock_guard<std::mutex> lock(mu_);
    if (stop_.load(std::memory_order_relaxed)) return;
    reason_ = reason;
    stop_.store(true, std::memory_order_release);
  }

  bool stop_requested() const { return stop_.load(std::memory_order_acquire); }

  // Empty until a stop was requested
  std::string reason() const {
    std::lock_guard<std::mutex> lock(mu_);
    return reason_;
  }

private:
  std::atomic_bool stop_{false};
  mutable std::mutex mu_;
  std::string reason_;
};

} // namespace occ
