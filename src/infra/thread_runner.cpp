#include "infra/thread_runner.hpp"

#include <iostream>
#include <stdexcept>
#include <utility>

namespace occ {

ThreadRunner::ThreadRunner(std::string name) : name_(std::move(name)) {}

// Destructor safely stops thread on death
ThreadRunner::~ThreadRunner() {
  request_stop();
  if (thread_.joinable()) thread_.join();
}

void ThreadRunner::start(StopToken global_stop, Fn fn) {
  if (thread_.joinable()) {
    throw std::runtime_error("ThreadRunner '" + name_ + "' already started");
  }

  local_stop_.store(false, std::memory_order_relaxed);
  finished_.store(false, std::memory_order_release);
  failed_.store(false, std::memory_order_release);
  global_stop_ = global_stop;

  thread_ = std::thread([this, fn = std::move(fn)]() mutable {
    try {
      fn(global_stop_, local_stop_);
    } catch (const std::exception& e) {
      {
        std::lock_guard<std::mutex> lock(error_mu_);
        error_ = e.what();
      }
      std::cerr << name_ << " failed: " << e.what() << std::endl;
      failed_.store(true, std::memory_order_release);
    }
    finished_.store(true, std::memory_order_release);
  });
}

void ThreadRunner::request_stop() {
  local_stop_.store(true, std::memory_order_relaxed);
}

bool ThreadRunner::stop_requested() const {
  return global_stop_.stop_requested() || local_stop_.load(std::memory_order_relaxed);
}

void ThreadRunner::join() {
  if (thread_.joinable()) thread_.join();
}

bool ThreadRunner::joinable() const {
  return thread_.joinable();
}

std::string ThreadRunner::error() const {
  std::lock_guard<std::mutex> lock(error_mu_);
  return error_;
}

} // namespace occ
