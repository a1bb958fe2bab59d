#pragma once

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <utility>

#include "core/config.hpp" // For queue config

/*
    Bounded hand-off queue between two stages. Capacity is fixed; when full the DropPolicy decides:
    DropOldest evicts the head, DropNewest rejects the item, Block makes push_for wait for space.
    close() marks end of stream: pushes are rejected and consumers drain what is left.
*/

namespace occ {

template <typename T>
class BoundedQueue {
public:
  explicit BoundedQueue(std::size_t capacity, DropPolicy policy): capacity_(capacity), policy_(policy) {}

  // No copy/move
  BoundedQueue(const BoundedQueue&) = delete;
  BoundedQueue& operator=(const BoundedQueue&) = delete;

  // Never waits. Under Block policy a full queue rejects like DropNewest
  bool try_push(T item) {
    std::unique_lock<std::mutex> lock(mu_);

    ++pushes_;

    if (closed_ || capacity_ == 0) {
      ++drops_;
      return false;
    }

    if (q_.size() >= capacity_) {
      if (policy_ != DropPolicy::DropOldest) {
        ++drops_;
        return false;
      }
      q_.pop_front();
      ++drops_;
    }

    q_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  // Waits up to timeout for space under Block policy, otherwise behaves like try_push
  template <typename Rep, typename Period>
  bool push_for(T item, const std::chrono::duration<Rep, Period>& timeout) {
    if (policy_ != DropPolicy::Block) return try_push(std::move(item));

    std::unique_lock<std::mutex> lock(mu_);
    if (!not_full_.wait_for(lock, timeout, [&] { return closed_ || q_.size() < capacity_; })) return false;

    ++pushes_;
    if (closed_) {
      ++drops_;
      return false;
    }

    q_.push_back(std::move(item));
    lock.unlock();
    not_empty_.notify_one();
    return true;
  }

  bool try_pop(T& out) {
    std::unique_lock<std::mutex> lock(mu_);

    if (q_.empty()) return false;

    out = std::move(q_.front());
    q_.pop_front();
    ++pops_;

    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  // Timeout variant of Pop function
  template <typename Rep, typename Period>
  bool try_pop_for(T& out, const std::chrono::duration<Rep, Period>& timeout) {
    std::unique_lock<std::mutex> lock(mu_);
    if (!not_empty_.wait_for(lock, timeout, [&] { return !q_.empty() || closed_; })) return false;
    if (q_.empty()) return false;

    out = std::move(q_.front());
    q_.pop_front();
    ++pops_;

    lock.unlock();
    not_full_.notify_one();
    return true;
  }

  void close() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      closed_ = true;
    }
    not_empty_.notify_all();
    not_full_.notify_all();
  }

  // Closed and fully drained
  bool finished() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_ && q_.empty();
  }

  void clear() {
    {
      std::lock_guard<std::mutex> lock(mu_);
      q_.clear();
    }
    not_full_.notify_all();
  }

  // Getters

  std::size_t size() const {
    std::lock_guard<std::mutex> lock(mu_);
    return q_.size();
  }

  std::size_t capacity() const { return capacity_; }

  DropPolicy policy() const { return policy_; }

  bool closed() const {
    std::lock_guard<std::mutex> lock(mu_);
    return closed_;
  }

  std::uint64_t pushes_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pushes_;
  }

  std::uint64_t pops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return pops_;
  }

  std::uint64_t drops_total() const {
    std::lock_guard<std::mutex> lock(mu_);
    return drops_;
  }

private:
  const std::size_t capacity_;
  const DropPolicy policy_;

  mutable std::mutex mu_;
  std::condition_variable not_empty_;
  std::condition_variable not_full_;
  std::deque<T> q_;
  bool closed_{false};

  std::uint64_t pushes_{0};
  std::uint64_t pops_{0};
  std::uint64_t drops_{0};
};

} // namespace occ
