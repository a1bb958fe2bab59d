#pragma once

#include <cstdint>
#include <mutex>
#include <optional>
#include <utility>

/*
    LatestStore holds only the newest value written to it.

    The counting stage publishes a CountSnapshot after every processed frame. Readers (the dashboard,
    the CSV export at shutdown) only ever want the current counts, never a backlog of old ones, so
    a writer overwrites and a reader copies out whatever is newest. version() lets a reader skip
    redrawing when nothing changed.
*/

namespace occ {

template <typename T>
class LatestStore {
public:
  LatestStore() = default;

  LatestStore(const LatestStore&) = delete;
  LatestStore& operator=(const LatestStore&) = delete;

  void write(T value) {
    std::lock_guard<std::mutex> lock(mu_);
    latest_ = std::move(value);
    has_value_ = true;
    ++version_;
  }

  std::optional<T> read_latest() const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_) return std::nullopt;
    return latest_;
  }

  // Newest value only if it is newer than 'seen_version'; updates seen_version
  std::optional<T> read_if_newer(std::uint64_t& seen_version) const {
    std::lock_guard<std::mutex> lock(mu_);
    if (!has_value_ || version_ == seen_version) return std::nullopt;
    seen_version = version_;
    return latest_;
  }

  std::uint64_t version() const {
    std::lock_guard<std::mutex> lock(mu_);
    return version_;
  }

  bool has_value() const {
    std::lock_guard<std::mutex> lock(mu_);
    return has_value_;
  }

private:
  mutable std::mutex mu_;
  T latest_{};
  bool has_value_{false};
  std::uint64_t version_{0};
};

} // namespace occ
