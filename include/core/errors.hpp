#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

/*
    Errors raised by the counting engine. All derive from std::runtime_error so apps can
    catch std::exception at main, while callers that care can branch on the concrete kind.
*/

namespace occ {

// Malformed line/zone definition. Rejected at ingestion, never partially applied
class InvalidGeometry : public std::runtime_error {
public:
  InvalidGeometry(const std::string& counter_id, const std::string& msg)
      : std::runtime_error("Invalid geometry for '" + counter_id + "': " + msg), counter_id_(counter_id) {}

  const std::string& counter_id() const { return counter_id_; }

private:
  std::string counter_id_;
};

// Operation referenced a counter id that is not registered
class UnknownCounterId : public std::runtime_error {
public:
  explicit UnknownCounterId(const std::string& counter_id)
      : std::runtime_error("Unknown counter id '" + counter_id + "'"), counter_id_(counter_id) {}

  const std::string& counter_id() const { return counter_id_; }

private:
  std::string counter_id_;
};

class DuplicateCounterId : public std::runtime_error {
public:
  explicit DuplicateCounterId(const std::string& counter_id)
      : std::runtime_error("Counter id '" + counter_id + "' is already registered"), counter_id_(counter_id) {}

  const std::string& counter_id() const { return counter_id_; }

private:
  std::string counter_id_;
};

// Frame index did not increase. The session stays faulted until reset()
class OutOfOrderFrame : public std::runtime_error {
public:
  OutOfOrderFrame(std::uint64_t frame_index, std::uint64_t last_frame_index)
      : std::runtime_error("Frame " + std::to_string(frame_index) + " is not after frame " +
                           std::to_string(last_frame_index)),
        frame_index_(frame_index), last_frame_index_(last_frame_index) {}

  std::uint64_t frame_index() const { return frame_index_; }
  std::uint64_t last_frame_index() const { return last_frame_index_; }

private:
  std::uint64_t frame_index_;
  std::uint64_t last_frame_index_;
};

// process() called again after an OutOfOrderFrame without a reset()
class SessionFaulted : public std::runtime_error {
public:
  SessionFaulted() : std::runtime_error("Counting session is faulted by an out-of-order frame, reset() required") {}
};

} // namespace occ
