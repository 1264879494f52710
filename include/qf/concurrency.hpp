#pragma once

#include <condition_variable>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "qf/model.hpp"

namespace qf {

// Shared transaction ID counter. next() hands each caller the exact
// pre-increment value; the counter wraps silently at 2^16.
class TxIdAllocator {
public:
  explicit TxIdAllocator(std::uint16_t start = 0) : next_(start) {}

  std::uint16_t next();

private:
  std::mutex mtx_;
  std::uint16_t next_;
};

// Unbounded multi-producer / single-consumer queue of status events.
// Events pushed by one thread are popped in the order they were pushed.
class EventChannel {
public:
  void push(const StatusEvent& ev);

  // Blocks until an event is available
  StatusEvent pop();

  // Non-blocking variant; nullopt when the queue is empty
  std::optional<StatusEvent> try_pop();

  std::size_t size() const;

private:
  mutable std::mutex mtx_;
  std::condition_variable cv_;
  std::deque<StatusEvent> q_;
};

} // namespace qf
