#pragma once

#include "parley/saga/types.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <vector>

namespace parley::saga {

/// Bounded event buffer. Producers never block: a full queue drops the event.
class SagaEventQueue {
public:
  explicit SagaEventQueue(std::size_t capacity);

  /// False when the event was dropped.
  bool push(SagaEvent event);
  [[nodiscard]] std::optional<SagaEvent> pop();
  /// Waits up to `timeout` for an event. Returns nullopt on timeout or after close().
  [[nodiscard]] std::optional<SagaEvent> pop_for(std::chrono::milliseconds timeout);
  [[nodiscard]] std::vector<SagaEvent> drain();
  void close();

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] std::size_t capacity() const { return capacity_; }
  [[nodiscard]] std::uint64_t dropped() const;

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::deque<SagaEvent> events_;
  std::uint64_t dropped_ = 0;
  bool closed_ = false;
};

} // namespace parley::saga
