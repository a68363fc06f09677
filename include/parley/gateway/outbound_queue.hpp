#pragma once

#include "parley/gateway/transport.hpp"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <mutex>
#include <optional>

namespace parley::gateway {

/// Bounded frame queue between producers and a connection's writer thread.
/// After close() the remaining frames are still handed out, then Closed.
class OutboundQueue {
public:
  enum class PopStatus { Frame, Timeout, Closed };

  struct PopResult {
    PopStatus status = PopStatus::Timeout;
    std::optional<gateway::Frame> frame;
  };

  explicit OutboundQueue(std::size_t capacity);

  /// False when the queue is full or closed; the frame is not queued.
  [[nodiscard]] bool push(gateway::Frame frame);
  /// Waits for room until `deadline`. False on timeout or close; the frame is not queued.
  [[nodiscard]] bool push_wait(gateway::Frame frame,
                               std::chrono::steady_clock::time_point deadline);
  [[nodiscard]] PopResult pop_until(std::chrono::steady_clock::time_point deadline);
  void close();

  [[nodiscard]] bool closed() const;
  [[nodiscard]] std::size_t size() const;

private:
  std::size_t capacity_;
  mutable std::mutex mutex_;
  std::condition_variable cv_;
  std::condition_variable space_cv_;
  std::deque<gateway::Frame> frames_;
  bool closed_ = false;
};

} // namespace parley::gateway
