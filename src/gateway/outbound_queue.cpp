#include "parley/gateway/outbound_queue.hpp"

namespace parley::gateway {

OutboundQueue::OutboundQueue(const std::size_t capacity) : capacity_(capacity) {}

bool OutboundQueue::push(Frame frame) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (closed_ || frames_.size() >= capacity_) {
    return false;
  }
  frames_.push_back(std::move(frame));
  cv_.notify_one();
  return true;
}

bool OutboundQueue::push_wait(Frame frame,
                              const std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  space_cv_.wait_until(lock, deadline,
                       [this] { return closed_ || frames_.size() < capacity_; });
  if (closed_ || frames_.size() >= capacity_) {
    return false;
  }
  frames_.push_back(std::move(frame));
  cv_.notify_one();
  return true;
}

OutboundQueue::PopResult
OutboundQueue::pop_until(const std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_until(lock, deadline, [this] { return closed_ || !frames_.empty(); });
  if (!frames_.empty()) {
    PopResult result{PopStatus::Frame, std::move(frames_.front())};
    frames_.pop_front();
    space_cv_.notify_one();
    return result;
  }
  return PopResult{closed_ ? PopStatus::Closed : PopStatus::Timeout, std::nullopt};
}

void OutboundQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  cv_.notify_all();
  space_cv_.notify_all();
}

bool OutboundQueue::closed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return closed_;
}

std::size_t OutboundQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return frames_.size();
}

} // namespace parley::gateway
