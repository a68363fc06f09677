#include "parley/saga/event_queue.hpp"

#include <iostream>

namespace parley::saga {

SagaEventQueue::SagaEventQueue(const std::size_t capacity) : capacity_(capacity) {}

bool SagaEventQueue::push(SagaEvent event) {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!closed_ && events_.size() < capacity_) {
      events_.push_back(std::move(event));
      cv_.notify_one();
      return true;
    }
    ++dropped_;
  }
  std::cerr << "[saga] event queue full, dropped " << to_string(event.type)
            << " saga=" << event.saga_id << "\n";
  return false;
}

std::optional<SagaEvent> SagaEventQueue::pop() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::optional<SagaEvent> SagaEventQueue::pop_for(const std::chrono::milliseconds timeout) {
  std::unique_lock<std::mutex> lock(mutex_);
  cv_.wait_for(lock, timeout, [this] { return closed_ || !events_.empty(); });
  if (events_.empty()) {
    return std::nullopt;
  }
  auto event = std::move(events_.front());
  events_.pop_front();
  return event;
}

std::vector<SagaEvent> SagaEventQueue::drain() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<SagaEvent> out(std::make_move_iterator(events_.begin()),
                             std::make_move_iterator(events_.end()));
  events_.clear();
  return out;
}

void SagaEventQueue::close() {
  std::lock_guard<std::mutex> lock(mutex_);
  closed_ = true;
  cv_.notify_all();
}

std::size_t SagaEventQueue::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_.size();
}

std::uint64_t SagaEventQueue::dropped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return dropped_;
}

} // namespace parley::saga
