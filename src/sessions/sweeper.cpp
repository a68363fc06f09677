#include "parley/sessions/sweeper.hpp"

#include "parley/observability/global.hpp"

#include <algorithm>
#include <iostream>

namespace parley::sessions {

SessionSweeper::SessionSweeper(ISessionStore &store, SweeperConfig config)
    : store_(store), config_(config) {}

SessionSweeper::~SessionSweeper() { stop(); }

void SessionSweeper::start() {
  if (running_) {
    return;
  }
  running_ = true;
  thread_ = std::thread([this]() { run_loop(); });
}

void SessionSweeper::stop() {
  running_ = false;
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool SessionSweeper::is_running() const { return running_; }

common::Result<std::size_t> SessionSweeper::sweep_once(const common::Timestamp now) {
  auto expired = store_.expire_sessions(now);
  if (!expired.ok()) {
    std::cerr << "[sessions] sweep failed: " << expired.error() << "\n";
    observability::record_error("sessions", "sweep failed: " + expired.error());
    return expired;
  }
  if (expired.value() > 0) {
    std::cerr << "[sessions] expired " << expired.value() << " session(s)\n";
    observability::record_metric(observability::ExpiredSessionsMetric{.count = expired.value()});
  }
  return expired;
}

void SessionSweeper::wait_for(const std::chrono::milliseconds duration) const {
  const auto steps = std::max<long long>(1, duration.count() / 100);
  for (long long i = 0; i < steps && running_; ++i) {
    std::this_thread::sleep_for(std::chrono::milliseconds(100));
  }
}

void SessionSweeper::run_loop() {
  wait_for(config_.initial_delay);
  while (running_) {
    (void)sweep_once(common::Clock::now());
    wait_for(config_.interval);
  }
}

} // namespace parley::sessions
