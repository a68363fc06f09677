#pragma once

#include "parley/sessions/store.hpp"

#include <atomic>
#include <chrono>
#include <thread>

namespace parley::sessions {

struct SweeperConfig {
  std::chrono::milliseconds initial_delay{60'000};
  std::chrono::milliseconds interval{30 * 60'000};
};

/// Periodically marks lapsed active sessions as expired.
class SessionSweeper {
public:
  explicit SessionSweeper(ISessionStore &store, SweeperConfig config = {});
  ~SessionSweeper();

  void start();
  void stop();
  [[nodiscard]] bool is_running() const;
  /// One sweep at `now`; returns the number of sessions expired.
  [[nodiscard]] common::Result<std::size_t> sweep_once(common::Timestamp now);

private:
  void run_loop();
  void wait_for(std::chrono::milliseconds duration) const;

  ISessionStore &store_;
  SweeperConfig config_;
  std::thread thread_;
  std::atomic<bool> running_{false};
};

} // namespace parley::sessions
