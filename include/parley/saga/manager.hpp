#pragma once

#include "parley/common/result.hpp"
#include "parley/saga/event_queue.hpp"
#include "parley/saga/types.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>

namespace parley::saga {

/// Runs registered step sequences with reverse compensation on failure.
///
/// `start` returns as soon as the instance is recorded; the steps run on a
/// detached runner thread, and each step on its own thread so the runner can
/// give up on it at the deadline. Instances stay queryable until pruned.
class SagaManager {
public:
  explicit SagaManager(std::shared_ptr<SagaEventQueue> events);

  [[nodiscard]] common::Status register_definition(SagaDefinition definition);
  [[nodiscard]] common::Result<std::string> start(const std::string &definition, SagaData data);
  [[nodiscard]] std::optional<SagaInstance> get(const std::string &id) const;

  /// Polls until the instance is terminal or `timeout` elapses, then returns the
  /// latest snapshot. nullopt only for unknown ids.
  [[nodiscard]] std::optional<SagaInstance> wait(const std::string &id,
                                                 std::chrono::milliseconds timeout,
                                                 std::chrono::milliseconds poll_interval) const;

  /// Drops terminal instances that completed more than `older_than` ago.
  std::size_t prune(std::chrono::milliseconds older_than);

  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] const std::shared_ptr<SagaEventQueue> &events() const;

private:
  struct Registry;

  static void run(const std::shared_ptr<Registry> &registry, const std::string &id);

  std::shared_ptr<Registry> registry_;
};

} // namespace parley::saga
