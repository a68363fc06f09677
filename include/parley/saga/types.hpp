#pragma once

#include "parley/common/error.hpp"
#include "parley/common/result.hpp"
#include "parley/common/time.hpp"

#include <any>
#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace parley::saga {

enum class SagaState { Started, Running, Completed, Failed, Compensated };
enum class StepState { Pending, Running, Completed, Failed, Compensated };

enum class SagaEventType {
  SagaStarted,
  SagaCompleted,
  SagaFailed,
  SagaCompensated,
  StepStarted,
  StepCompleted,
  StepFailed,
  StepCompensated,
};

[[nodiscard]] std::string_view to_string(SagaState state);
[[nodiscard]] std::string_view to_string(StepState state);
[[nodiscard]] std::string_view to_string(SagaEventType type);

/// Completed and Compensated are the only states a saga can finish in.
[[nodiscard]] inline bool is_terminal(const SagaState state) {
  return state == SagaState::Completed || state == SagaState::Compensated;
}

/// Request record shared by the steps of one saga.
using SagaData = std::unordered_map<std::string, std::any>;

/// Typed read of a record entry. Missing keys and type mismatches yield nullptr.
template <typename T> [[nodiscard]] const T *data_get(const SagaData &data, const std::string &key) {
  const auto it = data.find(key);
  if (it == data.end()) {
    return nullptr;
  }
  return std::any_cast<T>(&it->second);
}

using SteadyClock = std::chrono::steady_clock;

struct StepContext {
  std::string saga_id;
  SteadyClock::time_point deadline;
  std::shared_ptr<const std::atomic<bool>> cancelled;

  [[nodiscard]] bool is_cancelled() const {
    return cancelled != nullptr && cancelled->load(std::memory_order_acquire);
  }
  [[nodiscard]] bool past_deadline() const { return SteadyClock::now() >= deadline; }
};

struct StepResult {
  bool success = false;
  std::string result;
  std::string error;
  common::ErrorCode code = common::ErrorCode::Stream;

  [[nodiscard]] static StepResult ok(std::string result) {
    StepResult out;
    out.success = true;
    out.result = std::move(result);
    return out;
  }
  [[nodiscard]] static StepResult failure(const common::ErrorCode code, std::string error) {
    StepResult out;
    out.code = code;
    out.error = std::move(error);
    return out;
  }
};

class IStep {
public:
  virtual ~IStep() = default;

  [[nodiscard]] virtual std::string_view id() const = 0;
  /// Runs against a private copy of the record; the copy is published only on success.
  [[nodiscard]] virtual StepResult execute(SagaData &data, const StepContext &context) = 0;
  [[nodiscard]] virtual common::Status compensate(SagaData &data, const StepContext &context) = 0;
};

struct SagaDefinition {
  std::string name;
  std::vector<std::shared_ptr<IStep>> steps;
  std::chrono::milliseconds deadline{30'000};
};

struct StepExecution {
  std::string step_id;
  StepState state = StepState::Pending;
  std::optional<common::Timestamp> started_at;
  std::optional<common::Timestamp> completed_at;
  std::string result;
  std::string error;
  std::optional<common::ErrorCode> code;
};

struct SagaInstance {
  std::string id;
  std::string definition;
  SagaState state = SagaState::Started;
  SagaData data;
  std::vector<StepExecution> steps;
  common::Timestamp started_at;
  std::optional<common::Timestamp> completed_at;
  std::optional<common::Error> error;

  [[nodiscard]] bool terminal() const { return is_terminal(state); }
};

struct SagaEvent {
  std::string saga_id;
  std::optional<std::string> step_id;
  SagaEventType type = SagaEventType::SagaStarted;
  common::Timestamp timestamp;
  std::optional<std::string> payload;
};

} // namespace parley::saga
