#include "parley/saga/types.hpp"

namespace parley::saga {

std::string_view to_string(const SagaState state) {
  switch (state) {
  case SagaState::Started:
    return "started";
  case SagaState::Running:
    return "running";
  case SagaState::Completed:
    return "completed";
  case SagaState::Failed:
    return "failed";
  case SagaState::Compensated:
    return "compensated";
  }
  return "started";
}

std::string_view to_string(const StepState state) {
  switch (state) {
  case StepState::Pending:
    return "pending";
  case StepState::Running:
    return "running";
  case StepState::Completed:
    return "completed";
  case StepState::Failed:
    return "failed";
  case StepState::Compensated:
    return "compensated";
  }
  return "pending";
}

std::string_view to_string(const SagaEventType type) {
  switch (type) {
  case SagaEventType::SagaStarted:
    return "saga_started";
  case SagaEventType::SagaCompleted:
    return "saga_completed";
  case SagaEventType::SagaFailed:
    return "saga_failed";
  case SagaEventType::SagaCompensated:
    return "saga_compensated";
  case SagaEventType::StepStarted:
    return "step_started";
  case SagaEventType::StepCompleted:
    return "step_completed";
  case SagaEventType::StepFailed:
    return "step_failed";
  case SagaEventType::StepCompensated:
    return "step_compensated";
  }
  return "saga_started";
}

} // namespace parley::saga
