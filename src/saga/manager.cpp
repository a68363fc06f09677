#include "parley/saga/manager.hpp"

#include <future>
#include <iostream>
#include <mutex>
#include <thread>
#include <unordered_set>
#include <utility>

namespace parley::saga {

struct SagaManager::Registry {
  std::shared_ptr<SagaEventQueue> events;
  mutable std::shared_mutex mutex;
  std::unordered_map<std::string, SagaDefinition> definitions;
  std::unordered_map<std::string, SagaInstance> instances;
  std::atomic<std::uint64_t> sequence{0};

  void emit(const std::string &saga_id, const SagaEventType type,
            std::optional<std::string> step_id = std::nullopt,
            std::optional<std::string> payload = std::nullopt) {
    if (events == nullptr) {
      return;
    }
    SagaEvent event;
    event.saga_id = saga_id;
    event.step_id = std::move(step_id);
    event.type = type;
    event.timestamp = common::Clock::now();
    event.payload = std::move(payload);
    (void)events->push(std::move(event));
  }

  template <typename Fn> void mutate(const std::string &id, Fn &&fn) {
    std::unique_lock<std::shared_mutex> lock(mutex);
    const auto it = instances.find(id);
    if (it != instances.end()) {
      fn(it->second);
    }
  }
};

namespace {

struct StepRun {
  StepResult result;
  SagaData data;
};

StepResult execute_guarded(IStep &step, SagaData &data, const StepContext &context) {
  try {
    return step.execute(data, context);
  } catch (const std::exception &e) {
    return StepResult::failure(common::ErrorCode::Stream,
                               std::string("step raised an exception: ") + e.what());
  } catch (...) {
    return StepResult::failure(common::ErrorCode::Stream, "step raised a non-standard exception");
  }
}

common::Status compensate_guarded(IStep &step, SagaData &data, const StepContext &context) {
  try {
    return step.compensate(data, context);
  } catch (const std::exception &e) {
    return common::Status::error(std::string("compensation raised an exception: ") + e.what());
  } catch (...) {
    return common::Status::error("compensation raised a non-standard exception");
  }
}

} // namespace

SagaManager::SagaManager(std::shared_ptr<SagaEventQueue> events)
    : registry_(std::make_shared<Registry>()) {
  registry_->events = std::move(events);
}

common::Status SagaManager::register_definition(SagaDefinition definition) {
  if (definition.name.empty()) {
    return common::Status::error("saga definition name is empty");
  }
  if (definition.steps.empty()) {
    return common::Status::error("saga definition '" + definition.name + "' has no steps");
  }
  if (definition.deadline.count() <= 0) {
    return common::Status::error("saga definition '" + definition.name +
                                 "' has a non-positive deadline");
  }
  std::unordered_set<std::string> ids;
  for (const auto &step : definition.steps) {
    if (step == nullptr) {
      return common::Status::error("saga definition '" + definition.name + "' has a null step");
    }
    if (!ids.insert(std::string(step->id())).second) {
      return common::Status::error("duplicate step id: " + std::string(step->id()));
    }
  }

  std::unique_lock<std::shared_mutex> lock(registry_->mutex);
  if (registry_->definitions.count(definition.name) > 0) {
    return common::Status::error("saga definition already registered: " + definition.name);
  }
  const std::string name = definition.name;
  registry_->definitions.emplace(name, std::move(definition));
  return common::Status::success();
}

common::Result<std::string> SagaManager::start(const std::string &definition, SagaData data) {
  SagaInstance instance;
  {
    std::shared_lock<std::shared_mutex> lock(registry_->mutex);
    const auto it = registry_->definitions.find(definition);
    if (it == registry_->definitions.end()) {
      return common::Result<std::string>::failure("unknown saga definition: " + definition);
    }
    for (const auto &step : it->second.steps) {
      StepExecution execution;
      execution.step_id = std::string(step->id());
      instance.steps.push_back(std::move(execution));
    }
  }

  const auto now = common::Clock::now();
  const auto epoch_ns =
      std::chrono::duration_cast<std::chrono::nanoseconds>(now.time_since_epoch()).count();
  instance.id = definition + "_" + std::to_string(epoch_ns) + "_" +
                std::to_string(registry_->sequence.fetch_add(1) + 1);
  instance.definition = definition;
  instance.state = SagaState::Started;
  instance.data = std::move(data);
  instance.started_at = now;

  const std::string id = instance.id;
  {
    std::unique_lock<std::shared_mutex> lock(registry_->mutex);
    registry_->instances.emplace(id, std::move(instance));
  }
  registry_->emit(id, SagaEventType::SagaStarted);

  std::thread([registry = registry_, id] { run(registry, id); }).detach();
  return common::Result<std::string>::success(id);
}

void SagaManager::run(const std::shared_ptr<Registry> &registry, const std::string &id) {
  SagaDefinition definition;
  SagaData data;
  {
    std::unique_lock<std::shared_mutex> lock(registry->mutex);
    auto it = registry->instances.find(id);
    if (it == registry->instances.end()) {
      return;
    }
    it->second.state = SagaState::Running;
    definition = registry->definitions.at(it->second.definition);
    data = it->second.data;
  }

  auto cancelled = std::make_shared<std::atomic<bool>>(false);
  StepContext context{id, SteadyClock::now() + definition.deadline, cancelled};

  std::vector<std::size_t> completed;
  std::optional<common::Error> failure;

  for (std::size_t i = 0; i < definition.steps.size(); ++i) {
    const auto step = definition.steps[i];
    const std::string step_id(step->id());
    registry->mutate(id, [&](SagaInstance &instance) {
      instance.steps[i].state = StepState::Running;
      instance.steps[i].started_at = common::Clock::now();
    });
    registry->emit(id, SagaEventType::StepStarted, step_id);

    StepResult outcome;
    if (context.past_deadline()) {
      outcome = StepResult::failure(common::ErrorCode::Timeout, "saga deadline exceeded");
    } else {
      auto promise = std::make_shared<std::promise<StepRun>>();
      auto future = promise->get_future();
      std::thread([step, promise, context, scratch = data]() mutable {
        StepRun run;
        run.result = execute_guarded(*step, scratch, context);
        run.data = std::move(scratch);
        promise->set_value(std::move(run));
      }).detach();

      if (future.wait_until(context.deadline) == std::future_status::ready) {
        StepRun run = future.get();
        outcome = std::move(run.result);
        if (outcome.success) {
          data = std::move(run.data);
        }
      } else {
        cancelled->store(true, std::memory_order_release);
        std::cerr << "[saga] " << id << " abandoned step " << step_id << " at deadline\n";
        outcome = StepResult::failure(common::ErrorCode::Timeout, "saga deadline exceeded");
      }
    }

    if (outcome.success) {
      registry->mutate(id, [&](SagaInstance &instance) {
        instance.data = data;
        instance.steps[i].state = StepState::Completed;
        instance.steps[i].completed_at = common::Clock::now();
        instance.steps[i].result = outcome.result;
      });
      registry->emit(id, SagaEventType::StepCompleted, step_id, outcome.result);
      completed.push_back(i);
      continue;
    }

    registry->mutate(id, [&](SagaInstance &instance) {
      instance.steps[i].state = StepState::Failed;
      instance.steps[i].completed_at = common::Clock::now();
      instance.steps[i].error = outcome.error;
      instance.steps[i].code = outcome.code;
    });
    registry->emit(id, SagaEventType::StepFailed, step_id, outcome.error);
    failure = common::Error{outcome.code, outcome.error};
    break;
  }

  if (!failure.has_value()) {
    registry->mutate(id, [&](SagaInstance &instance) {
      instance.state = SagaState::Completed;
      instance.completed_at = common::Clock::now();
    });
    registry->emit(id, SagaEventType::SagaCompleted);
    return;
  }

  registry->mutate(id, [&](SagaInstance &instance) {
    instance.state = SagaState::Failed;
    instance.error = failure;
  });
  registry->emit(id, SagaEventType::SagaFailed, std::nullopt, failure->to_string());

  for (auto it = completed.rbegin(); it != completed.rend(); ++it) {
    const auto &step = definition.steps[*it];
    const std::string step_id(step->id());
    const auto status = compensate_guarded(*step, data, context);
    if (!status.ok()) {
      std::cerr << "[saga] " << id << " compensation failed for " << step_id << ": "
                << status.error() << "\n";
      continue;
    }
    const std::size_t index = *it;
    registry->mutate(id, [&](SagaInstance &instance) {
      instance.steps[index].state = StepState::Compensated;
    });
    registry->emit(id, SagaEventType::StepCompensated, step_id);
  }

  registry->mutate(id, [&](SagaInstance &instance) {
    instance.data = data;
    instance.state = SagaState::Compensated;
    instance.completed_at = common::Clock::now();
  });
  registry->emit(id, SagaEventType::SagaCompensated);
}

std::optional<SagaInstance> SagaManager::get(const std::string &id) const {
  std::shared_lock<std::shared_mutex> lock(registry_->mutex);
  const auto it = registry_->instances.find(id);
  if (it == registry_->instances.end()) {
    return std::nullopt;
  }
  return it->second;
}

std::optional<SagaInstance> SagaManager::wait(const std::string &id,
                                              const std::chrono::milliseconds timeout,
                                              const std::chrono::milliseconds poll_interval) const {
  const auto give_up = SteadyClock::now() + timeout;
  while (true) {
    auto snapshot = get(id);
    if (!snapshot.has_value() || snapshot->terminal() || SteadyClock::now() >= give_up) {
      return snapshot;
    }
    std::this_thread::sleep_for(poll_interval);
  }
}

std::size_t SagaManager::prune(const std::chrono::milliseconds older_than) {
  const auto cutoff = common::Clock::now() - older_than;
  std::unique_lock<std::shared_mutex> lock(registry_->mutex);
  std::size_t removed = 0;
  for (auto it = registry_->instances.begin(); it != registry_->instances.end();) {
    const auto &instance = it->second;
    if (instance.terminal() && instance.completed_at.has_value() &&
        *instance.completed_at < cutoff) {
      it = registry_->instances.erase(it);
      ++removed;
    } else {
      ++it;
    }
  }
  return removed;
}

std::size_t SagaManager::size() const {
  std::shared_lock<std::shared_mutex> lock(registry_->mutex);
  return registry_->instances.size();
}

const std::shared_ptr<SagaEventQueue> &SagaManager::events() const { return registry_->events; }

} // namespace parley::saga
