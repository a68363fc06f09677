#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "parley/saga/event_queue.hpp"
#include "parley/saga/manager.hpp"

#include <algorithm>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>

namespace {

namespace sg = parley::saga;
using parley::common::ErrorCode;
using parley::tests::require;

struct CallLog {
  std::mutex mutex;
  std::vector<std::string> calls;

  void add(std::string entry) {
    std::lock_guard<std::mutex> lock(mutex);
    calls.push_back(std::move(entry));
  }
  std::vector<std::string> snapshot() {
    std::lock_guard<std::mutex> lock(mutex);
    return calls;
  }
};

enum class Behavior { Succeed, Fail, Throw, ThrowOther, Sleep };

class ScriptedStep final : public sg::IStep {
public:
  ScriptedStep(std::string id, std::shared_ptr<CallLog> log, Behavior behavior = Behavior::Succeed,
               bool compensation_fails = false)
      : id_(std::move(id)), log_(std::move(log)), behavior_(behavior),
        compensation_fails_(compensation_fails) {}

  std::string_view id() const override { return id_; }

  sg::StepResult execute(sg::SagaData &data, const sg::StepContext &context) override {
    log_->add("execute:" + id_);
    data[id_] = std::string("ran");
    switch (behavior_) {
    case Behavior::Succeed:
      return sg::StepResult::ok(id_ + " ok");
    case Behavior::Fail:
      return sg::StepResult::failure(ErrorCode::ContentRejected, id_ + " refused");
    case Behavior::Throw:
      throw std::runtime_error(id_ + " exploded");
    case Behavior::ThrowOther:
      throw 42;
    case Behavior::Sleep:
      while (!context.is_cancelled()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(5));
      }
      return sg::StepResult::ok("too late");
    }
    return sg::StepResult::ok("");
  }

  parley::common::Status compensate(sg::SagaData &, const sg::StepContext &) override {
    log_->add("compensate:" + id_);
    if (compensation_fails_) {
      return parley::common::Status::error("cannot undo " + id_);
    }
    return parley::common::Status::success();
  }

private:
  std::string id_;
  std::shared_ptr<CallLog> log_;
  Behavior behavior_;
  bool compensation_fails_;
};

/// Runs fine but throws a non-standard value when undone.
class UndoRaisesStep final : public sg::IStep {
public:
  explicit UndoRaisesStep(std::shared_ptr<CallLog> log) : log_(std::move(log)) {}

  std::string_view id() const override { return "undo_raises"; }

  sg::StepResult execute(sg::SagaData &, const sg::StepContext &) override {
    log_->add("execute:undo_raises");
    return sg::StepResult::ok("done");
  }

  parley::common::Status compensate(sg::SagaData &, const sg::StepContext &) override {
    log_->add("compensate:undo_raises");
    throw std::string("not an exception type");
  }

private:
  std::shared_ptr<CallLog> log_;
};

sg::SagaDefinition definition(std::string name, std::vector<std::shared_ptr<sg::IStep>> steps,
                              std::chrono::milliseconds deadline = std::chrono::seconds(5)) {
  sg::SagaDefinition out;
  out.name = std::move(name);
  out.steps = std::move(steps);
  out.deadline = deadline;
  return out;
}

sg::SagaInstance run_to_end(sg::SagaManager &manager, const std::string &name,
                            sg::SagaData data = {}) {
  auto started = manager.start(name, std::move(data));
  require(started.ok(), started.error());
  const auto instance =
      manager.wait(started.value(), std::chrono::seconds(5), std::chrono::milliseconds(5));
  require(instance.has_value(), "instance vanished");
  require(instance->terminal(), "saga did not finish");
  return *instance;
}

std::vector<sg::SagaEvent> collect_until(sg::SagaEventQueue &queue, const std::string &saga_id,
                                         const sg::SagaEventType last) {
  std::vector<sg::SagaEvent> events;
  const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
  while (std::chrono::steady_clock::now() < deadline) {
    auto event = queue.pop_for(std::chrono::milliseconds(50));
    if (!event.has_value()) {
      continue;
    }
    if (event->saga_id != saga_id) {
      continue;
    }
    events.push_back(*event);
    if (event->type == last) {
      break;
    }
  }
  return events;
}

std::vector<std::string> event_names(const std::vector<sg::SagaEvent> &events) {
  std::vector<std::string> names;
  for (const auto &event : events) {
    names.push_back(std::string(sg::to_string(event.type)) +
                    (event.step_id.has_value() ? ":" + *event.step_id : ""));
  }
  return names;
}

} // namespace

void register_saga_tests(std::vector<parley::tests::TestCase> &tests) {
  tests.push_back({"saga_completes_all_steps_in_order", [] {
                     auto log = std::make_shared<CallLog>();
                     auto events = std::make_shared<sg::SagaEventQueue>(100);
                     sg::SagaManager manager(events);
                     require(manager
                                 .register_definition(definition(
                                     "three", {std::make_shared<ScriptedStep>("a", log),
                                               std::make_shared<ScriptedStep>("b", log),
                                               std::make_shared<ScriptedStep>("c", log)}))
                                 .ok(),
                             "register failed");

                     sg::SagaData data;
                     data["input"] = 42;
                     const auto instance = run_to_end(manager, "three", data);
                     require(instance.state == sg::SagaState::Completed, "should complete");
                     require(instance.completed_at.has_value(), "completed_at set");
                     require(!instance.error.has_value(), "no error");
                     require(instance.id.rfind("three_", 0) == 0, "id prefixed by definition");
                     for (const auto &step : instance.steps) {
                       require(step.state == sg::StepState::Completed, "step " + step.step_id);
                       require(step.started_at.has_value() && step.completed_at.has_value(),
                               "step timestamps");
                     }
                     require(sg::data_get<int>(instance.data, "input") != nullptr &&
                                 *sg::data_get<int>(instance.data, "input") == 42,
                             "input kept");
                     require(sg::data_get<std::string>(instance.data, "c") != nullptr,
                             "step writes published");
                     require(sg::data_get<int>(instance.data, "c") == nullptr,
                             "type mismatch yields nullptr");
                     require(log->snapshot() ==
                                 std::vector<std::string>{"execute:a", "execute:b", "execute:c"},
                             "execution order");

                     const auto names = event_names(
                         collect_until(*events, instance.id, sg::SagaEventType::SagaCompleted));
                     const std::vector<std::string> expected = {
                         "saga_started",     "step_started:a", "step_completed:a",
                         "step_started:b",   "step_completed:b", "step_started:c",
                         "step_completed:c", "saga_completed"};
                     require(names == expected, "event sequence mismatch");
                   }});

  tests.push_back({"saga_failure_compensates_in_reverse_exactly_once", [] {
                     auto log = std::make_shared<CallLog>();
                     auto events = std::make_shared<sg::SagaEventQueue>(100);
                     sg::SagaManager manager(events);
                     require(manager
                                 .register_definition(definition(
                                     "undo", {std::make_shared<ScriptedStep>("a", log),
                                              std::make_shared<ScriptedStep>("b", log),
                                              std::make_shared<ScriptedStep>("c", log, Behavior::Fail),
                                              std::make_shared<ScriptedStep>("d", log)}))
                                 .ok(),
                             "register failed");

                     const auto instance = run_to_end(manager, "undo");
                     require(instance.state == sg::SagaState::Compensated, "should compensate");
                     require(instance.error.has_value(), "error recorded");
                     require(instance.error->code == ErrorCode::ContentRejected,
                             "step error code propagated");
                     require(instance.error->message == "c refused", "step error message");
                     require(instance.steps[0].state == sg::StepState::Compensated, "a undone");
                     require(instance.steps[1].state == sg::StepState::Compensated, "b undone");
                     require(instance.steps[2].state == sg::StepState::Failed, "c failed");
                     require(instance.steps[3].state == sg::StepState::Pending, "d never ran");
                     require(sg::data_get<std::string>(instance.data, "c") == nullptr,
                             "failed step writes discarded");

                     const std::vector<std::string> expected = {
                         "execute:a", "execute:b", "execute:c", "compensate:b", "compensate:a"};
                     require(log->snapshot() == expected, "compensation order");

                     const auto names = event_names(
                         collect_until(*events, instance.id, sg::SagaEventType::SagaCompensated));
                     require(std::find(names.begin(), names.end(), "saga_failed") != names.end(),
                             "saga_failed emitted");
                     require(names.back() == "saga_compensated", "ends compensated");
                   }});

  tests.push_back({"saga_compensation_failure_does_not_stop_walk", [] {
                     auto log = std::make_shared<CallLog>();
                     sg::SagaManager manager(nullptr);
                     require(manager
                                 .register_definition(definition(
                                     "partial",
                                     {std::make_shared<ScriptedStep>("a", log),
                                      std::make_shared<ScriptedStep>("b", log, Behavior::Succeed, true),
                                      std::make_shared<ScriptedStep>("c", log, Behavior::Fail)}))
                                 .ok(),
                             "register failed");
                     const auto instance = run_to_end(manager, "partial");
                     require(instance.state == sg::SagaState::Compensated, "terminal state");
                     require(instance.steps[1].state == sg::StepState::Completed,
                             "failed compensation keeps step completed");
                     require(instance.steps[0].state == sg::StepState::Compensated,
                             "earlier step still compensated");
                     require(log->snapshot().back() == "compensate:a", "walk continued");
                   }});

  tests.push_back({"saga_step_exception_becomes_failure", [] {
                     auto log = std::make_shared<CallLog>();
                     sg::SagaManager manager(nullptr);
                     require(manager
                                 .register_definition(definition(
                                     "boom", {std::make_shared<ScriptedStep>("a", log),
                                              std::make_shared<ScriptedStep>("b", log, Behavior::Throw)}))
                                 .ok(),
                             "register failed");
                     const auto instance = run_to_end(manager, "boom");
                     require(instance.state == sg::SagaState::Compensated, "compensated");
                     require(instance.steps[1].error.find("b exploded") != std::string::npos,
                             "exception message kept");
                   }});

  tests.push_back({"saga_non_standard_throws_are_contained", [] {
                     auto log = std::make_shared<CallLog>();
                     sg::SagaManager manager(nullptr);
                     require(manager
                                 .register_definition(definition(
                                     "odd", {std::make_shared<ScriptedStep>("a", log),
                                             std::make_shared<UndoRaisesStep>(log),
                                             std::make_shared<ScriptedStep>("c", log,
                                                                            Behavior::ThrowOther)}))
                                 .ok(),
                             "register failed");
                     const auto instance = run_to_end(manager, "odd");
                     require(instance.state == sg::SagaState::Compensated, "compensated");
                     require(instance.steps[2].state == sg::StepState::Failed, "thrower failed");
                     require(instance.steps[2].error.find("non-standard") != std::string::npos,
                             "failure describes the throw: " + instance.steps[2].error);
                     require(instance.steps[1].state == sg::StepState::Completed,
                             "step whose undo threw stays completed");
                     require(instance.steps[0].state == sg::StepState::Compensated,
                             "walk continues past the throwing undo");
                     const auto calls = log->snapshot();
                     require(calls.back() == "compensate:a", "first step undone last");
                   }});

  tests.push_back({"saga_deadline_abandons_step_and_compensates", [] {
                     auto log = std::make_shared<CallLog>();
                     sg::SagaManager manager(nullptr);
                     require(manager
                                 .register_definition(definition(
                                     "slow",
                                     {std::make_shared<ScriptedStep>("a", log),
                                      std::make_shared<ScriptedStep>("b", log, Behavior::Sleep)},
                                     std::chrono::milliseconds(100)))
                                 .ok(),
                             "register failed");
                     const auto begun = std::chrono::steady_clock::now();
                     const auto instance = run_to_end(manager, "slow");
                     const auto took = std::chrono::steady_clock::now() - begun;
                     require(instance.state == sg::SagaState::Compensated, "compensated");
                     require(instance.error.has_value() &&
                                 instance.error->code == ErrorCode::Timeout,
                             "timeout error code");
                     require(took < std::chrono::seconds(2), "deadline not enforced");
                     require(instance.steps[0].state == sg::StepState::Compensated, "a undone");
                     require(sg::data_get<std::string>(instance.data, "b") == nullptr,
                             "abandoned step writes discarded");
                   }});

  tests.push_back({"saga_registration_validation", [] {
                     auto log = std::make_shared<CallLog>();
                     sg::SagaManager manager(nullptr);
                     require(!manager.register_definition(definition("", {std::make_shared<ScriptedStep>("a", log)})).ok(),
                             "empty name");
                     require(!manager.register_definition(definition("none", {})).ok(), "no steps");
                     require(!manager
                                  .register_definition(definition(
                                      "dup", {std::make_shared<ScriptedStep>("a", log),
                                              std::make_shared<ScriptedStep>("a", log)}))
                                  .ok(),
                             "duplicate step ids");
                     require(!manager
                                  .register_definition(definition(
                                      "zero", {std::make_shared<ScriptedStep>("a", log)},
                                      std::chrono::milliseconds(0)))
                                  .ok(),
                             "zero deadline");
                     require(manager.register_definition(definition("ok", {std::make_shared<ScriptedStep>("a", log)})).ok(),
                             "valid definition");
                     require(!manager.register_definition(definition("ok", {std::make_shared<ScriptedStep>("b", log)})).ok(),
                             "duplicate name");

                     const auto unknown = manager.start("missing", {});
                     require(!unknown.ok(), "unknown definition should fail");
                     require(unknown.error().find("missing") != std::string::npos,
                             "error names the definition");
                     require(manager.size() == 0, "no instance for unknown definition");
                     require(!manager.get("nope").has_value(), "unknown id");
                     require(!manager
                                  .wait("nope", std::chrono::milliseconds(10),
                                        std::chrono::milliseconds(1))
                                  .has_value(),
                             "wait on unknown id");
                   }});

  tests.push_back({"saga_wait_returns_snapshot_on_timeout_and_prune", [] {
                     auto log = std::make_shared<CallLog>();
                     sg::SagaManager manager(nullptr);
                     require(manager
                                 .register_definition(definition(
                                     "sleepy", {std::make_shared<ScriptedStep>("a", log, Behavior::Sleep)},
                                     std::chrono::milliseconds(300)))
                                 .ok(),
                             "register failed");
                     auto started = manager.start("sleepy", {});
                     require(started.ok(), started.error());
                     const auto early = manager.wait(started.value(), std::chrono::milliseconds(20),
                                                     std::chrono::milliseconds(5));
                     require(early.has_value() && !early->terminal(), "still running");
                     require(manager.prune(std::chrono::milliseconds(0)) == 0,
                             "running sagas are never pruned");

                     const auto done = manager.wait(started.value(), std::chrono::seconds(3),
                                                    std::chrono::milliseconds(5));
                     require(done.has_value() && done->terminal(), "finished");
                     std::this_thread::sleep_for(std::chrono::milliseconds(5));
                     require(manager.prune(std::chrono::hours(1)) == 0, "recent kept");
                     require(manager.prune(std::chrono::milliseconds(0)) == 1, "old pruned");
                     require(!manager.get(started.value()).has_value(), "pruned instance gone");
                   }});

  tests.push_back({"saga_event_queue_drops_when_full", [] {
                     sg::SagaEventQueue queue(2);
                     sg::SagaEvent event;
                     event.saga_id = "s1";
                     require(queue.push(event), "first push");
                     require(queue.push(event), "second push");
                     require(!queue.push(event), "third push dropped");
                     require(queue.dropped() == 1, "drop counted");
                     require(queue.size() == 2, "size capped");
                     require(queue.drain().size() == 2, "drain returns all");
                     require(!queue.pop().has_value(), "empty after drain");

                     queue.close();
                     require(!queue.push(event), "closed queue rejects");
                     require(!queue.pop_for(std::chrono::milliseconds(10)).has_value(),
                             "closed queue returns nothing");
                   }});

  tests.push_back({"saga_runs_concurrently_with_full_event_queue", [] {
                     auto log = std::make_shared<CallLog>();
                     auto events = std::make_shared<sg::SagaEventQueue>(1);
                     sg::SagaManager manager(events);
                     require(manager
                                 .register_definition(definition(
                                     "busy", {std::make_shared<ScriptedStep>("a", log),
                                              std::make_shared<ScriptedStep>("b", log)}))
                                 .ok(),
                             "register failed");
                     std::vector<std::string> ids;
                     for (int i = 0; i < 5; ++i) {
                       auto started = manager.start("busy", {});
                       require(started.ok(), started.error());
                       ids.push_back(started.value());
                     }
                     for (const auto &id : ids) {
                       const auto instance = manager.wait(id, std::chrono::seconds(5),
                                                          std::chrono::milliseconds(5));
                       require(instance.has_value() &&
                                   instance->state == sg::SagaState::Completed,
                               "saga blocked by full event queue");
                     }
                     require(events->dropped() > 0, "events should have been dropped");
                     std::sort(ids.begin(), ids.end());
                     require(std::unique(ids.begin(), ids.end()) == ids.end(), "ids unique");
                   }});
}
