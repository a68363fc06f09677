#include "parley/observability/global.hpp"

#include <mutex>

namespace parley::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::shared_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

std::shared_ptr<IObserver> get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer;
}

void record_event(const ObserverEvent &event) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_connection(const std::string &device_id, const std::string &action) {
  record_event(ConnectionEvent{.device_id = device_id, .action = action});
}

void record_utterance(const std::string &device_id, const std::string &session_id,
                      const std::uint64_t audio_bytes, const std::uint64_t frames,
                      const std::chrono::milliseconds duration) {
  record_event(UtteranceEvent{.device_id = device_id,
                              .session_id = session_id,
                              .audio_bytes = audio_bytes,
                              .frames = frames,
                              .duration = duration});
}

void record_saga_event(const std::string &saga_id, const std::string &step_id,
                       const std::string &type, const std::string &payload) {
  record_event(
      SagaStepEvent{.saga_id = saga_id, .step_id = step_id, .type = type, .payload = payload});
}

void record_pipeline_latency(const std::chrono::milliseconds latency, const bool success) {
  record_metric(PipelineLatencyMetric{.latency = latency, .success = success});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace parley::observability
