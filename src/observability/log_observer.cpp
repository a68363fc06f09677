#include "parley/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace parley::observability {

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ConnectionEvent>) {
          log_line("INFO", "connection." + evt.action + " device=" + evt.device_id);
        } else if constexpr (std::is_same_v<T, UtteranceEvent>) {
          log_line("INFO", "utterance device=" + evt.device_id + " session=" + evt.session_id +
                               " frames=" + std::to_string(evt.frames) +
                               " bytes=" + std::to_string(evt.audio_bytes) +
                               " duration_ms=" + std::to_string(evt.duration.count()));
        } else if constexpr (std::is_same_v<T, SagaStepEvent>) {
          std::string line = "saga." + evt.type + " id=" + evt.saga_id;
          if (!evt.step_id.empty()) {
            line += " step=" + evt.step_id;
          }
          if (!evt.payload.empty()) {
            line += " detail=" + evt.payload;
          }
          log_line(evt.type.find("failed") != std::string::npos ? "WARN" : "DEBUG", line);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, PipelineLatencyMetric>) {
          log_line("DEBUG", "metric.pipeline_latency_ms=" + std::to_string(m.latency.count()) +
                                (m.success ? " ok" : " failed"));
        } else if constexpr (std::is_same_v<T, ActiveConnectionsMetric>) {
          log_line("DEBUG", "metric.active_connections=" + std::to_string(m.count));
        } else if constexpr (std::is_same_v<T, DroppedEventsMetric>) {
          log_line("WARN", "metric.saga_events_dropped=" + std::to_string(m.total));
        } else if constexpr (std::is_same_v<T, ExpiredSessionsMetric>) {
          log_line("INFO", "metric.sessions_expired=" + std::to_string(m.count));
        }
      },
      metric);
}

} // namespace parley::observability
