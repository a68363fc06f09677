#pragma once

#include "parley/observability/observer.hpp"

#include <memory>

namespace parley::observability {

void set_global_observer(std::shared_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_connection(const std::string &device_id, const std::string &action);
void record_utterance(const std::string &device_id, const std::string &session_id,
                      std::uint64_t audio_bytes, std::uint64_t frames,
                      std::chrono::milliseconds duration);
void record_saga_event(const std::string &saga_id, const std::string &step_id,
                       const std::string &type, const std::string &payload);
void record_pipeline_latency(std::chrono::milliseconds latency, bool success);
void record_error(const std::string &component, const std::string &message);

} // namespace parley::observability
