#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace parley::observability {

struct ConnectionEvent {
  std::string device_id;
  std::string action; // "registered", "replaced", "unregistered"
};

struct UtteranceEvent {
  std::string device_id;
  std::string session_id;
  std::uint64_t audio_bytes = 0;
  std::uint64_t frames = 0;
  std::chrono::milliseconds duration{0};
};

struct SagaStepEvent {
  std::string saga_id;
  std::string step_id;
  std::string type;
  std::string payload;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<ConnectionEvent, UtteranceEvent, SagaStepEvent, ErrorEvent>;

struct PipelineLatencyMetric {
  std::chrono::milliseconds latency{0};
  bool success = false;
};

struct ActiveConnectionsMetric {
  std::uint64_t count = 0;
};

struct DroppedEventsMetric {
  std::uint64_t total = 0;
};

struct ExpiredSessionsMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<PipelineLatencyMetric, ActiveConnectionsMetric,
                                    DroppedEventsMetric, ExpiredSessionsMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace parley::observability
