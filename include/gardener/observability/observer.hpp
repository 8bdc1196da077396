#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace gardener::observability {

struct ScanStartEvent {
  std::string root;
  std::chrono::milliseconds timeout{0};
};

struct ScanEndEvent {
  std::string root;
  std::chrono::milliseconds duration{0};
  std::uint64_t files_visited = 0;
  std::uint64_t files_returned = 0;
  bool timed_out = false;
};

struct ProgressEvent {
  std::string component;
  std::string message;
};

struct SwitchStartEvent {
  std::string project_id;
  std::string previous_project_id;
};

struct ManagerOutcomeEvent {
  std::string manager;
  std::string project_id;
  bool success = false;
  std::string message;
};

struct SwitchEndEvent {
  std::string project_id;
  std::chrono::milliseconds duration{0};
  bool success = false;
  bool degraded = false;
  std::string message;
};

struct RegistryChangeEvent {
  std::string action;
  std::string project_id;
  std::string detail;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<ScanStartEvent, ScanEndEvent, ProgressEvent, SwitchStartEvent,
                 ManagerOutcomeEvent, SwitchEndEvent, RegistryChangeEvent, WarningEvent,
                 ErrorEvent>;

struct CacheLookupMetric {
  // "memory", "disk" or "miss".
  std::string tier;
};

struct EmbeddingComputeMetric {
  std::chrono::milliseconds latency{0};
  bool success = false;
};

struct SwitchLatencyMetric {
  std::chrono::milliseconds latency{0};
};

using ObserverMetric = std::variant<CacheLookupMetric, EmbeddingComputeMetric, SwitchLatencyMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace gardener::observability
