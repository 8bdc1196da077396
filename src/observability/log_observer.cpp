#include "gardener/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace gardener::observability {

namespace {

std::string flag(const bool value) { return value ? "true" : "false"; }

// Values with spaces are quoted so a line stays splittable on whitespace.
std::string field(const std::string &value) {
  if (value.empty()) {
    return "-";
  }
  if (value.find(' ') == std::string::npos) {
    return value;
  }
  return "\"" + value + "\"";
}

} // namespace

LogObserver::LogObserver(const bool verbose) : LogObserver(std::cerr, verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, ScanStartEvent>) {
          log_line("INFO", "scan.start root=" + field(evt.root) +
                               " timeout_ms=" + std::to_string(evt.timeout.count()));
        } else if constexpr (std::is_same_v<T, ScanEndEvent>) {
          log_line(evt.timed_out ? "WARN" : "INFO",
                   "scan.end root=" + field(evt.root) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " visited=" + std::to_string(evt.files_visited) +
                       " returned=" + std::to_string(evt.files_returned) +
                       " timed_out=" + flag(evt.timed_out));
        } else if constexpr (std::is_same_v<T, ProgressEvent>) {
          log_line("DEBUG", "progress component=" + evt.component + " " + evt.message);
        } else if constexpr (std::is_same_v<T, SwitchStartEvent>) {
          log_line("INFO", "switch.start project=" + field(evt.project_id) +
                               " previous=" + field(evt.previous_project_id));
        } else if constexpr (std::is_same_v<T, ManagerOutcomeEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "switch.manager name=" + evt.manager + " project=" + field(evt.project_id) +
                       " success=" + flag(evt.success) + " message=" + field(evt.message));
        } else if constexpr (std::is_same_v<T, SwitchEndEvent>) {
          log_line(!evt.success ? "ERROR" : (evt.degraded ? "WARN" : "INFO"),
                   "switch.end project=" + field(evt.project_id) +
                       " success=" + flag(evt.success) + " degraded=" + flag(evt.degraded) +
                       " duration_ms=" + std::to_string(evt.duration.count()) +
                       " message=" + field(evt.message));
        } else if constexpr (std::is_same_v<T, RegistryChangeEvent>) {
          log_line("INFO", "registry." + evt.action + " project=" + field(evt.project_id) +
                               " detail=" + field(evt.detail));
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
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
        if constexpr (std::is_same_v<T, CacheLookupMetric>) {
          log_line("DEBUG", "metric.cache_lookup tier=" + m.tier);
        } else if constexpr (std::is_same_v<T, EmbeddingComputeMetric>) {
          log_line("DEBUG", "metric.embedding_compute_ms=" + std::to_string(m.latency.count()) +
                                " success=" + flag(m.success));
        } else if constexpr (std::is_same_v<T, SwitchLatencyMetric>) {
          log_line("DEBUG", "metric.switch_latency_ms=" + std::to_string(m.latency.count()));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace gardener::observability
