#include "gardener/observability/global.hpp"

#include <mutex>

namespace gardener::observability {

namespace {

std::mutex g_observer_mutex;
std::shared_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::shared_ptr<IObserver> replaced;
  {
    std::lock_guard<std::mutex> lock(g_observer_mutex);
    replaced = std::move(g_observer);
    g_observer = std::move(observer);
  }
  if (replaced != nullptr) {
    replaced->flush();
  }
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

void record_progress(const std::string &component, const std::string &message) {
  record_event(ProgressEvent{.component = component, .message = message});
}

void record_registry_change(const std::string &action, const std::string &project_id,
                            const std::string &detail) {
  record_event(RegistryChangeEvent{.action = action, .project_id = project_id, .detail = detail});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace gardener::observability
