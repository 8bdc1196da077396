#pragma once

#include "gardener/observability/observer.hpp"

#include <memory>

namespace gardener::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
[[nodiscard]] std::shared_ptr<IObserver> get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_progress(const std::string &component, const std::string &message);
void record_registry_change(const std::string &action, const std::string &project_id,
                            const std::string &detail = "");
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace gardener::observability
