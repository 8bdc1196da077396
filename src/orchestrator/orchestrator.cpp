#include "gardener/orchestrator/orchestrator.hpp"

#include "gardener/common/json_util.hpp"
#include "gardener/health/health.hpp"
#include "gardener/observability/global.hpp"

#include <chrono>
#include <exception>
#include <sstream>

namespace gardener::orchestrator {

namespace {

constexpr const char *kComponent = "orchestrator";

std::string describe_outcomes(const std::string &label, const std::vector<ManagerOutcome> &outcomes) {
  std::string failed;
  for (const auto &outcome : outcomes) {
    if (outcome.success) {
      continue;
    }
    if (!failed.empty()) {
      failed += "; ";
    }
    failed += outcome.manager + " (" + outcome.message + ")";
  }
  if (failed.empty()) {
    return "switched to " + label;
  }
  return "switched to " + label + " with degraded managers: " + failed;
}

} // namespace

std::string health_report_json(const HealthReport &report) {
  std::ostringstream out;
  out << "{\"overall\":\"" << common::json_escape(report.overall) << "\",\"current_project\":";
  if (report.current_project_id.has_value()) {
    out << "\"" << common::json_escape(*report.current_project_id) << "\"";
  } else {
    out << "null";
  }
  out << ",\"registry\":{\"reachable\":" << (report.registry_reachable ? "true" : "false");
  if (!report.registry_error.empty()) {
    out << ",\"error\":\"" << common::json_escape(report.registry_error) << "\"";
  }
  out << "},\"managers\":{";
  bool first = true;
  for (const auto &manager : report.managers) {
    if (!first) {
      out << ",";
    }
    first = false;
    out << "\"" << common::json_escape(manager.name) << "\":{\"status\":\""
        << managers::manager_status_name(manager.status) << "\"";
    if (!manager.last_error.empty()) {
      out << ",\"error\":\"" << common::json_escape(manager.last_error) << "\"";
    }
    out << "}";
  }
  out << "}}";
  return out.str();
}

SwitchOrchestrator::SwitchOrchestrator(projects::ProjectRegistry &registry,
                                       std::vector<managers::IResourceManager *> managers)
    : registry_(registry), managers_(std::move(managers)) {
  std::erase(managers_, nullptr);
  state_.publish(capture(std::nullopt));
}

ActiveProjectSnapshot SwitchOrchestrator::capture(std::optional<std::string> current) const {
  ActiveProjectSnapshot snapshot;
  snapshot.current_project_id = std::move(current);
  snapshot.managers.reserve(managers_.size());
  for (const auto *manager : managers_) {
    snapshot.managers.push_back(ManagerState{
        .name = std::string(manager->name()),
        .status = manager->status(),
        .last_error = manager->last_error(),
    });
  }
  return snapshot;
}

ManagerOutcome SwitchOrchestrator::switch_manager(managers::IResourceManager &manager,
                                                  const std::string &project_id,
                                                  const bool retry_only) {
  const std::string name(manager.name());
  ManagerOutcome outcome{.manager = name};

  if (retry_only && manager.status() == managers::ManagerStatus::Loaded &&
      manager.current() == project_id) {
    outcome.success = true;
    outcome.status = managers::ManagerStatus::Loaded;
    outcome.message = "already loaded";
    return outcome;
  }
  if (retry_only && manager.status() == managers::ManagerStatus::Error) {
    health::bump_component_restart(name);
  }

  health::mark_component_starting(name);
  outcome.attempted = true;
  try {
    outcome.success = manager.switch_project(project_id);
    outcome.message = outcome.success ? "loaded" : manager.last_error();
  } catch (const std::exception &ex) {
    outcome.success = false;
    outcome.message = std::string("unexpected failure: ") + ex.what();
    observability::record_error(name, outcome.message);
  } catch (...) {
    outcome.success = false;
    outcome.message = "unexpected non-standard failure";
    observability::record_error(name, outcome.message);
  }
  outcome.status = manager.status();
  if (!outcome.success && outcome.status != managers::ManagerStatus::Error) {
    outcome.status = managers::ManagerStatus::Error;
  }

  if (outcome.success) {
    health::mark_component_ok(name, project_id);
  } else {
    health::mark_component_error(name, outcome.message);
  }
  observability::record_event(observability::ManagerOutcomeEvent{
      .manager = name,
      .project_id = project_id,
      .success = outcome.success,
      .message = outcome.message,
  });
  return outcome;
}

SwitchResult SwitchOrchestrator::switch_project(const std::string &project_id) {
  const auto started = std::chrono::steady_clock::now();
  std::lock_guard<std::mutex> lock(switch_mutex_);

  SwitchResult result;
  result.project_id = project_id;

  auto record = registry_.get(project_id);
  if (!record.ok()) {
    result.code = record.code();
    result.message = "cannot switch to " + project_id + ": " + record.error();
    observability::record_error(kComponent, result.message);
    return result;
  }

  const auto previous = state_.current_project_id();
  const bool same_project = previous.has_value() && *previous == project_id;
  observability::record_event(observability::SwitchStartEvent{
      .project_id = project_id,
      .previous_project_id = previous.value_or(""),
  });

  // Vector store first, so a reader never pairs the new model with the old
  // index.
  for (auto *manager : managers_) {
    result.outcomes.push_back(switch_manager(*manager, project_id, same_project));
  }

  state_.publish(capture(project_id));

  result.success = true;
  for (const auto &outcome : result.outcomes) {
    if (!outcome.success) {
      result.degraded = true;
    }
  }
  result.message = describe_outcomes(record.value().name + " (" + project_id + ")", result.outcomes);

  if (!same_project) {
    if (auto persisted = registry_.set_active_project(project_id); !persisted.ok()) {
      observability::record_warning(kComponent,
                                    "active project not persisted: " + persisted.error());
      result.message += "; active project not persisted: " + persisted.error();
    }
  }

  const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(
      std::chrono::steady_clock::now() - started);
  observability::record_metric(observability::SwitchLatencyMetric{.latency = latency});
  observability::record_event(observability::SwitchEndEvent{
      .project_id = project_id,
      .duration = latency,
      .success = result.success,
      .degraded = result.degraded,
      .message = result.message,
  });
  if (result.degraded) {
    observability::record_warning(kComponent, result.message);
  }
  return result;
}

std::optional<std::string> SwitchOrchestrator::current_project() const {
  return state_.current_project_id();
}

HealthReport SwitchOrchestrator::health() const {
  const auto snapshot = state_.snapshot();
  HealthReport report;
  report.current_project_id = snapshot.current_project_id;
  report.managers = snapshot.managers;

  const auto reachable = registry_.health_check();
  report.registry_reachable = reachable.ok();
  if (!reachable.ok()) {
    report.registry_error = reachable.error();
  }

  bool all_loaded = true;
  bool any_error = false;
  for (const auto &manager : report.managers) {
    all_loaded = all_loaded && manager.status == managers::ManagerStatus::Loaded;
    any_error = any_error || manager.status == managers::ManagerStatus::Error;
  }

  if (!report.registry_reachable || any_error) {
    report.overall = "degraded";
  } else if (!report.current_project_id.has_value()) {
    report.overall = "idle";
  } else {
    report.overall = all_loaded ? "ok" : "degraded";
  }
  return report;
}

std::optional<SwitchResult> SwitchOrchestrator::restore() {
  auto persisted = registry_.active_project();
  if (!persisted.ok()) {
    observability::record_warning(kComponent,
                                  "cannot read persisted active project: " + persisted.error());
    return std::nullopt;
  }
  if (!persisted.value().has_value()) {
    return std::nullopt;
  }

  const std::string project_id = *persisted.value();
  auto result = switch_project(project_id);
  if (!result.success && result.code == common::ErrorCode::NotFound) {
    observability::record_warning(kComponent, "persisted active project " + project_id +
                                                  " no longer exists; clearing it");
    if (auto cleared = registry_.set_active_project(std::nullopt); !cleared.ok()) {
      observability::record_warning(kComponent, cleared.error());
    }
  }
  return result;
}

common::Status SwitchOrchestrator::deactivate() {
  std::lock_guard<std::mutex> lock(switch_mutex_);
  for (auto *manager : managers_) {
    manager->unload();
    health::mark_component_unloaded(std::string(manager->name()));
  }
  state_.publish(capture(std::nullopt));
  return registry_.set_active_project(std::nullopt);
}

common::Status SwitchOrchestrator::remove_project(const std::string &project_id) {
  std::lock_guard<std::mutex> lock(switch_mutex_);
  if (state_.current_project_id() == project_id) {
    return common::Status::error("cannot remove the current project " + project_id,
                                 common::ErrorCode::ProjectActive);
  }
  return registry_.remove(project_id);
}

} // namespace gardener::orchestrator
