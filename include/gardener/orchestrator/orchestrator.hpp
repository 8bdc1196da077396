#pragma once

#include "gardener/common/result.hpp"
#include "gardener/managers/resource_manager.hpp"
#include "gardener/orchestrator/active_state.hpp"
#include "gardener/projects/registry.hpp"

#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace gardener::orchestrator {

struct ManagerOutcome {
  std::string manager;
  // False when the manager already had the project loaded and was skipped.
  bool attempted = false;
  bool success = false;
  managers::ManagerStatus status = managers::ManagerStatus::Unloaded;
  std::string message;
};

/// `success` means the project is now current. A switch where some managers
/// failed still succeeds, with `degraded` set and the failures listed.
struct SwitchResult {
  bool success = false;
  bool degraded = false;
  common::ErrorCode code = common::ErrorCode::None;
  std::string project_id;
  std::string message;
  std::vector<ManagerOutcome> outcomes;
};

struct HealthReport {
  // "ok", "idle" (no current project) or "degraded".
  std::string overall;
  std::optional<std::string> current_project_id;
  std::vector<ManagerState> managers;
  bool registry_reachable = false;
  std::string registry_error;
};

[[nodiscard]] std::string health_report_json(const HealthReport &report);

/// Moves the whole process from one active project to another. Switches are
/// serialized; partial switches are kept as they are (no rollback).
class SwitchOrchestrator {
public:
  /// Managers are switched in the order given.
  SwitchOrchestrator(projects::ProjectRegistry &registry,
                     std::vector<managers::IResourceManager *> managers);

  SwitchOrchestrator(const SwitchOrchestrator &) = delete;
  SwitchOrchestrator &operator=(const SwitchOrchestrator &) = delete;

  [[nodiscard]] SwitchResult switch_project(const std::string &project_id);
  [[nodiscard]] std::optional<std::string> current_project() const;
  [[nodiscard]] ActiveProjectSnapshot snapshot() const { return state_.snapshot(); }
  [[nodiscard]] const ActiveProjectState &state() const { return state_; }
  [[nodiscard]] HealthReport health() const;

  /// Re-activates the project persisted by an earlier process, if any.
  [[nodiscard]] std::optional<SwitchResult> restore();
  /// Unloads every manager and clears the current project.
  [[nodiscard]] common::Status deactivate();
  /// Refused with ProjectActive for the current project.
  [[nodiscard]] common::Status remove_project(const std::string &project_id);

private:
  [[nodiscard]] ActiveProjectSnapshot capture(std::optional<std::string> current) const;
  [[nodiscard]] ManagerOutcome switch_manager(managers::IResourceManager &manager,
                                              const std::string &project_id,
                                              bool retry_only);

  projects::ProjectRegistry &registry_;
  std::vector<managers::IResourceManager *> managers_;
  // Single writer for state_.
  std::mutex switch_mutex_;
  ActiveProjectState state_;
};

} // namespace gardener::orchestrator
