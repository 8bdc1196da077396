#pragma once

#include "gardener/managers/resource_manager.hpp"

#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>

namespace gardener::orchestrator {

struct ManagerState {
  std::string name;
  managers::ManagerStatus status = managers::ManagerStatus::Unloaded;
  std::string last_error;
};

struct ActiveProjectSnapshot {
  std::optional<std::string> current_project_id;
  std::vector<ManagerState> managers;
};

class SwitchOrchestrator;

/// Process-wide view of which project is current. Readers always get a
/// whole snapshot; only the orchestrator publishes new ones.
class ActiveProjectState {
public:
  [[nodiscard]] ActiveProjectSnapshot snapshot() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_;
  }

  [[nodiscard]] std::optional<std::string> current_project_id() const {
    std::shared_lock<std::shared_mutex> lock(mutex_);
    return state_.current_project_id;
  }

private:
  friend class SwitchOrchestrator;

  void publish(ActiveProjectSnapshot next) {
    std::unique_lock<std::shared_mutex> lock(mutex_);
    state_ = std::move(next);
  }

  mutable std::shared_mutex mutex_;
  ActiveProjectSnapshot state_;
};

} // namespace gardener::orchestrator
