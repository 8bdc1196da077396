#include "gardener/managers/resource_manager.hpp"

#include "gardener/observability/global.hpp"

#include <stdexcept>

namespace gardener::managers {

std::string_view manager_status_name(const ManagerStatus status) {
  switch (status) {
  case ManagerStatus::Unloaded:
    return "unloaded";
  case ManagerStatus::Loaded:
    return "loaded";
  case ManagerStatus::Error:
    return "error";
  }
  return "unloaded";
}

bool ScopedResourceManager::switch_project(const std::string &project_id) {
  if (project_id.empty()) {
    throw std::invalid_argument(std::string(name()) + ": project id must not be empty");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (status_ == ManagerStatus::Loaded && current_ == project_id) {
    return true;
  }

  const auto activated = activate(project_id);
  if (!activated.ok()) {
    // Nothing stays bound after a failed switch, so no caller can keep
    // talking to the previous project by accident.
    if (current_.has_value()) {
      release();
    }
    current_.reset();
    status_ = ManagerStatus::Error;
    last_error_ = activated.error();
    observability::record_warning(std::string(name()),
                                  "switch to " + project_id + " failed: " + last_error_);
    return false;
  }

  current_ = project_id;
  status_ = ManagerStatus::Loaded;
  last_error_.clear();
  ++load_count_;
  return true;
}

std::optional<std::string> ScopedResourceManager::current() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return current_;
}

void ScopedResourceManager::unload() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (current_.has_value()) {
    release();
  }
  current_.reset();
  status_ = ManagerStatus::Unloaded;
  last_error_.clear();
}

ManagerStatus ScopedResourceManager::status() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return status_;
}

std::string ScopedResourceManager::last_error() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return last_error_;
}

std::uint64_t ScopedResourceManager::load_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return load_count_;
}

} // namespace gardener::managers
