#pragma once

#include "gardener/common/result.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace gardener::managers {

enum class ManagerStatus { Unloaded, Loaded, Error };

[[nodiscard]] std::string_view manager_status_name(ManagerStatus status);

/// A resource bound to at most one project at a time.
class IResourceManager {
public:
  virtual ~IResourceManager() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  /// Idempotent for the current project: returns true without reloading when
  /// `project_id` is already loaded. Resolvable failures return false and
  /// leave the manager in Error with nothing bound.
  [[nodiscard]] virtual bool switch_project(const std::string &project_id) = 0;
  [[nodiscard]] virtual std::optional<std::string> current() const = 0;
  virtual void unload() = 0;

  [[nodiscard]] virtual ManagerStatus status() const = 0;
  [[nodiscard]] virtual std::string last_error() const = 0;
  /// Number of real loads performed so far.
  [[nodiscard]] virtual std::uint64_t load_count() const = 0;
};

/// Implements the switch bookkeeping shared by the concrete managers.
/// Subclasses provide activate/release and run under `mutex_`.
class ScopedResourceManager : public IResourceManager {
public:
  [[nodiscard]] bool switch_project(const std::string &project_id) final;
  [[nodiscard]] std::optional<std::string> current() const final;
  void unload() final;

  [[nodiscard]] ManagerStatus status() const final;
  [[nodiscard]] std::string last_error() const final;
  [[nodiscard]] std::uint64_t load_count() const final;

protected:
  /// Bind `project_id`, releasing whatever was bound before. On failure the
  /// previous binding must be left as it was.
  [[nodiscard]] virtual common::Status activate(const std::string &project_id) = 0;
  /// Drop the current binding. Only called while something is bound.
  virtual void release() = 0;

  /// Caller must hold `mutex_`.
  [[nodiscard]] const std::optional<std::string> &bound_project() const { return current_; }

  mutable std::mutex mutex_;

private:
  std::optional<std::string> current_;
  ManagerStatus status_ = ManagerStatus::Unloaded;
  std::string last_error_;
  std::uint64_t load_count_ = 0;
};

} // namespace gardener::managers
