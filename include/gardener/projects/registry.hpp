#pragma once

#include "gardener/common/result.hpp"
#include "gardener/projects/project.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace gardener::projects {

/// Durable project catalog. Every read goes to the database, so separate
/// instances on the same file observe each other's writes.
class ProjectRegistry {
public:
  explicit ProjectRegistry(std::filesystem::path db_path);
  ~ProjectRegistry();

  ProjectRegistry(const ProjectRegistry &) = delete;
  ProjectRegistry &operator=(const ProjectRegistry &) = delete;

  [[nodiscard]] const common::Status &open_status() const { return open_status_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  /// The name must be valid and the source directory must exist. Duplicate
  /// names and source paths are accepted; only the id is unique.
  [[nodiscard]] common::Result<ProjectRecord> register_project(const std::string &name,
                                                               const std::filesystem::path &source_path);
  [[nodiscard]] common::Result<ProjectRecord> get(const std::string &id);
  [[nodiscard]] common::Result<std::vector<ProjectRecord>> list();
  [[nodiscard]] common::Result<std::vector<ProjectRecord>> list_by_status(TrainingStatus status);
  /// Oldest project with exactly this name.
  [[nodiscard]] common::Result<std::optional<ProjectRecord>> find_by_name(const std::string &name);

  /// Fails with InvalidTransition (record untouched) on a backward move or
  /// when leaving a terminal state.
  [[nodiscard]] common::Result<ProjectRecord> update_status(const std::string &id,
                                                            TrainingStatus status);
  [[nodiscard]] common::Status set_file_count(const std::string &id, std::size_t file_count,
                                              const std::optional<std::string> &language);

  /// Refused with ProjectActive while `id` is the persisted active project.
  [[nodiscard]] common::Status remove(const std::string &id);

  [[nodiscard]] common::Status set_active_project(const std::optional<std::string> &id);
  [[nodiscard]] common::Result<std::optional<std::string>> active_project();

  [[nodiscard]] common::Status health_check();
  /// Human-readable consistency problems (missing sources, dangling active id).
  [[nodiscard]] common::Result<std::vector<std::string>> validate();

private:
  [[nodiscard]] common::Status init_schema();
  [[nodiscard]] common::Result<std::vector<ProjectRecord>>
  query_records(const std::string &where_clause, const std::string &parameter);
  [[nodiscard]] common::Result<std::optional<std::string>> active_project_locked();
  [[nodiscard]] common::Result<ProjectRecord> get_locked(const std::string &id);

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  common::Status open_status_ = common::Status::success();
};

} // namespace gardener::projects
