#include "gardener/projects/registry.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/common/hash.hpp"
#include "gardener/observability/global.hpp"
#include "gardener/storage/sqlite_util.hpp"

namespace gardener::projects {

namespace {

constexpr const char *kNotInitialized = "project registry not initialized";
constexpr const char *kActiveKey = "active_project";
constexpr int kMaxIdAttempts = 8;

constexpr const char *kSelectColumns =
    "SELECT id, name, source_path, created_at, training_status, updated_at, language, file_count "
    "FROM projects ";

void bind_text(sqlite3_stmt *stmt, const int index, const std::string &value) {
  sqlite3_bind_text(stmt, index, value.c_str(), -1, SQLITE_TRANSIENT);
}

common::Result<ProjectRecord> row_to_record(sqlite3_stmt *stmt) {
  ProjectRecord record;
  record.id = storage::column_text(stmt, 0);
  record.name = storage::column_text(stmt, 1);
  record.source_path = storage::column_text(stmt, 2);
  record.created_at = storage::column_text(stmt, 3);
  const std::string status_text = storage::column_text(stmt, 4);
  const auto status = parse_training_status(status_text);
  if (!status.has_value()) {
    return common::Result<ProjectRecord>::failure(
        "project " + record.id + " has unknown training status '" + status_text + "'",
        common::ErrorCode::Storage);
  }
  record.training_status = *status;
  record.updated_at = storage::column_text(stmt, 5);
  if (sqlite3_column_type(stmt, 6) != SQLITE_NULL) {
    record.language = storage::column_text(stmt, 6);
  }
  record.file_count = static_cast<std::size_t>(sqlite3_column_int64(stmt, 7));
  return common::Result<ProjectRecord>::success(std::move(record));
}

std::filesystem::path absolute_source(const std::filesystem::path &source_path) {
  std::error_code ec;
  auto resolved = std::filesystem::weakly_canonical(source_path, ec);
  if (ec) {
    resolved = std::filesystem::absolute(source_path, ec);
    if (ec) {
      return source_path;
    }
  }
  return resolved;
}

// Rolls back an open transaction unless commit() succeeded.
class Transaction {
public:
  explicit Transaction(sqlite3 *db) : db_(db) {}
  ~Transaction() {
    if (open_) {
      (void)storage::exec_sql(db_, "ROLLBACK");
    }
  }

  [[nodiscard]] common::Status begin() {
    auto status = storage::exec_sql(db_, "BEGIN IMMEDIATE");
    open_ = status.ok();
    return status;
  }

  [[nodiscard]] common::Status commit() {
    auto status = storage::exec_sql(db_, "COMMIT");
    if (status.ok()) {
      open_ = false;
    }
    return status;
  }

private:
  sqlite3 *db_;
  bool open_ = false;
};

} // namespace

ProjectRegistry::ProjectRegistry(std::filesystem::path db_path) : db_path_(std::move(db_path)) {
  std::error_code ec;
  if (db_path_.has_parent_path()) {
    std::filesystem::create_directories(db_path_.parent_path(), ec);
  }
  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_status_ = storage::sqlite_error(db_, "failed to open registry " + db_path_.string());
    if (db_ != nullptr) {
      sqlite3_close(db_);
    }
    db_ = nullptr;
    return;
  }
  sqlite3_busy_timeout(db_, 5000);
  open_status_ = init_schema();
  if (!open_status_.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

ProjectRegistry::~ProjectRegistry() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status ProjectRegistry::init_schema() {
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized, common::ErrorCode::Storage);
  }
  return storage::exec_sql(db_, R"(
PRAGMA journal_mode=WAL;
CREATE TABLE IF NOT EXISTS projects (
  id TEXT PRIMARY KEY,
  name TEXT NOT NULL,
  source_path TEXT NOT NULL,
  created_at TEXT NOT NULL,
  training_status TEXT NOT NULL,
  updated_at TEXT NOT NULL,
  language TEXT,
  file_count INTEGER NOT NULL DEFAULT 0
);
CREATE INDEX IF NOT EXISTS idx_projects_name ON projects(name);
CREATE TABLE IF NOT EXISTS registry_meta (
  key TEXT PRIMARY KEY,
  value TEXT NOT NULL
);
)");
}

common::Result<ProjectRecord> ProjectRegistry::register_project(
    const std::string &name, const std::filesystem::path &source_path) {
  if (auto valid = validate_project_name(name); !valid.ok()) {
    return common::Result<ProjectRecord>::failure(valid);
  }
  std::error_code ec;
  if (source_path.empty() || !std::filesystem::is_directory(source_path, ec)) {
    return common::Result<ProjectRecord>::failure(
        "source path is not a directory: " + source_path.string(),
        common::ErrorCode::InvalidArgument);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<ProjectRecord>::failure(kNotInitialized, common::ErrorCode::Storage);
  }

  ProjectRecord record;
  record.name = common::trim(name);
  record.source_path = absolute_source(source_path);
  record.created_at = common::now_rfc3339();
  record.updated_at = record.created_at;
  record.training_status = TrainingStatus::Pending;

  const std::string status_text(training_status_name(record.training_status));
  for (int attempt = 0; attempt < kMaxIdAttempts; ++attempt) {
    auto id = common::generate_uuid_v4();
    if (!id.ok()) {
      return common::Result<ProjectRecord>::failure(id.status());
    }

    sqlite3_stmt *stmt = nullptr;
    const char *sql = "INSERT INTO projects(id, name, source_path, created_at, training_status, "
                      "updated_at, language, file_count) VALUES(?1, ?2, ?3, ?4, ?5, ?6, NULL, 0)";
    if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
      return common::Result<ProjectRecord>::failure(
          storage::sqlite_error(db_, "prepare register"));
    }
    bind_text(stmt, 1, id.value());
    bind_text(stmt, 2, record.name);
    bind_text(stmt, 3, record.source_path.string());
    bind_text(stmt, 4, record.created_at);
    bind_text(stmt, 5, status_text);
    bind_text(stmt, 6, record.updated_at);
    const int rc = sqlite3_step(stmt);
    sqlite3_finalize(stmt);

    if (rc == SQLITE_DONE) {
      record.id = id.value();
      observability::record_registry_change("register", record.id, record.name);
      return common::Result<ProjectRecord>::success(std::move(record));
    }
    if (sqlite3_extended_errcode(db_) != SQLITE_CONSTRAINT_PRIMARYKEY) {
      return common::Result<ProjectRecord>::failure(
          storage::sqlite_error(db_, "insert project"));
    }
  }
  return common::Result<ProjectRecord>::failure("could not allocate a unique project id",
                                                common::ErrorCode::Storage);
}

common::Result<std::vector<ProjectRecord>>
ProjectRegistry::query_records(const std::string &where_clause, const std::string &parameter) {
  if (db_ == nullptr) {
    return common::Result<std::vector<ProjectRecord>>::failure(kNotInitialized,
                                                               common::ErrorCode::Storage);
  }
  const std::string sql =
      std::string(kSelectColumns) + where_clause + " ORDER BY created_at ASC, rowid ASC";
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<std::vector<ProjectRecord>>::failure(
        storage::sqlite_error(db_, "prepare project query"));
  }
  if (!where_clause.empty()) {
    bind_text(stmt, 1, parameter);
  }

  std::vector<ProjectRecord> records;
  int rc = SQLITE_ROW;
  while ((rc = sqlite3_step(stmt)) == SQLITE_ROW) {
    auto record = row_to_record(stmt);
    if (!record.ok()) {
      sqlite3_finalize(stmt);
      return common::Result<std::vector<ProjectRecord>>::failure(record.status());
    }
    records.push_back(std::move(record.value()));
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<std::vector<ProjectRecord>>::failure(
        storage::sqlite_error(db_, "read projects"));
  }
  return common::Result<std::vector<ProjectRecord>>::success(std::move(records));
}

common::Result<ProjectRecord> ProjectRegistry::get_locked(const std::string &id) {
  auto rows = query_records("WHERE id = ?1", id);
  if (!rows.ok()) {
    return common::Result<ProjectRecord>::failure(rows.status());
  }
  if (rows.value().empty()) {
    return common::Result<ProjectRecord>::failure("project not found: " + id,
                                                  common::ErrorCode::NotFound);
  }
  return common::Result<ProjectRecord>::success(std::move(rows.value().front()));
}

common::Result<ProjectRecord> ProjectRegistry::get(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return get_locked(id);
}

common::Result<std::vector<ProjectRecord>> ProjectRegistry::list() {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_records("", "");
}

common::Result<std::vector<ProjectRecord>> ProjectRegistry::list_by_status(
    const TrainingStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  return query_records("WHERE training_status = ?1", std::string(training_status_name(status)));
}

common::Result<std::optional<ProjectRecord>> ProjectRegistry::find_by_name(
    const std::string &name) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto rows = query_records("WHERE name = ?1", common::trim(name));
  if (!rows.ok()) {
    return common::Result<std::optional<ProjectRecord>>::failure(rows.status());
  }
  if (rows.value().empty()) {
    return common::Result<std::optional<ProjectRecord>>::success(std::nullopt);
  }
  return common::Result<std::optional<ProjectRecord>>::success(std::move(rows.value().front()));
}

common::Result<ProjectRecord> ProjectRegistry::update_status(const std::string &id,
                                                             const TrainingStatus status) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<ProjectRecord>::failure(kNotInitialized, common::ErrorCode::Storage);
  }

  // Read and write under one write transaction so another process cannot slip
  // a transition in between.
  Transaction txn(db_);
  if (auto begun = txn.begin(); !begun.ok()) {
    return common::Result<ProjectRecord>::failure(begun);
  }
  auto current = get_locked(id);
  if (!current.ok()) {
    return current;
  }
  ProjectRecord record = current.value();
  if (record.training_status == status) {
    return common::Result<ProjectRecord>::success(std::move(record));
  }
  if (!is_valid_transition(record.training_status, status)) {
    return common::Result<ProjectRecord>::failure(
        "invalid training status transition " +
            std::string(training_status_name(record.training_status)) + " -> " +
            std::string(training_status_name(status)),
        common::ErrorCode::InvalidTransition);
  }

  const std::string updated_at = common::now_rfc3339();
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "UPDATE projects SET training_status = ?1, updated_at = ?2 WHERE id = ?3",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return common::Result<ProjectRecord>::failure(storage::sqlite_error(db_, "prepare update"));
  }
  bind_text(stmt, 1, std::string(training_status_name(status)));
  bind_text(stmt, 2, updated_at);
  bind_text(stmt, 3, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return common::Result<ProjectRecord>::failure(storage::sqlite_error(db_, "update status"));
  }
  if (auto committed = txn.commit(); !committed.ok()) {
    return common::Result<ProjectRecord>::failure(committed);
  }

  const std::string previous(training_status_name(record.training_status));
  record.training_status = status;
  record.updated_at = updated_at;
  observability::record_registry_change(
      "status", id, previous + " -> " + std::string(training_status_name(status)));
  return common::Result<ProjectRecord>::success(std::move(record));
}

common::Status ProjectRegistry::set_file_count(const std::string &id, const std::size_t file_count,
                                               const std::optional<std::string> &language) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized, common::ErrorCode::Storage);
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_,
                         "UPDATE projects SET file_count = ?1, language = COALESCE(?2, language), "
                         "updated_at = ?3 WHERE id = ?4",
                         -1, &stmt, nullptr) != SQLITE_OK) {
    return storage::sqlite_error(db_, "prepare file count update");
  }
  sqlite3_bind_int64(stmt, 1, static_cast<sqlite3_int64>(file_count));
  if (language.has_value()) {
    bind_text(stmt, 2, *language);
  } else {
    sqlite3_bind_null(stmt, 2);
  }
  bind_text(stmt, 3, common::now_rfc3339());
  bind_text(stmt, 4, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage::sqlite_error(db_, "update file count");
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error("project not found: " + id, common::ErrorCode::NotFound);
  }
  return common::Status::success();
}

common::Status ProjectRegistry::remove(const std::string &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized, common::ErrorCode::Storage);
  }

  Transaction txn(db_);
  if (auto begun = txn.begin(); !begun.ok()) {
    return begun;
  }
  auto active = active_project_locked();
  if (!active.ok()) {
    return active.status();
  }
  if (active.value().has_value() && *active.value() == id) {
    return common::Status::error("cannot remove the active project " + id,
                                 common::ErrorCode::ProjectActive);
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "DELETE FROM projects WHERE id = ?1", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage::sqlite_error(db_, "prepare remove");
  }
  bind_text(stmt, 1, id);
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage::sqlite_error(db_, "remove project");
  }
  if (sqlite3_changes(db_) == 0) {
    return common::Status::error("project not found: " + id, common::ErrorCode::NotFound);
  }
  if (auto committed = txn.commit(); !committed.ok()) {
    return committed;
  }
  observability::record_registry_change("remove", id);
  return common::Status::success();
}

common::Result<std::optional<std::string>> ProjectRegistry::active_project_locked() {
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT value FROM registry_meta WHERE key = ?1", -1, &stmt,
                         nullptr) != SQLITE_OK) {
    return common::Result<std::optional<std::string>>::failure(
        storage::sqlite_error(db_, "prepare active project read"));
  }
  bind_text(stmt, 1, kActiveKey);
  std::optional<std::string> value;
  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_ROW) {
    value = storage::column_text(stmt, 0);
  }
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
    return common::Result<std::optional<std::string>>::failure(
        storage::sqlite_error(db_, "read active project"));
  }
  return common::Result<std::optional<std::string>>::success(std::move(value));
}

common::Result<std::optional<std::string>> ProjectRegistry::active_project() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::optional<std::string>>::failure(kNotInitialized,
                                                               common::ErrorCode::Storage);
  }
  return active_project_locked();
}

common::Status ProjectRegistry::set_active_project(const std::optional<std::string> &id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Status::error(kNotInitialized, common::ErrorCode::Storage);
  }
  sqlite3_stmt *stmt = nullptr;
  const char *sql = id.has_value()
                        ? "INSERT OR REPLACE INTO registry_meta(key, value) VALUES(?1, ?2)"
                        : "DELETE FROM registry_meta WHERE key = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return storage::sqlite_error(db_, "prepare active project write");
  }
  bind_text(stmt, 1, kActiveKey);
  if (id.has_value()) {
    bind_text(stmt, 2, *id);
  }
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    return storage::sqlite_error(db_, "write active project");
  }
  observability::record_registry_change(id.has_value() ? "activate" : "deactivate",
                                        id.value_or(""));
  return common::Status::success();
}

common::Status ProjectRegistry::health_check() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return open_status_.ok()
               ? common::Status::error(kNotInitialized, common::ErrorCode::Storage)
               : open_status_;
  }
  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM projects", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return storage::sqlite_error(db_, "registry health check");
  }
  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_ROW) {
    return storage::sqlite_error(db_, "registry health check");
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> ProjectRegistry::validate() {
  std::lock_guard<std::mutex> lock(mutex_);
  auto records = query_records("", "");
  if (!records.ok()) {
    return common::Result<std::vector<std::string>>::failure(records.status());
  }
  auto active = active_project_locked();
  if (!active.ok()) {
    return common::Result<std::vector<std::string>>::failure(active.status());
  }

  std::vector<std::string> issues;
  bool active_found = false;
  for (const auto &record : records.value()) {
    std::error_code ec;
    if (!std::filesystem::is_directory(record.source_path, ec)) {
      issues.push_back("project " + record.name + " (" + record.id +
                       "): source path missing: " + record.source_path.string());
    }
    if (active.value().has_value() && *active.value() == record.id) {
      active_found = true;
    }
  }
  if (active.value().has_value() && !active_found) {
    issues.push_back("active project " + *active.value() + " is not registered");
  }
  return common::Result<std::vector<std::string>>::success(std::move(issues));
}

} // namespace gardener::projects
