#include "gardener/embedding/disk_store.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/storage/sqlite_util.hpp"

#include <cstring>

namespace gardener::embedding {

namespace {

std::vector<unsigned char> vector_to_blob(const std::vector<float> &values) {
  std::vector<unsigned char> blob(values.size() * sizeof(float));
  std::memcpy(blob.data(), values.data(), blob.size());
  return blob;
}

common::Status not_open() {
  return common::Status::error("embedding cache database is not open",
                               common::ErrorCode::Storage);
}

} // namespace

SqliteEmbeddingStore::SqliteEmbeddingStore(std::filesystem::path db_path)
    : db_path_(std::move(db_path)) {
  if (!db_path_.parent_path().empty()) {
    if (auto dir = common::ensure_dir(db_path_.parent_path()); !dir.ok()) {
      open_status_ = dir.status();
      return;
    }
  }

  if (sqlite3_open(db_path_.string().c_str(), &db_) != SQLITE_OK) {
    open_status_ = storage::sqlite_error(db_, "open " + db_path_.string());
    sqlite3_close(db_);
    db_ = nullptr;
    return;
  }
  open_status_ = init_schema();
  if (!open_status_.ok()) {
    sqlite3_close(db_);
    db_ = nullptr;
  }
}

SqliteEmbeddingStore::~SqliteEmbeddingStore() {
  if (db_ != nullptr) {
    sqlite3_close(db_);
  }
}

common::Status SqliteEmbeddingStore::init_schema() {
  auto status = storage::exec_sql(db_, "PRAGMA journal_mode=WAL;");
  if (!status.ok()) {
    return status;
  }
  sqlite3_busy_timeout(db_, 5000);
  return storage::exec_sql(db_, R"(
CREATE TABLE IF NOT EXISTS embedding_cache (
  fingerprint TEXT PRIMARY KEY,
  embedding BLOB NOT NULL,
  dimensions INTEGER NOT NULL,
  size_bytes INTEGER NOT NULL,
  created_at TEXT NOT NULL
);
)");
}

common::Result<std::optional<std::vector<float>>>
SqliteEmbeddingStore::get(const std::string &fingerprint) {
  using Lookup = common::Result<std::optional<std::vector<float>>>;
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return Lookup::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  const char *sql =
      "SELECT embedding, dimensions, size_bytes FROM embedding_cache WHERE fingerprint = ?1";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    return Lookup::failure(storage::sqlite_error(db_, "prepare embedding lookup"));
  }
  sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  if (rc == SQLITE_DONE) {
    sqlite3_finalize(stmt);
    return Lookup::success(std::nullopt);
  }
  if (rc != SQLITE_ROW) {
    sqlite3_finalize(stmt);
    return Lookup::failure(storage::sqlite_error(db_, "embedding lookup"));
  }

  const void *blob = sqlite3_column_blob(stmt, 0);
  const auto bytes = static_cast<std::size_t>(sqlite3_column_bytes(stmt, 0));
  const auto dimensions = static_cast<std::size_t>(sqlite3_column_int64(stmt, 1));
  const auto recorded_size = static_cast<std::size_t>(sqlite3_column_int64(stmt, 2));

  if (blob == nullptr || dimensions == 0 || bytes != dimensions * sizeof(float) ||
      bytes != recorded_size) {
    sqlite3_finalize(stmt);
    return Lookup::success(std::nullopt);
  }

  std::vector<float> values(dimensions);
  std::memcpy(values.data(), blob, bytes);
  sqlite3_finalize(stmt);
  return Lookup::success(std::move(values));
}

common::Status SqliteEmbeddingStore::put(const std::string &fingerprint,
                                         const std::vector<float> &vector) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return not_open();
  }
  if (vector.empty()) {
    return common::Status::error("refusing to persist an empty embedding",
                                 common::ErrorCode::InvalidArgument);
  }

  auto status = storage::exec_sql(db_, "BEGIN IMMEDIATE;");
  if (!status.ok()) {
    return status;
  }

  const auto blob = vector_to_blob(vector);
  const std::string created_at = common::now_rfc3339();
  sqlite3_stmt *stmt = nullptr;
  const char *sql = "INSERT OR IGNORE INTO embedding_cache(fingerprint, embedding, dimensions, "
                    "size_bytes, created_at) VALUES(?1, ?2, ?3, ?4, ?5)";
  if (sqlite3_prepare_v2(db_, sql, -1, &stmt, nullptr) != SQLITE_OK) {
    const auto error = storage::sqlite_error(db_, "prepare embedding insert");
    (void)storage::exec_sql(db_, "ROLLBACK;");
    return error;
  }
  sqlite3_bind_text(stmt, 1, fingerprint.c_str(), -1, SQLITE_TRANSIENT);
  sqlite3_bind_blob(stmt, 2, blob.data(), static_cast<int>(blob.size()), SQLITE_TRANSIENT);
  sqlite3_bind_int64(stmt, 3, static_cast<sqlite3_int64>(vector.size()));
  sqlite3_bind_int64(stmt, 4, static_cast<sqlite3_int64>(blob.size()));
  sqlite3_bind_text(stmt, 5, created_at.c_str(), -1, SQLITE_TRANSIENT);

  const int rc = sqlite3_step(stmt);
  sqlite3_finalize(stmt);
  if (rc != SQLITE_DONE) {
    const auto error = storage::sqlite_error(db_, "insert embedding");
    (void)storage::exec_sql(db_, "ROLLBACK;");
    return error;
  }

  // The row only becomes visible to readers once this commit lands.
  status = storage::exec_sql(db_, "COMMIT;");
  if (!status.ok()) {
    (void)storage::exec_sql(db_, "ROLLBACK;");
  }
  return status;
}

common::Result<std::size_t> SqliteEmbeddingStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return common::Result<std::size_t>::failure(not_open());
  }

  sqlite3_stmt *stmt = nullptr;
  if (sqlite3_prepare_v2(db_, "SELECT COUNT(*) FROM embedding_cache", -1, &stmt, nullptr) !=
      SQLITE_OK) {
    return common::Result<std::size_t>::failure(storage::sqlite_error(db_, "count embeddings"));
  }
  std::size_t total = 0;
  if (sqlite3_step(stmt) == SQLITE_ROW) {
    total = static_cast<std::size_t>(sqlite3_column_int64(stmt, 0));
  }
  sqlite3_finalize(stmt);
  return common::Result<std::size_t>::success(total);
}

common::Status SqliteEmbeddingStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (db_ == nullptr) {
    return not_open();
  }
  return storage::exec_sql(db_, "DELETE FROM embedding_cache;");
}

} // namespace gardener::embedding
