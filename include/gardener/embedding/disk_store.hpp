#pragma once

#include "gardener/common/result.hpp"

#include <filesystem>
#include <mutex>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

namespace gardener::embedding {

/// Persistent fingerprint -> vector tier backed by sqlite. Entries are
/// insert-only; a second write for the same fingerprint is ignored.
class SqliteEmbeddingStore {
public:
  explicit SqliteEmbeddingStore(std::filesystem::path db_path);
  ~SqliteEmbeddingStore();

  SqliteEmbeddingStore(const SqliteEmbeddingStore &) = delete;
  SqliteEmbeddingStore &operator=(const SqliteEmbeddingStore &) = delete;

  /// Why the database could not be opened, if it could not.
  [[nodiscard]] const common::Status &open_status() const { return open_status_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

  /// nullopt for a miss, including rows whose blob does not match their
  /// recorded dimensions.
  [[nodiscard]] common::Result<std::optional<std::vector<float>>>
  get(const std::string &fingerprint);
  [[nodiscard]] common::Status put(const std::string &fingerprint,
                                   const std::vector<float> &vector);
  [[nodiscard]] common::Result<std::size_t> count();
  [[nodiscard]] common::Status clear();

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  common::Status open_status_ = common::Status::success();
};

} // namespace gardener::embedding
