#include "gardener/storage/sqlite_util.hpp"

namespace gardener::storage {

common::Status exec_sql(sqlite3 *db, const std::string &sql) {
  char *err = nullptr;
  const int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err);
  if (rc != SQLITE_OK) {
    const std::string message = err == nullptr ? "sqlite error" : err;
    if (err != nullptr) {
      sqlite3_free(err);
    }
    return common::Status::error(message, common::ErrorCode::Storage);
  }
  return common::Status::success();
}

common::Status sqlite_error(sqlite3 *db, const std::string &context) {
  const std::string detail = db == nullptr ? "database is not open" : sqlite3_errmsg(db);
  return common::Status::error(context + ": " + detail, common::ErrorCode::Storage);
}

std::string column_text(sqlite3_stmt *stmt, const int column) {
  const auto *text = sqlite3_column_text(stmt, column);
  if (text == nullptr) {
    return "";
  }
  return std::string(reinterpret_cast<const char *>(text),
                     static_cast<std::size_t>(sqlite3_column_bytes(stmt, column)));
}

} // namespace gardener::storage
