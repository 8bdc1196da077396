#pragma once

#include "gardener/common/result.hpp"

#include <sqlite3.h>
#include <string>

namespace gardener::storage {

[[nodiscard]] common::Status exec_sql(sqlite3 *db, const std::string &sql);

/// Storage-coded status carrying `context` and sqlite's last error message.
[[nodiscard]] common::Status sqlite_error(sqlite3 *db, const std::string &context);

/// Text column as std::string; NULL maps to "".
[[nodiscard]] std::string column_text(sqlite3_stmt *stmt, int column);

} // namespace gardener::storage
