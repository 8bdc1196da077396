#pragma once

#include "gardener/common/result.hpp"
#include <filesystem>
#include <string>

namespace gardener::common {

[[nodiscard]] std::string trim(const std::string &input);
[[nodiscard]] bool starts_with(const std::string &value, const std::string &prefix);
[[nodiscard]] std::string to_lower(std::string value);
[[nodiscard]] Result<std::filesystem::path> home_dir();
[[nodiscard]] Result<std::filesystem::path> ensure_dir(const std::filesystem::path &path);
[[nodiscard]] std::string expand_path(std::string value);

/// Read a whole file into memory.
[[nodiscard]] Result<std::string> read_file(const std::filesystem::path &path);

/// Write `content` to `<path>.tmp` and rename it over `path`, creating parents.
[[nodiscard]] Status write_file_atomic(const std::filesystem::path &path,
                                       const std::string &content);

/// UTC timestamp formatted as YYYY-MM-DDTHH:MM:SSZ.
[[nodiscard]] std::string now_rfc3339();

} // namespace gardener::common
