#pragma once

#include "gardener/common/result.hpp"

#include <filesystem>
#include <string>

namespace gardener::common {

[[nodiscard]] std::string sha256_hex(const std::string &data);

/// Streams the file through SHA-256 so large artifacts are not loaded whole.
[[nodiscard]] Result<std::string> sha256_file_hex(const std::filesystem::path &path);

/// RFC 4122 version 4 identifier, e.g. "3f2b8c1e-9a4d-4c7e-8b1a-2d9e5f6a7b8c".
[[nodiscard]] Result<std::string> generate_uuid_v4();

} // namespace gardener::common
