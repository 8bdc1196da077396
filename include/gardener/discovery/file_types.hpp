#pragma once

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace gardener::discovery {

enum class FileType { SourceCode, Text, Binary, Image, Document, Archive, Unknown };

[[nodiscard]] std::string_view file_type_name(FileType type);

/// `extension` is lowercase and includes the dot (".cpp").
[[nodiscard]] bool is_source_extension(const std::string &extension);

[[nodiscard]] std::optional<std::string> language_for(const std::filesystem::path &path);

/// Classifies by extension first, then sniffs the first 1 KiB of small files
/// (a NUL byte means binary). Missing or unreadable files are Unknown.
[[nodiscard]] FileType detect_file_type(const std::filesystem::path &path);

} // namespace gardener::discovery
