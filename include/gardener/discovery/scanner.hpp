#pragma once

#include "gardener/common/result.hpp"
#include "gardener/config/schema.hpp"
#include "gardener/discovery/file_types.hpp"
#include "gardener/discovery/progress.hpp"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gardener::discovery {

struct FileDescriptor {
  std::filesystem::path path;
  FileType detected_type = FileType::Unknown;
  bool is_source = false;
  std::optional<std::string> language;
  std::uintmax_t size_bytes = 0;
};

struct ScanOptions {
  std::chrono::milliseconds progress_interval{500};
  bool include_hidden = false;
  // When false every classified regular file is returned, not only sources.
  bool source_only = true;
  // Extra fnmatch patterns. Patterns with a '/' match the root-relative path,
  // others match the entry name.
  std::vector<std::string> exclude_patterns;
};

struct ScanStats {
  std::uint64_t entries_visited = 0;
  std::uint64_t entries_skipped = 0;
  std::uint64_t files_classified = 0;
};

[[nodiscard]] const std::vector<std::string> &default_exclusion_patterns();
[[nodiscard]] ScanOptions scan_options_from_config(const config::DiscoveryConfig &config);

/// Recursively discovers files under `root`, sorted by path.
///
/// Fails with FileUtility when `root` is missing or not a directory, and with
/// DiscoveryTimeout once `timeout` has elapsed; no partial result is returned
/// in either case. Unreadable entries and dangling symlinks are skipped.
[[nodiscard]] common::Result<std::vector<FileDescriptor>>
scan(const std::filesystem::path &root, std::chrono::milliseconds timeout,
     ProgressSink *progress = nullptr, const ScanOptions &options = {},
     ScanStats *stats = nullptr);

} // namespace gardener::discovery
