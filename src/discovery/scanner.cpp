#include "gardener/discovery/scanner.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/observability/global.hpp"

#include <fnmatch.h>

#include <algorithm>

namespace gardener::discovery {

namespace {

constexpr const char *kComponent = "discovery";

using Clock = std::chrono::steady_clock;

class ScanDeadline {
public:
  explicit ScanDeadline(const std::chrono::milliseconds timeout)
      : started_(Clock::now()), deadline_(started_ + timeout) {}

  [[nodiscard]] bool expired() const { return Clock::now() >= deadline_; }
  [[nodiscard]] std::chrono::milliseconds elapsed() const {
    return std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - started_);
  }

private:
  Clock::time_point started_;
  Clock::time_point deadline_;
};

class ProgressThrottle {
public:
  ProgressThrottle(ProgressSink *sink, const std::chrono::milliseconds interval)
      : sink_(sink), interval_(interval), last_(Clock::now()) {}

  void maybe_report(const ScanStats &stats, const std::size_t found) {
    if (sink_ == nullptr) {
      return;
    }
    const auto now = Clock::now();
    if (now - last_ < interval_) {
      return;
    }
    last_ = now;
    notify_progress(sink_, kComponent,
                    "Scanned " + std::to_string(stats.entries_visited) + " entries, " +
                        std::to_string(found) + " files found");
  }

private:
  ProgressSink *sink_;
  std::chrono::milliseconds interval_;
  Clock::time_point last_;
};

bool matches_any(const std::vector<std::string> &patterns, const std::string &name,
                 const std::string &relative) {
  for (const auto &pattern : patterns) {
    if (pattern.empty()) {
      continue;
    }
    const bool path_pattern = pattern.find('/') != std::string::npos;
    const std::string &subject = path_pattern ? relative : name;
    if (::fnmatch(pattern.c_str(), subject.c_str(), path_pattern ? FNM_PATHNAME : 0) == 0) {
      return true;
    }
  }
  return false;
}

void record_end(const std::filesystem::path &root, const ScanDeadline &deadline,
                const ScanStats &stats, const std::size_t returned, const bool timed_out) {
  observability::record_event(observability::ScanEndEvent{
      .root = root.string(),
      .duration = deadline.elapsed(),
      .files_visited = stats.entries_visited,
      .files_returned = returned,
      .timed_out = timed_out,
  });
}

common::Result<std::vector<FileDescriptor>> timeout_failure(const std::filesystem::path &root,
                                                            const std::chrono::milliseconds timeout,
                                                            const ScanStats &stats) {
  return common::Result<std::vector<FileDescriptor>>::failure(
      "discovery of " + root.string() + " exceeded " + std::to_string(timeout.count()) +
          "ms after " + std::to_string(stats.entries_visited) + " entries",
      common::ErrorCode::DiscoveryTimeout);
}

} // namespace

const std::vector<std::string> &default_exclusion_patterns() {
  static const std::vector<std::string> patterns = {
      ".git",         ".svn",   ".hg",     ".bzr",      "node_modules", "__pycache__",
      ".pytest_cache", "venv",  "env",     ".env",      "vendor",       "target",
      "build",        "dist",   ".tox",    ".vscode",   ".idea",        ".cache",
      "*.swp",        "*.swo",  "*~",      ".DS_Store", "*.pyc",        "*.pyo",
      "*.class",      "*.o",    "*.so",    "*.dll",     "*.exe",        "*.log",
      "*.tmp",        "*.temp"};
  return patterns;
}

ScanOptions scan_options_from_config(const config::DiscoveryConfig &config) {
  ScanOptions options;
  options.progress_interval = std::chrono::milliseconds(config.progress_interval_ms);
  options.include_hidden = config.include_hidden;
  options.source_only = config.source_only;
  options.exclude_patterns = config.exclude_patterns;
  return options;
}

common::Result<std::vector<FileDescriptor>> scan(const std::filesystem::path &root,
                                                 const std::chrono::milliseconds timeout,
                                                 ProgressSink *progress,
                                                 const ScanOptions &options, ScanStats *stats_out) {
  using ScanResult = common::Result<std::vector<FileDescriptor>>;

  std::error_code ec;
  if (!std::filesystem::exists(root, ec)) {
    return ScanResult::failure("discovery root does not exist: " + root.string(),
                               common::ErrorCode::FileUtility);
  }
  if (!std::filesystem::is_directory(root, ec)) {
    return ScanResult::failure("discovery root is not a directory: " + root.string(),
                               common::ErrorCode::FileUtility);
  }

  const ScanDeadline deadline(timeout);
  ScanStats stats;
  observability::record_event(
      observability::ScanStartEvent{.root = root.string(), .timeout = timeout});

  if (deadline.expired()) {
    record_end(root, deadline, stats, 0, true);
    return timeout_failure(root, timeout, stats);
  }

  notify_progress(progress, kComponent, "Scanning " + root.string());

  std::vector<std::string> patterns = default_exclusion_patterns();
  patterns.insert(patterns.end(), options.exclude_patterns.begin(),
                  options.exclude_patterns.end());

  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    record_end(root, deadline, stats, 0, false);
    return ScanResult::failure("unable to open " + root.string() + ": " + ec.message(),
                               common::ErrorCode::FileUtility);
  }

  std::vector<FileDescriptor> found;
  ProgressThrottle throttle(progress, options.progress_interval);
  const std::filesystem::recursive_directory_iterator end;

  while (it != end) {
    if (deadline.expired()) {
      record_end(root, deadline, stats, 0, true);
      return timeout_failure(root, timeout, stats);
    }

    const auto &entry = *it;
    ++stats.entries_visited;
    const std::string name = entry.path().filename().string();
    const std::string relative = entry.path().lexically_relative(root).generic_string();

    std::error_code entry_ec;
    const bool is_dir = entry.is_directory(entry_ec) && !entry.is_symlink(entry_ec);
    const bool hidden = !options.include_hidden && !name.empty() && name.front() == '.';

    if (hidden || matches_any(patterns, name, relative)) {
      ++stats.entries_skipped;
      if (is_dir) {
        it.disable_recursion_pending();
      }
    } else if (!is_dir) {
      // is_regular_file follows symlinks; a dangling link reports false.
      if (entry.is_regular_file(entry_ec) && !entry_ec) {
        const FileType type = detect_file_type(entry.path());
        ++stats.files_classified;
        const bool is_source = type == FileType::SourceCode;
        if (is_source || !options.source_only) {
          std::error_code size_ec;
          const auto size = std::filesystem::file_size(entry.path(), size_ec);
          found.push_back(FileDescriptor{
              .path = entry.path(),
              .detected_type = type,
              .is_source = is_source,
              .language = is_source ? language_for(entry.path()) : std::nullopt,
              .size_bytes = size_ec ? 0 : size,
          });
        }
      } else {
        ++stats.entries_skipped;
      }
    }

    throttle.maybe_report(stats, found.size());

    it.increment(ec);
    if (ec) {
      record_end(root, deadline, stats, 0, false);
      return ScanResult::failure("traversal of " + root.string() + " failed: " + ec.message(),
                                 common::ErrorCode::FileUtility);
    }
  }

  if (deadline.expired()) {
    record_end(root, deadline, stats, 0, true);
    return timeout_failure(root, timeout, stats);
  }

  std::sort(found.begin(), found.end(), [](const FileDescriptor &a, const FileDescriptor &b) {
    return a.path.generic_string() < b.path.generic_string();
  });

  notify_progress(progress, kComponent,
                  "Discovered " + std::to_string(found.size()) + " files (" +
                      std::to_string(stats.entries_visited) + " entries) in " +
                      std::to_string(deadline.elapsed().count()) + "ms");
  record_end(root, deadline, stats, found.size(), false);
  if (stats_out != nullptr) {
    *stats_out = stats;
  }
  return ScanResult::success(std::move(found));
}

} // namespace gardener::discovery
