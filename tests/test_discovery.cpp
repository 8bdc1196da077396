#include "test_framework.hpp"

#include "gardener/discovery/file_types.hpp"
#include "gardener/discovery/progress.hpp"
#include "gardener/discovery/scanner.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <algorithm>
#include <stdexcept>
#include <thread>

#include <unistd.h>

namespace {

class CollectingSink final : public gardener::discovery::ProgressSink {
public:
  void on_progress(const std::string &message) override { messages.push_back(message); }
  std::vector<std::string> messages;
};

class ThrowingSink final : public gardener::discovery::ProgressSink {
public:
  void on_progress(const std::string &) override { throw std::runtime_error("sink closed"); }
};

class ThrowsIntSink final : public gardener::discovery::ProgressSink {
public:
  void on_progress(const std::string &) override { throw 42; }
};

/// Stalls on every message so a short deadline runs out mid-walk.
class SlowSink final : public gardener::discovery::ProgressSink {
public:
  void on_progress(const std::string &) override {
    ++calls;
    std::this_thread::sleep_for(std::chrono::milliseconds(25));
  }
  int calls = 0;
};

/// Restores owner permissions so the workspace can be removed.
class PermissionGuard {
public:
  explicit PermissionGuard(std::filesystem::path path) : path_(std::move(path)) {
    std::filesystem::permissions(path_, std::filesystem::perms::none);
  }
  ~PermissionGuard() {
    std::error_code ec;
    std::filesystem::permissions(path_, std::filesystem::perms::owner_all, ec);
  }
  PermissionGuard(const PermissionGuard &) = delete;
  PermissionGuard &operator=(const PermissionGuard &) = delete;

private:
  std::filesystem::path path_;
};

std::vector<std::string> relative_paths(const std::vector<gardener::discovery::FileDescriptor> &files,
                                        const std::filesystem::path &root) {
  std::vector<std::string> out;
  out.reserve(files.size());
  for (const auto &file : files) {
    out.push_back(file.path.lexically_relative(root).generic_string());
  }
  return out;
}

constexpr std::chrono::milliseconds kGenerous{30000};

} // namespace

void register_discovery_tests(std::vector<gardener::tests::TestCase> &tests) {
  using gardener::tests::require;
  namespace discovery = gardener::discovery;
  using gardener::common::ErrorCode;

  tests.push_back({"discovery_file_type_detection", [] {
                     gardener::testing::TempWorkspace ws;
                     ws.create_file("main.cpp", "int main() {}\n");
                     ws.create_file("notes.txt", "plain\n");
                     ws.create_file("blob", std::string("ab\0cd", 5));
                     ws.create_file("README", "no extension\n");
                     ws.create_file("logo.PNG", "fake");
                     require(discovery::detect_file_type(ws.path() / "main.cpp") ==
                                 discovery::FileType::SourceCode,
                             "cpp is source");
                     require(discovery::detect_file_type(ws.path() / "notes.txt") ==
                                 discovery::FileType::Text,
                             "txt is text");
                     require(discovery::detect_file_type(ws.path() / "blob") ==
                                 discovery::FileType::Binary,
                             "NUL byte means binary");
                     require(discovery::detect_file_type(ws.path() / "README") ==
                                 discovery::FileType::Text,
                             "sniffed text");
                     require(discovery::detect_file_type(ws.path() / "logo.PNG") ==
                                 discovery::FileType::Image,
                             "extension match is case-insensitive");
                     require(discovery::detect_file_type(ws.path() / "missing.cpp") ==
                                 discovery::FileType::Unknown,
                             "missing file is unknown");
                   }});

  tests.push_back({"discovery_language_mapping", [] {
                     require(discovery::language_for("a/b.py").value_or("") == "python", "py");
                     require(discovery::language_for("x.HPP").value_or("") == "cpp", "hpp");
                     require(!discovery::language_for("x.unknown").has_value(), "unknown");
                     require(discovery::file_type_name(discovery::FileType::SourceCode) ==
                                 "source_code",
                             "type name");
                   }});

  tests.push_back({"discovery_scan_returns_sorted_sources", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::write_source_tree(ws.path(), 10);
                     ws.create_file("notes.txt", "not source\n");
                     discovery::ScanStats stats;
                     const auto result =
                         discovery::scan(ws.path(), kGenerous, nullptr, {}, &stats);
                     require(result.ok(), result.error());
                     const auto paths = relative_paths(result.value(), ws.path());
                     require(paths.size() == 10, "expected 10 sources, got " +
                                                     std::to_string(paths.size()));
                     require(std::is_sorted(paths.begin(), paths.end()), "sorted by path");
                     for (const auto &file : result.value()) {
                       require(file.is_source, "source only");
                       require(file.language.value_or("") == "python", "language");
                       require(file.size_bytes > 0, "size recorded");
                     }
                     require(stats.entries_visited >= 12, "stats filled in");
                   }});

  tests.push_back({"discovery_scan_all_files_when_not_source_only", [] {
                     gardener::testing::TempWorkspace ws;
                     ws.create_file("a.py", "x = 1\n");
                     ws.create_file("b.txt", "text\n");
                     discovery::ScanOptions options;
                     options.source_only = false;
                     const auto result = discovery::scan(ws.path(), kGenerous, nullptr, options);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "both files returned");
                     require(!result.value()[1].is_source, "txt is not source");
                   }});

  tests.push_back({"discovery_scan_applies_exclusions", [] {
                     gardener::testing::TempWorkspace ws;
                     ws.create_file("src/app.py", "print(1)\n");
                     ws.create_file("node_modules/lib/index.js", "module.exports = 1;\n");
                     ws.create_file(".git/hooks/pre-commit.sh", "#!/bin/sh\n");
                     ws.create_file("build/gen.cpp", "int x;\n");
                     ws.create_file("docs/guide.md", "# guide\n");
                     ws.create_file("src/app.pyc", "bytecode");
                     discovery::ScanOptions options;
                     options.exclude_patterns = {"docs/*"};
                     const auto result = discovery::scan(ws.path(), kGenerous, nullptr, options);
                     require(result.ok(), result.error());
                     const auto paths = relative_paths(result.value(), ws.path());
                     require(paths.size() == 1 && paths.front() == "src/app.py",
                             "only src/app.py should survive");
                   }});

  tests.push_back({"discovery_scan_hidden_files_opt_in", [] {
                     gardener::testing::TempWorkspace ws;
                     ws.create_file(".config/settings.json", "{}\n");
                     ws.create_file("visible.js", "let a;\n");
                     const auto hidden_off = discovery::scan(ws.path(), kGenerous);
                     require(hidden_off.ok() && hidden_off.value().size() == 1, "hidden skipped");
                     discovery::ScanOptions options;
                     options.include_hidden = true;
                     const auto hidden_on = discovery::scan(ws.path(), kGenerous, nullptr, options);
                     require(hidden_on.ok() && hidden_on.value().size() == 2,
                             "hidden included on request");
                   }});

  tests.push_back({"discovery_zero_timeout_fails", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::write_source_tree(ws.path(), 3);
                     const auto result = discovery::scan(ws.path(), std::chrono::milliseconds(0));
                     require(!result.ok(), "zero timeout should fail");
                     require(result.code() == ErrorCode::DiscoveryTimeout, "timeout code");
                   }});

  tests.push_back({"discovery_deadline_expires_mid_traversal", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::write_source_tree(ws.path(), 40);
                     SlowSink sink;
                     discovery::ScanOptions options;
                     options.progress_interval = std::chrono::milliseconds(0);
                     const auto result = discovery::scan(ws.path(), std::chrono::milliseconds(100),
                                                         &sink, options);
                     require(!result.ok(), "slow walk should time out");
                     require(result.code() == ErrorCode::DiscoveryTimeout, result.error());
                     require(sink.calls >= 2, "traversal had started");
                   }});

  tests.push_back({"discovery_missing_root_is_file_utility_error", [] {
                     gardener::testing::TempWorkspace ws;
                     const auto missing = discovery::scan(ws.path() / "nope", kGenerous);
                     require(!missing.ok() && missing.code() == ErrorCode::FileUtility,
                             "missing root");
                     ws.create_file("plain.py", "x = 1\n");
                     const auto file_root = discovery::scan(ws.path() / "plain.py", kGenerous);
                     require(!file_root.ok() && file_root.code() == ErrorCode::FileUtility,
                             "file as root");
                     // Root validation wins over an already expired deadline.
                     const auto both =
                         discovery::scan(ws.path() / "nope", std::chrono::milliseconds(0));
                     require(both.code() == ErrorCode::FileUtility, "root checked first");
                   }});

  tests.push_back({"discovery_skips_dangling_symlink", [] {
                     gardener::testing::TempWorkspace ws;
                     ws.create_file("real.py", "x = 1\n");
                     std::error_code ec;
                     std::filesystem::create_symlink(ws.path() / "gone.py", ws.path() / "link.py",
                                                     ec);
                     const auto result = discovery::scan(ws.path(), kGenerous);
                     require(result.ok(), result.error());
                     require(result.value().size() == 1, "dangling link ignored");
                   }});

  tests.push_back({"discovery_skips_unreadable_directory", [] {
                     if (::geteuid() == 0) {
                       return; // root reads through permission bits
                     }
                     gardener::testing::TempWorkspace ws;
                     ws.create_file("open.py", "x = 1\n");
                     ws.create_file("locked/hidden_away.py", "y = 2\n");
                     PermissionGuard guard(ws.path() / "locked");
                     const auto result = discovery::scan(ws.path(), kGenerous);
                     require(result.ok(), result.error());
                     const auto paths = relative_paths(result.value(), ws.path());
                     require(paths == std::vector<std::string>{"open.py"},
                             "unreadable directory skipped");
                   }});

  tests.push_back({"discovery_progress_reported", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::write_source_tree(ws.path(), 4);
                     CollectingSink sink;
                     discovery::ScanOptions options;
                     options.progress_interval = std::chrono::milliseconds(0);
                     const auto result = discovery::scan(ws.path(), kGenerous, &sink, options);
                     require(result.ok(), result.error());
                     require(sink.messages.size() >= 2, "start and summary lines");
                     require(sink.messages.back().rfind("Discovered 4 files", 0) == 0,
                             "summary line: " + sink.messages.back());
                   }});

  tests.push_back({"discovery_failing_sink_does_not_abort", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::write_source_tree(ws.path(), 2);
                     gardener::testing::ScopedRecordingObserver scoped;
                     ThrowingSink sink;
                     const auto result = discovery::scan(ws.path(), kGenerous, &sink);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "scan completes");
                     require(!scoped.observer()
                                  .events_of<gardener::observability::WarningEvent>()
                                  .empty(),
                             "sink failure logged");

                     ThrowsIntSink odd;
                     discovery::ScanOptions options;
                     options.progress_interval = std::chrono::milliseconds(0);
                     const auto again = discovery::scan(ws.path(), kGenerous, &odd, options);
                     require(again.ok(), again.error());
                     require(again.value().size() == 2, "non-standard throw does not abort");
                   }});

  tests.push_back({"discovery_scan_events_emitted", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::write_source_tree(ws.path(), 1);
                     gardener::testing::ScopedRecordingObserver scoped;
                     const auto timed_out =
                         discovery::scan(ws.path(), std::chrono::milliseconds(0));
                     require(!timed_out.ok(), "should time out");
                     const auto ends =
                         scoped.observer().events_of<gardener::observability::ScanEndEvent>();
                     require(ends.size() == 1 && ends.front().timed_out, "timeout recorded");
                   }});
}
