#include "gardener/managers/model_loader.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/common/hash.hpp"
#include "gardener/config/config.hpp"
#include "gardener/observability/global.hpp"

#include <algorithm>

namespace gardener::managers {

namespace {

struct AdapterFile {
  std::string relative;
  std::filesystem::path path;
};

common::Result<std::vector<AdapterFile>> list_adapter_files(const std::filesystem::path &root) {
  std::vector<AdapterFile> files;
  std::error_code ec;
  std::filesystem::recursive_directory_iterator it(
      root, std::filesystem::directory_options::skip_permission_denied, ec);
  if (ec) {
    return common::Result<std::vector<AdapterFile>>::failure(
        "failed to read adapter directory " + root.string() + ": " + ec.message(),
        common::ErrorCode::Storage);
  }
  for (const auto end = std::filesystem::recursive_directory_iterator(); it != end;
       it.increment(ec)) {
    if (ec) {
      return common::Result<std::vector<AdapterFile>>::failure(
          "failed to walk adapter directory " + root.string() + ": " + ec.message(),
          common::ErrorCode::Storage);
    }
    if (!it->is_regular_file(ec)) {
      continue;
    }
    files.push_back(AdapterFile{
        .relative = std::filesystem::relative(it->path(), root, ec).generic_string(),
        .path = it->path(),
    });
  }
  std::sort(files.begin(), files.end(),
            [](const AdapterFile &lhs, const AdapterFile &rhs) { return lhs.relative < rhs.relative; });
  return common::Result<std::vector<AdapterFile>>::success(std::move(files));
}

} // namespace

common::Result<AdapterHandle> inspect_adapter(const std::filesystem::path &path) {
  std::error_code ec;
  const auto status = std::filesystem::status(path, ec);
  if (ec || !std::filesystem::exists(status)) {
    return common::Result<AdapterHandle>::failure("adapter artifact missing: " + path.string(),
                                                  common::ErrorCode::NotFound);
  }

  AdapterHandle handle;
  handle.path = path;
  if (std::filesystem::is_regular_file(status)) {
    auto digest = common::sha256_file_hex(path);
    if (!digest.ok()) {
      return common::Result<AdapterHandle>::failure(digest.status());
    }
    handle.size_bytes = std::filesystem::file_size(path, ec);
    handle.file_count = 1;
    handle.checksum = digest.value();
    return common::Result<AdapterHandle>::success(std::move(handle));
  }

  auto files = list_adapter_files(path);
  if (!files.ok()) {
    return common::Result<AdapterHandle>::failure(files.status());
  }
  if (files.value().empty()) {
    return common::Result<AdapterHandle>::failure("adapter artifact is empty: " + path.string(),
                                                  common::ErrorCode::NotFound);
  }

  // Directory checksum: hash of "relative-path:file-digest" lines in path order.
  std::string manifest;
  for (const auto &file : files.value()) {
    auto digest = common::sha256_file_hex(file.path);
    if (!digest.ok()) {
      return common::Result<AdapterHandle>::failure(digest.status());
    }
    manifest += file.relative + ":" + digest.value() + "\n";
    handle.size_bytes += std::filesystem::file_size(file.path, ec);
  }
  handle.file_count = files.value().size();
  handle.checksum = common::sha256_hex(manifest);
  return common::Result<AdapterHandle>::success(std::move(handle));
}

ModelLoader::ModelLoader(config::ArtifactsConfig artifacts, const std::size_t max_adapters)
    : artifacts_(std::move(artifacts)), resident_(max_adapters) {}

ModelLoader::~ModelLoader() { unload(); }

std::filesystem::path ModelLoader::adapter_path(const std::string &project_id) const {
  return config::resolve_artifact_path(artifacts_.adapter_path, artifacts_, project_id);
}

common::Status ModelLoader::activate(const std::string &project_id) {
  const auto path = adapter_path(project_id);
  std::error_code ec;
  if (!std::filesystem::exists(path, ec)) {
    resident_.erase(project_id);
    return common::Status::error("adapter artifact missing: " + path.string(),
                                 common::ErrorCode::NotFound);
  }

  if (const AdapterHandle *cached = resident_.find(project_id);
      cached != nullptr && cached->path == path) {
    active_ = *cached;
    return common::Status::success();
  }

  auto inspected = inspect_adapter(path);
  if (!inspected.ok()) {
    return inspected.status();
  }
  AdapterHandle handle = std::move(inspected.value());
  handle.project_id = project_id;
  handle.loaded_at = common::now_rfc3339();

  if (auto evicted = resident_.put(project_id, handle); evicted.has_value()) {
    observability::record_progress(std::string(name()),
                                   "evicted resident adapter for " + evicted->first);
  }
  active_ = std::move(handle);
  return common::Status::success();
}

void ModelLoader::release() { active_.reset(); }

std::optional<AdapterHandle> ModelLoader::active_adapter() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return active_;
}

std::vector<std::string> ModelLoader::resident_adapters() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return resident_.keys();
}

} // namespace gardener::managers
