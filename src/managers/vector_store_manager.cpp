#include "gardener/managers/vector_store_manager.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/config/config.hpp"
#include "gardener/observability/global.hpp"

namespace gardener::managers {

VectorStoreManager::VectorStoreManager(config::ArtifactsConfig artifacts,
                                       const std::size_t dimensions)
    : artifacts_(std::move(artifacts)), dimensions_(dimensions) {}

VectorStoreManager::~VectorStoreManager() { unload(); }

std::filesystem::path VectorStoreManager::index_path(const std::string &project_id) const {
  return config::resolve_artifact_path(artifacts_.vector_store_path, artifacts_, project_id) /
         "index.bin";
}

common::Status VectorStoreManager::activate(const std::string &project_id) {
  const auto path = index_path(project_id);
  if (auto dir = common::ensure_dir(path.parent_path()); !dir.ok()) {
    return dir.status();
  }

  auto next = std::make_unique<VectorIndex>(dimensions_);
  if (auto loaded = next->load(path); !loaded.ok()) {
    return loaded;
  }

  // The new index is ready; the old one is persisted and dropped before any
  // write can reach the new one.
  if (index_ != nullptr) {
    release();
  }
  index_ = std::move(next);
  dirty_ = false;
  return common::Status::success();
}

void VectorStoreManager::release() {
  if (index_ == nullptr) {
    return;
  }
  if (auto saved = save_locked(); !saved.ok()) {
    observability::record_warning(std::string(name()), saved.error());
  }
  index_.reset();
  dirty_ = false;
}

common::Status VectorStoreManager::save_locked() {
  if (index_ == nullptr || !dirty_) {
    return common::Status::success();
  }
  const auto &bound = bound_project();
  if (!bound.has_value()) {
    return common::Status::success();
  }
  auto saved = index_->save(index_path(*bound));
  if (saved.ok()) {
    dirty_ = false;
  }
  return saved;
}

common::Status VectorStoreManager::check_bound(const std::string &project_id) const {
  const auto &bound = bound_project();
  if (index_ == nullptr || !bound.has_value()) {
    return common::Status::error("no vector store is open", common::ErrorCode::NotFound);
  }
  if (*bound != project_id) {
    return common::Status::error("vector store is bound to " + *bound + ", not " + project_id,
                                 common::ErrorCode::InvalidArgument);
  }
  return common::Status::success();
}

common::Status VectorStoreManager::upsert(const std::string &project_id, const std::string &key,
                                          const std::vector<float> &vector) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto bound = check_bound(project_id); !bound.ok()) {
    return bound;
  }
  auto stored = index_->upsert(key, vector);
  if (stored.ok()) {
    dirty_ = true;
  }
  return stored;
}

common::Result<std::vector<VectorMatch>>
VectorStoreManager::query(const std::string &project_id, const std::vector<float> &vector,
                          const std::size_t limit) const {
  std::lock_guard<std::mutex> lock(mutex_);
  if (auto bound = check_bound(project_id); !bound.ok()) {
    return common::Result<std::vector<VectorMatch>>::failure(bound);
  }
  return index_->query(vector, limit);
}

std::size_t VectorStoreManager::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return index_ == nullptr ? 0 : index_->size();
}

common::Status VectorStoreManager::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  return save_locked();
}

} // namespace gardener::managers
