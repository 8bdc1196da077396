#pragma once

#include "gardener/config/schema.hpp"
#include "gardener/managers/resource_manager.hpp"
#include "gardener/managers/vector_index.hpp"

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace gardener::managers {

/// Holds the vector index of the current project. Reads and writes name the
/// project they expect; a mismatch is rejected instead of hitting another
/// project's index.
class VectorStoreManager final : public ScopedResourceManager {
public:
  VectorStoreManager(config::ArtifactsConfig artifacts, std::size_t dimensions);
  ~VectorStoreManager() override;

  [[nodiscard]] std::string_view name() const override { return "vector_store"; }

  [[nodiscard]] common::Status upsert(const std::string &project_id, const std::string &key,
                                      const std::vector<float> &vector);
  [[nodiscard]] common::Result<std::vector<VectorMatch>>
  query(const std::string &project_id, const std::vector<float> &vector, std::size_t limit) const;
  [[nodiscard]] std::size_t size() const;
  [[nodiscard]] common::Status flush();

  [[nodiscard]] std::filesystem::path index_path(const std::string &project_id) const;

protected:
  [[nodiscard]] common::Status activate(const std::string &project_id) override;
  void release() override;

private:
  [[nodiscard]] common::Status check_bound(const std::string &project_id) const;
  [[nodiscard]] common::Status save_locked();

  config::ArtifactsConfig artifacts_;
  std::size_t dimensions_;
  std::unique_ptr<VectorIndex> index_;
  bool dirty_ = false;
};

} // namespace gardener::managers
