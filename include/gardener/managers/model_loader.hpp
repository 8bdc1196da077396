#pragma once

#include "gardener/common/lru_cache.hpp"
#include "gardener/config/schema.hpp"
#include "gardener/managers/resource_manager.hpp"

#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace gardener::managers {

struct AdapterHandle {
  std::string project_id;
  std::filesystem::path path;
  std::uintmax_t size_bytes = 0;
  std::size_t file_count = 0;
  std::string checksum;
  std::string loaded_at;
};

/// Activates the trained adapter artifact of the current project. Recently
/// used adapters stay resident so switching back does not re-read them.
class ModelLoader final : public ScopedResourceManager {
public:
  ModelLoader(config::ArtifactsConfig artifacts, std::size_t max_adapters);
  ~ModelLoader() override;

  [[nodiscard]] std::string_view name() const override { return "model_loader"; }

  [[nodiscard]] std::optional<AdapterHandle> active_adapter() const;
  /// Project ids of resident adapters, most recently used first.
  [[nodiscard]] std::vector<std::string> resident_adapters() const;
  [[nodiscard]] std::filesystem::path adapter_path(const std::string &project_id) const;

protected:
  [[nodiscard]] common::Status activate(const std::string &project_id) override;
  void release() override;

private:
  config::ArtifactsConfig artifacts_;
  common::LruCache<std::string, AdapterHandle> resident_;
  std::optional<AdapterHandle> active_;
};

/// Size, file count and SHA-256 of an adapter file or directory.
[[nodiscard]] common::Result<AdapterHandle> inspect_adapter(const std::filesystem::path &path);

} // namespace gardener::managers
