#pragma once

#include "gardener/common/result.hpp"
#include "gardener/config/schema.hpp"
#include "gardener/embedding/embedder.hpp"
#include "gardener/embedding/embedding_cache.hpp"
#include "gardener/ingest/indexer.hpp"
#include "gardener/managers/context_manager.hpp"
#include "gardener/managers/model_loader.hpp"
#include "gardener/managers/vector_store_manager.hpp"
#include "gardener/orchestrator/orchestrator.hpp"
#include "gardener/projects/registry.hpp"

#include <memory>
#include <string>

namespace gardener::runtime {

/// Owns every long-lived component of one process. Accessors other than
/// config() require a successful open().
class RuntimeContext {
public:
  explicit RuntimeContext(config::Config config);

  [[nodiscard]] static common::Result<RuntimeContext> from_disk();

  /// Installs the observer, opens the registry and embedding cache and wires
  /// the managers into the orchestrator. With `restore_active` the project
  /// that was current when the last process exited is switched to again.
  [[nodiscard]] common::Status open(bool restore_active = true);

  [[nodiscard]] const config::Config &config() const;
  [[nodiscard]] config::Config &mutable_config();

  [[nodiscard]] projects::ProjectRegistry &registry();
  [[nodiscard]] orchestrator::SwitchOrchestrator &orchestrator();
  [[nodiscard]] managers::VectorStoreManager &vector_store();
  [[nodiscard]] managers::ModelLoader &model_loader();
  [[nodiscard]] managers::ContextManager &context();
  [[nodiscard]] embedding::IEmbedder &embedder();
  [[nodiscard]] embedding::EmbeddingCache &embedding_cache();
  [[nodiscard]] ingest::ProjectIndexer make_indexer();

private:
  void require_open() const;

  config::Config config_;
  // Declaration order is teardown order in reverse: the orchestrator goes
  // before the managers it points at.
  std::unique_ptr<projects::ProjectRegistry> registry_;
  std::unique_ptr<managers::VectorStoreManager> vector_store_;
  std::unique_ptr<managers::ModelLoader> model_loader_;
  std::unique_ptr<managers::ContextManager> context_;
  std::unique_ptr<orchestrator::SwitchOrchestrator> orchestrator_;
  std::unique_ptr<embedding::IEmbedder> embedder_;
  std::unique_ptr<embedding::EmbeddingCache> cache_;
};

/// Deletes the adapter, vector store and context artifacts of a project.
[[nodiscard]] common::Status purge_project_artifacts(const config::ArtifactsConfig &artifacts,
                                                     const std::string &project_id);

} // namespace gardener::runtime
