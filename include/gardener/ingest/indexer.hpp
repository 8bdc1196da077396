#pragma once

#include "gardener/common/result.hpp"
#include "gardener/config/schema.hpp"
#include "gardener/discovery/progress.hpp"
#include "gardener/embedding/embedder.hpp"
#include "gardener/embedding/embedding_cache.hpp"
#include "gardener/managers/vector_store_manager.hpp"
#include "gardener/orchestrator/orchestrator.hpp"
#include "gardener/projects/registry.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace gardener::ingest {

struct IndexReport {
  std::string project_id;
  std::size_t files_discovered = 0;
  std::size_t files_indexed = 0;
  std::size_t files_skipped = 0;
  std::size_t chunks = 0;
  std::size_t embeddings_computed = 0;
  std::size_t embeddings_reused = 0;
  std::size_t vectors_stored = 0;
  std::vector<std::string> errors;
};

/// Discovers, chunks and embeds the current project's sources into its
/// vector store. Embeddings go through the cache, so unchanged chunks are
/// never recomputed.
class ProjectIndexer {
public:
  ProjectIndexer(projects::ProjectRegistry &registry, orchestrator::SwitchOrchestrator &orchestrator,
                 managers::VectorStoreManager &vector_store, embedding::EmbeddingCache &cache,
                 embedding::IEmbedder &embedder, const config::Config &config);

  /// Per-file failures are collected in the report; discovery and vector
  /// store failures abort the run.
  [[nodiscard]] common::Result<IndexReport> index_current(discovery::ProgressSink *progress = nullptr);

private:
  projects::ProjectRegistry &registry_;
  orchestrator::SwitchOrchestrator &orchestrator_;
  managers::VectorStoreManager &vector_store_;
  embedding::EmbeddingCache &cache_;
  embedding::IEmbedder &embedder_;
  const config::Config &config_;
};

} // namespace gardener::ingest
