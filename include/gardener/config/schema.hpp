#pragma once

#include <cstdint>
#include <string>
#include <vector>

namespace gardener::config {

struct DiscoveryConfig {
  std::uint32_t timeout_seconds = 30;
  std::uint32_t progress_interval_ms = 500;
  bool include_hidden = false;
  bool source_only = true;
  // Added on top of the built-in VCS/dependency/build exclusions.
  std::vector<std::string> exclude_patterns;
};

struct EmbeddingConfig {
  std::string provider = "local";
  std::string model = "local-hash-384";
  std::string config_version = "1";
  std::size_t dimensions = 384;
  std::size_t memory_cache_entries = 1000;
  std::string cache_path = "{data_dir}/embedding_cache.db";
};

struct ChunkingConfig {
  std::size_t max_chunk_size = 2048;
  std::size_t min_chunk_size = 50;
  std::size_t overlap = 100;
};

/// Path templates. `{data_dir}` and `{project_id}` are substituted at use.
struct ArtifactsConfig {
  std::string data_dir = "~/.gardener";
  std::string registry_path = "{data_dir}/registry.db";
  std::string adapter_path = "{data_dir}/projects/{project_id}/adapter";
  std::string vector_store_path = "{data_dir}/projects/{project_id}/vectors";
  std::string context_path = "{data_dir}/projects/{project_id}/context.jsonl";
};

struct ModelLoaderConfig {
  std::size_t max_adapters = 2;
};

struct ContextConfig {
  std::size_t max_messages = 50;
  std::size_t max_active_contexts = 10;
  std::size_t max_context_chars = 4000;
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool verbose = false;
};

struct Config {
  DiscoveryConfig discovery;
  EmbeddingConfig embedding;
  ChunkingConfig chunking;
  ArtifactsConfig artifacts;
  ModelLoaderConfig model_loader;
  ContextConfig context;
  ObservabilityConfig observability;
};

} // namespace gardener::config
