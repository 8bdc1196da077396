#include "gardener/runtime/app.hpp"

#include "gardener/config/config.hpp"
#include "gardener/health/health.hpp"
#include "gardener/observability/factory.hpp"
#include "gardener/observability/global.hpp"

#include <stdexcept>

namespace gardener::runtime {

RuntimeContext::RuntimeContext(config::Config config) : config_(std::move(config)) {}

common::Result<RuntimeContext> RuntimeContext::from_disk() {
  auto loaded = config::load_config();
  if (!loaded.ok()) {
    return common::Result<RuntimeContext>::failure(loaded.status());
  }
  return common::Result<RuntimeContext>::success(RuntimeContext(std::move(loaded.value())));
}

common::Status RuntimeContext::open(const bool restore_active) {
  observability::set_global_observer(observability::create_observer(config_.observability));

  auto validated = config::validate_config(config_);
  if (!validated.ok()) {
    return validated.status();
  }
  for (const auto &warning : validated.value()) {
    observability::record_warning("config", warning);
  }

  const auto &artifacts = config_.artifacts;
  registry_ = std::make_unique<projects::ProjectRegistry>(
      config::resolve_artifact_path(artifacts.registry_path, artifacts));
  if (!registry_->open_status().ok()) {
    health::mark_component_error("registry", registry_->open_status().error());
    return registry_->open_status();
  }
  health::mark_component_ok("registry");

  auto embedder = embedding::create_embedder(config_.embedding);
  if (!embedder.ok()) {
    return embedder.status();
  }
  embedder_ = std::move(embedder.value());

  auto disk = std::make_unique<embedding::SqliteEmbeddingStore>(
      config::resolve_artifact_path(config_.embedding.cache_path, artifacts));
  if (!disk->open_status().ok()) {
    // The memory tier still works; only persistence across runs is lost.
    observability::record_warning("embedding_cache",
                                  "persistent tier unavailable: " + disk->open_status().error());
    health::mark_component_error("embedding_cache", disk->open_status().error());
    disk.reset();
  } else {
    health::mark_component_ok("embedding_cache");
  }
  cache_ = std::make_unique<embedding::EmbeddingCache>(std::move(disk),
                                                       config_.embedding.memory_cache_entries);

  vector_store_ =
      std::make_unique<managers::VectorStoreManager>(artifacts, config_.embedding.dimensions);
  model_loader_ =
      std::make_unique<managers::ModelLoader>(artifacts, config_.model_loader.max_adapters);
  context_ = std::make_unique<managers::ContextManager>(artifacts, config_.context);
  orchestrator_ = std::make_unique<orchestrator::SwitchOrchestrator>(
      *registry_, std::vector<managers::IResourceManager *>{vector_store_.get(),
                                                            model_loader_.get(), context_.get()});

  if (restore_active) {
    if (auto restored = orchestrator_->restore(); restored.has_value() && !restored->success) {
      observability::record_warning("runtime", restored->message);
    }
  }
  return common::Status::success();
}

void RuntimeContext::require_open() const {
  if (orchestrator_ == nullptr) {
    throw std::logic_error("runtime context used before open()");
  }
}

const config::Config &RuntimeContext::config() const { return config_; }

config::Config &RuntimeContext::mutable_config() { return config_; }

projects::ProjectRegistry &RuntimeContext::registry() {
  require_open();
  return *registry_;
}

orchestrator::SwitchOrchestrator &RuntimeContext::orchestrator() {
  require_open();
  return *orchestrator_;
}

managers::VectorStoreManager &RuntimeContext::vector_store() {
  require_open();
  return *vector_store_;
}

managers::ModelLoader &RuntimeContext::model_loader() {
  require_open();
  return *model_loader_;
}

managers::ContextManager &RuntimeContext::context() {
  require_open();
  return *context_;
}

embedding::IEmbedder &RuntimeContext::embedder() {
  require_open();
  return *embedder_;
}

embedding::EmbeddingCache &RuntimeContext::embedding_cache() {
  require_open();
  return *cache_;
}

ingest::ProjectIndexer RuntimeContext::make_indexer() {
  require_open();
  return ingest::ProjectIndexer(*registry_, *orchestrator_, *vector_store_, *cache_, *embedder_,
                                config_);
}

common::Status purge_project_artifacts(const config::ArtifactsConfig &artifacts,
                                       const std::string &project_id) {
  if (project_id.empty()) {
    return common::Status::error("project id must not be empty",
                                 common::ErrorCode::InvalidArgument);
  }
  const std::vector<std::string> templates = {artifacts.adapter_path, artifacts.vector_store_path,
                                              artifacts.context_path};
  for (const auto &path_template : templates) {
    // Only remove paths that are specific to this project.
    if (path_template.find("{project_id}") == std::string::npos) {
      continue;
    }
    const auto path = config::resolve_artifact_path(path_template, artifacts, project_id);
    std::error_code ec;
    std::filesystem::remove_all(path, ec);
    if (ec) {
      return common::Status::error("failed to remove " + path.string() + ": " + ec.message(),
                                   common::ErrorCode::Storage);
    }
  }
  return common::Status::success();
}

} // namespace gardener::runtime
