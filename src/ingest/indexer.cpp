#include "gardener/ingest/indexer.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/discovery/scanner.hpp"
#include "gardener/embedding/fingerprint.hpp"
#include "gardener/ingest/chunker.hpp"
#include "gardener/observability/global.hpp"

#include <map>

namespace gardener::ingest {

namespace {

constexpr const char *kComponent = "indexer";
constexpr std::size_t kProgressEveryFiles = 25;

std::optional<std::string> dominant_language(const std::vector<discovery::FileDescriptor> &files) {
  std::map<std::string, std::size_t> counts;
  for (const auto &file : files) {
    if (file.language.has_value()) {
      ++counts[*file.language];
    }
  }
  std::optional<std::string> best;
  std::size_t best_count = 0;
  for (const auto &[language, count] : counts) {
    if (count > best_count) {
      best = language;
      best_count = count;
    }
  }
  return best;
}

} // namespace

ProjectIndexer::ProjectIndexer(projects::ProjectRegistry &registry,
                               orchestrator::SwitchOrchestrator &orchestrator,
                               managers::VectorStoreManager &vector_store,
                               embedding::EmbeddingCache &cache, embedding::IEmbedder &embedder,
                               const config::Config &config)
    : registry_(registry), orchestrator_(orchestrator), vector_store_(vector_store), cache_(cache),
      embedder_(embedder), config_(config) {}

common::Result<IndexReport> ProjectIndexer::index_current(discovery::ProgressSink *progress) {
  const auto current = orchestrator_.current_project();
  if (!current.has_value()) {
    return common::Result<IndexReport>::failure("no active project; switch to one first",
                                                common::ErrorCode::NotFound);
  }
  auto record = registry_.get(*current);
  if (!record.ok()) {
    return common::Result<IndexReport>::failure(record.status());
  }
  const auto &project = record.value();

  IndexReport report;
  report.project_id = project.id;

  const auto options = discovery::scan_options_from_config(config_.discovery);
  auto files = discovery::scan(project.source_path,
                               std::chrono::seconds(config_.discovery.timeout_seconds), progress,
                               options);
  if (!files.ok()) {
    return common::Result<IndexReport>::failure(files.status());
  }
  report.files_discovered = files.value().size();
  if (auto counted =
          registry_.set_file_count(project.id, files.value().size(), dominant_language(files.value()));
      !counted.ok()) {
    observability::record_warning(kComponent, "file count not recorded: " + counted.error());
  }

  const std::string identity = embedder_.identity();
  const std::string &version = config_.embedding.config_version;

  std::size_t processed = 0;
  for (const auto &file : files.value()) {
    ++processed;
    if (processed % kProgressEveryFiles == 0) {
      discovery::notify_progress(progress, kComponent,
                                 "indexed " + std::to_string(processed) + "/" +
                                     std::to_string(report.files_discovered) + " files");
    }

    auto content = common::read_file(file.path);
    if (!content.ok()) {
      ++report.files_skipped;
      report.errors.push_back(content.error());
      continue;
    }

    std::error_code ec;
    const std::string relative =
        std::filesystem::relative(file.path, project.source_path, ec).generic_string();
    const std::string key_base = ec ? file.path.generic_string() : relative;

    bool file_ok = true;
    for (const auto &chunk : chunk_source(content.value(), config_.chunking)) {
      ++report.chunks;
      const std::string fingerprint = embedding::make_fingerprint(chunk.content, identity, version);
      bool computed = false;
      auto vector = cache_.get_or_compute(fingerprint, [&](const std::string &) {
        computed = true;
        return embedder_.embed(chunk.content);
      });
      if (!vector.ok()) {
        file_ok = false;
        report.errors.push_back(key_base + ": " + vector.error());
        continue;
      }
      if (computed) {
        ++report.embeddings_computed;
      } else {
        ++report.embeddings_reused;
      }

      const std::string key = key_base + "#L" + std::to_string(chunk.start_line) + "-" +
                              std::to_string(chunk.end_line);
      if (auto stored = vector_store_.upsert(project.id, key, vector.value()); !stored.ok()) {
        // The store moved to another project or is unusable; continuing
        // would only repeat the failure.
        return common::Result<IndexReport>::failure(stored);
      }
      ++report.vectors_stored;
    }
    if (file_ok) {
      ++report.files_indexed;
    } else {
      ++report.files_skipped;
    }
  }

  if (auto flushed = vector_store_.flush(); !flushed.ok()) {
    return common::Result<IndexReport>::failure(flushed);
  }
  discovery::notify_progress(progress, kComponent,
                             "indexed " + std::to_string(report.files_indexed) + " files, " +
                                 std::to_string(report.vectors_stored) + " chunks");
  return common::Result<IndexReport>::success(std::move(report));
}

} // namespace gardener::ingest
