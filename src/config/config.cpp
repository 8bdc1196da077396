#include "gardener/config/config.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/common/toml.hpp"

#include <charconv>
#include <cstdlib>
#include <sstream>

namespace gardener::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".gardener";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("GARDENER_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string bool_to_toml(const bool value) { return value ? "true" : "false"; }

void replace_all(std::string &text, const std::string &needle, const std::string &value) {
  std::size_t pos = 0;
  while ((pos = text.find(needle, pos)) != std::string::npos) {
    text.replace(pos, needle.size(), value);
    pos += value.size();
  }
}

bool known_observability_backend(const std::string &backend) {
  const std::string normalized = common::to_lower(common::trim(backend));
  return normalized == "log" || normalized == "none" || normalized == "noop";
}

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::ensure_dir(*override_path);
    }
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure(
            "unable to resolve current directory", common::ErrorCode::FileUtility);
      }
    }
    return common::ensure_dir(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.status());
  }
  return common::ensure_dir(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    std::error_code ec;
    if (std::filesystem::is_directory(*override_path, ec) || override_path->filename().empty()) {
      return common::Result<std::filesystem::path>::success(*override_path / CONFIG_FILENAME);
    }
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto dir = config_dir();
  if (!dir.ok()) {
    return dir;
  }
  return common::Result<std::filesystem::path>::success(dir.value() / CONFIG_FILENAME);
}

bool config_exists() {
  const auto path = config_path();
  std::error_code ec;
  return path.ok() && std::filesystem::exists(path.value(), ec);
}

std::optional<std::filesystem::path> config_path_override() { return g_config_path_override; }

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

void apply_env_overrides(Config &config) {
  if (const char *data_dir = std::getenv("GARDENER_DATA_DIR"); data_dir != nullptr && *data_dir) {
    config.artifacts.data_dir = data_dir;
  }

  if (const char *timeout = std::getenv("GARDENER_DISCOVERY_TIMEOUT");
      timeout != nullptr && *timeout) {
    const std::string raw = common::trim(timeout);
    std::uint32_t parsed = 0;
    const auto [ptr, ec] = std::from_chars(raw.data(), raw.data() + raw.size(), parsed);
    if (ec == std::errc() && ptr == raw.data() + raw.size()) {
      config.discovery.timeout_seconds = parsed;
    }
  }

  if (const char *model = std::getenv("GARDENER_EMBEDDING_MODEL"); model != nullptr && *model) {
    config.embedding.model = model;
  }
}

common::Result<Config> parse_config(const std::string &toml_text) {
  const auto parsed = common::parse_toml(toml_text);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();
  Config config;

  auto &discovery = config.discovery;
  discovery.timeout_seconds = static_cast<std::uint32_t>(
      doc.get_u64("discovery.timeout_seconds", discovery.timeout_seconds));
  discovery.progress_interval_ms = static_cast<std::uint32_t>(
      doc.get_u64("discovery.progress_interval_ms", discovery.progress_interval_ms));
  discovery.include_hidden = doc.get_bool("discovery.include_hidden", discovery.include_hidden);
  discovery.source_only = doc.get_bool("discovery.source_only", discovery.source_only);
  discovery.exclude_patterns = doc.get_string_array("discovery.exclude_patterns");

  auto &embedding = config.embedding;
  embedding.provider = doc.get_string("embedding.provider", embedding.provider);
  embedding.model = doc.get_string("embedding.model", embedding.model);
  embedding.config_version = doc.get_string("embedding.config_version", embedding.config_version);
  embedding.dimensions =
      static_cast<std::size_t>(doc.get_u64("embedding.dimensions", embedding.dimensions));
  embedding.memory_cache_entries = static_cast<std::size_t>(
      doc.get_u64("embedding.memory_cache_entries", embedding.memory_cache_entries));
  embedding.cache_path = doc.get_string("embedding.cache_path", embedding.cache_path);

  auto &chunking = config.chunking;
  chunking.max_chunk_size =
      static_cast<std::size_t>(doc.get_u64("chunking.max_chunk_size", chunking.max_chunk_size));
  chunking.min_chunk_size =
      static_cast<std::size_t>(doc.get_u64("chunking.min_chunk_size", chunking.min_chunk_size));
  chunking.overlap = static_cast<std::size_t>(doc.get_u64("chunking.overlap", chunking.overlap));

  auto &artifacts = config.artifacts;
  artifacts.data_dir = doc.get_string("artifacts.data_dir", artifacts.data_dir);
  artifacts.registry_path = doc.get_string("artifacts.registry_path", artifacts.registry_path);
  artifacts.adapter_path = doc.get_string("artifacts.adapter_path", artifacts.adapter_path);
  artifacts.vector_store_path =
      doc.get_string("artifacts.vector_store_path", artifacts.vector_store_path);
  artifacts.context_path = doc.get_string("artifacts.context_path", artifacts.context_path);

  config.model_loader.max_adapters = static_cast<std::size_t>(
      doc.get_u64("model_loader.max_adapters", config.model_loader.max_adapters));

  auto &context = config.context;
  context.max_messages =
      static_cast<std::size_t>(doc.get_u64("context.max_messages", context.max_messages));
  context.max_active_contexts = static_cast<std::size_t>(
      doc.get_u64("context.max_active_contexts", context.max_active_contexts));
  context.max_context_chars =
      static_cast<std::size_t>(doc.get_u64("context.max_context_chars", context.max_context_chars));

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.verbose =
      doc.get_bool("observability.verbose", config.observability.verbose);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto path = config_path();
  if (!path.ok()) {
    return common::Result<Config>::failure(path.status());
  }

  std::error_code ec;
  if (!std::filesystem::exists(path.value(), ec)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto text = common::read_file(path.value());
  if (!text.ok()) {
    return common::Result<Config>::failure(text.status());
  }

  auto config = parse_config(text.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(path.value().string() + ": " + config.error(),
                                           config.code());
  }
  apply_env_overrides(config.value());
  return config;
}

std::string render_config(const Config &config) {
  std::ostringstream out;
  out << "[discovery]\n";
  out << "timeout_seconds = " << config.discovery.timeout_seconds << "\n";
  out << "progress_interval_ms = " << config.discovery.progress_interval_ms << "\n";
  out << "include_hidden = " << bool_to_toml(config.discovery.include_hidden) << "\n";
  out << "source_only = " << bool_to_toml(config.discovery.source_only) << "\n";
  out << "exclude_patterns = " << common::toml_string_array(config.discovery.exclude_patterns)
      << "\n";

  out << "\n[embedding]\n";
  out << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  out << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  out << "config_version = " << common::quote_toml_string(config.embedding.config_version)
      << "\n";
  out << "dimensions = " << config.embedding.dimensions << "\n";
  out << "memory_cache_entries = " << config.embedding.memory_cache_entries << "\n";
  out << "cache_path = " << common::quote_toml_string(config.embedding.cache_path) << "\n";

  out << "\n[chunking]\n";
  out << "max_chunk_size = " << config.chunking.max_chunk_size << "\n";
  out << "min_chunk_size = " << config.chunking.min_chunk_size << "\n";
  out << "overlap = " << config.chunking.overlap << "\n";

  out << "\n[artifacts]\n";
  out << "data_dir = " << common::quote_toml_string(config.artifacts.data_dir) << "\n";
  out << "registry_path = " << common::quote_toml_string(config.artifacts.registry_path) << "\n";
  out << "adapter_path = " << common::quote_toml_string(config.artifacts.adapter_path) << "\n";
  out << "vector_store_path = " << common::quote_toml_string(config.artifacts.vector_store_path)
      << "\n";
  out << "context_path = " << common::quote_toml_string(config.artifacts.context_path) << "\n";

  out << "\n[model_loader]\n";
  out << "max_adapters = " << config.model_loader.max_adapters << "\n";

  out << "\n[context]\n";
  out << "max_messages = " << config.context.max_messages << "\n";
  out << "max_active_contexts = " << config.context.max_active_contexts << "\n";
  out << "max_context_chars = " << config.context.max_context_chars << "\n";

  out << "\n[observability]\n";
  out << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  out << "verbose = " << bool_to_toml(config.observability.verbose) << "\n";
  return out.str();
}

common::Status save_config(const Config &config) {
  const auto path = config_path();
  if (!path.ok()) {
    return path.status();
  }
  return common::write_file_atomic(path.value(), render_config(config));
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  if (config.discovery.timeout_seconds == 0) {
    return Warnings::failure("discovery.timeout_seconds must be > 0",
                             common::ErrorCode::InvalidArgument);
  }
  if (config.discovery.progress_interval_ms == 0) {
    warnings.push_back("discovery.progress_interval_ms is 0; progress is reported on every file");
  }
  for (const auto &pattern : config.discovery.exclude_patterns) {
    if (common::trim(pattern).empty()) {
      warnings.push_back("discovery.exclude_patterns contains an empty pattern");
      break;
    }
  }

  if (common::to_lower(config.embedding.provider) != "local") {
    return Warnings::failure("Unknown embedding.provider: " + config.embedding.provider,
                             common::ErrorCode::InvalidArgument);
  }
  if (config.embedding.dimensions == 0) {
    return Warnings::failure("embedding.dimensions must be > 0",
                             common::ErrorCode::InvalidArgument);
  }
  if (config.embedding.memory_cache_entries == 0) {
    return Warnings::failure("embedding.memory_cache_entries must be > 0",
                             common::ErrorCode::InvalidArgument);
  }
  if (common::trim(config.embedding.config_version).empty()) {
    warnings.push_back("embedding.config_version is empty; cache keys ignore config changes");
  }

  if (config.chunking.max_chunk_size == 0) {
    return Warnings::failure("chunking.max_chunk_size must be > 0",
                             common::ErrorCode::InvalidArgument);
  }
  if (config.chunking.min_chunk_size > config.chunking.max_chunk_size) {
    return Warnings::failure("chunking.min_chunk_size must not exceed chunking.max_chunk_size",
                             common::ErrorCode::InvalidArgument);
  }
  if (config.chunking.overlap >= config.chunking.max_chunk_size) {
    return Warnings::failure("chunking.overlap must be smaller than chunking.max_chunk_size",
                             common::ErrorCode::InvalidArgument);
  }

  if (common::trim(config.artifacts.data_dir).empty()) {
    return Warnings::failure("artifacts.data_dir is required", common::ErrorCode::InvalidArgument);
  }
  for (const auto *per_project :
       {&config.artifacts.adapter_path, &config.artifacts.vector_store_path,
        &config.artifacts.context_path}) {
    if (per_project->find("{project_id}") == std::string::npos) {
      return Warnings::failure("artifact path template must contain {project_id}: " +
                                   *per_project,
                               common::ErrorCode::InvalidArgument);
    }
  }

  if (config.model_loader.max_adapters == 0) {
    return Warnings::failure("model_loader.max_adapters must be > 0",
                             common::ErrorCode::InvalidArgument);
  }
  if (config.context.max_messages == 0) {
    return Warnings::failure("context.max_messages must be > 0",
                             common::ErrorCode::InvalidArgument);
  }
  if (config.context.max_active_contexts == 0) {
    return Warnings::failure("context.max_active_contexts must be > 0",
                             common::ErrorCode::InvalidArgument);
  }

  if (!known_observability_backend(config.observability.backend)) {
    warnings.push_back("Unknown observability.backend '" + config.observability.backend +
                       "', falling back to log");
  }

  return Warnings::success(std::move(warnings));
}

std::filesystem::path resolve_artifact_path(const std::string &path_template,
                                            const ArtifactsConfig &artifacts,
                                            const std::string &project_id) {
  std::string resolved = path_template;
  replace_all(resolved, "{data_dir}", common::expand_path(artifacts.data_dir));
  replace_all(resolved, "{project_id}", project_id);
  return std::filesystem::path(common::expand_path(resolved));
}

} // namespace gardener::config
