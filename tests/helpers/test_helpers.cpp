#include "tests/helpers/test_helpers.hpp"

#include "gardener/config/config.hpp"
#include "gardener/observability/global.hpp"
#include "gardener/observability/noop_observer.hpp"

#include <fstream>
#include <random>

namespace gardener::testing {

TempWorkspace::TempWorkspace() {
  static std::mt19937_64 rng{std::random_device{}()};
  path_ = std::filesystem::temp_directory_path() / ("gardener-test-workspace-" + std::to_string(rng()));
  std::filesystem::create_directories(path_);
}

TempWorkspace::~TempWorkspace() {
  std::error_code ec;
  std::filesystem::remove_all(path_, ec);
}

void TempWorkspace::create_file(const std::string &name, const std::string &content) const {
  const auto file_path = path_ / name;
  std::error_code ec;
  std::filesystem::create_directories(file_path.parent_path(), ec);
  std::ofstream out(file_path, std::ios::binary | std::ios::trunc);
  out << content;
}

config::Config temp_config(const TempWorkspace &workspace) {
  config::Config config;
  config.artifacts.data_dir = (workspace.path() / "data").string();
  config.observability.backend = "none";
  config.embedding.dimensions = 64;
  config.embedding.model = "local-hash-64";
  config.embedding.memory_cache_entries = 64;
  config.discovery.timeout_seconds = 30;
  return config;
}

void write_adapter(const config::Config &config, const std::string &project_id,
                   const std::string &weights) {
  const auto dir =
      config::resolve_artifact_path(config.artifacts.adapter_path, config.artifacts, project_id);
  std::filesystem::create_directories(dir);
  std::ofstream(dir / "adapter_model.bin", std::ios::binary | std::ios::trunc) << weights;
  std::ofstream(dir / "adapter_config.json", std::ios::trunc) << "{\"r\": 8}";
}

void write_source_tree(const std::filesystem::path &root, const int count) {
  std::filesystem::create_directories(root / "src");
  for (int i = 0; i < count; ++i) {
    std::ofstream out(root / "src" / ("file_" + std::to_string(i) + ".py"), std::ios::trunc);
    out << "def function_" << i << "(value):\n"
        << "    \"\"\"Return the value scaled by " << i << ".\"\"\"\n"
        << "    return value * " << i << "\n";
  }
}

void RecordingObserver::record_event(const observability::ObserverEvent &event) {
  std::lock_guard<std::mutex> lock(mutex_);
  events_.push_back(event);
}

void RecordingObserver::record_metric(const observability::ObserverMetric &metric) {
  std::lock_guard<std::mutex> lock(mutex_);
  metrics_.push_back(metric);
}

std::vector<observability::ObserverEvent> RecordingObserver::events() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return events_;
}

std::vector<observability::ObserverMetric> RecordingObserver::metrics() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return metrics_;
}

ScopedRecordingObserver::ScopedRecordingObserver() {
  auto observer = std::make_unique<RecordingObserver>();
  observer_ = observer.get();
  observability::set_global_observer(std::move(observer));
}

ScopedRecordingObserver::~ScopedRecordingObserver() {
  observability::set_global_observer(std::make_unique<observability::NoopObserver>());
}

common::Status FakeManager::activate(const std::string &project_id) {
  if (fail_next.exchange(false)) {
    return common::Status::error(name_ + " cannot load " + project_id,
                                 common::ErrorCode::NotFound);
  }
  return common::Status::success();
}

} // namespace gardener::testing
