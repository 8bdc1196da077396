#include "test_framework.hpp"

#include "gardener/discovery/scanner.hpp"
#include "gardener/health/health.hpp"
#include "gardener/orchestrator/orchestrator.hpp"
#include "gardener/projects/registry.hpp"
#include "gardener/runtime/app.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <stdexcept>
#include <thread>

namespace {

namespace orch = gardener::orchestrator;
namespace managers = gardener::managers;
using gardener::testing::FakeManager;

struct Fixture {
  gardener::testing::TempWorkspace ws;
  gardener::projects::ProjectRegistry registry{ws.path() / "registry.db"};
  FakeManager vectors{"vector_store"};
  FakeManager model{"model_loader"};
  FakeManager context{"context"};
  orch::SwitchOrchestrator orchestrator{registry, {&vectors, &model, &context}};

  std::string add_project(const std::string &name) {
    const auto dir = ws.path() / "sources" / name;
    std::filesystem::create_directories(dir);
    auto record = registry.register_project(name, dir);
    gardener::tests::require(record.ok(), record.error());
    return record.value().id;
  }
};

/// Throws from activate to exercise the orchestrator's exception boundary.
class ExplodingManager final : public managers::ScopedResourceManager {
public:
  ~ExplodingManager() override { unload(); }
  [[nodiscard]] std::string_view name() const override { return "exploding"; }

protected:
  [[nodiscard]] gardener::common::Status activate(const std::string &) override {
    throw std::runtime_error("driver crashed");
  }
  void release() override {}
};

/// Throws a value that is not a std::exception.
class ThrowsIntManager final : public managers::ScopedResourceManager {
public:
  ~ThrowsIntManager() override { unload(); }
  [[nodiscard]] std::string_view name() const override { return "odd"; }

protected:
  [[nodiscard]] gardener::common::Status activate(const std::string &) override { throw 7; }
  void release() override {}
};

} // namespace

void register_orchestrator_tests(std::vector<gardener::tests::TestCase> &tests) {
  using gardener::tests::require;
  using gardener::common::ErrorCode;
  using managers::ManagerStatus;

  tests.push_back({"orchestrator_switch_loads_every_manager", [] {
                     Fixture f;
                     const auto id = f.add_project("alpha");
                     const auto result = f.orchestrator.switch_project(id);
                     require(result.success && !result.degraded, result.message);
                     require(result.outcomes.size() == 3, "three outcomes");
                     for (const auto &outcome : result.outcomes) {
                       require(outcome.attempted && outcome.success, outcome.manager);
                       require(outcome.status == ManagerStatus::Loaded, "loaded");
                     }
                     require(f.orchestrator.current_project().value_or("") == id, "current");
                     require(f.registry.active_project().value().value_or("") == id,
                             "active project persisted");
                   }});

  tests.push_back({"orchestrator_repeat_switch_does_no_work", [] {
                     Fixture f;
                     const auto id = f.add_project("alpha");
                     require(f.orchestrator.switch_project(id).success, "first");
                     const auto again = f.orchestrator.switch_project(id);
                     require(again.success && !again.degraded, again.message);
                     for (const auto &outcome : again.outcomes) {
                       require(!outcome.attempted, outcome.manager + " was reloaded");
                     }
                     require(f.vectors.load_count() == 1 && f.model.load_count() == 1 &&
                                 f.context.load_count() == 1,
                             "one load per manager");
                   }});

  tests.push_back({"orchestrator_unknown_project_leaves_state", [] {
                     Fixture f;
                     const auto id = f.add_project("alpha");
                     require(f.orchestrator.switch_project(id).success, "switch");
                     const auto before = f.orchestrator.snapshot();
                     const auto missing = f.orchestrator.switch_project("nonexistent-id");
                     require(!missing.success, "unknown id fails");
                     require(missing.code == ErrorCode::NotFound, "not found");
                     require(missing.outcomes.empty(), "no manager touched");
                     const auto after = f.orchestrator.snapshot();
                     require(after.current_project_id == before.current_project_id,
                             "current unchanged");
                     require(f.vectors.load_count() == 1, "no reload");
                     require(f.registry.active_project().value().value_or("") == id,
                             "persisted id unchanged");
                   }});

  tests.push_back({"orchestrator_partial_failure_is_degraded_success", [] {
                     Fixture f;
                     const auto a = f.add_project("a");
                     const auto b = f.add_project("b");
                     require(f.orchestrator.switch_project(a).success, "a");
                     f.model.fail_next = true;
                     const auto result = f.orchestrator.switch_project(b);
                     require(result.success, "switch still succeeds");
                     require(result.degraded, "degraded flag set");
                     require(result.message.find("model_loader") != std::string::npos,
                             "message names the failing manager: " + result.message);
                     require(f.orchestrator.current_project().value_or("") == b, "b current");
                     require(f.vectors.current().value_or("") == b, "vectors moved on (no rollback)");
                     require(!f.model.current().has_value(), "model holds nothing");
                     require(f.context.current().value_or("") == b, "later managers still ran");

                     const auto report = f.orchestrator.health();
                     require(report.overall == "degraded", "health degraded");
                     require(report.registry_reachable, "registry reachable");
                   }});

  tests.push_back({"orchestrator_same_project_retries_only_failed", [] {
                     Fixture f;
                     gardener::health::clear();
                     const auto id = f.add_project("alpha");
                     f.model.fail_next = true;
                     require(f.orchestrator.switch_project(id).degraded, "first is degraded");
                     const auto retry = f.orchestrator.switch_project(id);
                     require(retry.success && !retry.degraded, retry.message);
                     require(!retry.outcomes[0].attempted, "vector store skipped");
                     require(retry.outcomes[1].attempted && retry.outcomes[1].success,
                             "model loader retried");
                     require(!retry.outcomes[2].attempted, "context skipped");
                     require(f.vectors.load_count() == 1, "vector store loaded once");
                     const auto component = gardener::health::get_component("model_loader");
                     require(component.has_value() && component->restart_count == 1,
                             "restart counted");
                     require(f.orchestrator.health().overall == "ok", "healthy again");
                     gardener::health::clear();
                   }});

  tests.push_back({"orchestrator_contains_manager_exceptions", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::projects::ProjectRegistry registry(ws.path() / "registry.db");
                     FakeManager steady("steady");
                     ExplodingManager exploding;
                     orch::SwitchOrchestrator orchestrator(registry, {&exploding, &steady});
                     std::filesystem::create_directories(ws.path() / "src");
                     const auto id = registry.register_project("p", ws.path() / "src").value().id;
                     const auto result = orchestrator.switch_project(id);
                     require(result.success && result.degraded, "degraded, not thrown");
                     require(result.outcomes[0].status == ManagerStatus::Error, "error status");
                     require(result.outcomes[0].message.find("driver crashed") != std::string::npos,
                             "exception text kept");
                     require(steady.current().value_or("") == id, "others unaffected");

                     FakeManager before("before");
                     ThrowsIntManager odd;
                     FakeManager after("after");
                     orch::SwitchOrchestrator mixed(registry, {&before, &odd, &after});
                     const auto other =
                         registry.register_project("q", ws.path() / "src").value().id;
                     const auto odd_result = mixed.switch_project(other);
                     require(odd_result.success && odd_result.degraded, "non-standard contained");
                     require(odd_result.outcomes[1].status == ManagerStatus::Error, "odd errored");
                     require(odd_result.outcomes[1].message == "unexpected non-standard failure",
                             odd_result.outcomes[1].message);
                     require(mixed.current_project().value_or("") == other,
                             "active project follows the bound managers");
                     require(before.current().value_or("") == other &&
                                 after.current().value_or("") == other,
                             "surrounding managers switched");
                   }});

  tests.push_back({"orchestrator_health_report", [] {
                     Fixture f;
                     const auto idle = f.orchestrator.health();
                     require(idle.overall == "idle" && !idle.current_project_id.has_value(),
                             "idle before any switch");
                     require(idle.managers.size() == 3, "managers listed");
                     const auto id = f.add_project("alpha");
                     require(f.orchestrator.switch_project(id).success, "switch");
                     const auto report = f.orchestrator.health();
                     require(report.overall == "ok", "ok after switch");
                     const auto json = orch::health_report_json(report);
                     require(json.find("\"current_project\":\"" + id + "\"") != std::string::npos,
                             "json current: " + json);
                     require(json.find("\"model_loader\":{\"status\":\"loaded\"}") !=
                                 std::string::npos,
                             "json managers: " + json);
                   }});

  tests.push_back({"orchestrator_deactivate_and_remove", [] {
                     Fixture f;
                     const auto a = f.add_project("a");
                     const auto b = f.add_project("b");
                     require(f.orchestrator.switch_project(a).success, "a");
                     require(f.orchestrator.remove_project(a).code() == ErrorCode::ProjectActive,
                             "current project protected");
                     require(f.orchestrator.remove_project(b).ok(), "other project removable");
                     require(f.orchestrator.deactivate().ok(), "deactivate");
                     require(!f.orchestrator.current_project().has_value(), "no current");
                     require(f.vectors.status() == ManagerStatus::Unloaded, "unloaded");
                     require(!f.registry.active_project().value().has_value(), "cleared");
                     require(f.orchestrator.remove_project(a).ok(), "removable after deactivate");
                   }});

  tests.push_back({"orchestrator_restore_persisted_project", [] {
                     gardener::testing::TempWorkspace ws;
                     const auto db = ws.path() / "registry.db";
                     std::filesystem::create_directories(ws.path() / "src");
                     std::string id;
                     {
                       gardener::projects::ProjectRegistry registry(db);
                       FakeManager m("m");
                       orch::SwitchOrchestrator orchestrator(registry, {&m});
                       id = registry.register_project("p", ws.path() / "src").value().id;
                       require(orchestrator.switch_project(id).success, "switch");
                     }
                     gardener::projects::ProjectRegistry registry(db);
                     FakeManager m("m");
                     orch::SwitchOrchestrator orchestrator(registry, {&m});
                     const auto restored = orchestrator.restore();
                     require(restored.has_value() && restored->success, "restored");
                     require(orchestrator.current_project().value_or("") == id, "current again");
                   }});

  tests.push_back({"orchestrator_restore_clears_vanished_project", [] {
                     Fixture f;
                     require(f.registry.set_active_project(std::string("gone-id")).ok(), "seed");
                     const auto restored = f.orchestrator.restore();
                     require(restored.has_value() && !restored->success, "restore fails");
                     require(!f.registry.active_project().value().has_value(),
                             "dangling id cleared");
                     Fixture empty;
                     require(!empty.orchestrator.restore().has_value(), "nothing to restore");
                   }});

  tests.push_back({"orchestrator_snapshots_are_consistent", [] {
                     Fixture f;
                     const auto a = f.add_project("a");
                     const auto b = f.add_project("b");
                     std::atomic<bool> done{false};
                     std::atomic<int> torn{0};
                     std::thread reader([&] {
                       while (!done) {
                         const auto snap = f.orchestrator.snapshot();
                         if (!snap.current_project_id.has_value()) {
                           continue;
                         }
                         for (const auto &manager : snap.managers) {
                           if (manager.status != ManagerStatus::Loaded) {
                             ++torn;
                           }
                         }
                       }
                     });
                     for (int i = 0; i < 50; ++i) {
                       require(f.orchestrator.switch_project(i % 2 == 0 ? a : b).success, "switch");
                     }
                     done = true;
                     reader.join();
                     require(torn == 0, "reader saw a half-switched state");
                   }});

  tests.push_back({"orchestrator_events_and_metrics", [] {
                     Fixture f;
                     const auto id = f.add_project("alpha");
                     gardener::testing::ScopedRecordingObserver scoped;
                     require(f.orchestrator.switch_project(id).success, "switch");
                     const auto &recorded = scoped.observer();
                     require(recorded.events_of<gardener::observability::SwitchStartEvent>().size() ==
                                 1,
                             "start event");
                     require(recorded.events_of<gardener::observability::ManagerOutcomeEvent>()
                                     .size() == 3,
                             "outcome per manager");
                     const auto ends = recorded.events_of<gardener::observability::SwitchEndEvent>();
                     require(ends.size() == 1 && ends.front().success, "end event");
                     bool latency = false;
                     for (const auto &metric : recorded.metrics()) {
                       latency = latency ||
                                 std::holds_alternative<gardener::observability::SwitchLatencyMetric>(
                                     metric);
                     }
                     require(latency, "latency metric");
                   }});

  tests.push_back({"orchestrator_alpha_scenario_with_real_managers", [] {
                     gardener::testing::TempWorkspace ws;
                     auto config = gardener::testing::temp_config(ws);
                     gardener::runtime::RuntimeContext runtime(config);
                     require(runtime.open(false).ok(), "runtime open");

                     const auto source = ws.path() / "alpha";
                     gardener::testing::write_source_tree(source, 10);
                     const auto record = runtime.registry().register_project("alpha", source);
                     require(record.ok(), record.error());
                     require(record.value().training_status ==
                                 gardener::projects::TrainingStatus::Pending,
                             "pending");

                     const auto files = gardener::discovery::scan(record.value().source_path,
                                                                  std::chrono::seconds(30));
                     require(files.ok() && files.value().size() == 10, "ten files discovered");

                     const auto id = record.value().id;
                     gardener::testing::write_adapter(config, id);
                     const auto first = runtime.orchestrator().switch_project(id);
                     require(first.success && !first.degraded, first.message);
                     for (const auto &manager : runtime.orchestrator().snapshot().managers) {
                       require(manager.status == ManagerStatus::Loaded, manager.name);
                     }
                     const auto loads_before = runtime.model_loader().load_count() +
                                               runtime.vector_store().load_count() +
                                               runtime.context().load_count();
                     const auto second = runtime.orchestrator().switch_project(id);
                     require(second.success && !second.degraded, second.message);
                     const auto loads_after = runtime.model_loader().load_count() +
                                              runtime.vector_store().load_count() +
                                              runtime.context().load_count();
                     require(loads_after == loads_before, "no additional reload work");
                   }});
}
