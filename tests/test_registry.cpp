#include "test_framework.hpp"

#include "gardener/projects/project.hpp"
#include "gardener/projects/registry.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <atomic>
#include <thread>

namespace {

namespace projects = gardener::projects;

std::filesystem::path make_source(const gardener::testing::TempWorkspace &ws,
                                  const std::string &name) {
  const auto dir = ws.path() / "sources" / name;
  std::filesystem::create_directories(dir);
  return dir;
}

projects::ProjectRecord must_register(projects::ProjectRegistry &registry, const std::string &name,
                                      const std::filesystem::path &source) {
  auto record = registry.register_project(name, source);
  gardener::tests::require(record.ok(), "register failed: " + record.error());
  return record.value();
}

} // namespace

void register_registry_tests(std::vector<gardener::tests::TestCase> &tests) {
  using gardener::tests::require;
  using gardener::common::ErrorCode;
  using projects::TrainingStatus;

  tests.push_back({"registry_status_names_roundtrip", [] {
                     for (const auto status : {TrainingStatus::Pending, TrainingStatus::Training,
                                               TrainingStatus::Completed, TrainingStatus::Failed}) {
                       const auto parsed =
                           projects::parse_training_status(projects::training_status_name(status));
                       require(parsed.has_value() && *parsed == status, "roundtrip");
                     }
                     require(projects::training_status_name(TrainingStatus::Completed) ==
                                 "completed",
                             "lowercase names");
                     require(!projects::parse_training_status("done").has_value(), "unknown");
                   }});

  tests.push_back({"registry_transition_rules", [] {
                     using projects::is_valid_transition;
                     require(is_valid_transition(TrainingStatus::Pending, TrainingStatus::Training),
                             "pending -> training");
                     require(is_valid_transition(TrainingStatus::Training,
                                                 TrainingStatus::Completed),
                             "training -> completed");
                     require(is_valid_transition(TrainingStatus::Training, TrainingStatus::Failed),
                             "training -> failed");
                     require(is_valid_transition(TrainingStatus::Pending, TrainingStatus::Failed),
                             "pending -> failed");
                     require(!is_valid_transition(TrainingStatus::Training,
                                                  TrainingStatus::Pending),
                             "no moving back");
                     require(!is_valid_transition(TrainingStatus::Completed,
                                                  TrainingStatus::Training),
                             "completed is terminal");
                     require(!is_valid_transition(TrainingStatus::Failed,
                                                  TrainingStatus::Completed),
                             "failed is terminal");
                     require(is_valid_transition(TrainingStatus::Completed,
                                                 TrainingStatus::Completed),
                             "same state is a no-op");
                     require(projects::is_terminal(TrainingStatus::Failed), "terminal");
                   }});

  tests.push_back({"registry_name_validation", [] {
                     require(projects::validate_project_name("alpha-1").ok(), "plain name");
                     require(projects::validate_project_name("my project").ok(), "space is fine");
                     for (const std::string bad : {"", "   ", "a/b", "a\\b", "a:b", "what?",
                                                   "a*", "<a>", "a|b", "\"a\""}) {
                       const auto status = projects::validate_project_name(bad);
                       require(!status.ok() && status.code() == ErrorCode::InvalidArgument,
                               "should reject '" + bad + "'");
                     }
                   }});

  tests.push_back({"registry_register_starts_pending", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     require(registry.open_status().ok(), registry.open_status().error());
                     const auto record =
                         must_register(registry, "alpha", make_source(ws, "alpha"));
                     require(record.training_status == TrainingStatus::Pending, "pending");
                     require(record.id.size() == 36, "uuid id");
                     require(!record.created_at.empty(), "created_at set");
                     require(record.file_count == 0 && !record.language.has_value(),
                             "no scan yet");
                     const auto fetched = registry.get(record.id);
                     require(fetched.ok() && fetched.value().name == "alpha", "get");
                   }});

  tests.push_back({"registry_register_rejects_bad_input", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto missing = registry.register_project("ghost", ws.path() / "nope");
                     require(!missing.ok() && missing.code() == ErrorCode::InvalidArgument,
                             "missing source dir");
                     ws.create_file("file.txt", "x");
                     const auto file = registry.register_project("file", ws.path() / "file.txt");
                     require(!file.ok() && file.code() == ErrorCode::InvalidArgument,
                             "source must be a directory");
                     const auto bad_name = registry.register_project("a/b", make_source(ws, "ab"));
                     require(!bad_name.ok() && bad_name.code() == ErrorCode::InvalidArgument,
                             "bad name");
                     require(registry.list().value().empty(), "nothing stored");
                   }});

  tests.push_back({"registry_get_unknown_is_not_found", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto missing = registry.get("00000000-0000-4000-8000-000000000000");
                     require(!missing.ok() && missing.code() == ErrorCode::NotFound, "not found");
                   }});

  tests.push_back({"registry_list_in_creation_order", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto a = must_register(registry, "a", make_source(ws, "a"));
                     const auto b = must_register(registry, "b", make_source(ws, "b"));
                     const auto c = must_register(registry, "c", make_source(ws, "c"));
                     const auto listed = registry.list();
                     require(listed.ok() && listed.value().size() == 3, "three projects");
                     require(listed.value()[0].id == a.id && listed.value()[1].id == b.id &&
                                 listed.value()[2].id == c.id,
                             "creation order");
                   }});

  tests.push_back({"registry_duplicate_names_allowed", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto source = make_source(ws, "shared");
                     const auto first = must_register(registry, "twin", source);
                     const auto second = must_register(registry, "twin", source);
                     require(first.id != second.id, "distinct ids");
                     const auto found = registry.find_by_name("twin");
                     require(found.ok() && found.value().has_value(), "found");
                     require(found.value()->id == first.id, "oldest match wins");
                     const auto none = registry.find_by_name("nobody");
                     require(none.ok() && !none.value().has_value(), "no match is not an error");
                   }});

  tests.push_back({"registry_forward_transitions_persist", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto record = must_register(registry, "p", make_source(ws, "p"));
                     const auto training = registry.update_status(record.id,
                                                                  TrainingStatus::Training);
                     require(training.ok() && training.value().training_status ==
                                                  TrainingStatus::Training,
                             "training");
                     const auto done = registry.update_status(record.id, TrainingStatus::Completed);
                     require(done.ok(), done.error());
                     require(registry.get(record.id).value().training_status ==
                                 TrainingStatus::Completed,
                             "persisted");
                   }});

  tests.push_back({"registry_backward_transition_rejected", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto record = must_register(registry, "p", make_source(ws, "p"));
                     require(registry.update_status(record.id, TrainingStatus::Completed).ok(),
                             "complete");
                     const auto before = registry.get(record.id).value();
                     const auto back = registry.update_status(record.id, TrainingStatus::Training);
                     require(!back.ok() && back.code() == ErrorCode::InvalidTransition,
                             "completed -> training rejected");
                     const auto after = registry.get(record.id).value();
                     require(after.training_status == TrainingStatus::Completed, "status kept");
                     require(after.updated_at == before.updated_at, "record untouched");
                     const auto same = registry.update_status(record.id, TrainingStatus::Completed);
                     require(same.ok(), "same state is accepted");
                     const auto unknown =
                         registry.update_status("missing-id", TrainingStatus::Training);
                     require(!unknown.ok() && unknown.code() == ErrorCode::NotFound, "unknown id");
                   }});

  tests.push_back({"registry_list_by_status", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto a = must_register(registry, "a", make_source(ws, "a"));
                     must_register(registry, "b", make_source(ws, "b"));
                     require(registry.update_status(a.id, TrainingStatus::Training).ok(), "a");
                     const auto training = registry.list_by_status(TrainingStatus::Training);
                     require(training.ok() && training.value().size() == 1 &&
                                 training.value().front().id == a.id,
                             "one training");
                     require(registry.list_by_status(TrainingStatus::Pending).value().size() == 1,
                             "one pending");
                   }});

  tests.push_back({"registry_file_count_and_language", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto record = must_register(registry, "p", make_source(ws, "p"));
                     require(registry.set_file_count(record.id, 42, std::string("python")).ok(),
                             "set");
                     const auto fetched = registry.get(record.id).value();
                     require(fetched.file_count == 42, "file count");
                     require(fetched.language.value_or("") == "python", "language");
                     const auto missing = registry.set_file_count("nope", 1, std::nullopt);
                     require(missing.code() == ErrorCode::NotFound, "unknown id");
                   }});

  tests.push_back({"registry_durable_across_instances", [] {
                     gardener::testing::TempWorkspace ws;
                     const auto db = ws.path() / "registry.db";
                     std::string id;
                     {
                       projects::ProjectRegistry first(db);
                       id = must_register(first, "durable", make_source(ws, "d")).id;
                       require(first.update_status(id, TrainingStatus::Training).ok(), "update");
                       require(first.set_active_project(id).ok(), "activate");
                     }
                     projects::ProjectRegistry second(db);
                     const auto record = second.get(id);
                     require(record.ok(), record.error());
                     require(record.value().training_status == TrainingStatus::Training,
                             "status survived");
                     const auto active = second.active_project();
                     require(active.ok() && active.value().value_or("") == id,
                             "active project survived");
                   }});

  tests.push_back({"registry_concurrent_instances_see_writes", [] {
                     gardener::testing::TempWorkspace ws;
                     const auto db = ws.path() / "registry.db";
                     projects::ProjectRegistry writer(db);
                     projects::ProjectRegistry reader(db);
                     const auto record = must_register(writer, "shared", make_source(ws, "s"));
                     require(reader.get(record.id).ok(), "reader sees new project");
                     require(writer.update_status(record.id, TrainingStatus::Failed).ok(), "fail");
                     require(reader.get(record.id).value().training_status ==
                                 TrainingStatus::Failed,
                             "reader sees update");
                   }});

  tests.push_back({"registry_parallel_registrations", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto source = make_source(ws, "p");
                     std::vector<std::thread> threads;
                     std::atomic<int> failures{0};
                     for (int i = 0; i < 8; ++i) {
                       threads.emplace_back([&registry, &source, &failures, i] {
                         if (!registry.register_project("p" + std::to_string(i), source).ok()) {
                           ++failures;
                         }
                       });
                     }
                     for (auto &thread : threads) {
                       thread.join();
                     }
                     require(failures == 0, "all registrations succeed");
                     require(registry.list().value().size() == 8, "eight rows");
                   }});

  tests.push_back({"registry_remove_refuses_active_project", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto record = must_register(registry, "p", make_source(ws, "p"));
                     require(registry.set_active_project(record.id).ok(), "activate");
                     const auto refused = registry.remove(record.id);
                     require(refused.code() == ErrorCode::ProjectActive, "active is protected");
                     require(registry.get(record.id).ok(), "still there");
                     require(registry.set_active_project(std::nullopt).ok(), "deactivate");
                     require(!registry.active_project().value().has_value(), "no active");
                     require(registry.remove(record.id).ok(), "removed");
                     require(registry.get(record.id).code() == ErrorCode::NotFound, "gone");
                     require(registry.remove(record.id).code() == ErrorCode::NotFound,
                             "second remove is not found");
                   }});

  tests.push_back({"registry_validate_reports_missing_sources", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto source = make_source(ws, "vanishing");
                     const auto record = must_register(registry, "vanishing", source);
                     require(registry.validate().value().empty(), "clean registry");
                     std::filesystem::remove_all(source);
                     const auto issues = registry.validate();
                     require(issues.ok() && issues.value().size() == 1, "one issue");
                     require(issues.value().front().find(record.id) != std::string::npos,
                             "issue names the project");
                   }});

  tests.push_back({"registry_health_check", [] {
                     gardener::testing::TempWorkspace ws;
                     projects::ProjectRegistry healthy(ws.path() / "registry.db");
                     require(healthy.health_check().ok(), "healthy");
                     ws.create_file("blocker", "x");
                     projects::ProjectRegistry broken(ws.path() / "blocker" / "registry.db");
                     require(!broken.open_status().ok(), "open fails");
                     require(!broken.health_check().ok(), "unhealthy");
                     require(!broken.list().ok(), "reads fail cleanly");
                   }});

  tests.push_back({"registry_emits_change_events", [] {
                     gardener::testing::TempWorkspace ws;
                     gardener::testing::ScopedRecordingObserver scoped;
                     projects::ProjectRegistry registry(ws.path() / "registry.db");
                     const auto record = must_register(registry, "p", make_source(ws, "p"));
                     require(registry.update_status(record.id, TrainingStatus::Training).ok(),
                             "update");
                     const auto changes = scoped.observer()
                                              .events_of<gardener::observability::RegistryChangeEvent>();
                     require(changes.size() == 2, "register + status");
                     require(changes[1].detail == "pending -> training", "status detail");
                   }});
}
