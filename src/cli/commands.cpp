#include "gardener/cli/commands.hpp"

#include "gardener/common/fs.hpp"
#include "gardener/config/config.hpp"
#include "gardener/discovery/scanner.hpp"
#include "gardener/embedding/fingerprint.hpp"
#include "gardener/runtime/app.hpp"

#include <chrono>
#include <iostream>
#include <optional>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace gardener::cli {

namespace {

std::vector<std::string> collect_args(int argc, char **argv) {
  std::vector<std::string> out;
  out.reserve(static_cast<std::size_t>(argc));
  for (int i = 0; i < argc; ++i) {
    out.emplace_back(argv[i]);
  }
  return out;
}

bool take_option(std::vector<std::string> &args, const std::string &long_name,
                 const std::string &short_name, std::string &out_value) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == long_name || (!short_name.empty() && args[i] == short_name)) {
      if (i + 1 >= args.size()) {
        return false;
      }
      out_value = args[i + 1];
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      return true;
    }
  }
  return false;
}

bool take_flag(std::vector<std::string> &args, const std::string &name) {
  for (std::size_t i = 0; i < args.size(); ++i) {
    if (args[i] == name) {
      args.erase(args.begin() + static_cast<long>(i));
      return true;
    }
  }
  return false;
}

bool apply_global_options(std::vector<std::string> &args, std::string &error) {
  for (std::size_t i = 0; i < args.size();) {
    if (args[i] == "--config") {
      if (i + 1 >= args.size()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(args[i + 1]);
      args.erase(args.begin() + static_cast<long>(i), args.begin() + static_cast<long>(i + 2));
      continue;
    }
    if (common::starts_with(args[i], "--config=")) {
      const auto value = args[i].substr(std::string("--config=").size());
      if (value.empty()) {
        error = "missing value for --config";
        return false;
      }
      config::set_config_path_override(value);
      args.erase(args.begin() + static_cast<long>(i));
      continue;
    }
    ++i;
  }
  return true;
}

std::string join_tokens(const std::vector<std::string> &args, const std::size_t begin = 0) {
  std::ostringstream out;
  for (std::size_t i = begin; i < args.size(); ++i) {
    if (i > begin) {
      out << ' ';
    }
    out << args[i];
  }
  return out.str();
}

std::optional<std::size_t> parse_count(const std::string &raw) {
  if (raw.empty() || raw.find_first_not_of("0123456789") != std::string::npos) {
    return std::nullopt;
  }
  try {
    return static_cast<std::size_t>(std::stoull(raw));
  } catch (const std::out_of_range &) {
    return std::nullopt;
  }
}

std::optional<runtime::RuntimeContext> open_runtime(std::ostream &err,
                                                    const bool restore_active = true) {
  auto context = runtime::RuntimeContext::from_disk();
  if (!context.ok()) {
    err << "config: " << context.error() << "\n";
    return std::nullopt;
  }
  runtime::RuntimeContext runtime = std::move(context.value());
  if (auto opened = runtime.open(restore_active); !opened.ok()) {
    err << opened.error() << "\n";
    return std::nullopt;
  }
  return runtime;
}

// Accepts an id or, failing that, an exact project name.
common::Result<projects::ProjectRecord> resolve_project(projects::ProjectRegistry &registry,
                                                        const std::string &id_or_name) {
  auto by_id = registry.get(id_or_name);
  if (by_id.ok() || by_id.code() != common::ErrorCode::NotFound) {
    return by_id;
  }
  auto by_name = registry.find_by_name(id_or_name);
  if (!by_name.ok()) {
    return common::Result<projects::ProjectRecord>::failure(by_name.status());
  }
  if (!by_name.value().has_value()) {
    return common::Result<projects::ProjectRecord>::failure("no project with id or name '" +
                                                                id_or_name + "'",
                                                            common::ErrorCode::NotFound);
  }
  return common::Result<projects::ProjectRecord>::success(std::move(*by_name.value()));
}

void print_record(std::ostream &out, const projects::ProjectRecord &record, const bool active) {
  out << (active ? "* " : "  ") << record.id << "  " << record.name << "  ["
      << projects::training_status_name(record.training_status) << "]  "
      << record.source_path.string() << "\n";
}

int run_add(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  if (args.size() < 2) {
    err << "usage: gardener add <name> <source-path>\n";
    return 1;
  }
  auto runtime = open_runtime(err, false);
  if (!runtime.has_value()) {
    return 1;
  }
  const auto source = std::filesystem::path(common::expand_path(args[1]));
  auto record = runtime->registry().register_project(args[0], source);
  if (!record.ok()) {
    err << "add failed: " << record.error() << "\n";
    return 1;
  }
  out << "Registered " << record.value().name << " as " << record.value().id << "\n";
  return 0;
}

int run_list(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string status_raw;
  const bool filtered = take_option(args, "--status", "-s", status_raw);
  std::optional<projects::TrainingStatus> status;
  if (filtered) {
    status = projects::parse_training_status(status_raw);
    if (!status.has_value()) {
      err << "unknown status '" << status_raw << "'\n";
      return 1;
    }
  }

  auto runtime = open_runtime(err, false);
  if (!runtime.has_value()) {
    return 1;
  }
  auto &registry = runtime->registry();
  auto records = status.has_value() ? registry.list_by_status(*status) : registry.list();
  if (!records.ok()) {
    err << records.error() << "\n";
    return 1;
  }
  auto active = registry.active_project();
  const std::optional<std::string> active_id =
      active.ok() ? active.value() : std::optional<std::string>{};

  if (records.value().empty()) {
    out << "No projects registered.\n";
    return 0;
  }
  for (const auto &record : records.value()) {
    print_record(out, record, active_id.has_value() && *active_id == record.id);
  }
  return 0;
}

int run_show(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  if (args.empty()) {
    err << "usage: gardener show <id|name>\n";
    return 1;
  }
  auto runtime = open_runtime(err, false);
  if (!runtime.has_value()) {
    return 1;
  }
  auto record = resolve_project(runtime->registry(), args[0]);
  if (!record.ok()) {
    err << record.error() << "\n";
    return 1;
  }
  const auto &project = record.value();
  const auto &artifacts = runtime->config().artifacts;
  out << "id:              " << project.id << "\n";
  out << "name:            " << project.name << "\n";
  out << "source:          " << project.source_path.string() << "\n";
  out << "status:          " << projects::training_status_name(project.training_status) << "\n";
  out << "created:         " << project.created_at << "\n";
  out << "updated:         " << project.updated_at << "\n";
  out << "language:        " << project.language.value_or("-") << "\n";
  out << "files:           " << project.file_count << "\n";
  out << "adapter:         "
      << config::resolve_artifact_path(artifacts.adapter_path, artifacts, project.id).string()
      << "\n";
  out << "vector store:    "
      << config::resolve_artifact_path(artifacts.vector_store_path, artifacts, project.id).string()
      << "\n";
  return 0;
}

int run_remove(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  const bool purge = take_flag(args, "--purge");
  if (args.empty()) {
    err << "usage: gardener remove <id|name> [--purge]\n";
    return 1;
  }
  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  auto record = resolve_project(runtime->registry(), args[0]);
  if (!record.ok()) {
    err << record.error() << "\n";
    return 1;
  }
  if (auto removed = runtime->orchestrator().remove_project(record.value().id); !removed.ok()) {
    err << "remove failed: " << removed.error() << "\n";
    return 1;
  }
  if (purge) {
    if (auto purged = runtime::purge_project_artifacts(runtime->config().artifacts,
                                                       record.value().id);
        !purged.ok()) {
      err << "project removed but artifacts remain: " << purged.error() << "\n";
      return 1;
    }
  }
  out << "Removed " << record.value().name << " (" << record.value().id << ")\n";
  return 0;
}

int run_switch(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  if (args.empty()) {
    err << "usage: gardener switch <id|name>\n";
    return 1;
  }
  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  auto record = resolve_project(runtime->registry(), args[0]);
  const std::string project_id = record.ok() ? record.value().id : args[0];

  const auto result = runtime->orchestrator().switch_project(project_id);
  if (!result.success) {
    err << result.message << "\n";
    return 1;
  }
  out << result.message << "\n";
  for (const auto &outcome : result.outcomes) {
    out << "  " << outcome.manager << ": " << managers::manager_status_name(outcome.status);
    if (!outcome.attempted) {
      out << " (unchanged)";
    } else if (!outcome.success) {
      out << " (" << outcome.message << ")";
    }
    out << "\n";
  }
  return result.degraded ? 2 : 0;
}

int run_current(std::ostream &out, std::ostream &err) {
  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  const auto current = runtime->orchestrator().current_project();
  if (!current.has_value()) {
    out << "No active project.\n";
    return 0;
  }
  auto record = runtime->registry().get(*current);
  if (record.ok()) {
    out << record.value().name << " (" << *current << ")\n";
  } else {
    out << *current << "\n";
  }
  return 0;
}

int run_status(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  const bool json = take_flag(args, "--json");
  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  const auto report = runtime->orchestrator().health();
  if (json) {
    out << orchestrator::health_report_json(report) << "\n";
    return report.overall == "degraded" ? 2 : 0;
  }

  out << "Overall:  " << report.overall << "\n";
  out << "Project:  " << report.current_project_id.value_or("(none)") << "\n";
  out << "Registry: " << (report.registry_reachable ? "reachable" : "unreachable");
  if (!report.registry_error.empty()) {
    out << " (" << report.registry_error << ")";
  }
  out << "\n";
  for (const auto &manager : report.managers) {
    out << "  " << manager.name << ": " << managers::manager_status_name(manager.status);
    if (!manager.last_error.empty()) {
      out << " (" << manager.last_error << ")";
    }
    out << "\n";
  }
  auto config_file = config::config_path();
  if (config_file.ok()) {
    out << "Config:   " << config_file.value().string() << "\n";
  }
  return report.overall == "degraded" ? 2 : 0;
}

int run_scan(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string timeout_raw;
  const bool has_timeout = take_option(args, "--timeout", "-t", timeout_raw);
  const bool all_files = take_flag(args, "--all");
  const bool quiet = take_flag(args, "--quiet");

  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }

  std::filesystem::path root;
  if (!args.empty()) {
    root = common::expand_path(args[0]);
  } else {
    const auto current = runtime->orchestrator().current_project();
    if (!current.has_value()) {
      err << "usage: gardener scan [PATH]  (no path given and no active project)\n";
      return 1;
    }
    auto record = runtime->registry().get(*current);
    if (!record.ok()) {
      err << record.error() << "\n";
      return 1;
    }
    root = record.value().source_path;
  }

  std::size_t timeout_seconds = runtime->config().discovery.timeout_seconds;
  if (has_timeout) {
    const auto parsed = parse_count(timeout_raw);
    if (!parsed.has_value()) {
      err << "invalid --timeout '" << timeout_raw << "'\n";
      return 1;
    }
    timeout_seconds = *parsed;
  }

  auto options = discovery::scan_options_from_config(runtime->config().discovery);
  if (all_files) {
    options.source_only = false;
  }
  discovery::ConsoleProgressSink console(err);
  auto files = discovery::scan(root, std::chrono::seconds(timeout_seconds),
                               quiet ? nullptr : &console, options);
  if (!files.ok()) {
    err << "scan failed [" << common::error_code_name(files.code()) << "]: " << files.error()
        << "\n";
    return 1;
  }
  for (const auto &file : files.value()) {
    out << discovery::file_type_name(file.detected_type) << "\t"
        << file.language.value_or("-") << "\t" << file.path.string() << "\n";
  }
  out << files.value().size() << " files\n";
  return 0;
}

int run_index(std::ostream &out, std::ostream &err) {
  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  discovery::ConsoleProgressSink console(err);
  auto indexer = runtime->make_indexer();
  auto report = indexer.index_current(&console);
  if (!report.ok()) {
    err << "index failed: " << report.error() << "\n";
    return 1;
  }
  const auto &summary = report.value();
  out << "Indexed " << summary.files_indexed << "/" << summary.files_discovered << " files, "
      << summary.vectors_stored << " chunks (" << summary.embeddings_computed << " computed, "
      << summary.embeddings_reused << " cached)\n";
  for (const auto &error : summary.errors) {
    err << "  " << error << "\n";
  }
  return summary.errors.empty() ? 0 : 2;
}

int run_training(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  if (args.size() < 2) {
    err << "usage: gardener training <id|name> <pending|training|completed|failed>\n";
    return 1;
  }
  const auto status = projects::parse_training_status(args[1]);
  if (!status.has_value()) {
    err << "unknown status '" << args[1] << "'\n";
    return 1;
  }
  auto runtime = open_runtime(err, false);
  if (!runtime.has_value()) {
    return 1;
  }
  auto record = resolve_project(runtime->registry(), args[0]);
  if (!record.ok()) {
    err << record.error() << "\n";
    return 1;
  }
  auto updated = runtime->registry().update_status(record.value().id, *status);
  if (!updated.ok()) {
    err << "training status not changed: " << updated.error() << "\n";
    return 1;
  }
  out << updated.value().name << " is now "
      << projects::training_status_name(updated.value().training_status) << "\n";
  return 0;
}

int run_chat(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string limit_raw = "3";
  (void)take_option(args, "--top", "-k", limit_raw);
  const auto limit = parse_count(limit_raw);
  if (!limit.has_value()) {
    err << "invalid --top '" << limit_raw << "'\n";
    return 1;
  }
  const std::string message = join_tokens(args);
  if (common::trim(message).empty()) {
    err << "usage: gardener chat [--top N] <message>\n";
    return 1;
  }

  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  auto appended = runtime->context().add_message("user", message);
  if (!appended.ok()) {
    err << "chat: " << appended.error() << "\n";
    return 1;
  }
  const std::string &project_id = appended.value();

  auto &embedder = runtime->embedder();
  const std::string fingerprint = embedding::make_fingerprint(
      message, embedder.identity(), runtime->config().embedding.config_version);
  auto query = runtime->embedding_cache().get_or_compute(
      fingerprint, [&](const std::string &) { return embedder.embed(message); });
  if (!query.ok()) {
    err << "chat: " << query.error() << "\n";
    return 1;
  }
  auto matches = runtime->vector_store().query(project_id, query.value(), *limit);
  if (!matches.ok()) {
    err << "chat: " << matches.error() << "\n";
    return 1;
  }

  if (matches.value().empty()) {
    out << "No indexed code yet; run `gardener index`.\n";
    return 0;
  }
  out << "Most relevant code:\n";
  for (const auto &match : matches.value()) {
    out << "  " << match.key << "  (score " << match.score << ")\n";
  }
  return 0;
}

int run_context(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  const bool clear = take_flag(args, "--clear");
  std::string chars_raw;
  const bool has_chars = take_option(args, "--chars", "", chars_raw);
  std::optional<std::size_t> max_chars;
  if (has_chars) {
    max_chars = parse_count(chars_raw);
    if (!max_chars.has_value()) {
      err << "invalid --chars '" << chars_raw << "'\n";
      return 1;
    }
  }

  auto runtime = open_runtime(err);
  if (!runtime.has_value()) {
    return 1;
  }
  auto &context = runtime->context();
  if (!context.current().has_value()) {
    err << "no active project context\n";
    return 1;
  }
  if (clear) {
    if (auto cleared = context.clear(); !cleared.ok()) {
      err << cleared.error() << "\n";
      return 1;
    }
    out << "Conversation cleared.\n";
    return 0;
  }
  out << context.recent_context(max_chars);
  return 0;
}

int run_cache(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  const std::string action = args.empty() ? "stats" : args[0];
  auto runtime = open_runtime(err, false);
  if (!runtime.has_value()) {
    return 1;
  }
  auto &cache = runtime->embedding_cache();
  if (action == "stats") {
    const auto stats = cache.stats();
    out << "memory entries: " << stats.memory_entries << "/" << stats.memory_capacity << "\n";
    out << "disk entries:   " << stats.disk_entries << "\n";
    return 0;
  }
  if (action == "clear") {
    if (auto cleared = cache.clear(); !cleared.ok()) {
      err << "cache clear failed: " << cleared.error() << "\n";
      return 1;
    }
    out << "Embedding cache cleared.\n";
    return 0;
  }
  err << "usage: gardener cache [stats|clear]\n";
  return 1;
}

void print_help(std::ostream &out) {
  out << version_string() << "\n\n";
  out << "Usage: gardener [--config PATH] <command> [options]\n\n";
  out << "Projects:\n";
  out << "  add <name> <path>             Register a project\n";
  out << "  list [--status S]             List projects (* marks the active one)\n";
  out << "  show <id|name>                Show project details\n";
  out << "  remove <id|name> [--purge]    Forget a project (and delete its artifacts)\n";
  out << "  training <id|name> <status>   Advance the training status\n\n";
  out << "Active project:\n";
  out << "  switch <id|name>              Make a project active\n";
  out << "  current                       Print the active project\n";
  out << "  status [--json]               Manager and registry health\n";
  out << "  scan [PATH] [--timeout S] [--all] [--quiet]\n";
  out << "                                Discover files under PATH or the active project\n";
  out << "  index                         Embed the active project into its vector store\n";
  out << "  chat [--top N] <message>      Record a message and show related code\n";
  out << "  context [--chars N] [--clear] Show or clear the conversation\n";
  out << "  cache [stats|clear]           Embedding cache maintenance\n\n";
  out << "Other:\n";
  out << "  config-path                   Print the config file location\n";
  out << "  version                       Show version\n";
  out << "  help                          Show this help\n";
}

} // namespace

std::string version_string() {
#ifdef GARDENER_VERSION
  return std::string("gardener ") + GARDENER_VERSION;
#else
  return "gardener 0.1.0";
#endif
}

int run_command(std::vector<std::string> args, std::ostream &out, std::ostream &err) {
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    err << global_error << "\n";
    return 1;
  }
  if (args.empty()) {
    print_help(out);
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help(out);
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    out << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      err << path_result.error() << "\n";
      return 1;
    }
    out << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "add") {
    return run_add(std::move(args), out, err);
  }
  if (subcommand == "list") {
    return run_list(std::move(args), out, err);
  }
  if (subcommand == "show") {
    return run_show(std::move(args), out, err);
  }
  if (subcommand == "remove") {
    return run_remove(std::move(args), out, err);
  }
  if (subcommand == "switch") {
    return run_switch(std::move(args), out, err);
  }
  if (subcommand == "current") {
    return run_current(out, err);
  }
  if (subcommand == "status") {
    return run_status(std::move(args), out, err);
  }
  if (subcommand == "scan") {
    return run_scan(std::move(args), out, err);
  }
  if (subcommand == "index") {
    return run_index(out, err);
  }
  if (subcommand == "training") {
    return run_training(std::move(args), out, err);
  }
  if (subcommand == "chat") {
    return run_chat(std::move(args), out, err);
  }
  if (subcommand == "context") {
    return run_context(std::move(args), out, err);
  }
  if (subcommand == "cache") {
    return run_cache(std::move(args), out, err);
  }

  err << "Unknown command: " << subcommand << "\n";
  print_help(err);
  return 1;
}

int run_cli(int argc, char **argv) {
  if (argc <= 1) {
    print_help(std::cout);
    return 0;
  }
  return run_command(collect_args(argc - 1, argv + 1), std::cout, std::cerr);
}

} // namespace gardener::cli
