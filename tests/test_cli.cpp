#include "test_framework.hpp"

#include "gardener/cli/commands.hpp"
#include "gardener/common/fs.hpp"
#include "gardener/config/config.hpp"
#include "tests/helpers/test_helpers.hpp"

#include <optional>
#include <sstream>

namespace {

struct CliRun {
  int code = 0;
  std::string out;
  std::string err;
};

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

/// Points the config override at a fresh workspace for the lifetime of a test.
class CliFixture {
public:
  CliFixture() : config_(gardener::testing::temp_config(ws_)) {
    previous_ = gardener::config::config_path_override();
    gardener::config::set_config_path_override(ws_.path() / "config.toml");
    const auto saved = gardener::config::save_config(config_);
    gardener::tests::require_ok(saved, "save config");
  }

  ~CliFixture() {
    if (previous_.has_value()) {
      gardener::config::set_config_path_override(*previous_);
    } else {
      gardener::config::clear_config_path_override();
    }
  }

  CliFixture(const CliFixture &) = delete;
  CliFixture &operator=(const CliFixture &) = delete;

  CliRun run(std::vector<std::string> args) const {
    std::ostringstream out;
    std::ostringstream err;
    CliRun result;
    result.code = gardener::cli::run_command(std::move(args), out, err);
    result.out = out.str();
    result.err = err.str();
    return result;
  }

  /// Registers `name` over a generated source tree and returns its id.
  std::string add(const std::string &name, const int files = 4) const {
    const auto root = ws_.path() / name;
    gardener::testing::write_source_tree(root, files);
    const auto result = run({"add", name, root.string()});
    gardener::tests::require(result.code == 0, "add failed: " + result.err);
    const auto marker = result.out.find(" as ");
    gardener::tests::require(marker != std::string::npos, "unexpected add output: " + result.out);
    return gardener::common::trim(result.out.substr(marker + 4));
  }

  [[nodiscard]] const gardener::testing::TempWorkspace &ws() const { return ws_; }
  [[nodiscard]] const gardener::config::Config &config() const { return config_; }

private:
  gardener::testing::TempWorkspace ws_;
  gardener::config::Config config_;
  std::optional<std::filesystem::path> previous_;
};

} // namespace

void register_cli_tests(std::vector<gardener::tests::TestCase> &tests) {
  using gardener::tests::require;

  tests.push_back({"cli_help_and_version", [] {
                     CliFixture cli;
                     const auto help = cli.run({"help"});
                     require(help.code == 0 && contains(help.out, "Usage: gardener"), "help");
                     require(contains(help.out, "switch <id|name>"), "help lists switch");
                     const auto version = cli.run({"version"});
                     require(version.out == gardener::cli::version_string() + "\n", "version");
                     require(cli.run({}).code == 0, "no arguments prints help");
                   }});

  tests.push_back({"cli_unknown_command", [] {
                     CliFixture cli;
                     const auto result = cli.run({"frobnicate"});
                     require(result.code == 1, "exit code");
                     require(contains(result.err, "Unknown command: frobnicate"), result.err);
                   }});

  tests.push_back({"cli_config_option_forms", [] {
                     CliFixture cli;
                     const auto path = cli.ws().path() / "alt" / "config.toml";
                     const auto spaced = cli.run({"--config", path.string(), "config-path"});
                     require(spaced.code == 0 && spaced.out == path.string() + "\n", spaced.out);
                     const auto joined = cli.run({"--config=" + path.string(), "config-path"});
                     require(joined.out == path.string() + "\n", joined.out);
                     require(cli.run({"--config"}).code == 1, "missing value");
                   }});

  tests.push_back({"cli_add_list_show", [] {
                     CliFixture cli;
                     require(cli.run({"list"}).out == "No projects registered.\n", "empty list");
                     const auto id = cli.add("alpha");
                     require(id.size() == 36, "uuid id: " + id);

                     const auto list = cli.run({"list"});
                     require(list.code == 0, list.err);
                     require(contains(list.out, "  " + id + "  alpha  [pending]"), list.out);

                     const auto show = cli.run({"show", "alpha"});
                     require(show.code == 0, show.err);
                     require(contains(show.out, "status:          pending"), show.out);
                     require(contains(show.out, "id:              " + id), show.out);
                     require(contains(show.out, id + "/adapter"), "adapter path names the project");

                     require(cli.run({"show", "nobody"}).code == 1, "unknown project");
                     require(cli.run({"list", "--status", "bogus"}).code == 1, "bad status");
                     require(cli.run({"list", "--status", "completed"}).out ==
                                 "No projects registered.\n",
                             "filter excludes pending");
                   }});

  tests.push_back({"cli_add_rejects_missing_source", [] {
                     CliFixture cli;
                     const auto result =
                         cli.run({"add", "ghost", (cli.ws().path() / "nowhere").string()});
                     require(result.code == 1 && contains(result.err, "add failed"), result.err);
                     require(cli.run({"add", "only-name"}).code == 1, "usage");
                   }});

  tests.push_back({"cli_switch_reports_degraded", [] {
                     CliFixture cli;
                     const auto id = cli.add("alpha");
                     const auto degraded = cli.run({"switch", "alpha"});
                     require(degraded.code == 2, "missing adapter degrades: " + degraded.out);
                     require(contains(degraded.out, "model_loader: error"), degraded.out);
                     require(contains(degraded.out, "vector_store: loaded"), degraded.out);

                     const auto current = cli.run({"current"});
                     require(current.out == "alpha (" + id + ")\n", current.out);

                     const auto json = cli.run({"status", "--json"});
                     require(json.code == 2, "status exit code follows health");
                     require(contains(json.out, "\"overall\":\"degraded\""), json.out);
                     require(contains(json.out, "\"current_project\":\"" + id + "\""), json.out);

                     gardener::testing::write_adapter(cli.config(), id);
                     const auto healthy = cli.run({"switch", id});
                     require(healthy.code == 0, "adapter present: " + healthy.out + healthy.err);
                     require(cli.run({"status"}).code == 0, "status ok");
                   }});

  tests.push_back({"cli_switch_unknown_project", [] {
                     CliFixture cli;
                     const auto result = cli.run({"switch", "no-such-project"});
                     require(result.code == 1, "exit code");
                     require(contains(result.err, "cannot switch to no-such-project"), result.err);
                     require(cli.run({"current"}).out == "No active project.\n", "nothing active");
                   }});

  tests.push_back({"cli_scan", [] {
                     CliFixture cli;
                     const auto root = cli.ws().path() / "tree";
                     gardener::testing::write_source_tree(root, 3);
                     const auto scanned = cli.run({"scan", root.string(), "--quiet"});
                     require(scanned.code == 0, scanned.err);
                     require(contains(scanned.out, "3 files\n"), scanned.out);
                     require(contains(scanned.out, "python"), "language column");
                     require(scanned.err.empty(), "quiet suppresses progress");

                     require(cli.run({"scan"}).code == 1, "no path and no project");
                     require(cli.run({"scan", root.string(), "--timeout", "soon"}).code == 1,
                             "bad timeout");
                     const auto expired = cli.run({"scan", root.string(), "--timeout", "0"});
                     require(expired.code == 1 && contains(expired.err, "discovery_timeout"),
                             expired.err);
                   }});

  tests.push_back({"cli_index_and_chat", [] {
                     CliFixture cli;
                     const auto id = cli.add("alpha", 6);
                     gardener::testing::write_adapter(cli.config(), id);
                     require(cli.run({"switch", "alpha"}).code == 0, "switch");

                     const auto indexed = cli.run({"index"});
                     require(indexed.code == 0, indexed.err);
                     require(gardener::common::starts_with(indexed.out, "Indexed 6/6 files"),
                             indexed.out);

                     const auto chat = cli.run({"chat", "--top", "2", "scaled", "value"});
                     require(chat.code == 0, chat.err);
                     require(contains(chat.out, "Most relevant code:"), chat.out);
                     require(contains(chat.out, "src/file_"), chat.out);

                     const auto context = cli.run({"context"});
                     require(context.code == 0, context.err);
                     require(contains(context.out, "user: scaled value"), context.out);

                     require(cli.run({"context", "--clear"}).out == "Conversation cleared.\n",
                             "clear");
                     require(cli.run({"context"}).out.empty(), "conversation gone");
                     require(cli.run({"chat", "--top", "many", "hi"}).code == 1, "bad --top");
                   }});

  tests.push_back({"cli_chat_requires_project", [] {
                     CliFixture cli;
                     require(cli.run({"chat", "hello"}).code == 1, "no active project");
                     require(cli.run({"context"}).code == 1, "no context");
                     require(cli.run({"index"}).code == 1, "nothing to index");
                   }});

  tests.push_back({"cli_training_status", [] {
                     CliFixture cli;
                     (void)cli.add("alpha");
                     const auto forward = cli.run({"training", "alpha", "training"});
                     require(forward.code == 0 && forward.out == "alpha is now training\n",
                             forward.out + forward.err);
                     const auto backward = cli.run({"training", "alpha", "pending"});
                     require(backward.code == 1, "backward transition refused");
                     require(contains(backward.err, "training status not changed"), backward.err);
                     require(cli.run({"training", "alpha", "sleeping"}).code == 1, "bad status");
                     require(contains(cli.run({"list"}).out, "[training]"), "persisted");
                   }});

  tests.push_back({"cli_remove", [] {
                     CliFixture cli;
                     const auto alpha = cli.add("alpha");
                     (void)cli.add("beta");
                     gardener::testing::write_adapter(cli.config(), alpha);
                     require(cli.run({"switch", "alpha"}).code == 0, "switch");

                     const auto refused = cli.run({"remove", "alpha"});
                     require(refused.code == 1 && contains(refused.err, "remove failed"),
                             refused.err);

                     const auto removed = cli.run({"remove", "beta", "--purge"});
                     require(removed.code == 0, removed.err);
                     require(gardener::common::starts_with(removed.out, "Removed beta"),
                             removed.out);
                     require(!contains(cli.run({"list"}).out, "beta"), "beta gone");
                   }});

  tests.push_back({"cli_cache_commands", [] {
                     CliFixture cli;
                     const auto stats = cli.run({"cache"});
                     require(stats.code == 0, stats.err);
                     require(contains(stats.out, "memory entries: 0/64"), stats.out);
                     require(contains(stats.out, "disk entries:   0"), stats.out);
                     require(cli.run({"cache", "clear"}).out == "Embedding cache cleared.\n",
                             "clear");
                     require(cli.run({"cache", "defrag"}).code == 1, "unknown action");
                   }});
}
