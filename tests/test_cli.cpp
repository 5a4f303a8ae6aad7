#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devchain/cli/commands.hpp"
#include "devchain/config/config.hpp"
#include "devchain/observability/global.hpp"
#include "devchain/observability/noop_observer.hpp"

#include <iostream>
#include <sstream>

namespace {

namespace t = devchain::testing;

struct CliOutput {
  int code = 0;
  std::string out;
  std::string err;
};

// Redirects std::cout and std::cerr for the duration of one command.
class StreamCapture {
public:
  StreamCapture()
      : old_out_(std::cout.rdbuf(out_.rdbuf())), old_err_(std::cerr.rdbuf(err_.rdbuf())) {}
  ~StreamCapture() {
    std::cout.rdbuf(old_out_);
    std::cerr.rdbuf(old_err_);
  }

  StreamCapture(const StreamCapture &) = delete;
  StreamCapture &operator=(const StreamCapture &) = delete;

  [[nodiscard]] std::string out() const { return out_.str(); }
  [[nodiscard]] std::string err() const { return err_.str(); }

private:
  std::ostringstream out_;
  std::ostringstream err_;
  std::streambuf *old_out_;
  std::streambuf *old_err_;
};

CliOutput run(std::vector<std::string> args) {
  args.insert(args.begin(), "devchain");
  std::vector<char *> argv;
  argv.reserve(args.size());
  for (auto &arg : args) {
    argv.push_back(arg.data());
  }

  CliOutput output;
  {
    StreamCapture capture;
    output.code = devchain::cli::run_cli(static_cast<int>(argv.size()), argv.data());
    output.out = capture.out();
    output.err = capture.err();
  }
  devchain::config::clear_config_path_override();
  devchain::observability::set_global_observer(
      std::make_unique<devchain::observability::NoopObserver>());
  return output;
}

std::size_t count_lines(const std::string &text) {
  std::size_t lines = 0;
  for (const char c : text) {
    if (c == '\n') {
      ++lines;
    }
  }
  return lines;
}

// Kitchen catalog and a sqlite store inside the workspace. Thresholds are open so
// every neighbour of the trigger is printed regardless of the hashed vectors.
std::string write_workspace_config(const t::TempWorkspace &workspace) {
  workspace.create_file("devices.json", t::kitchen_catalog_json());
  auto config = t::temp_config(workspace);
  config.store.backend = "sqlite";
  config.traversal.max_depth = 2;
  config.traversal.min_similarity = -1.0;
  config.traversal.acceptance_floor = 0.0;

  const std::string path = (workspace.path() / "config.toml").string();
  devchain::config::set_config_path_override(path);
  const auto saved = devchain::config::save_config(config);
  devchain::config::clear_config_path_override();
  devchain::tests::require(saved.ok(), saved.error());
  return path;
}

} // namespace

void register_cli_tests(std::vector<devchain::tests::TestCase> &tests) {
  using devchain::tests::require;

  tests.push_back({"cli_version_prints_name", [] {
                     const auto output = run({"--version"});
                     require(output.code == 0, "exit code");
                     require(output.out.rfind("devchain ", 0) == 0, output.out);
                   }});

  tests.push_back({"cli_help_lists_commands", [] {
                     const auto output = run({});
                     require(output.code == 0, "exit code");
                     for (const char *command : {"generate", "paths", "stats", "invalidate",
                                                 "config-path"}) {
                       require(output.out.find(command) != std::string::npos,
                               std::string("missing ") + command);
                     }
                   }});

  tests.push_back({"cli_unknown_command_fails", [] {
                     const auto output = run({"teleport"});
                     require(output.code == 1, "exit code");
                     require(output.err.find("unknown command: teleport") != std::string::npos,
                             output.err);
                   }});

  tests.push_back({"cli_config_path_honours_override", [] {
                     t::TempWorkspace workspace;
                     const std::string path = (workspace.path() / "custom.toml").string();
                     const auto output = run({"--config", path, "config-path"});
                     require(output.code == 0, "exit code");
                     require(output.out == path + "\n", output.out);

                     const auto missing = run({"config-path", "--config"});
                     require(missing.code == 1, "missing value rejected");
                   }});

  tests.push_back({"cli_generate_paths_stats_invalidate_flow", [] {
                     t::TempWorkspace workspace;
                     const std::string config = write_workspace_config(workspace);

                     const auto generated = run({"--config", config, "generate"});
                     require(generated.code == 0, generated.err);
                     require(generated.out.find("total=3 generated=3 cached=0 errors=0") !=
                                 std::string::npos,
                             generated.out);

                     const auto cached = run({"--config=" + config, "generate"});
                     require(cached.code == 0, cached.err);
                     require(cached.out.find("generated=0 cached=3") != std::string::npos,
                             cached.out);

                     const auto forced = run({"--config", config, "generate", "--force"});
                     require(forced.code == 0 &&
                                 forced.out.find("generated=3 cached=0") != std::string::npos,
                             forced.out);

                     const auto paths =
                         run({"--config", config, "paths", "-t", "binary_sensor.kitchen_motion"});
                     require(paths.code == 0, paths.err);
                     require(count_lines(paths.out) == 2, paths.out);
                     require(paths.out.find(" 1 binary_sensor.kitchen_motion -> ") !=
                                 std::string::npos,
                             paths.out);

                     const auto limited = run({"--config", config, "paths", "--trigger",
                                               "binary_sensor.kitchen_motion", "--limit", "1"});
                     require(limited.code == 0 && count_lines(limited.out) == 1, limited.out);

                     const auto stats = run({"--config", config, "stats"});
                     require(stats.code == 0, stats.err);
                     require(stats.out.find("Store: sqlite") != std::string::npos, stats.out);
                     require(stats.out.find("Total: 3") != std::string::npos, stats.out);
                     require(stats.out.find("Model: local-hash-v1-64") != std::string::npos,
                             stats.out);

                     const auto one = run({"--config", config, "invalidate", "light.kitchen_ceiling"});
                     require(one.code == 0 && one.out == "Removed 1 embeddings\n", one.out);
                     const auto all = run({"--config", config, "invalidate", "--all"});
                     require(all.code == 0 && all.out == "Removed 2 embeddings\n", all.out);
                   }});

  tests.push_back({"cli_paths_reports_skipped_trigger", [] {
                     t::TempWorkspace workspace;
                     const std::string config = write_workspace_config(workspace);
                     const auto output =
                         run({"--config", config, "paths", "-t", "binary_sensor.kitchen_motion"});
                     require(output.code == 0, output.err);
                     require(output.out.empty(), "nothing generated yet");
                     require(output.err.find("skipped (no fresh embedding): "
                                             "binary_sensor.kitchen_motion") != std::string::npos,
                             output.err);
                   }});

  tests.push_back({"cli_paths_rejects_bad_arguments", [] {
                     t::TempWorkspace workspace;
                     const std::string config = write_workspace_config(workspace);
                     require(run({"--config", config, "paths", "--depth", "9"}).code == 1,
                             "depth 9 accepted");
                     require(run({"--config", config, "paths", "--top-k", "many"}).code == 1,
                             "non-numeric top-k accepted");
                     require(run({"--config", config, "paths", "--bogus"}).code == 1,
                             "unknown option accepted");
                     require(run({"--config", config, "invalidate"}).code == 1,
                             "invalidate without target accepted");
                   }});

  tests.push_back({"cli_generate_fails_without_catalog", [] {
                     t::TempWorkspace workspace;
                     auto config = t::temp_config(workspace);
                     const std::string path = (workspace.path() / "config.toml").string();
                     devchain::config::set_config_path_override(path);
                     const auto saved = devchain::config::save_config(config);
                     devchain::config::clear_config_path_override();
                     require(saved.ok(), saved.error());

                     const auto output = run({"--config", path, "generate"});
                     require(output.code == 1, "missing devices.json must fail");
                     require(output.err.find("catalog_unavailable") != std::string::npos, output.err);
                   }});
}
