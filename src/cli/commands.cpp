#include "devchain/cli/commands.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/config/config.hpp"
#include "devchain/discovery/chain_discovery.hpp"
#include "devchain/observability/factory.hpp"
#include "devchain/observability/global.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace devchain::cli {

namespace {

std::string version_string() {
#ifdef DEVCHAIN_VERSION
  std::string version = DEVCHAIN_VERSION;
#else
  std::string version = "0.1.0";
#endif
  return "devchain " + version;
}

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

std::vector<std::string> take_repeated_option(std::vector<std::string> &args,
                                              const std::string &long_name,
                                              const std::string &short_name) {
  std::vector<std::string> values;
  std::string value;
  while (take_option(args, long_name, short_name, value)) {
    values.push_back(value);
  }
  return values;
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

bool parse_size(const std::string &raw, const std::string &what, std::size_t &out) {
  try {
    std::size_t consumed = 0;
    const unsigned long value = std::stoul(raw, &consumed);
    if (consumed != raw.size()) {
      throw std::invalid_argument(raw);
    }
    out = static_cast<std::size_t>(value);
    return true;
  } catch (const std::exception &) {
    std::cerr << "invalid " << what << ": " << raw << "\n";
    return false;
  }
}

bool parse_double(const std::string &raw, const std::string &what, double &out) {
  try {
    std::size_t consumed = 0;
    out = std::stod(raw, &consumed);
    if (consumed != raw.size()) {
      throw std::invalid_argument(raw);
    }
    return true;
  } catch (const std::exception &) {
    std::cerr << "invalid " << what << ": " << raw << "\n";
    return false;
  }
}

bool reject_leftovers(const std::vector<std::string> &args, const std::string &command) {
  if (args.empty()) {
    return false;
  }
  std::cerr << "unexpected argument for " << command << ": " << args.front() << "\n";
  return true;
}

std::unique_ptr<discovery::ChainDiscovery> open_discovery() {
  auto cfg = config::load_config();
  if (!cfg.ok()) {
    std::cerr << cfg.error() << "\n";
    return nullptr;
  }

  observability::set_global_observer(observability::create_observer(cfg.value().observability));

  const auto validation = config::validate_config(cfg.value());
  if (!validation.ok()) {
    std::cerr << "invalid configuration: " << validation.error() << "\n";
    return nullptr;
  }
  for (const auto &warning : validation.value()) {
    observability::record_warning("config", warning);
  }

  auto discovery = discovery::ChainDiscovery::create(cfg.value());
  if (!discovery.ok()) {
    std::cerr << common::error_code_name(discovery.code()) << ": " << discovery.error() << "\n";
    return nullptr;
  }
  return std::move(discovery.value());
}

int run_generate(std::vector<std::string> args) {
  const bool force = take_flag(args, "--force");
  if (reject_leftovers(args, "generate")) {
    return 1;
  }
  auto discovery = open_discovery();
  if (!discovery) {
    return 1;
  }

  auto stats = discovery->generate_all_embeddings(force);
  if (!stats.ok()) {
    std::cerr << common::error_code_name(stats.code()) << ": " << stats.error() << "\n";
    return 1;
  }
  const auto &value = stats.value();
  std::cout << "total=" << value.total << " generated=" << value.generated
            << " cached=" << value.cached << " errors=" << value.errors
            << " duration_ms=" << value.duration.count() << "\n";
  return value.errors == 0 ? 0 : 2;
}

int run_paths(std::vector<std::string> args) {
  const auto triggers = take_repeated_option(args, "--trigger", "-t");
  std::string depth_raw;
  std::string similarity_raw;
  std::string top_k_raw;
  std::string limit_raw;
  (void)take_option(args, "--depth", "-d", depth_raw);
  (void)take_option(args, "--min-similarity", "", similarity_raw);
  (void)take_option(args, "--top-k", "-k", top_k_raw);
  (void)take_option(args, "--limit", "-n", limit_raw);
  if (reject_leftovers(args, "paths")) {
    return 1;
  }

  auto discovery = open_discovery();
  if (!discovery) {
    return 1;
  }

  auto options = graph::options_from_config(discovery->config().traversal);
  if (!depth_raw.empty() && !parse_size(depth_raw, "depth", options.max_depth)) {
    return 1;
  }
  if (!similarity_raw.empty() &&
      !parse_double(similarity_raw, "min-similarity", options.min_similarity)) {
    return 1;
  }
  if (!top_k_raw.empty() && !parse_size(top_k_raw, "top-k", options.top_k_per_hop)) {
    return 1;
  }
  if (!limit_raw.empty() && !parse_size(limit_raw, "limit", options.max_results)) {
    return 1;
  }

  auto result = discovery->find_paths(triggers, options);
  if (!result.ok()) {
    std::cerr << common::error_code_name(result.code()) << ": " << result.error() << "\n";
    return 1;
  }
  for (const auto &path : result.value().paths) {
    std::cout << graph::format_path(path) << "\n";
  }
  for (const auto &trigger : result.value().truncated_triggers) {
    std::cerr << "truncated: " << trigger << "\n";
  }
  for (const auto &trigger : result.value().skipped_triggers) {
    std::cerr << "skipped (no fresh embedding): " << trigger << "\n";
  }
  return 0;
}

int run_stats(std::vector<std::string> args) {
  if (reject_leftovers(args, "stats")) {
    return 1;
  }
  auto discovery = open_discovery();
  if (!discovery) {
    return 1;
  }

  auto stats = discovery->store_stats();
  if (!stats.ok()) {
    std::cerr << common::error_code_name(stats.code()) << ": " << stats.error() << "\n";
    return 1;
  }
  const auto &value = stats.value();
  std::cout << "Store: " << discovery->store().name() << "\n";
  std::cout << "Model: " << discovery->model().version() << "\n";
  std::cout << "Total: " << value.total << "\n";
  std::cout << "Current version: " << value.current_version << "\n";
  std::cout << "Stale version: " << value.stale_version << "\n";
  if (value.oldest_age_days.has_value()) {
    std::cout << "Oldest (days): " << *value.oldest_age_days << "\n";
    std::cout << "Newest (days): " << value.newest_age_days.value_or(0) << "\n";
  }
  return 0;
}

int run_invalidate(std::vector<std::string> args) {
  const bool all = take_flag(args, "--all");
  if (!all && args.empty()) {
    std::cerr << "usage: devchain invalidate (--all | DEVICE_ID...)\n";
    return 1;
  }
  if (all && !args.empty()) {
    std::cerr << "--all cannot be combined with device ids\n";
    return 1;
  }

  auto discovery = open_discovery();
  if (!discovery) {
    return 1;
  }
  auto removed = all ? discovery->invalidate_all() : discovery->invalidate(args);
  if (!removed.ok()) {
    std::cerr << common::error_code_name(removed.code()) << ": " << removed.error() << "\n";
    return 1;
  }
  std::cout << "Removed " << removed.value() << " embeddings\n";
  return 0;
}

void print_help() {
  std::cout << version_string() << "\n\n";
  std::cout << "usage: devchain [--config PATH] <command> [options]\n\n";
  std::cout << "commands:\n";
  std::cout << "  generate [--force]           build or refresh device embeddings\n";
  std::cout << "  paths [options]              list ranked automation chains\n";
  std::cout << "      --trigger, -t ID         trigger device (repeatable)\n";
  std::cout << "      --depth, -d N            devices per chain (2-5)\n";
  std::cout << "      --min-similarity X       minimum hop similarity\n";
  std::cout << "      --top-k, -k K            candidates kept per hop\n";
  std::cout << "      --limit, -n N            maximum chains printed\n";
  std::cout << "  stats                        embedding store summary\n";
  std::cout << "  invalidate (--all | ID...)   delete stored embeddings\n";
  std::cout << "  config-path                  print the config file location\n";
  std::cout << "  version                      print the version\n";
}

} // namespace

int run_cli(int argc, char **argv) {
  std::vector<std::string> args = collect_args(argc > 0 ? argc - 1 : 0, argv + (argc > 0 ? 1 : 0));
  std::string global_error;
  if (!apply_global_options(args, global_error)) {
    std::cerr << global_error << "\n";
    return 1;
  }

  if (args.empty()) {
    print_help();
    return 0;
  }

  const std::string subcommand = args[0];
  args.erase(args.begin());

  if (subcommand == "--help" || subcommand == "-h" || subcommand == "help") {
    print_help();
    return 0;
  }
  if (subcommand == "--version" || subcommand == "-V" || subcommand == "version") {
    std::cout << version_string() << "\n";
    return 0;
  }
  if (subcommand == "config-path") {
    auto path_result = config::config_path();
    if (!path_result.ok()) {
      std::cerr << path_result.error() << "\n";
      return 1;
    }
    std::cout << path_result.value().string() << "\n";
    return 0;
  }
  if (subcommand == "generate") {
    return run_generate(std::move(args));
  }
  if (subcommand == "paths") {
    return run_paths(std::move(args));
  }
  if (subcommand == "stats") {
    return run_stats(std::move(args));
  }
  if (subcommand == "invalidate") {
    return run_invalidate(std::move(args));
  }

  std::cerr << "unknown command: " << subcommand << "\n";
  print_help();
  return 1;
}

} // namespace devchain::cli
