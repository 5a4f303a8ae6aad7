#include "devchain/config/config.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/common/toml.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <fstream>
#include <limits>
#include <sstream>

namespace devchain::config {

namespace {

constexpr const char *CONFIG_FOLDER = ".devchain";
constexpr const char *CONFIG_FILENAME = "config.toml";
std::optional<std::filesystem::path> g_config_path_override;

std::optional<std::filesystem::path> resolved_config_path_override() {
  if (g_config_path_override.has_value()) {
    return g_config_path_override;
  }
  if (const char *env = std::getenv("DEVCHAIN_CONFIG_PATH"); env != nullptr && *env != '\0') {
    return std::filesystem::path(common::expand_path(env));
  }
  return std::nullopt;
}

std::string expand_config_value(const std::string &value) {
  if (value.find('$') == std::string::npos && value.find('~') == std::string::npos) {
    return value;
  }
  return common::expand_path(value);
}

const char *non_empty_env(const char *name) {
  const char *value = std::getenv(name);
  return (value != nullptr && *value != '\0') ? value : nullptr;
}

std::string bool_to_toml(bool value) { return value ? "true" : "false"; }

std::string string_array_to_toml(const std::vector<std::string> &values) {
  std::ostringstream stream;
  stream << '[';
  for (std::size_t index = 0; index < values.size(); ++index) {
    if (index > 0) {
      stream << ", ";
    }
    stream << common::quote_toml_string(values[index]);
  }
  stream << ']';
  return stream.str();
}

bool in_unit_interval(const double value) { return value >= 0.0 && value <= 1.0; }

} // namespace

common::Result<std::filesystem::path> config_dir() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    auto parent = override_path->parent_path();
    if (parent.empty()) {
      std::error_code ec;
      parent = std::filesystem::current_path(ec);
      if (ec) {
        return common::Result<std::filesystem::path>::failure("unable to resolve current directory");
      }
    }
    return common::Result<std::filesystem::path>::success(parent);
  }

  const auto home = common::home_dir();
  if (!home.ok()) {
    return common::Result<std::filesystem::path>::failure(home.error());
  }
  return common::Result<std::filesystem::path>::success(home.value() / CONFIG_FOLDER);
}

common::Result<std::filesystem::path> config_path() {
  if (const auto override_path = resolved_config_path_override(); override_path.has_value()) {
    return common::Result<std::filesystem::path>::success(*override_path);
  }

  const auto cfg_dir = config_dir();
  if (!cfg_dir.ok()) {
    return common::Result<std::filesystem::path>::failure(cfg_dir.error());
  }
  return common::Result<std::filesystem::path>::success(cfg_dir.value() / CONFIG_FILENAME);
}

void set_config_path_override(std::optional<std::filesystem::path> path) {
  if (!path.has_value()) {
    g_config_path_override = std::nullopt;
    return;
  }
  g_config_path_override = std::filesystem::path(common::expand_path(path->string()));
}

void clear_config_path_override() { g_config_path_override = std::nullopt; }

std::string expand_config_path(const std::string &path) { return common::expand_path(path); }

void apply_env_overrides(Config &config) {
  if (const char *path = non_empty_env("DEVCHAIN_STORE_PATH"); path != nullptr) {
    config.store.path = path;
  }
  if (const char *provider = non_empty_env("DEVCHAIN_EMBEDDING_PROVIDER"); provider != nullptr) {
    config.embedding.provider = provider;
  }
  if (const char *url = non_empty_env("DEVCHAIN_EMBEDDING_URL"); url != nullptr) {
    config.embedding.base_url = url;
  }
  if (const char *url = non_empty_env("DEVCHAIN_CATALOG_URL"); url != nullptr) {
    config.catalog.source = "data_api";
    config.catalog.base_url = url;
  }
  if (const char *log = non_empty_env("DEVCHAIN_LOG"); log != nullptr) {
    config.observability.backend = log;
  }
}

common::Result<Config> parse_config(const std::string &content) {
  const auto parsed = common::parse_toml(content);
  if (!parsed.ok()) {
    return common::Result<Config>::failure(parsed.status());
  }
  const auto &doc = parsed.value();

  Config config;

  config.catalog.source = doc.get_string("catalog.source", config.catalog.source);
  config.catalog.path = expand_config_value(doc.get_string("catalog.path", config.catalog.path));
  config.catalog.base_url =
      expand_config_value(doc.get_string("catalog.base_url", config.catalog.base_url));
  config.catalog.limit = doc.get_size("catalog.limit", config.catalog.limit);
  config.catalog.timeout_ms = doc.get_size("catalog.timeout_ms", config.catalog.timeout_ms);

  config.embedding.provider = doc.get_string("embedding.provider", config.embedding.provider);
  config.embedding.model = doc.get_string("embedding.model", config.embedding.model);
  config.embedding.base_url =
      expand_config_value(doc.get_string("embedding.base_url", config.embedding.base_url));
  config.embedding.dimensions = doc.get_size("embedding.dimensions", config.embedding.dimensions);
  config.embedding.timeout_ms = doc.get_size("embedding.timeout_ms", config.embedding.timeout_ms);

  config.store.backend = doc.get_string("store.backend", config.store.backend);
  config.store.path = expand_config_value(doc.get_string("store.path", config.store.path));
  config.store.max_age_days = static_cast<std::uint32_t>(
      std::min<std::size_t>(doc.get_size("store.max_age_days", config.store.max_age_days),
                            std::numeric_limits<std::uint32_t>::max()));

  config.generator.batch_size = doc.get_size("generator.batch_size", config.generator.batch_size);

  auto &traversal = config.traversal;
  traversal.max_depth = doc.get_size("traversal.max_depth", traversal.max_depth);
  traversal.min_similarity = doc.get_double("traversal.min_similarity", traversal.min_similarity);
  traversal.top_k_per_hop = doc.get_size("traversal.top_k_per_hop", traversal.top_k_per_hop);
  traversal.area_bonus = doc.get_double("traversal.area_bonus", traversal.area_bonus);
  traversal.acceptance_floor =
      doc.get_double("traversal.acceptance_floor", traversal.acceptance_floor);
  traversal.trigger_timeout_ms =
      doc.get_size("traversal.trigger_timeout_ms", traversal.trigger_timeout_ms);
  traversal.worker_threads = doc.get_size("traversal.worker_threads", traversal.worker_threads);
  traversal.max_results = doc.get_size("traversal.max_results", traversal.max_results);
  traversal.trigger_domains =
      doc.get_string_array("traversal.trigger_domains", traversal.trigger_domains);

  config.scoring.similarity_weight =
      doc.get_double("scoring.similarity_weight", config.scoring.similarity_weight);
  config.scoring.area_weight = doc.get_double("scoring.area_weight", config.scoring.area_weight);
  config.scoring.diversity_weight =
      doc.get_double("scoring.diversity_weight", config.scoring.diversity_weight);

  config.observability.backend =
      doc.get_string("observability.backend", config.observability.backend);
  config.observability.verbose =
      doc.get_bool("observability.verbose", config.observability.verbose);

  return common::Result<Config>::success(std::move(config));
}

common::Result<Config> load_config() {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Result<Config>::failure(cfg_path_result.error());
  }

  const auto path = cfg_path_result.value();
  if (!std::filesystem::exists(path)) {
    Config config;
    apply_env_overrides(config);
    return common::Result<Config>::success(std::move(config));
  }

  const auto content = common::read_file(path);
  if (!content.ok()) {
    return common::Result<Config>::failure("Unable to open config file: " + path.string());
  }

  auto config = parse_config(content.value());
  if (!config.ok()) {
    return common::Result<Config>::failure(config.code(),
                                           path.string() + ": " + config.error());
  }
  apply_env_overrides(config.value());
  return config;
}

common::Status save_config(const Config &config) {
  const auto cfg_path_result = config_path();
  if (!cfg_path_result.ok()) {
    return common::Status::error(cfg_path_result.error());
  }

  const std::filesystem::path path = cfg_path_result.value();
  if (!path.parent_path().empty()) {
    const auto ensured = common::ensure_dir(path.parent_path());
    if (!ensured.ok()) {
      return common::Status::error(ensured.error());
    }
  }
  const std::filesystem::path tmp_path = path.string() + ".tmp";

  std::ofstream file(tmp_path, std::ios::trunc);
  if (!file) {
    return common::Status::error("Unable to write temporary config file");
  }

  file << "[catalog]\n";
  file << "source = " << common::quote_toml_string(config.catalog.source) << "\n";
  file << "path = " << common::quote_toml_string(config.catalog.path) << "\n";
  file << "base_url = " << common::quote_toml_string(config.catalog.base_url) << "\n";
  file << "limit = " << config.catalog.limit << "\n";
  file << "timeout_ms = " << config.catalog.timeout_ms << "\n";

  file << "\n[embedding]\n";
  file << "provider = " << common::quote_toml_string(config.embedding.provider) << "\n";
  file << "model = " << common::quote_toml_string(config.embedding.model) << "\n";
  file << "base_url = " << common::quote_toml_string(config.embedding.base_url) << "\n";
  file << "dimensions = " << config.embedding.dimensions << "\n";
  file << "timeout_ms = " << config.embedding.timeout_ms << "\n";

  file << "\n[store]\n";
  file << "backend = " << common::quote_toml_string(config.store.backend) << "\n";
  file << "path = " << common::quote_toml_string(config.store.path) << "\n";
  file << "max_age_days = " << config.store.max_age_days << "\n";

  file << "\n[generator]\n";
  file << "batch_size = " << config.generator.batch_size << "\n";

  file << "\n[traversal]\n";
  file << "max_depth = " << config.traversal.max_depth << "\n";
  file << "min_similarity = " << config.traversal.min_similarity << "\n";
  file << "top_k_per_hop = " << config.traversal.top_k_per_hop << "\n";
  file << "area_bonus = " << config.traversal.area_bonus << "\n";
  file << "acceptance_floor = " << config.traversal.acceptance_floor << "\n";
  file << "trigger_timeout_ms = " << config.traversal.trigger_timeout_ms << "\n";
  file << "worker_threads = " << config.traversal.worker_threads << "\n";
  file << "max_results = " << config.traversal.max_results << "\n";
  file << "trigger_domains = " << string_array_to_toml(config.traversal.trigger_domains) << "\n";

  file << "\n[scoring]\n";
  file << "similarity_weight = " << config.scoring.similarity_weight << "\n";
  file << "area_weight = " << config.scoring.area_weight << "\n";
  file << "diversity_weight = " << config.scoring.diversity_weight << "\n";

  file << "\n[observability]\n";
  file << "backend = " << common::quote_toml_string(config.observability.backend) << "\n";
  file << "verbose = " << bool_to_toml(config.observability.verbose) << "\n";

  file.close();
  if (!file) {
    return common::Status::error("Failed to flush config file");
  }

  std::error_code ec;
  std::filesystem::rename(tmp_path, path, ec);
  if (ec) {
    return common::Status::error("Failed to replace config file: " + ec.message());
  }
  return common::Status::success();
}

common::Result<std::vector<std::string>> validate_config(const Config &config) {
  using Warnings = common::Result<std::vector<std::string>>;
  std::vector<std::string> warnings;

  const std::string source = common::to_lower(config.catalog.source);
  if (source != "file" && source != "data_api") {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "Invalid catalog.source: " + config.catalog.source);
  }

  const std::string provider = common::to_lower(config.embedding.provider);
  if (provider != "local" && provider != "http") {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "Invalid embedding.provider: " + config.embedding.provider);
  }
  if (config.embedding.dimensions == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "embedding.dimensions must be positive");
  }

  const std::string backend = common::to_lower(config.store.backend);
  if (backend != "sqlite" && backend != "memory") {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "Invalid store.backend: " + config.store.backend);
  }
  if (config.store.max_age_days > kMaxStoreAgeDays) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "store.max_age_days must be at most " +
                                 std::to_string(kMaxStoreAgeDays));
  }
  if (config.store.max_age_days == 0) {
    warnings.push_back("store.max_age_days is 0: every embedding is regenerated on each run");
  }

  if (config.generator.batch_size == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "generator.batch_size must be positive");
  }

  const auto &traversal = config.traversal;
  if (traversal.max_depth < 2 || traversal.max_depth > 5) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "traversal.max_depth must be between 2 and 5");
  }
  if (traversal.trigger_timeout_ms > kMaxTriggerTimeoutMs) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "traversal.trigger_timeout_ms must be at most " +
                                 std::to_string(kMaxTriggerTimeoutMs));
  }
  if (traversal.top_k_per_hop == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "traversal.top_k_per_hop must be positive");
  }
  if (traversal.min_similarity > 1.0) {
    warnings.push_back("traversal.min_similarity is unreachable: no path will be found");
  }
  if (!in_unit_interval(traversal.acceptance_floor)) {
    warnings.push_back("traversal.acceptance_floor is outside [0, 1]");
  }
  if (traversal.worker_threads == 0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "traversal.worker_threads must be positive");
  }
  if (traversal.trigger_domains.empty()) {
    warnings.push_back("traversal.trigger_domains is empty: explicit triggers are required");
  }

  const auto &scoring = config.scoring;
  if (scoring.similarity_weight < 0.0 || scoring.area_weight < 0.0 ||
      scoring.diversity_weight < 0.0) {
    return Warnings::failure(common::ErrorCode::InvalidArgument,
                             "scoring weights must not be negative");
  }
  const double weight_sum = scoring.similarity_weight + scoring.area_weight + scoring.diversity_weight;
  if (std::abs(weight_sum - 1.0) > 0.001) {
    warnings.push_back("scoring weights should sum to 1.0 (got " + std::to_string(weight_sum) + ")");
  }

  return Warnings::success(std::move(warnings));
}

} // namespace devchain::config
