#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devchain/config/config.hpp"

#include <cmath>

void register_config_tests(std::vector<devchain::tests::TestCase> &tests) {
  using devchain::tests::require;
  namespace cfg = devchain::config;
  namespace t = devchain::testing;

  tests.push_back({"config_defaults_match_documented_values", [] {
                     const cfg::Config config;
                     require(config.traversal.max_depth == 3, "max_depth default");
                     require(std::abs(config.traversal.min_similarity - 0.6) < 1e-9,
                             "min_similarity default");
                     require(config.traversal.top_k_per_hop == 5, "top_k default");
                     require(std::abs(config.traversal.area_bonus - 0.1) < 1e-9, "area bonus");
                     require(std::abs(config.traversal.acceptance_floor - 0.5) < 1e-9, "floor");
                     require(config.traversal.trigger_timeout_ms == 5000, "timeout default");
                     require(config.generator.batch_size == 32, "batch size default");
                     require(config.store.max_age_days == 30, "max age default");
                     require(std::abs(config.scoring.similarity_weight - 0.4) < 1e-9 &&
                                 std::abs(config.scoring.area_weight - 0.3) < 1e-9 &&
                                 std::abs(config.scoring.diversity_weight - 0.3) < 1e-9,
                             "scoring weights default");
                     auto validated = cfg::validate_config(config);
                     require(validated.ok(), validated.error());
                     require(validated.value().empty(), "defaults produce no warnings");
                   }});

  tests.push_back({"config_parse_overrides_sections", [] {
                     auto parsed = cfg::parse_config(R"(
[catalog]
source = "data_api"
base_url = "http://localhost:8006"

[embedding]
provider = "http"
dimensions = 256

[store]
backend = "memory"
max_age_days = 7

[traversal]
max_depth = 4
min_similarity = 0.7
trigger_domains = ["event"]

[scoring]
similarity_weight = 0.5
area_weight = 0.25
diversity_weight = 0.25
)");
                     require(parsed.ok(), parsed.error());
                     const auto &config = parsed.value();
                     require(config.catalog.source == "data_api", "catalog source");
                     require(config.catalog.base_url == "http://localhost:8006", "catalog url");
                     require(config.embedding.provider == "http", "provider");
                     require(config.embedding.dimensions == 256, "dimensions");
                     require(config.store.backend == "memory", "store backend");
                     require(config.store.max_age_days == 7, "max age");
                     require(config.traversal.max_depth == 4, "max depth");
                     require(config.traversal.trigger_domains.size() == 1 &&
                                 config.traversal.trigger_domains[0] == "event",
                             "trigger domains");
                     require(std::abs(config.scoring.similarity_weight - 0.5) < 1e-9,
                             "similarity weight");
                     require(config.traversal.top_k_per_hop == 5, "untouched keys keep defaults");
                   }});

  tests.push_back({"config_validation_rejects_unusable_values", [] {
                     cfg::Config depth;
                     depth.traversal.max_depth = 6;
                     require(!cfg::validate_config(depth).ok(), "depth 6 rejected");

                     cfg::Config shallow;
                     shallow.traversal.max_depth = 1;
                     require(!cfg::validate_config(shallow).ok(), "depth 1 rejected");

                     cfg::Config provider;
                     provider.embedding.provider = "cloud";
                     require(!cfg::validate_config(provider).ok(), "unknown provider rejected");

                     cfg::Config weights;
                     weights.scoring.area_weight = -0.1;
                     require(!cfg::validate_config(weights).ok(), "negative weight rejected");

                     cfg::Config batch;
                     batch.generator.batch_size = 0;
                     auto result = cfg::validate_config(batch);
                     require(!result.ok(), "zero batch rejected");
                     require(result.code() == devchain::common::ErrorCode::InvalidArgument,
                             "InvalidArgument expected");
                   }});

  tests.push_back({"config_validation_bounds_durations", [] {
                     cfg::Config age;
                     age.store.max_age_days = 200'000;
                     auto aged = cfg::validate_config(age);
                     require(!aged.ok() && aged.code() == devchain::common::ErrorCode::InvalidArgument,
                             "huge max_age_days rejected");
                     age.store.max_age_days = cfg::kMaxStoreAgeDays;
                     require(cfg::validate_config(age).ok(), "max_age_days limit accepted");

                     cfg::Config timeout;
                     timeout.traversal.trigger_timeout_ms = 10'000'000'000'000;
                     require(!cfg::validate_config(timeout).ok(), "huge timeout rejected");
                     timeout.traversal.trigger_timeout_ms = cfg::kMaxTriggerTimeoutMs;
                     require(cfg::validate_config(timeout).ok(), "timeout limit accepted");

                     auto parsed = cfg::parse_config("[store]\nmax_age_days = 4294967301\n");
                     require(parsed.ok(), parsed.error());
                     require(!cfg::validate_config(parsed.value()).ok(),
                             "out-of-range days do not wrap into a small window");
                   }});

  tests.push_back({"config_validation_warns_on_suspicious_values", [] {
                     cfg::Config config;
                     config.traversal.min_similarity = 1.1;
                     config.scoring.similarity_weight = 0.6;
                     auto result = cfg::validate_config(config);
                     require(result.ok(), result.error());
                     require(result.value().size() == 2, "unreachable threshold and weight sum");
                   }});

  tests.push_back({"config_save_and_load_roundtrip", [] {
                     t::TempWorkspace workspace;
                     const auto path = workspace.path() / "config.toml";
                     cfg::set_config_path_override(path);

                     cfg::Config config;
                     config.store.backend = "memory";
                     config.traversal.max_depth = 5;
                     config.traversal.trigger_domains = {"binary_sensor", "button"};
                     config.observability.verbose = true;
                     auto saved = cfg::save_config(config);
                     require(saved.ok(), saved.error());

                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.backend == "memory", "backend persisted");
                     require(loaded.value().traversal.max_depth == 5, "depth persisted");
                     require(loaded.value().traversal.trigger_domains.size() == 2,
                             "domains persisted");
                     require(loaded.value().observability.verbose, "verbose persisted");
                   }});

  tests.push_back({"config_missing_file_yields_defaults", [] {
                     t::TempWorkspace workspace;
                     cfg::set_config_path_override(workspace.path() / "absent.toml");
                     auto loaded = cfg::load_config();
                     cfg::clear_config_path_override();
                     require(loaded.ok(), loaded.error());
                     require(loaded.value().store.backend == "sqlite", "default backend");
                   }});

  tests.push_back({"config_env_overrides_apply_last", [] {
                     const t::EnvGuard store_path("DEVCHAIN_STORE_PATH", "/tmp/devchain-env.db");
                     const t::EnvGuard provider("DEVCHAIN_EMBEDDING_PROVIDER", "http");
                     const t::EnvGuard catalog("DEVCHAIN_CATALOG_URL", "http://catalog:1");
                     const t::EnvGuard log("DEVCHAIN_LOG", "none");
                     cfg::Config config;
                     cfg::apply_env_overrides(config);
                     require(config.store.path == "/tmp/devchain-env.db", "store path override");
                     require(config.embedding.provider == "http", "provider override");
                     require(config.catalog.source == "data_api", "catalog url switches source");
                     require(config.catalog.base_url == "http://catalog:1", "catalog url");
                     require(config.observability.backend == "none", "log override");
                   }});

  tests.push_back({"config_path_honours_env_variable", [] {
                     const t::EnvGuard env("DEVCHAIN_CONFIG_PATH", "/tmp/devchain-custom.toml");
                     cfg::clear_config_path_override();
                     auto path = cfg::config_path();
                     require(path.ok(), path.error());
                     require(path.value() == std::filesystem::path("/tmp/devchain-custom.toml"),
                             "env path used");
                   }});
}
