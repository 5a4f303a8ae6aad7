#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace devchain::config {

/// Upper bounds accepted by validate_config; larger values overflow chrono durations.
inline constexpr std::uint32_t kMaxStoreAgeDays = 36'500;
inline constexpr std::uint64_t kMaxTriggerTimeoutMs = 86'400'000;

struct CatalogConfig {
  std::string source = "file"; // "file" or "data_api"
  std::string path = "~/.devchain/devices.json";
  std::string base_url = "http://data-api:8006";
  std::size_t limit = 1000;
  std::uint64_t timeout_ms = 30'000;
};

struct EmbeddingConfig {
  std::string provider = "local"; // "local" or "http"
  std::string model = "all-MiniLM-L6-v2-int8";
  std::string base_url = "http://openvino-service:8019";
  std::size_t dimensions = 384;
  std::uint64_t timeout_ms = 30'000;
};

struct StoreConfig {
  std::string backend = "sqlite"; // "sqlite" or "memory"
  std::string path = "~/.devchain/embeddings.db";
  std::uint32_t max_age_days = 30;
};

struct GeneratorConfig {
  std::size_t batch_size = 32;
};

struct TraversalConfig {
  std::size_t max_depth = 3;
  double min_similarity = 0.6;
  std::size_t top_k_per_hop = 5;
  double area_bonus = 0.1;
  double acceptance_floor = 0.5;
  std::uint64_t trigger_timeout_ms = 5'000;
  std::size_t worker_threads = 1;
  std::size_t max_results = 0;
  std::vector<std::string> trigger_domains = {"binary_sensor", "sensor", "event", "button"};
};

struct ScoringConfig {
  double similarity_weight = 0.4;
  double area_weight = 0.3;
  double diversity_weight = 0.3;
};

struct ObservabilityConfig {
  std::string backend = "log";
  bool verbose = false;
};

struct Config {
  CatalogConfig catalog;
  EmbeddingConfig embedding;
  StoreConfig store;
  GeneratorConfig generator;
  TraversalConfig traversal;
  ScoringConfig scoring;
  ObservabilityConfig observability;
};

} // namespace devchain::config
