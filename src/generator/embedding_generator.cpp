#include "devchain/generator/embedding_generator.hpp"

#include "devchain/observability/global.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace devchain::generator {

namespace {

constexpr const char *kComponent = "generator";

std::chrono::milliseconds elapsed_since(const std::chrono::steady_clock::time_point started) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() -
                                                               started);
}

} // namespace

EmbeddingGenerator::EmbeddingGenerator(catalog::ICatalogProvider &catalog,
                                       embedding::IEmbeddingModel &model,
                                       store::IEmbeddingStore &store, GeneratorOptions options)
    : catalog_(catalog), model_(model), store_(store), options_(options) {
  if (options_.batch_size == 0) {
    options_.batch_size = 1;
  }
}

common::Result<GenerationStats> EmbeddingGenerator::run(const bool force_refresh) {
  const auto started = std::chrono::steady_clock::now();
  auto result = run_pipeline(force_refresh, started);
  if (!result.ok()) {
    observability::record_error(kComponent, std::string(common::error_code_name(result.code())) +
                                                ": " + result.error());
  }
  return result;
}

common::Result<GenerationStats>
EmbeddingGenerator::run_pipeline(const bool force_refresh,
                               const std::chrono::steady_clock::time_point started) {
  using StatsResult = common::Result<GenerationStats>;

  if (auto status = model_.load(); !status.ok()) {
    return StatsResult::failure(common::ErrorCode::ModelUnavailable, status.error());
  }
  const std::string model_version = model_.version();
  observability::record_generation_start(force_refresh, model_version);

  auto devices = catalog_.list_devices();
  if (!devices.ok()) {
    return StatsResult::failure(common::ErrorCode::CatalogUnavailable, devices.error());
  }

  GenerationStats stats;
  stats.total = devices.value().size();

  std::vector<PendingDevice> pending;
  std::unordered_set<std::string> seen;
  for (const auto &device : devices.value()) {
    if (device.device_id.empty()) {
      ++stats.errors;
      observability::record_warning(kComponent, "DescriptorBuildFailure: device with empty id");
      continue;
    }
    if (!seen.insert(device.device_id).second) {
      ++stats.errors;
      observability::record_warning(kComponent,
                                    "DescriptorBuildFailure: duplicate device id " + device.device_id);
      continue;
    }

    auto capabilities = catalog_.get_capabilities(device.device_id);
    const std::string descriptor = capabilities.ok()
                                       ? builder_.build(device, capabilities.value())
                                       : builder_.build(device);

    if (!force_refresh && store_.is_fresh(device.device_id, model_version, options_.max_age)) {
      const auto existing = store_.get(device.device_id);
      if (existing.ok() && existing.value().has_value() &&
          existing.value()->descriptor == descriptor) {
        ++stats.cached;
        continue;
      }
    }
    pending.push_back(PendingDevice{.device_id = device.device_id, .descriptor = descriptor});
  }

  observability::record_metric(observability::EmbeddingCacheMetric{
      .hits = static_cast<std::uint64_t>(stats.cached),
      .misses = static_cast<std::uint64_t>(pending.size())});

  for (std::size_t start = 0; start < pending.size(); start += options_.batch_size) {
    const std::size_t end = std::min(pending.size(), start + options_.batch_size);
    std::vector<std::string> texts;
    texts.reserve(end - start);
    for (std::size_t i = start; i < end; ++i) {
      texts.push_back(pending[i].descriptor);
    }

    auto vectors = model_.encode(texts, options_.batch_size);
    if (!vectors.ok()) {
      return StatsResult::failure(common::ErrorCode::ModelUnavailable, vectors.error());
    }
    if (vectors.value().size() != texts.size()) {
      return StatsResult::failure(common::ErrorCode::ModelUnavailable,
                                  "model returned " + std::to_string(vectors.value().size()) +
                                      " vectors for " + std::to_string(texts.size()) + " texts");
    }

    const auto generated_at = common::Clock::now();
    for (std::size_t i = start; i < end; ++i) {
      auto &vector = vectors.value()[i - start];
      store::DeviceEmbedding row{.device_id = pending[i].device_id,
                                 .vector = std::move(vector),
                                 .descriptor = pending[i].descriptor,
                                 .model_version = model_version,
                                 .norm = 0.0,
                                 .generated_at = generated_at};
      row.norm = embedding::l2_norm(row.vector);
      if (auto status = store_.upsert(row); !status.ok()) {
        ++stats.errors;
        observability::record_warning(kComponent, "StorageFailure for " + row.device_id + ": " +
                                                      status.error());
        continue;
      }
      ++stats.generated;
    }
    observability::record_debug(kComponent, "stored batch of " + std::to_string(end - start));
  }

  stats.duration = elapsed_since(started);
  observability::record_generation_end(stats.total, stats.generated, stats.cached, stats.errors,
                                       stats.duration);
  return StatsResult::success(stats);
}

} // namespace devchain::generator
