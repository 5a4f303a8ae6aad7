#pragma once

#include "devchain/catalog/catalog.hpp"
#include "devchain/embedding/descriptor.hpp"
#include "devchain/embedding/model.hpp"
#include "devchain/store/embedding_store.hpp"

#include <chrono>

namespace devchain::generator {

struct GeneratorOptions {
  std::size_t batch_size = 32;
  store::MaxAge max_age = store::max_age_from_days(30);
};

struct GenerationStats {
  std::size_t total = 0;
  std::size_t generated = 0;
  std::size_t cached = 0;
  std::size_t errors = 0;
  std::chrono::milliseconds duration{0};
};

/// Catalog -> descriptors -> batched encode -> upsert. Devices whose stored row is
/// fresh and whose descriptor is unchanged are skipped unless force_refresh is set.
class EmbeddingGenerator {
public:
  EmbeddingGenerator(catalog::ICatalogProvider &catalog, embedding::IEmbeddingModel &model,
                     store::IEmbeddingStore &store, GeneratorOptions options = {});

  [[nodiscard]] common::Result<GenerationStats> run(bool force_refresh);

private:
  struct PendingDevice {
    std::string device_id;
    std::string descriptor;
  };

  [[nodiscard]] common::Result<GenerationStats> run_pipeline(bool force_refresh,
                                                          std::chrono::steady_clock::time_point started);

  catalog::ICatalogProvider &catalog_;
  embedding::IEmbeddingModel &model_;
  store::IEmbeddingStore &store_;
  GeneratorOptions options_;
  embedding::DescriptorBuilder builder_;
};

} // namespace devchain::generator
