#pragma once

#include "devchain/catalog/catalog.hpp"
#include "devchain/config/schema.hpp"
#include "devchain/embedding/model.hpp"
#include "devchain/generator/embedding_generator.hpp"
#include "devchain/graph/path_finder.hpp"
#include "devchain/store/embedding_store.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace devchain::discovery {

/// One configured pipeline: catalog, model and store shared by the embedding
/// generator and the path finder. Generation and traversal never overlap.
class ChainDiscovery {
public:
  ChainDiscovery(config::Config config, std::unique_ptr<catalog::ICatalogProvider> catalog,
                 std::unique_ptr<embedding::IEmbeddingModel> model,
                 std::unique_ptr<store::IEmbeddingStore> store);

  [[nodiscard]] static common::Result<std::unique_ptr<ChainDiscovery>>
  create(const config::Config &config);

  [[nodiscard]] common::Result<generator::GenerationStats>
  generate_all_embeddings(bool force_refresh);

  /// Empty triggers selects every device whose domain is a configured trigger domain.
  [[nodiscard]] common::Result<graph::SearchResult>
  find_paths(const std::vector<std::string> &triggers, const graph::FinderOptions &options);
  [[nodiscard]] common::Result<graph::SearchResult>
  find_paths(const std::vector<std::string> &triggers);

  [[nodiscard]] common::Result<store::StoreStats> store_stats();
  [[nodiscard]] common::Result<std::size_t> invalidate(const std::vector<std::string> &device_ids);
  [[nodiscard]] common::Result<std::size_t> invalidate_all();

  [[nodiscard]] const config::Config &config() const { return config_; }
  [[nodiscard]] catalog::ICatalogProvider &catalog() { return *catalog_; }
  [[nodiscard]] embedding::IEmbeddingModel &model() { return *model_; }
  [[nodiscard]] store::IEmbeddingStore &store() { return *store_; }

private:
  [[nodiscard]] std::vector<std::string> default_triggers(const catalog::DeviceIndex &devices) const;

  config::Config config_;
  std::unique_ptr<catalog::ICatalogProvider> catalog_;
  std::unique_ptr<embedding::IEmbeddingModel> model_;
  std::unique_ptr<store::IEmbeddingStore> store_;
  graph::PathScorer scorer_;
  std::mutex mutex_;
};

} // namespace devchain::discovery
