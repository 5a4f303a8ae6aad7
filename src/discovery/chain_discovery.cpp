#include "devchain/discovery/chain_discovery.hpp"

#include "devchain/observability/global.hpp"

#include <algorithm>
#include <cstdint>
#include <unordered_set>

namespace devchain::discovery {

ChainDiscovery::ChainDiscovery(config::Config config,
                               std::unique_ptr<catalog::ICatalogProvider> catalog,
                               std::unique_ptr<embedding::IEmbeddingModel> model,
                               std::unique_ptr<store::IEmbeddingStore> store)
    : config_(std::move(config)), catalog_(std::move(catalog)), model_(std::move(model)),
      store_(std::move(store)), scorer_(graph::weights_from_config(config_.scoring)) {}

common::Result<std::unique_ptr<ChainDiscovery>> ChainDiscovery::create(const config::Config &config) {
  using DiscoveryResult = common::Result<std::unique_ptr<ChainDiscovery>>;

  auto catalog = catalog::create_catalog(config.catalog);
  if (!catalog.ok()) {
    return DiscoveryResult::failure(catalog.status());
  }
  auto model = embedding::create_embedding_model(config.embedding);
  if (!model.ok()) {
    return DiscoveryResult::failure(model.status());
  }
  auto store = store::create_embedding_store(config.store);
  if (!store.ok()) {
    return DiscoveryResult::failure(store.status());
  }
  return DiscoveryResult::success(std::make_unique<ChainDiscovery>(
      config, std::move(catalog.value()), std::move(model.value()), std::move(store.value())));
}

common::Result<generator::GenerationStats>
ChainDiscovery::generate_all_embeddings(const bool force_refresh) {
  std::lock_guard<std::mutex> lock(mutex_);
  generator::EmbeddingGenerator generator(
      *catalog_, *model_, *store_,
      generator::GeneratorOptions{.batch_size = config_.generator.batch_size,
                                  .max_age = store::max_age_from_days(config_.store.max_age_days)});
  return generator.run(force_refresh);
}

common::Result<graph::SearchResult>
ChainDiscovery::find_paths(const std::vector<std::string> &triggers) {
  return find_paths(triggers, graph::options_from_config(config_.traversal));
}

common::Result<graph::SearchResult>
ChainDiscovery::find_paths(const std::vector<std::string> &triggers,
                           const graph::FinderOptions &options) {
  using PathsResult = common::Result<graph::SearchResult>;
  if (auto status = graph::PathFinder::validate(options); !status.ok()) {
    return PathsResult::failure(status);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  auto devices = catalog_->list_devices();
  if (!devices.ok()) {
    return PathsResult::failure(common::ErrorCode::CatalogUnavailable, devices.error());
  }
  const catalog::DeviceIndex index = catalog::index_devices(devices.value());

  auto snapshot = graph::VectorSnapshot::capture(*store_, model_->version(),
                                                 store::max_age_from_days(config_.store.max_age_days));
  if (!snapshot.ok()) {
    return PathsResult::failure(snapshot.status());
  }
  snapshot.value().retain(index);
  observability::record_metric(
      observability::SnapshotSizeMetric{.vectors = static_cast<std::uint64_t>(snapshot.value().size())});

  const std::vector<std::string> selected = triggers.empty() ? default_triggers(index) : triggers;
  if (selected.empty()) {
    observability::record_warning("discovery", "no trigger devices selected");
  }

  const graph::PathFinder finder(snapshot.value(), index, scorer_);
  return finder.find_paths(selected, options);
}

std::vector<std::string> ChainDiscovery::default_triggers(const catalog::DeviceIndex &devices) const {
  const std::unordered_set<std::string> domains(config_.traversal.trigger_domains.begin(),
                                                config_.traversal.trigger_domains.end());
  std::vector<std::string> out;
  for (const auto &[id, device] : devices) {
    if (domains.count(device.domain) > 0) {
      out.push_back(id);
    }
  }
  std::sort(out.begin(), out.end());
  return out;
}

common::Result<store::StoreStats> ChainDiscovery::store_stats() {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_->stats(model_->version());
}

common::Result<std::size_t> ChainDiscovery::invalidate(const std::vector<std::string> &device_ids) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t removed = 0;
  for (const auto &device_id : device_ids) {
    auto result = store_->remove(device_id);
    if (!result.ok()) {
      return common::Result<std::size_t>::failure(result.status());
    }
    if (result.value()) {
      ++removed;
    }
  }
  return common::Result<std::size_t>::success(removed);
}

common::Result<std::size_t> ChainDiscovery::invalidate_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  return store_->clear();
}

} // namespace devchain::discovery
