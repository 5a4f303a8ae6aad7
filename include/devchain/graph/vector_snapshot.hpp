#pragma once

#include "devchain/catalog/device.hpp"
#include "devchain/store/embedding_store.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace devchain::graph {

/// Immutable copy of the fresh vectors in a store, taken once per search so
/// concurrent writers cannot change what a traversal sees.
class VectorSnapshot {
public:
  VectorSnapshot() = default;
  explicit VectorSnapshot(std::unordered_map<std::string, embedding::Vector> vectors);

  /// Copies rows with the current model version that are younger than max_age.
  /// Reads every row once through entries() and applies is_fresh_embedding()
  /// itself instead of calling the per-row IEmbeddingStore::is_fresh().
  [[nodiscard]] static common::Result<VectorSnapshot>
  capture(store::IEmbeddingStore &store, const std::string &current_model_version,
          store::MaxAge max_age, common::Timestamp now = common::Clock::now());

  /// Drops vectors whose device is no longer in the catalog.
  void retain(const catalog::DeviceIndex &devices);

  [[nodiscard]] const embedding::Vector *find(const std::string &device_id) const;
  [[nodiscard]] bool contains(const std::string &device_id) const;
  /// Sorted ascending.
  [[nodiscard]] const std::vector<std::string> &ids() const { return ids_; }
  [[nodiscard]] std::size_t size() const { return vectors_.size(); }

private:
  void rebuild_ids();

  std::unordered_map<std::string, embedding::Vector> vectors_;
  std::vector<std::string> ids_;
};

} // namespace devchain::graph
