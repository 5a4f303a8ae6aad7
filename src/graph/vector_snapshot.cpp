#include "devchain/graph/vector_snapshot.hpp"

#include <algorithm>

namespace devchain::graph {

VectorSnapshot::VectorSnapshot(std::unordered_map<std::string, embedding::Vector> vectors)
    : vectors_(std::move(vectors)) {
  rebuild_ids();
}

common::Result<VectorSnapshot> VectorSnapshot::capture(store::IEmbeddingStore &store,
                                                       const std::string &current_model_version,
                                                       const store::MaxAge max_age,
                                                       const common::Timestamp now) {
  auto rows = store.entries();
  if (!rows.ok()) {
    return common::Result<VectorSnapshot>::failure(rows.status());
  }

  std::unordered_map<std::string, embedding::Vector> vectors;
  for (auto &row : rows.value()) {
    if (!store::is_fresh_embedding(row, current_model_version, max_age, now)) {
      continue;
    }
    vectors.emplace(row.device_id, std::move(row.vector));
  }
  return common::Result<VectorSnapshot>::success(VectorSnapshot(std::move(vectors)));
}

void VectorSnapshot::retain(const catalog::DeviceIndex &devices) {
  for (auto it = vectors_.begin(); it != vectors_.end();) {
    if (devices.find(it->first) == devices.end()) {
      it = vectors_.erase(it);
    } else {
      ++it;
    }
  }
  rebuild_ids();
}

const embedding::Vector *VectorSnapshot::find(const std::string &device_id) const {
  const auto it = vectors_.find(device_id);
  return it == vectors_.end() ? nullptr : &it->second;
}

bool VectorSnapshot::contains(const std::string &device_id) const {
  return vectors_.find(device_id) != vectors_.end();
}

void VectorSnapshot::rebuild_ids() {
  ids_.clear();
  ids_.reserve(vectors_.size());
  for (const auto &[id, vector] : vectors_) {
    ids_.push_back(id);
  }
  std::sort(ids_.begin(), ids_.end());
}

} // namespace devchain::graph
