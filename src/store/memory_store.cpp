#include "devchain/store/memory_store.hpp"

namespace devchain::store {

common::Result<std::optional<DeviceEmbedding>> MemoryEmbeddingStore::get(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = rows_.find(device_id);
  if (it == rows_.end()) {
    return common::Result<std::optional<DeviceEmbedding>>::success(std::nullopt);
  }
  return common::Result<std::optional<DeviceEmbedding>>::success(it->second);
}

common::Status MemoryEmbeddingStore::upsert(const DeviceEmbedding &embedding) {
  if (embedding.device_id.empty()) {
    return common::Status::error(common::ErrorCode::StorageFailure, "empty device_id");
  }
  std::lock_guard<std::mutex> lock(mutex_);
  rows_[embedding.device_id] = embedding;
  return common::Status::success();
}

bool MemoryEmbeddingStore::is_fresh(const std::string &device_id,
                                    const std::string &current_model_version,
                                    const MaxAge max_age) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = rows_.find(device_id);
  return it != rows_.end() && is_fresh_embedding(it->second, current_model_version, max_age);
}

common::Result<std::unordered_map<std::string, embedding::Vector>> MemoryEmbeddingStore::all() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::unordered_map<std::string, embedding::Vector> out;
  out.reserve(rows_.size());
  for (const auto &[id, row] : rows_) {
    out.emplace(id, row.vector);
  }
  return common::Result<std::unordered_map<std::string, embedding::Vector>>::success(std::move(out));
}

common::Result<std::vector<DeviceEmbedding>> MemoryEmbeddingStore::entries() {
  std::lock_guard<std::mutex> lock(mutex_);
  std::vector<DeviceEmbedding> out;
  out.reserve(rows_.size());
  for (const auto &[id, row] : rows_) {
    out.push_back(row);
  }
  return common::Result<std::vector<DeviceEmbedding>>::success(std::move(out));
}

common::Result<bool> MemoryEmbeddingStore::remove(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<bool>::success(rows_.erase(device_id) > 0);
}

common::Result<std::size_t> MemoryEmbeddingStore::clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t removed = rows_.size();
  rows_.clear();
  return common::Result<std::size_t>::success(removed);
}

common::Result<std::size_t> MemoryEmbeddingStore::count() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<std::size_t>::success(rows_.size());
}

} // namespace devchain::store
