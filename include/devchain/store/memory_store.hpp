#pragma once

#include "devchain/store/embedding_store.hpp"

#include <map>
#include <mutex>

namespace devchain::store {

class MemoryEmbeddingStore final : public IEmbeddingStore {
public:
  [[nodiscard]] std::string_view name() const override { return "memory"; }

  [[nodiscard]] common::Result<std::optional<DeviceEmbedding>>
  get(const std::string &device_id) override;
  [[nodiscard]] common::Status upsert(const DeviceEmbedding &embedding) override;
  [[nodiscard]] bool is_fresh(const std::string &device_id, const std::string &current_model_version,
                              MaxAge max_age) override;
  [[nodiscard]] common::Result<std::unordered_map<std::string, embedding::Vector>> all() override;
  [[nodiscard]] common::Result<std::vector<DeviceEmbedding>> entries() override;

  [[nodiscard]] common::Result<bool> remove(const std::string &device_id) override;
  [[nodiscard]] common::Result<std::size_t> clear() override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override { return true; }

private:
  std::mutex mutex_;
  std::map<std::string, DeviceEmbedding> rows_;
};

} // namespace devchain::store
