#pragma once

#include "devchain/store/embedding_store.hpp"

#include <sqlite3.h>

#include <filesystem>
#include <mutex>

namespace devchain::store {

/// device_embeddings table in a WAL-mode SQLite database. Vectors are stored as
/// raw little-endian float32 blobs, timestamps as RFC 3339 text.
class SqliteEmbeddingStore final : public IEmbeddingStore {
public:
  explicit SqliteEmbeddingStore(std::filesystem::path db_path);
  ~SqliteEmbeddingStore() override;

  SqliteEmbeddingStore(const SqliteEmbeddingStore &) = delete;
  SqliteEmbeddingStore &operator=(const SqliteEmbeddingStore &) = delete;

  [[nodiscard]] std::string_view name() const override { return "sqlite"; }

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
  [[nodiscard]] bool health_check() override;

  [[nodiscard]] const std::string &last_error() const { return last_error_; }
  [[nodiscard]] const std::filesystem::path &path() const { return db_path_; }

private:
  [[nodiscard]] common::Status init_schema();

  std::filesystem::path db_path_;
  sqlite3 *db_ = nullptr;
  std::mutex mutex_;
  std::string last_error_;
};

} // namespace devchain::store
