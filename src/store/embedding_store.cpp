#include "devchain/store/embedding_store.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/store/memory_store.hpp"
#include "devchain/store/sqlite_store.hpp"

#include <algorithm>

namespace devchain::store {

bool is_fresh_embedding(const DeviceEmbedding &embedding, const std::string &current_model_version,
                        const MaxAge max_age, const common::Timestamp now) {
  if (embedding.model_version != current_model_version) {
    return false;
  }
  return now - embedding.generated_at < max_age;
}

common::Result<StoreStats> IEmbeddingStore::stats(const std::string &current_model_version,
                                                  const common::Timestamp now) {
  auto rows = entries();
  if (!rows.ok()) {
    return common::Result<StoreStats>::failure(rows.status());
  }

  StoreStats stats;
  stats.total = rows.value().size();
  for (const auto &row : rows.value()) {
    if (row.model_version == current_model_version) {
      ++stats.current_version;
    } else {
      ++stats.stale_version;
    }
    const std::int64_t age = common::age_in_days(row.generated_at, now);
    stats.oldest_age_days = std::max(stats.oldest_age_days.value_or(age), age);
    stats.newest_age_days = std::min(stats.newest_age_days.value_or(age), age);
  }
  return common::Result<StoreStats>::success(stats);
}

common::Result<std::unique_ptr<IEmbeddingStore>> create_embedding_store(const config::StoreConfig &config) {
  using StoreResult = common::Result<std::unique_ptr<IEmbeddingStore>>;
  const std::string backend = common::to_lower(config.backend);
  if (backend == "memory") {
    return StoreResult::success(std::make_unique<MemoryEmbeddingStore>());
  }
  if (backend == "sqlite") {
    auto store = std::make_unique<SqliteEmbeddingStore>(common::expand_path(config.path));
    if (!store->health_check()) {
      return StoreResult::failure(common::ErrorCode::StorageFailure,
                                  "cannot open embedding database " + config.path + ": " +
                                      store->last_error());
    }
    return StoreResult::success(std::move(store));
  }
  return StoreResult::failure(common::ErrorCode::InvalidArgument,
                              "unknown store backend: " + config.backend);
}

} // namespace devchain::store
