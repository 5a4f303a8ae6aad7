#pragma once

#include "devchain/common/result.hpp"
#include "devchain/common/time.hpp"
#include "devchain/config/schema.hpp"
#include "devchain/embedding/vector_math.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devchain::store {

struct DeviceEmbedding {
  std::string device_id;
  embedding::Vector vector;
  std::string descriptor;
  std::string model_version;
  double norm = 0.0;
  common::Timestamp generated_at{};
};

struct StoreStats {
  std::size_t total = 0;
  std::size_t current_version = 0;
  std::size_t stale_version = 0;
  std::optional<std::int64_t> oldest_age_days;
  std::optional<std::int64_t> newest_age_days;
};

using MaxAge = std::chrono::hours;

/// Saturates at config::kMaxStoreAgeDays.
[[nodiscard]] constexpr MaxAge max_age_from_days(const std::uint32_t days) {
  const std::uint32_t bounded = days < config::kMaxStoreAgeDays ? days : config::kMaxStoreAgeDays;
  return MaxAge(static_cast<MaxAge::rep>(bounded) * 24);
}

/// Version matches and the row is younger than max_age.
[[nodiscard]] bool is_fresh_embedding(const DeviceEmbedding &embedding,
                                      const std::string &current_model_version, MaxAge max_age,
                                      common::Timestamp now = common::Clock::now());

/// Persistent per-device embedding table. Rows are only replaced by upsert() and
/// only deleted by remove()/clear(); staleness never deletes anything.
class IEmbeddingStore {
public:
  virtual ~IEmbeddingStore() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;

  [[nodiscard]] virtual common::Result<std::optional<DeviceEmbedding>>
  get(const std::string &device_id) = 0;
  /// Insert-or-replace keyed on device_id.
  [[nodiscard]] virtual common::Status upsert(const DeviceEmbedding &embedding) = 0;
  /// Read failures count as "not fresh".
  [[nodiscard]] virtual bool is_fresh(const std::string &device_id,
                                      const std::string &current_model_version,
                                      MaxAge max_age) = 0;
  [[nodiscard]] virtual common::Result<std::unordered_map<std::string, embedding::Vector>> all() = 0;
  [[nodiscard]] virtual common::Result<std::vector<DeviceEmbedding>> entries() = 0;

  [[nodiscard]] virtual common::Result<bool> remove(const std::string &device_id) = 0;
  [[nodiscard]] virtual common::Result<std::size_t> clear() = 0;
  [[nodiscard]] virtual common::Result<std::size_t> count() = 0;
  [[nodiscard]] virtual bool health_check() = 0;

  [[nodiscard]] common::Result<StoreStats> stats(const std::string &current_model_version,
                                                 common::Timestamp now = common::Clock::now());
};

[[nodiscard]] common::Result<std::unique_ptr<IEmbeddingStore>>
create_embedding_store(const config::StoreConfig &config);

} // namespace devchain::store
