#pragma once

#include "devchain/common/http.hpp"
#include "devchain/common/result.hpp"
#include "devchain/config/schema.hpp"
#include "devchain/embedding/vector_math.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace devchain::embedding {

/// Sentence-embedding model. Every vector returned by encode() has unit L2 norm;
/// a failure anywhere in the call fails the whole call with ModelUnavailable.
class IEmbeddingModel {
public:
  virtual ~IEmbeddingModel() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::string version() const = 0;
  [[nodiscard]] virtual std::size_t dimensions() const = 0;

  /// Acquires the model resource. Safe to call more than once.
  [[nodiscard]] virtual common::Status load() = 0;
  [[nodiscard]] virtual bool is_loaded() const = 0;

  [[nodiscard]] virtual common::Result<std::vector<Vector>>
  encode(const std::vector<std::string> &texts, std::size_t batch_size) = 0;
};

[[nodiscard]] common::Result<std::unique_ptr<IEmbeddingModel>>
create_embedding_model(const config::EmbeddingConfig &config,
                       std::shared_ptr<common::HttpClient> http_client = nullptr);

} // namespace devchain::embedding
