#pragma once

#include "devchain/embedding/model.hpp"

namespace devchain::embedding {

/// Client for a sentence-embedding service:
///   GET  <base>/health
///   POST <base>/embeddings  {"texts": [...], "normalize": true} -> {"embeddings": [[...], ...]}
class HttpEmbeddingModel final : public IEmbeddingModel {
public:
  HttpEmbeddingModel(config::EmbeddingConfig config,
                     std::shared_ptr<common::HttpClient> http_client);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string version() const override;
  [[nodiscard]] std::size_t dimensions() const override;

  [[nodiscard]] common::Status load() override;
  [[nodiscard]] bool is_loaded() const override;

  [[nodiscard]] common::Result<std::vector<Vector>>
  encode(const std::vector<std::string> &texts, std::size_t batch_size) override;

private:
  [[nodiscard]] common::Result<std::vector<Vector>>
  encode_batch(const std::vector<std::string> &texts);

  config::EmbeddingConfig config_;
  std::shared_ptr<common::HttpClient> http_client_;
  bool loaded_ = false;
};

} // namespace devchain::embedding
