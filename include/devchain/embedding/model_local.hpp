#pragma once

#include "devchain/embedding/model.hpp"

namespace devchain::embedding {

/// Feature-hashing sentence embedding: lower-cased word unigrams, word bigrams and
/// character trigrams hashed into a fixed number of signed buckets. Needs no
/// external resources and is stable across processes and platforms.
class LocalHashModel final : public IEmbeddingModel {
public:
  explicit LocalHashModel(std::size_t dimensions = 384);

  [[nodiscard]] std::string_view name() const override;
  [[nodiscard]] std::string version() const override;
  [[nodiscard]] std::size_t dimensions() const override;

  [[nodiscard]] common::Status load() override;
  [[nodiscard]] bool is_loaded() const override;

  [[nodiscard]] common::Result<std::vector<Vector>>
  encode(const std::vector<std::string> &texts, std::size_t batch_size) override;

  [[nodiscard]] common::Result<Vector> encode_one(std::string_view text) const;

private:
  std::size_t dimensions_;
  bool loaded_ = false;
};

} // namespace devchain::embedding
