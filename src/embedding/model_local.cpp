#include "devchain/embedding/model_local.hpp"

#include "devchain/observability/global.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdint>

namespace devchain::embedding {

namespace {

constexpr float kWordWeight = 1.0F;
constexpr float kBigramWeight = 0.7F;
constexpr float kTrigramWeight = 0.35F;

// FNV-1a, so bucket assignment does not depend on the standard library's std::hash.
std::uint64_t fnv1a(const std::string_view prefix, const std::string_view text) {
  std::uint64_t hash = 14695981039346656037ULL;
  const auto mix = [&hash](const std::string_view part) {
    for (const char c : part) {
      hash ^= static_cast<unsigned char>(c);
      hash *= 1099511628211ULL;
    }
  };
  mix(prefix);
  mix(text);
  return hash;
}

std::vector<std::string> tokenize(const std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (const char raw : text) {
    const auto c = static_cast<unsigned char>(raw);
    if (std::isalnum(c) != 0) {
      current.push_back(static_cast<char>(std::tolower(c)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

} // namespace

LocalHashModel::LocalHashModel(const std::size_t dimensions) : dimensions_(dimensions) {}

std::string_view LocalHashModel::name() const { return "local"; }

std::string LocalHashModel::version() const {
  return "local-hash-v1-" + std::to_string(dimensions_);
}

std::size_t LocalHashModel::dimensions() const { return dimensions_; }

common::Status LocalHashModel::load() {
  if (dimensions_ == 0) {
    return common::Status::error(common::ErrorCode::ModelUnavailable,
                                 "local model needs at least one dimension");
  }
  loaded_ = true;
  return common::Status::success();
}

bool LocalHashModel::is_loaded() const { return loaded_; }

common::Result<Vector> LocalHashModel::encode_one(const std::string_view text) const {
  Vector values(dimensions_, 0.0F);
  const auto add = [&](const std::string_view prefix, const std::string_view feature,
                       const float weight) {
    const std::uint64_t hash = fnv1a(prefix, feature);
    const std::size_t idx = static_cast<std::size_t>(hash % dimensions_);
    const float sign = ((hash >> 63U) & 1U) != 0U ? -1.0F : 1.0F;
    values[idx] += sign * weight;
  };

  const auto tokens = tokenize(text);
  for (std::size_t i = 0; i < tokens.size(); ++i) {
    add("w:", tokens[i], kWordWeight);
    if (i + 1 < tokens.size()) {
      add("b:", tokens[i] + " " + tokens[i + 1], kBigramWeight);
    }
    const std::string padded = "#" + tokens[i] + "#";
    for (std::size_t j = 0; j + 3 <= padded.size(); ++j) {
      add("c:", std::string_view(padded).substr(j, 3), kTrigramWeight);
    }
  }

  if (!normalize(values)) {
    return common::Result<Vector>::failure(common::ErrorCode::ModelUnavailable,
                                           "text produced no features: \"" + std::string(text) +
                                               "\"");
  }
  return common::Result<Vector>::success(std::move(values));
}

common::Result<std::vector<Vector>> LocalHashModel::encode(const std::vector<std::string> &texts,
                                                           const std::size_t batch_size) {
  using EncodeResult = common::Result<std::vector<Vector>>;
  if (!loaded_) {
    if (auto status = load(); !status.ok()) {
      return EncodeResult::failure(status);
    }
  }

  const std::size_t step = batch_size == 0 ? texts.size() : batch_size;
  std::vector<Vector> out;
  out.reserve(texts.size());
  for (std::size_t start = 0; start < texts.size(); start += step) {
    const auto started = std::chrono::steady_clock::now();
    const std::size_t end = std::min(texts.size(), start + step);
    for (std::size_t i = start; i < end; ++i) {
      auto vector = encode_one(texts[i]);
      if (!vector.ok()) {
        return EncodeResult::failure(vector.status());
      }
      out.push_back(std::move(vector.value()));
    }
    observability::record_metric(observability::EncodeLatencyMetric{
        .batch_size = end - start,
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)});
  }
  return EncodeResult::success(std::move(out));
}

} // namespace devchain::embedding
