#include "devchain/embedding/model_http.hpp"

#include "devchain/common/json_util.hpp"
#include "devchain/observability/global.hpp"

#include <algorithm>
#include <chrono>
#include <sstream>

namespace devchain::embedding {

namespace {

common::Result<std::vector<Vector>> unavailable(std::string message) {
  return common::Result<std::vector<Vector>>::failure(common::ErrorCode::ModelUnavailable,
                                                      std::move(message));
}

} // namespace

HttpEmbeddingModel::HttpEmbeddingModel(config::EmbeddingConfig config,
                                       std::shared_ptr<common::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {}

std::string_view HttpEmbeddingModel::name() const { return "http"; }

std::string HttpEmbeddingModel::version() const { return config_.model; }

std::size_t HttpEmbeddingModel::dimensions() const { return config_.dimensions; }

common::Status HttpEmbeddingModel::load() {
  if (loaded_) {
    return common::Status::success();
  }
  const std::string url = common::join_url(config_.base_url, "/health");
  const auto response = http_client_->get(url, {}, config_.timeout_ms);
  if (!response.success()) {
    return common::Status::error(common::ErrorCode::ModelUnavailable,
                                 "embedding service not ready (" + url +
                                     "): " + response.describe_failure());
  }
  loaded_ = true;
  observability::record_debug("embedding.http", "model " + config_.model + " ready at " +
                                                    config_.base_url);
  return common::Status::success();
}

bool HttpEmbeddingModel::is_loaded() const { return loaded_; }

common::Result<std::vector<Vector>>
HttpEmbeddingModel::encode_batch(const std::vector<std::string> &texts) {
  std::ostringstream body;
  body << "{\"texts\":[";
  for (std::size_t i = 0; i < texts.size(); ++i) {
    if (i > 0) {
      body << ",";
    }
    body << "\"" << common::json_escape(texts[i]) << "\"";
  }
  body << "],\"normalize\":true}";

  const std::string url = common::join_url(config_.base_url, "/embeddings");
  const auto response = http_client_->post_json(url, {}, body.str(), config_.timeout_ms);
  if (!response.success()) {
    return unavailable("POST " + url + ": " + response.describe_failure());
  }

  auto fields = common::json_parse_flat(response.body);
  const auto it = fields.find("embeddings");
  if (it == fields.end()) {
    return unavailable("embedding response has no \"embeddings\" field");
  }

  const auto rows = common::json_split_array(it->second);
  if (rows.size() != texts.size()) {
    return unavailable("embedding service returned " + std::to_string(rows.size()) +
                       " vectors for " + std::to_string(texts.size()) + " texts");
  }

  std::vector<Vector> out;
  out.reserve(rows.size());
  for (const auto &row : rows) {
    auto parsed = common::json_parse_float_array(row);
    if (!parsed.ok()) {
      return unavailable("invalid embedding vector: " + parsed.error());
    }
    Vector vector = std::move(parsed.value());
    if (vector.size() != config_.dimensions) {
      return unavailable("embedding has " + std::to_string(vector.size()) +
                         " dimensions, expected " + std::to_string(config_.dimensions));
    }
    if (!normalize(vector)) {
      return unavailable("embedding service returned a zero vector");
    }
    out.push_back(std::move(vector));
  }
  return common::Result<std::vector<Vector>>::success(std::move(out));
}

common::Result<std::vector<Vector>> HttpEmbeddingModel::encode(const std::vector<std::string> &texts,
                                                               const std::size_t batch_size) {
  if (auto status = load(); !status.ok()) {
    return common::Result<std::vector<Vector>>::failure(status);
  }

  const std::size_t step = batch_size == 0 ? std::max<std::size_t>(texts.size(), 1) : batch_size;
  std::vector<Vector> out;
  out.reserve(texts.size());
  for (std::size_t start = 0; start < texts.size(); start += step) {
    const auto started = std::chrono::steady_clock::now();
    const auto first = texts.begin() + static_cast<std::ptrdiff_t>(start);
    const auto last = texts.begin() + static_cast<std::ptrdiff_t>(std::min(texts.size(), start + step));
    auto batch = encode_batch(std::vector<std::string>(first, last));
    if (!batch.ok()) {
      return batch;
    }
    observability::record_metric(observability::EncodeLatencyMetric{
        .batch_size = batch.value().size(),
        .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - started)});
    for (auto &vector : batch.value()) {
      out.push_back(std::move(vector));
    }
  }
  return common::Result<std::vector<Vector>>::success(std::move(out));
}

} // namespace devchain::embedding
