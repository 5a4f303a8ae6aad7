#include "devchain/embedding/model.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/embedding/model_http.hpp"
#include "devchain/embedding/model_local.hpp"

namespace devchain::embedding {

common::Result<std::unique_ptr<IEmbeddingModel>>
create_embedding_model(const config::EmbeddingConfig &config,
                       std::shared_ptr<common::HttpClient> http_client) {
  using ModelResult = common::Result<std::unique_ptr<IEmbeddingModel>>;
  const std::string provider = common::to_lower(config.provider);
  if (provider == "local") {
    return ModelResult::success(std::make_unique<LocalHashModel>(config.dimensions));
  }
  if (provider == "http") {
    if (!http_client) {
      http_client = std::make_shared<common::CurlHttpClient>();
    }
    return ModelResult::success(
        std::make_unique<HttpEmbeddingModel>(config, std::move(http_client)));
  }
  return ModelResult::failure(common::ErrorCode::InvalidArgument,
                              "unknown embedding provider: " + config.provider);
}

} // namespace devchain::embedding
