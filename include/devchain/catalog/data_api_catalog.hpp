#pragma once

#include "devchain/catalog/catalog.hpp"
#include "devchain/common/http.hpp"

#include <unordered_map>

namespace devchain::catalog {

/// Reads entities from the household data API. Each entity becomes one Device;
/// area and name fall back to the owning physical device when the entity has none.
class DataApiCatalog final : public ICatalogProvider {
public:
  explicit DataApiCatalog(config::CatalogConfig config,
                          std::shared_ptr<common::HttpClient> http_client = nullptr);

  [[nodiscard]] std::string_view name() const override { return "data_api"; }
  [[nodiscard]] common::Result<std::vector<Device>> list_devices() override;
  [[nodiscard]] common::Result<std::vector<std::string>>
  get_capabilities(const std::string &device_id) override;

private:
  [[nodiscard]] common::Result<std::string> fetch(const std::string &path);

  config::CatalogConfig config_;
  std::shared_ptr<common::HttpClient> http_client_;
  std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::string>> capabilities_;
};

} // namespace devchain::catalog
