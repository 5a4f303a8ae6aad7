#include "devchain/catalog/catalog.hpp"

#include "devchain/catalog/data_api_catalog.hpp"
#include "devchain/catalog/file_catalog.hpp"
#include "devchain/common/fs.hpp"

namespace devchain::catalog {

StaticCatalog::StaticCatalog(std::vector<Device> devices) { set_devices(std::move(devices)); }

void StaticCatalog::add(Device device) {
  std::lock_guard<std::mutex> lock(mutex_);
  capabilities_.emplace(device.device_id, device.capabilities);
  devices_.push_back(std::move(device));
}

void StaticCatalog::set_devices(std::vector<Device> devices) {
  std::lock_guard<std::mutex> lock(mutex_);
  devices_ = std::move(devices);
  capabilities_.clear();
  for (const auto &device : devices_) {
    capabilities_.emplace(device.device_id, device.capabilities);
  }
}

common::Result<std::vector<Device>> StaticCatalog::list_devices() {
  std::lock_guard<std::mutex> lock(mutex_);
  return common::Result<std::vector<Device>>::success(devices_);
}

common::Result<std::vector<std::string>> StaticCatalog::get_capabilities(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (const auto it = capabilities_.find(device_id); it != capabilities_.end()) {
    return common::Result<std::vector<std::string>>::success(it->second);
  }
  return common::Result<std::vector<std::string>>::failure(common::ErrorCode::InvalidArgument,
                                                           "unknown device: " + device_id);
}

common::Result<std::unique_ptr<ICatalogProvider>> create_catalog(const config::CatalogConfig &config) {
  using CatalogResult = common::Result<std::unique_ptr<ICatalogProvider>>;
  const std::string source = common::to_lower(config.source);
  if (source == "file") {
    return CatalogResult::success(
        std::make_unique<FileCatalog>(common::expand_path(config.path)));
  }
  if (source == "data_api") {
    return CatalogResult::success(std::make_unique<DataApiCatalog>(config));
  }
  return CatalogResult::failure(common::ErrorCode::InvalidArgument,
                                "unknown catalog source: " + config.source);
}

} // namespace devchain::catalog
