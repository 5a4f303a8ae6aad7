#include "devchain/catalog/file_catalog.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/observability/global.hpp"

namespace devchain::catalog {

FileCatalog::FileCatalog(std::filesystem::path path) : path_(std::move(path)) {}

common::Result<std::vector<Device>> FileCatalog::list_devices() {
  const auto content = common::read_file(path_);
  if (!content.ok()) {
    return common::Result<std::vector<Device>>::failure(common::ErrorCode::CatalogUnavailable,
                                                        content.error());
  }

  std::vector<std::string> skipped;
  auto devices = parse_device_list_json(content.value(), "devices", &skipped);
  if (!devices.ok()) {
    return common::Result<std::vector<Device>>::failure(
        common::ErrorCode::CatalogUnavailable, path_.string() + ": " + devices.error());
  }
  for (const auto &reason : skipped) {
    observability::record_warning("catalog.file", "skipped entry: " + reason);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  capabilities_.clear();
  for (const auto &device : devices.value()) {
    capabilities_[device.device_id] = device.capabilities;
  }
  return devices;
}

common::Result<std::vector<std::string>> FileCatalog::get_capabilities(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = capabilities_.find(device_id);
  if (it == capabilities_.end()) {
    return common::Result<std::vector<std::string>>::failure(common::ErrorCode::InvalidArgument,
                                                             "unknown device: " + device_id);
  }
  return common::Result<std::vector<std::string>>::success(it->second);
}

} // namespace devchain::catalog
