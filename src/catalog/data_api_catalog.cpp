#include "devchain/catalog/data_api_catalog.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/common/json_util.hpp"
#include "devchain/observability/global.hpp"

namespace devchain::catalog {

namespace {

struct PhysicalDevice {
  std::optional<std::string> area_id;
  std::optional<std::string> name;
  std::vector<std::string> capabilities;
};

} // namespace

DataApiCatalog::DataApiCatalog(config::CatalogConfig config,
                               std::shared_ptr<common::HttpClient> http_client)
    : config_(std::move(config)), http_client_(std::move(http_client)) {
  if (!http_client_) {
    http_client_ = std::make_shared<common::CurlHttpClient>();
  }
}

common::Result<std::string> DataApiCatalog::fetch(const std::string &path) {
  const std::string url = common::join_url(config_.base_url, path) +
                          "?limit=" + std::to_string(config_.limit);
  const auto response = http_client_->get(url, {{"Accept", "application/json"}}, config_.timeout_ms);
  if (!response.success()) {
    return common::Result<std::string>::failure(common::ErrorCode::CatalogUnavailable,
                                                "GET " + url + ": " + response.describe_failure());
  }
  return common::Result<std::string>::success(response.body);
}

common::Result<std::vector<Device>> DataApiCatalog::list_devices() {
  using DevicesResult = common::Result<std::vector<Device>>;

  const auto devices_body = fetch("/api/devices");
  if (!devices_body.ok()) {
    return DevicesResult::failure(devices_body.status());
  }
  const auto entities_body = fetch("/api/entities");
  if (!entities_body.ok()) {
    return DevicesResult::failure(entities_body.status());
  }

  auto physical = parse_device_list_json(devices_body.value(), "devices");
  if (!physical.ok()) {
    return DevicesResult::failure(common::ErrorCode::CatalogUnavailable,
                                  "devices response: " + physical.error());
  }
  std::unordered_map<std::string, PhysicalDevice> owners;
  for (const auto &device : physical.value()) {
    owners[device.device_id] = PhysicalDevice{
        .area_id = device.area_id, .name = device.name, .capabilities = device.capabilities};
  }

  std::vector<std::string> skipped;
  auto entities = parse_device_list_json(entities_body.value(), "entities", &skipped);
  if (!entities.ok()) {
    return DevicesResult::failure(common::ErrorCode::CatalogUnavailable,
                                  "entities response: " + entities.error());
  }
  for (const auto &reason : skipped) {
    observability::record_warning("catalog.data_api", "skipped entity: " + reason);
  }

  // The owning device id lives in the entity's own `device_id` field, which
  // parse_device_json shadows with `entity_id`. Re-read it from the raw entries.
  std::unordered_map<std::string, std::string> owner_of;
  const std::string trimmed = common::trim(entities_body.value());
  const std::string array_json =
      (!trimmed.empty() && trimmed.front() == '{')
          ? common::json_parse_flat(trimmed)["entities"]
          : trimmed;
  for (const auto &element : common::json_split_array(array_json)) {
    auto fields = common::json_parse_flat(element);
    if (!fields["entity_id"].empty() && !common::json_is_null(fields["device_id"])) {
      owner_of[fields["entity_id"]] = fields["device_id"];
    }
  }

  std::vector<Device> devices = std::move(entities.value());
  for (auto &device : devices) {
    const auto link = owner_of.find(device.device_id);
    if (link == owner_of.end()) {
      continue;
    }
    const auto owner = owners.find(link->second);
    if (owner == owners.end()) {
      continue;
    }
    if (!device.area_id.has_value()) {
      device.area_id = owner->second.area_id;
    }
    if (!device.name.has_value()) {
      device.name = owner->second.name;
    }
    if (device.capabilities.empty()) {
      device.capabilities = owner->second.capabilities;
    }
  }

  std::lock_guard<std::mutex> lock(mutex_);
  capabilities_.clear();
  for (const auto &device : devices) {
    capabilities_[device.device_id] = device.capabilities;
  }
  return DevicesResult::success(std::move(devices));
}

common::Result<std::vector<std::string>>
DataApiCatalog::get_capabilities(const std::string &device_id) {
  std::lock_guard<std::mutex> lock(mutex_);
  const auto it = capabilities_.find(device_id);
  if (it == capabilities_.end()) {
    return common::Result<std::vector<std::string>>::failure(common::ErrorCode::InvalidArgument,
                                                             "unknown device: " + device_id);
  }
  return common::Result<std::vector<std::string>>::success(it->second);
}

} // namespace devchain::catalog
