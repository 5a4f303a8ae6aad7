#include "devchain/catalog/device.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/common/json_util.hpp"

namespace devchain::catalog {

namespace {

std::optional<std::string> optional_field(const common::JsonFlatMap &fields,
                                          const std::string &key) {
  const auto it = fields.find(key);
  if (it == fields.end() || common::json_is_null(it->second)) {
    return std::nullopt;
  }
  const std::string value = common::trim(it->second);
  if (value.empty()) {
    return std::nullopt;
  }
  return value;
}

std::string string_field(const common::JsonFlatMap &fields, const std::string &key) {
  return optional_field(fields, key).value_or("");
}

// Capabilities arrive either as ["brightness", ...] or as [{"name": "brightness", ...}, ...].
std::vector<std::string> parse_capabilities(const std::string &raw) {
  std::vector<std::string> out;
  for (const auto &element : common::json_split_array(raw)) {
    if (!element.empty() && element.front() == '"') {
      out.push_back(common::json_unescape(element.substr(1, element.size() - 2)));
      continue;
    }
    if (!element.empty() && element.front() == '{') {
      const auto fields = common::json_parse_flat(element);
      if (auto name = optional_field(fields, "name"); name.has_value()) {
        out.push_back(*name);
      } else if (auto feature = optional_field(fields, "feature"); feature.has_value()) {
        out.push_back(*feature);
      }
    }
  }
  return out;
}

} // namespace

DeviceIndex index_devices(const std::vector<Device> &devices) {
  DeviceIndex index;
  index.reserve(devices.size());
  for (const auto &device : devices) {
    index.emplace(device.device_id, device);
  }
  return index;
}

bool share_area(const Device &lhs, const Device &rhs) {
  return lhs.area_id.has_value() && rhs.area_id.has_value() && *lhs.area_id == *rhs.area_id;
}

common::Result<Device> parse_device_json(const std::string &object_json) {
  const auto fields = common::json_parse_flat(object_json);
  if (fields.empty()) {
    return common::Result<Device>::failure(common::ErrorCode::InvalidArgument,
                                           "device entry is not a JSON object");
  }

  Device device;
  device.device_id = string_field(fields, "device_id");
  const std::string entity_id = string_field(fields, "entity_id");
  if (!entity_id.empty()) {
    device.device_id = entity_id;
  }
  if (device.device_id.empty()) {
    return common::Result<Device>::failure(common::ErrorCode::InvalidArgument,
                                           "device entry has no device_id");
  }

  device.domain = common::to_lower(string_field(fields, "domain"));
  if (device.domain.empty()) {
    const auto dot = device.device_id.find('.');
    if (dot != std::string::npos && dot > 0) {
      device.domain = common::to_lower(device.device_id.substr(0, dot));
    }
  }

  device.device_class = optional_field(fields, "device_class");
  if (!device.device_class.has_value()) {
    device.device_class = optional_field(fields, "original_device_class");
  }
  device.area_id = optional_field(fields, "area_id");

  device.integration = string_field(fields, "integration");
  if (device.integration.empty()) {
    device.integration = string_field(fields, "platform");
  }

  device.name = optional_field(fields, "name");
  if (!device.name.has_value()) {
    device.name = optional_field(fields, "friendly_name");
  }

  if (const auto it = fields.find("capabilities"); it != fields.end()) {
    device.capabilities = parse_capabilities(it->second);
  }

  return common::Result<Device>::success(std::move(device));
}

common::Result<std::vector<Device>> parse_device_list_json(const std::string &body,
                                                           const std::string &list_key,
                                                           std::vector<std::string> *skipped) {
  const std::string trimmed = common::trim(body);
  std::string array_json;
  if (!trimmed.empty() && trimmed.front() == '[') {
    array_json = trimmed;
  } else if (!trimmed.empty() && trimmed.front() == '{') {
    const auto fields = common::json_parse_flat(trimmed);
    const auto it = fields.find(list_key);
    if (it == fields.end()) {
      return common::Result<std::vector<Device>>::failure(
          common::ErrorCode::InvalidArgument, "response has no \"" + list_key + "\" array");
    }
    array_json = it->second;
  } else {
    return common::Result<std::vector<Device>>::failure(common::ErrorCode::InvalidArgument,
                                                        "unexpected device list format");
  }

  std::vector<Device> devices;
  for (const auto &element : common::json_split_array(array_json)) {
    auto parsed = parse_device_json(element);
    if (!parsed.ok()) {
      if (skipped != nullptr) {
        skipped->push_back(parsed.error());
      }
      continue;
    }
    devices.push_back(std::move(parsed.value()));
  }
  return common::Result<std::vector<Device>>::success(std::move(devices));
}

} // namespace devchain::catalog
