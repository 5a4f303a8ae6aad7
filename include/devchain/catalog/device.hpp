#pragma once

#include "devchain/common/result.hpp"

#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace devchain::catalog {

/// A device as reported by the catalog provider. Optional fields stay empty
/// rather than holding placeholder text; consumers decide the fallback.
struct Device {
  std::string device_id;
  std::string domain;
  std::optional<std::string> device_class;
  std::optional<std::string> area_id;
  std::vector<std::string> capabilities;
  std::string integration;
  std::optional<std::string> name;
};

using DeviceIndex = std::unordered_map<std::string, Device>;

[[nodiscard]] DeviceIndex index_devices(const std::vector<Device> &devices);

/// Same known area on both sides. A missing area never matches anything.
[[nodiscard]] bool share_area(const Device &lhs, const Device &rhs);

/// Parses one device object. Accepts `device_id` or `entity_id` as the key and
/// derives `domain` from an `entity_id` prefix when it is not given.
[[nodiscard]] common::Result<Device> parse_device_json(const std::string &object_json);

/// Parses either a bare JSON array or an object wrapping the array under `list_key`.
/// Malformed entries are skipped and reported through `skipped` when provided.
[[nodiscard]] common::Result<std::vector<Device>>
parse_device_list_json(const std::string &body, const std::string &list_key,
                       std::vector<std::string> *skipped = nullptr);

} // namespace devchain::catalog
