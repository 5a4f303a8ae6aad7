#pragma once

#include "devchain/catalog/catalog.hpp"

#include <filesystem>
#include <unordered_map>

namespace devchain::catalog {

/// Devices from a JSON file: a bare array, or an object with a "devices" array.
/// The file is re-read on every list_devices() call.
class FileCatalog final : public ICatalogProvider {
public:
  explicit FileCatalog(std::filesystem::path path);

  [[nodiscard]] std::string_view name() const override { return "file"; }
  [[nodiscard]] common::Result<std::vector<Device>> list_devices() override;
  [[nodiscard]] common::Result<std::vector<std::string>>
  get_capabilities(const std::string &device_id) override;

private:
  std::filesystem::path path_;
  std::mutex mutex_;
  std::unordered_map<std::string, std::vector<std::string>> capabilities_;
};

} // namespace devchain::catalog
