#pragma once

#include "devchain/catalog/device.hpp"
#include "devchain/common/result.hpp"
#include "devchain/config/schema.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

namespace devchain::catalog {

/// Read-only source of the household's device inventory.
class ICatalogProvider {
public:
  virtual ~ICatalogProvider() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual common::Result<std::vector<Device>> list_devices() = 0;
  [[nodiscard]] virtual common::Result<std::vector<std::string>>
  get_capabilities(const std::string &device_id) = 0;
};

class StaticCatalog final : public ICatalogProvider {
public:
  StaticCatalog() = default;
  explicit StaticCatalog(std::vector<Device> devices);

  void add(Device device);
  void set_devices(std::vector<Device> devices);

  [[nodiscard]] std::string_view name() const override { return "static"; }
  [[nodiscard]] common::Result<std::vector<Device>> list_devices() override;
  [[nodiscard]] common::Result<std::vector<std::string>>
  get_capabilities(const std::string &device_id) override;

private:
  std::mutex mutex_;
  std::vector<Device> devices_;
  /// device_id -> capabilities; the first entry wins for duplicate ids.
  std::unordered_map<std::string, std::vector<std::string>> capabilities_;
};

[[nodiscard]] common::Result<std::unique_ptr<ICatalogProvider>>
create_catalog(const config::CatalogConfig &config);

} // namespace devchain::catalog
