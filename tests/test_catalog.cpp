#include "test_framework.hpp"
#include "tests/helpers/test_helpers.hpp"

#include "devchain/catalog/catalog.hpp"
#include "devchain/catalog/data_api_catalog.hpp"
#include "devchain/catalog/file_catalog.hpp"

void register_catalog_tests(std::vector<devchain::tests::TestCase> &tests) {
  using devchain::tests::require;
  namespace catalog = devchain::catalog;
  namespace common = devchain::common;
  namespace t = devchain::testing;

  tests.push_back({"catalog_parse_device_fields", [] {
                     auto parsed = catalog::parse_device_json(
                         R"({"device_id":"sensor.hall_temp","domain":"sensor",)"
                         R"("device_class":"temperature","area_id":"hall",)"
                         R"("capabilities":["temperature","battery"],"integration":"zigbee",)"
                         R"("name":"Hall Temp"})");
                     require(parsed.ok(), parsed.error());
                     const auto &device = parsed.value();
                     require(device.device_id == "sensor.hall_temp", "id");
                     require(device.domain == "sensor", "domain");
                     require(device.device_class == std::optional<std::string>("temperature"),
                             "class");
                     require(device.area_id == std::optional<std::string>("hall"), "area");
                     require(device.capabilities.size() == 2, "capabilities");
                     require(device.integration == "zigbee", "integration");
                     require(device.name == std::optional<std::string>("Hall Temp"), "name");
                   }});

  tests.push_back({"catalog_parse_entity_derives_domain_and_optionals", [] {
                     auto parsed = catalog::parse_device_json(
                         R"({"entity_id":"light.porch","area_id":null,"device_class":"",)"
                         R"("platform":"hue","capabilities":[{"name":"brightness"},{"feature":"effect"}]})");
                     require(parsed.ok(), parsed.error());
                     const auto &device = parsed.value();
                     require(device.device_id == "light.porch", "entity id used");
                     require(device.domain == "light", "domain from entity prefix");
                     require(!device.area_id.has_value(), "null area stays empty");
                     require(!device.device_class.has_value(), "blank class stays empty");
                     require(device.integration == "hue", "platform as integration");
                     require(device.capabilities.size() == 2 &&
                                 device.capabilities[1] == "effect",
                             "object capabilities");

                     auto missing = catalog::parse_device_json(R"({"domain":"light"})");
                     require(!missing.ok(), "entry without id rejected");
                   }});

  tests.push_back({"catalog_share_area_requires_known_area", [] {
                     const auto a = t::make_device("a", "light", std::nullopt, "kitchen");
                     const auto b = t::make_device("b", "switch", std::nullopt, "kitchen");
                     const auto c = t::make_device("c", "switch");
                     const auto d = t::make_device("d", "switch");
                     require(catalog::share_area(a, b), "same area shared");
                     require(!catalog::share_area(a, c), "unknown area never shared");
                     require(!catalog::share_area(c, d), "two unknown areas are not shared");
                   }});

  tests.push_back({"static_catalog_lists_and_looks_up_capabilities", [] {
                     catalog::StaticCatalog provider(t::kitchen_devices());
                     auto devices = provider.list_devices();
                     require(devices.ok() && devices.value().size() == 3, "three devices");
                     auto caps = provider.get_capabilities("light.kitchen_ceiling");
                     require(caps.ok() && caps.value().size() == 2, "capabilities found");
                     require(!provider.get_capabilities("nope").ok(), "unknown id fails");
                   }});

  tests.push_back({"static_catalog_index_follows_updates", [] {
                     catalog::StaticCatalog provider(t::kitchen_devices());
                     provider.add(t::make_device("switch.fan", "switch", std::nullopt, "den",
                                                 {"turn_on"}));
                     auto added = provider.get_capabilities("switch.fan");
                     require(added.ok() && added.value() == std::vector<std::string>{"turn_on"},
                             "added device indexed");

                     provider.set_devices({t::make_device("lock.back", "lock", std::nullopt,
                                                          "yard", {"lock"})});
                     require(!provider.get_capabilities("light.kitchen_ceiling").ok(),
                             "replaced devices dropped from index");
                     require(provider.get_capabilities("lock.back").ok(), "new device indexed");

                     std::vector<catalog::Device> many;
                     for (int i = 0; i < 2000; ++i) {
                       many.push_back(t::make_device("light.l" + std::to_string(i), "light",
                                                     std::nullopt, std::nullopt,
                                                     {"cap" + std::to_string(i)}));
                     }
                     provider.set_devices(many);
                     for (int i = 0; i < 2000; ++i) {
                       auto caps = provider.get_capabilities("light.l" + std::to_string(i));
                       require(caps.ok() && caps.value().front() == "cap" + std::to_string(i),
                               "lookup " + std::to_string(i));
                     }
                   }});

  tests.push_back({"file_catalog_reads_array_and_wrapped_object", [] {
                     t::TempWorkspace workspace;
                     workspace.create_file(
                         "array.json",
                         R"([{"device_id":"binary_sensor.door","domain":"binary_sensor","device_class":"door"},)"
                         R"({"domain":"light"},)"
                         R"({"device_id":"light.hall","domain":"light","capabilities":["brightness"]}])");
                     workspace.create_file(
                         "wrapped.json",
                         R"({"devices":[{"device_id":"lock.front","domain":"lock"}]})");

                     t::ScopedCapture capture;
                     catalog::FileCatalog array_catalog(workspace.path() / "array.json");
                     auto devices = array_catalog.list_devices();
                     require(devices.ok(), devices.error());
                     require(devices.value().size() == 2, "malformed entry skipped");
                     require(capture.observer().warnings() == 1, "skip reported");
                     auto caps = array_catalog.get_capabilities("light.hall");
                     require(caps.ok() && caps.value().front() == "brightness",
                             "capabilities cached after listing");

                     catalog::FileCatalog wrapped(workspace.path() / "wrapped.json");
                     auto wrapped_devices = wrapped.list_devices();
                     require(wrapped_devices.ok() && wrapped_devices.value().size() == 1,
                             "wrapped list parsed");
                   }});

  tests.push_back({"file_catalog_missing_file_is_catalog_unavailable", [] {
                     t::TempWorkspace workspace;
                     catalog::FileCatalog provider(workspace.path() / "none.json");
                     auto devices = provider.list_devices();
                     require(!devices.ok(), "missing file fails");
                     require(devices.code() == common::ErrorCode::CatalogUnavailable,
                             "CatalogUnavailable expected");
                   }});

  tests.push_back({"data_api_catalog_merges_entities_with_devices", [] {
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->on("GET", "http://data-api:8006/api/devices?limit=1000",
                              t::json_response(
                                  R"({"devices":[{"device_id":"dev1","name":"Kitchen Hub",)"
                                  R"("area_id":"kitchen","capabilities":["occupancy"]}]})"));
                     http->on("GET", "http://data-api:8006/api/entities?limit=1000",
                              t::json_response(
                                  R"([{"entity_id":"binary_sensor.hub_motion","device_id":"dev1",)"
                                  R"("domain":"binary_sensor","device_class":"motion","platform":"zha"},)"
                                  R"({"entity_id":"light.garage","device_id":null,"domain":"light",)"
                                  R"("area_id":"garage"}])"));

                     catalog::DataApiCatalog provider(devchain::config::CatalogConfig{}, http);
                     auto devices = provider.list_devices();
                     require(devices.ok(), devices.error());
                     require(devices.value().size() == 2, "one device per entity");
                     const auto &motion = devices.value()[0];
                     require(motion.device_id == "binary_sensor.hub_motion", "entity id");
                     require(motion.area_id == std::optional<std::string>("kitchen"),
                             "area inherited from owning device");
                     require(motion.name == std::optional<std::string>("Kitchen Hub"),
                             "name inherited");
                     require(motion.capabilities.size() == 1, "capabilities inherited");
                     require(devices.value()[1].area_id == std::optional<std::string>("garage"),
                             "own area kept");
                     auto caps = provider.get_capabilities("binary_sensor.hub_motion");
                     require(caps.ok() && caps.value().front() == "occupancy",
                             "capability lookup after listing");
                   }});

  tests.push_back({"data_api_catalog_http_failure_is_catalog_unavailable", [] {
                     auto http = std::make_shared<t::FakeHttpClient>();
                     http->on("GET", "http://data-api:8006/api/devices?limit=1000",
                              t::json_response("oops", 503));
                     catalog::DataApiCatalog provider(devchain::config::CatalogConfig{}, http);
                     auto devices = provider.list_devices();
                     require(!devices.ok(), "503 should fail");
                     require(devices.code() == common::ErrorCode::CatalogUnavailable,
                             "CatalogUnavailable expected");
                   }});

  tests.push_back({"catalog_factory_selects_source", [] {
                     devchain::config::CatalogConfig config;
                     config.source = "file";
                     auto file = catalog::create_catalog(config);
                     require(file.ok() && file.value()->name() == "file", "file source");
                     config.source = "data_api";
                     auto api = catalog::create_catalog(config);
                     require(api.ok() && api.value()->name() == "data_api", "data api source");
                     config.source = "ldap";
                     require(!catalog::create_catalog(config).ok(), "unknown source rejected");
                   }});
}
