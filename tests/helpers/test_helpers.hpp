#pragma once

#include "devchain/catalog/catalog.hpp"
#include "devchain/common/http.hpp"
#include "devchain/config/schema.hpp"
#include "devchain/embedding/model.hpp"
#include "devchain/observability/observer.hpp"
#include "devchain/store/memory_store.hpp"

#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

namespace devchain::testing {

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

struct EnvGuard {
  EnvGuard(std::string key, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;

  std::string key;
  std::optional<std::string> old_value;
};

/// Config pointing every file under the workspace, with a memory store and no logging.
config::Config temp_config(const TempWorkspace &workspace);

catalog::Device make_device(std::string id, std::string domain,
                            std::optional<std::string> device_class = std::nullopt,
                            std::optional<std::string> area = std::nullopt,
                            std::vector<std::string> capabilities = {});

/// motion sensor + light in the kitchen, lock at the entry.
std::vector<catalog::Device> kitchen_devices();

/// kitchen_devices() in the file catalog format.
std::string kitchen_catalog_json();

embedding::Vector unit(std::vector<float> values);

/// Maps each text to the vector of the first rule whose keyword occurs in it,
/// so tests control pairwise similarities exactly.
class KeywordModel final : public embedding::IEmbeddingModel {
public:
  KeywordModel(std::vector<std::pair<std::string, embedding::Vector>> rules,
               embedding::Vector fallback, std::string version = "keyword-v1");

  [[nodiscard]] std::string_view name() const override { return "keyword"; }
  [[nodiscard]] std::string version() const override { return version_; }
  [[nodiscard]] std::size_t dimensions() const override { return fallback_.size(); }

  [[nodiscard]] common::Status load() override;
  [[nodiscard]] bool is_loaded() const override { return loads_ > 0; }

  [[nodiscard]] common::Result<std::vector<embedding::Vector>>
  encode(const std::vector<std::string> &texts, std::size_t batch_size) override;

  void set_version(std::string version) { version_ = std::move(version); }
  /// Every encode() call after `calls` successful ones fails.
  void fail_after(std::size_t calls) { fail_after_ = calls; }

  std::size_t loads_ = 0;
  std::size_t encode_calls_ = 0;
  std::vector<std::string> encoded_texts_;

private:
  std::vector<std::pair<std::string, embedding::Vector>> rules_;
  embedding::Vector fallback_;
  std::string version_;
  std::optional<std::size_t> fail_after_;
};

/// Similarities used by the kitchen tests: motion.light = 0.8, motion.lock = 0, light.lock = 0.
std::unique_ptr<KeywordModel> kitchen_model();

class FakeHttpClient final : public common::HttpClient {
public:
  struct Request {
    std::string method;
    std::string url;
    std::string body;
  };

  void on(const std::string &method, const std::string &url, common::HttpResponse response);

  [[nodiscard]] common::HttpResponse get(const std::string &url, const common::HttpHeaders &headers,
                                         std::uint64_t timeout_ms) override;
  [[nodiscard]] common::HttpResponse post_json(const std::string &url,
                                               const common::HttpHeaders &headers,
                                               const std::string &body,
                                               std::uint64_t timeout_ms) override;

  std::vector<Request> requests;

private:
  common::HttpResponse respond(const std::string &method, const std::string &url);

  std::map<std::string, std::vector<common::HttpResponse>> responses_;
};

common::HttpResponse json_response(std::string body, std::uint16_t status = 200);

/// Memory store whose upsert fails for selected ids and whose freshness verdict can be forced.
class FlakyStore final : public store::IEmbeddingStore {
public:
  explicit FlakyStore(std::set<std::string> failing_ids);

  [[nodiscard]] std::string_view name() const override { return "flaky"; }
  [[nodiscard]] common::Result<std::optional<store::DeviceEmbedding>>
  get(const std::string &device_id) override;
  [[nodiscard]] common::Status upsert(const store::DeviceEmbedding &embedding) override;
  [[nodiscard]] bool is_fresh(const std::string &device_id, const std::string &current_model_version,
                              store::MaxAge max_age) override;
  [[nodiscard]] common::Result<std::unordered_map<std::string, embedding::Vector>> all() override;
  [[nodiscard]] common::Result<std::vector<store::DeviceEmbedding>> entries() override;
  [[nodiscard]] common::Result<bool> remove(const std::string &device_id) override;
  [[nodiscard]] common::Result<std::size_t> clear() override;
  [[nodiscard]] common::Result<std::size_t> count() override;
  [[nodiscard]] bool health_check() override { return true; }

  /// When set, is_fresh() answers this for every row.
  void force_freshness(std::optional<bool> fresh) { forced_freshness_ = fresh; }
  std::size_t fresh_checks_ = 0;

private:
  std::set<std::string> failing_ids_;
  std::optional<bool> forced_freshness_;
  store::MemoryEmbeddingStore inner_;
};

/// Catalog whose list_devices() always fails.
class BrokenCatalog final : public catalog::ICatalogProvider {
public:
  [[nodiscard]] std::string_view name() const override { return "broken"; }
  [[nodiscard]] common::Result<std::vector<catalog::Device>> list_devices() override;
  [[nodiscard]] common::Result<std::vector<std::string>>
  get_capabilities(const std::string &device_id) override;
};

class CapturingObserver final : public observability::IObserver {
public:
  void record_event(const observability::ObserverEvent &event) override;
  void record_metric(const observability::ObserverMetric &metric) override;
  [[nodiscard]] std::string_view name() const override { return "capture"; }

  [[nodiscard]] std::vector<observability::ObserverEvent> events() const;
  [[nodiscard]] std::vector<observability::ObserverMetric> metrics() const;
  [[nodiscard]] std::size_t warnings() const;

private:
  mutable std::mutex mutex_;
  std::vector<observability::ObserverEvent> events_;
  std::vector<observability::ObserverMetric> metrics_;
};

/// Installs a CapturingObserver as the global observer and restores a no-op one on exit.
class ScopedCapture {
public:
  ScopedCapture();
  ~ScopedCapture();

  ScopedCapture(const ScopedCapture &) = delete;
  ScopedCapture &operator=(const ScopedCapture &) = delete;

  [[nodiscard]] CapturingObserver &observer() { return *observer_; }

private:
  CapturingObserver *observer_ = nullptr;
};

} // namespace devchain::testing
