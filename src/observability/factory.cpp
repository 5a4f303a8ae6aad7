#include "devchain/observability/factory.hpp"

#include "devchain/common/fs.hpp"
#include "devchain/observability/log_observer.hpp"
#include "devchain/observability/multi_observer.hpp"
#include "devchain/observability/noop_observer.hpp"

namespace devchain::observability {

namespace {

std::unique_ptr<IObserver> create_single(const std::string &backend, const bool verbose) {
  if (backend == "none" || backend == "noop") {
    return std::make_unique<NoopObserver>();
  }
  if (backend == "verbose" || backend == "debug") {
    return std::make_unique<LogObserver>(true);
  }
  return std::make_unique<LogObserver>(verbose);
}

} // namespace

std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config) {
  const std::string backend = common::to_lower(common::trim(config.backend));
  if (backend.empty()) {
    return std::make_unique<NoopObserver>();
  }

  if (backend.find(',') == std::string::npos) {
    return create_single(backend, config.verbose);
  }

  auto multi = std::make_unique<MultiObserver>();
  for (const auto &part : common::split(backend, ',')) {
    multi->add(create_single(part, config.verbose));
  }
  return multi;
}

} // namespace devchain::observability
