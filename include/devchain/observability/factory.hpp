#pragma once

#include "devchain/config/schema.hpp"
#include "devchain/observability/observer.hpp"

#include <memory>

namespace devchain::observability {

[[nodiscard]] std::unique_ptr<IObserver> create_observer(const config::ObservabilityConfig &config);

} // namespace devchain::observability
