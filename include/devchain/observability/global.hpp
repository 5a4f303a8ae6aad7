#pragma once

#include "devchain/observability/observer.hpp"

#include <memory>

namespace devchain::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_generation_start(bool force_refresh, const std::string &model_version);
void record_generation_end(std::size_t total, std::size_t generated, std::size_t cached,
                           std::size_t errors, std::chrono::milliseconds duration);
void record_path_search(const std::string &trigger, std::size_t paths, bool truncated,
                        std::chrono::milliseconds duration);
void record_debug(const std::string &component, const std::string &message);
void record_warning(const std::string &component, const std::string &message);
void record_error(const std::string &component, const std::string &message);

} // namespace devchain::observability
