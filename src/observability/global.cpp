#include "devchain/observability/global.hpp"

#include <mutex>

namespace devchain::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_generation_start(const bool force_refresh, const std::string &model_version) {
  record_event(GenerationStartEvent{.force_refresh = force_refresh, .model_version = model_version});
}

void record_generation_end(const std::size_t total, const std::size_t generated,
                           const std::size_t cached, const std::size_t errors,
                           const std::chrono::milliseconds duration) {
  record_event(GenerationEndEvent{.total = total,
                                  .generated = generated,
                                  .cached = cached,
                                  .errors = errors,
                                  .duration = duration});
}

void record_path_search(const std::string &trigger, const std::size_t paths, const bool truncated,
                        const std::chrono::milliseconds duration) {
  record_event(PathSearchEvent{
      .trigger = trigger, .paths = paths, .truncated = truncated, .duration = duration});
}

void record_debug(const std::string &component, const std::string &message) {
  record_event(DebugEvent{.component = component, .message = message});
}

void record_warning(const std::string &component, const std::string &message) {
  record_event(WarningEvent{.component = component, .message = message});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace devchain::observability
