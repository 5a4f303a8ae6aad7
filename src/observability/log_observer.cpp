#include "devchain/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace devchain::observability {

namespace {

std::string ms(const std::chrono::milliseconds duration) {
  return std::to_string(duration.count()) + "ms";
}

} // namespace

LogObserver::LogObserver(const bool verbose) : LogObserver(std::cerr, verbose) {}

LogObserver::LogObserver(std::ostream &out, const bool verbose) : out_(out), verbose_(verbose) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  if (level == "DEBUG" && !verbose_) {
    return;
  }
  std::lock_guard<std::mutex> lock(mutex_);
  out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, GenerationStartEvent>) {
          log_line("INFO", std::string("embedding.generate start force_refresh=") +
                               (evt.force_refresh ? "true" : "false") +
                               " model=" + evt.model_version);
        } else if constexpr (std::is_same_v<T, GenerationEndEvent>) {
          log_line("INFO", "embedding.generate done total=" + std::to_string(evt.total) +
                               " generated=" + std::to_string(evt.generated) +
                               " cached=" + std::to_string(evt.cached) +
                               " errors=" + std::to_string(evt.errors) +
                               " duration=" + ms(evt.duration));
        } else if constexpr (std::is_same_v<T, PathSearchEvent>) {
          log_line(evt.truncated ? "WARN" : "INFO",
                   "paths.search trigger=" + evt.trigger + " paths=" + std::to_string(evt.paths) +
                       (evt.truncated ? " truncated=true" : "") + " duration=" + ms(evt.duration));
        } else if constexpr (std::is_same_v<T, DebugEvent>) {
          log_line("DEBUG", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, WarningEvent>) {
          log_line("WARN", evt.component + ": " + evt.message);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, EmbeddingCacheMetric>) {
          log_line("DEBUG", "metric.embedding_cache hits=" + std::to_string(m.hits) +
                                " misses=" + std::to_string(m.misses));
        } else if constexpr (std::is_same_v<T, EncodeLatencyMetric>) {
          log_line("DEBUG", "metric.encode_latency batch=" + std::to_string(m.batch_size) +
                                " latency=" + ms(m.latency));
        } else if constexpr (std::is_same_v<T, SnapshotSizeMetric>) {
          log_line("DEBUG", "metric.snapshot_vectors=" + std::to_string(m.vectors));
        }
      },
      metric);
}

void LogObserver::flush() {
  std::lock_guard<std::mutex> lock(mutex_);
  out_.flush();
}

} // namespace devchain::observability
