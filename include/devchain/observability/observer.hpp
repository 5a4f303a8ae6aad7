#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace devchain::observability {

struct GenerationStartEvent {
  bool force_refresh = false;
  std::string model_version;
};

struct GenerationEndEvent {
  std::size_t total = 0;
  std::size_t generated = 0;
  std::size_t cached = 0;
  std::size_t errors = 0;
  std::chrono::milliseconds duration{0};
};

struct PathSearchEvent {
  std::string trigger;
  std::size_t paths = 0;
  bool truncated = false;
  std::chrono::milliseconds duration{0};
};

struct DebugEvent {
  std::string component;
  std::string message;
};

struct WarningEvent {
  std::string component;
  std::string message;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent = std::variant<GenerationStartEvent, GenerationEndEvent, PathSearchEvent,
                                   DebugEvent, WarningEvent, ErrorEvent>;

struct EmbeddingCacheMetric {
  std::uint64_t hits = 0;
  std::uint64_t misses = 0;
};

struct EncodeLatencyMetric {
  std::size_t batch_size = 0;
  std::chrono::milliseconds latency{0};
};

struct SnapshotSizeMetric {
  std::uint64_t vectors = 0;
};

using ObserverMetric = std::variant<EmbeddingCacheMetric, EncodeLatencyMetric, SnapshotSizeMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace devchain::observability
