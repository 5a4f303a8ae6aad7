#pragma once

#include "devchain/catalog/device.hpp"
#include "devchain/common/result.hpp"
#include "devchain/config/schema.hpp"
#include "devchain/graph/path.hpp"
#include "devchain/graph/path_scorer.hpp"
#include "devchain/graph/vector_snapshot.hpp"

#include <chrono>
#include <string>
#include <vector>

namespace devchain::graph {

struct FinderOptions {
  /// Devices per complete path, in [kMinPathLength, kMaxPathLength].
  std::size_t max_depth = 3;
  double min_similarity = 0.6;
  std::size_t top_k_per_hop = 5;
  double area_bonus = 0.1;
  double acceptance_floor = 0.5;
  /// Capped at config::kMaxTriggerTimeoutMs.
  std::chrono::milliseconds trigger_timeout{5000};
  std::size_t worker_threads = 1;
  /// 0 keeps every accepted path.
  std::size_t max_results = 0;
};

[[nodiscard]] FinderOptions options_from_config(const config::TraversalConfig &config);

struct TriggerOutcome {
  std::string trigger;
  std::vector<Path> paths;
  bool truncated = false;
  bool skipped = false;
  std::size_t expanded_nodes = 0;
};

struct SearchResult {
  std::vector<Path> paths;
  std::vector<std::string> truncated_triggers;
  std::vector<std::string> skipped_triggers;
};

/// Bounded breadth-first search over a vector snapshot. From each node only the
/// top_k_per_hop most similar unvisited devices at or above min_similarity are
/// expanded, so work per trigger is at most top_k^(max_depth - 1) leaves.
class PathFinder {
public:
  PathFinder(const VectorSnapshot &snapshot, const catalog::DeviceIndex &devices,
             const PathScorer &scorer);

  [[nodiscard]] common::Result<SearchResult> find_paths(const std::vector<std::string> &triggers,
                                                        const FinderOptions &options) const;

  [[nodiscard]] TriggerOutcome search_trigger(const std::string &trigger,
                                              const FinderOptions &options) const;

  /// Dot product plus the same-area bonus, capped at 1.0.
  [[nodiscard]] double hop_similarity(const std::string &from, const std::string &to,
                                      double area_bonus) const;

  [[nodiscard]] static common::Status validate(const FinderOptions &options);

private:
  const VectorSnapshot &snapshot_;
  const catalog::DeviceIndex &devices_;
  const PathScorer &scorer_;
};

} // namespace devchain::graph
