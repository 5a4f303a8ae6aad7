#pragma once

#include "devchain/catalog/device.hpp"
#include "devchain/config/schema.hpp"
#include "devchain/graph/path.hpp"

namespace devchain::graph {

struct ScoringWeights {
  double similarity = 0.4;
  double area = 0.3;
  double diversity = 0.3;
};

[[nodiscard]] ScoringWeights weights_from_config(const config::ScoringConfig &config);

struct ScoreBreakdown {
  double mean_similarity = 0.0;
  double area_consistency = 0.0;
  double domain_diversity = 0.0;
  double total = 0.0;
};

/// score = w_sim * mean(hop similarities) + w_area * area consistency
///       + w_div * (distinct domains / path length), clamped to [0, 1].
class PathScorer {
public:
  PathScorer() = default;
  explicit PathScorer(ScoringWeights weights);

  [[nodiscard]] double score(const Path &path, const catalog::DeviceIndex &devices) const;
  [[nodiscard]] ScoreBreakdown explain(const Path &path, const catalog::DeviceIndex &devices) const;

  [[nodiscard]] const ScoringWeights &weights() const { return weights_; }

private:
  ScoringWeights weights_;
};

} // namespace devchain::graph
