#include "devchain/graph/path_scorer.hpp"

#include <algorithm>
#include <optional>
#include <set>

namespace devchain::graph {

ScoringWeights weights_from_config(const config::ScoringConfig &config) {
  return ScoringWeights{.similarity = config.similarity_weight,
                        .area = config.area_weight,
                        .diversity = config.diversity_weight};
}

PathScorer::PathScorer(ScoringWeights weights) : weights_(weights) {}

double PathScorer::score(const Path &path, const catalog::DeviceIndex &devices) const {
  return explain(path, devices).total;
}

ScoreBreakdown PathScorer::explain(const Path &path, const catalog::DeviceIndex &devices) const {
  ScoreBreakdown breakdown;
  if (path.devices.empty()) {
    return breakdown;
  }

  if (!path.hop_similarities.empty()) {
    double sum = 0.0;
    for (const double similarity : path.hop_similarities) {
      sum += std::clamp(similarity, 0.0, 1.0);
    }
    breakdown.mean_similarity = sum / static_cast<double>(path.hop_similarities.size());
  }

  std::optional<std::string> shared_area;
  bool consistent = true;
  std::set<std::string> domains;
  for (const auto &device_id : path.devices) {
    const auto it = devices.find(device_id);
    if (it == devices.end()) {
      consistent = false;
      domains.insert("");
      continue;
    }
    domains.insert(it->second.domain);
    if (!it->second.area_id.has_value()) {
      consistent = false;
    } else if (!shared_area.has_value()) {
      shared_area = it->second.area_id;
    } else if (*shared_area != *it->second.area_id) {
      consistent = false;
    }
  }
  breakdown.area_consistency = consistent ? 1.0 : 0.0;
  breakdown.domain_diversity =
      static_cast<double>(domains.size()) / static_cast<double>(path.devices.size());

  const double total = weights_.similarity * breakdown.mean_similarity +
                       weights_.area * breakdown.area_consistency +
                       weights_.diversity * breakdown.domain_diversity;
  breakdown.total = std::clamp(total, 0.0, 1.0);
  return breakdown;
}

} // namespace devchain::graph
