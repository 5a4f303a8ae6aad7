#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace devchain::graph {

inline constexpr std::size_t kMinPathLength = 2;
inline constexpr std::size_t kMaxPathLength = 5;

/// Candidate automation chain. devices[0] is the trigger; hop_similarities[i]
/// is the similarity used to step from devices[i] to devices[i + 1].
struct Path {
  std::vector<std::string> devices;
  std::vector<double> hop_similarities;
  double score = 0.0;
  std::size_t depth = 0;
};

/// score desc, then first device id asc, then the whole id sequence.
[[nodiscard]] bool path_ranks_before(const Path &lhs, const Path &rhs);

[[nodiscard]] std::string format_path(const Path &path);

} // namespace devchain::graph
