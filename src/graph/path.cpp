#include "devchain/graph/path.hpp"

#include <iomanip>
#include <sstream>

namespace devchain::graph {

bool path_ranks_before(const Path &lhs, const Path &rhs) {
  if (lhs.score != rhs.score) {
    return lhs.score > rhs.score;
  }
  const std::string &lhs_first = lhs.devices.empty() ? std::string() : lhs.devices.front();
  const std::string &rhs_first = rhs.devices.empty() ? std::string() : rhs.devices.front();
  if (lhs_first != rhs_first) {
    return lhs_first < rhs_first;
  }
  return lhs.devices < rhs.devices;
}

std::string format_path(const Path &path) {
  std::ostringstream out;
  out << std::fixed << std::setprecision(3) << path.score << " " << path.depth << " ";
  for (std::size_t i = 0; i < path.devices.size(); ++i) {
    if (i > 0) {
      out << " -> ";
    }
    out << path.devices[i];
  }
  return out.str();
}

} // namespace devchain::graph
