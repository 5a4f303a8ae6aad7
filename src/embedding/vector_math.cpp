#include "devchain/embedding/vector_math.hpp"

#include <algorithm>
#include <cmath>

namespace devchain::embedding {

float dot(const Vector &a, const Vector &b) {
  const std::size_t n = std::min(a.size(), b.size());
  double sum = 0.0;
  for (std::size_t i = 0; i < n; ++i) {
    sum += static_cast<double>(a[i]) * static_cast<double>(b[i]);
  }
  return static_cast<float>(sum);
}

double l2_norm(const Vector &values) {
  double sum = 0.0;
  for (const float v : values) {
    sum += static_cast<double>(v) * static_cast<double>(v);
  }
  return std::sqrt(sum);
}

bool normalize(Vector &values) {
  const double norm = l2_norm(values);
  if (norm < 1e-9 || !std::isfinite(norm)) {
    return false;
  }
  for (float &v : values) {
    v = static_cast<float>(static_cast<double>(v) / norm);
  }
  return true;
}

bool is_unit(const Vector &values, const double tolerance) {
  return std::abs(l2_norm(values) - 1.0) <= tolerance;
}

} // namespace devchain::embedding
