#pragma once

#include <vector>

namespace devchain::embedding {

using Vector = std::vector<float>;

/// Dot product over the shared prefix. For unit vectors this is cosine similarity.
[[nodiscard]] float dot(const Vector &a, const Vector &b);
[[nodiscard]] double l2_norm(const Vector &values);

/// Scales to unit length. Returns false (leaving values untouched) for a zero vector.
[[nodiscard]] bool normalize(Vector &values);

[[nodiscard]] bool is_unit(const Vector &values, double tolerance = 1e-3);

} // namespace devchain::embedding
