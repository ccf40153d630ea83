#include "lore_core/store/similarity.hpp"

#include <cmath>

#include "lore_core/errors.hpp"

namespace lore_core {

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatch(a.size(), b.size());
  }

  double dot = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    const double x = a[i];
    const double y = b[i];
    dot += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }
  return dot / (std::sqrt(norm_a) * std::sqrt(norm_b));
}

std::vector<float> l2_normalized(const std::vector<float> &v) {
  double norm = 0.0;
  for (float value : v) {
    norm += static_cast<double>(value) * value;
  }
  norm = std::sqrt(norm);

  std::vector<float> out(v);
  if (norm > 0.0) {
    for (float &value : out) {
      value = static_cast<float>(value / norm);
    }
  }
  return out;
}

}  // namespace lore_core
