#include "clientiq_core/similarity/vector_math.hpp"

#include <algorithm>
#include <cmath>

namespace clientiq_core {

double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b) {
  if (a.size() != b.size()) {
    throw DimensionMismatchError(a.size(), b.size(), "cosine_similarity");
  }

  double dot_product = 0.0;
  double norm_a = 0.0;
  double norm_b = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    const double x = a[i];
    const double y = b[i];
    dot_product += x * y;
    norm_a += x * x;
    norm_b += y * y;
  }

  if (norm_a == 0.0 || norm_b == 0.0) {
    return 0.0;
  }

  const double similarity = dot_product / (std::sqrt(norm_a) * std::sqrt(norm_b));
  // std::min/max would turn NaN into 1.0, a perfect match
  if (!std::isfinite(similarity)) {
    throw std::invalid_argument("cosine_similarity: vectors contain non-finite components");
  }
  return std::max(-1.0, std::min(1.0, similarity));
}

std::vector<float> average_vectors(const std::vector<std::vector<float>> &vectors) {
  if (vectors.empty()) {
    return {};
  }

  const size_t dimension = vectors.front().size();
  std::vector<double> sums(dimension, 0.0);
  for (const auto &vector : vectors) {
    if (vector.size() != dimension) {
      throw DimensionMismatchError(dimension, vector.size(), "average_vectors");
    }
    for (size_t i = 0; i < dimension; ++i) {
      sums[i] += vector[i];
    }
  }

  std::vector<float> average(dimension);
  const double count = static_cast<double>(vectors.size());
  for (size_t i = 0; i < dimension; ++i) {
    average[i] = static_cast<float>(sums[i] / count);
  }
  return average;
}

}  // namespace clientiq_core
