#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>
#include <vector>

namespace clientiq_core {

// Raised whenever two vectors that must share a dimension do not.
// This is a data or programming error and is never coerced away.
class DimensionMismatchError : public std::exception {
 public:
  DimensionMismatchError(size_t expected, size_t actual, const std::string &context = "")
      : expected_(expected), actual_(actual) {
    message_ = "Vector dimension mismatch";
    if (!context.empty()) {
      message_ += " in " + context;
    }
    message_ += ": expected " + std::to_string(expected) + ", got " + std::to_string(actual);
  }

  const char *what() const noexcept override {
    return message_.c_str();
  }

  size_t expected() const noexcept { return expected_; }
  size_t actual() const noexcept { return actual_; }

 private:
  size_t expected_;
  size_t actual_;
  std::string message_;
};

/**
 * Cosine of the angle between a and b, in [-1, 1].
 *
 * Returns 0 when either vector has zero norm. Accumulates in double so the
 * result is symmetric and stable for 1k+ dimension embeddings.
 *
 * @throws DimensionMismatchError if a.size() != b.size()
 * @throws std::invalid_argument if either vector holds NaN or infinity
 */
double cosine_similarity(const std::vector<float> &a, const std::vector<float> &b);

/**
 * Elementwise arithmetic mean. An empty input yields an empty vector.
 *
 * @throws DimensionMismatchError if the vectors do not all share the first one's length
 */
std::vector<float> average_vectors(const std::vector<std::vector<float>> &vectors);

}  // namespace clientiq_core
