/**
 * @file distance.h
 * @brief Vector similarity helpers
 */

#pragma once

#include <cmath>
#include <vector>

namespace finrag::vectors {

/**
 * @brief Dot product: sum(a[i] * b[i])
 *
 * @return Dot product value, or 0.0 if dimensions mismatch
 */
inline float DotProduct(const std::vector<float>& a, const std::vector<float>& b) {
  if (a.size() != b.size() || a.empty()) {
    return 0.0f;
  }
  double sum = 0.0;
  for (size_t i = 0; i < a.size(); ++i) {
    sum += static_cast<double>(a[i]) * b[i];
  }
  return static_cast<float>(sum);
}

/**
 * @brief Normalize a vector to unit length in place
 *
 * @return True if normalized, false if the vector is zero or not finite
 */
inline bool Normalize(std::vector<float>& v) {
  double norm_sq = 0.0;
  for (float val : v) {
    norm_sq += static_cast<double>(val) * val;
  }
  if (norm_sq <= 0.0 || !std::isfinite(norm_sq)) {
    return false;
  }
  const auto inv_norm = static_cast<float>(1.0 / std::sqrt(norm_sq));
  for (float& val : v) {
    val *= inv_norm;
  }
  return true;
}

/**
 * @brief True when every component is exactly zero
 */
inline bool IsZeroVector(const std::vector<float>& v) {
  for (float val : v) {
    if (val != 0.0f) {
      return false;
    }
  }
  return true;
}

}  // namespace finrag::vectors
