/**
 * @file embedding.h
 * @brief Embedding value type and method tag
 */

#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace finrag::embeddings {

/**
 * @brief Which generator produced a vector
 *
 * Vectors of different methods live in unrelated spaces and must never be
 * compared with each other.
 */
enum class EmbeddingMethod : std::uint8_t {
  kPrimary = 0,   // HTTP model endpoint
  kFallback = 1,  // TF-IDF + truncated SVD
};

inline const char* MethodToString(EmbeddingMethod method) {
  return method == EmbeddingMethod::kPrimary ? "primary" : "fallback";
}

inline std::optional<EmbeddingMethod> ParseMethod(std::string_view name) {
  if (name == "primary") {
    return EmbeddingMethod::kPrimary;
  }
  if (name == "fallback") {
    return EmbeddingMethod::kFallback;
  }
  return std::nullopt;
}

/**
 * @brief Fixed-size vector tagged with its method
 *
 * values is L2-normalized, or all zeros for empty or degenerate text.
 */
struct Embedding {
  std::vector<float> values;
  EmbeddingMethod method = EmbeddingMethod::kFallback;
  bool degraded = false;  ///< Zero vector substituted after a per-call failure

  bool IsZero() const {
    for (float value : values) {
      if (value != 0.0F) {
        return false;
      }
    }
    return true;
  }
};

}  // namespace finrag::embeddings
