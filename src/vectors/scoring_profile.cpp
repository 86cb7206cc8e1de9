/**
 * @file scoring_profile.cpp
 * @brief Method-dependent hybrid scoring weights
 */

#include "vectors/scoring_profile.h"

#include <algorithm>

namespace finrag::vectors {

ScoringProfile::ScoringProfile(embeddings::EmbeddingMethod method, const config::ScoringWeights& weights)
    : method_(method),
      semantic_weight_(weights.semantic_weight),
      keyword_weight_(weights.keyword_weight),
      min_score_(weights.min_score) {}

ScoringProfile ScoringProfile::For(embeddings::EmbeddingMethod method, const config::ScoringConfig& config) {
  return method == embeddings::EmbeddingMethod::kPrimary ? ScoringProfile(method, config.primary)
                                                         : ScoringProfile(method, config.fallback);
}

double ScoringProfile::Combine(double semantic_score, double keyword_score) const {
  const double semantic = std::clamp(semantic_score, 0.0, 1.0);
  const double keyword = std::clamp(keyword_score, 0.0, 1.0);
  const double total_weight = semantic_weight_ + keyword_weight_;
  if (total_weight <= 0.0) {
    return 0.0;
  }
  return std::clamp((semantic_weight_ * semantic + keyword_weight_ * keyword) / total_weight, 0.0, 1.0);
}

}  // namespace finrag::vectors
