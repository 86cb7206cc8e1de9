/**
 * @file scoring_profile.h
 * @brief Method-dependent hybrid scoring weights
 */

#pragma once

#include "config/config.h"
#include "embeddings/embedding.h"

namespace finrag::vectors {

/**
 * @brief Weights and cutoff used to combine semantic and keyword scores
 *
 * Selected once from the store's active embedding method. Fallback vectors
 * are weaker, so that profile leans on keywords and accepts lower scores.
 */
class ScoringProfile {
 public:
  static ScoringProfile For(embeddings::EmbeddingMethod method, const config::ScoringConfig& config);

  /**
   * @brief Weighted sum, normalized by the weight total and clamped to [0, 1]
   */
  double Combine(double semantic_score, double keyword_score) const;

  bool Accepts(double combined_score) const { return combined_score > min_score_; }

  embeddings::EmbeddingMethod Method() const { return method_; }
  double SemanticWeight() const { return semantic_weight_; }
  double KeywordWeight() const { return keyword_weight_; }
  double MinScore() const { return min_score_; }

 private:
  ScoringProfile(embeddings::EmbeddingMethod method, const config::ScoringWeights& weights);

  embeddings::EmbeddingMethod method_;
  double semantic_weight_;
  double keyword_weight_;
  double min_score_;
};

}  // namespace finrag::vectors
