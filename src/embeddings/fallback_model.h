/**
 * @file fallback_model.h
 * @brief Fitted fallback embedding model (tokenizer + TF-IDF + SVD)
 */

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "config/config.h"
#include "embeddings/svd_reducer.h"
#include "embeddings/text_normalizer.h"
#include "embeddings/tfidf_vectorizer.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::embeddings {

/**
 * @brief Local embedding model used when no primary endpoint is reachable
 *
 * Fit once on the full ingestion corpus; afterwards every text (batch or
 * single) goes through the same Embed() path, so results do not depend on
 * how texts are grouped.
 */
class FallbackModel {
 public:
  FallbackModel(uint32_t dimension, const config::FallbackEmbeddingConfig& config);

  utils::Expected<void, utils::Error> Fit(const std::vector<std::string>& corpus);

  /**
   * @brief L2-normalized vector of Dimension() entries (zeros for text with no known terms)
   */
  utils::Expected<std::vector<float>, utils::Error> Embed(const std::string& text) const;

  bool IsFitted() const { return vectorizer_.IsFitted() && reducer_.IsFitted(); }
  uint32_t Dimension() const { return dimension_; }
  size_t VocabularySize() const { return vectorizer_.VocabularySize(); }
  uint32_t Rank() const { return reducer_.Rank(); }

  /**
   * @brief Binary serialization of the fitted state
   */
  utils::Expected<std::string, utils::Error> Export() const;
  utils::Expected<void, utils::Error> Import(const std::string& blob);

  /**
   * @brief CRC32 of the serialized model (0 when not fitted)
   */
  uint32_t Fingerprint() const;

 private:
  uint32_t dimension_;
  TextNormalizer normalizer_;
  TfidfVectorizer vectorizer_;
  SvdReducer reducer_;
};

}  // namespace finrag::embeddings
