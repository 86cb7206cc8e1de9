/**
 * @file embedding_generator.h
 * @brief Embedding generation with primary/fallback strategy
 */

#pragma once

#include <cstdint>
#include <memory>
#include <shared_mutex>
#include <string>
#include <vector>

#include "config/config.h"
#include "embeddings/embedding.h"
#include "embeddings/fallback_model.h"
#include "embeddings/primary_embedder.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::embeddings {

/**
 * @brief Produces fixed-size, L2-normalized embeddings
 *
 * The method is decided once at construction: the primary backend is probed
 * and, when it is missing, unreachable or of the wrong dimension, the
 * generator switches to the fallback model for the rest of its lifetime.
 * Per-call failures of the primary backend never switch method; they yield a
 * zero vector flagged as degraded.
 *
 * EmbedOne(t) and EmbedBatch({t})[0] run the same code path and return the
 * same values.
 *
 * Thread-safety: Embed* may run concurrently; Fit and ImportModel take an
 * exclusive lock.
 */
class EmbeddingGenerator {
 public:
  /**
   * @param config Embedding configuration
   * @param primary Primary backend, or nullptr to use the fallback directly
   */
  EmbeddingGenerator(const config::EmbeddingConfig& config, std::unique_ptr<PrimaryEmbedder> primary);

  /**
   * @brief Build a generator with the HTTP backend described by config
   */
  static std::unique_ptr<EmbeddingGenerator> Create(const config::EmbeddingConfig& config);

  EmbeddingMethod Method() const { return method_; }
  uint32_t Dimension() const { return dimension_; }

  /**
   * @brief True when EmbedOne/EmbedBatch can be served (always for primary)
   */
  bool IsFitted() const;

  /**
   * @brief Fit the fallback model on the full corpus (no-op for primary)
   */
  utils::Expected<void, utils::Error> Fit(const std::vector<std::string>& corpus);

  utils::Expected<std::vector<Embedding>, utils::Error> EmbedBatch(const std::vector<std::string>& texts) const;
  utils::Expected<Embedding, utils::Error> EmbedOne(const std::string& text) const;

  /**
   * @brief Identity of the fitted fallback model (0 for primary or unfitted)
   */
  uint32_t ModelFingerprint() const;

  /**
   * @brief Serialized fallback model, for snapshots
   */
  utils::Expected<std::string, utils::Error> ExportModel() const;

  /**
   * @brief Restore a fallback model written by ExportModel()
   */
  utils::Expected<void, utils::Error> ImportModel(const std::string& blob);

 private:
  uint32_t dimension_;
  EmbeddingMethod method_ = EmbeddingMethod::kFallback;
  std::unique_ptr<PrimaryEmbedder> primary_;
  FallbackModel fallback_;
  mutable std::shared_mutex mutex_;

  utils::Expected<Embedding, utils::Error> EmbedLocked(const std::string& text) const;
};

}  // namespace finrag::embeddings
