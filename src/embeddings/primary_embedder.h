/**
 * @file primary_embedder.h
 * @brief Primary embedding backend (remote model endpoint)
 */

#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config/config.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::embeddings {

/**
 * @brief Interface of a primary embedding backend
 *
 * The generator treats the backend as a black box that maps text to a vector
 * of the configured dimension.
 */
class PrimaryEmbedder {
 public:
  virtual ~PrimaryEmbedder() = default;

  /**
   * @brief Check the backend is reachable and returns vectors of `dimension`
   */
  virtual utils::Expected<void, utils::Error> Probe(uint32_t dimension) = 0;

  /**
   * @brief Embed one text (raw model output, not yet normalized)
   */
  virtual utils::Expected<std::vector<float>, utils::Error> Embed(const std::string& text) = 0;

  /**
   * @brief Human-readable endpoint description for logs
   */
  virtual std::string Describe() const = 0;
};

/**
 * @brief Ollama-compatible HTTP embedding endpoint
 *
 * POST {url}/api/embeddings with {"model": ..., "prompt": ...};
 * the response carries {"embedding": [floats]}.
 */
class HttpPrimaryEmbedder : public PrimaryEmbedder {
 public:
  explicit HttpPrimaryEmbedder(config::PrimaryEmbeddingConfig config);

  utils::Expected<void, utils::Error> Probe(uint32_t dimension) override;
  utils::Expected<std::vector<float>, utils::Error> Embed(const std::string& text) override;
  std::string Describe() const override;

 private:
  config::PrimaryEmbeddingConfig config_;
};

/**
 * @brief Build the backend described by config (nullptr when disabled)
 */
std::unique_ptr<PrimaryEmbedder> MakePrimaryEmbedder(const config::PrimaryEmbeddingConfig& config);

}  // namespace finrag::embeddings
