/**
 * @file ingest_pipeline.h
 * @brief Chunk file -> fitted embeddings -> vector store
 */

#pragma once

#include <string>
#include <vector>

#include "embeddings/embedding_generator.h"
#include "ingest/chunk_loader.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/vector_store.h"

namespace finrag::ingest {

struct IngestReport {
  LoadSummary load;
  vectors::IngestSummary store;
  bool model_fitted = false;  ///< The fallback model was (re)fitted by this run
};

/**
 * @brief Single-writer ingestion
 *
 * The fallback model is fitted on the chunks of the first ingestion into an
 * empty store. Later ingestions reuse the fitted model so that stored vectors
 * stay comparable.
 */
class IngestPipeline {
 public:
  IngestPipeline(embeddings::EmbeddingGenerator& generator, vectors::VectorStore& store)
      : generator_(generator), store_(store) {}

  utils::Expected<IngestReport, utils::Error> IngestFile(const std::string& path);

  utils::Expected<IngestReport, utils::Error> IngestChunks(const std::vector<vectors::Chunk>& chunks);

 private:
  embeddings::EmbeddingGenerator& generator_;
  vectors::VectorStore& store_;
};

}  // namespace finrag::ingest
