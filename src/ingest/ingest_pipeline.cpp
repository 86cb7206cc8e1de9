/**
 * @file ingest_pipeline.cpp
 * @brief Ingestion pipeline
 */

#include "ingest/ingest_pipeline.h"

namespace finrag::ingest {

using utils::Error;
using utils::Expected;
using utils::MakeUnexpected;

Expected<IngestReport, Error> IngestPipeline::IngestFile(const std::string& path) {
  auto loaded = ChunkLoader::LoadFile(path);
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }
  auto report = IngestChunks(loaded->chunks);
  if (!report) {
    return report;
  }
  report->load = std::move(loaded->summary);
  return report;
}

Expected<IngestReport, Error> IngestPipeline::IngestChunks(const std::vector<vectors::Chunk>& chunks) {
  IngestReport report;
  report.load.loaded = chunks.size();
  report.load.lines = chunks.size();
  if (chunks.empty()) {
    return report;
  }

  auto loaded = store_.EnsureLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }

  std::vector<std::string> texts;
  texts.reserve(chunks.size());
  for (const auto& chunk : chunks) {
    texts.push_back(chunk.text);
  }

  if (generator_.Method() == embeddings::EmbeddingMethod::kFallback &&
      (store_.ChunkCount() == 0 || !generator_.IsFitted())) {
    auto fitted = generator_.Fit(texts);
    if (!fitted) {
      return MakeUnexpected(fitted.error());
    }
    report.model_fitted = true;
  }

  auto embeddings = generator_.EmbedBatch(texts);
  if (!embeddings) {
    return MakeUnexpected(embeddings.error());
  }

  auto added = store_.Add(chunks, *embeddings);
  if (!added) {
    return MakeUnexpected(added.error());
  }
  report.store = std::move(*added);
  return report;
}

}  // namespace finrag::ingest
