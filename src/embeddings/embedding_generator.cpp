/**
 * @file embedding_generator.cpp
 * @brief Embedding generation with primary/fallback strategy
 */

#include "embeddings/embedding_generator.h"

#include <mutex>

#include "utils/string_utils.h"
#include "utils/structured_log.h"
#include "vectors/distance.h"

namespace finrag::embeddings {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

EmbeddingGenerator::EmbeddingGenerator(const config::EmbeddingConfig& config, std::unique_ptr<PrimaryEmbedder> primary)
    : dimension_(config.dimension), primary_(std::move(primary)), fallback_(config.dimension, config.fallback) {
  if (!primary_) {
    utils::StructuredLog()
        .Event("embedding_method")
        .Field("method", MethodToString(EmbeddingMethod::kFallback))
        .Field("reason", "primary disabled")
        .Info();
    return;
  }

  auto probe = primary_->Probe(dimension_);
  if (probe) {
    method_ = EmbeddingMethod::kPrimary;
    utils::StructuredLog()
        .Event("embedding_method")
        .Field("method", MethodToString(method_))
        .Field("endpoint", primary_->Describe())
        .Info();
    return;
  }

  utils::LogEmbeddingFallback(primary_->Describe(), probe.error().to_string());
  primary_.reset();
  method_ = EmbeddingMethod::kFallback;
}

std::unique_ptr<EmbeddingGenerator> EmbeddingGenerator::Create(const config::EmbeddingConfig& config) {
  return std::make_unique<EmbeddingGenerator>(config, MakePrimaryEmbedder(config.primary));
}

bool EmbeddingGenerator::IsFitted() const {
  if (method_ == EmbeddingMethod::kPrimary) {
    return true;
  }
  std::shared_lock lock(mutex_);
  return fallback_.IsFitted();
}

Expected<void, Error> EmbeddingGenerator::Fit(const std::vector<std::string>& corpus) {
  if (method_ == EmbeddingMethod::kPrimary) {
    return {};
  }
  std::unique_lock lock(mutex_);
  auto result = fallback_.Fit(corpus);
  if (result) {
    utils::StructuredLog()
        .Event("embedding_fit")
        .Field("documents", static_cast<uint64_t>(corpus.size()))
        .Field("vocabulary", static_cast<uint64_t>(fallback_.VocabularySize()))
        .Field("rank", static_cast<uint64_t>(fallback_.Rank()))
        .Info();
  }
  return result;
}

Expected<Embedding, Error> EmbeddingGenerator::EmbedLocked(const std::string& text) const {
  Embedding embedding;
  embedding.method = method_;

  if (method_ == EmbeddingMethod::kFallback && !fallback_.IsFitted()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kEmbeddingNotFitted, "Fallback embedding model must be fitted on a corpus before use"));
  }

  if (utils::IsBlank(text)) {
    embedding.values.assign(dimension_, 0.0F);
    return embedding;
  }

  if (method_ == EmbeddingMethod::kFallback) {
    auto values = fallback_.Embed(text);
    if (!values) {
      return MakeUnexpected(values.error());
    }
    embedding.values = std::move(*values);
    return embedding;
  }

  auto values = primary_->Embed(text);
  if (values && values->size() != dimension_) {
    values = MakeUnexpected(MakeError(ErrorCode::kEmbeddingDimensionMismatch,
                                      "Primary returned " + std::to_string(values->size()) + " dimensions"));
  }
  if (!values) {
    utils::LogEmbeddingError(MethodToString(method_), values.error().to_string());
    embedding.values.assign(dimension_, 0.0F);
    embedding.degraded = true;
    return embedding;
  }

  embedding.values = std::move(*values);
  if (!vectors::Normalize(embedding.values)) {
    embedding.values.assign(dimension_, 0.0F);
  }
  return embedding;
}

Expected<std::vector<Embedding>, Error> EmbeddingGenerator::EmbedBatch(const std::vector<std::string>& texts) const {
  std::shared_lock lock(mutex_);
  std::vector<Embedding> embeddings;
  embeddings.reserve(texts.size());
  for (const auto& text : texts) {
    auto embedding = EmbedLocked(text);
    if (!embedding) {
      return MakeUnexpected(embedding.error());
    }
    embeddings.push_back(std::move(*embedding));
  }
  return embeddings;
}

Expected<Embedding, Error> EmbeddingGenerator::EmbedOne(const std::string& text) const {
  std::shared_lock lock(mutex_);
  return EmbedLocked(text);
}

uint32_t EmbeddingGenerator::ModelFingerprint() const {
  if (method_ == EmbeddingMethod::kPrimary) {
    return 0;
  }
  std::shared_lock lock(mutex_);
  return fallback_.Fingerprint();
}

Expected<std::string, Error> EmbeddingGenerator::ExportModel() const {
  if (method_ == EmbeddingMethod::kPrimary) {
    return std::string();
  }
  std::shared_lock lock(mutex_);
  return fallback_.Export();
}

Expected<void, Error> EmbeddingGenerator::ImportModel(const std::string& blob) {
  if (method_ == EmbeddingMethod::kPrimary) {
    return MakeUnexpected(
        MakeError(ErrorCode::kVectorMethodMismatch, "Cannot import a fallback model into a primary generator"));
  }
  std::unique_lock lock(mutex_);
  return fallback_.Import(blob);
}

}  // namespace finrag::embeddings
