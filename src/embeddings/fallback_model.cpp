/**
 * @file fallback_model.cpp
 * @brief Fitted fallback embedding model
 */

#include "embeddings/fallback_model.h"

#include <zlib.h>

#include <sstream>

#include "utils/binary_io.h"
#include "vectors/distance.h"

namespace finrag::embeddings {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

namespace {

constexpr uint32_t kModelFormatVersion = 1;

}  // namespace

FallbackModel::FallbackModel(uint32_t dimension, const config::FallbackEmbeddingConfig& config)
    : dimension_(dimension),
      normalizer_(config.min_token_length),
      vectorizer_(config.max_features),
      reducer_(dimension, config.svd_oversampling, config.svd_power_iterations, config.seed) {}

Expected<void, Error> FallbackModel::Fit(const std::vector<std::string>& corpus) {
  std::vector<std::vector<std::string>> tokenized;
  tokenized.reserve(corpus.size());
  for (const auto& text : corpus) {
    tokenized.push_back(normalizer_.Tokenize(text));
  }

  auto fit_result = vectorizer_.Fit(tokenized);
  if (!fit_result) {
    return fit_result;
  }

  std::vector<SparseRow> rows;
  rows.reserve(tokenized.size());
  for (const auto& tokens : tokenized) {
    rows.push_back(vectorizer_.Transform(tokens));
  }
  return reducer_.Fit(SvdReducer::BuildMatrix(rows, vectorizer_.VocabularySize()));
}

Expected<std::vector<float>, Error> FallbackModel::Embed(const std::string& text) const {
  if (!IsFitted()) {
    return MakeUnexpected(
        MakeError(ErrorCode::kEmbeddingNotFitted, "Fallback embedding model must be fitted on a corpus before use"));
  }
  std::vector<float> values = reducer_.Transform(vectorizer_.Transform(normalizer_.Tokenize(text)));
  vectors::Normalize(values);
  return values;
}

Expected<std::string, Error> FallbackModel::Export() const {
  if (!IsFitted()) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingNotFitted, "Cannot export an unfitted fallback model"));
  }
  std::ostringstream output_stream;
  bool ok = utils::WriteBinary(output_stream, kModelFormatVersion) &&
            utils::WriteBinary(output_stream, normalizer_.MinTokenLength()) &&
            vectorizer_.Serialize(output_stream) && reducer_.Serialize(output_stream);
  if (!ok) {
    return MakeUnexpected(MakeError(ErrorCode::kStorageDumpWriteError, "Failed to serialize fallback model"));
  }
  return output_stream.str();
}

Expected<void, Error> FallbackModel::Import(const std::string& blob) {
  std::istringstream input_stream(blob);
  uint32_t version = 0;
  uint32_t min_token_length = 0;
  if (!utils::ReadBinary(input_stream, version) || version != kModelFormatVersion) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Unsupported fallback model version"));
  }
  if (!utils::ReadBinary(input_stream, min_token_length)) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Failed to read tokenizer settings"));
  }

  TfidfVectorizer vectorizer;
  auto vectorizer_result = vectorizer.Deserialize(input_stream);
  if (!vectorizer_result) {
    return vectorizer_result;
  }
  SvdReducer reducer(dimension_, 0, 0, 0);
  auto reducer_result = reducer.Deserialize(input_stream);
  if (!reducer_result) {
    return reducer_result;
  }
  if (reducer.Dimension() != dimension_) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingDimensionMismatch,
                                    "Stored model dimension " + std::to_string(reducer.Dimension()) +
                                        " differs from configured dimension " + std::to_string(dimension_)));
  }

  normalizer_ = TextNormalizer(min_token_length);
  vectorizer_ = std::move(vectorizer);
  reducer_ = std::move(reducer);
  return {};
}

uint32_t FallbackModel::Fingerprint() const {
  auto blob = Export();
  if (!blob) {
    return 0;
  }
  // NOLINTNEXTLINE(cppcoreguidelines-pro-type-reinterpret-cast)
  return static_cast<uint32_t>(crc32(0L, reinterpret_cast<const Bytef*>(blob->data()), blob->size()));
}

}  // namespace finrag::embeddings
