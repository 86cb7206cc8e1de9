/**
 * @file tfidf_vectorizer.cpp
 * @brief Unigram + bigram TF-IDF vectorizer
 */

#include "embeddings/tfidf_vectorizer.h"

#include <algorithm>
#include <cmath>
#include <map>

#include "utils/binary_io.h"

namespace finrag::embeddings {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

TfidfVectorizer::TfidfVectorizer(uint32_t max_features) : max_features_(max_features) {}

std::vector<std::string> TfidfVectorizer::ExpandTerms(const std::vector<std::string>& tokens) {
  std::vector<std::string> terms(tokens.begin(), tokens.end());
  if (tokens.size() > 1) {
    terms.reserve(tokens.size() * 2 - 1);
    for (size_t i = 0; i + 1 < tokens.size(); ++i) {
      terms.push_back(tokens[i] + " " + tokens[i + 1]);
    }
  }
  return terms;
}

Expected<void, Error> TfidfVectorizer::Fit(const std::vector<std::vector<std::string>>& documents) {
  std::unordered_map<std::string, uint64_t> corpus_frequency;
  std::unordered_map<std::string, uint32_t> document_frequency;

  for (const auto& tokens : documents) {
    std::unordered_map<std::string, uint32_t> counts;
    for (auto& term : ExpandTerms(tokens)) {
      ++counts[std::move(term)];
    }
    for (const auto& [term, count] : counts) {
      corpus_frequency[term] += count;
      ++document_frequency[term];
    }
  }

  if (corpus_frequency.empty()) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingEmptyCorpus, "Corpus contains no usable terms"));
  }

  std::vector<std::pair<std::string, uint64_t>> ranked(corpus_frequency.begin(), corpus_frequency.end());
  std::sort(ranked.begin(), ranked.end(), [](const auto& lhs, const auto& rhs) {
    if (lhs.second != rhs.second) {
      return lhs.second > rhs.second;
    }
    return lhs.first < rhs.first;
  });
  if (ranked.size() > max_features_) {
    ranked.resize(max_features_);
  }

  terms_.clear();
  terms_.reserve(ranked.size());
  for (auto& entry : ranked) {
    terms_.push_back(std::move(entry.first));
  }
  std::sort(terms_.begin(), terms_.end());

  const auto n_docs = static_cast<double>(documents.size());
  idf_.assign(terms_.size(), 0.0F);
  for (size_t i = 0; i < terms_.size(); ++i) {
    const auto doc_freq = static_cast<double>(document_frequency[terms_[i]]);
    idf_[i] = static_cast<float>(std::log((1.0 + n_docs) / (1.0 + doc_freq)) + 1.0);
  }

  RebuildVocabulary();
  return {};
}

SparseRow TfidfVectorizer::Transform(const std::vector<std::string>& tokens) const {
  std::map<uint32_t, uint32_t> counts;
  for (const auto& term : ExpandTerms(tokens)) {
    auto iter = vocabulary_.find(term);
    if (iter != vocabulary_.end()) {
      ++counts[iter->second];
    }
  }

  SparseRow row;
  row.indices.reserve(counts.size());
  row.values.reserve(counts.size());
  double norm_sq = 0.0;
  for (const auto& [index, count] : counts) {
    float value = static_cast<float>(count) * idf_[index];
    row.indices.push_back(index);
    row.values.push_back(value);
    norm_sq += static_cast<double>(value) * value;
  }

  if (norm_sq > 0.0) {
    const auto inv_norm = static_cast<float>(1.0 / std::sqrt(norm_sq));
    for (auto& value : row.values) {
      value *= inv_norm;
    }
  }
  return row;
}

std::optional<uint32_t> TfidfVectorizer::TermIndex(const std::string& term) const {
  auto iter = vocabulary_.find(term);
  if (iter == vocabulary_.end()) {
    return std::nullopt;
  }
  return iter->second;
}

void TfidfVectorizer::RebuildVocabulary() {
  vocabulary_.clear();
  vocabulary_.reserve(terms_.size());
  for (size_t i = 0; i < terms_.size(); ++i) {
    vocabulary_.emplace(terms_[i], static_cast<uint32_t>(i));
  }
}

bool TfidfVectorizer::Serialize(std::ostream& output_stream) const {
  if (!utils::WriteBinary(output_stream, max_features_)) {
    return false;
  }
  auto term_count = static_cast<uint32_t>(terms_.size());
  if (!utils::WriteBinary(output_stream, term_count)) {
    return false;
  }
  for (const auto& term : terms_) {
    if (!utils::WriteString(output_stream, term)) {
      return false;
    }
  }
  return utils::WriteFloats(output_stream, idf_);
}

Expected<void, Error> TfidfVectorizer::Deserialize(std::istream& input_stream) {
  uint32_t max_features = 0;
  uint32_t term_count = 0;
  if (!utils::ReadBinary(input_stream, max_features) || !utils::ReadBinary(input_stream, term_count)) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Failed to read vocabulary header"));
  }

  std::vector<std::string> terms(term_count);
  for (auto& term : terms) {
    if (!utils::ReadString(input_stream, term)) {
      return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "Failed to read vocabulary term"));
    }
  }
  std::vector<float> idf;
  if (!utils::ReadFloats(input_stream, idf) || idf.size() != terms.size()) {
    return MakeUnexpected(MakeError(ErrorCode::kEmbeddingModelCorrupted, "idf table does not match vocabulary"));
  }

  max_features_ = max_features;
  terms_ = std::move(terms);
  idf_ = std::move(idf);
  RebuildVocabulary();
  return {};
}

}  // namespace finrag::embeddings
