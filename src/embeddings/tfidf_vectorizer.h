/**
 * @file tfidf_vectorizer.h
 * @brief Unigram + bigram TF-IDF vectorizer
 */

#pragma once

#include <cstdint>
#include <iosfwd>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::embeddings {

/**
 * @brief Sparse row: parallel arrays sorted by ascending index
 */
struct SparseRow {
  std::vector<uint32_t> indices;
  std::vector<float> values;
};

/**
 * @brief TF-IDF over unigrams and bigrams with smooth idf
 *
 * - Vocabulary: the max_features most frequent terms across the corpus
 *   (ties broken lexically), indexed in lexical order.
 * - idf(t) = ln((1 + n_docs) / (1 + df(t))) + 1
 * - Row value = raw term count * idf, then the row is L2-normalized.
 */
class TfidfVectorizer {
 public:
  explicit TfidfVectorizer(uint32_t max_features = 5000);

  /**
   * @brief Learn vocabulary and idf from tokenized documents
   * @return kEmbeddingEmptyCorpus when no document yields a term
   */
  utils::Expected<void, utils::Error> Fit(const std::vector<std::vector<std::string>>& documents);

  /**
   * @brief Vectorize one tokenized document (empty row when nothing is in vocabulary)
   */
  SparseRow Transform(const std::vector<std::string>& tokens) const;

  bool IsFitted() const { return !idf_.empty(); }
  size_t VocabularySize() const { return terms_.size(); }
  std::optional<uint32_t> TermIndex(const std::string& term) const;
  const std::vector<std::string>& Terms() const { return terms_; }
  const std::vector<float>& IdfWeights() const { return idf_; }

  bool Serialize(std::ostream& output_stream) const;
  utils::Expected<void, utils::Error> Deserialize(std::istream& input_stream);

  /**
   * @brief Unigrams followed by space-joined bigrams
   */
  static std::vector<std::string> ExpandTerms(const std::vector<std::string>& tokens);

 private:
  uint32_t max_features_;
  std::vector<std::string> terms_;
  std::unordered_map<std::string, uint32_t> vocabulary_;
  std::vector<float> idf_;

  void RebuildVocabulary();
};

}  // namespace finrag::embeddings
