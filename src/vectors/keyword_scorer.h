/**
 * @file keyword_scorer.h
 * @brief Lexical overlap scoring between a query and a chunk
 */

#pragma once

#include <string>
#include <string_view>
#include <unordered_set>
#include <vector>

namespace finrag::vectors {

/**
 * @brief Pre-tokenized chunk text, built once per chunk at ingestion
 */
struct ChunkTerms {
  std::string lowered;                     ///< Lowercased full text, for partial matches
  std::unordered_set<std::string> tokens;  ///< Lowercased alphanumeric tokens
};

/**
 * @brief Keyword score in [0, 1]
 *
 * Query keywords are lowercased alphanumeric tokens longer than two characters
 * that are not stopwords. Each keyword contributes 1.0 when it is a token of
 * the chunk, 0.5 when it only occurs inside a longer word, 0 otherwise; the
 * score is the mean over keywords.
 */
class KeywordScorer {
 public:
  static constexpr double kExactMatch = 1.0;
  static constexpr double kPartialMatch = 0.5;

  /**
   * @brief Distinct keywords of a query, in first-occurrence order
   */
  static std::vector<std::string> ExtractKeywords(std::string_view query);

  static ChunkTerms Analyze(std::string_view text);

  static double Score(const std::vector<std::string>& keywords, const ChunkTerms& terms);

  static bool IsStopword(std::string_view word);

 private:
  static std::vector<std::string> Tokenize(std::string_view text);
};

}  // namespace finrag::vectors
