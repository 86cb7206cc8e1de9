/**
 * @file chunk.h
 * @brief Corpus record and search result types
 */

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

namespace finrag::vectors {

/**
 * @brief Filing metadata attached to every chunk
 *
 * String fields are exact-match indexed; quality_score is numeric and filtered
 * by threshold only.
 */
struct ChunkMetadata {
  std::string ticker;       ///< e.g. "AAPL"
  std::string filing_type;  ///< 10-K, 10-Q, 8-K, DEF 14A, 3, 4, 5
  std::string filing_date;  ///< ISO YYYY-MM-DD
  std::string section_type;
  double quality_score = 0.0;                ///< In [0, 1]
  std::map<std::string, std::string> extra;  ///< Free-form attributes (company_name, sector, ...)

  static bool IsCoreField(const std::string& field) {
    return field == "ticker" || field == "filing_type" || field == "filing_date" || field == "section_type" ||
           field == "quality_score";
  }

  /**
   * @brief Value of an indexed string field, nullopt when the field is unknown
   */
  std::optional<std::string> Get(const std::string& field) const {
    if (field == "ticker") {
      return ticker;
    }
    if (field == "filing_type") {
      return filing_type;
    }
    if (field == "filing_date") {
      return filing_date;
    }
    if (field == "section_type") {
      return section_type;
    }
    auto iter = extra.find(field);
    if (iter != extra.end()) {
      return iter->second;
    }
    return std::nullopt;
  }

  /**
   * @brief All indexed (field, value) pairs
   */
  std::vector<std::pair<std::string, std::string>> IndexedFields() const {
    std::vector<std::pair<std::string, std::string>> fields = {
        {"ticker", ticker}, {"filing_type", filing_type}, {"filing_date", filing_date}, {"section_type", section_type}};
    for (const auto& [key, value] : extra) {
      if (!IsCoreField(key)) {
        fields.emplace_back(key, value);
      }
    }
    return fields;
  }
};

/**
 * @brief Unit of retrieval: a passage of one filing
 */
struct Chunk {
  std::string id;
  std::string text;
  ChunkMetadata metadata;
};

/**
 * @brief One ranked hit
 */
struct SearchResult {
  std::string chunk_id;
  std::string text;
  ChunkMetadata metadata;
  double combined_score = 0.0;  ///< In [0, 1]
  double semantic_score = 0.0;
  double keyword_score = 0.0;
};

/**
 * @brief Deterministic result ordering
 *
 * Combined score descending, then more recent filing_date, then chunk id.
 */
inline bool ResultOrder(const SearchResult& lhs, const SearchResult& rhs) {
  if (lhs.combined_score != rhs.combined_score) {
    return lhs.combined_score > rhs.combined_score;
  }
  if (lhs.metadata.filing_date != rhs.metadata.filing_date) {
    return lhs.metadata.filing_date > rhs.metadata.filing_date;
  }
  return lhs.chunk_id < rhs.chunk_id;
}

}  // namespace finrag::vectors
