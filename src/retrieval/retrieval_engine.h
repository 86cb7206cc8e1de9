/**
 * @file retrieval_engine.h
 * @brief Strategy-driven retrieval over the vector store
 */

#pragma once

#include <cstdint>
#include <map>
#include <string>
#include <utility>
#include <vector>

#include "config/config.h"
#include "embeddings/embedding.h"
#include "query/query_context.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/vector_store.h"

namespace finrag::retrieval {

/**
 * @brief Retrieval strategies, chosen by the query router
 */
enum class Strategy : std::uint8_t {
  kFiltered = 0,             // One entity scope: ticker, filing types, years
  kMultiEntityBalanced = 1,  // Per-ticker quota, concatenated in ticker order
  kTemporal = 2,             // Year-bounded, recency as secondary key
  kGeneral = 3,              // No metadata filter; concept-weighted when concepts exist
};

const char* StrategyToString(Strategy strategy);

/**
 * @brief Outcome of one retrieval
 */
struct RetrievalResult {
  vectors::SearchStatus status = vectors::SearchStatus::kNoData;
  Strategy strategy = Strategy::kGeneral;
  std::vector<vectors::SearchResult> results;
  std::map<std::string, size_t> per_ticker_counts;
  bool broadened = false;  ///< Scoped search found nothing; results come from an unscoped search
  bool degraded = false;   ///< Query vector was a substituted zero vector
};

/**
 * @brief Executes a retrieval strategy against a VectorStore
 *
 * When a scoped strategy (filtered, multi-entity or temporal) finds nothing
 * while the corpus holds data, and retrieval.broaden_on_empty is set, the
 * engine re-runs a general search and marks the result as broadened.
 */
class RetrievalEngine {
 public:
  RetrievalEngine(vectors::VectorStore& store, const config::RetrievalConfig& config);

  utils::Expected<RetrievalResult, utils::Error> Retrieve(const embeddings::Embedding& query_vector,
                                                          const std::string& query_text,
                                                          const query::QueryContext& context, Strategy strategy);

  /**
   * @brief Unfiltered search widened with section keywords
   *
   * Keeps only hits whose text mentions one of the keywords (case-insensitive),
   * so it finds section content in chunks whose section_type is missing or
   * labelled differently. Returns at most top_k results with strategy kGeneral.
   */
  utils::Expected<RetrievalResult, utils::Error> SearchBySection(const embeddings::Embedding& query_vector,
                                                                 const std::string& query_text,
                                                                 const std::vector<std::string>& section_keywords,
                                                                 size_t top_k);

  /**
   * @brief Trigger the store's lazy snapshot load (which may restore the embedding model)
   */
  utils::Expected<void, utils::Error> EnsureStoreLoaded() { return store_.EnsureLoaded(); }

  /**
   * @brief Results per ticker for multi-entity retrieval: max(min_per_entity, budget / n)
   */
  static size_t PerEntityQuota(size_t budget, size_t entity_count, size_t min_per_entity);

  /**
   * @brief Inclusive filing_date bounds covering the given years and quarters
   *
   * Quarters narrow the range only when exactly one year is given. Returns a
   * pair of empty strings when there are no years.
   */
  static std::pair<std::string, std::string> DateRange(const query::TimePeriods& periods);

 private:
  vectors::VectorStore& store_;
  config::RetrievalConfig config_;

  /**
   * @brief Run one store search and fold it into result
   */
  utils::Expected<void, utils::Error> Collect(const embeddings::Embedding& query_vector,
                                              const std::string& query_text, const vectors::SearchOptions& options,
                                              RetrievalResult& result);

  utils::Expected<void, utils::Error> RunFiltered(const embeddings::Embedding& query_vector,
                                                  const std::string& query_text, const query::QueryContext& context,
                                                  RetrievalResult& result);
  utils::Expected<void, utils::Error> RunMultiEntity(const embeddings::Embedding& query_vector,
                                                     const std::string& query_text,
                                                     const query::QueryContext& context, RetrievalResult& result);
  utils::Expected<void, utils::Error> RunTemporal(const embeddings::Embedding& query_vector,
                                                  const std::string& query_text, const query::QueryContext& context,
                                                  RetrievalResult& result);
  utils::Expected<void, utils::Error> RunGeneral(const embeddings::Embedding& query_vector,
                                                 const std::string& query_text, const query::QueryContext& context,
                                                 RetrievalResult& result);
};

}  // namespace finrag::retrieval
