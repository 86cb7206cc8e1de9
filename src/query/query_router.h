/**
 * @file query_router.h
 * @brief Query classification and retrieval strategy selection
 */

#pragma once

#include <cstdint>
#include <string>

#include "embeddings/embedding_generator.h"
#include "query/entity_extractor.h"
#include "query/query_context.h"
#include "retrieval/retrieval_engine.h"
#include "utils/error.h"
#include "utils/expected.h"

namespace finrag::query {

enum class QueryType : std::uint8_t {
  kSingleCompany = 0,
  kMultiCompany = 1,
  kTemporalAnalysis = 2,
  kCrossSectional = 3,  // No ticker, financial concepts present
  kGeneralSearch = 4,
};

const char* QueryTypeToString(QueryType type);

enum class Complexity : std::uint8_t {
  kSimple = 0,
  kModerate = 1,
  kComplex = 2,
};

const char* ComplexityToString(Complexity complexity);

/**
 * @brief How the answer-generation step should treat the retrieved context
 */
struct ProcessingHints {
  std::string approach;
  std::string synthesis_method;
  std::string context_window;
};

struct RoutingDecision {
  QueryContext context;
  QueryType type = QueryType::kGeneralSearch;
  retrieval::Strategy strategy = retrieval::Strategy::kGeneral;
  ProcessingHints hints;
  Complexity complexity = Complexity::kSimple;
};

struct RoutedQuery {
  RoutingDecision decision;
  retrieval::RetrievalResult retrieval;
};

/**
 * @brief Classifies a query from its entities and runs the chosen strategy
 *
 * Decision order, first match wins:
 *  1. two or more tickers, or comparison intent -> multi-entity balanced
 *  2. one ticker and a time period              -> temporal, scoped to the ticker
 *  3. one ticker                                -> filtered
 *  4. no ticker, one or more concepts           -> general, concept-weighted
 *  5. otherwise                                 -> general
 *
 * Entities are trusted as extracted; a false-positive ticker changes the
 * branch. An empty query routes to general search with an empty context.
 */
class QueryRouter {
 public:
  /**
   * @param extractor Entity extraction pipeline
   * @param engine Retrieval engine used by Process (may be nullptr for Route-only use)
   * @param generator Query embedding generator used by Process (may be nullptr for Route-only use)
   */
  QueryRouter(const EntityExtractor& extractor, retrieval::RetrievalEngine* engine,
              const embeddings::EmbeddingGenerator* generator);

  RoutingDecision Route(const std::string& query) const;

  /**
   * @brief Route, embed the query, and retrieve
   */
  utils::Expected<RoutedQuery, utils::Error> Process(const std::string& query) const;

  static QueryType Classify(const QueryContext& context);
  static retrieval::Strategy StrategyFor(QueryType type);
  static ProcessingHints HintsFor(QueryType type);

  /**
   * @brief Weighted entity count: 2 per ticker, 1 per year, filing type and
   * concept, 3 for a comparison cue; <= 3 simple, <= 7 moderate, else complex
   */
  static Complexity ScoreComplexity(const QueryContext& context);

 private:
  const EntityExtractor& extractor_;
  retrieval::RetrievalEngine* engine_;
  const embeddings::EmbeddingGenerator* generator_;
};

}  // namespace finrag::query
