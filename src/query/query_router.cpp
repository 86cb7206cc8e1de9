/**
 * @file query_router.cpp
 * @brief Query routing
 */

#include "query/query_router.h"

namespace finrag::query {

using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

const char* QueryTypeToString(QueryType type) {
  switch (type) {
    case QueryType::kSingleCompany:
      return "single_company";
    case QueryType::kMultiCompany:
      return "multi_company";
    case QueryType::kTemporalAnalysis:
      return "temporal_analysis";
    case QueryType::kCrossSectional:
      return "cross_sectional";
    case QueryType::kGeneralSearch:
      return "general_search";
  }
  return "unknown";
}

const char* ComplexityToString(Complexity complexity) {
  switch (complexity) {
    case Complexity::kSimple:
      return "simple";
    case Complexity::kModerate:
      return "moderate";
    case Complexity::kComplex:
      return "complex";
  }
  return "unknown";
}

QueryRouter::QueryRouter(const EntityExtractor& extractor, retrieval::RetrievalEngine* engine,
                         const embeddings::EmbeddingGenerator* generator)
    : extractor_(extractor), engine_(engine), generator_(generator) {}

QueryType QueryRouter::Classify(const QueryContext& context) {
  if (context.tickers.size() >= 2 || context.comparison_intent) {
    return QueryType::kMultiCompany;
  }
  if (context.tickers.size() == 1) {
    return context.time_periods.Empty() ? QueryType::kSingleCompany : QueryType::kTemporalAnalysis;
  }
  if (!context.concepts.empty()) {
    return QueryType::kCrossSectional;
  }
  return QueryType::kGeneralSearch;
}

retrieval::Strategy QueryRouter::StrategyFor(QueryType type) {
  switch (type) {
    case QueryType::kSingleCompany:
      return retrieval::Strategy::kFiltered;
    case QueryType::kMultiCompany:
      return retrieval::Strategy::kMultiEntityBalanced;
    case QueryType::kTemporalAnalysis:
      return retrieval::Strategy::kTemporal;
    case QueryType::kCrossSectional:
    case QueryType::kGeneralSearch:
      return retrieval::Strategy::kGeneral;
  }
  return retrieval::Strategy::kGeneral;
}

ProcessingHints QueryRouter::HintsFor(QueryType type) {
  switch (type) {
    case QueryType::kSingleCompany:
      return {"focused_analysis", "single_source", "company_specific"};
    case QueryType::kMultiCompany:
      return {"comparative_analysis", "cross_company", "multi_entity"};
    case QueryType::kTemporalAnalysis:
      return {"time_series_analysis", "temporal_synthesis", "chronological"};
    case QueryType::kCrossSectional:
      return {"thematic_analysis", "concept_aggregation", "industry_wide"};
    case QueryType::kGeneralSearch:
      break;
  }
  return {"broad_search", "relevance_ranking", "general"};
}

Complexity QueryRouter::ScoreComplexity(const QueryContext& context) {
  size_t score = context.tickers.size() * 2;
  score += context.time_periods.years.size();
  score += context.filing_types.size();
  score += context.comparison_cue ? 3 : 0;
  score += context.concepts.size();

  if (score <= 3) {
    return Complexity::kSimple;
  }
  if (score <= 7) {
    return Complexity::kModerate;
  }
  return Complexity::kComplex;
}

RoutingDecision QueryRouter::Route(const std::string& query) const {
  RoutingDecision decision;
  decision.context = extractor_.Extract(query);
  decision.type = Classify(decision.context);
  decision.strategy = StrategyFor(decision.type);
  decision.hints = HintsFor(decision.type);
  decision.complexity = ScoreComplexity(decision.context);
  return decision;
}

Expected<RoutedQuery, Error> QueryRouter::Process(const std::string& query) const {
  if (engine_ == nullptr || generator_ == nullptr) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "Router has no retrieval engine or generator"));
  }

  RoutedQuery routed;
  routed.decision = Route(query);

  // Loading the snapshot may restore the fallback model
  auto loaded = engine_->EnsureStoreLoaded();
  if (!loaded) {
    return MakeUnexpected(loaded.error());
  }
  // An unfitted fallback model means nothing was ever ingested or restored
  if (!generator_->IsFitted()) {
    routed.retrieval.strategy = routed.decision.strategy;
    routed.retrieval.status = vectors::SearchStatus::kNoData;
    return routed;
  }

  auto query_vector = generator_->EmbedOne(query);
  if (!query_vector) {
    return MakeUnexpected(query_vector.error());
  }

  auto retrieved = engine_->Retrieve(*query_vector, query, routed.decision.context, routed.decision.strategy);
  if (!retrieved) {
    return MakeUnexpected(retrieved.error());
  }
  routed.retrieval = std::move(*retrieved);
  return routed;
}

}  // namespace finrag::query
