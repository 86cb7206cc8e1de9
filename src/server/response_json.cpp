/**
 * @file response_json.cpp
 * @brief JSON shapes shared by the HTTP API and the CLI
 */

#include "server/response_json.h"

namespace finrag::server {

using json = nlohmann::json;
using utils::Error;
using utils::ErrorCode;
using utils::Expected;
using utils::MakeError;
using utils::MakeUnexpected;

json MetadataToJson(const vectors::ChunkMetadata& metadata) {
  json object;
  object["ticker"] = metadata.ticker;
  object["filing_type"] = metadata.filing_type;
  object["filing_date"] = metadata.filing_date;
  object["section_type"] = metadata.section_type;
  object["quality_score"] = metadata.quality_score;
  for (const auto& [key, value] : metadata.extra) {
    object[key] = value;
  }
  return object;
}

json ResultToJson(const vectors::SearchResult& result) {
  json object;
  object["chunk_id"] = result.chunk_id;
  object["text"] = result.text;
  object["combined_score"] = result.combined_score;
  object["semantic_score"] = result.semantic_score;
  object["keyword_score"] = result.keyword_score;
  object["metadata"] = MetadataToJson(result.metadata);
  return object;
}

json ChunkToJson(const vectors::Chunk& chunk) {
  json object;
  object["id"] = chunk.id;
  object["text"] = chunk.text;
  object["metadata"] = MetadataToJson(chunk.metadata);
  return object;
}

json ContextToJson(const query::QueryContext& context) {
  json object;
  object["tickers"] = context.tickers;
  object["time_periods"] = {{"years", context.time_periods.years},
                            {"quarters", context.time_periods.quarters},
                            {"relative_terms", context.time_periods.relative_terms}};
  object["filing_types"] = context.filing_types;
  object["concepts"] = context.concepts;
  object["comparison_cue"] = context.comparison_cue;
  object["comparison_intent"] = context.comparison_intent;
  object["original_query"] = context.original_query;
  return object;
}

json DecisionToJson(const query::RoutingDecision& decision) {
  json object;
  object["query_type"] = query::QueryTypeToString(decision.type);
  object["strategy"] = retrieval::StrategyToString(decision.strategy);
  object["complexity"] = query::ComplexityToString(decision.complexity);
  object["hints"] = {{"approach", decision.hints.approach},
                     {"synthesis_method", decision.hints.synthesis_method},
                     {"context_window", decision.hints.context_window}};
  object["context"] = ContextToJson(decision.context);
  return object;
}

json RetrievalToJson(const retrieval::RetrievalResult& result) {
  json object;
  object["status"] = vectors::SearchStatusToString(result.status);
  object["strategy"] = retrieval::StrategyToString(result.strategy);
  object["broadened"] = result.broadened;
  object["degraded"] = result.degraded;
  object["count"] = result.results.size();
  object["per_ticker_counts"] = result.per_ticker_counts;

  json results = json::array();
  for (const auto& hit : result.results) {
    results.push_back(ResultToJson(hit));
  }
  object["results"] = std::move(results);
  return object;
}

json RoutedQueryToJson(const query::RoutedQuery& routed) {
  json object = RetrievalToJson(routed.retrieval);
  object["routing"] = DecisionToJson(routed.decision);
  return object;
}

json SearchResponseToJson(const vectors::SearchResponse& response) {
  json object;
  object["status"] = vectors::SearchStatusToString(response.status);
  object["count"] = response.results.size();
  object["candidate_count"] = response.candidate_count;
  object["degraded"] = response.degraded;

  json results = json::array();
  for (const auto& hit : response.results) {
    results.push_back(ResultToJson(hit));
  }
  object["results"] = std::move(results);
  return object;
}

json StatisticsToJson(const vectors::CollectionStatistics& stats) {
  json object;
  object["total_chunks"] = stats.total_chunks;
  object["embeddings_count"] = stats.embeddings_count;
  object["tickers"] = stats.tickers;
  object["filing_types"] = stats.filing_types;
  object["sectors"] = stats.sectors;
  object["date_range"] = {{"earliest", stats.earliest_date}, {"latest", stats.latest_date}};
  object["words"] = {{"total", stats.total_words},
                     {"avg_per_chunk", stats.avg_words_per_chunk},
                     {"min", stats.min_words},
                     {"max", stats.max_words}};
  object["active_method"] = stats.active_method;
  object["dimension"] = stats.dimension;
  object["memory_bytes"] = stats.memory_bytes;
  return object;
}

Expected<vectors::MetadataFilter, Error> ParseFilter(const json& filter) {
  vectors::MetadataFilter parsed;
  if (filter.is_null()) {
    return parsed;
  }
  if (!filter.is_object()) {
    return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "filter must be an object"));
  }
  for (auto iter = filter.begin(); iter != filter.end(); ++iter) {
    const auto& value = iter.value();
    auto& values = parsed[iter.key()];
    if (value.is_string()) {
      values.push_back(value.get<std::string>());
      continue;
    }
    if (!value.is_array()) {
      return MakeUnexpected(
          MakeError(ErrorCode::kInvalidArgument, "filter." + iter.key() + " must be a string or an array of strings"));
    }
    for (const auto& item : value) {
      if (!item.is_string()) {
        return MakeUnexpected(MakeError(ErrorCode::kInvalidArgument, "filter." + iter.key() + " must hold strings"));
      }
      values.push_back(item.get<std::string>());
    }
  }
  return parsed;
}

}  // namespace finrag::server
