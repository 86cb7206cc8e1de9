/**
 * @file response_json.h
 * @brief JSON shapes shared by the HTTP API and the CLI
 */

#pragma once

#include <nlohmann/json.hpp>

#include "query/query_router.h"
#include "retrieval/retrieval_engine.h"
#include "utils/error.h"
#include "utils/expected.h"
#include "vectors/chunk.h"
#include "vectors/metadata_index.h"
#include "vectors/vector_store.h"

namespace finrag::server {

nlohmann::json MetadataToJson(const vectors::ChunkMetadata& metadata);

/**
 * @brief Citation-ready result: chunk id, text, scores and filing metadata
 */
nlohmann::json ResultToJson(const vectors::SearchResult& result);

nlohmann::json ChunkToJson(const vectors::Chunk& chunk);

nlohmann::json ContextToJson(const query::QueryContext& context);

nlohmann::json DecisionToJson(const query::RoutingDecision& decision);

nlohmann::json RetrievalToJson(const retrieval::RetrievalResult& result);

nlohmann::json RoutedQueryToJson(const query::RoutedQuery& routed);

nlohmann::json SearchResponseToJson(const vectors::SearchResponse& response);

nlohmann::json StatisticsToJson(const vectors::CollectionStatistics& stats);

/**
 * @brief Parse a metadata filter object
 *
 * Each value is a string or an array of strings:
 * @code
 * {"ticker": ["AAPL", "MSFT"], "filing_type": "10-K"}
 * @endcode
 *
 * @return kInvalidArgument when the shape is wrong
 */
utils::Expected<vectors::MetadataFilter, utils::Error> ParseFilter(const nlohmann::json& filter);

}  // namespace finrag::server
