/**
 * @file retrieval_engine.cpp
 * @brief Retrieval strategies
 */

#include "retrieval/retrieval_engine.h"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <tuple>

#include "query/entity_extractors.h"
#include "utils/string_utils.h"
#include "utils/structured_log.h"

namespace finrag::retrieval {

using utils::Error;
using utils::Expected;
using utils::MakeUnexpected;
using vectors::SearchOptions;
using vectors::SearchStatus;

const char* StrategyToString(Strategy strategy) {
  switch (strategy) {
    case Strategy::kFiltered:
      return "filtered";
    case Strategy::kMultiEntityBalanced:
      return "multi_entity_balanced";
    case Strategy::kTemporal:
      return "temporal";
    case Strategy::kGeneral:
      return "general";
  }
  return "unknown";
}

RetrievalEngine::RetrievalEngine(vectors::VectorStore& store, const config::RetrievalConfig& config)
    : store_(store), config_(config) {}

size_t RetrievalEngine::PerEntityQuota(size_t budget, size_t entity_count, size_t min_per_entity) {
  if (entity_count == 0) {
    return budget;
  }
  return std::max(min_per_entity, budget / entity_count);
}

std::pair<std::string, std::string> RetrievalEngine::DateRange(const query::TimePeriods& periods) {
  if (periods.years.empty()) {
    return {};
  }
  const std::string first_year = std::to_string(periods.years.front());
  const std::string last_year = std::to_string(periods.years.back());
  std::string from = first_year + "-01-01";
  std::string to = last_year + "-12-31";

  if (periods.years.size() == 1 && !periods.quarters.empty()) {
    static const char* kQuarterStart[] = {"-01-01", "-04-01", "-07-01", "-10-01"};
    static const char* kQuarterEnd[] = {"-03-31", "-06-30", "-09-30", "-12-31"};
    // quarters are sorted "Q1".."Q4"
    const int first_quarter = periods.quarters.front().back() - '1';
    const int last_quarter = periods.quarters.back().back() - '1';
    if (first_quarter >= 0 && last_quarter <= 3) {
      from = first_year + kQuarterStart[first_quarter];
      to = first_year + kQuarterEnd[last_quarter];
    }
  }
  return {from, to};
}

Expected<void, Error> RetrievalEngine::Collect(const embeddings::Embedding& query_vector,
                                               const std::string& query_text, const SearchOptions& options,
                                               RetrievalResult& result) {
  auto response = store_.Search(query_vector, query_text, options);
  if (!response) {
    return MakeUnexpected(response.error());
  }
  if (response->status == SearchStatus::kNoData) {
    result.status = SearchStatus::kNoData;
  }
  result.degraded = result.degraded || response->degraded;
  std::move(response->results.begin(), response->results.end(), std::back_inserter(result.results));
  return {};
}

// ============================================================================
// Strategies
// ============================================================================

Expected<void, Error> RetrievalEngine::RunFiltered(const embeddings::Embedding& query_vector,
                                                   const std::string& query_text, const query::QueryContext& context,
                                                   RetrievalResult& result) {
  SearchOptions options;
  options.top_k = config_.single_entity_budget;
  if (!context.tickers.empty()) {
    options.filter["ticker"] = context.tickers;
  }
  if (!context.filing_types.empty()) {
    options.filter["filing_type"] = context.filing_types;
  }
  std::tie(options.date_from, options.date_to) = DateRange(context.time_periods);
  return Collect(query_vector, query_text, options, result);
}

Expected<void, Error> RetrievalEngine::RunMultiEntity(const embeddings::Embedding& query_vector,
                                                      const std::string& query_text,
                                                      const query::QueryContext& context, RetrievalResult& result) {
  if (context.tickers.empty()) {
    return RunGeneral(query_vector, query_text, context, result);
  }

  const size_t quota = PerEntityQuota(config_.multi_entity_budget, context.tickers.size(), config_.min_per_entity);
  const auto [date_from, date_to] = DateRange(context.time_periods);

  for (const auto& ticker : context.tickers) {
    SearchOptions options;
    options.top_k = quota;
    options.filter["ticker"] = {ticker};
    if (!context.filing_types.empty()) {
      options.filter["filing_type"] = context.filing_types;
    }
    options.date_from = date_from;
    options.date_to = date_to;

    auto collected = Collect(query_vector, query_text, options, result);
    if (!collected) {
      return collected;
    }
    if (result.status == SearchStatus::kNoData) {
      break;
    }
  }
  return {};
}

Expected<void, Error> RetrievalEngine::RunTemporal(const embeddings::Embedding& query_vector,
                                                   const std::string& query_text, const query::QueryContext& context,
                                                   RetrievalResult& result) {
  SearchOptions options;
  options.top_k = config_.temporal_budget;
  if (context.tickers.size() == 1) {
    options.filter["ticker"] = context.tickers;
  }
  std::tie(options.date_from, options.date_to) = DateRange(context.time_periods);
  return Collect(query_vector, query_text, options, result);
}

Expected<void, Error> RetrievalEngine::RunGeneral(const embeddings::Embedding& query_vector,
                                                  const std::string& query_text, const query::QueryContext& context,
                                                  RetrievalResult& result) {
  SearchOptions options;
  options.top_k = config_.general_budget;
  if (!context.concepts.empty()) {
    options.top_k = config_.concept_budget;
    for (const auto& concept_id : context.concepts) {
      auto keywords = query::ConceptExtractor::KeywordsFor(concept_id);
      options.extra_keywords.insert(options.extra_keywords.end(), keywords.begin(), keywords.end());
    }
  }
  return Collect(query_vector, query_text, options, result);
}

// ============================================================================
// Section search
// ============================================================================

Expected<RetrievalResult, Error> RetrievalEngine::SearchBySection(const embeddings::Embedding& query_vector,
                                                                  const std::string& query_text,
                                                                  const std::vector<std::string>& section_keywords,
                                                                  size_t top_k) {
  // Candidates are over-fetched since the keyword check drops some
  constexpr size_t kCandidateFactor = 3;

  std::vector<std::string> keywords;
  for (const auto& keyword : section_keywords) {
    std::string lowered = utils::ToLower(utils::Trim(keyword));
    if (!lowered.empty()) {
      keywords.push_back(std::move(lowered));
    }
  }
  if (keywords.empty()) {
    return MakeUnexpected(utils::MakeError(utils::ErrorCode::kInvalidArgument, "No section keywords given"));
  }

  RetrievalResult result;
  result.strategy = Strategy::kGeneral;
  result.status = SearchStatus::kOk;

  SearchOptions options;
  options.top_k = std::max(top_k, static_cast<size_t>(config_.general_budget)) * kCandidateFactor;
  options.extra_keywords = keywords;
  auto collected = Collect(query_vector, query_text, options, result);
  if (!collected) {
    return MakeUnexpected(collected.error());
  }

  auto mentions_section = [&keywords](const vectors::SearchResult& hit) {
    const std::string text = utils::ToLower(hit.text);
    return std::any_of(keywords.begin(), keywords.end(),
                       [&text](const std::string& keyword) { return text.find(keyword) != std::string::npos; });
  };
  result.results.erase(std::remove_if(result.results.begin(), result.results.end(),
                                      [&](const vectors::SearchResult& hit) { return !mentions_section(hit); }),
                       result.results.end());
  if (result.results.size() > top_k) {
    result.results.resize(top_k);
  }

  if (result.status != SearchStatus::kNoData && result.results.empty()) {
    result.status = SearchStatus::kNoMatches;
  }
  for (const auto& hit : result.results) {
    ++result.per_ticker_counts[hit.metadata.ticker];
  }
  return result;
}

// ============================================================================
// Entry point
// ============================================================================

Expected<RetrievalResult, Error> RetrievalEngine::Retrieve(const embeddings::Embedding& query_vector,
                                                           const std::string& query_text,
                                                           const query::QueryContext& context, Strategy strategy) {
  const auto start = std::chrono::steady_clock::now();

  auto run = [&](Strategy which, RetrievalResult& out) -> Expected<void, Error> {
    out.strategy = which;
    out.status = SearchStatus::kOk;
    switch (which) {
      case Strategy::kFiltered:
        return RunFiltered(query_vector, query_text, context, out);
      case Strategy::kMultiEntityBalanced:
        return RunMultiEntity(query_vector, query_text, context, out);
      case Strategy::kTemporal:
        return RunTemporal(query_vector, query_text, context, out);
      case Strategy::kGeneral:
        return RunGeneral(query_vector, query_text, context, out);
    }
    return {};
  };

  RetrievalResult result;
  auto ran = run(strategy, result);
  if (!ran) {
    return MakeUnexpected(ran.error());
  }
  if (result.status != SearchStatus::kNoData && result.results.empty()) {
    result.status = SearchStatus::kNoMatches;
  }

  if (result.status == SearchStatus::kNoMatches && strategy != Strategy::kGeneral && config_.broaden_on_empty) {
    RetrievalResult broad;
    auto broad_ran = run(Strategy::kGeneral, broad);
    if (!broad_ran) {
      return MakeUnexpected(broad_ran.error());
    }
    if (!broad.results.empty()) {
      broad.strategy = strategy;
      broad.broadened = true;
      result = std::move(broad);
    }
  }

  for (const auto& hit : result.results) {
    ++result.per_ticker_counts[hit.metadata.ticker];
  }

  const double latency_ms =
      std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - start).count();
  utils::LogRetrieval(StrategyToString(result.strategy), result.results.size(), result.broadened, latency_ms);
  return result;
}

}  // namespace finrag::retrieval
