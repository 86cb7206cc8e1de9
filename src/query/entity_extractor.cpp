/**
 * @file entity_extractor.cpp
 * @brief Entity extraction pipeline
 */

#include "query/entity_extractor.h"

#include <algorithm>

namespace finrag::query {

EntityExtractor::EntityExtractor(const config::EntitiesConfig& config)
    : registry_(config.companies),
      tickers_(registry_),
      aliases_(registry_),
      time_periods_(config.min_year, config.max_year) {}

QueryContext EntityExtractor::Extract(const std::string& query) const {
  QueryContext context;
  context.original_query = query;

  auto mentions = tickers_.Extract(query);
  auto alias_mentions = aliases_.Extract(query);
  mentions.insert(mentions.end(), alias_mentions.begin(), alias_mentions.end());
  std::stable_sort(mentions.begin(), mentions.end(),
                   [](const TickerMention& lhs, const TickerMention& rhs) { return lhs.offset < rhs.offset; });
  for (const auto& mention : mentions) {
    if (std::find(context.tickers.begin(), context.tickers.end(), mention.ticker) == context.tickers.end()) {
      context.tickers.push_back(mention.ticker);
    }
  }

  context.time_periods = time_periods_.Extract(query);
  context.filing_types = filing_types_.Extract(query);
  context.concepts = concepts_.Extract(query);
  context.comparison_cue = comparison_.HasCue(query);
  context.comparison_intent = context.comparison_cue && context.tickers.size() >= 2;
  return context;
}

}  // namespace finrag::query
