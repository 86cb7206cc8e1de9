/**
 * @file entity_extractor.h
 * @brief Raw query -> QueryContext
 */

#pragma once

#include <string>

#include "config/config.h"
#include "query/company_registry.h"
#include "query/entity_extractors.h"
#include "query/query_context.h"

namespace finrag::query {

/**
 * @brief Runs every extractor over a query and assembles the context
 *
 * Tickers from symbols and from company names are merged and ordered by
 * their first mention. Stateless after construction; Extract may run
 * concurrently.
 *
 * Example:
 * @code
 * EntityExtractor extractor(config.entities);
 * auto context = extractor.Extract("Compare Apple and Microsoft revenue in 2023");
 * // context.tickers == {"AAPL", "MSFT"}, context.time_periods.years == {2023}
 * @endcode
 */
class EntityExtractor {
 public:
  explicit EntityExtractor(const config::EntitiesConfig& config = {});

  // Extractors hold references into registry_
  EntityExtractor(const EntityExtractor&) = delete;
  EntityExtractor& operator=(const EntityExtractor&) = delete;

  QueryContext Extract(const std::string& query) const;

  const CompanyRegistry& Registry() const { return registry_; }

 private:
  CompanyRegistry registry_;
  TickerExtractor tickers_;
  AliasExtractor aliases_;
  TimePeriodExtractor time_periods_;
  FilingTypeExtractor filing_types_;
  ConceptExtractor concepts_;
  ComparisonDetector comparison_;
};

}  // namespace finrag::query
