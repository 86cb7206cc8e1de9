/**
 * @file query_context.h
 * @brief Structured entities extracted from a raw query
 */

#pragma once

#include <string>
#include <vector>

namespace finrag::query {

/**
 * @brief Time references found in a query
 *
 * Relative terms ("recent", "last year") are kept as written; resolving them
 * to dates is left to the caller.
 */
struct TimePeriods {
  std::vector<int> years;                   ///< Ascending, distinct
  std::vector<std::string> quarters;        ///< "Q1".."Q4", ascending, distinct
  std::vector<std::string> relative_terms;  ///< Lexicon order

  bool Empty() const { return years.empty() && quarters.empty() && relative_terms.empty(); }
};

/**
 * @brief Per-request query understanding, never persisted
 */
struct QueryContext {
  std::vector<std::string> tickers;  ///< Distinct, in order of first mention
  TimePeriods time_periods;
  std::vector<std::string> filing_types;  ///< Canonical form codes
  std::vector<std::string> concepts;      ///< Concept ids, lexicon order
  bool comparison_cue = false;            ///< A comparison word occurs in the query
  bool comparison_intent = false;         ///< comparison_cue and at least two tickers
  std::string original_query;
};

}  // namespace finrag::query
