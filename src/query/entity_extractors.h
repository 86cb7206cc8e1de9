/**
 * @file entity_extractors.h
 * @brief Independent extractors composed by EntityExtractor
 *
 * Each extractor looks at the raw query for one kind of entity and knows
 * nothing about the others.
 */

#pragma once

#include <regex>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "query/company_registry.h"
#include "query/query_context.h"

namespace finrag::query {

/**
 * @brief A ticker found at a byte offset of the query
 */
struct TickerMention {
  std::string ticker;
  size_t offset = 0;
};

/**
 * @brief Uppercase ticker symbols written in the query
 *
 * Matches are case-sensitive and word-bounded, so "ba" or "BAC" never yield
 * BA. Tickers of two letters or fewer, and tickers that spell a common English
 * word ("IT", "CAT", ...), additionally need a company cue: a `$` or
 * `EXCHANGE:` prefix, an adjacent cue word (stock, shares, ticker, company,
 * inc, corp, filing, 10-k, ...), or the company's alias elsewhere in the
 * query. This guard is a best-effort heuristic.
 */
class TickerExtractor {
 public:
  explicit TickerExtractor(const CompanyRegistry& registry);

  std::vector<TickerMention> Extract(const std::string& query) const;

  static bool IsCueWord(std::string_view word);
  static bool IsCommonWord(std::string_view ticker);

 private:
  const CompanyRegistry& registry_;
  std::vector<std::pair<std::string, std::regex>> patterns_;

  bool HasCompanyCue(const std::string& query, const std::string& lowered, const std::string& ticker,
                     size_t offset) const;
};

/**
 * @brief Company names and variants, case-insensitive and whole-word
 */
class AliasExtractor {
 public:
  explicit AliasExtractor(const CompanyRegistry& registry) : registry_(registry) {}

  std::vector<TickerMention> Extract(const std::string& query) const;

 private:
  const CompanyRegistry& registry_;
};

/**
 * @brief Years within a plausible range, quarter notations and relative terms
 */
class TimePeriodExtractor {
 public:
  TimePeriodExtractor(int min_year, int max_year);

  TimePeriods Extract(const std::string& query) const;

  static const std::vector<std::string>& RelativeTerms();

  /**
   * @brief True when a relative term is part of a non-temporal phrase
   */
  static bool IsNonTemporalUse(std::string_view term, std::string_view next_token);

 private:
  int min_year_;
  int max_year_;
  std::regex year_pattern_;
  std::regex quarter_prefix_pattern_;
  std::regex quarter_suffix_pattern_;
  std::regex quarter_word_pattern_;
};

/**
 * @brief Form codes and descriptive synonyms -> canonical filing types
 *
 * "annual report" -> 10-K, "quarterly report" -> 10-Q, "current report" -> 8-K,
 * "proxy" -> DEF 14A, "insider trading" or "form 3/4/5" -> 3, 4, 5.
 */
class FilingTypeExtractor {
 public:
  FilingTypeExtractor();

  std::vector<std::string> Extract(const std::string& query) const;

 private:
  std::vector<std::pair<std::regex, std::vector<std::string>>> patterns_;
};

/**
 * @brief Financial concept lexicon
 */
class ConceptExtractor {
 public:
  using Lexicon = std::vector<std::pair<std::string, std::vector<std::string>>>;

  /**
   * @brief Concept id -> trigger keywords, in reporting order
   */
  static const Lexicon& Concepts();

  /**
   * @brief Trigger keywords of a concept (empty for an unknown id)
   */
  static std::vector<std::string> KeywordsFor(const std::string& concept_id);

  std::vector<std::string> Extract(const std::string& query) const;
};

/**
 * @brief Comparison words ("compare", "versus", "vs", "between", ...)
 */
class ComparisonDetector {
 public:
  static const std::vector<std::string>& Lexicon();

  bool HasCue(const std::string& query) const;
};

}  // namespace finrag::query
