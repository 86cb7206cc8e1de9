/**
 * @file entity_extractors.cpp
 * @brief Ticker, alias, time period, filing type, concept and comparison extraction
 */

#include "query/entity_extractors.h"

#include <algorithm>
#include <cctype>
#include <set>
#include <unordered_set>

#include "utils/string_utils.h"

namespace finrag::query {

namespace {

std::string EscapeRegex(const std::string& text) {
  static const std::string kSpecial = R"(\^$.|?*+()[]{}-)";
  std::string out;
  for (char chr : text) {
    if (kSpecial.find(chr) != std::string::npos) {
      out += '\\';
    }
    out += chr;
  }
  return out;
}

bool IsTokenChar(char chr) {
  return std::isalnum(static_cast<unsigned char>(chr)) != 0 || chr == '-' || chr == '&';
}

/**
 * @brief Lowercased token ending right before `end` (punctuation stripped)
 */
std::string PreviousToken(const std::string& text, size_t end) {
  size_t pos = end;
  while (pos > 0 && !IsTokenChar(text[pos - 1])) {
    --pos;
  }
  size_t stop = pos;
  while (pos > 0 && IsTokenChar(text[pos - 1])) {
    --pos;
  }
  return utils::ToLower(text.substr(pos, stop - pos));
}

/**
 * @brief Lowercased token starting after `begin`, skipping a possessive "'s"
 */
std::string NextToken(const std::string& text, size_t begin) {
  size_t pos = begin;
  if (text.compare(pos, 2, "'s") == 0) {
    pos += 2;
  }
  while (pos < text.size() && !IsTokenChar(text[pos])) {
    ++pos;
  }
  size_t start = pos;
  while (pos < text.size() && IsTokenChar(text[pos])) {
    ++pos;
  }
  return utils::ToLower(text.substr(start, pos - start));
}

void AddUnique(std::vector<std::string>& values, const std::string& value) {
  if (std::find(values.begin(), values.end(), value) == values.end()) {
    values.push_back(value);
  }
}

}  // namespace

// ============================================================================
// TickerExtractor
// ============================================================================

TickerExtractor::TickerExtractor(const CompanyRegistry& registry) : registry_(registry) {
  for (const auto& company : registry_.Companies()) {
    patterns_.emplace_back(company.ticker, std::regex("\\b" + EscapeRegex(company.ticker) + "\\b"));
  }
}

bool TickerExtractor::IsCueWord(std::string_view word) {
  static const std::unordered_set<std::string_view> kCueWords = {
      "stock",  "stocks", "share",   "shares",      "shareholders", "ticker", "company", "inc",
      "corp",   "co",     "filing",  "filings",     "10-k",         "10-q",   "8-k",     "proxy",
      "nyse",   "nasdaq", "equity",  "corporation",
  };
  return kCueWords.count(word) > 0;
}

bool TickerExtractor::IsCommonWord(std::string_view ticker) {
  static const std::unordered_set<std::string_view> kCommonWords = {
      "A",   "AN",  "AS",  "AT",  "BA",  "BE",  "BY",  "DO",  "GE",  "GO",  "HE",  "IF",  "IN",
      "IS",  "IT",  "ME",  "MY",  "NO",  "OF",  "ON",  "OR",  "SO",  "TO",  "UP",  "US",  "WE",
      "ALL", "ARE", "CAN", "CAT", "FOR", "HAS", "KEY", "NEW", "NOW", "ONE", "OUT", "SEE", "TWO",
  };
  return kCommonWords.count(ticker) > 0;
}

bool TickerExtractor::HasCompanyCue(const std::string& query, const std::string& lowered, const std::string& ticker,
                                    size_t offset) const {
  // "$BA"
  if (offset > 0 && query[offset - 1] == '$') {
    return true;
  }
  // "NYSE:BA" or "NYSE: BA"
  size_t colon = offset;
  while (colon > 0 && query[colon - 1] == ' ') {
    --colon;
  }
  if (colon > 0 && query[colon - 1] == ':') {
    const std::string exchange = PreviousToken(query, colon - 1);
    if (exchange == "nyse" || exchange == "nasdaq") {
      return true;
    }
  }

  const std::string previous = PreviousToken(query, offset);
  const std::string next = NextToken(query, offset + ticker.size());
  if (IsCueWord(previous) || IsCueWord(next)) {
    return true;
  }
  // "Compare GE and ...", "BA versus ..."
  const auto& comparison = ComparisonDetector::Lexicon();
  if (std::find(comparison.begin(), comparison.end(), previous) != comparison.end() ||
      std::find(comparison.begin(), comparison.end(), next) != comparison.end()) {
    return true;
  }

  for (const auto& [alias, alias_ticker] : registry_.Aliases()) {
    if (alias_ticker == ticker && utils::ContainsWholeWord(lowered, alias)) {
      return true;
    }
  }
  return false;
}

std::vector<TickerMention> TickerExtractor::Extract(const std::string& query) const {
  std::vector<TickerMention> mentions;
  const std::string lowered = utils::ToLower(query);

  for (const auto& [ticker, pattern] : patterns_) {
    const bool guarded = ticker.size() <= 2 || IsCommonWord(ticker);
    for (auto iter = std::sregex_iterator(query.begin(), query.end(), pattern); iter != std::sregex_iterator();
         ++iter) {
      const auto offset = static_cast<size_t>(iter->position(0));
      if (!guarded || HasCompanyCue(query, lowered, ticker, offset)) {
        mentions.push_back({ticker, offset});
        break;
      }
    }
  }
  return mentions;
}

// ============================================================================
// AliasExtractor
// ============================================================================

std::vector<TickerMention> AliasExtractor::Extract(const std::string& query) const {
  const std::string lowered = utils::ToLower(query);
  std::vector<TickerMention> mentions;

  for (const auto& [alias, ticker] : registry_.Aliases()) {
    const size_t offset = utils::FindWholeWord(lowered, alias);
    if (offset == std::string::npos) {
      continue;
    }
    auto existing = std::find_if(mentions.begin(), mentions.end(),
                                 [&ticker = ticker](const TickerMention& mention) { return mention.ticker == ticker; });
    if (existing == mentions.end()) {
      mentions.push_back({ticker, offset});
    } else {
      existing->offset = std::min(existing->offset, offset);
    }
  }
  return mentions;
}

// ============================================================================
// TimePeriodExtractor
// ============================================================================

TimePeriodExtractor::TimePeriodExtractor(int min_year, int max_year)
    : min_year_(min_year),
      max_year_(max_year),
      year_pattern_(R"(\b(\d{4})\b)"),
      quarter_prefix_pattern_(R"(\b[Qq]([1-4])\b)"),
      quarter_suffix_pattern_(R"(\b([1-4])[Qq]\b)"),
      quarter_word_pattern_(R"(\b(first|second|third|fourth|1st|2nd|3rd|4th)\s+quarter\b)",
                            std::regex_constants::ECMAScript | std::regex_constants::icase) {}

const std::vector<std::string>& TimePeriodExtractor::RelativeTerms() {
  static const std::vector<std::string> kTerms = {
      "recent", "latest", "current", "last year", "this year", "over time", "historical", "trend", "evolution",
  };
  return kTerms;
}

TimePeriods TimePeriodExtractor::Extract(const std::string& query) const {
  TimePeriods periods;

  std::set<int> years;
  for (auto iter = std::sregex_iterator(query.begin(), query.end(), year_pattern_); iter != std::sregex_iterator();
       ++iter) {
    const int year = std::stoi((*iter)[1].str());
    if (year >= min_year_ && year <= max_year_) {
      years.insert(year);
    }
  }
  periods.years.assign(years.begin(), years.end());

  std::set<int> quarters;
  for (const auto* pattern : {&quarter_prefix_pattern_, &quarter_suffix_pattern_}) {
    for (auto iter = std::sregex_iterator(query.begin(), query.end(), *pattern); iter != std::sregex_iterator();
         ++iter) {
      quarters.insert(std::stoi((*iter)[1].str()));
    }
  }
  for (auto iter = std::sregex_iterator(query.begin(), query.end(), quarter_word_pattern_);
       iter != std::sregex_iterator(); ++iter) {
    const std::string ordinal = utils::ToLower((*iter)[1].str());
    if (ordinal == "first" || ordinal == "1st") {
      quarters.insert(1);
    } else if (ordinal == "second" || ordinal == "2nd") {
      quarters.insert(2);
    } else if (ordinal == "third" || ordinal == "3rd") {
      quarters.insert(3);
    } else {
      quarters.insert(4);
    }
  }
  for (int quarter : quarters) {
    periods.quarters.push_back("Q" + std::to_string(quarter));
  }

  const std::string lowered = utils::ToLower(query);
  for (const auto& term : RelativeTerms()) {
    for (size_t offset = utils::FindWholeWord(lowered, term); offset != std::string::npos;
         offset = utils::FindWholeWord(lowered, term, offset + 1)) {
      if (!IsNonTemporalUse(term, NextToken(lowered, offset + term.size()))) {
        periods.relative_terms.push_back(term);
        break;
      }
    }
  }
  return periods;
}

bool TimePeriodExtractor::IsNonTemporalUse(std::string_view term, std::string_view next_token) {
  // "current assets", "current report" (8-K)
  static const std::unordered_set<std::string_view> kAfterCurrent = {
      "asset", "assets", "liabilities", "liability", "report", "reports", "ratio", "portion",
  };
  return term == "current" && kAfterCurrent.count(next_token) > 0;
}

// ============================================================================
// FilingTypeExtractor
// ============================================================================

FilingTypeExtractor::FilingTypeExtractor() {
  const std::vector<std::string> insider = {"3", "4", "5"};
  patterns_.emplace_back(std::regex(R"(\b10-?k\b)"), std::vector<std::string>{"10-K"});
  patterns_.emplace_back(std::regex(R"(\bannual reports?\b)"), std::vector<std::string>{"10-K"});
  patterns_.emplace_back(std::regex(R"(\b10-?q\b)"), std::vector<std::string>{"10-Q"});
  patterns_.emplace_back(std::regex(R"(\bquarterly reports?\b)"), std::vector<std::string>{"10-Q"});
  patterns_.emplace_back(std::regex(R"(\b8-?k\b)"), std::vector<std::string>{"8-K"});
  patterns_.emplace_back(std::regex(R"(\bcurrent reports?\b)"), std::vector<std::string>{"8-K"});
  patterns_.emplace_back(std::regex(R"(\bproxy\b)"), std::vector<std::string>{"DEF 14A"});
  patterns_.emplace_back(std::regex(R"(\bdef\s*14a\b)"), std::vector<std::string>{"DEF 14A"});
  patterns_.emplace_back(std::regex(R"(\binsider trading\b)"), insider);
  patterns_.emplace_back(std::regex(R"(\bforms? [345]\b)"), insider);
}

std::vector<std::string> FilingTypeExtractor::Extract(const std::string& query) const {
  static const std::vector<std::string> kCanonicalOrder = {"10-K", "10-Q", "8-K", "DEF 14A", "3", "4", "5"};

  const std::string lowered = utils::ToLower(query);
  std::set<std::string> found;
  for (const auto& [pattern, types] : patterns_) {
    if (std::regex_search(lowered, pattern)) {
      found.insert(types.begin(), types.end());
    }
  }

  std::vector<std::string> filing_types;
  for (const auto& type : kCanonicalOrder) {
    if (found.count(type) > 0) {
      filing_types.push_back(type);
    }
  }
  return filing_types;
}

// ============================================================================
// ConceptExtractor
// ============================================================================

const ConceptExtractor::Lexicon& ConceptExtractor::Concepts() {
  static const Lexicon kConcepts = {
      {"revenue", {"revenue", "revenues", "sales", "income", "earnings"}},
      {"expenses", {"expenses", "costs", "spending"}},
      {"profit", {"profit", "profitability", "net income", "earnings", "margin"}},
      {"cash_flow", {"cash flow", "operating cash", "free cash flow"}},
      {"debt", {"debt", "liabilities", "borrowing"}},
      {"assets", {"assets", "balance sheet"}},
      {"risk_factors", {"risk", "risks", "risk factors"}},
      {"competition", {"competition", "competitive", "competitors"}},
      {"r&d", {"r&d", "research", "development", "innovation"}},
      {"acquisitions", {"acquisition", "acquisitions", "merger", "m&a"}},
      {"executive_compensation", {"compensation", "executive pay", "salary"}},
      {"working_capital", {"working capital", "current assets"}},
      {"climate", {"climate", "environmental", "sustainability"}},
      {"ai_automation", {"ai", "artificial intelligence", "automation", "technology"}},
  };
  return kConcepts;
}

std::vector<std::string> ConceptExtractor::KeywordsFor(const std::string& concept_id) {
  for (const auto& [id, keywords] : Concepts()) {
    if (id == concept_id) {
      return keywords;
    }
  }
  return {};
}

std::vector<std::string> ConceptExtractor::Extract(const std::string& query) const {
  const std::string lowered = utils::ToLower(query);
  std::vector<std::string> concepts;
  for (const auto& [id, keywords] : Concepts()) {
    for (const auto& keyword : keywords) {
      if (utils::ContainsWholeWord(lowered, keyword)) {
        AddUnique(concepts, id);
        break;
      }
    }
  }
  return concepts;
}

// ============================================================================
// ComparisonDetector
// ============================================================================

const std::vector<std::string>& ComparisonDetector::Lexicon() {
  static const std::vector<std::string> kWords = {
      "compare", "compared", "comparing", "comparison", "versus",     "vs",
      "against", "difference", "differences", "similar",  "contrast", "between",
  };
  return kWords;
}

bool ComparisonDetector::HasCue(const std::string& query) const {
  const std::string lowered = utils::ToLower(query);
  return std::any_of(Lexicon().begin(), Lexicon().end(),
                     [&lowered](const std::string& word) { return utils::ContainsWholeWord(lowered, word); });
}

}  // namespace finrag::query
