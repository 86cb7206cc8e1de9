/**
 * @file keyword_scorer.cpp
 * @brief Lexical overlap scoring between a query and a chunk
 */

#include "vectors/keyword_scorer.h"

#include <algorithm>
#include <array>
#include <cctype>

#include "utils/string_utils.h"

namespace finrag::vectors {

namespace {

constexpr size_t kMinKeywordLength = 3;

constexpr std::array<std::string_view, 19> kStopwords = {"the", "a",   "an",   "and",  "or",   "but", "in",
                                                         "on",  "at",  "to",   "for",  "of",   "with", "by",
                                                         "what", "how", "when", "where", "why"};

}  // namespace

bool KeywordScorer::IsStopword(std::string_view word) {
  return std::find(kStopwords.begin(), kStopwords.end(), word) != kStopwords.end();
}

std::vector<std::string> KeywordScorer::Tokenize(std::string_view text) {
  std::vector<std::string> tokens;
  std::string current;
  for (char chr : text) {
    auto uchr = static_cast<unsigned char>(chr);
    if (std::isalnum(uchr) != 0) {
      current.push_back(static_cast<char>(std::tolower(uchr)));
    } else if (!current.empty()) {
      tokens.push_back(std::move(current));
      current.clear();
    }
  }
  if (!current.empty()) {
    tokens.push_back(std::move(current));
  }
  return tokens;
}

std::vector<std::string> KeywordScorer::ExtractKeywords(std::string_view query) {
  std::vector<std::string> keywords;
  std::unordered_set<std::string> seen;
  for (auto& token : Tokenize(query)) {
    if (token.size() < kMinKeywordLength || IsStopword(token)) {
      continue;
    }
    if (seen.insert(token).second) {
      keywords.push_back(std::move(token));
    }
  }
  return keywords;
}

ChunkTerms KeywordScorer::Analyze(std::string_view text) {
  ChunkTerms terms;
  terms.lowered = utils::ToLower(text);
  for (auto& token : Tokenize(text)) {
    terms.tokens.insert(std::move(token));
  }
  return terms;
}

double KeywordScorer::Score(const std::vector<std::string>& keywords, const ChunkTerms& terms) {
  if (keywords.empty()) {
    return 0.0;
  }
  double total = 0.0;
  for (const auto& keyword : keywords) {
    if (terms.tokens.count(keyword) > 0) {
      total += kExactMatch;
    } else if (terms.lowered.find(keyword) != std::string::npos) {
      total += kPartialMatch;
    }
  }
  return total / static_cast<double>(keywords.size());
}

}  // namespace finrag::vectors
