/**
 * @file text_normalizer.cpp
 * @brief Tokenizer used by the fallback embedding path
 */

#include "embeddings/text_normalizer.h"

#include <array>
#include <cctype>

#include "utils/string_utils.h"

namespace finrag::embeddings {

namespace {

constexpr std::array<std::string_view, 9> kShortTokenAllowList = {"$", "%", "us", "uk", "eu", "ai", "ceo", "cfo", "eps"};

bool IsKeptChar(unsigned char chr) {
  return std::isalnum(chr) != 0 || chr == '_' || chr == '.' || chr == '$' || chr == '%' || chr == '-' ||
         std::isspace(chr) != 0;
}

std::string StripEdgePunctuation(const std::string& token) {
  size_t begin = 0;
  size_t end = token.size();
  while (begin < end && (token[begin] == '.' || token[begin] == '-')) {
    ++begin;
  }
  while (end > begin && (token[end - 1] == '.' || token[end - 1] == '-')) {
    --end;
  }
  return token.substr(begin, end - begin);
}

}  // namespace

TextNormalizer::TextNormalizer(uint32_t min_token_length) : min_token_length_(min_token_length) {}

bool TextNormalizer::IsAllowListed(std::string_view token) {
  for (const auto& allowed : kShortTokenAllowList) {
    if (token == allowed) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> TextNormalizer::Tokenize(std::string_view text) const {
  std::string cleaned = utils::ToLower(text);
  for (auto& chr : cleaned) {
    if (!IsKeptChar(static_cast<unsigned char>(chr))) {
      chr = ' ';
    }
  }

  std::vector<std::string> tokens;
  for (const auto& raw : utils::SplitWhitespace(cleaned)) {
    std::string token = StripEdgePunctuation(raw);
    if (token.empty()) {
      continue;
    }
    if (token.size() < min_token_length_ && !IsAllowListed(token)) {
      continue;
    }
    tokens.push_back(std::move(token));
  }
  return tokens;
}

}  // namespace finrag::embeddings
