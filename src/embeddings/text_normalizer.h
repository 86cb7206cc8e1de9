/**
 * @file text_normalizer.h
 * @brief Tokenizer used by the fallback embedding path
 */

#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace finrag::embeddings {

/**
 * @brief Lowercasing tokenizer tuned for filing text
 *
 * Steps:
 *   1. Lowercase.
 *   2. Replace every character outside [a-z0-9_ . $ % -] and whitespace by a space.
 *   3. Split on whitespace and strip leading/trailing '.' and '-' from each token.
 *   4. Drop tokens shorter than min_token_length unless they are in the
 *      short-token allow-list ("$", "%", "us", "eps", ...).
 *
 * Numbers, currency and percentages survive, so "$4.2" and "12%" are tokens.
 */
class TextNormalizer {
 public:
  explicit TextNormalizer(uint32_t min_token_length = 2);

  std::vector<std::string> Tokenize(std::string_view text) const;

  /**
   * @brief Short financial tokens kept regardless of length
   */
  static bool IsAllowListed(std::string_view token);

  uint32_t MinTokenLength() const { return min_token_length_; }

 private:
  uint32_t min_token_length_;
};

}  // namespace finrag::embeddings
