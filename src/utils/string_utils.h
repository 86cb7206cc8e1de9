/**
 * @file string_utils.h
 * @brief ASCII string helpers shared by the text pipelines
 */

#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace finrag::utils {

/**
 * @brief Lowercase ASCII letters, leave other bytes unchanged
 */
std::string ToLower(std::string_view text);

/**
 * @brief Strip leading and trailing ASCII whitespace
 */
std::string Trim(std::string_view text);

/**
 * @brief Split on runs of ASCII whitespace, dropping empty pieces
 */
std::vector<std::string> SplitWhitespace(std::string_view text);

/**
 * @brief True when text is empty or only whitespace
 */
bool IsBlank(std::string_view text);

/**
 * @brief Offset of `word` in `text` where it is not flanked by ASCII letters or digits
 *
 * Matching is case-sensitive; lowercase both sides for case-insensitive use.
 * Returns std::string_view::npos when there is no whole-word occurrence.
 */
size_t FindWholeWord(std::string_view text, std::string_view word, size_t from = 0);

inline bool ContainsWholeWord(std::string_view text, std::string_view word) {
  return FindWholeWord(text, word) != std::string_view::npos;
}

}  // namespace finrag::utils
