/**
 * @file string_utils.cpp
 * @brief ASCII string helpers
 */

#include "utils/string_utils.h"

#include <cctype>

namespace finrag::utils {

namespace {

bool IsSpace(char chr) {
  return std::isspace(static_cast<unsigned char>(chr)) != 0;
}

bool IsWordChar(char chr) {
  return std::isalnum(static_cast<unsigned char>(chr)) != 0;
}

}  // namespace

std::string ToLower(std::string_view text) {
  std::string out(text);
  for (auto& chr : out) {
    chr = static_cast<char>(std::tolower(static_cast<unsigned char>(chr)));
  }
  return out;
}

std::string Trim(std::string_view text) {
  size_t begin = 0;
  size_t end = text.size();
  while (begin < end && IsSpace(text[begin])) {
    ++begin;
  }
  while (end > begin && IsSpace(text[end - 1])) {
    --end;
  }
  return std::string(text.substr(begin, end - begin));
}

std::vector<std::string> SplitWhitespace(std::string_view text) {
  std::vector<std::string> pieces;
  size_t pos = 0;
  while (pos < text.size()) {
    while (pos < text.size() && IsSpace(text[pos])) {
      ++pos;
    }
    size_t start = pos;
    while (pos < text.size() && !IsSpace(text[pos])) {
      ++pos;
    }
    if (pos > start) {
      pieces.emplace_back(text.substr(start, pos - start));
    }
  }
  return pieces;
}

bool IsBlank(std::string_view text) {
  for (char chr : text) {
    if (!IsSpace(chr)) {
      return false;
    }
  }
  return true;
}

size_t FindWholeWord(std::string_view text, std::string_view word, size_t from) {
  if (word.empty()) {
    return std::string_view::npos;
  }
  size_t pos = text.find(word, from);
  while (pos != std::string_view::npos) {
    const size_t end = pos + word.size();
    const bool left_ok = pos == 0 || !IsWordChar(text[pos - 1]) || !IsWordChar(word.front());
    const bool right_ok = end == text.size() || !IsWordChar(text[end]) || !IsWordChar(word.back());
    if (left_ok && right_ok) {
      return pos;
    }
    pos = text.find(word, pos + 1);
  }
  return std::string_view::npos;
}

}  // namespace finrag::utils
