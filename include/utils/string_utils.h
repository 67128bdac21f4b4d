#ifndef STRING_UTILS_H
#define STRING_UTILS_H

#include <algorithm>
#include <cctype>
#include <string>
#include <string_view>

namespace StringUtils {

inline std::string toLower(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return result;
}

inline std::string toUpper(std::string_view str) {
  std::string result{str};
  std::transform(result.begin(), result.end(), result.begin(),
                 [](unsigned char c) { return std::toupper(c); });
  return result;
}

inline std::string trim(std::string_view str) {
  const auto start = std::find_if_not(
      str.begin(), str.end(), [](unsigned char c) { return std::isspace(c); });

  const auto end =
      std::find_if_not(str.rbegin(), str.rend(), [](unsigned char c) {
        return std::isspace(c);
      }).base();

  return (start < end) ? std::string(start, end) : std::string{};
}

inline bool startsWith(std::string_view str, std::string_view prefix) {
  return str.size() >= prefix.size() &&
         str.compare(0, prefix.size(), prefix) == 0;
}

inline bool isDigits(std::string_view str) {
  return !str.empty() &&
         std::all_of(str.begin(), str.end(),
                     [](unsigned char c) { return std::isdigit(c); });
}

// Catalog names mix Latin and Cyrillic text, so the helpers below work on
// Unicode code points. Invalid UTF-8 bytes decode to U+FFFD.
std::u32string decodeUtf8(std::string_view str);
std::string encodeUtf8(std::u32string_view str);
size_t utf8Length(std::string_view str);

// Case mapping for ASCII and the basic Cyrillic block (including Ё/ё).
char32_t toLowerCodePoint(char32_t cp);
char32_t toUpperCodePoint(char32_t cp);
bool isLetterCodePoint(char32_t cp);
bool isSpaceCodePoint(char32_t cp);

std::string utf8ToLower(std::string_view str);

// Trims and replaces every run of whitespace with a single ASCII space.
std::string collapseWhitespace(std::string_view str);

} // namespace StringUtils

#endif
