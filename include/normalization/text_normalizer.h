#ifndef TEXT_NORMALIZER_H
#define TEXT_NORMALIZER_H

#include <string>
#include <string_view>
#include <vector>

// Canonicalization of catalog names and codes. All functions are pure and
// UTF-8 aware (Latin and Cyrillic).
class TextNormalizer {
public:
  // Trim, collapse whitespace, unify quotes and dashes. Case is preserved;
  // used for the display form a suggestion proposes.
  static std::string cleanName(std::string_view raw);

  // cleanName() plus lower-casing and removal of Latin diacritics. This is the
  // form stored in normalized_name and compared by the duplicate detector.
  static std::string normalizeName(std::string_view raw);

  // Trim, upper-case, drop inner whitespace and every character outside
  // [A-Z0-9А-ЯЁ._/-].
  static std::string normalizeCode(std::string_view raw);

  // Splits a normalized name into letter/digit tokens. Stop words are removed
  // when requested.
  static std::vector<std::string> tokenize(std::string_view normalized,
                                           bool removeStopWords = false);

  static bool isStopWord(const std::string &token);

private:
  static char32_t canonicalPunctuation(char32_t cp);
  static char32_t stripDiacritic(char32_t cp);
};

#endif
