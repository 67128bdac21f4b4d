#ifndef STRING_SIMILARITY_H
#define STRING_SIMILARITY_H

#include <string>
#include <string_view>
#include <vector>

// Similarity measures over UTF-8 strings. Every *Similarity function returns a
// value in [0, 1]; two empty inputs are not considered similar.
class StringSimilarity {
public:
  // Edit distance in code points.
  static size_t levenshteinDistance(std::string_view a, std::string_view b);
  static double levenshteinSimilarity(std::string_view a, std::string_view b);

  // Dice coefficient of character bigram multisets.
  static double bigramDice(std::string_view a, std::string_view b);

  // Mean of the Levenshtein and bigram measures.
  static double combinedSimilarity(std::string_view a, std::string_view b);

  // Jaccard index of two token sets.
  static double jaccard(const std::vector<std::string> &a,
                        const std::vector<std::string> &b);

  // Four-character Soundex code of one word. Cyrillic is transliterated to
  // Latin first so that "Сименс" and "Siemens" share a code. Words made only
  // of digits are returned unchanged; empty input yields an empty code.
  static std::string soundex(std::string_view word);

  // Space-joined, sorted Soundex codes of all tokens of at least three
  // characters. Empty when the name has no such token.
  static std::string phoneticKey(const std::vector<std::string> &tokens);

  static std::string transliterate(std::string_view word);
};

#endif
