#include "quality/string_similarity.h"
#include "utils/string_utils.h"
#include <algorithm>
#include <map>
#include <set>

namespace {
const char *translitOf(char32_t cp) {
  static const char *const table[] = {
      "a", "b",  "v",  "g",  "d",    "e", "zh", "z", "i", "y", "k",
      "l", "m",  "n",  "o",  "p",    "r", "s",  "t", "u", "f", "kh",
      "ts", "ch", "sh", "shch", "", "y", "",   "e", "yu", "ya"};
  if (cp >= 0x0430 && cp <= 0x044F)
    return table[cp - 0x0430];
  if (cp == 0x0451)
    return "e";
  return nullptr;
}

char soundexDigit(char c) {
  switch (c) {
  case 'b':
  case 'f':
  case 'p':
  case 'v':
    return '1';
  case 'c':
  case 'g':
  case 'j':
  case 'k':
  case 'q':
  case 's':
  case 'x':
  case 'z':
    return '2';
  case 'd':
  case 't':
    return '3';
  case 'l':
    return '4';
  case 'm':
  case 'n':
    return '5';
  case 'r':
    return '6';
  default:
    return '0';
  }
}

std::map<std::u32string, int> bigrams(const std::u32string &s) {
  std::map<std::u32string, int> grams;
  for (size_t i = 0; i + 1 < s.size(); ++i) {
    grams[s.substr(i, 2)]++;
  }
  return grams;
}
} // namespace

size_t StringSimilarity::levenshteinDistance(std::string_view a,
                                             std::string_view b) {
  std::u32string s = StringUtils::decodeUtf8(a);
  std::u32string t = StringUtils::decodeUtf8(b);
  if (s.empty())
    return t.size();
  if (t.empty())
    return s.size();

  std::vector<size_t> prev(t.size() + 1);
  std::vector<size_t> curr(t.size() + 1);
  for (size_t j = 0; j <= t.size(); ++j)
    prev[j] = j;

  for (size_t i = 1; i <= s.size(); ++i) {
    curr[0] = i;
    for (size_t j = 1; j <= t.size(); ++j) {
      size_t cost = s[i - 1] == t[j - 1] ? 0 : 1;
      curr[j] = std::min({prev[j] + 1, curr[j - 1] + 1, prev[j - 1] + cost});
    }
    std::swap(prev, curr);
  }
  return prev[t.size()];
}

double StringSimilarity::levenshteinSimilarity(std::string_view a,
                                               std::string_view b) {
  size_t maxLen = std::max(StringUtils::utf8Length(a), StringUtils::utf8Length(b));
  if (maxLen == 0)
    return 0.0;
  return 1.0 - static_cast<double>(levenshteinDistance(a, b)) /
                   static_cast<double>(maxLen);
}

double StringSimilarity::bigramDice(std::string_view a, std::string_view b) {
  std::u32string s = StringUtils::decodeUtf8(a);
  std::u32string t = StringUtils::decodeUtf8(b);
  if (s.empty() || t.empty())
    return 0.0;
  if (s.size() < 2 || t.size() < 2)
    return s == t ? 1.0 : 0.0;

  auto first = bigrams(s);
  auto second = bigrams(t);
  int common = 0;
  for (const auto &entry : first) {
    auto it = second.find(entry.first);
    if (it != second.end())
      common += std::min(entry.second, it->second);
  }
  double total = static_cast<double>((s.size() - 1) + (t.size() - 1));
  return 2.0 * common / total;
}

double StringSimilarity::combinedSimilarity(std::string_view a,
                                            std::string_view b) {
  return 0.5 * levenshteinSimilarity(a, b) + 0.5 * bigramDice(a, b);
}

double StringSimilarity::jaccard(const std::vector<std::string> &a,
                                 const std::vector<std::string> &b) {
  std::set<std::string> left(a.begin(), a.end());
  std::set<std::string> right(b.begin(), b.end());
  if (left.empty() && right.empty())
    return 0.0;

  size_t common = 0;
  for (const auto &token : left) {
    if (right.count(token))
      ++common;
  }
  size_t unionSize = left.size() + right.size() - common;
  return static_cast<double>(common) / static_cast<double>(unionSize);
}

std::string StringSimilarity::transliterate(std::string_view word) {
  std::string out;
  for (char32_t cp : StringUtils::decodeUtf8(word)) {
    char32_t lower = StringUtils::toLowerCodePoint(cp);
    if (const char *latin = translitOf(lower)) {
      out += latin;
    } else if (lower < 0x80) {
      out.push_back(static_cast<char>(lower));
    }
  }
  return StringUtils::toLower(out);
}

std::string StringSimilarity::soundex(std::string_view word) {
  if (StringUtils::isDigits(word))
    return std::string(word);

  std::string latin;
  for (char c : transliterate(word)) {
    if (c >= 'a' && c <= 'z')
      latin.push_back(c);
  }
  if (latin.empty())
    return "";

  std::string code(1, static_cast<char>(latin[0] - 'a' + 'A'));
  char last = soundexDigit(latin[0]);
  for (size_t i = 1; i < latin.size() && code.size() < 4; ++i) {
    char c = latin[i];
    char digit = soundexDigit(c);
    if (digit != '0' && digit != last) {
      code.push_back(digit);
    }
    // h and w do not separate consonants with the same code.
    if (c != 'h' && c != 'w')
      last = digit;
  }
  code.resize(4, '0');
  return code;
}

std::string
StringSimilarity::phoneticKey(const std::vector<std::string> &tokens) {
  std::vector<std::string> codes;
  for (const auto &token : tokens) {
    if (StringUtils::utf8Length(token) < 3)
      continue;
    std::string code = soundex(token);
    if (!code.empty())
      codes.push_back(code);
  }
  std::sort(codes.begin(), codes.end());
  std::string key;
  for (const auto &code : codes) {
    if (!key.empty())
      key.push_back(' ');
    key += code;
  }
  return key;
}
