#include "normalization/text_normalizer.h"
#include "utils/string_utils.h"
#include <unordered_set>

namespace {
const std::unordered_set<std::string> &stopWords() {
  static const std::unordered_set<std::string> words = {
      "и",   "в",   "на", "с",   "для", "по",  "из",  "к",    "от",
      "о",   "а",   "но", "или", "the", "a",   "an",  "and",  "or",
      "in",  "on",  "at", "to",  "for", "of",  "with", "by",  "from"};
  return words;
}

bool isTokenChar(char32_t cp) {
  return StringUtils::isLetterCodePoint(cp) || (cp >= U'0' && cp <= U'9');
}
} // namespace

char32_t TextNormalizer::canonicalPunctuation(char32_t cp) {
  switch (cp) {
  case 0x201C: // left double quotation mark
  case 0x201D:
  case 0x00AB: // guillemets
  case 0x00BB:
  case 0x201E:
    return U'"';
  case 0x2018:
  case 0x2019:
  case 0x201A:
    return U'\'';
  case 0x2014: // em dash
  case 0x2013: // en dash
  case 0x2212: // minus sign
    return U'-';
  default:
    return cp;
  }
}

char32_t TextNormalizer::stripDiacritic(char32_t cp) {
  if (cp < 0x00C0 || cp > 0x00FF) {
    return cp;
  }
  // Latin-1 supplement, indexed from U+00C0.
  static const char32_t table[] = {
      U'A', U'A', U'A', U'A', U'A', U'A', 0x00C6, U'C', U'E', U'E', U'E',
      U'E', U'I', U'I', U'I', U'I', 0x00D0, U'N', U'O', U'O', U'O', U'O',
      U'O', 0x00D7, 0x00D8, U'U', U'U', U'U', U'U', U'Y', 0x00DE, 0x00DF,
      U'a', U'a', U'a', U'a', U'a', U'a', 0x00E6, U'c', U'e', U'e', U'e',
      U'e', U'i', U'i', U'i', U'i', 0x00F0, U'n', U'o', U'o', U'o', U'o',
      U'o', 0x00F7, 0x00F8, U'u', U'u', U'u', U'u', U'y', 0x00FE, U'y'};
  return table[cp - 0x00C0];
}

std::string TextNormalizer::cleanName(std::string_view raw) {
  std::u32string cps = StringUtils::decodeUtf8(StringUtils::collapseWhitespace(raw));
  for (char32_t &cp : cps) {
    cp = canonicalPunctuation(cp);
  }
  return StringUtils::encodeUtf8(cps);
}

std::string TextNormalizer::normalizeName(std::string_view raw) {
  std::u32string cps = StringUtils::decodeUtf8(cleanName(raw));
  for (char32_t &cp : cps) {
    cp = StringUtils::toLowerCodePoint(stripDiacritic(cp));
  }
  return StringUtils::encodeUtf8(cps);
}

std::string TextNormalizer::normalizeCode(std::string_view raw) {
  std::u32string cps = StringUtils::decodeUtf8(StringUtils::trim(raw));
  std::u32string out;
  out.reserve(cps.size());
  for (char32_t cp : cps) {
    char32_t up = StringUtils::toUpperCodePoint(cp);
    bool keep = (up >= U'A' && up <= U'Z') || (up >= U'0' && up <= U'9') ||
                (up >= 0x0410 && up <= 0x042F) || up == 0x0401 ||
                up == U'.' || up == U'_' || up == U'/' || up == U'-';
    if (keep) {
      out.push_back(up);
    }
  }
  return StringUtils::encodeUtf8(out);
}

std::vector<std::string> TextNormalizer::tokenize(std::string_view normalized,
                                                  bool removeStopWords) {
  std::vector<std::string> tokens;
  std::u32string cps = StringUtils::decodeUtf8(normalized);
  std::u32string current;

  auto flush = [&]() {
    if (current.empty())
      return;
    std::string token = StringUtils::encodeUtf8(current);
    current.clear();
    if (removeStopWords && isStopWord(token))
      return;
    tokens.push_back(std::move(token));
  };

  for (char32_t cp : cps) {
    if (isTokenChar(cp)) {
      current.push_back(StringUtils::toLowerCodePoint(cp));
    } else {
      flush();
    }
  }
  flush();
  return tokens;
}

bool TextNormalizer::isStopWord(const std::string &token) {
  return stopWords().count(token) > 0;
}
