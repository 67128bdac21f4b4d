#include "utils/string_utils.h"

namespace StringUtils {

namespace {
constexpr char32_t REPLACEMENT_CHAR = 0xFFFD;
}

std::u32string decodeUtf8(std::string_view str) {
  std::u32string out;
  out.reserve(str.size());

  size_t i = 0;
  while (i < str.size()) {
    unsigned char c = static_cast<unsigned char>(str[i]);
    size_t length = 0;
    char32_t cp = 0;
    if (c < 0x80) {
      length = 1;
      cp = c;
    } else if ((c & 0xE0) == 0xC0) {
      length = 2;
      cp = c & 0x1F;
    } else if ((c & 0xF0) == 0xE0) {
      length = 3;
      cp = c & 0x0F;
    } else if ((c & 0xF8) == 0xF0) {
      length = 4;
      cp = c & 0x07;
    }

    bool valid = length > 0 && i + length <= str.size();
    for (size_t k = 1; valid && k < length; ++k) {
      unsigned char cc = static_cast<unsigned char>(str[i + k]);
      valid = (cc & 0xC0) == 0x80;
      cp = (cp << 6) | (cc & 0x3F);
    }

    if (valid) {
      out.push_back(cp);
      i += length;
    } else {
      out.push_back(REPLACEMENT_CHAR);
      ++i;
    }
  }
  return out;
}

std::string encodeUtf8(std::u32string_view str) {
  std::string out;
  out.reserve(str.size());
  for (char32_t cp : str) {
    if (cp < 0x80) {
      out.push_back(static_cast<char>(cp));
    } else if (cp < 0x800) {
      out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else if (cp < 0x10000) {
      out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    } else {
      out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
      out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
    }
  }
  return out;
}

size_t utf8Length(std::string_view str) {
  size_t count = 0;
  for (unsigned char c : str) {
    if ((c & 0xC0) != 0x80) {
      ++count;
    }
  }
  return count;
}

char32_t toLowerCodePoint(char32_t cp) {
  if (cp >= U'A' && cp <= U'Z')
    return cp + 32;
  if (cp >= 0x0410 && cp <= 0x042F)
    return cp + 32;
  if (cp >= 0x0400 && cp <= 0x040F)
    return cp + 80;
  return cp;
}

char32_t toUpperCodePoint(char32_t cp) {
  if (cp >= U'a' && cp <= U'z')
    return cp - 32;
  if (cp >= 0x0430 && cp <= 0x044F)
    return cp - 32;
  if (cp >= 0x0450 && cp <= 0x045F)
    return cp - 80;
  return cp;
}

bool isLetterCodePoint(char32_t cp) {
  return (cp >= U'a' && cp <= U'z') || (cp >= U'A' && cp <= U'Z') ||
         (cp >= 0x0400 && cp <= 0x045F);
}

bool isSpaceCodePoint(char32_t cp) {
  return cp == U' ' || cp == U'\t' || cp == U'\n' || cp == U'\r' ||
         cp == U'\v' || cp == U'\f' || cp == 0x00A0 || cp == 0x2007 ||
         cp == 0x202F;
}

std::string utf8ToLower(std::string_view str) {
  std::u32string cps = decodeUtf8(str);
  for (char32_t &cp : cps) {
    cp = toLowerCodePoint(cp);
  }
  return encodeUtf8(cps);
}

std::string collapseWhitespace(std::string_view str) {
  std::u32string cps = decodeUtf8(str);
  std::u32string out;
  out.reserve(cps.size());
  bool pendingSpace = false;
  for (char32_t cp : cps) {
    if (isSpaceCodePoint(cp)) {
      pendingSpace = !out.empty();
      continue;
    }
    if (pendingSpace) {
      out.push_back(U' ');
      pendingSpace = false;
    }
    out.push_back(cp);
  }
  return encodeUtf8(out);
}

} // namespace StringUtils
