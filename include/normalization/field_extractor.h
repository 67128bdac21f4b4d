#ifndef FIELD_EXTRACTOR_H
#define FIELD_EXTRACTOR_H

#include <initializer_list>
#include <nlohmann/json.hpp>
#include <string>

struct ExtractedFields {
  std::string inn;
  std::string kpp;
  std::string unit;
  std::string category;
  // "payload", "keyword" or empty when no category was found.
  std::string categorySource;
  // The payload as parsed JSON, or the raw text as a JSON string.
  nlohmann::json payload;
};

// Pulls domain fields out of an item's raw payload. The payload is either a
// JSON object (keys such as "inn", "ИНН", "unit") or free text such as
// "ИНН: 7707083893 КПП 773601001". Missing fields stay empty; nothing here
// throws for malformed input.
class FieldExtractor {
public:
  static ExtractedFields extract(const std::string &normalizedName,
                                 const std::string &payload);

  // 10 or 12 digits with valid check digits.
  static bool isValidInn(const std::string &inn);
  static bool isValidKpp(const std::string &kpp);

  // Category implied by keywords of a normalized name, empty if none.
  static std::string guessCategory(const std::string &normalizedName);
  // Unit of measure mentioned as a separate token of the name, empty if none.
  static std::string detectUnit(const std::string &normalizedName);

  // Removes spaces and dashes.
  static std::string cleanIdentifier(const std::string &value);

private:
  static std::string findInText(const std::string &lowerText,
                                const std::string &pattern);
  static std::string lookupKey(const nlohmann::json &object,
                               std::initializer_list<const char *> keys);
};

#endif
