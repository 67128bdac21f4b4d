#include "normalization/field_extractor.h"
#include "normalization/text_normalizer.h"
#include "utils/string_utils.h"
#include <regex>
#include <unordered_map>
#include <utility>
#include <vector>

namespace {

// Token prefixes of a normalized name that imply a category.
const std::vector<std::pair<std::string, std::string>> &categoryKeywords() {
  static const std::vector<std::pair<std::string, std::string>> keywords = {
      {"болт", "Крепеж"},
      {"гайк", "Крепеж"},
      {"винт", "Крепеж"},
      {"шуруп", "Крепеж"},
      {"саморез", "Крепеж"},
      {"шайб", "Крепеж"},
      {"гвозд", "Крепеж"},
      {"bolt", "Крепеж"},
      {"screw", "Крепеж"},
      {"кабел", "Кабельная продукция"},
      {"провод", "Кабельная продукция"},
      {"cable", "Кабельная продукция"},
      {"wire", "Кабельная продукция"},
      {"труб", "Трубопроводная арматура"},
      {"фитинг", "Трубопроводная арматура"},
      {"задвижк", "Трубопроводная арматура"},
      {"краск", "Лакокрасочные материалы"},
      {"эмал", "Лакокрасочные материалы"},
      {"грунтовк", "Лакокрасочные материалы"},
      {"бумаг", "Канцелярские товары"},
      {"ручк", "Канцелярские товары"},
      {"карандаш", "Канцелярские товары"},
      {"папк", "Канцелярские товары"},
      {"перчатк", "Средства защиты"},
      {"респиратор", "Средства защиты"},
      {"каск", "Средства защиты"}};
  return keywords;
}

// Whole-token legal forms marking a counterparty rather than an item.
const std::vector<std::string> &legalForms() {
  static const std::vector<std::string> forms = {
      "ооо", "оао", "зао", "пао", "ао", "ип", "llc", "ltd", "inc", "gmbh"};
  return forms;
}

const std::unordered_map<std::string, std::string> &unitAliases() {
  static const std::unordered_map<std::string, std::string> units = {
      {"шт", "шт"},     {"штук", "шт"},   {"pcs", "шт"},   {"кг", "кг"},
      {"kg", "кг"},     {"гр", "г"},      {"тн", "т"},     {"л", "л"},
      {"мл", "мл"},     {"м", "м"},       {"мм", "мм"},    {"см", "см"},
      {"м2", "м2"},     {"м3", "м3"},     {"уп", "уп"},    {"упак", "уп"},
      {"компл", "компл"}, {"кмп", "компл"}, {"пара", "пара"}, {"рул", "рул"}};
  return units;
}

std::string jsonScalarToString(const nlohmann::json &value) {
  if (value.is_string())
    return value.get<std::string>();
  if (value.is_number_integer())
    return std::to_string(value.get<int64_t>());
  if (value.is_number_unsigned())
    return std::to_string(value.get<uint64_t>());
  return "";
}

int checkDigit(const std::string &digits, const std::vector<int> &weights) {
  int sum = 0;
  for (size_t i = 0; i < weights.size(); ++i) {
    sum += (digits[i] - '0') * weights[i];
  }
  int check = sum % 11;
  return check == 10 ? 0 : check;
}

} // namespace

std::string FieldExtractor::cleanIdentifier(const std::string &value) {
  std::string cleaned;
  cleaned.reserve(value.size());
  for (char c : value) {
    if (c != ' ' && c != '-' && c != '\t')
      cleaned.push_back(c);
  }
  return cleaned;
}

bool FieldExtractor::isValidInn(const std::string &inn) {
  std::string digits = cleanIdentifier(inn);
  if (!StringUtils::isDigits(digits))
    return false;

  if (digits.size() == 10) {
    return checkDigit(digits, {2, 4, 10, 3, 5, 9, 4, 6, 8}) == digits[9] - '0';
  }
  if (digits.size() == 12) {
    if (checkDigit(digits, {7, 2, 4, 10, 3, 5, 9, 4, 6, 8}) != digits[10] - '0')
      return false;
    return checkDigit(digits, {3, 7, 2, 4, 10, 3, 5, 9, 4, 6, 8}) ==
           digits[11] - '0';
  }
  return false;
}

bool FieldExtractor::isValidKpp(const std::string &kpp) {
  std::string digits = cleanIdentifier(kpp);
  return digits.size() == 9 && StringUtils::isDigits(digits);
}

std::string FieldExtractor::guessCategory(const std::string &normalizedName) {
  std::vector<std::string> tokens = TextNormalizer::tokenize(normalizedName);
  for (const auto &token : tokens) {
    for (const auto &form : legalForms()) {
      if (token == form)
        return "Контрагенты";
    }
  }
  for (const auto &token : tokens) {
    for (const auto &keyword : categoryKeywords()) {
      if (StringUtils::startsWith(token, keyword.first))
        return keyword.second;
    }
  }
  return "";
}

std::string FieldExtractor::detectUnit(const std::string &normalizedName) {
  std::vector<std::string> tokens = TextNormalizer::tokenize(normalizedName);
  // The unit usually trails the name ("Кабель ВВГ 3х2.5, 100 м").
  for (auto it = tokens.rbegin(); it != tokens.rend(); ++it) {
    auto found = unitAliases().find(*it);
    if (found != unitAliases().end())
      return found->second;
  }
  return "";
}

std::string FieldExtractor::findInText(const std::string &lowerText,
                                       const std::string &pattern) {
  std::smatch match;
  std::regex re(pattern);
  if (std::regex_search(lowerText, match, re) && match.size() > 1) {
    return match[1].str();
  }
  return "";
}

std::string
FieldExtractor::lookupKey(const nlohmann::json &object,
                          std::initializer_list<const char *> keys) {
  for (const char *key : keys) {
    auto it = object.find(key);
    if (it != object.end()) {
      std::string value = StringUtils::trim(jsonScalarToString(*it));
      if (!value.empty())
        return value;
    }
  }
  return "";
}

ExtractedFields FieldExtractor::extract(const std::string &normalizedName,
                                        const std::string &payload) {
  ExtractedFields fields;

  nlohmann::json parsed;
  bool isObject = false;
  if (!StringUtils::trim(payload).empty()) {
    try {
      parsed = nlohmann::json::parse(payload);
      isObject = parsed.is_object();
    } catch (const nlohmann::json::parse_error &) {
      parsed = payload;
    }
  }
  fields.payload = isObject ? parsed : nlohmann::json(payload);

  if (isObject) {
    fields.inn = cleanIdentifier(lookupKey(parsed, {"inn", "INN", "ИНН", "tax_id"}));
    fields.kpp = cleanIdentifier(lookupKey(parsed, {"kpp", "KPP", "КПП"}));
    fields.unit = lookupKey(parsed, {"unit", "unit_of_measure", "ед_изм",
                                     "ЕдиницаИзмерения"});
    fields.category = lookupKey(parsed, {"category", "group", "Категория",
                                         "Группа"});
    if (!fields.category.empty())
      fields.categorySource = "payload";
  } else if (!payload.empty()) {
    std::string lower = StringUtils::utf8ToLower(payload);
    fields.inn = findInText(lower, "(?:инн|inn)[\\s:]*(\\d{10,12})");
    fields.kpp = findInText(lower, "(?:кпп|kpp)[\\s:]*(\\d{9})");
  }

  if (fields.unit.empty()) {
    fields.unit = detectUnit(normalizedName);
  }
  if (fields.category.empty()) {
    fields.category = guessCategory(normalizedName);
    if (!fields.category.empty())
      fields.categorySource = "keyword";
  }
  return fields;
}
