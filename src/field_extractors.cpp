#include "field_extractors.hpp"

#include "pharma_patterns.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

#include <spdlog/spdlog.h>

namespace {

constexpr size_t kMaxSupplierNameLength = 120;
constexpr size_t kSupplierHeaderLines = 10;
constexpr size_t kInvoiceTokenLines = 5;

const char* const kMonthAbbrev[] = {"jan", "feb", "mar", "apr", "may", "jun",
                                    "jul", "aug", "sep", "oct", "nov", "dec"};
const char* const kMonthNames[] = {"january", "february", "march",     "april",   "may",      "june",
                                   "july",    "august",   "september", "october", "november", "december"};

const std::vector<std::string>& supplierSuffixes() {
  static const std::vector<std::string> suffixes = {
    "pvt ltd", "private limited", "ltd", "limited", "pharmaceuticals",
    "pharma", "healthcare", "labs", "laboratories",
  };
  return suffixes;
}

const std::vector<std::regex>& datePatterns() {
  static const std::vector<std::regex> patterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    return std::vector<std::regex>{
      std::regex(R"(\b(\d{1,2}[\-/.]?\d{1,2}[\-/.]?\d{4})\b)", flags),
      std::regex(R"(\b(\d{4}[\-/.]?\d{1,2}[\-/.]?\d{1,2})\b)", flags),
      std::regex(R"(\b(\d{1,2}\s+(Jan|Feb|Mar|Apr|May|Jun|Jul|Aug|Sep|Oct|Nov|Dec)\s+\d{4})\b)", flags),
      std::regex(R"(\b(\d{1,2}\s+(January|February|March|April|May|June|July|August|September|October|November|December)\s+\d{4})\b)",
                 flags),
    };
  }();
  return patterns;
}

const std::vector<std::string>& dateFormats() {
  static const std::vector<std::string> formats = {
    "%d/%m/%Y", "%d-%m-%Y", "%d.%m.%Y",
    "%Y-%m-%d", "%Y/%m/%d", "%Y.%m.%d",
    "%d %b %Y", "%d %B %Y",
  };
  return formats;
}

// Label-driven invoice number shapes, tried after the catalogue.
const std::vector<std::regex>& labelledInvoicePatterns() {
  static const std::vector<std::regex> patterns = [] {
    const auto flags = std::regex::ECMAScript | std::regex::icase;
    return std::vector<std::regex>{
      std::regex(R"(\b(?:invoice|bill)\s*(?:no|number|#)\.?[\s:]*([A-Za-z0-9\-/]+))", flags),
      std::regex(R"(\b(?:inv|bill)\b\.?[\s:]*([A-Za-z0-9\-/]+))", flags),
      std::regex(R"(\b(INV[A-Za-z0-9\-/]+)\b)", flags),
      std::regex(R"(\b([A-Z]{2,4}\d{3,8})\b)", flags),
    };
  }();
  return patterns;
}

bool hasDigit(const std::string& s) {
  return std::any_of(s.begin(), s.end(), [](unsigned char c) { return std::isdigit(c); });
}

bool readNumber(const std::string& text, size_t& pos, size_t maxDigits, int& out) {
  size_t start = pos;
  int value = 0;
  while (pos < text.size() && pos - start < maxDigits &&
         std::isdigit(static_cast<unsigned char>(text[pos]))) {
    value = value * 10 + (text[pos] - '0');
    ++pos;
  }
  if (pos == start) return false;
  out = value;
  return true;
}

bool readMonthName(const std::string& text, size_t& pos, bool fullName, int& out) {
  const char* const* names = fullName ? kMonthNames : kMonthAbbrev;
  for (int i = 0; i < 12; ++i) {
    std::string name = names[i];
    if (pos + name.size() > text.size()) continue;
    if (toLower(text.substr(pos, name.size())) == name) {
      pos += name.size();
      out = i + 1;
      return true;
    }
  }
  return false;
}

} // namespace

const std::vector<std::string>& pharmaKeywords() {
  static const std::vector<std::string> keywords = {
    "tablet", "capsule", "syrup", "injection", "drops", "cream", "ointment",
    "powder", "suspension", "lotion", "gel", "inhaler", "strip", "vial",
    "ampoule", "bottle", "tube", "pack", "box", "mg", "ml", "gm", "mcg",
  };
  return keywords;
}

int countPharmaKeywords(const std::string& text) {
  const std::string lowered = toLower(text);
  int count = 0;
  for (const auto& kw : pharmaKeywords()) {
    if (lowered.find(kw) != std::string::npos) ++count;
  }
  return count;
}

std::optional<Date> parseDate(const std::string& text, const std::string& format) {
  int year = -1, month = -1, day = -1;
  size_t pos = 0;

  for (size_t f = 0; f < format.size(); ++f) {
    char fc = format[f];
    if (fc == '%' && f + 1 < format.size()) {
      char directive = format[++f];
      bool ok = false;
      switch (directive) {
        case 'd': ok = readNumber(text, pos, 2, day); break;
        case 'm': ok = readNumber(text, pos, 2, month); break;
        case 'Y': {
          size_t start = pos;
          ok = readNumber(text, pos, 4, year) && pos - start == 4;
          break;
        }
        case 'b': ok = readMonthName(text, pos, false, month); break;
        case 'B': ok = readMonthName(text, pos, true, month); break;
        default: return std::nullopt;
      }
      if (!ok) return std::nullopt;
    } else if (std::isspace(static_cast<unsigned char>(fc))) {
      size_t start = pos;
      while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos]))) ++pos;
      if (pos == start) return std::nullopt;
    } else {
      if (pos >= text.size() || text[pos] != fc) return std::nullopt;
      ++pos;
    }
  }

  if (pos != text.size()) return std::nullopt;
  if (!isValidCalendarDate(year, month, day)) return std::nullopt;
  return Date{year, month, day};
}

FieldResult<std::string> findSupplier(const std::string& text) {
  PatternMatcher matcher;
  const double companyConfidence = matcher.isPharmaCompany(text).second;
  const auto& companyPatterns = compiledPatterns(PatternCategory::Company);

  FieldResult<std::string> fallback;
  const auto lines = splitLines(text);
  const size_t limit = std::min(lines.size(), kSupplierHeaderLines);

  for (size_t i = 0; i < limit; ++i) {
    const std::string line = trim(lines[i]);
    if (line.size() < 3) continue;
    const std::string lowered = toLower(line);
    const std::string name = utf8Prefix(line, kMaxSupplierNameLength);

    for (const auto& re : companyPatterns) {
      if (std::regex_search(line, re)) {
        double bonus = lowered.find("pharmaceuticals") != std::string::npos ? 0.05 : 0.0;
        return FieldResult<std::string>{name, 0.9 + bonus};
      }
    }

    double density = static_cast<double>(countPharmaKeywords(line)) / pharmaKeywords().size();
    if (density > 0.1 && line.size() > 10) {
      return FieldResult<std::string>{name, std::min(0.8, density * 3) + companyConfidence * 0.2};
    }

    for (const auto& suffix : supplierSuffixes()) {
      if (lowered.find(suffix) != std::string::npos) {
        return FieldResult<std::string>{name, 0.75 + companyConfidence * 0.2};
      }
    }

    if (!fallback.value && line.size() > 15) {
      fallback = FieldResult<std::string>{name, 0.3 + companyConfidence * 0.1};
    }
  }
  return fallback;
}

double validateGstin(const std::string& candidate) {
  if (candidate.size() != 15) return 0.0;
  bool lettersOk = std::all_of(candidate.begin() + 2, candidate.begin() + 7,
                               [](unsigned char c) { return std::isalpha(c); });
  bool digitsOk = std::all_of(candidate.begin() + 7, candidate.begin() + 11,
                              [](unsigned char c) { return std::isdigit(c); });
  return lettersOk && digitsOk ? 0.9 : 0.6;
}

FieldResult<std::string> findGstin(const std::string& text) {
  std::smatch m;
  if (!std::regex_search(text, m, gstinRegex())) return {};
  std::string gstin = toUpper(m.str(0));
  return FieldResult<std::string>{gstin, validateGstin(gstin)};
}

FieldResult<std::string> findInvoiceNumber(const std::string& text) {
  for (const auto& re : compiledPatterns(PatternCategory::InvoiceNumber)) {
    auto matches = findAllMatches(re, text);
    if (!matches.empty()) {
      std::string number = trim(matches.front());
      if (number.size() >= 3) return FieldResult<std::string>{number, 0.9};
    }
  }

  for (const auto& re : labelledInvoicePatterns()) {
    for (const auto& match : findAllMatches(re, text)) {
      std::string number = trim(match);
      if (number.size() >= 3 && hasDigit(number)) return FieldResult<std::string>{number, 0.7};
    }
  }

  static const std::regex token(R"([A-Z0-9]{3,})");
  const auto lines = splitLines(text);
  const size_t limit = std::min(lines.size(), kInvoiceTokenLines);
  for (size_t i = 0; i < limit; ++i) {
    if (toLower(lines[i]).find("invoice") == std::string::npos) continue;
    for (const auto& candidate : findAllMatches(token, lines[i])) {
      if (toUpper(candidate) != "INVOICE") return FieldResult<std::string>{candidate, 0.5};
    }
  }

  spdlog::debug("no invoice number found");
  return {};
}

FieldResult<Date> findInvoiceDate(const std::string& text) {
  const auto& patterns = datePatterns();
  for (size_t i = 0; i < patterns.size(); ++i) {
    for (const auto& candidate : findAllMatches(patterns[i], text)) {
      for (const auto& format : dateFormats()) {
        if (auto date = parseDate(candidate, format)) {
          return FieldResult<Date>{*date, 0.9 - 0.1 * static_cast<double>(i)};
        }
      }
    }
  }
  return {};
}

FieldResult<std::string> findDrugLicense(const std::string& text) {
  PatternMatcher matcher;
  auto licenses = matcher.extractDrugLicenses(text);
  if (licenses.empty()) return {};
  auto best = std::max_element(licenses.begin(), licenses.end(),
                               [](const PatternMatch& a, const PatternMatch& b) {
                                 return a.confidence < b.confidence;
                               });
  return FieldResult<std::string>{trim(best->text), best->confidence};
}
