#pragma once

#include <cstddef>
#include <regex>
#include <string>
#include <utility>
#include <vector>

// Catalogue of regular expressions used to recognise pharmaceutical invoice
// content (Indian suppliers). Patterns are ordered most-specific-first within
// each category and compiled once on first use; everything here is read-only
// afterwards and safe to share between threads.

extern const char* const kPatternLibraryVersion;

enum class PatternCategory {
  Company,
  DrugName,
  Batch,
  Expiry,
  ManufacturingDate,
  Hsn,
  DrugLicense,
  PackSize,
  Strength,
  Price,
  Tax,
  Discount,
  Address,
  Contact,
  InvoiceNumber,
};

const std::vector<PatternCategory>& allPatternCategories();

// Stable lower-case name, e.g. "drug_name".
const char* categoryName(PatternCategory category);

bool isCaseSensitive(PatternCategory category);

const std::vector<std::string>& patternsFor(PatternCategory category);
const std::vector<std::regex>& compiledPatterns(PatternCategory category);

// Number of patterns in the extraction catalogue. Manufacturing-date patterns
// are looked up on their own and are not counted.
std::size_t getPatternCount();

// GSTIN shape: 2-digit state code, PAN (5 letters, 4 digits, 1 letter),
// entity code, literal 'Z', check character. Upper case only.
const std::regex& gstinRegex();

struct PatternMatch {
  std::string text;
  double confidence;
};

// Group 1 when the pattern has capture groups, the whole match otherwise.
std::vector<std::string> findAllMatches(const std::regex& re, const std::string& text);

class PatternMatcher {
public:
  // (any company pattern matched, fraction of company patterns that matched)
  std::pair<bool, double> isPharmaCompany(const std::string& text) const;

  std::vector<PatternMatch> extractDrugNames(const std::string& text) const;
  std::vector<PatternMatch> extractBatchNumbers(const std::string& text) const;
  std::vector<PatternMatch> extractExpiryDates(const std::string& text) const;
  std::vector<PatternMatch> extractDrugLicenses(const std::string& text) const;

  bool hasStrength(const std::string& text) const;

  // Known pharmaceutical HSN chapter (3003, 3004, 2936, 2937, 2939, 2941).
  std::pair<bool, double> validateHsnPharma(const std::string& hsn) const;
};
