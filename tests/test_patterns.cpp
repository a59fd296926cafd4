#include <catch2/catch_all.hpp>

#include "pharma_patterns.hpp"

#include <regex>
#include <set>
#include <string>

TEST_CASE("pattern catalogue is complete and compiled", "[patterns]") {
  const auto& categories = allPatternCategories();
  REQUIRE(categories.size() == 15);

  std::size_t total = 0;
  std::set<std::string> names;
  for (PatternCategory category : categories) {
    REQUIRE_FALSE(patternsFor(category).empty());
    REQUIRE(compiledPatterns(category).size() == patternsFor(category).size());
    names.insert(categoryName(category));
    total += patternsFor(category).size();
  }
  REQUIRE(names.size() == categories.size());
  REQUIRE(getPatternCount() == total - patternsFor(PatternCategory::ManufacturingDate).size());
  REQUIRE(std::string(categoryName(PatternCategory::DrugName)) == "drug_name");
  REQUIRE(std::string(kPatternLibraryVersion).size() > 0);
}

TEST_CASE("only HSN patterns are case-sensitive", "[patterns]") {
  for (PatternCategory category : allPatternCategories()) {
    REQUIRE(isCaseSensitive(category) == (category == PatternCategory::Hsn));
  }
}

TEST_CASE("findAllMatches prefers the first capture group", "[patterns]") {
  std::regex grouped(R"(batch\s*:\s*(\w+))", std::regex::icase);
  auto found = findAllMatches(grouped, "Batch: AB123 batch : CD456");
  REQUIRE(found == std::vector<std::string>{"AB123", "CD456"});

  std::regex plain(R"(\d{4})");
  REQUIRE(findAllMatches(plain, "2024 and 2025") == std::vector<std::string>{"2024", "2025"});
}

TEST_CASE("GSTIN regex accepts the documented shape only", "[patterns]") {
  const auto& re = gstinRegex();
  REQUIRE(std::regex_search(std::string("GSTIN: 27ABCDE1234F1Z5"), re));
  REQUIRE(std::regex_search(std::string("29AAACB1234C1ZV"), re));
  REQUIRE_FALSE(std::regex_search(std::string("47ABCDE1234F1Z5"), re));  // state code > 3x
  REQUIRE_FALSE(std::regex_search(std::string("27ABCDE1234F1X5"), re));  // missing Z
  REQUIRE_FALSE(std::regex_search(std::string("27abcde1234f1z5"), re));
}

TEST_CASE("PatternMatcher recognises pharmaceutical companies", "[patterns]") {
  PatternMatcher matcher;
  auto sun = matcher.isPharmaCompany("Sun Pharmaceuticals Industries Ltd");
  REQUIRE(sun.first);
  REQUIRE(sun.second > 0.0);
  REQUIRE(sun.second <= 1.0);

  auto other = matcher.isPharmaCompany("Acme Hardware Stores");
  REQUIRE_FALSE(other.first);
  REQUIRE(other.second == 0.0);
}

TEST_CASE("PatternMatcher scores drug names by formulation", "[patterns]") {
  PatternMatcher matcher;
  auto tablet = matcher.extractDrugNames("Paracetamol 500mg Tablet");
  REQUIRE_FALSE(tablet.empty());
  REQUIRE(tablet.front().text.find("Paracetamol") == 0);
  REQUIRE(tablet.front().confidence == Catch::Approx(0.7));

  auto bare = matcher.extractDrugNames("Multivitamin");
  REQUIRE_FALSE(bare.empty());
  REQUIRE(bare.front().confidence == Catch::Approx(0.5));
}

TEST_CASE("PatternMatcher extracts batch, expiry and licence numbers", "[patterns]") {
  PatternMatcher matcher;

  auto batches = matcher.extractBatchNumbers("Batch No: AB12345");
  REQUIRE_FALSE(batches.empty());
  REQUIRE(batches.front().text == "AB12345");
  REQUIRE(batches.front().confidence == Catch::Approx(0.8));

  auto expiries = matcher.extractExpiryDates("Exp: 01/12/2026");
  REQUIRE_FALSE(expiries.empty());
  REQUIRE(expiries.front().text == "01/12/2026");
  REQUIRE(expiries.front().confidence == Catch::Approx(0.9));

  auto licenses = matcher.extractDrugLicenses("Drug Lic No: MH-12-123456");
  REQUIRE_FALSE(licenses.empty());
  REQUIRE(licenses.front().confidence == Catch::Approx(0.9));

  REQUIRE(matcher.hasStrength("Amoxicillin 250 mg"));
  REQUIRE_FALSE(matcher.hasStrength("Cotton roll"));
}

TEST_CASE("PatternMatcher validates pharmaceutical HSN codes", "[patterns]") {
  PatternMatcher matcher;
  auto full = matcher.validateHsnPharma("30049099");
  REQUIRE(full.first);
  REQUIRE(full.second == Catch::Approx(0.9));

  auto chapter = matcher.validateHsnPharma("3004");
  REQUIRE(chapter.first);
  REQUIRE(chapter.second == Catch::Approx(0.8));

  auto other = matcher.validateHsnPharma("84713010");
  REQUIRE_FALSE(other.first);
  REQUIRE(other.second == 0.0);
  REQUIRE_FALSE(matcher.validateHsnPharma("").first);
}
