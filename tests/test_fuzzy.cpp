#include <catch2/catch_all.hpp>

#include "fuzzy.hpp"

TEST_CASE("ratio is normalized indel similarity", "[fuzzy]") {
  REQUIRE(ratio("abc", "abc") == Catch::Approx(100.0));
  REQUIRE(ratio("abc", "xyz") == Catch::Approx(0.0));
  REQUIRE(ratio("abcd", "abce") == Catch::Approx(75.0));
  REQUIRE(ratio("", "") == Catch::Approx(100.0));
}

TEST_CASE("partialRatio finds the keyword inside a longer text", "[fuzzy]") {
  REQUIRE(partialRatio("pharma bio logical", "tax invoice pharma bio logical pune") == Catch::Approx(100.0));
  REQUIRE(partialRatio("tax invoice pharma bio logical pune", "pharma bio logical") == Catch::Approx(100.0));
}

TEST_CASE("partialRatio tolerates OCR noise", "[fuzzy]") {
  REQUIRE(partialRatio("pharma bio logical", "invoice phrma bio logical") > 80.0);
  REQUIRE(partialRatio("pharma bio logical", "pharma bi0 logica1 pvt") > 80.0);
}

TEST_CASE("partialRatio rejects unrelated text", "[fuzzy]") {
  REQUIRE(partialRatio("pharma bio logical", "acme hardware stores, main road") < 80.0);
  REQUIRE(partialRatio("", "anything") == 0.0);
  REQUIRE(partialRatio("anything", "") == 0.0);
}

TEST_CASE("partialRatio scores matches clipped at the text edges", "[fuzzy]") {
  // Only "logical" is present, at the very start of the text.
  double score = partialRatio("bio logical", "logical order");
  REQUIRE(score > 0.0);
  REQUIRE(score < 100.0);
}
