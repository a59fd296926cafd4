#include <catch2/catch_all.hpp>

#include "item_extractor.hpp"

#include <string>
#include <vector>

namespace {

Table itemTable() {
  Table table;
  table.pageNumber = 1;
  table.rows = {
    {"Tax Invoice", "", "", "", "", "", ""},
    {"Product Description", "HSN", "Batch", "Expiry", "Qty", "Rate", "Amount"},
    {"Paracetamol 500mg Tablet", "30049099", "B123456", "12/2026", "10+2F", "20.00", "200.00"},
    {"Amoxicillin 250mg Capsule Batch AB1234", "30041010", "nan", "", "5", "50.00", "250.00"},
    {"nan", "", "", "", "1", "1", "1"},
    {"Sub Total", "", "", "", "", "", "450.00"},
  };
  return table;
}

} // namespace

TEST_CASE("extractNumeric reads the first number in a cell", "[items]") {
  REQUIRE(extractNumeric("10+2F") == Catch::Approx(10.0));
  REQUIRE(extractNumeric("1,234.50") == Catch::Approx(1234.5));
  REQUIRE(extractNumeric("Rs. 99.9 only") == Catch::Approx(99.9));
  REQUIRE(extractNumeric("abc") == 0.0);
  REQUIRE(extractNumeric("") == 0.0);
}

TEST_CASE("resolveColumns maps header synonyms to positions", "[items]") {
  std::vector<std::string> header = {"Sr", "Particulars", "HSN Code", "Lot No", "Exp", "Qnty",
                                     "MRP", "Unit Price", "Disc %", "GST %", "Total Amount"};
  ColumnMap columns = resolveColumns(header);
  REQUIRE(columns.description == std::optional<size_t>(1));
  REQUIRE(columns.hsn == std::optional<size_t>(2));
  REQUIRE(columns.batch == std::optional<size_t>(3));
  REQUIRE(columns.expiry == std::optional<size_t>(4));
  REQUIRE(columns.quantity == std::optional<size_t>(5));
  REQUIRE(columns.mrp == std::optional<size_t>(6));
  REQUIRE(columns.rate == std::optional<size_t>(6));  // "mrp" is also a rate synonym
  REQUIRE(columns.discount == std::optional<size_t>(8));
  REQUIRE(columns.taxPercent == std::optional<size_t>(9));
  REQUIRE(columns.total == std::optional<size_t>(10));

  REQUIRE_FALSE(findColumnIndex(header, {"batch"}).has_value());
}

TEST_CASE("parseTableItems builds items from data rows", "[items]") {
  ItemExtraction extraction = parseTableItems({itemTable()}, "");

  REQUIRE(extraction.items.size() == 2);
  const InvoiceItem& first = extraction.items[0];
  REQUIRE(first.description == "Paracetamol 500mg Tablet");
  REQUIRE(first.hsn == std::optional<std::string>("30049099"));
  REQUIRE(first.batch == std::optional<std::string>("B123456"));
  REQUIRE(first.expiry == std::optional<std::string>("12/2026"));
  REQUIRE(first.quantity == Catch::Approx(10.0));
  REQUIRE(first.unitPrice == Catch::Approx(20.0));
  REQUIRE(first.total == Catch::Approx(200.0));

  // Batch recovered from the description when the cell is a placeholder.
  const InvoiceItem& second = extraction.items[1];
  REQUIRE(second.batch == std::optional<std::string>("AB1234"));
  REQUIRE_FALSE(second.expiry.has_value());

  REQUIRE(extraction.confidence > 0.8);
  REQUIRE(extraction.confidence <= 1.0);
}

TEST_CASE("parseTableItems returns nothing for tables without items", "[items]") {
  Table empty;
  Table headerOnly;
  headerOnly.rows = {{"Description", "Qty", "Amount"}};
  Table noDescription;
  noDescription.rows = {{"Code", "Qty", "Amount"}, {"X1", "2", "20.00"}};

  ItemExtraction extraction = parseTableItems({empty, headerOnly, noDescription}, "text");
  REQUIRE(extraction.items.empty());
  REQUIRE(extraction.confidence == 0.0);
}

TEST_CASE("a drug line with a pharmaceutical HSN scores above 0.8", "[items]") {
  InvoiceItem item;
  item.description = "Paracetamol 500mg Tablet";
  item.hsn = "30049099";
  REQUIRE(scoreItem(item) > 0.8);
}

TEST_CASE("consistent arithmetic raises item confidence", "[items]") {
  InvoiceItem exact;
  exact.description = "Cetirizine 10mg Tablet";
  exact.quantity = 10;
  exact.unitPrice = 20;
  exact.total = 200;

  InvoiceItem off = exact;
  off.total = 260;  // 30% away from quantity * rate

  InvoiceItem near = exact;
  near.total = 205;  // within the 10% window

  REQUIRE(scoreItem(exact) > scoreItem(off));
  REQUIRE(scoreItem(near) == Catch::Approx(scoreItem(exact)));
}

TEST_CASE("recoverBatchAndExpiry fills only missing fields", "[items]") {
  InvoiceItem item;
  item.description = "Azithromycin 500mg Batch ZX9981 Exp: 01/06/2026";
  REQUIRE(recoverBatchAndExpiry(item) == 2);
  REQUIRE(item.batch == std::optional<std::string>("ZX9981"));
  REQUIRE(item.expiry == std::optional<std::string>("01/06/2026"));

  InvoiceItem filled = item;
  filled.batch = "KEEP";
  filled.expiry = "KEEP";
  REQUIRE(recoverBatchAndExpiry(filled) == 0);
  REQUIRE(filled.batch == std::optional<std::string>("KEEP"));
}
