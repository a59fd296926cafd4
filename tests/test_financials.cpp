#include <catch2/catch_all.hpp>

#include "confidence.hpp"
#include "financials.hpp"

#include <string>
#include <vector>

namespace {

InvoiceItem itemWithTotal(double total) {
  InvoiceItem item;
  item.description = "Item";
  item.total = total;
  return item;
}

} // namespace

TEST_CASE("extractFinancials reads intra-state GST and the grand total", "[financials]") {
  const std::string text =
    "Sub Total            1,000.00\n"
    "CGST @ 6%               60.00\n"
    "SGST @ 6%               60.00\n"
    "Grand Total          1,120.00\n";

  FinancialSummary summary = extractFinancials(text, {itemWithTotal(600), itemWithTotal(400)});

  REQUIRE(summary.subtotal == std::optional<double>(1000.0));
  REQUIRE(summary.cgst == std::optional<double>(60.0));
  REQUIRE(summary.sgst == std::optional<double>(60.0));
  REQUIRE_FALSE(summary.igst.has_value());
  REQUIRE(summary.grandTotal == std::optional<double>(1120.0));
  REQUIRE(summary.taxAmount() == Catch::Approx(120.0));
}

TEST_CASE("extractTaxAmount understands long labels and inter-state tax", "[financials]") {
  REQUIRE(extractTaxAmount("IGST 18% : 180.00", TaxComponent::Igst) == std::optional<double>(180.0));
  REQUIRE(extractTaxAmount("Integrated GST 90.50", TaxComponent::Igst) == std::optional<double>(90.5));
  REQUIRE(extractTaxAmount("Central GST 2,500.00", TaxComponent::Cgst) == std::optional<double>(2500.0));
  REQUIRE(extractTaxAmount("UTGST 12.00", TaxComponent::Sgst) == std::optional<double>(12.0));
}

TEST_CASE("extractTaxAmount skips labels without an amount", "[financials]") {
  const std::string text =
    "CGST 6%\n"
    "CGST Amount 42.00\n";
  REQUIRE(extractTaxAmount(text, TaxComponent::Cgst) == std::optional<double>(42.0));
  REQUIRE_FALSE(extractTaxAmount(text, TaxComponent::Sgst).has_value());
  REQUIRE_FALSE(extractTaxAmount("no taxes", TaxComponent::Igst).has_value());
}

TEST_CASE("grand total falls back to the item subtotal", "[financials]") {
  FinancialSummary withItems = extractFinancials("Total: 35", {itemWithTotal(20), itemWithTotal(15)});
  REQUIRE(withItems.subtotal == std::optional<double>(35.0));
  REQUIRE(withItems.grandTotal == std::optional<double>(35.0));

  FinancialSummary nothing = extractFinancials("no amounts", {});
  REQUIRE_FALSE(nothing.subtotal.has_value());
  REQUIRE_FALSE(nothing.grandTotal.has_value());
  REQUIRE(nothing.taxAmount() == 0.0);
}

TEST_CASE("aggregateConfidence applies fixed weights", "[confidence]") {
  REQUIRE(kSupplierWeight + kDateWeight + kInvoiceNumberWeight + kItemsWeight + kGstinWeight ==
          Catch::Approx(1.0));

  ConfidenceInputs all{1.0, 1.0, 1.0, 1.0, 1.0};
  REQUIRE(aggregateConfidence(all) == Catch::Approx(1.0));

  ConfidenceInputs supplierOnly;
  supplierOnly.supplier = 0.8;
  REQUIRE(aggregateConfidence(supplierOnly) == Catch::Approx(0.2));

  ConfidenceInputs inflated{2.0, 2.0, 2.0, 2.0, 2.0};
  REQUIRE(aggregateConfidence(inflated) == 1.0);
  REQUIRE(aggregateConfidence(ConfidenceInputs{}) == 0.0);
}
