#include "invoice_parser_factory.hpp"

#include "bill_parser.hpp"
#include "generic_parser.hpp"
#include "pharma_patterns.hpp"
#include "text_utils.hpp"

#include <spdlog/spdlog.h>

namespace {

const char* const kUnknown = "UNKNOWN";

nlohmann::json failure(const std::string& error) {
  return nlohmann::json{
    {"success", false},
    {"error", error},
    {"parser_used", "none"},
    {"extracted_data", InvoiceParserFactory::emptyExtractedData()},
  };
}

nlohmann::json extractedData(const Invoice& invoice) {
  double discount = 0.0;
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : invoice.items) {
    discount += item.discount;
    items.push_back(toJson(item));
  }
  const double cgst = invoice.cgst.value_or(0.0);
  const double sgst = invoice.sgst.value_or(0.0);
  const double igst = invoice.igst.value_or(0.0);

  return nlohmann::json{
    {"invoice_number", trim(invoice.invoiceNumber).empty() ? kUnknown : invoice.invoiceNumber},
    {"invoice_date", invoice.invoiceDate.toIsoString()},
    {"supplier_name", trim(invoice.supplierName).empty() ? kUnknown : invoice.supplierName},
    {"supplier_gstin", invoice.supplierGstin.value_or("")},
    {"supplier_address", invoice.supplierAddress.value_or("")},
    {"drug_license", invoice.drugLicense.value_or("")},
    {"subtotal", invoice.subtotal.value_or(0.0)},
    {"cgst", cgst},
    {"sgst", sgst},
    {"igst", igst},
    {"tax_amount", cgst + sgst + igst},
    {"discount_amount", discount},
    {"grand_total", invoice.grandTotal.value_or(0.0)},
    {"items", items},
  };
}

} // namespace

nlohmann::json InvoiceParserFactory::emptyExtractedData() {
  return nlohmann::json{
    {"invoice_number", ""},
    {"invoice_date", ""},
    {"supplier_name", ""},
    {"supplier_gstin", ""},
    {"supplier_address", ""},
    {"drug_license", ""},
    {"subtotal", 0},
    {"cgst", 0},
    {"sgst", 0},
    {"igst", 0},
    {"tax_amount", 0},
    {"discount_amount", 0},
    {"grand_total", 0},
    {"items", nlohmann::json::array()},
  };
}

nlohmann::json InvoiceParserFactory::parseExtracted(const RawDocument& doc, bool useEnhancedFallback,
                                                    const ParserRegistry& registry) {
  try {
    ParseOutcome outcome = parseDocument(doc, registry);
    const std::string firstParser = outcome.parserUsed;
    std::string parserUsed = firstParser;
    bool fallbackUsed = false;

    if (useEnhancedFallback && firstParser != GenericParser::kName && outcome.invoice.items.empty()) {
      spdlog::info("{} found no items, retrying with {}", firstParser, GenericParser::kName);
      Invoice generic = GenericParser().parse(doc.text, doc.tables);
      if (!generic.items.empty()) {
        generic.rawText = doc.text;
        outcome.invoice = std::move(generic);
        parserUsed = GenericParser::kName;
        fallbackUsed = true;
      }
    }

    return nlohmann::json{
      {"success", true},
      {"parser_used", parserUsed},
      {"first_attempted_parser", firstParser},
      {"fallback_used", fallbackUsed},
      {"confidence", outcome.invoice.confidence},
      {"extracted_data", extractedData(outcome.invoice)},
    };
  } catch (const std::exception& ex) {
    spdlog::error("Error parsing invoice: {}", ex.what());
    return failure(ex.what());
  }
}

nlohmann::json InvoiceParserFactory::parseInvoice(const std::string& pdfPath, bool useEnhancedFallback,
                                                  const ExtractionOptions& options) {
  RawDocument doc;
  try {
    doc = extractDocument(pdfPath, options);
  } catch (const std::exception& ex) {
    spdlog::error("Error extracting {}: {}", pdfPath, ex.what());
    return failure(ex.what());
  }
  return parseExtracted(doc, useEnhancedFallback);
}

nlohmann::json patternLibraryReport() {
  nlohmann::json categories = nlohmann::json::object();
  for (PatternCategory category : allPatternCategories()) {
    categories[categoryName(category)] = patternsFor(category).size();
  }
  return nlohmann::json{
    {"status", getPatternCount() > 0 ? "ok" : "empty"},
    {"pattern_library_version", kPatternLibraryVersion},
    {"pattern_count", getPatternCount()},
    {"categories", categories},
  };
}
