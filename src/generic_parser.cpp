#include "generic_parser.hpp"

#include "confidence.hpp"
#include "field_extractors.hpp"
#include "financials.hpp"
#include "item_extractor.hpp"

#include <spdlog/spdlog.h>

Invoice GenericParser::parse(const std::string& text, const std::vector<Table>& tables) const {
  const auto supplier = findSupplier(text);
  const auto gstin = findGstin(text);
  const auto date = findInvoiceDate(text);
  const auto number = findInvoiceNumber(text);
  const auto license = findDrugLicense(text);
  ItemExtraction extraction = parseTableItems(tables, text);
  const FinancialSummary financials = extractFinancials(text, extraction.items);

  Invoice invoice;
  invoice.supplierName = supplier.value.value_or("");
  invoice.supplierGstin = gstin.value;
  invoice.drugLicense = license.value;
  invoice.invoiceNumber = number.value.value_or("");
  if (date.value) {
    invoice.invoiceDate = *date.value;
    invoice.invoiceDateExtracted = true;
  }
  invoice.items = std::move(extraction.items);
  invoice.subtotal = financials.subtotal;
  invoice.cgst = financials.cgst;
  invoice.sgst = financials.sgst;
  invoice.igst = financials.igst;
  invoice.grandTotal = financials.grandTotal;

  ConfidenceInputs inputs;
  inputs.supplier = supplier.confidence;
  inputs.date = date.confidence;
  inputs.invoiceNumber = number.confidence;
  inputs.items = extraction.confidence;
  inputs.gstin = gstin.confidence;
  invoice.confidence = aggregateConfidence(inputs);

  spdlog::debug("{}: supplier '{}' ({:.2f}), number '{}' ({:.2f}), {} item(s)", kName,
                invoice.supplierName, supplier.confidence, invoice.invoiceNumber,
                number.confidence, invoice.items.size());
  return invoice;
}
