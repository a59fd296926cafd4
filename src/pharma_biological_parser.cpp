#include "pharma_biological_parser.hpp"

#include "confidence.hpp"
#include "field_extractors.hpp"
#include "financials.hpp"
#include "item_extractor.hpp"
#include "pharma_patterns.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <regex>

#include <spdlog/spdlog.h>

namespace {

constexpr double kDefaultTaxPercent = 12.0;
constexpr size_t kMaxAddressLines = 3;

// Column positions of the printed item table when the header cannot be read.
struct ItemLayout {
  std::optional<size_t> description = 2;
  std::optional<size_t> hsn = 3;
  std::optional<size_t> quantity = 5;
  std::optional<size_t> batch = 7;
  std::optional<size_t> expiry = 8;
  std::optional<size_t> mrp = 9;
  std::optional<size_t> rate = 11;
  std::optional<size_t> total = 17;
  std::optional<size_t> taxPercent;
  size_t minCells = 5;
};

std::string cell(const std::vector<std::string>& row, const std::optional<size_t>& index) {
  if (!index || *index >= row.size()) return {};
  return trim(row[*index]);
}

std::string firstLine(const std::string& value) {
  return trim(value.substr(0, value.find('\n')));
}

bool isSerial(const std::string& value) {
  const std::string serial = firstLine(value);
  return !serial.empty() && std::all_of(serial.begin(), serial.end(), [](unsigned char c) {
    return std::isdigit(c);
  });
}

std::optional<std::string> captureFirst(const std::string& text, const std::regex& re) {
  std::smatch m;
  if (!std::regex_search(text, m, re)) return std::nullopt;
  return m.str(1);
}

const std::regex& invoiceNumberLabel() {
  static const std::regex re(R"(Invoice\s+No\.\s*:\s*([A-Z\-0-9]+))");
  return re;
}

const std::regex& dateLabel() {
  static const std::regex re(R"(Date\s*:\s*(\d{2}-\d{2}-\d{4}))");
  return re;
}

const std::regex& gstinLabel() {
  static const std::regex re(R"(GSTIN\s*:\s*(\w+))");
  return re;
}

const std::regex& fssaiLabel() {
  static const std::regex re(R"(FSSAI\s+No\.\s*:\s*(\d+))");
  return re;
}

// The label is also printed with placeholders such as "URP" (unregistered).
bool isWellFormedGstin(const std::string& value) {
  return value.size() == 15 && std::regex_match(value, gstinRegex());
}

std::optional<std::string> findAddress(const std::string& text) {
  std::vector<std::string> parts;
  bool capture = false;
  for (const auto& line : splitLines(text)) {
    if (line.find(PharmaBiologicalParser::kSupplierName) != std::string::npos) {
      capture = true;
      continue;
    }
    if (!capture) continue;
    if (line.find("GSTIN") != std::string::npos) break;
    std::string part = trim(line);
    if (!part.empty()) parts.push_back(part);
  }
  if (parts.empty()) return std::nullopt;

  std::string address;
  for (size_t i = 0; i < parts.size() && i < kMaxAddressLines; ++i) {
    if (i > 0) address += ", ";
    address += parts[i];
  }
  return address;
}

bool isItemHeader(const std::vector<std::string>& row) {
  return std::any_of(row.begin(), row.end(), [](const std::string& c) {
    return c.find("Product Description") != std::string::npos || c.find("S.No") != std::string::npos;
  });
}

ItemLayout layoutFromHeader(const std::vector<std::string>& header) {
  ItemLayout layout;
  const ColumnMap columns = resolveColumns(header);
  if (!columns.description) return layout;

  layout.description = columns.description;
  layout.hsn = columns.hsn;
  layout.quantity = columns.quantity;
  layout.batch = columns.batch;
  layout.expiry = columns.expiry;
  layout.mrp = columns.mrp;
  // "Rate" wins over the MRP column that the generic rate synonyms also accept.
  auto rate = findColumnIndex(header, {"rate"});
  layout.rate = rate ? rate : columns.rate;
  layout.total = columns.total;
  layout.taxPercent = columns.taxPercent;
  layout.minCells = 3;
  return layout;
}

void appendRowItems(const std::vector<std::string>& row, const ItemLayout& layout,
                    std::vector<InvoiceItem>& items) {
  std::vector<std::string> descriptions = splitLines(cell(row, layout.description));
  std::vector<std::string> hsns = splitLines(cell(row, layout.hsn));

  const std::string batch = firstLine(cell(row, layout.batch));
  const std::string expiry = firstLine(cell(row, layout.expiry));
  const double quantity = std::floor(extractNumeric(cell(row, layout.quantity)));
  const double taxPercent = extractNumeric(cell(row, layout.taxPercent));

  for (size_t i = 0; i < descriptions.size(); ++i) {
    InvoiceItem item;
    item.description = trim(descriptions[i]);
    if (item.description.size() <= 3) continue;

    if (i < hsns.size() && !trim(hsns[i]).empty()) item.hsn = trim(hsns[i]);
    if (batch.size() > 2) item.batch = batch;
    if (!expiry.empty()) item.expiry = expiry;
    item.quantity = quantity > 0 ? quantity : 1;
    item.mrp = extractNumeric(cell(row, layout.mrp));
    item.unitPrice = extractNumeric(cell(row, layout.rate));
    item.total = extractNumeric(cell(row, layout.total));
    item.taxPercent = taxPercent > 0 ? taxPercent : kDefaultTaxPercent;
    items.push_back(std::move(item));
  }
}

std::vector<InvoiceItem> extractLayoutItems(const std::vector<Table>& tables) {
  std::vector<InvoiceItem> items;
  for (const auto& table : tables) {
    for (size_t h = 0; h < table.rows.size(); ++h) {
      if (!isItemHeader(table.rows[h])) continue;

      const ItemLayout layout = layoutFromHeader(table.rows[h]);
      for (size_t r = h + 1; r < table.rows.size(); ++r) {
        const auto& row = table.rows[r];
        if (row.size() < layout.minCells || !isSerial(row.front())) continue;
        appendRowItems(row, layout, items);
      }
      return items;
    }
  }
  return items;
}

} // namespace

Invoice PharmaBiologicalParser::parse(const std::string& text, const std::vector<Table>& tables) const {
  auto number = captureFirst(text, invoiceNumberLabel());
  if (!number) {
    throw InvoiceValidationError(std::string(kName) + ": invoice number label not found");
  }

  Invoice invoice;
  invoice.supplierName = kSupplierName;
  invoice.supplierAddress = findAddress(text);
  invoice.invoiceNumber = *number;

  ConfidenceInputs inputs;
  inputs.supplier = 0.9;
  inputs.invoiceNumber = 0.9;

  auto dateText = captureFirst(text, dateLabel());
  std::optional<Date> labelledDate = dateText ? parseDate(*dateText, "%d-%m-%Y") : std::nullopt;
  if (labelledDate) {
    invoice.invoiceDate = *labelledDate;
    invoice.invoiceDateExtracted = true;
    inputs.date = 0.9;
  } else {
    auto date = findInvoiceDate(text);
    if (date.value) {
      invoice.invoiceDate = *date.value;
      invoice.invoiceDateExtracted = true;
    }
    inputs.date = date.confidence;
  }

  auto gstin = captureFirst(text, gstinLabel());
  if (gstin && isWellFormedGstin(*gstin)) {
    invoice.supplierGstin = *gstin;
    inputs.gstin = validateGstin(*gstin);
  } else {
    auto found = findGstin(text);
    invoice.supplierGstin = found.value;
    inputs.gstin = found.confidence;
  }

  if (auto fssai = captureFirst(text, fssaiLabel())) {
    invoice.drugLicense = "FSSAI: " + *fssai;
  } else {
    invoice.drugLicense = findDrugLicense(text).value;
  }

  invoice.items = extractLayoutItems(tables);
  if (!invoice.items.empty()) {
    inputs.items = meanItemConfidence(invoice.items);
  } else {
    spdlog::debug("{}: item table layout not found, using column heuristics", kName);
    ItemExtraction extraction = parseTableItems(tables, text);
    invoice.items = std::move(extraction.items);
    inputs.items = extraction.confidence;
  }

  const FinancialSummary financials = extractFinancials(text, invoice.items);
  invoice.subtotal = financials.subtotal;
  invoice.cgst = financials.cgst;
  invoice.sgst = financials.sgst;
  invoice.igst = financials.igst;
  invoice.grandTotal = financials.grandTotal;
  invoice.confidence = aggregateConfidence(inputs);
  return invoice;
}
