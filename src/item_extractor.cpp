#include "item_extractor.hpp"

#include "field_extractors.hpp"
#include "pharma_patterns.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <regex>

#include <spdlog/spdlog.h>

namespace {

std::string cellAt(const std::vector<std::string>& row, const std::optional<size_t>& index) {
  if (!index || *index >= row.size()) return {};
  return trim(row[*index]);
}

std::optional<std::string> optionalCell(const std::vector<std::string>& row,
                                        const std::optional<size_t>& index) {
  std::string value = cellAt(row, index);
  if (isPlaceholderCell(value)) return std::nullopt;
  return value;
}

size_t nonEmptyCells(const std::vector<std::string>& row) {
  return static_cast<size_t>(std::count_if(row.begin(), row.end(), [](const std::string& cell) {
    return !trim(cell).empty();
  }));
}

// The header is the first row with two or more filled cells; leading title
// rows are skipped.
std::optional<size_t> findHeaderRow(const Table& table) {
  for (size_t i = 0; i < table.rows.size(); ++i) {
    if (nonEmptyCells(table.rows[i]) >= 2) return i;
  }
  return std::nullopt;
}

double clamp01(double v) {
  return std::max(0.0, std::min(1.0, v));
}

} // namespace

std::optional<size_t> findColumnIndex(const std::vector<std::string>& headers,
                                      const std::vector<std::string>& keywords) {
  for (size_t i = 0; i < headers.size(); ++i) {
    const std::string header = toLower(trim(headers[i]));
    for (const auto& keyword : keywords) {
      if (header.find(keyword) != std::string::npos) return i;
    }
  }
  return std::nullopt;
}

ColumnMap resolveColumns(const std::vector<std::string>& header) {
  ColumnMap columns;
  columns.description = findColumnIndex(header, {"description", "particulars", "item", "product"});
  columns.hsn = findColumnIndex(header, {"hsn", "hsn code", "code"});
  columns.batch = findColumnIndex(header, {"batch", "batch no", "lot", "lot no"});
  columns.expiry = findColumnIndex(header, {"expiry", "exp", "exp date", "mfg", "expiry date"});
  columns.quantity = findColumnIndex(header, {"qty", "quantity", "qnty"});
  columns.rate = findColumnIndex(header, {"rate", "price", "unit price", "mrp"});
  columns.mrp = findColumnIndex(header, {"mrp"});
  columns.discount = findColumnIndex(header, {"disc", "discount"});
  columns.taxPercent = findColumnIndex(header, {"gst %", "gst%", "tax %", "tax%"});
  columns.total = findColumnIndex(header, {"total", "amount", "total amount"});
  return columns;
}

double extractNumeric(const std::string& value) {
  static const std::regex number(R"(\d+(?:\.\d+)?)");
  const std::string cleaned = trim(removeChar(value, ','));
  std::smatch m;
  if (!std::regex_search(cleaned, m, number)) return 0.0;
  return std::strtod(m.str(0).c_str(), nullptr);
}

double scoreItem(const InvoiceItem& item) {
  PatternMatcher matcher;
  double score = 0.0;

  if (!matcher.extractDrugNames(item.description).empty()) score += 0.4;
  score += std::min(0.3, countPharmaKeywords(item.description) * 0.1);
  if (matcher.hasStrength(item.description)) score += 0.2;

  if (item.quantity > 0 && item.unitPrice > 0 && item.total > 0) {
    double expected = item.quantity * item.unitPrice;
    if (std::fabs(expected - item.total) / item.total < 0.1) score += 0.3;
  }

  if (item.hsn) {
    auto hsn = matcher.validateHsnPharma(*item.hsn);
    if (hsn.first) score += hsn.second * 0.3;
  }
  return score;
}

int recoverBatchAndExpiry(InvoiceItem& item) {
  PatternMatcher matcher;
  int recovered = 0;
  if (!item.batch) {
    auto batches = matcher.extractBatchNumbers(item.description);
    if (!batches.empty()) {
      item.batch = batches.front().text;
      ++recovered;
    }
  }
  if (!item.expiry) {
    auto expiries = matcher.extractExpiryDates(item.description);
    if (!expiries.empty()) {
      item.expiry = expiries.front().text;
      ++recovered;
    }
  }
  return recovered;
}

ItemExtraction parseTableItems(const std::vector<Table>& tables, const std::string& text) {
  ItemExtraction result;
  double tableConfidenceSum = 0.0;
  int tablesWithItems = 0;

  for (const auto& table : tables) {
    if (table.rows.size() < 2) continue;
    auto headerRow = findHeaderRow(table);
    if (!headerRow) continue;

    const ColumnMap columns = resolveColumns(table.rows[*headerRow]);
    double itemConfidenceSum = 0.0;
    int itemCount = 0;

    for (size_t r = *headerRow + 1; r < table.rows.size(); ++r) {
      const auto& row = table.rows[r];
      if (nonEmptyCells(row) < 3) continue;

      InvoiceItem item;
      item.description = cellAt(row, columns.description);
      if (isPlaceholderCell(item.description)) continue;

      item.hsn = optionalCell(row, columns.hsn);
      item.batch = optionalCell(row, columns.batch);
      item.expiry = optionalCell(row, columns.expiry);
      item.quantity = extractNumeric(cellAt(row, columns.quantity));
      item.unitPrice = extractNumeric(cellAt(row, columns.rate));
      item.mrp = extractNumeric(cellAt(row, columns.mrp));
      item.discount = extractNumeric(cellAt(row, columns.discount));
      item.taxPercent = extractNumeric(cellAt(row, columns.taxPercent));
      item.total = extractNumeric(cellAt(row, columns.total));

      double confidence = scoreItem(item) + 0.1 * recoverBatchAndExpiry(item);
      itemConfidenceSum += confidence;
      ++itemCount;
      result.items.push_back(std::move(item));
    }

    if (itemCount > 0) {
      tableConfidenceSum += itemConfidenceSum / itemCount;
      ++tablesWithItems;
    }
    spdlog::debug("table on page {}: {} item(s)", table.pageNumber, itemCount);
  }

  if (result.items.empty() && !text.empty()) {
    spdlog::debug("no item rows recognised in {} table(s)", tables.size());
  }
  if (tablesWithItems > 0) {
    result.confidence = clamp01(tableConfidenceSum / tablesWithItems);
  }
  return result;
}

double meanItemConfidence(const std::vector<InvoiceItem>& items) {
  if (items.empty()) return 0.0;
  double sum = 0.0;
  for (const auto& item : items) sum += scoreItem(item);
  return clamp01(sum / items.size());
}
