#pragma once

#include "invoice.hpp"
#include "table_extractor.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

// Column positions resolved from a table header row.
struct ColumnMap {
  std::optional<size_t> description;
  std::optional<size_t> hsn;
  std::optional<size_t> batch;
  std::optional<size_t> expiry;
  std::optional<size_t> quantity;
  std::optional<size_t> rate;
  std::optional<size_t> mrp;
  std::optional<size_t> discount;
  std::optional<size_t> taxPercent;
  std::optional<size_t> total;
};

struct ItemExtraction {
  std::vector<InvoiceItem> items;
  double confidence = 0.0;
};

// Index of the first header containing any of the keywords (headers are
// compared lower-cased and trimmed).
std::optional<size_t> findColumnIndex(const std::vector<std::string>& headers,
                                      const std::vector<std::string>& keywords);

ColumnMap resolveColumns(const std::vector<std::string>& header);

// First unsigned decimal in the value after removing thousands separators,
// 0 when there is none ("10+2F" -> 10).
double extractNumeric(const std::string& value);

// Evidence that the item is a real drug line: drug name, dosage keywords,
// strength, arithmetic consistency and pharmaceutical HSN. Additive, so a
// line with more evidence always scores higher; may exceed 1.
double scoreItem(const InvoiceItem& item);

// Fills a missing batch or expiry from the description. Returns the number
// of fields recovered.
int recoverBatchAndExpiry(InvoiceItem& item);

// Builds one item per plausible data row of every table. The overall
// confidence is the mean of per-table means, clamped to [0, 1].
ItemExtraction parseTableItems(const std::vector<Table>& tables, const std::string& text);

// Mean scoreItem() over the items, clamped to [0, 1]; 0 for no items.
double meanItemConfidence(const std::vector<InvoiceItem>& items);
