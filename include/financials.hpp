#pragma once

#include "invoice.hpp"

#include <optional>
#include <string>
#include <vector>

enum class TaxComponent { Cgst, Sgst, Igst };

struct FinancialSummary {
  std::optional<double> subtotal;
  std::optional<double> cgst;
  std::optional<double> sgst;
  std::optional<double> igst;
  std::optional<double> grandTotal;

  // Sum of the tax components that were found.
  double taxAmount() const;
};

// Amount printed on the first line labelled with the component (percentages
// on that line are ignored), or nothing when no such line carries a number.
std::optional<double> extractTaxAmount(const std::string& text, TaxComponent component);

FinancialSummary extractFinancials(const std::string& text, const std::vector<InvoiceItem>& items);
