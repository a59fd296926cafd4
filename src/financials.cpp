#include "financials.hpp"

#include "text_utils.hpp"

#include <cstdlib>
#include <regex>

namespace {

const std::regex& labelFor(TaxComponent component) {
  const auto flags = std::regex::ECMAScript | std::regex::icase;
  static const std::regex cgst(R"(\b(?:cgst|central\s+gst)\b)", flags);
  static const std::regex sgst(R"(\b(?:sgst|state\s+gst|utgst)\b)", flags);
  static const std::regex igst(R"(\b(?:igst|integrated\s+gst)\b)", flags);
  switch (component) {
    case TaxComponent::Cgst: return cgst;
    case TaxComponent::Sgst: return sgst;
    case TaxComponent::Igst: return igst;
  }
  return cgst;
}

double toDouble(const std::string& s) {
  return std::strtod(s.c_str(), nullptr);
}

} // namespace

double FinancialSummary::taxAmount() const {
  return cgst.value_or(0.0) + sgst.value_or(0.0) + igst.value_or(0.0);
}

std::optional<double> extractTaxAmount(const std::string& text, TaxComponent component) {
  static const std::regex percentage(R"(\d+(?:\.\d+)?\s*%)");
  static const std::regex number(R"(\d+(?:\.\d+)?)");

  for (const auto& line : splitLines(text)) {
    std::smatch label;
    if (!std::regex_search(line, label, labelFor(component))) continue;

    std::string rest = removeChar(label.suffix().str(), ',');
    rest = std::regex_replace(rest, percentage, " ");
    std::smatch amount;
    if (std::regex_search(rest, amount, number)) return toDouble(amount.str(0));
  }
  return std::nullopt;
}

FinancialSummary extractFinancials(const std::string& text, const std::vector<InvoiceItem>& items) {
  FinancialSummary summary;

  if (!items.empty()) {
    double itemsTotal = 0.0;
    for (const auto& item : items) itemsTotal += item.total;
    summary.subtotal = itemsTotal;
  }

  summary.cgst = extractTaxAmount(text, TaxComponent::Cgst);
  summary.sgst = extractTaxAmount(text, TaxComponent::Sgst);
  summary.igst = extractTaxAmount(text, TaxComponent::Igst);

  // Money amounts carry exactly two decimals; the largest one is the grand total.
  static const std::regex money(R"((?:^|[^\d.])(\d+\.\d{2})(?![.\d]))");
  const std::string plain = removeChar(text, ',');
  for (std::sregex_iterator it(plain.begin(), plain.end(), money), end; it != end; ++it) {
    double amount = toDouble((*it)[1].str());
    if (!summary.grandTotal || amount > *summary.grandTotal) summary.grandTotal = amount;
  }
  if (!summary.grandTotal) summary.grandTotal = summary.subtotal;
  return summary;
}
