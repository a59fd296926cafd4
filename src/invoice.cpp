#include "invoice.hpp"

#include "text_utils.hpp"

#include <cstdio>
#include <ctime>

namespace {

template <typename T>
nlohmann::json optionalToJson(const std::optional<T>& value) {
  if (!value) return nullptr;
  return *value;
}

} // namespace

std::string Date::toIsoString() const {
  char buf[16];
  std::snprintf(buf, sizeof(buf), "%04d-%02d-%02d", year, month, day);
  return buf;
}

Date Date::today() {
  std::time_t now = std::time(nullptr);
  std::tm local{};
  localtime_r(&now, &local);
  return Date{local.tm_year + 1900, local.tm_mon + 1, local.tm_mday};
}

bool operator==(const Date& lhs, const Date& rhs) {
  return lhs.year == rhs.year && lhs.month == rhs.month && lhs.day == rhs.day;
}

bool operator!=(const Date& lhs, const Date& rhs) {
  return !(lhs == rhs);
}

bool isValidCalendarDate(int year, int month, int day) {
  if (year < 1 || year > 9999 || month < 1 || month > 12 || day < 1) return false;
  static const int kDaysInMonth[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  int maxDay = kDaysInMonth[month - 1];
  bool leap = (year % 4 == 0 && year % 100 != 0) || year % 400 == 0;
  if (month == 2 && leap) maxDay = 29;
  return day <= maxDay;
}

void Invoice::validate() const {
  if (trim(supplierName).empty()) {
    throw InvoiceValidationError("Invoice is missing the supplier name");
  }
  if (trim(invoiceNumber).empty()) {
    throw InvoiceValidationError("Invoice is missing the invoice number");
  }
  if (confidence < 0.0 || confidence > 1.0) {
    throw InvoiceValidationError("Invoice confidence out of range: " + std::to_string(confidence));
  }
}

nlohmann::json toJson(const InvoiceItem& item) {
  return nlohmann::json{
    {"description", item.description},
    {"hsn", optionalToJson(item.hsn)},
    {"batch", optionalToJson(item.batch)},
    {"expiry", optionalToJson(item.expiry)},
    {"quantity", item.quantity},
    {"unit_price", item.unitPrice},
    {"mrp", item.mrp},
    {"discount", item.discount},
    {"tax_percent", item.taxPercent},
    {"tax_amount", item.taxAmount},
    {"total", item.total},
  };
}

nlohmann::json toJson(const Invoice& invoice) {
  nlohmann::json items = nlohmann::json::array();
  for (const auto& item : invoice.items) {
    items.push_back(toJson(item));
  }
  return nlohmann::json{
    {"supplier_name", invoice.supplierName},
    {"supplier_gstin", optionalToJson(invoice.supplierGstin)},
    {"supplier_address", optionalToJson(invoice.supplierAddress)},
    {"drug_license", optionalToJson(invoice.drugLicense)},
    {"invoice_number", invoice.invoiceNumber},
    {"invoice_date", invoice.invoiceDate.toIsoString()},
    {"invoice_date_extracted", invoice.invoiceDateExtracted},
    {"items", items},
    {"subtotal", optionalToJson(invoice.subtotal)},
    {"cgst", optionalToJson(invoice.cgst)},
    {"sgst", optionalToJson(invoice.sgst)},
    {"igst", optionalToJson(invoice.igst)},
    {"grand_total", optionalToJson(invoice.grandTotal)},
    {"confidence", invoice.confidence},
  };
}
