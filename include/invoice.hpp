#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

class InvoiceValidationError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Value found by an extractor together with how much it is trusted, in [0, 1].
template <typename T>
struct FieldResult {
  std::optional<T> value;
  double confidence = 0.0;
};

struct Date {
  int year = 1970;
  int month = 1;
  int day = 1;

  std::string toIsoString() const;
  static Date today();
};

bool operator==(const Date& lhs, const Date& rhs);
bool operator!=(const Date& lhs, const Date& rhs);

bool isValidCalendarDate(int year, int month, int day);

struct InvoiceItem {
  std::string description;
  std::optional<std::string> hsn;
  std::optional<std::string> batch;
  std::optional<std::string> expiry;  // as printed, e.g. "12/2026"
  double quantity = 0.0;
  double unitPrice = 0.0;
  double mrp = 0.0;
  double discount = 0.0;
  double taxPercent = 0.0;
  double taxAmount = 0.0;
  double total = 0.0;
};

struct Invoice {
  std::string supplierName;
  std::optional<std::string> supplierGstin;
  std::optional<std::string> supplierAddress;
  std::optional<std::string> drugLicense;
  std::string invoiceNumber;
  Date invoiceDate = Date::today();
  bool invoiceDateExtracted = false;
  std::vector<InvoiceItem> items;
  std::optional<double> subtotal;
  std::optional<double> cgst;
  std::optional<double> sgst;
  std::optional<double> igst;
  std::optional<double> grandTotal;
  double confidence = 0.0;
  std::string rawText;

  // Throws InvoiceValidationError when a required field is empty or the
  // confidence is out of range.
  void validate() const;
};

nlohmann::json toJson(const InvoiceItem& item);

// Raw text is not exported.
nlohmann::json toJson(const Invoice& invoice);
