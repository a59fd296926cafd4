#pragma once

#include "parser_strategy.hpp"

// Layout of invoices issued by PHARMA BIO LOGICAL: labelled header fields
// ("Invoice No. :", "Date :", "GSTIN :", "FSSAI No. :") and an item table
// headed by "S.No" / "Product Description" whose cells may hold several
// products separated by line breaks.
class PharmaBiologicalParser : public ParserStrategy {
public:
  static constexpr const char* kName = "pharma_biological";
  static constexpr const char* kSupplierName = "PHARMA BIO LOGICAL";

  std::string name() const override { return kName; }
  std::vector<std::string> supplierKeywords() const override { return {kSupplierName}; }
  int priority() const override { return 10; }

  // Throws InvoiceValidationError when the invoice number label is absent.
  Invoice parse(const std::string& text, const std::vector<Table>& tables) const override;
};
