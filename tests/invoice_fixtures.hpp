#pragma once

#include "extractor.hpp"
#include "invoice.hpp"
#include "parser_strategy.hpp"

#include <string>
#include <utility>
#include <vector>

// Header and one-row item table as printed by PHARMA BIO LOGICAL.
inline RawDocument pharmaBiologicalDocument() {
  RawDocument doc;
  doc.text =
    "PHARMA BIO LOGICAL\n"
    "Plot 12, MIDC Industrial Area\n"
    "Bhosari, Pune 411026\n"
    "GSTIN : 27ABCDE1234F1Z5\n"
    "FSSAI No. : 11521999000123\n"
    "TAX INVOICE\n"
    "Invoice No. : PB-000561\n"
    "Date : 01-02-2024\n"
    "CGST @ 6%   12.00\n"
    "SGST @ 6%   12.00\n"
    "Grand Total 224.00\n";
  Table table;
  table.pageNumber = 1;
  table.rows = {
    {"S.No", "Product Description", "HSN", "Qty", "Batch", "Exp", "MRP", "Rate", "Amount"},
    {"1", "Paracetamol 500mg Tablet", "30049099", "10", "B12345", "12/2026", "25.00", "20.00", "200.00"},
    {"", "Total", "", "", "", "", "", "", "200.00"},
  };
  doc.tables.push_back(table);
  return doc;
}

// A supplier without a dedicated strategy.
inline RawDocument genericDocument() {
  RawDocument doc;
  doc.text =
    "Sun Pharmaceuticals Ltd\n"
    "Andheri East, Mumbai 400069\n"
    "GSTIN: 27AAACS1234F1Z9\n"
    "Invoice No: SP2024118\n"
    "Invoice Date: 15/03/2024\n"
    "IGST @ 12%  54.00\n"
    "Grand Total 504.00\n";
  Table table;
  table.pageNumber = 1;
  table.rows = {
    {"Description", "HSN", "Batch", "Expiry", "Qty", "Rate", "Amount"},
    {"Pantoprazole 40mg Tablet", "30049039", "PT4401", "08/2026", "10", "45.00", "450.00"},
  };
  doc.tables.push_back(table);
  return doc;
}

// Strategy with scripted behaviour for registry and orchestration tests.
class ScriptedStrategy : public ParserStrategy {
public:
  ScriptedStrategy(std::string name, std::vector<std::string> keywords, int priority, bool fails)
    : name_(std::move(name)), keywords_(std::move(keywords)), priority_(priority), fails_(fails) {}

  std::string name() const override { return name_; }
  std::vector<std::string> supplierKeywords() const override { return keywords_; }
  int priority() const override { return priority_; }

  Invoice parse(const std::string&, const std::vector<Table>&) const override {
    if (fails_) throw InvoiceValidationError(name_ + " cannot read this layout");
    Invoice invoice;
    invoice.supplierName = "Scripted Supplier";
    invoice.invoiceNumber = "S-1";
    invoice.confidence = 0.5;
    return invoice;
  }

private:
  std::string name_;
  std::vector<std::string> keywords_;
  int priority_;
  bool fails_;
};
