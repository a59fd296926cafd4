#pragma once

#include "parser_strategy.hpp"

// Supplier-agnostic heuristics: header fields from text patterns, items from
// table columns. Accepts every document and never rejects one for missing
// fields; required fields are left empty for the caller to validate.
class GenericParser : public ParserStrategy {
public:
  static constexpr const char* kName = "enhanced_generic";

  std::string name() const override { return kName; }
  std::vector<std::string> supplierKeywords() const override { return {}; }
  int priority() const override { return -100; }
  bool canParse(const std::string&) const override { return true; }

  Invoice parse(const std::string& text, const std::vector<Table>& tables) const override;
};
