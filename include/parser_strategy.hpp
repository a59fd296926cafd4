#pragma once

#include "invoice.hpp"
#include "table_extractor.hpp"

#include <string>
#include <vector>

// A supplier-specific (or generic) way of turning extracted text and tables
// into an Invoice. Implementations keep no per-call state.
class ParserStrategy {
public:
  virtual ~ParserStrategy() = default;

  virtual std::string name() const = 0;

  // Every keyword must appear in the document for canParse() to accept it.
  virtual std::vector<std::string> supplierKeywords() const = 0;

  // Higher runs first.
  virtual int priority() const = 0;

  // True when all supplier keywords occur in `text` (case-insensitive). A
  // strategy without keywords accepts nothing unless it overrides this.
  virtual bool canParse(const std::string& text) const;

  // May throw (typically InvoiceValidationError) when the layout does not fit.
  virtual Invoice parse(const std::string& text, const std::vector<Table>& tables) const = 0;
};
