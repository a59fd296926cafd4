#pragma once

#include "extractor.hpp"
#include "invoice.hpp"
#include "parser_registry.hpp"

#include <stdexcept>
#include <string>
#include <vector>

class InvoiceParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct ParseOutcome {
  Invoice invoice;
  std::string parserUsed;
  // "<parser>: <reason>" for each strategy that threw before one succeeded.
  std::vector<std::string> failures;
};

// Tries the registry's candidates for the document in ranked order and keeps
// the first result. Throws InvoiceParseError when every candidate throws.
ParseOutcome parseDocument(const RawDocument& doc,
                           const ParserRegistry& registry = ParserRegistry::defaultRegistry());

// Extract, parse and validate. Throws ExtractionError, InvoiceParseError or
// InvoiceValidationError.
Invoice parsePdf(const std::string& pdfPath, const ExtractionOptions& options = {});
Invoice parsePdfBytes(const std::vector<unsigned char>& pdfBytes,
                      const ExtractionOptions& options = {});
