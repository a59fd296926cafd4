#pragma once

#include "extractor.hpp"
#include "parser_registry.hpp"

#include <string>

#include <nlohmann/json.hpp>

// Lenient front door for callers that persist the result as a record: never
// throws, always answers with a JSON object carrying `success`.
class InvoiceParserFactory {
public:
  // Extracts and parses the PDF. With `useEnhancedFallback`, a supplier
  // strategy that found no items is second-guessed by the generic one.
  static nlohmann::json parseInvoice(const std::string& pdfPath, bool useEnhancedFallback = true,
                                     const ExtractionOptions& options = {});

  static nlohmann::json parseExtracted(const RawDocument& doc, bool useEnhancedFallback = true,
                                       const ParserRegistry& registry = ParserRegistry::defaultRegistry());

  // All-empty `extracted_data` returned with failures.
  static nlohmann::json emptyExtractedData();
};

// Health-check summary of the pattern library.
nlohmann::json patternLibraryReport();
