#include "bill_parser.hpp"

#include <spdlog/spdlog.h>

ParseOutcome parseDocument(const RawDocument& doc, const ParserRegistry& registry) {
  ParseOutcome outcome;
  for (const ParserStrategy* strategy : registry.select(doc.text)) {
    try {
      outcome.invoice = strategy->parse(doc.text, doc.tables);
    } catch (const std::exception& ex) {
      spdlog::warn("parser {} failed: {}", strategy->name(), ex.what());
      outcome.failures.push_back(strategy->name() + ": " + ex.what());
      continue;
    }
    outcome.parserUsed = strategy->name();
    outcome.invoice.rawText = doc.text;
    spdlog::info("parsed with {} (confidence {:.2f}, {} item(s))", outcome.parserUsed,
                 outcome.invoice.confidence, outcome.invoice.items.size());
    return outcome;
  }

  std::string message = "No parser could handle the document";
  for (const auto& failure : outcome.failures) message += "; " + failure;
  throw InvoiceParseError(message);
}

Invoice parsePdf(const std::string& pdfPath, const ExtractionOptions& options) {
  RawDocument doc = extractDocument(pdfPath, options);
  Invoice invoice = parseDocument(doc).invoice;
  invoice.validate();
  return invoice;
}

Invoice parsePdfBytes(const std::vector<unsigned char>& pdfBytes, const ExtractionOptions& options) {
  RawDocument doc = extractDocumentFromBytes(pdfBytes, options);
  Invoice invoice = parseDocument(doc).invoice;
  invoice.validate();
  return invoice;
}
