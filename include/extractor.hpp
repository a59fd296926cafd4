#pragma once

#include "table_extractor.hpp"

#include <cstddef>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>

class ExtractionError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

struct RawDocument {
  std::string text;
  std::vector<Table> tables;
};

struct ExtractionOptions {
  // Below this many non-whitespace characters the secondary engine is tried.
  std::size_t minTextChars = 100;
  // Below this many non-whitespace characters pages are rasterized and OCR'd.
  std::size_t ocrTriggerChars = 50;
  int ocrDpi = 300;
  std::string ocrLanguage = "eng";
  bool extractTables = true;
};

// One function per extraction stage. Each takes the PDF path.
struct ExtractionEngines {
  std::function<std::string(const std::string&)> primaryText;
  std::function<std::string(const std::string&)> secondaryText;
  std::function<std::vector<Table>(const std::string&)> tables;
  std::function<std::string(const std::string&)> ocr;
};

// Returns full text of the PDF by invoking `pdftotext -layout`.
// Throws CommandError on failure.
std::string extractPdfText(const std::string& pdfPath);

// Text layer through MuPDF's `mutool draw -F txt`, an independent PDF parser.
std::string extractPdfTextMupdf(const std::string& pdfPath);

// Rasterizes every page with `pdftoppm` and runs `tesseract` on each image,
// concatenating page texts in page order.
std::string ocrPdf(const std::string& pdfPath, int dpi, const std::string& language);

ExtractionEngines defaultEngines(const ExtractionOptions& options);

// Layered fallback: pdftotext, then mutool, then OCR. Tables are extracted
// independently and failures there leave the table list empty.
// Throws ExtractionError if the file is missing or no text survives the chain.
RawDocument extractDocument(const std::string& pdfPath, const ExtractionOptions& options = {});
RawDocument extractDocument(const std::string& pdfPath, const ExtractionOptions& options,
                            const ExtractionEngines& engines);

// Writes the bytes to a private temporary file and extracts from there.
RawDocument extractDocumentFromBytes(const std::vector<unsigned char>& pdfBytes,
                                     const ExtractionOptions& options = {});
