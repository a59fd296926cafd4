#include "extractor.hpp"

#include "process.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <string>

#include <spdlog/spdlog.h>

namespace {

std::string runStage(const char* stage, const std::function<std::string(const std::string&)>& engine,
                     const std::string& pdfPath) {
  if (!engine) return {};
  try {
    std::string text = engine(pdfPath);
    spdlog::debug("{}: {} non-whitespace chars from {}", stage, countNonWhitespace(text), pdfPath);
    return text;
  } catch (const std::exception& ex) {
    spdlog::warn("{} failed for {}: {}", stage, pdfPath, ex.what());
    return {};
  }
}

// Keeps whichever candidate carries more text.
void keepBetter(std::string& current, std::string candidate) {
  if (countNonWhitespace(candidate) > countNonWhitespace(current)) {
    current = std::move(candidate);
  }
}

} // namespace

std::string extractPdfText(const std::string& pdfPath) {
  if (!commandExists("pdftotext")) {
    throw CommandError(
      "pdftotext not found. Please install poppler-utils (e.g., apt-get install -y poppler-utils)."
    );
  }
  return runCommand("pdftotext -layout -nopgbrk -q " + shellQuote(pdfPath) + " - 2>/dev/null");
}

std::string extractPdfTextMupdf(const std::string& pdfPath) {
  if (!commandExists("mutool")) {
    throw CommandError("mutool not found. Please install mupdf-tools.");
  }
  return runCommand("mutool draw -q -F txt -o - " + shellQuote(pdfPath) + " 2>/dev/null");
}

std::string ocrPdf(const std::string& pdfPath, int dpi, const std::string& language) {
  if (!commandExists("pdftoppm") || !commandExists("tesseract")) {
    throw CommandError("OCR needs pdftoppm (poppler-utils) and tesseract.");
  }

  TempDirectory workDir;
  const std::string prefix = (workDir.path() / "page").string();
  runCommand("pdftoppm -r " + std::to_string(dpi) + " -png " + shellQuote(pdfPath) + " " +
             shellQuote(prefix) + " 2>/dev/null");

  // pdftoppm zero-pads page numbers to a common width, so name order is page order.
  std::vector<std::filesystem::path> images;
  for (const auto& entry : std::filesystem::directory_iterator(workDir.path())) {
    if (entry.path().extension() == ".png") images.push_back(entry.path());
  }
  std::sort(images.begin(), images.end());

  std::string text;
  for (const auto& image : images) {
    std::string pageText = runCommand("tesseract " + shellQuote(image.string()) + " stdout -l " +
                                      shellQuote(language) + " 2>/dev/null");
    if (!text.empty()) text += "\n";
    text += pageText;
  }
  spdlog::debug("ocr: {} page(s) recognized", images.size());
  return text;
}

ExtractionEngines defaultEngines(const ExtractionOptions& options) {
  ExtractionEngines engines;
  engines.primaryText = extractPdfText;
  engines.secondaryText = extractPdfTextMupdf;
  if (options.extractTables) {
    engines.tables = [](const std::string& path) { return extractTablesFromPdf(path); };
  }
  engines.ocr = [dpi = options.ocrDpi, lang = options.ocrLanguage](const std::string& path) {
    return ocrPdf(path, dpi, lang);
  };
  return engines;
}

RawDocument extractDocument(const std::string& pdfPath, const ExtractionOptions& options) {
  return extractDocument(pdfPath, options, defaultEngines(options));
}

RawDocument extractDocument(const std::string& pdfPath, const ExtractionOptions& options,
                            const ExtractionEngines& engines) {
  if (!std::filesystem::exists(pdfPath)) {
    throw ExtractionError("PDF not found: " + pdfPath);
  }

  RawDocument doc;
  doc.text = runStage("pdftotext", engines.primaryText, pdfPath);

  if (options.extractTables && engines.tables) {
    try {
      doc.tables = engines.tables(pdfPath);
    } catch (const std::exception& ex) {
      spdlog::debug("table extraction failed for {}: {}", pdfPath, ex.what());
      doc.tables.clear();
    }
  }

  if (countNonWhitespace(doc.text) < options.minTextChars) {
    keepBetter(doc.text, runStage("mutool", engines.secondaryText, pdfPath));
  }

  if (countNonWhitespace(doc.text) < options.ocrTriggerChars) {
    spdlog::info("{}: text layer too thin, falling back to OCR", pdfPath);
    keepBetter(doc.text, runStage("ocr", engines.ocr, pdfPath));
  }

  if (countNonWhitespace(doc.text) == 0) {
    throw ExtractionError("Unable to extract text from PDF: " + pdfPath);
  }
  return doc;
}

RawDocument extractDocumentFromBytes(const std::vector<unsigned char>& pdfBytes,
                                     const ExtractionOptions& options) {
  TempDirectory workDir;
  const std::filesystem::path pdfPath = workDir.path() / "input.pdf";
  {
    std::ofstream ofs(pdfPath, std::ios::binary);
    if (!ofs) {
      throw ExtractionError("Cannot stage PDF bytes at " + pdfPath.string());
    }
    ofs.write(reinterpret_cast<const char*>(pdfBytes.data()),
              static_cast<std::streamsize>(pdfBytes.size()));
  }
  return extractDocument(pdfPath.string(), options);
}
