#include "bill_parser.hpp"
#include "extractor.hpp"
#include "invoice_parser_factory.hpp"
#include "table_extractor.hpp"

#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace {

void printUsage(const char* argv0) {
  std::cerr << "Usage: " << argv0
            << " [--tables] [--tables-out=dir] [--no-fallback] [--strict] [--patterns]"
               " [--ocr-lang=lang] [--ocr-dpi=n] [--verbose] <pdf_path>\n";
}

} // namespace

int main(int argc, char** argv)
{
  try {
    std::string pdfPath;
    bool extractTables = false;
    bool enhancedFallback = true;
    bool strict = false;
    bool patterns = false;
    std::string tablesOutDir = "tables_out";
    ExtractionOptions options;
    spdlog::set_level(spdlog::level::warn);

    for (int i = 1; i < argc; ++i) {
      std::string arg = argv[i];
      if (arg == "--tables") {
        extractTables = true;
      } else if (arg.rfind("--tables-out=", 0) == 0) {
        tablesOutDir = arg.substr(std::string("--tables-out=").size());
      } else if (arg == "--no-fallback") {
        enhancedFallback = false;
      } else if (arg == "--strict") {
        strict = true;
      } else if (arg == "--patterns") {
        patterns = true;
      } else if (arg.rfind("--ocr-lang=", 0) == 0) {
        options.ocrLanguage = arg.substr(std::string("--ocr-lang=").size());
      } else if (arg.rfind("--ocr-dpi=", 0) == 0) {
        options.ocrDpi = std::stoi(arg.substr(std::string("--ocr-dpi=").size()));
      } else if (arg == "--verbose") {
        spdlog::set_level(spdlog::level::debug);
      } else if (arg.rfind("--", 0) == 0) {
        std::cerr << "Unknown option: " << arg << "\n";
        printUsage(argv[0]);
        return 2;
      } else if (pdfPath.empty()) {
        pdfPath = arg;
      }
    }

    if (patterns) {
      std::cout << patternLibraryReport().dump(2) << "\n";
      return 0;
    }

    if (pdfPath.empty() || !std::filesystem::exists(pdfPath)) {
      if (!pdfPath.empty()) std::cerr << "PDF not found: " << pdfPath << "\n";
      printUsage(argv[0]);
      return 2;
    }

    if (extractTables) {
      auto tables = extractTablesFromPdf(pdfPath);
      writeTablesAsCsv(tables, tablesOutDir);
      std::cout << "Extracted " << tables.size() << " table(s) to '" << tablesOutDir << "'\n";
      return 0;
    }

    if (strict) {
      Invoice invoice = parsePdf(pdfPath, options);
      std::cout << toJson(invoice).dump(2) << "\n";
      return 0;
    }

    nlohmann::json result = InvoiceParserFactory::parseInvoice(pdfPath, enhancedFallback, options);
    std::cout << result.dump(2) << "\n";
    return result.value("success", false) ? 0 : 1;
  } catch (const std::exception& ex) {
    std::cerr << "Error: " << ex.what() << "\n";
    return 1;
  }
}
