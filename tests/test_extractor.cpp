#include <catch2/catch_all.hpp>

#include "extractor.hpp"
#include "process.hpp"

#include <filesystem>
#include <fstream>
#include <string>

namespace {

std::string textOfLength(size_t nonWhitespace, char fill = 'x') {
  std::string text;
  for (size_t i = 0; i < nonWhitespace; ++i) {
    text.push_back(fill);
    if (i % 10 == 9) text.push_back(' ');
  }
  return text;
}

struct StageCalls {
  int primary = 0;
  int secondary = 0;
  int ocr = 0;
  int tables = 0;
};

ExtractionEngines fakeEngines(StageCalls& calls, std::string primary, std::string secondary,
                              std::string ocr) {
  ExtractionEngines engines;
  engines.primaryText = [&calls, primary](const std::string&) { ++calls.primary; return primary; };
  engines.secondaryText = [&calls, secondary](const std::string&) { ++calls.secondary; return secondary; };
  engines.ocr = [&calls, ocr](const std::string&) { ++calls.ocr; return ocr; };
  engines.tables = [&calls](const std::string&) {
    ++calls.tables;
    Table t;
    t.pageNumber = 1;
    t.rows = {{"Description", "Qty"}, {"Syrup", "1"}};
    return std::vector<Table>{t};
  };
  return engines;
}

// A file that exists; its content never reaches the substitute engines.
struct PdfFixture {
  TempDirectory dir;
  std::string path;
  PdfFixture() : path((dir.path() / "invoice.pdf").string()) {
    std::ofstream(path) << "%PDF-1.4\n";
  }
};

} // namespace

TEST_CASE("extractDocument keeps a rich primary text layer", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, textOfLength(150), "unused", "unused");

  RawDocument doc = extractDocument(pdf.path, ExtractionOptions{}, engines);

  REQUIRE(doc.text == textOfLength(150));
  REQUIRE(doc.tables.size() == 1);
  REQUIRE(calls.primary == 1);
  REQUIRE(calls.secondary == 0);
  REQUIRE(calls.ocr == 0);
}

TEST_CASE("extractDocument falls back to the secondary engine for thin text", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, textOfLength(60, 'a'), textOfLength(120, 'b'), "unused");

  RawDocument doc = extractDocument(pdf.path, ExtractionOptions{}, engines);

  REQUIRE(doc.text == textOfLength(120, 'b'));
  REQUIRE(calls.secondary == 1);
  REQUIRE(calls.ocr == 0);
}

TEST_CASE("extractDocument keeps the longer text when the secondary engine is worse", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, textOfLength(80, 'a'), textOfLength(20, 'b'), "unused");

  RawDocument doc = extractDocument(pdf.path, ExtractionOptions{}, engines);

  REQUIRE(doc.text == textOfLength(80, 'a'));
  REQUIRE(calls.ocr == 0);
}

TEST_CASE("extractDocument runs OCR when the text layer is nearly empty", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, "  \n ", textOfLength(10, 'b'), textOfLength(400, 'c'));

  RawDocument doc = extractDocument(pdf.path, ExtractionOptions{}, engines);

  REQUIRE(doc.text == textOfLength(400, 'c'));
  REQUIRE(calls.secondary == 1);
  REQUIRE(calls.ocr == 1);
}

TEST_CASE("extractDocument treats a failing engine as an empty stage", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, "", textOfLength(200, 'm'), "unused");
  engines.primaryText = [](const std::string&) -> std::string {
    throw CommandError("pdftotext not found");
  };
  engines.tables = [](const std::string&) -> std::vector<Table> {
    throw CommandError("pdftotext not found");
  };

  RawDocument doc = extractDocument(pdf.path, ExtractionOptions{}, engines);

  REQUIRE(doc.text == textOfLength(200, 'm'));
  REQUIRE(doc.tables.empty());
}

TEST_CASE("extractDocument raises ExtractionError for a blank document", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, "\n\n", " ", "\t");

  REQUIRE_THROWS_AS(extractDocument(pdf.path, ExtractionOptions{}, engines), ExtractionError);
  REQUIRE(calls.ocr == 1);
}

TEST_CASE("extractDocument raises ExtractionError for a missing file", "[extract]") {
  StageCalls calls;
  auto engines = fakeEngines(calls, textOfLength(150), "", "");

  REQUIRE_THROWS_AS(extractDocument("/nonexistent/invoice.pdf", ExtractionOptions{}, engines),
                    ExtractionError);
  REQUIRE(calls.primary == 0);
}

TEST_CASE("extractDocument honours the table switch", "[extract]") {
  PdfFixture pdf;
  StageCalls calls;
  auto engines = fakeEngines(calls, textOfLength(150), "", "");
  ExtractionOptions options;
  options.extractTables = false;

  RawDocument doc = extractDocument(pdf.path, options, engines);

  REQUIRE(doc.tables.empty());
  REQUIRE(calls.tables == 0);
}

TEST_CASE("runCommand captures stdout and reports failures", "[process]") {
  REQUIRE(runCommand("printf 'a b'") == "a b");
  REQUIRE_THROWS_AS(runCommand("exit 3"), CommandError);
  REQUIRE(shellQuote("it's") == "'it'\\''s'");
  REQUIRE(runCommand("printf %s " + shellQuote("it's")) == "it's");
}

TEST_CASE("TempDirectory removes its contents", "[process]") {
  std::filesystem::path kept;
  {
    TempDirectory dir;
    kept = dir.path();
    std::ofstream(dir.path() / "page-1.png") << "x";
    REQUIRE(std::filesystem::is_directory(kept));
  }
  REQUIRE_FALSE(std::filesystem::exists(kept));
}
