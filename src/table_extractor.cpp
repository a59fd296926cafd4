#include "table_extractor.hpp"

#include "process.hpp"
#include "text_utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <regex>
#include <stdexcept>
#include <string>

#include <spdlog/spdlog.h>

namespace {

struct WordBox {
  int pageNumber;
  double xMin;
  double yMin;
  double xMax;
  double yMax;
  std::string text;
};

// Words of a row merged while they sit closer than a word height apart.
struct Phrase {
  double xMin;
  double xMax;
  std::string text;
};

const char* const kHeaderKeywords[] = {
  "description", "particulars", "product", "item", "qty", "quantity", "batch",
  "hsn", "exp", "rate", "mrp", "amount", "total", "s.no", "sr.",
};

const std::map<std::string, char>& namedEntities() {
  static const std::map<std::string, char> entities = {
    {"amp", '&'}, {"lt", '<'}, {"gt", '>'}, {"quot", '"'}, {"apos", '\''},
  };
  return entities;
}

// Decodes one entity body (the text between '&' and ';'). Returns 0 when it
// is unknown or outside ASCII.
char decodeEntity(const std::string& body) {
  auto named = namedEntities().find(body);
  if (named != namedEntities().end()) return named->second;
  if (body.size() < 2 || body[0] != '#') return 0;

  const bool hex = body[1] == 'x' || body[1] == 'X';
  const std::string digits = body.substr(hex ? 2 : 1);
  if (digits.empty() || digits.size() > 6) return 0;
  for (unsigned char c : digits) {
    if (hex ? !std::isxdigit(c) : !std::isdigit(c)) return 0;
  }
  unsigned long code = std::stoul(digits, nullptr, hex ? 16 : 10);
  return code > 0 && code <= 0x7F ? static_cast<char>(code) : 0;
}

std::string decodeEntities(const std::string& raw) {
  std::string decoded;
  decoded.reserve(raw.size());
  size_t pos = 0;
  while (pos < raw.size()) {
    size_t amp = raw.find('&', pos);
    if (amp == std::string::npos) {
      decoded.append(raw, pos, std::string::npos);
      break;
    }
    decoded.append(raw, pos, amp - pos);
    size_t semi = raw.find(';', amp + 1);
    char c = semi == std::string::npos ? 0 : decodeEntity(raw.substr(amp + 1, semi - amp - 1));
    if (c != 0) {
      decoded.push_back(c);
      pos = semi + 1;
    } else {
      decoded.push_back('&');
      pos = amp + 1;
    }
  }
  return decoded;
}

std::string runPdftotextBboxLayout(const std::string& pdfPath, int firstPage, int lastPage) {
  if (!commandExists("pdftotext")) {
    throw CommandError("pdftotext not found; install poppler-utils");
  }
  std::string range;
  if (firstPage > 0) range += " -f " + std::to_string(firstPage);
  if (lastPage > 0 && lastPage >= firstPage) range += " -l " + std::to_string(lastPage);
  return runCommand("pdftotext -q -bbox-layout" + range + " " + shellQuote(pdfPath) + " - 2>/dev/null");
}

std::vector<WordBox> parseWords(const std::string& layout) {
  // pdftotext does not number its <page> elements, so pages are counted in order.
  static const std::regex tokenRe(
    "<page[\\s>]|<word[^>]*?xMin=\"([0-9.]+)\"[^>]*?yMin=\"([0-9.]+)\"[^>]*?"
    "xMax=\"([0-9.]+)\"[^>]*?yMax=\"([0-9.]+)\"[^>]*>([^<]*)</word>");

  std::vector<WordBox> boxes;
  int page = 0;
  for (std::sregex_iterator it(layout.begin(), layout.end(), tokenRe), end; it != end; ++it) {
    const std::smatch& m = *it;
    if (!m[1].matched) {
      ++page;
      continue;
    }
    std::string text = trim(decodeEntities(m[5].str()));
    if (text.empty()) continue;
    boxes.push_back(WordBox{std::max(page, 1), std::stod(m[1].str()), std::stod(m[2].str()),
                            std::stod(m[3].str()), std::stod(m[4].str()), std::move(text)});
  }
  return boxes;
}

double median(std::vector<double> values) {
  if (values.empty()) return 0.0;
  auto mid = values.begin() + values.size() / 2;
  std::nth_element(values.begin(), mid, values.end());
  return *mid;
}

double centreY(const WordBox& w) { return (w.yMin + w.yMax) / 2.0; }

double centreX(const Phrase& p) { return (p.xMin + p.xMax) / 2.0; }

// Words sharing a baseline band, left to right.
using Line = std::vector<const WordBox*>;

std::vector<Line> groupLines(const std::vector<WordBox>& words, double tolerance) {
  std::vector<const WordBox*> ordered;
  ordered.reserve(words.size());
  for (const auto& w : words) ordered.push_back(&w);
  std::stable_sort(ordered.begin(), ordered.end(), [](const WordBox* a, const WordBox* b) {
    return centreY(*a) < centreY(*b);
  });

  std::vector<Line> lines;
  double bandCentre = 0.0;
  for (const WordBox* w : ordered) {
    if (lines.empty() || std::abs(centreY(*w) - bandCentre) > tolerance) {
      lines.emplace_back();
      bandCentre = centreY(*w);
    }
    Line& line = lines.back();
    line.push_back(w);
    bandCentre += (centreY(*w) - bandCentre) / static_cast<double>(line.size());
  }

  for (auto& line : lines) {
    std::sort(line.begin(), line.end(), [](const WordBox* a, const WordBox* b) { return a->xMin < b->xMin; });
  }
  return lines;
}

std::vector<Phrase> mergePhrases(const Line& line, double maxGap) {
  std::vector<Phrase> phrases;
  for (const WordBox* w : line) {
    if (!phrases.empty() && w->xMin - phrases.back().xMax <= maxGap) {
      Phrase& last = phrases.back();
      last.text += ' ' + w->text;
      last.xMax = std::max(last.xMax, w->xMax);
    } else {
      phrases.push_back(Phrase{w->xMin, w->xMax, w->text});
    }
  }
  return phrases;
}

bool looksLikeHeader(const std::vector<Phrase>& phrases) {
  if (phrases.size() < 2) return false;
  auto hits = std::count_if(phrases.begin(), phrases.end(), [](const Phrase& p) {
    const std::string lowered = toLower(p.text);
    return std::any_of(std::begin(kHeaderKeywords), std::end(kHeaderKeywords), [&lowered](const char* keyword) {
      return lowered.find(keyword) != std::string::npos;
    });
  });
  return hits >= 2;
}

// Column centres seeded by the header phrases. A body phrase further than
// `tolerance` from every known column opens a new one.
std::vector<double> columnCentres(const std::vector<std::vector<Phrase>>& rows, double tolerance) {
  std::vector<double> centres;
  std::vector<int> members;
  for (const auto& row : rows) {
    for (const auto& phrase : row) {
      const double x = centreX(phrase);
      auto nearest = std::min_element(centres.begin(), centres.end(), [x](double a, double b) {
        return std::abs(a - x) < std::abs(b - x);
      });
      if (nearest != centres.end() && std::abs(*nearest - x) <= tolerance) {
        size_t idx = static_cast<size_t>(nearest - centres.begin());
        ++members[idx];
        centres[idx] += (x - centres[idx]) / members[idx];
      } else {
        centres.push_back(x);
        members.push_back(1);
      }
    }
  }

  std::sort(centres.begin(), centres.end());
  return centres;
}

size_t nearestColumn(const std::vector<double>& centres, double x) {
  size_t best = 0;
  for (size_t c = 1; c < centres.size(); ++c) {
    if (std::abs(x - centres[c]) < std::abs(x - centres[best])) best = c;
  }
  return best;
}

std::vector<std::vector<std::string>> buildGrid(const std::vector<std::vector<Phrase>>& rows,
                                                const std::vector<double>& centres) {
  std::vector<std::vector<std::string>> grid;
  grid.reserve(rows.size());
  for (const auto& row : rows) {
    std::vector<std::string> cells(centres.size());
    for (const auto& phrase : row) {
      std::string& cell = cells[nearestColumn(centres, centreX(phrase))];
      if (!cell.empty()) cell += ' ';
      cell += phrase.text;
    }
    grid.push_back(std::move(cells));
  }
  return grid;
}

std::string csvField(const std::string& cell) {
  if (cell.find_first_of(",\"\n") == std::string::npos) return cell;
  std::string quoted = "\"";
  for (char ch : cell) {
    quoted += ch;
    if (ch == '"') quoted += '"';
  }
  return quoted + '"';
}

} // namespace

std::vector<Table> tablesFromBboxLayout(const std::string& layout) {
  std::map<int, std::vector<WordBox>> pages;
  for (auto& w : parseWords(layout)) pages[w.pageNumber].push_back(std::move(w));

  std::vector<Table> tables;
  for (const auto& [page, words] : pages) {
    std::vector<double> heights;
    std::vector<double> widths;
    for (const auto& w : words) {
      heights.push_back(w.yMax - w.yMin);
      widths.push_back(w.xMax - w.xMin);
    }
    const double heightMedian = median(heights);
    const double wordHeight = heightMedian > 0 ? heightMedian : 6.0;

    std::vector<std::vector<Phrase>> phraseRows;
    for (const auto& line : groupLines(words, wordHeight * 0.8)) {
      phraseRows.push_back(mergePhrases(line, wordHeight));
    }

    auto header = std::find_if(phraseRows.begin(), phraseRows.end(), looksLikeHeader);
    if (header == phraseRows.end()) {
      spdlog::debug("page {}: no table header found", page);
      continue;
    }
    std::vector<std::vector<Phrase>> tableRows(header, phraseRows.end());
    if (tableRows.size() < 2) continue;

    std::vector<double> centres = columnCentres(tableRows, std::max(8.0, median(widths) * 1.2));
    if (centres.size() < 2) continue;

    Table table;
    table.pageNumber = page;
    table.rows = buildGrid(tableRows, centres);
    spdlog::debug("page {}: table with {} rows x {} columns", page, table.rows.size(), centres.size());
    tables.push_back(std::move(table));
  }
  return tables;
}

std::vector<Table> extractTablesFromPdf(const std::string& pdfPath, int firstPage, int lastPage) {
  return tablesFromBboxLayout(runPdftotextBboxLayout(pdfPath, firstPage, lastPage));
}

void writeTablesAsCsv(const std::vector<Table>& tables, const std::string& outDir) {
  std::filesystem::create_directories(outDir);

  std::map<int, int> perPage;
  for (const auto& table : tables) {
    const int index = perPage[table.pageNumber]++;
    const std::filesystem::path file =
      std::filesystem::path(outDir) / ("table_" + std::to_string(table.pageNumber) + "_" + std::to_string(index) + ".csv");
    std::ofstream out(file);
    if (!out) {
      throw std::runtime_error("Cannot write " + file.string());
    }
    for (const auto& row : table.rows) {
      for (size_t i = 0; i < row.size(); ++i) {
        if (i > 0) out << ',';
        out << csvField(row[i]);
      }
      out << '\n';
    }
    spdlog::debug("wrote {} ({} rows)", file.string(), table.rows.size());
  }
}
