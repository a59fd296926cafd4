#pragma once

#include <string>
#include <vector>

// One reconstructed item grid. rows[0] is the header row.
struct Table {
  int pageNumber = 0;
  std::vector<std::vector<std::string>> rows;
};

// Runs `pdftotext -bbox-layout` over the page range (lastPage <= 0 means to
// the end) and rebuilds at most one item table per page.
std::vector<Table> extractTablesFromPdf(const std::string& pdfPath,
                                        int firstPage = 1,
                                        int lastPage = -1);

// Table reconstruction over an already captured bbox-layout document.
std::vector<Table> tablesFromBboxLayout(const std::string& layout);

// Writes table_<page>_<index>.csv files into outDir, creating it if needed.
void writeTablesAsCsv(const std::vector<Table>& tables, const std::string& outDir);
