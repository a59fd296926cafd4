#pragma once

#include "invoice.hpp"

#include <optional>
#include <string>
#include <vector>

// Dosage-form and unit words that mark a line or description as pharmaceutical.
const std::vector<std::string>& pharmaKeywords();

// Number of pharmaKeywords() contained in `text` (case-insensitive).
int countPharmaKeywords(const std::string& text);

// Supplier name from the document header (first 10 lines).
FieldResult<std::string> findSupplier(const std::string& text);

// First GSTIN-shaped token in the text, scored by validateGstin().
FieldResult<std::string> findGstin(const std::string& text);

// 0.9 for a well-formed 15 character GSTIN, 0.6 when only the length is
// right, 0 otherwise. The check character is not verified.
double validateGstin(const std::string& candidate);

FieldResult<std::string> findInvoiceNumber(const std::string& text);

FieldResult<Date> findInvoiceDate(const std::string& text);

FieldResult<std::string> findDrugLicense(const std::string& text);

// strptime-like parser for the directives %d %m %Y %b %B. A space in the
// format matches one or more whitespace characters; every other character
// must match literally. The whole input must be consumed and the result must
// be a real calendar date.
std::optional<Date> parseDate(const std::string& text, const std::string& format);
