#pragma once

#include <cstddef>
#include <string>
#include <vector>

std::string trim(const std::string& s);

std::string toLower(std::string s);
std::string toUpper(std::string s);

// Splits on '\n' (a trailing '\r' is dropped). Empty lines are kept so line
// indices stay meaningful to callers scanning the document header.
std::vector<std::string> splitLines(const std::string& text);

bool containsIgnoreCase(const std::string& haystack, const std::string& needle);

std::size_t countNonWhitespace(const std::string& text);

// True for the placeholder strings table engines emit for empty cells.
bool isPlaceholderCell(const std::string& cell);

std::string removeChar(std::string s, char c);

// At most maxBytes of s, cut back so no UTF-8 sequence is split.
std::string utf8Prefix(const std::string& s, std::size_t maxBytes);
