#pragma once

#include <string>

// Normalized indel similarity in [0, 100]: 200 * LCS(a, b) / (|a| + |b|).
double ratio(const std::string& a, const std::string& b);

// Best ratio between the shorter string and any same-length window of the
// longer one (windows clipped at either end included). Case-sensitive; fold
// case before calling when that matters. Empty input scores 0.
double partialRatio(const std::string& a, const std::string& b);
