#include "fuzzy.hpp"

#include <algorithm>
#include <vector>

namespace {

size_t longestCommonSubsequence(const char* a, size_t lenA, const char* b, size_t lenB) {
  if (lenA == 0 || lenB == 0) return 0;
  std::vector<size_t> prev(lenB + 1, 0);
  std::vector<size_t> cur(lenB + 1, 0);
  for (size_t i = 1; i <= lenA; ++i) {
    for (size_t j = 1; j <= lenB; ++j) {
      if (a[i - 1] == b[j - 1]) {
        cur[j] = prev[j - 1] + 1;
      } else {
        cur[j] = std::max(prev[j], cur[j - 1]);
      }
    }
    std::swap(prev, cur);
  }
  return prev[lenB];
}

double windowRatio(const std::string& needle, const std::string& hay, size_t pos, size_t len) {
  size_t lcs = longestCommonSubsequence(needle.data(), needle.size(), hay.data() + pos, len);
  return 200.0 * static_cast<double>(lcs) / static_cast<double>(needle.size() + len);
}

} // namespace

double ratio(const std::string& a, const std::string& b) {
  if (a.empty() && b.empty()) return 100.0;
  size_t lcs = longestCommonSubsequence(a.data(), a.size(), b.data(), b.size());
  return 200.0 * static_cast<double>(lcs) / static_cast<double>(a.size() + b.size());
}

double partialRatio(const std::string& a, const std::string& b) {
  if (a.empty() || b.empty()) return 0.0;
  const std::string& needle = a.size() <= b.size() ? a : b;
  const std::string& hay = a.size() <= b.size() ? b : a;
  const size_t m = needle.size();
  const size_t n = hay.size();

  double best = 0.0;
  auto consider = [&](size_t pos, size_t len) {
    // A window can only score if it shares its first or last character with the needle.
    if (needle.find(hay[pos]) == std::string::npos &&
        needle.find(hay[pos + len - 1]) == std::string::npos) {
      return;
    }
    best = std::max(best, windowRatio(needle, hay, pos, len));
  };

  for (size_t len = 1; len < m && best < 100.0; ++len) {
    consider(0, len);          // clipped at the start
    consider(n - len, len);    // clipped at the end
  }
  for (size_t pos = 0; pos + m <= n && best < 100.0; ++pos) {
    consider(pos, m);
  }
  return best;
}
