#include "parser_strategy.hpp"

#include "text_utils.hpp"

bool ParserStrategy::canParse(const std::string& text) const {
  const auto keywords = supplierKeywords();
  if (keywords.empty()) return false;
  const std::string lowered = toLower(text);
  for (const auto& keyword : keywords) {
    if (lowered.find(toLower(keyword)) == std::string::npos) return false;
  }
  return true;
}
