#include "parser_registry.hpp"

#include "fuzzy.hpp"
#include "generic_parser.hpp"
#include "pharma_biological_parser.hpp"
#include "text_utils.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace {

constexpr double kFuzzyKeywordThreshold = 80.0;

bool fuzzyKeywordMatch(const ParserStrategy& strategy, const std::string& loweredText) {
  for (const auto& keyword : strategy.supplierKeywords()) {
    if (partialRatio(toLower(keyword), loweredText) > kFuzzyKeywordThreshold) return true;
  }
  return false;
}

} // namespace

std::vector<std::unique_ptr<ParserStrategy>> createBuiltinStrategies() {
  std::vector<std::unique_ptr<ParserStrategy>> strategies;
  strategies.push_back(std::make_unique<PharmaBiologicalParser>());
  strategies.push_back(std::make_unique<GenericParser>());
  return strategies;
}

ParserRegistry::ParserRegistry(std::vector<std::unique_ptr<ParserStrategy>> strategies)
  : strategies_(std::move(strategies)) {}

const ParserRegistry& ParserRegistry::defaultRegistry() {
  static const ParserRegistry registry(createBuiltinStrategies());
  return registry;
}

std::vector<const ParserStrategy*> ParserRegistry::select(const std::string& text) const {
  const std::string lowered = toLower(text);
  std::vector<const ParserStrategy*> eligible;
  for (const auto& strategy : strategies_) {
    if (strategy->canParse(text) || fuzzyKeywordMatch(*strategy, lowered)) {
      eligible.push_back(strategy.get());
    }
  }

  std::sort(eligible.begin(), eligible.end(), [](const ParserStrategy* a, const ParserStrategy* b) {
    if (a->priority() != b->priority()) return a->priority() > b->priority();
    return a->name() < b->name();
  });

  for (const auto* strategy : eligible) {
    spdlog::debug("candidate parser: {} (priority {})", strategy->name(), strategy->priority());
  }
  return eligible;
}

const ParserStrategy* ParserRegistry::find(const std::string& name) const {
  for (const auto& strategy : strategies_) {
    if (strategy->name() == name) return strategy.get();
  }
  return nullptr;
}
