#pragma once

#include "parser_strategy.hpp"

#include <memory>
#include <string>
#include <vector>

// Every strategy compiled into the library, generic one included.
std::vector<std::unique_ptr<ParserStrategy>> createBuiltinStrategies();

class ParserRegistry {
public:
  explicit ParserRegistry(std::vector<std::unique_ptr<ParserStrategy>> strategies);

  // Built-in strategies; constructed on first use and immutable afterwards.
  static const ParserRegistry& defaultRegistry();

  // Strategies eligible for `text`, highest priority first (ties by name).
  // A strategy is eligible when canParse() accepts the text or one of its
  // supplier keywords fuzzily matches it (partial ratio above 80).
  std::vector<const ParserStrategy*> select(const std::string& text) const;

  const std::vector<std::unique_ptr<ParserStrategy>>& strategies() const { return strategies_; }

  // Looks a strategy up by name; nullptr when not registered.
  const ParserStrategy* find(const std::string& name) const;

private:
  std::vector<std::unique_ptr<ParserStrategy>> strategies_;
};
