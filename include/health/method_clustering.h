#pragma once

#include <health/heuristic_config.h>
#include <health/models.h>

#include <optional>
#include <string>
#include <vector>

namespace health {

// Detects islands of private, non-utility methods that never call each other.
class MethodClusterAnalyzer {
public:
  explicit MethodClusterAnalyzer(
      HeuristicConfig config = DefaultHeuristicConfig());

  // No result when the struct has no methods or no private methods.
  std::optional<MethodClusterResult>
  Analyze(const StructFacts &structure) const;

  // Clusters smaller than this are dropped unless they are the only one.
  int MinimumClusterSize(int total_methods) const;

  // "<Word>-related operations" from the most frequent non-trivial word;
  // ties resolve to the lexicographically smallest word.
  std::string SuggestResponsibility(const std::vector<std::string> &methods) const;

private:
  HeuristicConfig config_;
};

} // namespace health
