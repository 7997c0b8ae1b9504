#pragma once

#include <string>
#include <vector>

namespace health {

struct HeuristicConfig {
  std::vector<std::string> utility_patterns = {"test", "util", "helper",
                                               "mock", "stub"};
  std::vector<std::string> accessor_prefixes = {"Get", "Set", "Is", "Has"};
  std::vector<std::string> trivial_words = {"get", "set", "is", "has", "do"};

  int god_object_lcom4 = 5;
  int god_object_afferent = 10;
  int unstable_foundation_afferent = 10;
  double unstable_foundation_instability = 0.7;
  int complex_function_complexity = 15;
  int ambiguous_struct_lcom4 = 3;
  int ambiguous_struct_method_complexity = 10;

  int min_call_frequency = 1;
  int min_cluster_size = 2;
  double min_cluster_ratio = 0.2;

  int min_fields = 3;
  int min_methods = 2;
  int max_components = 5;
  int power_iterations = 100;
  double eigenvalue_epsilon = 1e-10;
  double deflation_factor = 0.5;
  double kaiser_threshold = 1.0;
  double elbow_threshold = 0.1;
  double cumulative_variance_threshold = 0.8;
  int max_estimated_clusters = 5;
  int critical_field_clusters = 3;

  // Summary thresholds used by reporters.
  int summary_high_lcom4 = 2;
  int summary_high_complexity = 15;
  double summary_high_instability = 0.7;
};

const HeuristicConfig &DefaultHeuristicConfig();

// First letter of the bare (unqualified) name is lowercase.
bool IsPrivateName(const std::string &name);

bool IsUtilityMethodName(const std::string &name,
                         const HeuristicConfig &config = DefaultHeuristicConfig());

std::string QualifiedMethodName(const std::string &struct_name,
                                const std::string &method_name);

// Strips everything up to the last '.' of a qualified name.
std::string BareName(const std::string &qualified_name);

// Splits camelCase and snake_case identifiers into words.
std::vector<std::string> SplitIdentifierWords(const std::string &identifier);

} // namespace health
