#include <health/method_clustering.h>

#include <health/errors.h>
#include <health/union_find.h>

#include <algorithm>
#include <cctype>
#include <cmath>
#include <map>
#include <set>
#include <utility>

namespace health {
namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::string Capitalize(std::string word) {
  if (!word.empty()) {
    word.front() = static_cast<char>(
        std::toupper(static_cast<unsigned char>(word.front())));
  }
  return word;
}

using MethodIndex = std::map<std::string, const MethodFacts *>;

std::vector<std::string>
FindPublicCallers(const std::vector<std::string> &cluster,
                  const MethodIndex &public_methods) {
  std::set<std::string> callers;
  for (const auto &[name, method] : public_methods) {
    for (const auto &member : cluster) {
      const auto call = method->calls.find(member);
      if (call != method->calls.end() && call->second >= 1) {
        callers.insert(name);
        break;
      }
    }
  }
  return {callers.begin(), callers.end()};
}

} // namespace

MethodClusterAnalyzer::MethodClusterAnalyzer(HeuristicConfig config)
    : config_(std::move(config)) {}

int MethodClusterAnalyzer::MinimumClusterSize(int total_methods) const {
  const auto ratio_based = static_cast<int>(
      std::lround(static_cast<double>(total_methods) * config_.min_cluster_ratio));
  return std::max(config_.min_cluster_size, ratio_based);
}

std::string MethodClusterAnalyzer::SuggestResponsibility(
    const std::vector<std::string> &methods) const {
  if (methods.empty()) {
    return "Unknown";
  }

  const std::set<std::string> trivial(config_.trivial_words.begin(),
                                      config_.trivial_words.end());
  std::map<std::string, int> keywords;
  for (const auto &method : methods) {
    const auto separator = method.rfind('.');
    if (separator == std::string::npos) {
      continue;
    }
    for (const auto &word : SplitIdentifierWords(method.substr(separator + 1))) {
      const auto lowered = ToLower(word);
      if (trivial.count(lowered) != 0) {
        continue;
      }
      ++keywords[lowered];
    }
  }

  std::string common_word;
  int max_count = 0;
  for (const auto &[word, count] : keywords) {
    if (count > max_count) {
      max_count = count;
      common_word = word;
    }
  }

  if (common_word.empty()) {
    return "Mixed operations";
  }
  return Capitalize(common_word) + "-related operations";
}

std::optional<MethodClusterResult>
MethodClusterAnalyzer::Analyze(const StructFacts &structure) const {
  if (structure.methods.empty()) {
    return std::nullopt;
  }

  MethodIndex private_methods;
  MethodIndex public_methods;
  for (const auto &method : structure.methods) {
    auto &target = method.is_private ? private_methods : public_methods;
    target.emplace(method.qualified_name, &method);
  }
  if (private_methods.empty()) {
    return std::nullopt;
  }

  UnionFind graph;
  for (const auto &[name, method] : private_methods) {
    if (!method->is_utility) {
      graph.Add(name);
    }
  }
  for (const auto &[name, method] : private_methods) {
    if (method->is_utility) {
      continue;
    }
    for (const auto &[callee, frequency] : method->calls) {
      if (frequency < config_.min_call_frequency || !graph.Contains(callee)) {
        continue;
      }
      graph.Union(name, callee);
    }
  }

  const auto total_methods = static_cast<int>(graph.Size());
  const auto components = graph.Components();
  const auto min_size = MinimumClusterSize(total_methods);

  MethodClusterResult result;
  result.total_private_methods = static_cast<int>(private_methods.size());
  for (auto component : components) {
    const auto size = static_cast<int>(component.size());
    if (size < min_size && components.size() != 1) {
      continue;
    }
    std::sort(component.begin(), component.end());
    MethodCluster cluster;
    cluster.methods = std::move(component);
    cluster.size = size;
    result.clusters.push_back(std::move(cluster));
  }

  std::stable_sort(result.clusters.begin(), result.clusters.end(),
                   [](const MethodCluster &left, const MethodCluster &right) {
                     if (left.size != right.size) {
                       return left.size > right.size;
                     }
                     return left.methods.front() < right.methods.front();
                   });

  for (std::size_t i = 0; i < result.clusters.size(); ++i) {
    auto &cluster = result.clusters[i];
    if (cluster.methods.empty()) {
      throw InvariantViolation("Empty method cluster for " + structure.name);
    }
    cluster.id = static_cast<int>(i) + 1;
    cluster.called_by = FindPublicCallers(cluster.methods, public_methods);
    cluster.responsibility_hint = SuggestResponsibility(cluster.methods);
  }
  result.has_multiple_islands = result.clusters.size() >= 2;
  return result;
}

} // namespace health
