#include <health/complexity_analyzer.h>

#include <health/coupling_analyzer.h>

#include <map>
#include <set>

namespace health {
namespace {

std::map<std::string, int>
CountInPackageCallers(const std::vector<FunctionFacts> &functions) {
  std::map<std::string, std::set<std::string>> callers;
  for (const auto &function : functions) {
    callers.emplace(function.qualified_name, std::set<std::string>{});
  }

  for (const auto &caller : functions) {
    if (!caller.has_body) {
      continue;
    }
    for (const auto &[callee, frequency] : caller.calls) {
      if (frequency < 1 || callee == caller.qualified_name) {
        continue;
      }
      const auto target = callers.find(callee);
      if (target != callers.end()) {
        target->second.insert(caller.qualified_name);
      }
    }
  }

  std::map<std::string, int> counts;
  for (const auto &[callee, names] : callers) {
    counts[callee] = static_cast<int>(names.size());
  }
  return counts;
}

} // namespace

int CyclomaticComplexity(const FunctionFacts &function) {
  if (!function.has_body) {
    return 1;
  }
  return 1 + function.decision_points.Total();
}

int FunctionLoc(const FunctionFacts &function) {
  if (!function.has_body) {
    return 0;
  }
  const auto lines = function.body_end_line - function.body_start_line;
  return lines < 0 ? 0 : lines;
}

double Instability(int afferent, int efferent) {
  const auto total = afferent + efferent;
  if (total <= 0) {
    return 0.0;
  }
  return static_cast<double>(efferent) / static_cast<double>(total);
}

std::pair<std::vector<std::string>, std::vector<std::string>>
CategorizeDependencies(const std::vector<std::string> &dependencies,
                       const std::string &module_path) {
  std::vector<std::string> internal;
  std::vector<std::string> external;
  for (const auto &dependency : dependencies) {
    if (IsWithinModule(dependency, module_path)) {
      internal.push_back(dependency);
    } else {
      external.push_back(dependency);
    }
  }
  return {internal, external};
}

std::vector<ComplexityResult>
CalculateComplexity(const PackageFacts &package,
                    const std::string &module_path) {
  const auto afferent = CountInPackageCallers(package.functions);

  std::vector<ComplexityResult> results;
  results.reserve(package.functions.size());
  for (const auto &function : package.functions) {
    ComplexityResult result;
    result.func_name = function.qualified_name;
    result.file_path = function.file_path;
    result.complexity = CyclomaticComplexity(function);
    result.loc = FunctionLoc(function);
    if (function.has_body) {
      result.dependencies.assign(function.imported_packages_used.begin(),
                                 function.imported_packages_used.end());
    }
    auto [internal, external] =
        CategorizeDependencies(result.dependencies, module_path);
    result.internal_dependencies = std::move(internal);
    result.external_dependencies = std::move(external);
    result.efferent = static_cast<int>(result.dependencies.size());
    result.afferent = afferent.at(function.qualified_name);
    result.instability = Instability(result.afferent, result.efferent);
    results.push_back(std::move(result));
  }
  return results;
}

} // namespace health
