#include <health/rule_based_diagnostics_engine.h>

#include <algorithm>
#include <iomanip>
#include <sstream>
#include <string>
#include <utility>
#include <vector>

namespace health {
namespace {

std::string FormatFixed(double value, int precision) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(precision) << value;
  return stream.str();
}

std::string StructTarget(const PackageResult &package,
                         const std::string &struct_name) {
  return package.name + "." + struct_name;
}

void AddGodObjectFindings(const AnalysisReport &report,
                          const HeuristicConfig &config,
                          DiagnosticsResult &result) {
  for (const auto &package : report.packages) {
    if (package.coupling.afferent < config.god_object_afferent) {
      continue;
    }
    for (const auto &structure : package.structs) {
      const auto &cohesion = structure.cohesion;
      if (cohesion.lcom4_score < config.god_object_lcom4) {
        continue;
      }
      Finding finding{};
      finding.kind = kGodObjectFinding;
      finding.target_name = StructTarget(package, cohesion.struct_name);
      finding.severity = Severity::kCritical;
      finding.message =
          "Struct '" + cohesion.struct_name +
          "' has excessive responsibilities (LCOM4=" +
          std::to_string(cohesion.lcom4_score) +
          ") and is heavily depended upon (Ca=" +
          std::to_string(package.coupling.afferent) +
          "). Consider splitting into smaller, focused structs.";
      finding.evidence = {{"lcom4_score", cohesion.lcom4_score},
                          {"afferent", package.coupling.afferent},
                          {"package", package.name},
                          {"file_path", cohesion.file_path}};
      finding.related_path = StructAnchor(package.path, cohesion.struct_name);
      result.findings.push_back(std::move(finding));
    }
  }
}

void AddUnstableFoundationFindings(const AnalysisReport &report,
                                   const HeuristicConfig &config,
                                   DiagnosticsResult &result) {
  for (const auto &package : report.packages) {
    const auto &coupling = package.coupling;
    if (coupling.afferent < config.unstable_foundation_afferent ||
        coupling.instability < config.unstable_foundation_instability) {
      continue;
    }
    Finding finding{};
    finding.kind = kUnstableFoundationFinding;
    finding.target_name = package.name;
    finding.severity = Severity::kCritical;
    finding.message = "Package '" + package.name +
                      "' is heavily depended upon (Ca=" +
                      std::to_string(coupling.afferent) +
                      ") but highly unstable (I=" +
                      FormatFixed(coupling.instability, 2) +
                      "). This creates a fragile foundation. Consider "
                      "stabilizing this package by reducing dependencies.";
    finding.evidence = {{"afferent", coupling.afferent},
                        {"efferent", coupling.efferent},
                        {"instability", coupling.instability},
                        {"package", package.name}};
    finding.related_path = PackageAnchor(package.path);
    result.findings.push_back(std::move(finding));
  }
}

void AddComplexFunctionFindings(const AnalysisReport &report,
                                const HeuristicConfig &config,
                                DiagnosticsResult &result) {
  for (const auto &package : report.packages) {
    for (const auto &function : package.functions) {
      if (function.complexity < config.complex_function_complexity) {
        continue;
      }
      Finding finding{};
      finding.kind = kComplexFunctionFinding;
      finding.target_name = package.name + "." + function.func_name;
      finding.severity = Severity::kWarning;
      finding.message = "Function '" + function.func_name +
                        "' is too complex (Complexity=" +
                        std::to_string(function.complexity) +
                        "). High complexity makes code hard to test and "
                        "maintain. Consider refactoring into smaller "
                        "functions.";
      finding.evidence = {{"complexity", function.complexity},
                          {"function", function.func_name},
                          {"package", package.name},
                          {"file_path", function.file_path}};
      finding.related_path = FunctionAnchor(package.path, function.func_name);
      result.findings.push_back(std::move(finding));
    }
  }
}

std::vector<std::string> ComplexMethodsOf(const PackageResult &package,
                                          const std::string &struct_name,
                                          int threshold) {
  const auto prefix = struct_name + ".";
  std::vector<std::string> methods;
  for (const auto &function : package.functions) {
    const auto &name = function.func_name;
    if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
      continue;
    }
    if (function.complexity >= threshold) {
      methods.push_back(name);
    }
  }
  std::sort(methods.begin(), methods.end());
  methods.erase(std::unique(methods.begin(), methods.end()), methods.end());
  return methods;
}

void AddAmbiguousStructFindings(const AnalysisReport &report,
                                const HeuristicConfig &config,
                                DiagnosticsResult &result) {
  for (const auto &package : report.packages) {
    for (const auto &structure : package.structs) {
      const auto &cohesion = structure.cohesion;
      if (cohesion.lcom4_score < config.ambiguous_struct_lcom4) {
        continue;
      }
      auto complex_methods =
          ComplexMethodsOf(package, cohesion.struct_name,
                           config.ambiguous_struct_method_complexity);
      if (complex_methods.empty()) {
        continue;
      }
      Finding finding{};
      finding.kind = kAmbiguousStructFinding;
      finding.target_name = StructTarget(package, cohesion.struct_name);
      finding.severity = Severity::kWarning;
      finding.message = "Struct '" + cohesion.struct_name +
                        "' has unclear responsibilities (LCOM4=" +
                        std::to_string(cohesion.lcom4_score) +
                        ") and contains complex logic. This suggests mixed "
                        "concerns. Consider refactoring.";
      finding.evidence = {{"lcom4_score", cohesion.lcom4_score},
                          {"complex_methods", std::move(complex_methods)},
                          {"package", package.name},
                          {"file_path", cohesion.file_path}};
      finding.related_path = StructAnchor(package.path, cohesion.struct_name);
      result.findings.push_back(std::move(finding));
    }
  }
}

void AddMethodIslandFindings(const AnalysisReport &report,
                             DiagnosticsResult &result) {
  for (const auto &package : report.packages) {
    for (const auto &structure : package.structs) {
      if (!structure.method_clusters ||
          !structure.method_clusters->has_multiple_islands) {
        continue;
      }
      const auto &clusters = *structure.method_clusters;
      const auto &name = structure.cohesion.struct_name;
      const auto count = std::to_string(clusters.clusters.size());

      std::vector<std::string> summaries;
      for (const auto &cluster : clusters.clusters) {
        summaries.push_back("Cluster " + std::to_string(cluster.id) + " (" +
                            std::to_string(cluster.size) +
                            " methods): " + cluster.responsibility_hint);
      }
      std::string summary;
      for (std::size_t i = 0; i < summaries.size(); ++i) {
        summary += (i > 0 ? "; " : "") + summaries[i];
      }

      Finding finding{};
      finding.kind = kMethodIslandsFinding;
      finding.target_name = StructTarget(package, name);
      finding.severity = Severity::kWarning;
      finding.message =
          "Struct '" + name + "' has " + count +
          " isolated groups of private methods, suggesting " + count +
          " distinct responsibilities. Private methods that don't call each "
          "other likely serve different purposes. Clusters: " +
          summary + ". Consider splitting into separate structs.";
      finding.evidence = {
          {"cluster_count", static_cast<int>(clusters.clusters.size())},
          {"total_private_methods", clusters.total_private_methods},
          {"clusters", std::move(summaries)},
          {"package", package.name},
          {"file_path", structure.cohesion.file_path}};
      finding.related_path = StructAnchor(package.path, name);
      result.findings.push_back(std::move(finding));
    }
  }
}

void AddFieldClusterFindings(const AnalysisReport &report,
                             const HeuristicConfig &config,
                             DiagnosticsResult &result) {
  for (const auto &package : report.packages) {
    for (const auto &structure : package.structs) {
      if (!structure.field_clusters ||
          !structure.field_clusters->has_multiple_responsibilities) {
        continue;
      }
      const auto &clusters = *structure.field_clusters;
      const auto &name = structure.cohesion.struct_name;

      Finding finding{};
      finding.kind = kFieldClustersFinding;
      finding.target_name = StructTarget(package, name);
      finding.severity =
          clusters.estimated_clusters >= config.critical_field_clusters
              ? Severity::kCritical
              : Severity::kWarning;
      finding.message = "Struct '" + name + "' shows " +
                        std::to_string(clusters.estimated_clusters) +
                        " distinct responsibility patterns in method-field "
                        "usage (PCA analysis). " +
                        clusters.recommendation_text;
      finding.evidence = {
          {"estimated_clusters", clusters.estimated_clusters},
          {"explained_variance", clusters.explained_variance},
          {"method_count", static_cast<int>(clusters.method_names.size())},
          {"field_count", static_cast<int>(clusters.field_names.size())},
          {"package", package.name},
          {"file_path", structure.cohesion.file_path},
          {"recommendations", clusters.recommendation_text}};
      finding.related_path = StructAnchor(package.path, name);
      result.findings.push_back(std::move(finding));
    }
  }
}

} // namespace

std::string SeverityName(Severity severity) {
  switch (severity) {
  case Severity::kWarning:
    return "Warning";
  case Severity::kCritical:
    return "Critical";
  }
  return "Unknown";
}

std::string PackageAnchor(const std::string &package_path) {
  return "#package-" + package_path;
}

std::string StructAnchor(const std::string &package_path,
                         const std::string &struct_name) {
  return "#struct-" + package_path + "-" + struct_name;
}

std::string FunctionAnchor(const std::string &package_path,
                           const std::string &function_name) {
  return "#function-" + package_path + "-" + function_name;
}

bool HasCriticalFindings(const DiagnosticsResult &diagnostics) {
  return std::any_of(diagnostics.findings.begin(), diagnostics.findings.end(),
                     [](const Finding &finding) {
                       return finding.severity == Severity::kCritical;
                     });
}

RuleBasedDiagnosticsEngine::RuleBasedDiagnosticsEngine(HeuristicConfig config)
    : config_(std::move(config)) {}

DiagnosticsResult
RuleBasedDiagnosticsEngine::Diagnose(const AnalysisReport &report) {
  DiagnosticsResult result;
  AddGodObjectFindings(report, config_, result);
  AddUnstableFoundationFindings(report, config_, result);
  AddComplexFunctionFindings(report, config_, result);
  AddAmbiguousStructFindings(report, config_, result);
  AddMethodIslandFindings(report, result);
  AddFieldClusterFindings(report, config_, result);
  return result;
}

} // namespace health
