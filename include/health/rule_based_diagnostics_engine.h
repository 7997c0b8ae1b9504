#pragma once

#include <health/heuristic_config.h>
#include <health/interfaces.h>

#include <string>

namespace health {

inline constexpr const char *kGodObjectFinding = "God Object";
inline constexpr const char *kUnstableFoundationFinding = "Unstable Foundation";
inline constexpr const char *kComplexFunctionFinding = "Overly Complex Function";
inline constexpr const char *kAmbiguousStructFinding = "Ambiguous Struct";
inline constexpr const char *kMethodIslandsFinding =
    "Split Responsibility (Method Islands)";
inline constexpr const char *kFieldClustersFinding =
    "Split Responsibility (Field Clusters)";

// Fixed rule set over a finished analysis. Rules run in declaration order
// (God Object, Unstable Foundation, Overly Complex Function, Ambiguous
// Struct, Method Islands, Field Clusters); each walks packages in report
// order.
class RuleBasedDiagnosticsEngine : public DiagnosticsEngine {
public:
  explicit RuleBasedDiagnosticsEngine(
      HeuristicConfig config = DefaultHeuristicConfig());

  DiagnosticsResult Diagnose(const AnalysisReport &report) override;

private:
  HeuristicConfig config_;
};

std::string SeverityName(Severity severity);

// Report anchors a finding's related_path points at.
std::string PackageAnchor(const std::string &package_path);
std::string StructAnchor(const std::string &package_path,
                         const std::string &struct_name);
std::string FunctionAnchor(const std::string &package_path,
                           const std::string &function_name);

bool HasCriticalFindings(const DiagnosticsResult &diagnostics);

} // namespace health
