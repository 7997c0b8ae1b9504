#pragma once

#include <health/heuristic_config.h>
#include <health/logging.h>
#include <health/models.h>

#include <chrono>
#include <memory>
#include <optional>

namespace health {

struct MetricsEngineOptions {
  int jobs = 1;
  std::optional<std::chrono::milliseconds> timeout;
};

// Runs every per-package analyzer and the coupling builder over a complete
// fact model. Packages are analyzed independently (in parallel when jobs > 1)
// after the dependency graph barrier; results come back ordered by package
// path.
class MetricsEngine {
public:
  explicit MetricsEngine(HeuristicConfig config = DefaultHeuristicConfig(),
                         MetricsEngineOptions options = {},
                         std::shared_ptr<Logger> logger = nullptr);

  // Throws AnalysisAborted once the deadline passes between packages and
  // InvariantViolation when a package's facts are inconsistent.
  AnalysisReport Analyze(const FactModel &model) const;

  PackageResult AnalyzePackage(const PackageFacts &package,
                               const std::string &module_path,
                               const CouplingResult &coupling) const;

private:
  HeuristicConfig config_;
  MetricsEngineOptions options_;
  std::shared_ptr<Logger> logger_;
};

} // namespace health
