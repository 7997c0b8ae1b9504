#include <health/metrics_engine.h>

#include <health/cohesion_analyzer.h>
#include <health/complexity_analyzer.h>
#include <health/coupling_analyzer.h>
#include <health/errors.h>
#include <health/field_clustering.h>
#include <health/method_clustering.h>

#include <algorithm>
#include <future>
#include <map>
#include <stdexcept>
#include <string>
#include <utility>
#include <vector>

namespace health {
namespace {

using Clock = std::chrono::steady_clock;

std::map<std::string, CouplingResult>
CouplingBarrier(const FactModel &model) {
  const auto graph = BuildDependencyGraph(model);
  auto coupling = CalculateCoupling(graph, model.module_path);
  const auto depths = CalculateDependencyDepth(graph, model.module_path);
  for (auto &[path, result] : coupling) {
    result.dependency_depth = depths.at(path);
  }
  return coupling;
}

} // namespace

MetricsEngine::MetricsEngine(HeuristicConfig config,
                             MetricsEngineOptions options,
                             std::shared_ptr<Logger> logger)
    : config_(std::move(config)), options_(options),
      logger_(EnsureLogger(std::move(logger))) {
  if (options_.jobs < 1) {
    throw std::invalid_argument("jobs must be at least 1");
  }
}

PackageResult MetricsEngine::AnalyzePackage(const PackageFacts &package,
                                            const std::string &module_path,
                                            const CouplingResult &coupling) const {
  const MethodClusterAnalyzer method_clusters(config_);
  const FieldClusterAnalyzer field_clusters(config_);

  PackageResult result;
  result.name = package.name;
  result.path = package.path;
  result.coupling = coupling;
  result.coupling.package_name = package.name;

  for (const auto &structure : package.structs) {
    StructResult struct_result;
    struct_result.cohesion = CalculateLcom4(structure);
    struct_result.method_clusters = method_clusters.Analyze(structure);
    struct_result.field_clusters = field_clusters.Analyze(structure);
    result.structs.push_back(std::move(struct_result));
  }
  result.functions = CalculateComplexity(package, module_path);

  result.total_loc = package.total_lines;
  result.file_count = static_cast<int>(package.files.size());
  result.func_count = static_cast<int>(result.functions.size());
  if (result.func_count > 0) {
    int function_loc = 0;
    for (const auto &function : result.functions) {
      function_loc += function.loc;
    }
    result.avg_func_loc =
        static_cast<double>(function_loc) / static_cast<double>(result.func_count);
  }
  return result;
}

AnalysisReport MetricsEngine::Analyze(const FactModel &model) const {
  const auto start = Clock::now();
  std::optional<Clock::time_point> deadline;
  if (options_.timeout) {
    deadline = start + *options_.timeout;
  }

  std::vector<const PackageFacts *> packages;
  for (const auto &package : model.packages) {
    packages.push_back(&package);
  }
  std::sort(packages.begin(), packages.end(),
            [](const PackageFacts *left, const PackageFacts *right) {
              return left->path < right->path;
            });

  const auto coupling = CouplingBarrier(model);
  logger_->Log(LogLevel::kDebug, "metrics.coupling.complete",
               {{"packages", std::to_string(coupling.size())}});

  AnalysisReport report;
  report.module_path = model.module_path;
  report.skipped_directories = model.skipped_directories;
  report.packages.reserve(packages.size());

  const auto check_deadline = [&](std::size_t completed) {
    if (deadline && Clock::now() >= *deadline) {
      logger_->Log(LogLevel::kError, "metrics.aborted",
                   {{"completed_packages", std::to_string(completed)},
                    {"total_packages", std::to_string(packages.size())}});
      throw AnalysisAborted("Analysis deadline expired after " +
                                std::to_string(completed) + " of " +
                                std::to_string(packages.size()) + " packages",
                            completed);
    }
  };
  const auto analyze = [&](const PackageFacts *package) {
    return AnalyzePackage(*package, model.module_path,
                          coupling.at(package->path));
  };

  const auto batch_size = static_cast<std::size_t>(options_.jobs);
  for (std::size_t begin = 0; begin < packages.size(); begin += batch_size) {
    const auto end = std::min(packages.size(), begin + batch_size);
    if (batch_size == 1) {
      check_deadline(report.packages.size());
      report.packages.push_back(analyze(packages[begin]));
      continue;
    }

    std::vector<std::future<PackageResult>> futures;
    for (auto index = begin; index < end; ++index) {
      check_deadline(report.packages.size());
      futures.push_back(
          std::async(std::launch::async, analyze, packages[index]));
    }
    for (auto &future : futures) {
      report.packages.push_back(future.get());
    }
  }

  for (const auto &package : report.packages) {
    report.total_loc += package.total_loc;
    logger_->Log(LogLevel::kDebug, "metrics.package.complete",
                 {{"package", package.path},
                  {"structs", std::to_string(package.structs.size())},
                  {"functions", std::to_string(package.functions.size())}});
  }

  const auto duration_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                               Clock::now() - start)
                               .count();
  logger_->Log(LogLevel::kInfo, "metrics.complete",
               {{"packages", std::to_string(report.packages.size())},
                {"total_loc", std::to_string(report.total_loc)},
                {"duration_ms", std::to_string(duration_ms)}});
  return report;
}

} // namespace health
