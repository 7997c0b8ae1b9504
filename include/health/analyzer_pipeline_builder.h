#pragma once

#include <health/component_registry.h>
#include <health/heuristic_config.h>
#include <health/interfaces.h>
#include <health/logging.h>

#include <memory>
#include <string>

namespace health {

class DefaultAnalyzerPipeline;

struct PipelineComponents {
  std::unique_ptr<SourceAcquirer> source_acquirer;
  std::unique_ptr<FactExtractor> fact_extractor;
  std::unique_ptr<DiagnosticsEngine> diagnostics_engine;
  std::unique_ptr<Reporter> reporter;
  std::shared_ptr<Logger> logger;
  HeuristicConfig heuristics;
};

class AnalyzerPipelineBuilder {
public:
  explicit AnalyzerPipelineBuilder(
      const ComponentRegistry &registry = GlobalComponentRegistry());

  AnalyzerPipelineBuilder &
  WithSourceAcquirer(std::unique_ptr<SourceAcquirer> source_acquirer);
  AnalyzerPipelineBuilder &
  WithFactExtractor(std::unique_ptr<FactExtractor> fact_extractor);
  AnalyzerPipelineBuilder &
  WithDiagnosticsEngine(std::unique_ptr<DiagnosticsEngine> diagnostics_engine);
  AnalyzerPipelineBuilder &WithReporter(std::unique_ptr<Reporter> reporter);
  AnalyzerPipelineBuilder &WithLogger(std::shared_ptr<Logger> logger);
  AnalyzerPipelineBuilder &WithHeuristics(HeuristicConfig heuristics);
  AnalyzerPipelineBuilder &WithFactExtractorName(std::string name);
  AnalyzerPipelineBuilder &WithDiagnosticsEngineName(std::string name);
  AnalyzerPipelineBuilder &WithReporterName(std::string name);

  // Components not injected are created from the registry by name. The
  // source acquirer defaults to a DirectorySourceAcquirer on "build".
  // Throws std::invalid_argument when no fact extractor is available.
  DefaultAnalyzerPipeline Build();

private:
  const ComponentRegistry *registry_;
  struct ComponentSelections {
    std::string fact_extractor;
    std::string diagnostics_engine;
    std::string reporter;
  } selections_;
  PipelineComponents components_;
};

} // namespace health
