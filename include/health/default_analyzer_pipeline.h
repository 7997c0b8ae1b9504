#pragma once

#include <health/analyzer_pipeline_builder.h>

#include <memory>

namespace health {

// acquire -> extract -> metrics -> diagnose -> render. Each stage finishes
// completely before the next starts.
class DefaultAnalyzerPipeline : public AnalyzerPipeline {
public:
  explicit DefaultAnalyzerPipeline(PipelineComponents components);

  PipelineResult Run(const AnalysisConfig &config) override;

private:
  std::unique_ptr<SourceAcquirer> source_acquirer_;
  std::unique_ptr<FactExtractor> fact_extractor_;
  std::unique_ptr<DiagnosticsEngine> diagnostics_engine_;
  std::unique_ptr<Reporter> reporter_;
  std::shared_ptr<Logger> logger_;
  HeuristicConfig heuristics_;
};

} // namespace health
