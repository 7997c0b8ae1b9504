#include <health/analyzer_pipeline_builder.h>

#include <health/default_analyzer_pipeline.h>
#include <health/directory_source_acquirer.h>

#include <filesystem>
#include <stdexcept>
#include <utility>

namespace health {

AnalyzerPipelineBuilder::AnalyzerPipelineBuilder(
    const ComponentRegistry &registry)
    : registry_(&registry) {
  selections_.fact_extractor = registry_->DefaultFactExtractorName();
  selections_.diagnostics_engine = registry_->DefaultDiagnosticsEngineName();
  selections_.reporter = registry_->DefaultReporterName();
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithSourceAcquirer(
    std::unique_ptr<SourceAcquirer> source_acquirer) {
  components_.source_acquirer = std::move(source_acquirer);
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithFactExtractor(
    std::unique_ptr<FactExtractor> fact_extractor) {
  components_.fact_extractor = std::move(fact_extractor);
  return *this;
}

AnalyzerPipelineBuilder &AnalyzerPipelineBuilder::WithDiagnosticsEngine(
    std::unique_ptr<DiagnosticsEngine> diagnostics_engine) {
  components_.diagnostics_engine = std::move(diagnostics_engine);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporter(std::unique_ptr<Reporter> reporter) {
  components_.reporter = std::move(reporter);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithLogger(std::shared_ptr<Logger> logger) {
  components_.logger = std::move(logger);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithHeuristics(HeuristicConfig heuristics) {
  components_.heuristics = std::move(heuristics);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithFactExtractorName(std::string name) {
  selections_.fact_extractor = std::move(name);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithDiagnosticsEngineName(std::string name) {
  selections_.diagnostics_engine = std::move(name);
  return *this;
}

AnalyzerPipelineBuilder &
AnalyzerPipelineBuilder::WithReporterName(std::string name) {
  selections_.reporter = std::move(name);
  return *this;
}

DefaultAnalyzerPipeline AnalyzerPipelineBuilder::Build() {
  components_.logger = EnsureLogger(std::move(components_.logger));
  if (!components_.fact_extractor && selections_.fact_extractor.empty()) {
    throw std::invalid_argument(
        "No fact extractor configured for the analyzer pipeline");
  }

  const auto &heuristics = components_.heuristics;
  components_.source_acquirer =
      components_.source_acquirer
          ? std::move(components_.source_acquirer)
          : std::make_unique<DirectorySourceAcquirer>(
                std::filesystem::path("build"), components_.logger);
  components_.fact_extractor =
      components_.fact_extractor
          ? std::move(components_.fact_extractor)
          : registry_->CreateFactExtractor(selections_.fact_extractor,
                                           heuristics);
  components_.diagnostics_engine =
      components_.diagnostics_engine
          ? std::move(components_.diagnostics_engine)
          : registry_->CreateDiagnosticsEngine(selections_.diagnostics_engine,
                                               heuristics);
  components_.reporter =
      components_.reporter
          ? std::move(components_.reporter)
          : registry_->CreateReporter(selections_.reporter, heuristics);
  return DefaultAnalyzerPipeline(std::move(components_));
}

} // namespace health
