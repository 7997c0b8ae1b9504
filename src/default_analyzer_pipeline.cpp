#include <health/default_analyzer_pipeline.h>

#include <health/metrics_engine.h>

#include <algorithm>
#include <chrono>
#include <utility>

namespace health {

DefaultAnalyzerPipeline::DefaultAnalyzerPipeline(PipelineComponents components)
    : source_acquirer_(std::move(components.source_acquirer)),
      fact_extractor_(std::move(components.fact_extractor)),
      diagnostics_engine_(std::move(components.diagnostics_engine)),
      reporter_(std::move(components.reporter)),
      logger_(EnsureLogger(std::move(components.logger))),
      heuristics_(std::move(components.heuristics)) {}

PipelineResult DefaultAnalyzerPipeline::Run(const AnalysisConfig &config) {
  logger_->Log(LogLevel::kInfo, "pipeline.start",
               {{"root", config.root_path},
                {"jobs", std::to_string(config.jobs)},
                {"formats", std::to_string(config.formats.size())}});

  const auto pipeline_start = std::chrono::steady_clock::now();
  const auto sources = source_acquirer_->Acquire(config);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "acquire"},
                {"file_count", std::to_string(sources.files.size())}});

  const auto facts = fact_extractor_->Extract(sources);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "extract"},
                {"packages", std::to_string(facts.packages.size())},
                {"skipped", std::to_string(facts.skipped_directories.size())}});

  MetricsEngineOptions metrics_options;
  metrics_options.jobs = config.jobs;
  metrics_options.timeout = config.timeout;
  if (metrics_options.timeout) {
    // The deadline covers the whole run, not only the metrics stage.
    const auto elapsed =
        std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::steady_clock::now() - pipeline_start);
    metrics_options.timeout =
        std::max(std::chrono::milliseconds(0), *metrics_options.timeout - elapsed);
  }
  const MetricsEngine metrics(heuristics_, metrics_options, logger_);
  auto analysis = metrics.Analyze(facts);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "metrics"},
                {"total_loc", std::to_string(analysis.total_loc)}});

  auto diagnostics = diagnostics_engine_->Diagnose(analysis);
  logger_->Log(LogLevel::kDebug, "pipeline.stage.complete",
               {{"stage", "diagnose"},
                {"findings", std::to_string(diagnostics.findings.size())}});

  auto report = reporter_->Render(analysis, diagnostics, config);

  const auto duration_ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - pipeline_start)
          .count();
  logger_->Log(LogLevel::kInfo, "pipeline.complete",
               {{"duration_ms", std::to_string(duration_ms)},
                {"findings", std::to_string(diagnostics.findings.size())}});

  return PipelineResult{std::move(report), std::move(analysis),
                        std::move(diagnostics)};
}

} // namespace health
