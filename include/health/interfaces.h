#pragma once

#include <health/models.h>

namespace health {

class SourceAcquirer {
public:
  virtual ~SourceAcquirer() = default;
  virtual SourceAcquisitionResult Acquire(const AnalysisConfig &config) = 0;
};

class FactExtractor {
public:
  virtual ~FactExtractor() = default;
  virtual FactModel Extract(const SourceAcquisitionResult &sources) = 0;
};

class DiagnosticsEngine {
public:
  virtual ~DiagnosticsEngine() = default;
  virtual DiagnosticsResult Diagnose(const AnalysisReport &report) = 0;
};

class Reporter {
public:
  virtual ~Reporter() = default;
  virtual Report Render(const AnalysisReport &report,
                        const DiagnosticsResult &diagnostics,
                        const AnalysisConfig &config) = 0;
};

class AnalyzerPipeline {
public:
  virtual ~AnalyzerPipeline() = default;
  virtual PipelineResult Run(const AnalysisConfig &config) = 0;
};

} // namespace health
