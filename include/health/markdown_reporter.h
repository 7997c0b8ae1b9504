#pragma once

#include <health/heuristic_config.h>
#include <health/interfaces.h>

namespace health {

inline constexpr const char *kMarkdownReportFileName = "code_health_report.md";
inline constexpr const char *kJsonReportFileName = "code_health_report.json";

// Renders markdown, and JSON when the "json" format is requested.
class MarkdownReporter : public Reporter {
public:
  explicit MarkdownReporter(HeuristicConfig config = DefaultHeuristicConfig());

  Report Render(const AnalysisReport &report,
                const DiagnosticsResult &diagnostics,
                const AnalysisConfig &config) override;

private:
  HeuristicConfig config_;
};

std::string EscapeJsonString(const std::string &value);

} // namespace health
