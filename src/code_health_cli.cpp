#include <health/code_health_cli.h>

#include <health/analyze_options.h>
#include <health/analyzer_pipeline_builder.h>
#include <health/clang_fact_extractor.h>
#include <health/cli_exit_codes.h>
#include <health/default_analyzer_pipeline.h>
#include <health/directory_source_acquirer.h>
#include <health/markdown_reporter.h>

#include <fstream>
#include <iostream>
#include <stdexcept>

namespace health {
namespace {

constexpr const char kDefaultFactExtractor[] = "clang";

void WriteFileIfContent(const std::filesystem::path &path,
                        const std::string &content) {
  if (content.empty()) {
    return;
  }
  std::ofstream stream(path);
  if (!stream) {
    throw std::runtime_error("Failed to open output file: " + path.string());
  }
  stream << content;
}

DefaultAnalyzerPipeline BuildAnalyzePipeline(
    const AnalyzeOptions &options, const ComponentRegistry &registry,
    const std::shared_ptr<Logger> &logger) {
  AnalyzerPipelineBuilder builder(registry);
  builder.WithLogger(logger);
  builder.WithHeuristics(BuildHeuristicConfig(options));
  builder.WithSourceAcquirer(std::make_unique<DirectorySourceAcquirer>(
      std::filesystem::path("build"), logger));
  if (options.engine) {
    builder.WithDiagnosticsEngineName(*options.engine);
  }
  if (options.reporter) {
    builder.WithReporterName(*options.reporter);
  }
  return builder.Build();
}

} // namespace

ComponentRegistry MakeCliComponentRegistry() {
  auto registry = MakeComponentRegistryWithDefaults();
  registry.RegisterFactExtractor(
      kDefaultFactExtractor,
      [](const HeuristicConfig &config) {
        return std::make_unique<ClangFactExtractor>(config);
      },
      true);
  return registry;
}

void WriteReports(const std::filesystem::path &output_directory,
                  const Report &report) {
  std::filesystem::create_directories(output_directory);
  WriteFileIfContent(output_directory / kMarkdownReportFileName,
                     report.markdown);
  WriteFileIfContent(output_directory / kJsonReportFileName, report.json);
}

int RunAnalyze(const std::vector<std::string> &arguments) {
  const auto cli_options = ParseAnalyzeArguments(arguments);
  if (cli_options.show_help) {
    PrintAnalyzeUsage(std::cout);
    return kExitSuccess;
  }

  const auto merged = ResolveAnalyzeOptions(cli_options);
  const auto root = std::filesystem::weakly_canonical(*merged.root);
  auto logger = MakeLogger(BuildLoggingConfig(merged), std::clog);

  const auto registry = MakeCliComponentRegistry();
  auto pipeline = BuildAnalyzePipeline(merged, registry, logger);
  const auto config = BuildAnalysisConfig(merged, root);

  const auto result = pipeline.Run(config);
  WriteReports(merged.output_directory.value_or(root), result.report);
  for (const auto &skipped : result.analysis.skipped_directories) {
    std::cerr << "Warning: skipped directory " << skipped
              << " (translation units failed to parse)\n";
  }
  return FindingsExitCode(result.diagnostics);
}

} // namespace health
