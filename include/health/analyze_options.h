#pragma once

#include <health/heuristic_config.h>
#include <health/logging.h>
#include <health/models.h>

#include <filesystem>
#include <iosfwd>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace health {

struct AnalyzeOptions {
  std::optional<std::filesystem::path> root;
  std::optional<std::filesystem::path> build_directory;
  std::optional<std::filesystem::path> output_directory;
  std::optional<std::filesystem::path> config_file;
  std::optional<std::string> scope_notes;
  std::optional<std::string> module_path;
  std::optional<std::string> engine;
  std::optional<std::string> reporter;
  std::vector<std::string> formats;
  std::vector<std::string> excluded_directories;
  std::optional<int> jobs;
  std::optional<int> timeout_seconds;
  std::optional<LogLevel> log_level;
  std::map<std::string, double> thresholds;
  std::optional<std::vector<std::string>> utility_patterns;
  bool show_help = false;
};

void PrintAnalyzeUsage(std::ostream &stream);

AnalyzeOptions ParseAnalyzeArguments(const std::vector<std::string> &arguments);

// Reads a .yml/.yaml mapping. Keys are case-insensitive, '-' and '_' are
// interchangeable, and unknown keys are rejected.
AnalyzeOptions ParseConfigFile(const std::filesystem::path &path);

// Values set on the command line win over the config file.
AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options);

// Loads --config when given, merges, and validates the result.
AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options);

const std::vector<std::string> &SupportedConfigKeys();
std::vector<std::string> SupportedThresholdKeys();
std::string NormalizeConfigKey(std::string key);

HeuristicConfig BuildHeuristicConfig(const AnalyzeOptions &options);
LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options);
AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   const std::filesystem::path &root);

} // namespace health
