#pragma once

#include <health/component_registry.h>
#include <health/models.h>

#include <filesystem>
#include <string>
#include <vector>

namespace health {

// Default registry plus the libclang fact extractor ("clang").
ComponentRegistry MakeCliComponentRegistry();

void WriteReports(const std::filesystem::path &output_directory,
                  const Report &report);

// Runs the analyze command and returns the process exit code. Errors
// propagate as exceptions.
int RunAnalyze(const std::vector<std::string> &arguments);

} // namespace health
