#pragma once

#include <health/models.h>

namespace health {

constexpr int kExitSuccess = 0;
constexpr int kExitError = 1;
constexpr int kExitCriticalFindings = 2;

int FindingsExitCode(const DiagnosticsResult &diagnostics);

} // namespace health
