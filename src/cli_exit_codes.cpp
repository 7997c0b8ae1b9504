#include <health/cli_exit_codes.h>

#include <health/rule_based_diagnostics_engine.h>

namespace health {

int FindingsExitCode(const DiagnosticsResult &diagnostics) {
  return HasCriticalFindings(diagnostics) ? kExitCriticalFindings
                                          : kExitSuccess;
}

} // namespace health
