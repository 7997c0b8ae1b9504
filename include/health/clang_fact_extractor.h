#pragma once

#include <health/heuristic_config.h>
#include <health/interfaces.h>
#include <health/logging.h>

#include <filesystem>
#include <memory>

namespace health {

// Builds the fact model of a C++ project from compile_commands.json with
// libclang. Every project directory becomes a package; a translation unit
// that fails to parse drops the directories it failed in.
class ClangFactExtractor : public FactExtractor {
public:
  explicit ClangFactExtractor(
      HeuristicConfig config = DefaultHeuristicConfig(),
      std::filesystem::path compile_commands_path = {},
      std::shared_ptr<Logger> logger = nullptr);

  FactModel Extract(const SourceAcquisitionResult &sources) override;

private:
  HeuristicConfig config_;
  std::filesystem::path compile_commands_path_;
  std::shared_ptr<Logger> logger_;
};

} // namespace health
