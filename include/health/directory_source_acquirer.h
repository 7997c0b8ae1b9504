#pragma once

#include <health/interfaces.h>
#include <health/logging.h>

#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace health {

// Directories skipped by every walk, in addition to hidden directories and
// the build directory.
const std::vector<std::string> &DefaultExcludedDirectories();

// Walks the project tree for C and C++ sources. The root must exist and a
// compile_commands.json must be present in the build directory or the root.
class DirectorySourceAcquirer : public SourceAcquirer {
public:
  explicit DirectorySourceAcquirer(
      std::filesystem::path build_directory = std::filesystem::path("build"),
      std::shared_ptr<Logger> logger = nullptr);
  SourceAcquisitionResult Acquire(const AnalysisConfig &config) override;

private:
  std::filesystem::path build_directory_;
  std::shared_ptr<Logger> logger_;
};

// project(<name>) of the root CMakeLists.txt, or the root directory name.
std::string DetectModulePath(const std::filesystem::path &root);

// Matches an exclusion by directory base name or by project-relative path.
bool IsExcludedDirectory(const std::filesystem::path &relative_directory,
                         const std::vector<std::string> &exclusions);

} // namespace health
