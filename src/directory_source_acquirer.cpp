#include <health/directory_source_acquirer.h>

#include <algorithm>
#include <fstream>
#include <iterator>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace health {
namespace {

namespace fs = std::filesystem;

bool IsSourceExtension(const fs::path &path) {
  static const std::set<std::string> kExtensions = {
      ".c", ".cc", ".cxx", ".cpp", ".h", ".hh", ".hpp", ".hxx"};
  return kExtensions.count(path.extension().string()) > 0;
}

bool IsWithin(const fs::path &candidate, const fs::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  const auto parent = fs::weakly_canonical(potential_parent);
  const auto normalized_candidate = fs::weakly_canonical(candidate);
  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

bool IsHidden(const fs::path &path) {
  const auto name = path.filename().string();
  return name.size() > 1 && name.front() == '.';
}

std::string TrimSlashes(std::string value) {
  std::replace(value.begin(), value.end(), '\\', '/');
  while (!value.empty() && value.back() == '/') {
    value.pop_back();
  }
  while (value.rfind("./", 0) == 0) {
    value.erase(0, 2);
  }
  return value;
}

fs::path ResolveRootPath(const AnalysisConfig &config) {
  if (config.root_path.empty()) {
    throw std::invalid_argument("AnalysisConfig.root_path must not be empty.");
  }
  const auto normalized_root = fs::weakly_canonical(config.root_path);
  if (!fs::exists(normalized_root) || !fs::is_directory(normalized_root)) {
    throw std::runtime_error("Analysis root path is not a directory: " +
                             normalized_root.string());
  }
  return normalized_root;
}

// The directory holding compile_commands.json: the build directory first,
// then the root itself.
fs::path LocateCompilationDatabase(const fs::path &root,
                                   const fs::path &build_dir) {
  for (const auto &candidate : {build_dir, root}) {
    if (fs::exists(candidate / "compile_commands.json")) {
      return candidate;
    }
  }
  throw std::runtime_error(
      "compile_commands.json not found in " + build_dir.string() + " or " +
      root.string() +
      ". Configure the project with CMAKE_EXPORT_COMPILE_COMMANDS=ON.");
}

std::vector<std::string>
CollectSourceFiles(const fs::path &root, const fs::path &build_dir,
                   const std::vector<std::string> &exclusions,
                   Logger &logger) {
  std::vector<std::string> files;
  const auto build_inside_root = build_dir != root;
  for (fs::recursive_directory_iterator it(root), end; it != end; ++it) {
    const auto &entry = *it;
    if (entry.is_directory()) {
      const auto relative = fs::relative(entry.path(), root);
      if (IsHidden(entry.path()) ||
          (build_inside_root && IsWithin(entry.path(), build_dir)) ||
          IsExcludedDirectory(relative, exclusions)) {
        logger.Log(LogLevel::kDebug, "acquire.directory.excluded",
                   {{"directory", relative.generic_string()}});
        it.disable_recursion_pending();
      }
      continue;
    }
    if (!entry.is_regular_file() || !IsSourceExtension(entry.path())) {
      continue;
    }
    files.push_back(fs::weakly_canonical(entry.path()).string());
  }

  std::sort(files.begin(), files.end());
  files.erase(std::unique(files.begin(), files.end()), files.end());
  return files;
}

} // namespace

const std::vector<std::string> &DefaultExcludedDirectories() {
  static const std::vector<std::string> kDefaults = {"build", "third_party",
                                                     "vendor"};
  return kDefaults;
}

bool IsExcludedDirectory(const fs::path &relative_directory,
                         const std::vector<std::string> &exclusions) {
  const auto relative = TrimSlashes(relative_directory.generic_string());
  const auto base_name = relative_directory.filename().string();
  return std::any_of(exclusions.begin(), exclusions.end(),
                     [&](const std::string &exclusion) {
                       const auto pattern = TrimSlashes(exclusion);
                       return !pattern.empty() &&
                              (pattern == base_name || pattern == relative);
                     });
}

std::string DetectModulePath(const fs::path &root) {
  std::ifstream stream(root / "CMakeLists.txt");
  if (stream) {
    std::stringstream buffer;
    buffer << stream.rdbuf();
    const std::string content = buffer.str();
    static const std::regex kProject(R"(project\s*\(\s*([A-Za-z0-9_.+-]+))",
                                     std::regex::icase);
    std::smatch match;
    if (std::regex_search(content, match, kProject)) {
      return match[1].str();
    }
  }
  return root.filename().string();
}

DirectorySourceAcquirer::DirectorySourceAcquirer(fs::path build_directory,
                                                 std::shared_ptr<Logger> logger)
    : build_directory_(std::move(build_directory)),
      logger_(EnsureLogger(std::move(logger))) {}

SourceAcquisitionResult
DirectorySourceAcquirer::Acquire(const AnalysisConfig &config) {
  const auto root = ResolveRootPath(config);

  fs::path build_dir = config.build_directory.empty()
                           ? build_directory_
                           : fs::path(config.build_directory);
  if (!build_dir.is_absolute()) {
    build_dir = root / build_dir;
  }
  build_dir = fs::weakly_canonical(build_dir);
  const auto database_dir = LocateCompilationDatabase(root, build_dir);

  auto exclusions = DefaultExcludedDirectories();
  exclusions.insert(exclusions.end(), config.excluded_directories.begin(),
                    config.excluded_directories.end());

  auto files = CollectSourceFiles(root, build_dir, exclusions, *logger_);
  if (files.empty()) {
    throw std::runtime_error("No source files found under root: " +
                             root.string());
  }

  SourceAcquisitionResult result;
  result.files = std::move(files);
  result.project_root = root.string();
  result.build_directory = database_dir.string();
  result.module_path = config.module_path.empty() ? DetectModulePath(root)
                                                  : config.module_path;

  logger_->Log(LogLevel::kInfo, "acquire.complete",
               {{"count", std::to_string(result.files.size())},
                {"root", result.project_root},
                {"module", result.module_path}});
  return result;
}

} // namespace health
