#include <health/analyze_options.h>

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cmath>
#include <ostream>
#include <stdexcept>
#include <unordered_map>
#include <utility>
#include <variant>

#include <yaml-cpp/yaml.h>

namespace health {
namespace {

std::string Trim(std::string value) {
  const auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  value.erase(value.begin(),
              std::find_if(value.begin(), value.end(),
                           [&](unsigned char ch) { return !is_space(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(),
                           [&](unsigned char ch) { return !is_space(ch); })
                  .base(),
              value.end());
  return value;
}

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

std::vector<std::string> SplitList(const std::string &raw_values) {
  std::vector<std::string> values;
  std::string current;
  for (const auto character : raw_values) {
    if (character == ',') {
      values.push_back(Trim(current));
      current.clear();
    } else {
      current.push_back(character);
    }
  }
  values.push_back(Trim(current));
  values.erase(std::remove(values.begin(), values.end(), std::string()),
               values.end());
  return values;
}

void AppendUnique(std::string value, std::vector<std::string> &target) {
  if (std::find(target.begin(), target.end(), value) == target.end()) {
    target.push_back(std::move(value));
  }
}

void AppendFormats(const std::string &raw_formats,
                   std::vector<std::string> &target) {
  for (auto format : SplitList(raw_formats)) {
    format = ToLower(format);
    if (format != "markdown" && format != "json") {
      throw std::invalid_argument("Unsupported format: " + format);
    }
    AppendUnique(std::move(format), target);
  }
}

void AppendExclusions(const std::string &raw_paths,
                      std::vector<std::string> &target) {
  for (const auto &path : SplitList(raw_paths)) {
    AppendUnique(std::filesystem::path(path).generic_string(), target);
  }
}

int ParsePositiveInt(const std::string &value, const std::string &name) {
  std::size_t consumed = 0;
  int parsed = 0;
  try {
    parsed = std::stoi(value, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument(name + " must be a positive integer, got '" +
                                value + "'");
  }
  if (consumed != value.size() || parsed < 1) {
    throw std::invalid_argument(name + " must be a positive integer, got '" +
                                value + "'");
  }
  return parsed;
}

std::string RequireValue(const std::vector<std::string> &arguments,
                         std::size_t &index, const std::string &flag) {
  if (++index >= arguments.size()) {
    throw std::invalid_argument(flag + " requires a value");
  }
  return arguments[index];
}

bool HandleLoggingOption(const std::vector<std::string> &arguments,
                         std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--log-level") {
    options.log_level = ParseLogLevel(RequireValue(arguments, index, argument));
    return true;
  }
  if (argument == "--verbose") {
    options.log_level = LogLevel::kInfo;
    return true;
  }
  if (argument == "--debug") {
    options.log_level = LogLevel::kDebug;
    return true;
  }
  return false;
}

bool HandleListOption(const std::vector<std::string> &arguments,
                      std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--format") {
    AppendFormats(RequireValue(arguments, index, argument), options.formats);
    return true;
  }
  if (argument == "--exclude") {
    AppendExclusions(RequireValue(arguments, index, argument),
                     options.excluded_directories);
    return true;
  }
  return false;
}

bool HandleExecutionOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--jobs") {
    options.jobs =
        ParsePositiveInt(RequireValue(arguments, index, argument), argument);
    return true;
  }
  if (argument == "--timeout-seconds") {
    options.timeout_seconds =
        ParsePositiveInt(RequireValue(arguments, index, argument), argument);
    return true;
  }
  return false;
}

bool HandlePluginSelection(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--engine") {
    options.engine = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--reporter") {
    options.reporter = RequireValue(arguments, index, argument);
    return true;
  }
  return false;
}

bool DispatchAnalyzeOption(const std::vector<std::string> &arguments,
                           std::size_t &index, AnalyzeOptions &options) {
  const auto &argument = arguments[index];
  if (argument == "--help" || argument == "-h") {
    options.show_help = true;
    return true;
  }
  if (argument == "--root") {
    options.root = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--build") {
    options.build_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--out") {
    options.output_directory = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--config") {
    options.config_file = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--module") {
    options.module_path = RequireValue(arguments, index, argument);
    return true;
  }
  if (argument == "--scope-notes") {
    options.scope_notes = RequireValue(arguments, index, argument);
    return true;
  }
  return HandleListOption(arguments, index, options) ||
         HandleExecutionOption(arguments, index, options) ||
         HandleLoggingOption(arguments, index, options) ||
         HandlePluginSelection(arguments, index, options);
}

using ThresholdField =
    std::variant<int HeuristicConfig::*, double HeuristicConfig::*>;

const std::map<std::string, ThresholdField> &ThresholdFields() {
  static const std::map<std::string, ThresholdField> fields = {
      {"god_object_lcom4", &HeuristicConfig::god_object_lcom4},
      {"god_object_afferent", &HeuristicConfig::god_object_afferent},
      {"unstable_foundation_afferent",
       &HeuristicConfig::unstable_foundation_afferent},
      {"unstable_foundation_instability",
       &HeuristicConfig::unstable_foundation_instability},
      {"complex_function_complexity",
       &HeuristicConfig::complex_function_complexity},
      {"ambiguous_struct_lcom4", &HeuristicConfig::ambiguous_struct_lcom4},
      {"ambiguous_struct_method_complexity",
       &HeuristicConfig::ambiguous_struct_method_complexity},
      {"min_call_frequency", &HeuristicConfig::min_call_frequency},
      {"min_cluster_size", &HeuristicConfig::min_cluster_size},
      {"min_cluster_ratio", &HeuristicConfig::min_cluster_ratio},
      {"min_fields", &HeuristicConfig::min_fields},
      {"min_methods", &HeuristicConfig::min_methods},
      {"max_components", &HeuristicConfig::max_components},
      {"power_iterations", &HeuristicConfig::power_iterations},
      {"eigenvalue_epsilon", &HeuristicConfig::eigenvalue_epsilon},
      {"deflation_factor", &HeuristicConfig::deflation_factor},
      {"kaiser_threshold", &HeuristicConfig::kaiser_threshold},
      {"elbow_threshold", &HeuristicConfig::elbow_threshold},
      {"cumulative_variance_threshold",
       &HeuristicConfig::cumulative_variance_threshold},
      {"max_estimated_clusters", &HeuristicConfig::max_estimated_clusters},
      {"critical_field_clusters", &HeuristicConfig::critical_field_clusters},
      {"summary_high_lcom4", &HeuristicConfig::summary_high_lcom4},
      {"summary_high_complexity", &HeuristicConfig::summary_high_complexity},
      {"summary_high_instability",
       &HeuristicConfig::summary_high_instability}};
  return fields;
}

std::string JoinKeys(const std::vector<std::string> &keys) {
  std::string message;
  for (const auto &key : keys) {
    if (!message.empty()) {
      message += ", ";
    }
    message += key;
  }
  return message;
}

[[noreturn]] void ThrowUnknownKey(const std::string &key) {
  throw std::invalid_argument("Unknown config key: " + key +
                              ". Supported keys: " +
                              JoinKeys(SupportedConfigKeys()));
}

std::string NormalizeAndValidateKey(const std::string &key) {
  const auto normalized = NormalizeConfigKey(key);
  const auto &supported = SupportedConfigKeys();
  if (std::find(supported.begin(), supported.end(), normalized) ==
      supported.end()) {
    ThrowUnknownKey(key);
  }
  return normalized;
}

std::string ExtractStringScalar(const YAML::Node &node,
                                const std::string &key_name) {
  if (!node.IsScalar()) {
    throw std::invalid_argument("Config key '" + key_name +
                                "' must be a string or path value");
  }
  return node.as<std::string>();
}

std::string ExtractPathLike(const YAML::Node &node,
                            const std::string &key_name) {
  if (node.IsScalar()) {
    return node.as<std::string>();
  }
  if (node.IsMap()) {
    for (const auto &candidate : {"path", "dir", "directory"}) {
      if (node[candidate]) {
        return ExtractStringScalar(node[candidate], key_name);
      }
    }
    throw std::invalid_argument("Config key '" + key_name +
                                "' map must contain 'path', 'dir', or "
                                "'directory'");
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or mapping");
}

using ListAppender = void (*)(const std::string &, std::vector<std::string> &);

void AppendPlainValues(const std::string &raw_values,
                       std::vector<std::string> &target) {
  for (auto value : SplitList(raw_values)) {
    AppendUnique(std::move(value), target);
  }
}

std::vector<std::string> ExtractList(const YAML::Node &node,
                                     const std::string &key_name,
                                     ListAppender appender) {
  std::vector<std::string> values;
  if (node.IsSequence()) {
    for (const auto &child : node) {
      if (!child.IsScalar()) {
        throw std::invalid_argument("Config key '" + key_name +
                                    "' must be a list of strings");
      }
      appender(child.as<std::string>(), values);
    }
    return values;
  }
  if (node.IsScalar()) {
    appender(node.as<std::string>(), values);
    return values;
  }
  throw std::invalid_argument("Config key '" + key_name +
                              "' must be a string or list of strings");
}

int ExtractPositiveInt(const YAML::Node &node, const std::string &key_name) {
  return ParsePositiveInt(Trim(ExtractStringScalar(node, key_name)), key_name);
}

double ExtractNumber(const YAML::Node &node, const std::string &key_name) {
  const auto text = Trim(ExtractStringScalar(node, key_name));
  std::size_t consumed = 0;
  double value = 0.0;
  try {
    value = std::stod(text, &consumed);
  } catch (const std::exception &) {
    throw std::invalid_argument("Threshold '" + key_name +
                                "' must be a number, got '" + text + "'");
  }
  if (consumed != text.size() || !std::isfinite(value)) {
    throw std::invalid_argument("Threshold '" + key_name +
                                "' must be a number, got '" + text + "'");
  }
  return value;
}

void ExtractThresholds(const YAML::Node &node, AnalyzeOptions &options) {
  if (!node.IsMap()) {
    throw std::invalid_argument("Config key 'thresholds' must be a mapping");
  }
  const auto &fields = ThresholdFields();
  for (const auto &entry : node) {
    const auto raw_key = entry.first.as<std::string>();
    const auto key = NormalizeConfigKey(raw_key);
    if (key == "utility_patterns") {
      options.utility_patterns =
          ExtractList(entry.second, key, AppendPlainValues);
      continue;
    }
    if (fields.find(key) == fields.end()) {
      throw std::invalid_argument("Unknown threshold: " + raw_key +
                                  ". Supported thresholds: " +
                                  JoinKeys(SupportedThresholdKeys()));
    }
    options.thresholds[key] = ExtractNumber(entry.second, key);
  }
}

void ApplyConfigEntry(const std::string &key, const YAML::Node &node,
                      AnalyzeOptions &options) {
  if (key == "root") {
    options.root = ExtractPathLike(node, key);
  } else if (key == "build") {
    options.build_directory = ExtractPathLike(node, key);
  } else if (key == "out") {
    options.output_directory = ExtractPathLike(node, key);
  } else if (key == "formats") {
    options.formats = ExtractList(node, key, AppendFormats);
  } else if (key == "exclude") {
    options.excluded_directories = ExtractList(node, key, AppendExclusions);
  } else if (key == "module") {
    options.module_path = ExtractStringScalar(node, key);
  } else if (key == "scope_notes") {
    options.scope_notes = ExtractStringScalar(node, key);
  } else if (key == "jobs") {
    options.jobs = ExtractPositiveInt(node, key);
  } else if (key == "timeout_seconds") {
    options.timeout_seconds = ExtractPositiveInt(node, key);
  } else if (key == "log_level") {
    options.log_level = ParseLogLevel(ExtractStringScalar(node, key));
  } else if (key == "engine") {
    options.engine = ExtractStringScalar(node, key);
  } else if (key == "reporter") {
    options.reporter = ExtractStringScalar(node, key);
  } else if (key == "thresholds") {
    ExtractThresholds(node, options);
  } else {
    ThrowUnknownKey(key);
  }
}

void ValidateAnalyzeOptions(const AnalyzeOptions &options) {
  if (!options.root) {
    throw std::invalid_argument("--root is required (or set in config file)");
  }
}

} // namespace

void PrintAnalyzeUsage(std::ostream &stream) {
  stream
      << "Usage: code-health analyze --root <path> [options]\n"
      << "Options:\n"
      << "  --root <path>            Root directory of the project\n"
      << "  --build <path>           Build directory containing "
         "compile_commands.json\n"
      << "                           (default: build)\n"
      << "  --format <list>          Comma-separated list of output formats\n"
      << "                           (supported: markdown,json)\n"
      << "  --out <path>             Directory for report outputs (default: "
         "analysis root)\n"
      << "  --config <file>          Optional YAML config file\n"
      << "  --exclude <list>         Comma-separated directory names or "
         "paths to skip\n"
      << "  --module <name>          Module path used to classify imports\n"
      << "                           (default: CMake project name)\n"
      << "  --scope-notes <text>     Scope notes to embed in the report "
         "header\n"
      << "  --jobs <n>               Packages analyzed in parallel "
         "(default: 1)\n"
      << "  --timeout-seconds <n>    Abort analysis after this many seconds\n"
      << "  --log-level <level>      Logging verbosity (error,warn,info,debug)\n"
      << "  --verbose                Shortcut for --log-level info\n"
      << "  --debug                  Shortcut for --log-level debug\n"
      << "  --engine <name>          Diagnostics engine to use\n"
      << "  --reporter <name>        Reporter to render outputs\n"
      << "  --help                   Show this message\n";
}

AnalyzeOptions
ParseAnalyzeArguments(const std::vector<std::string> &arguments) {
  AnalyzeOptions options;
  for (std::size_t i = 0; i < arguments.size(); ++i) {
    if (!DispatchAnalyzeOption(arguments, i, options)) {
      throw std::invalid_argument("Unknown argument: " + arguments[i]);
    }
    if (options.show_help) {
      break;
    }
  }
  return options;
}

const std::vector<std::string> &SupportedConfigKeys() {
  static const std::vector<std::string> keys = {
      "root",    "build",           "out",       "formats",
      "exclude", "module",          "scope_notes", "jobs",
      "timeout_seconds", "log_level", "engine",  "reporter",
      "thresholds"};
  return keys;
}

std::vector<std::string> SupportedThresholdKeys() {
  std::vector<std::string> keys;
  for (const auto &entry : ThresholdFields()) {
    keys.push_back(entry.first);
  }
  keys.push_back("utility_patterns");
  std::sort(keys.begin(), keys.end());
  return keys;
}

std::string NormalizeConfigKey(std::string key) {
  key = ToLower(Trim(key));
  std::replace(key.begin(), key.end(), '-', '_');
  static const std::unordered_map<std::string, std::string> aliases = {
      {"build_directory", "build"},
      {"output", "out"},
      {"output_directory", "out"},
      {"format", "formats"},
      {"excluded_directories", "exclude"},
      {"excludes", "exclude"},
      {"module_path", "module"},
      {"timeout", "timeout_seconds"},
      {"diagnostics_engine", "engine"}};

  if (const auto alias = aliases.find(key); alias != aliases.end()) {
    return alias->second;
  }
  return key;
}

AnalyzeOptions ParseConfigFile(const std::filesystem::path &path) {
  if (!std::filesystem::exists(path)) {
    throw std::runtime_error("Config file not found: " + path.string());
  }
  const auto extension = ToLower(path.extension().string());
  if (extension != ".yml" && extension != ".yaml") {
    throw std::invalid_argument("Unsupported config format: " + extension);
  }

  const auto root = YAML::LoadFile(path.string());
  if (!root.IsMap()) {
    throw std::invalid_argument(
        "Config file must contain a mapping at the root");
  }

  AnalyzeOptions options;
  options.config_file = path;
  for (const auto &entry : root) {
    const auto key = NormalizeAndValidateKey(entry.first.as<std::string>());
    ApplyConfigEntry(key, entry.second, options);
  }
  return options;
}

AnalyzeOptions MergeOptions(const AnalyzeOptions &config_options,
                            const AnalyzeOptions &cli_options) {
  AnalyzeOptions merged = config_options;
  const auto override_value = [](auto &target, const auto &source) {
    if (source) {
      target = source;
    }
  };

  override_value(merged.root, cli_options.root);
  override_value(merged.build_directory, cli_options.build_directory);
  override_value(merged.output_directory, cli_options.output_directory);
  override_value(merged.config_file, cli_options.config_file);
  override_value(merged.scope_notes, cli_options.scope_notes);
  override_value(merged.module_path, cli_options.module_path);
  override_value(merged.engine, cli_options.engine);
  override_value(merged.reporter, cli_options.reporter);
  override_value(merged.jobs, cli_options.jobs);
  override_value(merged.timeout_seconds, cli_options.timeout_seconds);
  override_value(merged.log_level, cli_options.log_level);
  override_value(merged.utility_patterns, cli_options.utility_patterns);

  if (!cli_options.formats.empty()) {
    merged.formats = cli_options.formats;
  }
  if (!cli_options.excluded_directories.empty()) {
    merged.excluded_directories = cli_options.excluded_directories;
  }
  for (const auto &[key, value] : cli_options.thresholds) {
    merged.thresholds[key] = value;
  }
  return merged;
}

AnalyzeOptions ResolveAnalyzeOptions(const AnalyzeOptions &cli_options) {
  if (cli_options.show_help) {
    return cli_options;
  }

  AnalyzeOptions config_options;
  if (cli_options.config_file) {
    config_options = ParseConfigFile(*cli_options.config_file);
  }

  auto merged = MergeOptions(config_options, cli_options);
  ValidateAnalyzeOptions(merged);
  return merged;
}

HeuristicConfig BuildHeuristicConfig(const AnalyzeOptions &options) {
  HeuristicConfig config = DefaultHeuristicConfig();
  const auto &fields = ThresholdFields();
  for (const auto &[key, value] : options.thresholds) {
    const auto field = fields.find(key);
    if (field == fields.end()) {
      throw std::invalid_argument("Unknown threshold: " + key);
    }
    if (const auto *integer = std::get_if<int HeuristicConfig::*>(&field->second)) {
      if (std::floor(value) != value) {
        throw std::invalid_argument("Threshold '" + key +
                                    "' must be an integer");
      }
      config.*(*integer) = static_cast<int>(value);
    } else {
      config.*(std::get<double HeuristicConfig::*>(field->second)) = value;
    }
  }
  if (options.utility_patterns) {
    config.utility_patterns = *options.utility_patterns;
  }
  return config;
}

LoggingConfig BuildLoggingConfig(const AnalyzeOptions &options) {
  LoggingConfig logging;
  logging.level = options.log_level.value_or(LogLevel::kWarn);
  return logging;
}

AnalysisConfig BuildAnalysisConfig(const AnalyzeOptions &options,
                                   const std::filesystem::path &root) {
  AnalysisConfig config;
  config.root_path = root.string();
  if (options.build_directory) {
    config.build_directory =
        std::filesystem::absolute(*options.build_directory).string();
  }
  config.module_path = options.module_path.value_or("");
  config.formats = options.formats.empty()
                       ? std::vector<std::string>{"markdown"}
                       : options.formats;
  config.excluded_directories = options.excluded_directories;
  config.scope_notes = options.scope_notes.value_or("");
  config.jobs = options.jobs.value_or(1);
  if (options.timeout_seconds) {
    config.timeout = std::chrono::seconds(*options.timeout_seconds);
  }
  return config;
}

} // namespace health
