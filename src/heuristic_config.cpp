#include <health/heuristic_config.h>

#include <algorithm>
#include <cctype>

namespace health {
namespace {

std::string ToLower(std::string value) {
  std::transform(
      value.begin(), value.end(), value.begin(),
      [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
  return value;
}

bool HasAccessorShape(const std::string &name, const std::string &prefix) {
  if (name.size() <= prefix.size() || name.compare(0, prefix.size(), prefix) != 0) {
    return false;
  }
  return std::isupper(static_cast<unsigned char>(name[prefix.size()])) != 0;
}

} // namespace

const HeuristicConfig &DefaultHeuristicConfig() {
  static const HeuristicConfig config{};
  return config;
}

std::string BareName(const std::string &qualified_name) {
  const auto separator = qualified_name.rfind('.');
  if (separator == std::string::npos) {
    return qualified_name;
  }
  return qualified_name.substr(separator + 1);
}

bool IsPrivateName(const std::string &name) {
  const auto bare = BareName(name);
  if (bare.empty()) {
    return false;
  }
  return std::islower(static_cast<unsigned char>(bare.front())) != 0;
}

bool IsUtilityMethodName(const std::string &name,
                         const HeuristicConfig &config) {
  const auto bare = BareName(name);
  const auto lower = ToLower(bare);
  for (const auto &pattern : config.utility_patterns) {
    if (lower.find(ToLower(pattern)) != std::string::npos) {
      return true;
    }
  }
  return std::any_of(
      config.accessor_prefixes.begin(), config.accessor_prefixes.end(),
      [&](const std::string &prefix) { return HasAccessorShape(bare, prefix); });
}

std::string QualifiedMethodName(const std::string &struct_name,
                                const std::string &method_name) {
  return struct_name + "." + method_name;
}

std::vector<std::string> SplitIdentifierWords(const std::string &identifier) {
  std::vector<std::string> words;
  std::string current;
  for (std::size_t i = 0; i < identifier.size(); ++i) {
    const auto character = static_cast<unsigned char>(identifier[i]);
    if (character == '_') {
      if (!current.empty()) {
        words.push_back(current);
        current.clear();
      }
      continue;
    }
    if (i > 0 && std::isupper(character) != 0 && !current.empty()) {
      words.push_back(current);
      current.clear();
    }
    current.push_back(static_cast<char>(character));
  }
  if (!current.empty()) {
    words.push_back(current);
  }
  return words;
}

} // namespace health
