#include <health/component_registry.h>

#include <health/markdown_reporter.h>
#include <health/rule_based_diagnostics_engine.h>

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace {

constexpr const char kDefaultDiagnosticsEngine[] = "rule-based";
constexpr const char kDefaultReporter[] = "markdown";

} // namespace

namespace health {

template <typename Factory>
std::vector<std::string>
ComponentRegistry::RegisteredNames(const ComponentSet<Factory> &set) {
  std::vector<std::string> names;
  names.reserve(set.factories.size());
  for (const auto &entry : set.factories) {
    names.push_back(entry.first);
  }
  std::sort(names.begin(), names.end());
  return names;
}

template <typename Factory>
std::string ComponentRegistry::JoinNames(const ComponentSet<Factory> &set) {
  const auto names = RegisteredNames(set);
  if (names.empty()) {
    return "none";
  }
  std::string message;
  for (const auto &name : names) {
    if (!message.empty()) {
      message += ", ";
    }
    message += name;
  }
  return message;
}

template <typename Interface, typename Factory>
std::unique_ptr<Interface> ComponentRegistry::CreateComponent(
    const std::string &name, const ComponentSet<Factory> &set,
    const std::string &kind, const HeuristicConfig &config) const {
  const auto target_name = name.empty() ? set.default_name : name;
  if (target_name.empty()) {
    throw std::invalid_argument("No default " + kind + " registered");
  }
  const auto found = set.factories.find(target_name);
  if (found == set.factories.end()) {
    throw std::invalid_argument("Unknown " + kind + " '" + target_name +
                                "'. Registered: " + JoinNames(set));
  }
  auto instance = found->second(config);
  if (!instance) {
    throw std::runtime_error("Factory for " + kind + " '" + target_name +
                             "' returned null");
  }
  return instance;
}

template <typename Factory>
void ComponentRegistry::RegisterComponent(const std::string &name,
                                          Factory factory, bool set_as_default,
                                          ComponentSet<Factory> &set) {
  if (name.empty()) {
    throw std::invalid_argument("Component name cannot be empty");
  }
  if (!factory) {
    throw std::invalid_argument("Factory for '" + name + "' cannot be null");
  }
  if (!set.factories.emplace(name, std::move(factory)).second) {
    throw std::invalid_argument("Component with name '" + name +
                                "' already registered");
  }
  if (set_as_default || set.default_name.empty()) {
    set.default_name = name;
  }
}

void ComponentRegistry::RegisterFactExtractor(const std::string &name,
                                              FactExtractorFactory factory,
                                              bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, extractors_);
}

void ComponentRegistry::RegisterDiagnosticsEngine(
    const std::string &name, DiagnosticsEngineFactory factory,
    bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default,
                    diagnostics_engines_);
}

void ComponentRegistry::RegisterReporter(const std::string &name,
                                         ReporterFactory factory,
                                         bool set_as_default) {
  RegisterComponent(name, std::move(factory), set_as_default, reporters_);
}

std::unique_ptr<FactExtractor>
ComponentRegistry::CreateFactExtractor(const std::string &name,
                                       const HeuristicConfig &config) const {
  return CreateComponent<FactExtractor>(name, extractors_, "fact extractor",
                                        config);
}

std::unique_ptr<DiagnosticsEngine> ComponentRegistry::CreateDiagnosticsEngine(
    const std::string &name, const HeuristicConfig &config) const {
  return CreateComponent<DiagnosticsEngine>(name, diagnostics_engines_,
                                            "diagnostics engine", config);
}

std::unique_ptr<Reporter>
ComponentRegistry::CreateReporter(const std::string &name,
                                  const HeuristicConfig &config) const {
  return CreateComponent<Reporter>(name, reporters_, "reporter", config);
}

std::vector<std::string> ComponentRegistry::FactExtractorNames() const {
  return RegisteredNames(extractors_);
}

std::vector<std::string> ComponentRegistry::DiagnosticsEngineNames() const {
  return RegisteredNames(diagnostics_engines_);
}

std::vector<std::string> ComponentRegistry::ReporterNames() const {
  return RegisteredNames(reporters_);
}

const std::string &ComponentRegistry::DefaultFactExtractorName() const {
  return extractors_.default_name;
}

const std::string &ComponentRegistry::DefaultDiagnosticsEngineName() const {
  return diagnostics_engines_.default_name;
}

const std::string &ComponentRegistry::DefaultReporterName() const {
  return reporters_.default_name;
}

ComponentRegistry MakeComponentRegistryWithDefaults() {
  ComponentRegistry registry;
  registry.RegisterDiagnosticsEngine(
      kDefaultDiagnosticsEngine,
      [](const HeuristicConfig &config) {
        return std::make_unique<RuleBasedDiagnosticsEngine>(config);
      },
      true);
  registry.RegisterReporter(
      kDefaultReporter,
      [](const HeuristicConfig &config) {
        return std::make_unique<MarkdownReporter>(config);
      },
      true);
  return registry;
}

const ComponentRegistry &GlobalComponentRegistry() {
  static const ComponentRegistry registry = MakeComponentRegistryWithDefaults();
  return registry;
}

} // namespace health
