#pragma once

#include <health/heuristic_config.h>
#include <health/interfaces.h>

#include <functional>
#include <memory>
#include <string>
#include <unordered_map>
#include <vector>

namespace health {

class ComponentRegistry {
public:
  using FactExtractorFactory =
      std::function<std::unique_ptr<FactExtractor>(const HeuristicConfig &)>;
  using DiagnosticsEngineFactory = std::function<
      std::unique_ptr<DiagnosticsEngine>(const HeuristicConfig &)>;
  using ReporterFactory =
      std::function<std::unique_ptr<Reporter>(const HeuristicConfig &)>;

  void RegisterFactExtractor(const std::string &name,
                             FactExtractorFactory factory,
                             bool set_as_default = false);
  void RegisterDiagnosticsEngine(const std::string &name,
                                 DiagnosticsEngineFactory factory,
                                 bool set_as_default = false);
  void RegisterReporter(const std::string &name, ReporterFactory factory,
                        bool set_as_default = false);

  std::unique_ptr<FactExtractor>
  CreateFactExtractor(const std::string &name = "",
                      const HeuristicConfig &config =
                          DefaultHeuristicConfig()) const;
  std::unique_ptr<DiagnosticsEngine>
  CreateDiagnosticsEngine(const std::string &name = "",
                          const HeuristicConfig &config =
                              DefaultHeuristicConfig()) const;
  std::unique_ptr<Reporter>
  CreateReporter(const std::string &name = "",
                 const HeuristicConfig &config =
                     DefaultHeuristicConfig()) const;

  std::vector<std::string> FactExtractorNames() const;
  std::vector<std::string> DiagnosticsEngineNames() const;
  std::vector<std::string> ReporterNames() const;

  const std::string &DefaultFactExtractorName() const;
  const std::string &DefaultDiagnosticsEngineName() const;
  const std::string &DefaultReporterName() const;

  template <typename Factory> struct ComponentSet {
    std::unordered_map<std::string, Factory> factories;
    std::string default_name;
  };

private:
  template <typename Factory>
  static std::vector<std::string>
  RegisteredNames(const ComponentSet<Factory> &set);

  template <typename Factory>
  static std::string JoinNames(const ComponentSet<Factory> &set);

  template <typename Interface, typename Factory>
  std::unique_ptr<Interface>
  CreateComponent(const std::string &name, const ComponentSet<Factory> &set,
                  const std::string &kind,
                  const HeuristicConfig &config) const;

  template <typename Factory>
  void RegisterComponent(const std::string &name, Factory factory,
                         bool set_as_default, ComponentSet<Factory> &set);

  ComponentSet<FactExtractorFactory> extractors_;
  ComponentSet<DiagnosticsEngineFactory> diagnostics_engines_;
  ComponentSet<ReporterFactory> reporters_;
};

// Registers the rule-based diagnostics engine and the markdown reporter.
// Fact extractors depend on the parser toolchain and are registered by the
// executable that links one.
ComponentRegistry MakeComponentRegistryWithDefaults();
const ComponentRegistry &GlobalComponentRegistry();

} // namespace health
