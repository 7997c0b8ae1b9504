#include <health/coupling_analyzer.h>

#include <health/complexity_analyzer.h>

#include <algorithm>
#include <set>
#include <unordered_set>

namespace health {
namespace {

class DepthCalculator {
public:
  DepthCalculator(const std::map<std::string, PackageDependency> &graph,
                  const std::string &module_path)
      : graph_(graph), module_path_(module_path) {
    for (const auto &[path, dependency] : graph_) {
      import_to_package_.emplace(dependency.import_path, path);
    }
  }

  int Depth(const std::string &package_path) {
    const auto memoized = depths_.find(package_path);
    if (memoized != depths_.end()) {
      return memoized->second;
    }

    on_stack_.insert(package_path);
    int deepest = 0;
    for (const auto &import : graph_.at(package_path).imports) {
      if (!IsWithinModule(import, module_path_)) {
        continue;
      }
      const auto target = import_to_package_.find(import);
      if (target == import_to_package_.end()) {
        continue;
      }
      if (on_stack_.count(target->second) != 0) {
        continue;
      }
      deepest = std::max(deepest, 1 + Depth(target->second));
    }
    on_stack_.erase(package_path);

    depths_.emplace(package_path, deepest);
    return deepest;
  }

private:
  const std::map<std::string, PackageDependency> &graph_;
  const std::string &module_path_;
  std::map<std::string, std::string> import_to_package_;
  std::map<std::string, int> depths_;
  std::unordered_set<std::string> on_stack_;
};

} // namespace

std::string ImportPathFor(const std::string &module_path,
                          const std::string &package_path) {
  if (package_path.empty()) {
    return module_path;
  }
  return module_path + "/" + package_path;
}

bool IsWithinModule(const std::string &import_path,
                    const std::string &module_path) {
  if (module_path.empty() ||
      import_path.compare(0, module_path.size(), module_path) != 0) {
    return false;
  }
  return import_path.size() == module_path.size() ||
         import_path[module_path.size()] == '/';
}

std::map<std::string, PackageDependency>
BuildDependencyGraph(const FactModel &model) {
  std::map<std::string, PackageDependency> graph;
  std::map<std::string, std::string> import_to_package;
  for (const auto &package : model.packages) {
    PackageDependency dependency;
    dependency.import_path = ImportPathFor(model.module_path, package.path);
    import_to_package.emplace(dependency.import_path, package.path);
    graph.emplace(package.path, std::move(dependency));
  }

  for (const auto &package : model.packages) {
    auto &dependency = graph.at(package.path);
    std::set<std::string> imports;
    for (const auto &import : package.imports) {
      if (import != dependency.import_path) {
        imports.insert(import);
      }
    }
    dependency.imports.assign(imports.begin(), imports.end());

    for (const auto &import : dependency.imports) {
      const auto target = import_to_package.find(import);
      if (target != import_to_package.end()) {
        graph.at(target->second).imported_by.push_back(dependency.import_path);
      }
    }
  }

  for (auto &[path, dependency] : graph) {
    std::sort(dependency.imported_by.begin(), dependency.imported_by.end());
    dependency.imported_by.erase(std::unique(dependency.imported_by.begin(),
                                             dependency.imported_by.end()),
                                 dependency.imported_by.end());
  }
  return graph;
}

std::map<std::string, CouplingResult>
CalculateCoupling(const std::map<std::string, PackageDependency> &graph,
                  const std::string &module_path) {
  std::map<std::string, CouplingResult> metrics;
  for (const auto &[path, dependency] : graph) {
    CouplingResult result;
    result.package_path = path;
    result.afferent = static_cast<int>(std::count_if(
        dependency.imported_by.begin(), dependency.imported_by.end(),
        [&](const std::string &importer) {
          return IsWithinModule(importer, module_path);
        }));
    result.efferent = static_cast<int>(std::count_if(
        dependency.imports.begin(), dependency.imports.end(),
        [&](const std::string &import) {
          return IsWithinModule(import, module_path);
        }));
    result.instability = Instability(result.afferent, result.efferent);
    metrics.emplace(path, std::move(result));
  }
  return metrics;
}

std::map<std::string, int>
CalculateDependencyDepth(const std::map<std::string, PackageDependency> &graph,
                         const std::string &module_path) {
  DepthCalculator calculator(graph, module_path);
  std::map<std::string, int> depths;
  for (const auto &entry : graph) {
    depths.emplace(entry.first, calculator.Depth(entry.first));
  }
  return depths;
}

} // namespace health
