#pragma once

#include <health/models.h>

#include <map>
#include <string>

namespace health {

// "<module>" for the root package (empty path), "<module>/<path>" otherwise.
std::string ImportPathFor(const std::string &module_path,
                          const std::string &package_path);

// True when import_path is the module itself or lies underneath it.
bool IsWithinModule(const std::string &import_path,
                    const std::string &module_path);

// One node per analyzed package, keyed by package path. Self imports are
// dropped; imports of unknown packages are kept but never walked.
std::map<std::string, PackageDependency>
BuildDependencyGraph(const FactModel &model);

// Ca, Ce and instability for every package of the graph. Only in-project
// edges count.
std::map<std::string, CouplingResult>
CalculateCoupling(const std::map<std::string, PackageDependency> &graph,
                  const std::string &module_path);

// Longest chain of in-project imports per package (memoized DFS). An edge that
// closes a cycle contributes 0 instead of recursing.
std::map<std::string, int>
CalculateDependencyDepth(const std::map<std::string, PackageDependency> &graph,
                         const std::string &module_path);

} // namespace health
