#include <health/cohesion_analyzer.h>

#include <health/errors.h>
#include <health/union_find.h>

#include <unordered_set>

namespace health {

CohesionResult CalculateLcom4(const StructFacts &structure) {
  CohesionResult result;
  result.struct_name = structure.name;
  result.file_path = structure.file_path;
  if (structure.methods.empty()) {
    return result;
  }

  const std::unordered_set<std::string> fields(structure.fields.begin(),
                                               structure.fields.end());
  UnionFind graph;
  for (const auto &method : structure.methods) {
    graph.Add(method.qualified_name);
  }
  for (const auto &field : structure.fields) {
    graph.Add(field);
  }

  for (const auto &method : structure.methods) {
    for (const auto &[field, weight] : method.field_usage) {
      if (weight < kFieldRead) {
        continue;
      }
      if (fields.count(field) == 0) {
        throw InvariantViolation("Method " + method.qualified_name +
                                 " uses undeclared field '" + field +
                                 "' of " + structure.name);
      }
      graph.Union(method.qualified_name, field);
    }
  }

  result.components = graph.Components();
  result.lcom4_score = static_cast<int>(result.components.size());
  return result;
}

} // namespace health
