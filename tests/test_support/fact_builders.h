#ifndef HEALTH_TEST_SUPPORT_FACT_BUILDERS_H
#define HEALTH_TEST_SUPPORT_FACT_BUILDERS_H

#include <health/heuristic_config.h>
#include <health/models.h>

#include <map>
#include <string>
#include <utility>
#include <vector>

namespace health {
namespace test {

inline MethodFacts
Method(const std::string &struct_name, const std::string &name,
       std::map<std::string, int> field_usage = {},
       std::map<std::string, int> calls = {}) {
  MethodFacts method;
  method.name = name;
  method.qualified_name = QualifiedMethodName(struct_name, name);
  method.receiver_binding_name = "this";
  method.is_private = IsPrivateName(name);
  method.is_utility = IsUtilityMethodName(name);
  method.field_usage = std::move(field_usage);
  for (auto &[callee, frequency] : calls) {
    method.calls.emplace(QualifiedMethodName(struct_name, callee), frequency);
  }
  return method;
}

inline FunctionFacts Function(const std::string &name, int decision_points = 0,
                              int body_lines = 10,
                              std::vector<std::string> imports_used = {}) {
  FunctionFacts function;
  function.qualified_name = name;
  function.file_path = "src/file.cpp";
  function.has_body = true;
  function.body_start_line = 1;
  function.body_end_line = 1 + body_lines;
  function.decision_points.if_statements = decision_points;
  function.imported_packages_used.insert(imports_used.begin(),
                                         imports_used.end());
  return function;
}

inline PackageFacts Package(const std::string &path,
                            std::vector<std::string> imports = {}) {
  PackageFacts package;
  package.path = path;
  const auto separator = path.rfind('/');
  package.name =
      separator == std::string::npos ? path : path.substr(separator + 1);
  package.imports.insert(imports.begin(), imports.end());
  return package;
}

} // namespace test
} // namespace health

#endif // HEALTH_TEST_SUPPORT_FACT_BUILDERS_H
