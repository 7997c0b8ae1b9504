#pragma once

#include <health/models.h>

#include <string>
#include <utility>
#include <vector>

namespace health {

// 1 + every decision point. A function without a body scores 1.
int CyclomaticComplexity(const FunctionFacts &function);

// Lines spanned by the body (end - start), clamped at 0; 0 without a body.
int FunctionLoc(const FunctionFacts &function);

// Splits dependencies into (internal, external) by module path prefix.
std::pair<std::vector<std::string>, std::vector<std::string>>
CategorizeDependencies(const std::vector<std::string> &dependencies,
                       const std::string &module_path);

// Complexity, size and function-level coupling for every function of the
// package, in declaration order. Afferent coupling only counts callers inside
// the same package, matched by exact qualified name.
std::vector<ComplexityResult>
CalculateComplexity(const PackageFacts &package, const std::string &module_path);

double Instability(int afferent, int efferent);

} // namespace health
