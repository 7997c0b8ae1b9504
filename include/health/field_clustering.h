#pragma once

#include <health/heuristic_config.h>
#include <health/models.h>

#include <optional>
#include <string>
#include <vector>

namespace health {

using Matrix = std::vector<std::vector<double>>;

// Principal-component estimate of how many responsibility clusters the
// method x field usage matrix of a struct decomposes into.
class FieldClusterAnalyzer {
public:
  explicit FieldClusterAnalyzer(
      HeuristicConfig config = DefaultHeuristicConfig());

  // No result below the minimum data threshold (fields, non-utility methods).
  std::optional<FieldClusterResult> Analyze(const StructFacts &structure) const;

  // Leading eigenvalues of a symmetric matrix by power iteration with the
  // simplified diagonal deflation. Stops early at the epsilon.
  std::vector<double> TopEigenvalues(const Matrix &matrix) const;

  int EstimateClusterCount(const std::vector<double> &eigenvalues,
                           const std::vector<double> &explained_variance) const;

  std::string Recommend(int clusters, int method_count, int field_count,
                        const std::vector<double> &explained_variance) const;

private:
  double PowerIteration(const Matrix &matrix) const;

  HeuristicConfig config_;
};

Matrix CenterColumns(const Matrix &matrix);

// Sample covariance (divides by rows - 1) between columns.
Matrix CovarianceMatrix(const Matrix &centered);

std::vector<double> ExplainedVariance(const std::vector<double> &eigenvalues);

} // namespace health
