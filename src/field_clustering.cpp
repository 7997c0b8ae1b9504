#include <health/field_clustering.h>

#include <algorithm>
#include <cmath>
#include <functional>
#include <iomanip>
#include <sstream>
#include <utility>

namespace health {

FieldClusterAnalyzer::FieldClusterAnalyzer(HeuristicConfig config)
    : config_(std::move(config)) {}

Matrix CenterColumns(const Matrix &matrix) {
  if (matrix.empty()) {
    return matrix;
  }
  const auto rows = matrix.size();
  const auto cols = matrix.front().size();

  std::vector<double> means(cols, 0.0);
  for (std::size_t j = 0; j < cols; ++j) {
    for (std::size_t i = 0; i < rows; ++i) {
      means[j] += matrix[i][j];
    }
    means[j] /= static_cast<double>(rows);
  }

  Matrix centered(rows, std::vector<double>(cols, 0.0));
  for (std::size_t i = 0; i < rows; ++i) {
    for (std::size_t j = 0; j < cols; ++j) {
      centered[i][j] = matrix[i][j] - means[j];
    }
  }
  return centered;
}

Matrix CovarianceMatrix(const Matrix &centered) {
  if (centered.size() < 2) {
    return {};
  }
  const auto rows = centered.size();
  const auto cols = centered.front().size();

  Matrix covariance(cols, std::vector<double>(cols, 0.0));
  for (std::size_t i = 0; i < cols; ++i) {
    for (std::size_t j = i; j < cols; ++j) {
      double sum = 0.0;
      for (std::size_t k = 0; k < rows; ++k) {
        sum += centered[k][i] * centered[k][j];
      }
      covariance[i][j] = sum / static_cast<double>(rows - 1);
      covariance[j][i] = covariance[i][j];
    }
  }
  return covariance;
}

std::vector<double> ExplainedVariance(const std::vector<double> &eigenvalues) {
  double total = 0.0;
  for (const auto value : eigenvalues) {
    if (value > 0.0) {
      total += value;
    }
  }

  std::vector<double> explained(eigenvalues.size(), 0.0);
  if (total <= 0.0) {
    return explained;
  }
  for (std::size_t i = 0; i < eigenvalues.size(); ++i) {
    explained[i] = eigenvalues[i] / total;
  }
  return explained;
}

double FieldClusterAnalyzer::PowerIteration(const Matrix &matrix) const {
  const auto n = matrix.size();
  if (n == 0) {
    return 0.0;
  }

  std::vector<double> vector(n, 1.0 / std::sqrt(static_cast<double>(n)));
  double eigenvalue = 0.0;
  for (int iteration = 0; iteration < config_.power_iterations; ++iteration) {
    std::vector<double> next(n, 0.0);
    for (std::size_t i = 0; i < n; ++i) {
      for (std::size_t j = 0; j < n; ++j) {
        next[i] += matrix[i][j] * vector[j];
      }
    }

    double numerator = 0.0;
    double denominator = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      numerator += next[i] * vector[i];
      denominator += vector[i] * vector[i];
    }
    if (denominator > 0.0) {
      eigenvalue = numerator / denominator;
    }

    double norm = 0.0;
    for (const auto value : next) {
      norm += value * value;
    }
    norm = std::sqrt(norm);
    if (norm < config_.eigenvalue_epsilon) {
      break;
    }
    for (std::size_t i = 0; i < n; ++i) {
      vector[i] = next[i] / norm;
    }
  }
  return std::abs(eigenvalue);
}

std::vector<double>
FieldClusterAnalyzer::TopEigenvalues(const Matrix &matrix) const {
  std::vector<double> eigenvalues;
  if (matrix.empty()) {
    return eigenvalues;
  }

  const auto limit = std::min<std::size_t>(
      static_cast<std::size_t>(std::max(config_.max_components, 0)),
      matrix.size());
  Matrix work = matrix;
  for (std::size_t k = 0; k < limit; ++k) {
    const auto eigenvalue = PowerIteration(work);
    if (eigenvalue <= config_.eigenvalue_epsilon) {
      break;
    }
    eigenvalues.push_back(eigenvalue);
    // Approximate deflation: only the eigenvalue is known, not its vector.
    for (std::size_t i = 0; i < work.size(); ++i) {
      work[i][i] -= eigenvalue * config_.deflation_factor;
    }
  }
  return eigenvalues;
}

int FieldClusterAnalyzer::EstimateClusterCount(
    const std::vector<double> &eigenvalues,
    const std::vector<double> &explained_variance) const {
  if (eigenvalues.empty()) {
    return 1;
  }

  const auto kaiser = static_cast<int>(std::count_if(
      eigenvalues.begin(), eigenvalues.end(),
      [&](double value) { return value > config_.kaiser_threshold; }));

  int elbow = 0;
  for (const auto ratio : explained_variance) {
    if (ratio <= config_.elbow_threshold) {
      break;
    }
    ++elbow;
  }

  double cumulative = 0.0;
  int variance_cap = 0;
  for (const auto ratio : explained_variance) {
    cumulative += ratio;
    ++variance_cap;
    if (cumulative >= config_.cumulative_variance_threshold) {
      break;
    }
  }

  auto estimate = std::max(kaiser, elbow);
  if (variance_cap < estimate) {
    estimate = variance_cap;
  }
  return std::clamp(estimate, 1, std::max(1, config_.max_estimated_clusters));
}

std::string FieldClusterAnalyzer::Recommend(
    int clusters, int method_count, int field_count,
    const std::vector<double> &explained_variance) const {
  std::ostringstream text;
  if (clusters <= 1) {
    text << "Analysis suggests a single cohesive responsibility. The "
         << method_count << " methods work together on " << field_count
         << " fields in a unified way. This is a good sign of high cohesion.";
    return text.str();
  }

  std::string strength = "moderate";
  if (!explained_variance.empty() && explained_variance.front() > 0.5) {
    strength = "strong";
  } else if (!explained_variance.empty() && explained_variance.front() < 0.3) {
    strength = "weak";
  }

  std::vector<double> top(
      explained_variance.begin(),
      explained_variance.begin() +
          std::min<std::ptrdiff_t>(clusters, static_cast<std::ptrdiff_t>(
                                                 explained_variance.size())));
  std::sort(top.begin(), top.end(), std::greater<double>());

  text << "Analysis detects " << clusters
       << " distinct responsibility clusters (variance explained: ";
  text << std::fixed << std::setprecision(1);
  for (std::size_t i = 0; i < top.size(); ++i) {
    if (i > 0) {
      text << ", ";
    }
    text << top[i] * 100.0 << "%";
  }
  text << "). The primary cluster shows " << strength
       << " separation. Consider splitting this struct into " << clusters
       << " smaller, focused structs, each handling one specific "
          "responsibility. Group methods and fields based on which cluster "
          "they belong to.";
  return text.str();
}

std::optional<FieldClusterResult>
FieldClusterAnalyzer::Analyze(const StructFacts &structure) const {
  if (static_cast<int>(structure.fields.size()) < config_.min_fields) {
    return std::nullopt;
  }

  std::vector<const MethodFacts *> methods;
  for (const auto &method : structure.methods) {
    if (!method.is_utility) {
      methods.push_back(&method);
    }
  }
  if (static_cast<int>(methods.size()) < config_.min_methods) {
    return std::nullopt;
  }

  FieldClusterResult result;
  result.field_names = structure.fields;
  Matrix values;
  for (const auto *method : methods) {
    result.method_names.push_back(method->qualified_name);
    std::vector<int> row;
    row.reserve(structure.fields.size());
    for (const auto &field : structure.fields) {
      const auto usage = method->field_usage.find(field);
      row.push_back(usage == method->field_usage.end()
                        ? kFieldUnused
                        : std::clamp(usage->second, kFieldUnused,
                                     kFieldReadWrite));
    }
    values.emplace_back(row.begin(), row.end());
    result.matrix.push_back(std::move(row));
  }
  if (values.size() < 2 || values.front().size() < 3) {
    return std::nullopt;
  }

  result.eigenvalues = TopEigenvalues(CovarianceMatrix(CenterColumns(values)));
  result.explained_variance = ExplainedVariance(result.eigenvalues);
  result.estimated_clusters =
      EstimateClusterCount(result.eigenvalues, result.explained_variance);
  result.has_multiple_responsibilities = result.estimated_clusters >= 2;
  result.recommendation_text =
      Recommend(result.estimated_clusters,
                static_cast<int>(result.method_names.size()),
                static_cast<int>(result.field_names.size()),
                result.explained_variance);
  return result;
}

} // namespace health
