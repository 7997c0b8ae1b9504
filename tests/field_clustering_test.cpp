#include <health/field_clustering.h>

#include <numeric>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fact_builders.h"

namespace health {
namespace {

using ::testing::DoubleNear;
using ::testing::ElementsAre;
using ::testing::HasSubstr;
using ::testing::StartsWith;
using test::Method;

StructFacts StructFromMatrix(const std::vector<std::vector<int>> &matrix) {
  StructFacts structure;
  structure.name = "Widget";
  for (std::size_t j = 0; j < matrix.front().size(); ++j) {
    structure.fields.push_back("field" + std::to_string(j));
  }
  for (std::size_t i = 0; i < matrix.size(); ++i) {
    std::map<std::string, int> usage;
    for (std::size_t j = 0; j < matrix[i].size(); ++j) {
      if (matrix[i][j] != kFieldUnused) {
        usage[structure.fields[j]] = matrix[i][j];
      }
    }
    structure.methods.push_back(
        Method("Widget", "Op" + std::to_string(i), usage));
  }
  return structure;
}

TEST(FieldClusteringTest, CovarianceOfCenteredColumns) {
  const Matrix values = {{1.0, 2.0}, {3.0, 6.0}};

  const auto centered = CenterColumns(values);
  const auto covariance = CovarianceMatrix(centered);

  EXPECT_THAT(centered[0], ElementsAre(-1.0, -2.0));
  ASSERT_EQ(covariance.size(), 2u);
  EXPECT_DOUBLE_EQ(covariance[0][0], 2.0);
  EXPECT_DOUBLE_EQ(covariance[0][1], 4.0);
  EXPECT_DOUBLE_EQ(covariance[1][1], 8.0);
}

TEST(FieldClusteringTest, ExplainedVarianceNormalizesPositiveTotal) {
  EXPECT_THAT(ExplainedVariance({3.0, 1.0}), ElementsAre(0.75, 0.25));
  EXPECT_THAT(ExplainedVariance({0.0}), ElementsAre(0.0));
}

TEST(FieldClusteringTest, EstimateCombinesKaiserElbowAndVarianceCap) {
  const FieldClusterAnalyzer analyzer;

  EXPECT_EQ(analyzer.EstimateClusterCount({3.0, 1.5, 0.5}, {0.6, 0.3, 0.1}), 2);
  EXPECT_EQ(analyzer.EstimateClusterCount({0.5}, {1.0}), 1);
  EXPECT_EQ(analyzer.EstimateClusterCount({}, {}), 1);
}

TEST(FieldClusteringTest, PowerIterationFindsDominantEigenvalue) {
  const FieldClusterAnalyzer analyzer;
  const Matrix diagonal = {{4.0, 0.0}, {0.0, 1.0}};

  const auto eigenvalues = analyzer.TopEigenvalues(diagonal);

  ASSERT_FALSE(eigenvalues.empty());
  EXPECT_THAT(eigenvalues.front(), DoubleNear(4.0, 1e-6));
}

TEST(FieldClusteringTest, UniformUsageIsSingleResponsibility) {
  const auto structure = StructFromMatrix({{3, 3, 3}, {3, 3, 3}, {3, 3, 3}});

  const auto result = FieldClusterAnalyzer().Analyze(structure);

  ASSERT_TRUE(result.has_value());
  EXPECT_EQ(result->estimated_clusters, 1);
  EXPECT_FALSE(result->has_multiple_responsibilities);
  EXPECT_EQ(result->recommendation_text,
            "Analysis suggests a single cohesive responsibility. The 3 "
            "methods work together on 3 fields in a unified way. This is a "
            "good sign of high cohesion.");
}

TEST(FieldClusteringTest, SeparatedUsageBlocksSuggestSplitting) {
  const auto structure = StructFromMatrix({{3, 1, 0, 0, 0, 0},
                                           {1, 3, 0, 0, 0, 0},
                                           {3, 3, 0, 0, 0, 0},
                                           {0, 0, 0, 3, 1, 0},
                                           {0, 0, 0, 1, 3, 0},
                                           {0, 0, 0, 3, 3, 0}});

  const auto result = FieldClusterAnalyzer().Analyze(structure);

  ASSERT_TRUE(result.has_value());
  EXPECT_GE(result->estimated_clusters, 2);
  EXPECT_LE(result->estimated_clusters, 5);
  EXPECT_TRUE(result->has_multiple_responsibilities);
  EXPECT_EQ(result->method_names.size(), 6u);
  EXPECT_EQ(result->matrix[0], (std::vector<int>{3, 1, 0, 0, 0, 0}));
  EXPECT_THAT(std::accumulate(result->explained_variance.begin(),
                              result->explained_variance.end(), 0.0),
              DoubleNear(1.0, 1e-9));
  EXPECT_THAT(result->recommendation_text,
              StartsWith("Analysis detects " +
                         std::to_string(result->estimated_clusters) +
                         " distinct responsibility clusters"));
}

TEST(FieldClusteringTest, RecommendationListsVarianceSharesDescending) {
  const FieldClusterAnalyzer analyzer;

  const auto text = analyzer.Recommend(2, 4, 5, {0.4, 0.6});

  EXPECT_THAT(text, HasSubstr("(variance explained: 60.0%, 40.0%)"));
  EXPECT_THAT(text, HasSubstr("shows moderate separation"));
  EXPECT_THAT(analyzer.Recommend(2, 4, 5, {0.7, 0.3}),
              HasSubstr("shows strong separation"));
  EXPECT_THAT(analyzer.Recommend(2, 4, 5, {0.2, 0.1}),
              HasSubstr("shows weak separation"));
}

TEST(FieldClusteringTest, BelowDataThresholdHasNoResult) {
  const FieldClusterAnalyzer analyzer;
  EXPECT_FALSE(analyzer.Analyze(StructFromMatrix({{1, 1}, {1, 2}})).has_value());
  EXPECT_FALSE(analyzer.Analyze(StructFromMatrix({{1, 2, 3}})).has_value());
}

TEST(FieldClusteringTest, UtilityMethodsAreNotRows) {
  auto structure = StructFromMatrix({{3, 0, 1}, {0, 3, 1}});
  structure.methods[1].is_utility = true;

  EXPECT_FALSE(FieldClusterAnalyzer().Analyze(structure).has_value());
}

} // namespace
} // namespace health
