#include <health/complexity_analyzer.h>

#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fact_builders.h"

namespace health {
namespace {

using ::testing::ElementsAre;
using ::testing::IsEmpty;
using test::Function;

TEST(ComplexityAnalyzerTest, CountsEveryDecisionPoint) {
  FunctionFacts function = Function("Dispatch");
  function.decision_points.if_statements = 2;
  function.decision_points.loops = 1;
  function.decision_points.switch_statements = 1;
  function.decision_points.case_clauses = 3;
  function.decision_points.logical_operators = 2;

  EXPECT_EQ(CyclomaticComplexity(function), 10);
}

TEST(ComplexityAnalyzerTest, EachAddedDecisionPointRaisesComplexityByOne) {
  const FunctionFacts base = Function("Route", 2);
  const auto base_complexity = CyclomaticComplexity(base);

  const std::vector<int DecisionPoints::*> kinds = {
      &DecisionPoints::if_statements,     &DecisionPoints::loops,
      &DecisionPoints::switch_statements, &DecisionPoints::case_clauses,
      &DecisionPoints::select_cases,      &DecisionPoints::logical_operators};
  for (const auto kind : kinds) {
    FunctionFacts extended = base;
    ++(extended.decision_points.*kind);
    EXPECT_EQ(CyclomaticComplexity(extended), base_complexity + 1);
  }
}

TEST(ComplexityAnalyzerTest, DeclarationWithoutBodyScoresOne) {
  FunctionFacts function;
  function.qualified_name = "Declared";
  function.decision_points.if_statements = 4;

  EXPECT_EQ(CyclomaticComplexity(function), 1);
  EXPECT_EQ(FunctionLoc(function), 0);
}

TEST(ComplexityAnalyzerTest, LocIsBodySpanClampedAtZero) {
  auto function = Function("Span", 0, 12);
  EXPECT_EQ(FunctionLoc(function), 12);

  function.body_start_line = 20;
  function.body_end_line = 10;
  EXPECT_EQ(FunctionLoc(function), 0);
}

TEST(ComplexityAnalyzerTest, SplitsDependenciesAtModuleBoundary) {
  const auto [internal, external] = CategorizeDependencies(
      {"shop/orders", "shop", "shopping/cart", "fmt", "std"}, "shop");

  EXPECT_THAT(internal, ElementsAre("shop/orders", "shop"));
  EXPECT_THAT(external, ElementsAre("shopping/cart", "fmt", "std"));
}

TEST(ComplexityAnalyzerTest, AfferentCountsDistinctCallersInPackage) {
  PackageFacts package;
  package.path = "core";
  auto parse = Function("Parse");
  auto load = Function("Load");
  load.calls = {{"Parse", 3}, {"Missing", 1}};
  auto reload = Function("Reload");
  reload.calls = {{"Parse", 1}, {"Reload", 2}};
  package.functions = {parse, load, reload};

  const auto results = CalculateComplexity(package, "app");

  ASSERT_EQ(results.size(), 3u);
  EXPECT_EQ(results[0].func_name, "Parse");
  EXPECT_EQ(results[0].afferent, 2);
  EXPECT_EQ(results[1].afferent, 0);
  EXPECT_EQ(results[2].afferent, 0);
}

TEST(ComplexityAnalyzerTest, EfferentCountsImportedPackagesUsed) {
  PackageFacts package;
  package.path = "api";
  package.functions = {Function("Serve", 1, 5, {"app/core", "boost", "fmt"})};

  const auto results = CalculateComplexity(package, "app");

  ASSERT_EQ(results.size(), 1u);
  const auto &result = results.front();
  EXPECT_EQ(result.complexity, 2);
  EXPECT_EQ(result.efferent, 3);
  EXPECT_THAT(result.internal_dependencies, ElementsAre("app/core"));
  EXPECT_THAT(result.external_dependencies, ElementsAre("boost", "fmt"));
  EXPECT_DOUBLE_EQ(result.instability, 1.0);
}

TEST(ComplexityAnalyzerTest, InstabilityIsZeroWithoutCoupling) {
  EXPECT_DOUBLE_EQ(Instability(0, 0), 0.0);
  EXPECT_DOUBLE_EQ(Instability(3, 1), 0.25);
}

TEST(ComplexityAnalyzerTest, EmptyPackageHasNoResults) {
  PackageFacts package;
  EXPECT_THAT(CalculateComplexity(package, "app"), IsEmpty());
}

} // namespace
} // namespace health
