#include <health/coupling_analyzer.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/fact_builders.h"

namespace health {
namespace {

using ::testing::ElementsAre;
using test::Package;

FactModel ChainModel() {
  FactModel model;
  model.module_path = "app";
  model.packages = {Package("a", {"app/b", "fmt"}), Package("b", {"app/c"}),
                    Package("c")};
  return model;
}

TEST(CouplingAnalyzerTest, ImportPathsJoinModuleAndPackagePath) {
  EXPECT_EQ(ImportPathFor("app", ""), "app");
  EXPECT_EQ(ImportPathFor("app", "net/http"), "app/net/http");
}

TEST(CouplingAnalyzerTest, ModulePrefixMatchingRespectsPathBoundaries) {
  EXPECT_TRUE(IsWithinModule("app", "app"));
  EXPECT_TRUE(IsWithinModule("app/core", "app"));
  EXPECT_FALSE(IsWithinModule("application/core", "app"));
  EXPECT_FALSE(IsWithinModule("app/core", ""));
}

TEST(CouplingAnalyzerTest, GraphRecordsImportersAndDropsSelfImports) {
  auto model = ChainModel();
  model.packages[1].imports.insert("app/b");

  const auto graph = BuildDependencyGraph(model);

  ASSERT_EQ(graph.size(), 3u);
  EXPECT_THAT(graph.at("a").imports, ElementsAre("app/b", "fmt"));
  EXPECT_THAT(graph.at("b").imports, ElementsAre("app/c"));
  EXPECT_THAT(graph.at("b").imported_by, ElementsAre("app/a"));
  EXPECT_THAT(graph.at("c").imported_by, ElementsAre("app/b"));
}

TEST(CouplingAnalyzerTest, CouplingCountsOnlyInProjectEdges) {
  const auto model = ChainModel();
  const auto graph = BuildDependencyGraph(model);

  const auto coupling = CalculateCoupling(graph, model.module_path);

  EXPECT_EQ(coupling.at("a").afferent, 0);
  EXPECT_EQ(coupling.at("a").efferent, 1);
  EXPECT_DOUBLE_EQ(coupling.at("a").instability, 1.0);
  EXPECT_EQ(coupling.at("b").afferent, 1);
  EXPECT_EQ(coupling.at("b").efferent, 1);
  EXPECT_DOUBLE_EQ(coupling.at("b").instability, 0.5);
  EXPECT_EQ(coupling.at("c").afferent, 1);
  EXPECT_EQ(coupling.at("c").efferent, 0);
  EXPECT_DOUBLE_EQ(coupling.at("c").instability, 0.0);
}

TEST(CouplingAnalyzerTest, DepthIsLongestImportChain) {
  const auto model = ChainModel();
  const auto depths =
      CalculateDependencyDepth(BuildDependencyGraph(model), model.module_path);

  EXPECT_EQ(depths.at("a"), 2);
  EXPECT_EQ(depths.at("b"), 1);
  EXPECT_EQ(depths.at("c"), 0);
}

TEST(CouplingAnalyzerTest, CycleTerminatesWithFiniteDepths) {
  FactModel model;
  model.module_path = "app";
  model.packages = {Package("x", {"app/y"}), Package("y", {"app/x"})};

  const auto depths =
      CalculateDependencyDepth(BuildDependencyGraph(model), model.module_path);

  EXPECT_EQ(depths.at("x"), 1);
  EXPECT_EQ(depths.at("y"), 0);
}

TEST(CouplingAnalyzerTest, UnanalyzedInProjectImportCountsButIsNotWalked) {
  FactModel model;
  model.module_path = "app";
  model.packages = {Package("ui", {"app/generated"})};

  const auto graph = BuildDependencyGraph(model);
  const auto coupling = CalculateCoupling(graph, model.module_path);
  const auto depths = CalculateDependencyDepth(graph, model.module_path);

  EXPECT_EQ(coupling.at("ui").efferent, 1);
  EXPECT_EQ(depths.at("ui"), 0);
}

TEST(CouplingAnalyzerTest, RootPackageUsesModuleAsImportPath) {
  FactModel model;
  model.module_path = "app";
  model.packages = {Package(""), Package("tools", {"app"})};

  const auto graph = BuildDependencyGraph(model);

  EXPECT_EQ(graph.at("").import_path, "app");
  EXPECT_THAT(graph.at("").imported_by, ElementsAre("app/tools"));
}

} // namespace
} // namespace health
