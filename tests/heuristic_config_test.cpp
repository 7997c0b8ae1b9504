#include <health/heuristic_config.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace health {
namespace {

using ::testing::ElementsAre;

TEST(HeuristicConfigTest, DefaultsMatchDocumentedThresholds) {
  const auto &config = DefaultHeuristicConfig();
  EXPECT_EQ(config.god_object_lcom4, 5);
  EXPECT_EQ(config.god_object_afferent, 10);
  EXPECT_DOUBLE_EQ(config.unstable_foundation_instability, 0.7);
  EXPECT_EQ(config.complex_function_complexity, 15);
  EXPECT_EQ(config.ambiguous_struct_lcom4, 3);
  EXPECT_EQ(config.ambiguous_struct_method_complexity, 10);
  EXPECT_EQ(config.power_iterations, 100);
  EXPECT_EQ(config.critical_field_clusters, 3);
}

TEST(HeuristicConfigTest, PrivateNamesStartLowercase) {
  EXPECT_TRUE(IsPrivateName("Cache.evictOldest"));
  EXPECT_TRUE(IsPrivateName("helper"));
  EXPECT_FALSE(IsPrivateName("Cache.Evict"));
  EXPECT_FALSE(IsPrivateName("_internal"));
  EXPECT_FALSE(IsPrivateName(""));
}

TEST(HeuristicConfigTest, UtilityNamesMatchPatternsAndAccessors) {
  EXPECT_TRUE(IsUtilityMethodName("Cache.testInsert"));
  EXPECT_TRUE(IsUtilityMethodName("formatHelper"));
  EXPECT_TRUE(IsUtilityMethodName("Cache.GetSize"));
  EXPECT_TRUE(IsUtilityMethodName("HasEntries"));
  EXPECT_TRUE(IsUtilityMethodName("StubClock"));
  EXPECT_FALSE(IsUtilityMethodName("Getaway"));
  EXPECT_FALSE(IsUtilityMethodName("Cache.evict"));
}

TEST(HeuristicConfigTest, CustomPatternsReplaceDefaults) {
  HeuristicConfig config;
  config.utility_patterns = {"debug"};

  EXPECT_TRUE(IsUtilityMethodName("dumpDebugState", config));
  EXPECT_FALSE(IsUtilityMethodName("testInsert", config));
}

TEST(HeuristicConfigTest, SplitsCamelAndSnakeCase) {
  EXPECT_THAT(SplitIdentifierWords("parseHeaderLine"),
              ElementsAre("parse", "Header", "Line"));
  EXPECT_THAT(SplitIdentifierWords("read_config_file"),
              ElementsAre("read", "config", "file"));
  EXPECT_THAT(SplitIdentifierWords("Flush"), ElementsAre("Flush"));
}

TEST(HeuristicConfigTest, QualifiedAndBareNamesRoundTrip) {
  EXPECT_EQ(QualifiedMethodName("Parser", "next"), "Parser.next");
  EXPECT_EQ(BareName("Parser.next"), "next");
  EXPECT_EQ(BareName("free_function"), "free_function");
}

} // namespace
} // namespace health
