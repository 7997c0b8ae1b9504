#include <health/markdown_reporter.h>
#include <health/rule_based_diagnostics_engine.h>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

namespace health {
namespace {

using ::testing::HasSubstr;
using ::testing::IsEmpty;
using ::testing::Not;

AnalysisReport SampleReport() {
  AnalysisReport report;
  report.module_path = "shop";
  report.total_loc = 300;
  report.skipped_directories = {"legacy"};

  PackageResult storage;
  storage.name = "storage";
  storage.path = "storage";
  storage.total_loc = 100;
  storage.coupling.afferent = 2;
  storage.coupling.instability = 0.0;

  PackageResult api;
  api.name = "api";
  api.path = "api";
  api.total_loc = 200;
  api.coupling.efferent = 3;
  api.coupling.instability = 1.0;

  StructResult router;
  router.cohesion.struct_name = "Router";
  router.cohesion.file_path = "api/router.h";
  router.cohesion.lcom4_score = 4;
  router.cohesion.components = {{"Router.Route", "table"}, {"Router.Log"}};
  StructResult handler;
  handler.cohesion.struct_name = "Handler";
  handler.cohesion.lcom4_score = 1;
  api.structs = {handler, router};

  ComplexityResult simple;
  simple.func_name = "Router.Log";
  simple.complexity = 2;
  ComplexityResult branchy;
  branchy.func_name = "Router.Route";
  branchy.complexity = 18;
  api.functions = {simple, branchy};

  report.packages = {storage, api};
  return report;
}

DiagnosticsResult SampleDiagnostics() {
  DiagnosticsResult diagnostics;
  Finding finding;
  finding.kind = kComplexFunctionFinding;
  finding.target_name = "api.Router.Route";
  finding.severity = Severity::kWarning;
  finding.message = "Function 'Router.Route' is too complex (Complexity=18).";
  finding.evidence = {{"complexity", 18},
                      {"explained_variance", std::vector<double>{0.5, 0.25}},
                      {"package", std::string("api")}};
  finding.related_path = FunctionAnchor("api", "Router.Route");
  diagnostics.findings.push_back(finding);
  return diagnostics;
}

AnalysisConfig ConfigFor(std::vector<std::string> formats) {
  AnalysisConfig config;
  config.root_path = "/work/shop";
  config.formats = std::move(formats);
  config.scope_notes = "Nightly run";
  return config;
}

TEST(MarkdownReporterTest, RendersSectionsAndSummary) {
  MarkdownReporter reporter;

  const auto report = reporter.Render(SampleReport(), SampleDiagnostics(),
                                      ConfigFor({"markdown"}));

  EXPECT_THAT(report.markdown, HasSubstr("# Code Health Report"));
  EXPECT_THAT(report.markdown, HasSubstr("| Source | /work/shop |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Scope Notes | Nightly run |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Packages | 2 |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Structs with LCOM4 > 2 | 1 |"));
  EXPECT_THAT(report.markdown,
              HasSubstr("| Functions with Complexity > 15 | 1 |"));
  EXPECT_THAT(report.markdown,
              HasSubstr("| Packages with Instability > 0.7 | 1 |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Warnings | 1 |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Skipped Directories | legacy |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Total Lines of Code | 300 |"));
  EXPECT_THAT(report.json, IsEmpty());
}

TEST(MarkdownReporterTest, FindingLinksResolveToAnchors) {
  const auto report = MarkdownReporter().Render(
      SampleReport(), SampleDiagnostics(), ConfigFor({"markdown"}));

  EXPECT_THAT(report.markdown,
              HasSubstr("[api.Router.Route](#function-api-Router.Route)"));
  EXPECT_THAT(report.markdown,
              HasSubstr("<a id=\"function-api-Router.Route\"></a>"));
  EXPECT_THAT(report.markdown, HasSubstr("<a id=\"struct-api-Router\"></a>"));
  EXPECT_THAT(report.markdown, HasSubstr("<a id=\"package-storage\"></a>"));
}

TEST(MarkdownReporterTest, OrdersPackagesStructsAndFunctions) {
  const auto markdown = MarkdownReporter()
                            .Render(SampleReport(), SampleDiagnostics(),
                                    ConfigFor({"markdown"}))
                            .markdown;

  EXPECT_LT(markdown.find("<a id=\"package-api\">"),
            markdown.find("<a id=\"package-storage\">"));
  EXPECT_LT(markdown.find("<a id=\"struct-api-Router\">"),
            markdown.find("<a id=\"struct-api-Handler\">"));
  EXPECT_LT(markdown.find("<a id=\"function-api-Router.Route\">"),
            markdown.find("<a id=\"function-api-Router.Log\">"));
}

TEST(MarkdownReporterTest, RendersJsonWhenRequested) {
  const auto report = MarkdownReporter().Render(
      SampleReport(), SampleDiagnostics(), ConfigFor({"markdown", "json"}));

  EXPECT_THAT(report.json, HasSubstr("\"module\": \"shop\""));
  EXPECT_THAT(report.json, HasSubstr("\"kind\": \"Overly Complex Function\""));
  EXPECT_THAT(report.json, HasSubstr("\"complexity\": 18"));
  EXPECT_THAT(report.json, HasSubstr("\"explained_variance\": [0.5,0.25]"));
  EXPECT_THAT(report.json, HasSubstr("\"skipped_directories\": [\"legacy\"]"));
  EXPECT_THAT(report.json, HasSubstr("\"method_clusters\": null"));
  EXPECT_THAT(report.markdown, Not(IsEmpty()));
}

TEST(MarkdownReporterTest, JsonOnlySkipsMarkdown) {
  const auto report = MarkdownReporter().Render(
      SampleReport(), SampleDiagnostics(), ConfigFor({"json"}));

  EXPECT_THAT(report.markdown, IsEmpty());
  EXPECT_THAT(report.json, Not(IsEmpty()));
}

TEST(MarkdownReporterTest, EmptyAnalysisRendersPlaceholders) {
  AnalysisConfig config = ConfigFor({"markdown"});
  config.scope_notes.clear();

  const auto report =
      MarkdownReporter().Render(AnalysisReport{}, DiagnosticsResult{}, config);

  EXPECT_THAT(report.markdown, HasSubstr("| Scope Notes | None |"));
  EXPECT_THAT(report.markdown, HasSubstr("| None | - | - | - |"));
  EXPECT_THAT(report.markdown, HasSubstr("| Skipped Directories | None |"));
}

TEST(MarkdownReporterTest, EscapesJsonStrings) {
  EXPECT_EQ(EscapeJsonString("say \"hi\"\n\\path\t"),
            "say \\\"hi\\\"\\n\\\\path\\t");
}

TEST(MarkdownReporterTest, CustomSummaryThresholds) {
  HeuristicConfig config;
  config.summary_high_lcom4 = 5;

  const auto markdown = MarkdownReporter(config)
                            .Render(SampleReport(), SampleDiagnostics(),
                                    ConfigFor({"markdown"}))
                            .markdown;

  EXPECT_THAT(markdown, HasSubstr("| Structs with LCOM4 > 5 | 0 |"));
}

} // namespace
} // namespace health
