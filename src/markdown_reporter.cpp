#include <health/markdown_reporter.h>

#include <health/rule_based_diagnostics_engine.h>

#include <algorithm>
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <tuple>
#include <type_traits>
#include <unordered_map>
#include <utility>
#include <variant>
#include <vector>

namespace health {
namespace {

template <typename Collection, typename Formatter>
std::string Join(const Collection &items, const std::string &delimiter,
                 Formatter formatter) {
  std::ostringstream output;
  bool first = true;
  std::for_each(items.begin(), items.end(), [&](const auto &item) {
    if (!first) {
      output << delimiter;
    }
    output << formatter(item);
    first = false;
  });
  return output.str();
}

std::string Quoted(const std::string &value) {
  return "\"" + EscapeJsonString(value) + "\"";
}

std::string JoinJsonArray(const std::vector<std::string> &values) {
  return "[" + Join(values, ",", Quoted) + "]";
}

std::string FormatNumber(double value) {
  std::ostringstream stream;
  stream << value;
  return stream.str();
}

std::string FormatFixed(double value, int precision) {
  std::ostringstream stream;
  stream << std::fixed << std::setprecision(precision) << value;
  return stream.str();
}

// Table cells cannot hold pipes or line breaks.
std::string Cell(const std::string &value) {
  std::string cell;
  cell.reserve(value.size());
  for (const auto character : value) {
    if (character == '|') {
      cell.append("\\|");
    } else if (character == '\n') {
      cell.append("<br>");
    } else {
      cell.push_back(character);
    }
  }
  return cell.empty() ? "-" : cell;
}

std::string AnchorTag(const std::string &related_path) {
  return "<a id=\"" + related_path.substr(1) + "\"></a>";
}

bool ShouldRenderFormat(const std::vector<std::string> &formats,
                        const std::string &format) {
  if (formats.empty()) {
    return format == "markdown";
  }
  return std::find(formats.begin(), formats.end(), format) != formats.end();
}

struct StructEntry {
  const PackageResult *package;
  const StructResult *structure;
};

struct FunctionEntry {
  const PackageResult *package;
  const ComplexityResult *function;
};

std::vector<const PackageResult *> PackagesByName(const AnalysisReport &report) {
  std::vector<const PackageResult *> packages;
  for (const auto &package : report.packages) {
    packages.push_back(&package);
  }
  std::stable_sort(packages.begin(), packages.end(),
                   [](const PackageResult *left, const PackageResult *right) {
                     return std::tie(left->name, left->path) <
                            std::tie(right->name, right->path);
                   });
  return packages;
}

std::vector<StructEntry> StructsByLcom4(const AnalysisReport &report) {
  std::vector<StructEntry> structs;
  for (const auto &package : report.packages) {
    for (const auto &structure : package.structs) {
      structs.push_back({&package, &structure});
    }
  }
  std::stable_sort(structs.begin(), structs.end(),
                   [](const StructEntry &left, const StructEntry &right) {
                     return left.structure->cohesion.lcom4_score >
                            right.structure->cohesion.lcom4_score;
                   });
  return structs;
}

std::vector<FunctionEntry> FunctionsByComplexity(const AnalysisReport &report) {
  std::vector<FunctionEntry> functions;
  for (const auto &package : report.packages) {
    for (const auto &function : package.functions) {
      functions.push_back({&package, &function});
    }
  }
  std::stable_sort(functions.begin(), functions.end(),
                   [](const FunctionEntry &left, const FunctionEntry &right) {
                     return left.function->complexity >
                            right.function->complexity;
                   });
  return functions;
}

struct Summary {
  std::size_t packages = 0;
  std::size_t structs = 0;
  std::size_t functions = 0;
  std::size_t high_lcom4 = 0;
  std::size_t high_complexity = 0;
  std::size_t high_instability = 0;
  std::size_t critical = 0;
  std::size_t warnings = 0;
};

Summary Summarize(const AnalysisReport &report,
                  const DiagnosticsResult &diagnostics,
                  const HeuristicConfig &config) {
  Summary summary;
  summary.packages = report.packages.size();
  for (const auto &package : report.packages) {
    summary.structs += package.structs.size();
    summary.functions += package.functions.size();
    if (package.coupling.instability > config.summary_high_instability) {
      ++summary.high_instability;
    }
    summary.high_lcom4 += static_cast<std::size_t>(std::count_if(
        package.structs.begin(), package.structs.end(),
        [&](const StructResult &structure) {
          return structure.cohesion.lcom4_score > config.summary_high_lcom4;
        }));
    summary.high_complexity += static_cast<std::size_t>(std::count_if(
        package.functions.begin(), package.functions.end(),
        [&](const ComplexityResult &function) {
          return function.complexity > config.summary_high_complexity;
        }));
  }
  for (const auto &finding : diagnostics.findings) {
    if (finding.severity == Severity::kCritical) {
      ++summary.critical;
    } else {
      ++summary.warnings;
    }
  }
  return summary;
}

std::string BuildAnalysisHeaderMarkdown(const AnalysisReport &report,
                                        const AnalysisConfig &config,
                                        const std::string &timestamp) {
  std::ostringstream section;
  section << "## Analysis Header\n\n";
  section << "| Field | Value |\n";
  section << "| --- | --- |\n";
  section << "| Generated On | " << timestamp << " |\n";
  section << "| Source | " << Cell(config.root_path) << " |\n";
  section << "| Module | " << Cell(report.module_path) << " |\n";
  section << "| Scope Notes | "
          << (config.scope_notes.empty() ? "None" : Cell(config.scope_notes))
          << " |\n\n";
  return section.str();
}

std::string BuildSummaryMarkdown(const AnalysisReport &report,
                                 const Summary &summary,
                                 const HeuristicConfig &config) {
  std::ostringstream section;
  section << "## Summary\n\n";
  section << "| Metric | Value |\n";
  section << "| --- | --- |\n";
  section << "| Packages | " << summary.packages << " |\n";
  section << "| Structs | " << summary.structs << " |\n";
  section << "| Functions | " << summary.functions << " |\n";
  section << "| Total Lines of Code | " << report.total_loc << " |\n";
  section << "| Structs with LCOM4 > " << config.summary_high_lcom4 << " | "
          << summary.high_lcom4 << " |\n";
  section << "| Functions with Complexity > "
          << config.summary_high_complexity << " | "
          << summary.high_complexity << " |\n";
  section << "| Packages with Instability > "
          << FormatNumber(config.summary_high_instability) << " | "
          << summary.high_instability << " |\n";
  section << "| Critical Findings | " << summary.critical << " |\n";
  section << "| Warnings | " << summary.warnings << " |\n";
  section << "| Skipped Directories | "
          << (report.skipped_directories.empty()
                  ? std::string("None")
                  : Join(report.skipped_directories, ", ",
                         [](const std::string &value) { return Cell(value); }))
          << " |\n\n";
  return section.str();
}

std::string BuildDiagnosticsMarkdown(const DiagnosticsResult &diagnostics) {
  std::ostringstream section;
  section << "## Diagnostics\n\n";
  section << "| Severity | Kind | Target | Message |\n";
  section << "| --- | --- | --- | --- |\n";
  if (diagnostics.findings.empty()) {
    section << "| None | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &finding : diagnostics.findings) {
    section << "| " << SeverityName(finding.severity) << " | " << finding.kind
            << " | [" << Cell(finding.target_name) << "]("
            << finding.related_path << ") | " << Cell(finding.message)
            << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildPackagesMarkdown(const AnalysisReport &report) {
  std::ostringstream section;
  section << "## Packages\n\n";
  section << "| Package | Path | Files | LoC | Functions | Avg Function LoC "
             "| Ca | Ce | Instability | Depth |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- | --- | --- |\n";
  if (report.packages.empty()) {
    section << "| None | - | - | - | - | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto *package : PackagesByName(report)) {
    const auto &coupling = package->coupling;
    section << "| " << AnchorTag(PackageAnchor(package->path))
            << Cell(package->name) << " | "
            << Cell(package->path.empty() ? "." : package->path) << " | "
            << package->file_count << " | " << package->total_loc << " | "
            << package->func_count << " | "
            << FormatFixed(package->avg_func_loc, 1) << " | "
            << coupling.afferent << " | " << coupling.efferent << " | "
            << FormatFixed(coupling.instability, 2) << " | "
            << coupling.dependency_depth << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string DescribeMethodClusters(const StructResult &structure) {
  if (!structure.method_clusters ||
      structure.method_clusters->clusters.empty()) {
    return "-";
  }
  return Join(structure.method_clusters->clusters, "<br>",
              [](const MethodCluster &cluster) {
                return std::to_string(cluster.id) + ". " +
                       cluster.responsibility_hint + ": " +
                       Join(cluster.methods, ", ",
                            [](const std::string &name) { return name; });
              });
}

std::string DescribeFieldClusters(const StructResult &structure) {
  if (!structure.field_clusters) {
    return "-";
  }
  return std::to_string(structure.field_clusters->estimated_clusters) + " (" +
         Join(structure.field_clusters->explained_variance, ", ",
              [](double ratio) { return FormatFixed(ratio * 100.0, 1) + "%"; }) +
         ")";
}

std::string BuildStructsMarkdown(const AnalysisReport &report) {
  std::ostringstream section;
  section << "## Structs\n\n";
  section << "| Struct | Package | File | LCOM4 | Components | Method "
             "Clusters | Field Clusters |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- |\n";
  const auto structs = StructsByLcom4(report);
  if (structs.empty()) {
    section << "| None | - | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &entry : structs) {
    const auto &cohesion = entry.structure->cohesion;
    const auto components =
        Join(cohesion.components, "<br>", [](const std::vector<std::string> &members) {
          return "{" + Join(members, ", ", [](const std::string &name) {
                   return name;
                 }) + "}";
        });
    section << "| "
            << AnchorTag(StructAnchor(entry.package->path, cohesion.struct_name))
            << Cell(cohesion.struct_name) << " | " << Cell(entry.package->name)
            << " | " << Cell(cohesion.file_path) << " | "
            << cohesion.lcom4_score << " | " << Cell(components) << " | "
            << DescribeMethodClusters(*entry.structure) << " | "
            << DescribeFieldClusters(*entry.structure) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string BuildFunctionsMarkdown(const AnalysisReport &report) {
  std::ostringstream section;
  section << "## Functions\n\n";
  section << "| Function | Package | File | Complexity | LoC | Ca | Ce | "
             "Instability |\n";
  section << "| --- | --- | --- | --- | --- | --- | --- | --- |\n";
  const auto functions = FunctionsByComplexity(report);
  if (functions.empty()) {
    section << "| None | - | - | - | - | - | - | - |\n\n";
    return section.str();
  }
  for (const auto &entry : functions) {
    const auto &function = *entry.function;
    section << "| "
            << AnchorTag(FunctionAnchor(entry.package->path, function.func_name))
            << Cell(function.func_name) << " | " << Cell(entry.package->name)
            << " | " << Cell(function.file_path) << " | "
            << function.complexity << " | " << function.loc << " | "
            << function.afferent << " | " << function.efferent << " | "
            << FormatFixed(function.instability, 2) << " |\n";
  }
  section << "\n";
  return section.str();
}

std::string EvidenceJson(const EvidenceValue &value) {
  return std::visit(
      [](const auto &item) -> std::string {
        using T = std::decay_t<decltype(item)>;
        if constexpr (std::is_same_v<T, int>) {
          return std::to_string(item);
        } else if constexpr (std::is_same_v<T, double>) {
          return FormatNumber(item);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return Quoted(item);
        } else if constexpr (std::is_same_v<T, std::vector<std::string>>) {
          return JoinJsonArray(item);
        } else {
          return "[" + Join(item, ",", FormatNumber) + "]";
        }
      },
      value);
}

std::string BuildAnalysisHeaderJson(const AnalysisReport &report,
                                    const AnalysisConfig &config,
                                    const std::string &timestamp) {
  std::ostringstream json;
  json << "\"analysis_header\": {";
  json << "\"generated_on\": " << Quoted(timestamp) << ",";
  json << "\"source\": " << Quoted(config.root_path) << ",";
  json << "\"module\": " << Quoted(report.module_path) << ",";
  json << "\"scope_notes\": "
       << Quoted(config.scope_notes.empty() ? "None" : config.scope_notes)
       << "}";
  return json.str();
}

std::string BuildSummaryJson(const AnalysisReport &report,
                             const Summary &summary) {
  std::ostringstream json;
  json << "\"summary\": {";
  json << "\"packages\": " << summary.packages << ",";
  json << "\"structs\": " << summary.structs << ",";
  json << "\"functions\": " << summary.functions << ",";
  json << "\"total_loc\": " << report.total_loc << ",";
  json << "\"high_lcom4_structs\": " << summary.high_lcom4 << ",";
  json << "\"high_complexity_functions\": " << summary.high_complexity << ",";
  json << "\"high_instability_packages\": " << summary.high_instability << ",";
  json << "\"critical_findings\": " << summary.critical << ",";
  json << "\"warnings\": " << summary.warnings << ",";
  json << "\"skipped_directories\": "
       << JoinJsonArray(report.skipped_directories) << "}";
  return json.str();
}

std::string MethodClustersJson(const std::optional<MethodClusterResult> &result) {
  if (!result) {
    return "null";
  }
  std::ostringstream json;
  json << "{\"total_private_methods\": " << result->total_private_methods
       << ",";
  json << "\"has_multiple_islands\": "
       << (result->has_multiple_islands ? "true" : "false") << ",";
  json << "\"clusters\": ["
       << Join(result->clusters, ",",
               [](const MethodCluster &cluster) {
                 std::ostringstream item;
                 item << "{\"id\": " << cluster.id << ",";
                 item << "\"size\": " << cluster.size << ",";
                 item << "\"methods\": " << JoinJsonArray(cluster.methods)
                      << ",";
                 item << "\"called_by\": " << JoinJsonArray(cluster.called_by)
                      << ",";
                 item << "\"responsibility_hint\": "
                      << Quoted(cluster.responsibility_hint) << "}";
                 return item.str();
               })
       << "]}";
  return json.str();
}

std::string FieldClustersJson(const std::optional<FieldClusterResult> &result) {
  if (!result) {
    return "null";
  }
  std::ostringstream json;
  json << "{\"method_names\": " << JoinJsonArray(result->method_names) << ",";
  json << "\"field_names\": " << JoinJsonArray(result->field_names) << ",";
  json << "\"matrix\": ["
       << Join(result->matrix, ",",
               [](const std::vector<int> &row) {
                 return "[" +
                        Join(row, ",",
                             [](int value) { return std::to_string(value); }) +
                        "]";
               })
       << "],";
  json << "\"eigenvalues\": [" << Join(result->eigenvalues, ",", FormatNumber)
       << "],";
  json << "\"explained_variance\": ["
       << Join(result->explained_variance, ",", FormatNumber) << "],";
  json << "\"estimated_clusters\": " << result->estimated_clusters << ",";
  json << "\"has_multiple_responsibilities\": "
       << (result->has_multiple_responsibilities ? "true" : "false") << ",";
  json << "\"recommendation\": " << Quoted(result->recommendation_text) << "}";
  return json.str();
}

std::string StructJson(const StructResult &structure) {
  const auto &cohesion = structure.cohesion;
  std::ostringstream json;
  json << "{\"name\": " << Quoted(cohesion.struct_name) << ",";
  json << "\"file_path\": " << Quoted(cohesion.file_path) << ",";
  json << "\"lcom4_score\": " << cohesion.lcom4_score << ",";
  json << "\"components\": [" << Join(cohesion.components, ",", JoinJsonArray)
       << "],";
  json << "\"method_clusters\": " << MethodClustersJson(structure.method_clusters)
       << ",";
  json << "\"field_clusters\": " << FieldClustersJson(structure.field_clusters)
       << "}";
  return json.str();
}

std::string FunctionJson(const ComplexityResult &function) {
  std::ostringstream json;
  json << "{\"name\": " << Quoted(function.func_name) << ",";
  json << "\"file_path\": " << Quoted(function.file_path) << ",";
  json << "\"complexity\": " << function.complexity << ",";
  json << "\"loc\": " << function.loc << ",";
  json << "\"afferent\": " << function.afferent << ",";
  json << "\"efferent\": " << function.efferent << ",";
  json << "\"instability\": " << FormatNumber(function.instability) << ",";
  json << "\"internal_dependencies\": "
       << JoinJsonArray(function.internal_dependencies) << ",";
  json << "\"external_dependencies\": "
       << JoinJsonArray(function.external_dependencies) << "}";
  return json.str();
}

std::string BuildPackagesJson(const AnalysisReport &report) {
  std::ostringstream json;
  json << "\"packages\": [";
  json << Join(report.packages, ",", [](const PackageResult &package) {
    const auto &coupling = package.coupling;
    std::ostringstream item;
    item << "{\"name\": " << Quoted(package.name) << ",";
    item << "\"path\": " << Quoted(package.path) << ",";
    item << "\"total_loc\": " << package.total_loc << ",";
    item << "\"file_count\": " << package.file_count << ",";
    item << "\"func_count\": " << package.func_count << ",";
    item << "\"avg_func_loc\": " << FormatNumber(package.avg_func_loc) << ",";
    item << "\"coupling\": {\"afferent\": " << coupling.afferent
         << ", \"efferent\": " << coupling.efferent
         << ", \"instability\": " << FormatNumber(coupling.instability)
         << ", \"dependency_depth\": " << coupling.dependency_depth << "},";
    item << "\"structs\": [" << Join(package.structs, ",", StructJson) << "],";
    item << "\"functions\": [" << Join(package.functions, ",", FunctionJson)
         << "]}";
    return item.str();
  });
  json << "]";
  return json.str();
}

std::string BuildDiagnosticsJson(const DiagnosticsResult &diagnostics) {
  std::ostringstream json;
  json << "\"diagnostics\": [";
  json << Join(diagnostics.findings, ",", [](const Finding &finding) {
    std::ostringstream item;
    item << "{\"kind\": " << Quoted(finding.kind) << ",";
    item << "\"target_name\": " << Quoted(finding.target_name) << ",";
    item << "\"severity\": " << Quoted(SeverityName(finding.severity)) << ",";
    item << "\"message\": " << Quoted(finding.message) << ",";
    item << "\"related_path\": " << Quoted(finding.related_path) << ",";
    item << "\"evidence\": {"
         << Join(finding.evidence, ",",
                 [](const std::pair<const std::string, EvidenceValue> &entry) {
                   return Quoted(entry.first) + ": " + EvidenceJson(entry.second);
                 })
         << "}}";
    return item.str();
  });
  json << "]";
  return json.str();
}

} // namespace

std::string EscapeJsonString(const std::string &value) {
  static const std::unordered_map<char, std::string> replacements{
      {'"', "\\\""}, {'\\', "\\\\"}, {'\n', "\\n"}, {'\r', "\\r"}, {'\t', "\\t"}};

  std::string escaped;
  escaped.reserve(value.size());
  for (const auto character : value) {
    const auto replacement = replacements.find(character);
    if (replacement != replacements.end()) {
      escaped.append(replacement->second);
    } else {
      escaped.push_back(character);
    }
  }
  return escaped;
}

MarkdownReporter::MarkdownReporter(HeuristicConfig config)
    : config_(std::move(config)) {}

Report MarkdownReporter::Render(const AnalysisReport &report,
                                const DiagnosticsResult &diagnostics,
                                const AnalysisConfig &config) {
  const auto now = std::chrono::system_clock::now();
  const std::time_t now_time = std::chrono::system_clock::to_time_t(now);
  std::tm utc{};
  gmtime_r(&now_time, &utc);
  std::ostringstream timestamp_stream;
  timestamp_stream << std::put_time(&utc, "%FT%TZ");
  const auto timestamp = timestamp_stream.str();
  const auto summary = Summarize(report, diagnostics, config_);

  Report rendered;
  if (ShouldRenderFormat(config.formats, "markdown")) {
    std::ostringstream output;
    output << "# Code Health Report\n\n";
    output << BuildAnalysisHeaderMarkdown(report, config, timestamp);
    output << BuildSummaryMarkdown(report, summary, config_);
    output << BuildDiagnosticsMarkdown(diagnostics);
    output << BuildPackagesMarkdown(report);
    output << BuildStructsMarkdown(report);
    output << BuildFunctionsMarkdown(report);
    rendered.markdown = output.str();
  }

  if (ShouldRenderFormat(config.formats, "json")) {
    std::ostringstream output;
    output << "{";
    output << BuildAnalysisHeaderJson(report, config, timestamp) << ",";
    output << BuildSummaryJson(report, summary) << ",";
    output << BuildDiagnosticsJson(diagnostics) << ",";
    output << BuildPackagesJson(report);
    output << "}";
    rendered.json = output.str();
  }
  return rendered;
}

} // namespace health
