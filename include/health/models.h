#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <variant>
#include <vector>

namespace health {

// Field usage weights. Values combine with bitwise-or: a field read and
// written by the same method ends up as kFieldReadWrite.
constexpr int kFieldUnused = 0;
constexpr int kFieldRead = 1;
constexpr int kFieldWrite = 2;
constexpr int kFieldReadWrite = 3;

struct AnalysisConfig {
  std::string root_path;
  std::string build_directory;
  std::string module_path;
  std::vector<std::string> formats;
  std::vector<std::string> excluded_directories;
  std::string scope_notes;
  int jobs = 1;
  std::optional<std::chrono::milliseconds> timeout;
};

struct SourceAcquisitionResult {
  std::vector<std::string> files;
  std::string project_root;
  std::string build_directory;
  std::string module_path;
};

struct MethodFacts {
  std::string qualified_name;
  std::string name;
  std::string receiver_binding_name;
  bool is_private = false;
  bool is_utility = false;
  std::map<std::string, int> field_usage;
  std::map<std::string, int> calls;
};

struct DecisionPoints {
  int if_statements = 0;
  int loops = 0;
  int switch_statements = 0;
  int case_clauses = 0;
  int select_cases = 0;
  int logical_operators = 0;

  int Total() const {
    return if_statements + loops + switch_statements + case_clauses +
           select_cases + logical_operators;
  }
};

struct FunctionFacts {
  std::string qualified_name;
  std::string file_path;
  bool has_body = false;
  int body_start_line = 0;
  int body_end_line = 0;
  DecisionPoints decision_points;
  std::set<std::string> imported_packages_used;
  std::map<std::string, int> calls;
};

struct StructFacts {
  std::string name;
  std::string file_path;
  std::vector<std::string> fields;
  std::vector<MethodFacts> methods;
};

struct PackageFacts {
  std::string name;
  std::string path;
  std::vector<std::string> files;
  int total_lines = 0;
  std::vector<StructFacts> structs;
  std::vector<FunctionFacts> functions;
  std::set<std::string> imports;
};

struct FactModel {
  std::string module_path;
  std::vector<PackageFacts> packages;
  std::vector<std::string> skipped_directories;
};

struct PackageDependency {
  std::string import_path;
  std::vector<std::string> imports;
  std::vector<std::string> imported_by;
};

struct CohesionResult {
  std::string struct_name;
  std::string file_path;
  int lcom4_score = 0;
  std::vector<std::vector<std::string>> components;
};

struct ComplexityResult {
  std::string func_name;
  std::string file_path;
  int complexity = 1;
  int loc = 0;
  std::vector<std::string> dependencies;
  std::vector<std::string> internal_dependencies;
  std::vector<std::string> external_dependencies;
  int efferent = 0;
  int afferent = 0;
  double instability = 0.0;
};

struct CouplingResult {
  std::string package_name;
  std::string package_path;
  int afferent = 0;
  int efferent = 0;
  double instability = 0.0;
  int dependency_depth = 0;
};

struct MethodCluster {
  int id = 0;
  std::vector<std::string> methods;
  int size = 0;
  std::vector<std::string> called_by;
  std::string responsibility_hint;
};

struct MethodClusterResult {
  std::vector<MethodCluster> clusters;
  int total_private_methods = 0;
  bool has_multiple_islands = false;
};

struct FieldClusterResult {
  std::vector<std::string> method_names;
  std::vector<std::string> field_names;
  std::vector<std::vector<int>> matrix;
  std::vector<double> eigenvalues;
  std::vector<double> explained_variance;
  int estimated_clusters = 1;
  bool has_multiple_responsibilities = false;
  std::string recommendation_text;
};

struct StructResult {
  CohesionResult cohesion;
  std::optional<MethodClusterResult> method_clusters;
  std::optional<FieldClusterResult> field_clusters;
};

struct PackageResult {
  std::string name;
  std::string path;
  CouplingResult coupling;
  std::vector<StructResult> structs;
  std::vector<ComplexityResult> functions;
  int total_loc = 0;
  int file_count = 0;
  int func_count = 0;
  double avg_func_loc = 0.0;
};

struct AnalysisReport {
  std::string module_path;
  std::vector<PackageResult> packages;
  int total_loc = 0;
  std::vector<std::string> skipped_directories;
};

enum class Severity { kWarning, kCritical };

using EvidenceValue = std::variant<int, double, std::string,
                                   std::vector<std::string>,
                                   std::vector<double>>;

struct Finding {
  std::string kind;
  std::string target_name;
  Severity severity = Severity::kWarning;
  std::string message;
  std::map<std::string, EvidenceValue> evidence;
  std::string related_path;
};

struct DiagnosticsResult {
  std::vector<Finding> findings;
};

struct Report {
  std::string markdown;
  std::string json;
};

struct PipelineResult {
  Report report;
  AnalysisReport analysis;
  DiagnosticsResult diagnostics;
};

} // namespace health
