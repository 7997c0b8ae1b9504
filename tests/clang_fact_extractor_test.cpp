#include <health/clang_fact_extractor.h>
#include <health/complexity_analyzer.h>
#include <health/models.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include "test_support/temporary_project.h"

namespace health {
namespace {

using ::testing::Contains;
using ::testing::ElementsAre;
using ::testing::Gt;
using ::testing::Key;
using ::testing::Not;
using ::testing::Pair;

void WriteCompileCommands(const std::filesystem::path &build_directory,
                          const std::filesystem::path &include_root,
                          const std::vector<std::filesystem::path> &sources) {
  std::filesystem::create_directories(build_directory);
  std::ofstream stream(build_directory / "compile_commands.json");
  stream << "[\n";
  for (std::size_t i = 0; i < sources.size(); ++i) {
    stream << "  {\n";
    stream << "    \"directory\": \"" << build_directory.string() << "\",\n";
    stream << "    \"file\": \"" << sources[i].string() << "\",\n";
    stream << "    \"command\": \"clang++ -std=c++17 -I"
           << include_root.string() << " -c " << sources[i].string()
           << "\"\n";
    stream << "  }" << (i + 1 < sources.size() ? "," : "") << "\n";
  }
  stream << "]\n";
}

const PackageFacts *FindPackage(const FactModel &model,
                                const std::string &path) {
  const auto found =
      std::find_if(model.packages.begin(), model.packages.end(),
                   [&](const PackageFacts &package) { return package.path == path; });
  return found == model.packages.end() ? nullptr : &*found;
}

const FunctionFacts *FindFunction(const PackageFacts &package,
                                  const std::string &name) {
  const auto found = std::find_if(
      package.functions.begin(), package.functions.end(),
      [&](const FunctionFacts &function) {
        return function.qualified_name == name;
      });
  return found == package.functions.end() ? nullptr : &*found;
}

const MethodFacts *FindMethod(const StructFacts &structure,
                              const std::string &name) {
  const auto found =
      std::find_if(structure.methods.begin(), structure.methods.end(),
                   [&](const MethodFacts &method) { return method.name == name; });
  return found == structure.methods.end() ? nullptr : &*found;
}

class ClangFactExtractorTest : public ::testing::Test {
protected:
  void SetUp() override {
    project_.AddFile("storage/store.h",
                     "#pragma once\n"
                     "namespace shop {\n"
                     "class Store {\n"
                     "public:\n"
                     "  int Load(int key) const { return key * 2; }\n"
                     "};\n"
                     "class Text {\n"
                     "public:\n"
                     "  Text &operator=(int size) { size_ = size; return *this; }\n"
                     "  Text &operator+=(int size) { size_ += size; return *this; }\n"
                     "  Text &operator++() { ++size_; return *this; }\n"
                     "private:\n"
                     "  int size_ = 0;\n"
                     "};\n"
                     "} // namespace shop\n");
    project_.AddFile("orders/order.h",
                     "#pragma once\n"
                     "#include \"storage/store.h\"\n"
                     "namespace shop {\n"
                     "class Order {\n"
                     "public:\n"
                     "  Order() = default;\n"
                     "  int Total();\n"
                     "  void Reset();\n"
                     "private:\n"
                     "  int Compute(int value);\n"
                     "  void Rename(int size);\n"
                     "  void Extend(int size);\n"
                     "  void Bump();\n"
                     "  int count_ = 0;\n"
                     "  int total_ = 0;\n"
                     "  Store store_;\n"
                     "  Text label_;\n"
                     "};\n"
                     "} // namespace shop\n");
    order_source_ = project_.AddFile(
        "orders/order.cpp",
        "#include \"orders/order.h\"\n"
        "namespace shop {\n"
        "int Order::Total() {\n"
        "  if (count_ > 0 && total_ > 0) {\n"
        "    return Compute(total_);\n"
        "  }\n"
        "  for (int i = 0; i < count_; ++i) {\n"
        "    total_ += i;\n"
        "  }\n"
        "  return 0;\n"
        "}\n"
        "void Order::Reset() { count_ = 0; }\n"
        "int Order::Compute(int value) { return store_.Load(value); }\n"
        "void Order::Rename(int size) { label_ = size; }\n"
        "void Order::Extend(int size) { label_ += size; }\n"
        "void Order::Bump() {\n"
        "  (count_)++;\n"
        "  ++label_;\n"
        "}\n"
        "} // namespace shop\n");
  }

  SourceAcquisitionResult Sources() const {
    SourceAcquisitionResult sources;
    sources.project_root = project_.root().string();
    sources.build_directory = (project_.root() / "build").string();
    sources.module_path = "shop";
    for (const auto &relative :
         {"orders/order.cpp", "orders/order.h", "storage/store.h"}) {
      sources.files.push_back(
          std::filesystem::weakly_canonical(project_.root() / relative)
              .string());
    }
    return sources;
  }

  test::TemporaryProject project_;
  std::filesystem::path order_source_;
};

TEST_F(ClangFactExtractorTest, ExtractsPackagesStructsAndFunctions) {
  WriteCompileCommands(project_.root() / "build", project_.root(),
                       {order_source_});

  ClangFactExtractor extractor;
  const auto model = extractor.Extract(Sources());

  EXPECT_EQ(model.module_path, "shop");
  EXPECT_TRUE(model.skipped_directories.empty());

  const auto *orders = FindPackage(model, "orders");
  ASSERT_NE(orders, nullptr);
  EXPECT_EQ(orders->name, "orders");
  EXPECT_THAT(orders->files,
              ElementsAre("orders/order.cpp", "orders/order.h"));
  EXPECT_THAT(orders->total_lines, Gt(0));
  EXPECT_THAT(orders->imports, Contains("shop/storage"));

  ASSERT_EQ(orders->structs.size(), 1u);
  const auto &order = orders->structs.front();
  EXPECT_EQ(order.name, "Order");
  EXPECT_EQ(order.file_path, "orders/order.h");
  EXPECT_THAT(order.fields,
              ElementsAre("count_", "total_", "store_", "label_"));
  ASSERT_EQ(order.methods.size(), 6u);

  const auto *total = FindMethod(order, "Total");
  ASSERT_NE(total, nullptr);
  EXPECT_EQ(total->qualified_name, "Order.Total");
  EXPECT_FALSE(total->is_private);
  EXPECT_THAT(total->field_usage, Contains(Pair("count_", kFieldRead)));
  EXPECT_THAT(total->field_usage, Contains(Pair("total_", kFieldReadWrite)));
  EXPECT_THAT(total->field_usage, Not(Contains(Key("store_"))));

  const auto *compute = FindMethod(order, "Compute");
  ASSERT_NE(compute, nullptr);
  EXPECT_TRUE(compute->is_private);
  EXPECT_THAT(compute->field_usage, Contains(Key("store_")));

  const auto *total_function = FindFunction(*orders, "Order.Total");
  ASSERT_NE(total_function, nullptr);
  EXPECT_TRUE(total_function->has_body);
  EXPECT_EQ(total_function->decision_points.if_statements, 1);
  EXPECT_EQ(total_function->decision_points.loops, 1);
  EXPECT_EQ(total_function->decision_points.logical_operators, 1);
  EXPECT_THAT(total_function->calls, Contains(Key("Order.Compute")));
  EXPECT_EQ(total_function->body_start_line, 3);
  EXPECT_EQ(total_function->body_end_line, 11);

  const auto *compute_function = FindFunction(*orders, "Order.Compute");
  ASSERT_NE(compute_function, nullptr);
  EXPECT_THAT(compute_function->calls, Contains(Key("Store.Load")));
  EXPECT_THAT(compute_function->imported_packages_used,
              Contains("shop/storage"));

  const auto *reset = FindMethod(order, "Reset");
  ASSERT_NE(reset, nullptr);
  EXPECT_THAT(reset->field_usage, ElementsAre(Pair("count_", kFieldWrite)));

  // Constructors count as functions but never as methods.
  EXPECT_EQ(FindMethod(order, "Order"), nullptr);
}

TEST_F(ClangFactExtractorTest, OperatorCallsOnClassFieldsRecordWrites) {
  WriteCompileCommands(project_.root() / "build", project_.root(),
                       {order_source_});

  ClangFactExtractor extractor;
  const auto model = extractor.Extract(Sources());

  const auto *orders = FindPackage(model, "orders");
  ASSERT_NE(orders, nullptr);
  ASSERT_EQ(orders->structs.size(), 1u);
  const auto &order = orders->structs.front();

  const auto *rename = FindMethod(order, "Rename");
  ASSERT_NE(rename, nullptr);
  EXPECT_THAT(rename->field_usage, ElementsAre(Pair("label_", kFieldWrite)));

  const auto *extend = FindMethod(order, "Extend");
  ASSERT_NE(extend, nullptr);
  EXPECT_THAT(extend->field_usage,
              ElementsAre(Pair("label_", kFieldReadWrite)));

  const auto *bump = FindMethod(order, "Bump");
  ASSERT_NE(bump, nullptr);
  EXPECT_THAT(bump->field_usage,
              ElementsAre(Pair("count_", kFieldReadWrite),
                          Pair("label_", kFieldReadWrite)));
}

TEST_F(ClangFactExtractorTest, ExtraBranchRaisesComplexityByOne) {
  const auto source = project_.AddFile(
      "rules/rules.cpp", "int Plain(int value) {\n"
                         "  if (value > 0) { return 1; }\n"
                         "  return 0;\n"
                         "}\n"
                         "int Branched(int value) {\n"
                         "  if (value > 0) { return 1; }\n"
                         "  if (value < -10) { return 2; }\n"
                         "  return 0;\n"
                         "}\n");
  WriteCompileCommands(project_.root() / "build", project_.root(), {source});

  auto sources = Sources();
  sources.files = {std::filesystem::weakly_canonical(source).string()};

  ClangFactExtractor extractor;
  const auto model = extractor.Extract(sources);

  const auto *rules = FindPackage(model, "rules");
  ASSERT_NE(rules, nullptr);
  const auto *plain = FindFunction(*rules, "Plain");
  const auto *branched = FindFunction(*rules, "Branched");
  ASSERT_NE(plain, nullptr);
  ASSERT_NE(branched, nullptr);
  EXPECT_EQ(CyclomaticComplexity(*plain), 2);
  EXPECT_EQ(CyclomaticComplexity(*branched), CyclomaticComplexity(*plain) + 1);
}

TEST_F(ClangFactExtractorTest, BrokenHeaderSkipsIncludingDirectoryToo) {
  const auto header = project_.AddFile(
      "parsers/parser.h", "#pragma once\nint Parse( { return 0; }\n");
  const auto source = project_.AddFile(
      "app/main.cpp", "#include \"parsers/parser.h\"\n"
                      "int Run() { return 1; }\n");
  WriteCompileCommands(project_.root() / "build", project_.root(),
                       {order_source_, source});

  auto sources = Sources();
  sources.files.push_back(std::filesystem::weakly_canonical(source).string());
  sources.files.push_back(std::filesystem::weakly_canonical(header).string());

  ClangFactExtractor extractor;
  const auto model = extractor.Extract(sources);

  EXPECT_THAT(model.skipped_directories, ElementsAre("app", "parsers"));
  EXPECT_EQ(FindPackage(model, "app"), nullptr);
  EXPECT_EQ(FindPackage(model, "parsers"), nullptr);
  EXPECT_NE(FindPackage(model, "orders"), nullptr);
}

TEST_F(ClangFactExtractorTest, AttributesHeaderDefinitionsToTheirDirectory) {
  WriteCompileCommands(project_.root() / "build", project_.root(),
                       {order_source_});

  ClangFactExtractor extractor;
  const auto model = extractor.Extract(Sources());

  const auto *storage = FindPackage(model, "storage");
  ASSERT_NE(storage, nullptr);
  ASSERT_EQ(storage->structs.size(), 2u);
  EXPECT_EQ(storage->structs.front().name, "Store");
  EXPECT_EQ(storage->structs.back().name, "Text");
  ASSERT_NE(FindMethod(storage->structs.front(), "Load"), nullptr);
  EXPECT_NE(FindFunction(*storage, "Store.Load"), nullptr);
}

TEST_F(ClangFactExtractorTest, SkipsDirectoriesThatFailToParse) {
  const auto broken = project_.AddFile(
      "broken/bad.cpp", "int Broken( { return missing_symbol; }\n");
  WriteCompileCommands(project_.root() / "build", project_.root(),
                       {order_source_, broken});

  auto sources = Sources();
  sources.files.push_back(std::filesystem::weakly_canonical(broken).string());

  ClangFactExtractor extractor;
  const auto model = extractor.Extract(sources);

  EXPECT_THAT(model.skipped_directories, ElementsAre("broken"));
  EXPECT_EQ(FindPackage(model, "broken"), nullptr);
  EXPECT_NE(FindPackage(model, "orders"), nullptr);
}

TEST_F(ClangFactExtractorTest, RequiresCompilationDatabase) {
  ClangFactExtractor extractor;
  EXPECT_THROW(extractor.Extract(Sources()), std::runtime_error);

  SourceAcquisitionResult empty;
  EXPECT_THROW(extractor.Extract(empty), std::invalid_argument);
}

} // namespace
} // namespace health
