#include <health/clang_fact_extractor.h>

#include <health/coupling_analyzer.h>

#include <clang-c/CXCompilationDatabase.h>
#include <clang-c/Index.h>

#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <map>
#include <memory>
#include <optional>
#include <regex>
#include <set>
#include <sstream>
#include <stdexcept>
#include <string>
#include <unordered_set>
#include <utility>
#include <vector>

namespace health {
namespace {

namespace fs = std::filesystem;

struct CompileCommandEntry {
  fs::path file;
  fs::path directory;
  std::vector<std::string> args;
};

std::string ToString(CXString value) {
  std::string text;
  if (const auto *cstr = clang_getCString(value); cstr != nullptr) {
    text = cstr;
  }
  clang_disposeString(value);
  return text;
}

std::string Spelling(CXCursor cursor) {
  return ToString(clang_getCursorSpelling(cursor));
}

std::string Usr(CXCursor cursor) {
  return ToString(clang_getCursorUSR(cursor));
}

bool IsWithin(const fs::path &candidate, const fs::path &potential_parent) {
  if (potential_parent.empty()) {
    return false;
  }
  const auto parent = fs::weakly_canonical(potential_parent);
  const auto normalized_candidate = fs::weakly_canonical(candidate);
  return std::distance(parent.begin(), parent.end()) <=
             std::distance(normalized_candidate.begin(),
                           normalized_candidate.end()) &&
         std::equal(parent.begin(), parent.end(), normalized_candidate.begin());
}

bool IsSourcePath(const std::string &arg) {
  static const std::set<std::string> kExtensions = {".c", ".cc", ".cxx",
                                                    ".cpp", ".c++"};
  return kExtensions.count(fs::path(arg).extension().string()) > 0;
}

template <typename Callback> void ForEachChild(CXCursor cursor, Callback callback) {
  clang_visitChildren(
      cursor,
      [](CXCursor child, CXCursor, CXClientData data) {
        (*static_cast<Callback *>(data))(child);
        return CXChildVisit_Continue;
      },
      &callback);
}

std::vector<CXCursor> Children(CXCursor cursor) {
  std::vector<CXCursor> children;
  ForEachChild(cursor, [&](CXCursor child) { children.push_back(child); });
  return children;
}

// Looks through implicit casts and parentheses.
CXCursor StripWrappers(CXCursor cursor) {
  while (clang_getCursorKind(cursor) == CXCursor_UnexposedExpr ||
         clang_getCursorKind(cursor) == CXCursor_ParenExpr) {
    const auto children = Children(cursor);
    if (children.size() != 1) {
      break;
    }
    cursor = children.front();
  }
  return cursor;
}

bool IsRecordKind(CXCursorKind kind) {
  return kind == CXCursor_StructDecl || kind == CXCursor_ClassDecl ||
         kind == CXCursor_ClassTemplate ||
         kind == CXCursor_ClassTemplatePartialSpecialization;
}

bool IsFunctionKind(CXCursorKind kind) {
  return kind == CXCursor_FunctionDecl || kind == CXCursor_CXXMethod ||
         kind == CXCursor_Constructor || kind == CXCursor_Destructor ||
         kind == CXCursor_ConversionFunction ||
         kind == CXCursor_FunctionTemplate;
}

// Name of a record including its enclosing records, without namespaces.
std::string TypeName(CXCursor record) {
  auto name = Spelling(record);
  for (auto parent = clang_getCursorSemanticParent(record);
       !clang_Cursor_isNull(parent) &&
       IsRecordKind(clang_getCursorKind(parent));
       parent = clang_getCursorSemanticParent(parent)) {
    name = Spelling(parent) + "::" + name;
  }
  return name;
}

std::string CalleeName(CXCursor callee) {
  const auto parent = clang_getCursorSemanticParent(callee);
  if (!clang_Cursor_isNull(parent) &&
      IsRecordKind(clang_getCursorKind(parent))) {
    return QualifiedMethodName(TypeName(parent), Spelling(callee));
  }
  return Spelling(callee);
}

std::string RawFileOf(CXCursor cursor) {
  CXFile file{};
  clang_getFileLocation(clang_getCursorLocation(cursor), &file, nullptr,
                        nullptr, nullptr);
  if (file == nullptr) {
    return {};
  }
  return ToString(clang_getFileName(file));
}

unsigned LineOf(CXSourceLocation location) {
  unsigned line = 0;
  clang_getSpellingLocation(location, nullptr, &line, nullptr, nullptr);
  return line;
}

unsigned OffsetOf(CXSourceLocation location) {
  unsigned offset = 0;
  clang_getSpellingLocation(location, nullptr, nullptr, nullptr, &offset);
  return offset;
}

int CountLines(const std::string &path) {
  std::ifstream stream(path);
  if (!stream.is_open()) {
    return 0;
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());
  auto lines = static_cast<int>(std::count(content.begin(), content.end(), '\n'));
  if (!content.empty() && content.back() != '\n') {
    ++lines;
  }
  return lines;
}

struct FileInfo {
  std::string path;
  bool in_project = false;
  bool analyzed = false;
  std::string relative;
  std::string package;
};

// Resolves libclang file names against the project root and the acquired
// file list. Lookups are cached; the same headers show up in every unit.
class ProjectFiles {
public:
  ProjectFiles(fs::path root, const std::vector<std::string> &files)
      : root_(std::move(root)) {
    for (const auto &file : files) {
      analyzed_.insert(fs::weakly_canonical(file).string());
    }
  }

  const FileInfo &Lookup(const std::string &raw_path) {
    const auto cached = cache_.find(raw_path);
    if (cached != cache_.end()) {
      return cached->second;
    }
    FileInfo info;
    info.path = raw_path;
    if (!raw_path.empty()) {
      const auto canonical = fs::weakly_canonical(raw_path);
      info.in_project = IsWithin(canonical, root_);
      info.analyzed = analyzed_.count(canonical.string()) != 0;
      if (info.in_project) {
        info.relative = fs::relative(canonical, root_).generic_string();
        info.package = fs::path(info.relative).parent_path().generic_string();
      }
    }
    return cache_.emplace(raw_path, std::move(info)).first->second;
  }

  const FileInfo &Of(CXCursor cursor) { return Lookup(RawFileOf(cursor)); }

private:
  fs::path root_;
  std::set<std::string> analyzed_;
  std::map<std::string, FileInfo> cache_;
};

// Facts collected across translation units, keyed by package path.
class FactAccumulator {
public:
  explicit FactAccumulator(std::string module_path)
      : module_path_(std::move(module_path)) {}

  const std::string &module_path() const { return module_path_; }

  PackageFacts &Package(const std::string &path) {
    auto found = packages_.find(path);
    if (found == packages_.end()) {
      PackageFacts package;
      package.path = path;
      package.name =
          path.empty() ? module_path_ : fs::path(path).filename().string();
      found = packages_.emplace(path, std::move(package)).first;
    }
    return found->second;
  }

  bool HasStruct(const std::string &usr) const {
    return struct_locations_.count(usr) != 0;
  }

  void AddStruct(const std::string &usr, const std::string &package_path,
                 StructFacts structure) {
    auto &package = Package(package_path);
    struct_locations_.emplace(usr,
                              std::make_pair(package_path, package.structs.size()));
    package.structs.push_back(std::move(structure));
  }

  StructFacts *FindStruct(const std::string &usr, std::string *package_path) {
    const auto found = struct_locations_.find(usr);
    if (found == struct_locations_.end()) {
      return nullptr;
    }
    if (package_path != nullptr) {
      *package_path = found->second.first;
    }
    return &Package(found->second.first).structs.at(found->second.second);
  }

  // True the first time a definition is seen; headers repeat across units.
  bool ClaimDefinition(const std::string &usr) {
    return usr.empty() || claimed_.insert(usr).second;
  }

  void MarkSkipped(const std::string &package_path) {
    skipped_.insert(package_path);
  }

  bool IsSkipped(const std::string &package_path) const {
    return skipped_.count(package_path) != 0;
  }

  FactModel Finish() {
    FactModel model;
    model.module_path = module_path_;
    for (auto &[path, package] : packages_) {
      if (skipped_.count(path) != 0) {
        continue;
      }
      model.packages.push_back(std::move(package));
    }
    for (const auto &path : skipped_) {
      model.skipped_directories.push_back(path.empty() ? "." : path);
    }
    return model;
  }

private:
  std::string module_path_;
  std::map<std::string, PackageFacts> packages_;
  std::map<std::string, std::pair<std::string, std::size_t>> struct_locations_;
  std::unordered_set<std::string> claimed_;
  std::set<std::string> skipped_;
};

std::string BinaryOperatorSpelling(CXTranslationUnit unit, CXCursor cursor) {
  const auto children = Children(cursor);
  if (children.size() != 2) {
    return {};
  }
  const auto lhs_end =
      OffsetOf(clang_getRangeEnd(clang_getCursorExtent(children.front())));

  CXToken *tokens = nullptr;
  unsigned count = 0;
  clang_tokenize(unit, clang_getCursorExtent(cursor), &tokens, &count);
  std::string spelling;
  for (unsigned i = 0; i < count; ++i) {
    if (clang_getTokenKind(tokens[i]) != CXToken_Punctuation) {
      continue;
    }
    if (OffsetOf(clang_getTokenLocation(unit, tokens[i])) >= lhs_end) {
      spelling = ToString(clang_getTokenSpelling(unit, tokens[i]));
      break;
    }
  }
  clang_disposeTokens(unit, tokens, count);
  return spelling;
}

std::string UnaryOperatorSpelling(CXTranslationUnit unit, CXCursor cursor) {
  CXToken *tokens = nullptr;
  unsigned count = 0;
  clang_tokenize(unit, clang_getCursorExtent(cursor), &tokens, &count);
  std::string spelling;
  if (count > 0) {
    // Prefix operators lead the extent, postfix ones close it. A leading
    // parenthesis belongs to the operand of a postfix operator.
    spelling = ToString(clang_getTokenSpelling(unit, tokens[0]));
    if (clang_getTokenKind(tokens[0]) != CXToken_Punctuation ||
        spelling == "(") {
      spelling = ToString(clang_getTokenSpelling(unit, tokens[count - 1]));
    }
  }
  clang_disposeTokens(unit, tokens, count);
  return spelling;
}

// Access an overloaded operator call applies to its first operand, or
// nullopt when the call is not an assignment or increment.
std::optional<int> OverloadedOperatorAccess(CXCursor call) {
  const auto callee = clang_getCursorReferenced(call);
  if (clang_Cursor_isNull(callee)) {
    return std::nullopt;
  }
  static const std::set<std::string> kReadWrite = {
      "operator+=", "operator-=", "operator*=",  "operator/=",
      "operator%=", "operator&=", "operator|=",  "operator^=",
      "operator<<=", "operator>>=", "operator++", "operator--"};
  const auto name = Spelling(callee);
  if (name == "operator=") {
    return kFieldWrite;
  }
  if (kReadWrite.count(name) != 0) {
    return kFieldReadWrite;
  }
  return std::nullopt;
}

// Outermost named namespace of an external declaration, or its header name
// when it lives in the global namespace.
std::string ExternalLabel(CXCursor declaration, const std::string &raw_path) {
  std::string outermost;
  for (auto cursor = declaration;
       !clang_Cursor_isNull(cursor) &&
       clang_getCursorKind(cursor) != CXCursor_TranslationUnit;
       cursor = clang_getCursorSemanticParent(cursor)) {
    if (clang_getCursorKind(cursor) == CXCursor_NamespaceDecl) {
      const auto name = Spelling(cursor);
      if (!name.empty()) {
        outermost = name;
      }
    }
  }
  if (!outermost.empty()) {
    return outermost;
  }
  return fs::path(raw_path).filename().string();
}

// Walks one function body: decision points, calls, cross-package
// references and, for methods, field usage through `this`.
class BodyScanner {
public:
  BodyScanner(CXTranslationUnit unit, ProjectFiles &files,
              const std::string &module_path, const std::string &package,
              FunctionFacts &function, MethodFacts *method,
              std::string class_usr, std::set<std::string> fields)
      : unit_(unit), files_(files), module_path_(module_path),
        package_(package), function_(function), method_(method),
        class_usr_(std::move(class_usr)), fields_(std::move(fields)) {}

  void Scan(CXCursor body) { Visit(body, kFieldRead); }

private:
  void Visit(CXCursor cursor, int access) {
    auto &decisions = function_.decision_points;
    switch (clang_getCursorKind(cursor)) {
    case CXCursor_IfStmt:
      ++decisions.if_statements;
      break;
    case CXCursor_ForStmt:
    case CXCursor_CXXForRangeStmt:
    case CXCursor_WhileStmt:
    case CXCursor_DoStmt:
      ++decisions.loops;
      break;
    case CXCursor_SwitchStmt:
      ++decisions.switch_statements;
      break;
    case CXCursor_CaseStmt:
      ++decisions.case_clauses;
      break;
    case CXCursor_BinaryOperator: {
      const auto op = BinaryOperatorSpelling(unit_, cursor);
      if (op == "&&" || op == "||") {
        ++decisions.logical_operators;
      }
      if (op == "=") {
        VisitOperands(cursor, kFieldWrite);
        return;
      }
      break;
    }
    case CXCursor_CompoundAssignOperator:
      VisitOperands(cursor, kFieldReadWrite);
      return;
    case CXCursor_UnaryOperator: {
      const auto op = UnaryOperatorSpelling(unit_, cursor);
      if (op == "++" || op == "--") {
        VisitOperands(cursor, kFieldReadWrite);
        return;
      }
      break;
    }
    case CXCursor_ParenExpr:
    case CXCursor_UnexposedExpr:
      ForEachChild(cursor, [&](CXCursor child) { Visit(child, access); });
      return;
    case CXCursor_MemberRefExpr:
      RecordFieldAccess(cursor, access);
      RecordDependency(clang_getCursorReferenced(cursor));
      break;
    case CXCursor_CallExpr:
      RecordCall(cursor);
      // libclang lists the first operand of an operator call first.
      if (const auto operator_access = OverloadedOperatorAccess(cursor)) {
        VisitOperands(cursor, *operator_access);
        return;
      }
      break;
    case CXCursor_DeclRefExpr:
    case CXCursor_TypeRef:
    case CXCursor_TemplateRef:
      RecordDependency(clang_getCursorReferenced(cursor));
      break;
    default:
      break;
    }
    ForEachChild(cursor, [&](CXCursor child) { Visit(child, kFieldRead); });
  }

  // The first operand receives the write access, the others are reads.
  void VisitOperands(CXCursor cursor, int first_access) {
    bool first = true;
    ForEachChild(cursor, [&](CXCursor child) {
      Visit(child, first ? first_access : kFieldRead);
      first = false;
    });
  }

  static bool IsThisAccess(CXCursor member_ref) {
    const auto children = Children(member_ref);
    if (children.empty()) {
      return true;
    }
    return clang_getCursorKind(StripWrappers(children.front())) ==
           CXCursor_CXXThisExpr;
  }

  bool IsOwnMember(CXCursor declaration) const {
    return !class_usr_.empty() &&
           Usr(clang_getCursorSemanticParent(declaration)) == class_usr_;
  }

  void RecordFieldAccess(CXCursor cursor, int access) {
    if (method_ == nullptr) {
      return;
    }
    const auto referenced = clang_getCursorReferenced(cursor);
    if (clang_getCursorKind(referenced) != CXCursor_FieldDecl ||
        !IsOwnMember(referenced) || !IsThisAccess(cursor)) {
      return;
    }
    const auto name = Spelling(referenced);
    if (fields_.count(name) == 0) {
      return;
    }
    method_->field_usage[name] |= access;
  }

  void RecordCall(CXCursor cursor) {
    const auto callee = clang_getCursorReferenced(cursor);
    if (clang_Cursor_isNull(callee) ||
        !IsFunctionKind(clang_getCursorKind(callee))) {
      return;
    }
    if (!files_.Of(callee).analyzed) {
      return;
    }
    const auto name = CalleeName(callee);
    if (name.empty()) {
      return;
    }
    ++function_.calls[name];

    if (method_ == nullptr || !IsOwnMember(callee)) {
      return;
    }
    const auto children = Children(cursor);
    if (children.empty()) {
      return;
    }
    const auto target = StripWrappers(children.front());
    if (clang_getCursorKind(target) == CXCursor_MemberRefExpr &&
        IsThisAccess(target)) {
      ++method_->calls[name];
    }
  }

  void RecordDependency(CXCursor declaration) {
    if (clang_Cursor_isNull(declaration) ||
        !clang_isDeclaration(clang_getCursorKind(declaration))) {
      return;
    }
    const auto &file = files_.Of(declaration);
    if (file.path.empty()) {
      return;
    }
    if (file.analyzed) {
      if (file.package != package_) {
        function_.imported_packages_used.insert(
            ImportPathFor(module_path_, file.package));
      }
      return;
    }
    function_.imported_packages_used.insert(
        ExternalLabel(declaration, file.path));
  }

  CXTranslationUnit unit_;
  ProjectFiles &files_;
  const std::string &module_path_;
  const std::string &package_;
  FunctionFacts &function_;
  MethodFacts *method_;
  std::string class_usr_;
  std::set<std::string> fields_;
};

class TranslationUnitWalker {
public:
  TranslationUnitWalker(CXTranslationUnit unit, ProjectFiles &files,
                        FactAccumulator &facts, const HeuristicConfig &config)
      : unit_(unit), files_(files), facts_(facts), config_(config) {}

  void Walk() {
    ForEachChild(clang_getTranslationUnitCursor(unit_),
                 [&](CXCursor child) { Visit(child); });
  }

private:
  void Visit(CXCursor cursor) {
    const auto &file = files_.Of(cursor);
    if (!file.analyzed || facts_.IsSkipped(file.package)) {
      return;
    }
    const auto kind = clang_getCursorKind(cursor);
    if (kind == CXCursor_InclusionDirective) {
      VisitInclusion(cursor, file);
    } else if (IsRecordKind(kind)) {
      VisitRecord(cursor, file);
    } else if (IsFunctionKind(kind)) {
      VisitFunction(cursor, file);
    } else if (kind == CXCursor_NamespaceDecl ||
               kind == CXCursor_LinkageSpec) {
      ForEachChild(cursor, [&](CXCursor child) { Visit(child); });
    }
  }

  void VisitInclusion(CXCursor cursor, const FileInfo &file) {
    auto &package = facts_.Package(file.package);
    if (CXFile included = clang_getIncludedFile(cursor); included != nullptr) {
      const auto &target = files_.Lookup(ToString(clang_getFileName(included)));
      if (target.analyzed) {
        package.imports.insert(
            ImportPathFor(facts_.module_path(), target.package));
        return;
      }
    }
    package.imports.insert(Spelling(cursor));
  }

  void VisitRecord(CXCursor cursor, const FileInfo &file) {
    if (!clang_isCursorDefinition(cursor) || clang_Cursor_isAnonymous(cursor)) {
      return;
    }
    const auto usr = Usr(cursor);
    if (!facts_.HasStruct(usr)) {
      StructFacts structure;
      structure.name = TypeName(cursor);
      structure.file_path = file.relative;
      ForEachChild(cursor, [&](CXCursor child) {
        if (clang_getCursorKind(child) != CXCursor_FieldDecl) {
          return;
        }
        auto name = Spelling(child);
        if (!name.empty()) {
          structure.fields.push_back(std::move(name));
        }
      });
      facts_.AddStruct(usr, file.package, std::move(structure));
    }
    ForEachChild(cursor, [&](CXCursor child) { Visit(child); });
  }

  static std::optional<CXCursor> FindBody(CXCursor function) {
    std::optional<CXCursor> body;
    ForEachChild(function, [&](CXCursor child) {
      if (clang_getCursorKind(child) == CXCursor_CompoundStmt) {
        body = child;
      }
    });
    return body;
  }

  bool IsPrivateMember(CXCursor cursor, const std::string &name) const {
    switch (clang_getCXXAccessSpecifier(clang_getCanonicalCursor(cursor))) {
    case CX_CXXPublic:
      return false;
    case CX_CXXProtected:
    case CX_CXXPrivate:
      return true;
    case CX_CXXInvalidAccessSpecifier:
      break;
    }
    return IsPrivateName(name);
  }

  void VisitFunction(CXCursor cursor, const FileInfo &file) {
    if (!clang_isCursorDefinition(cursor) ||
        !facts_.ClaimDefinition(Usr(cursor))) {
      return;
    }

    const auto kind = clang_getCursorKind(cursor);
    const auto parent = clang_getCursorSemanticParent(cursor);
    const bool is_member = !clang_Cursor_isNull(parent) &&
                           IsRecordKind(clang_getCursorKind(parent));
    const auto name = Spelling(cursor);

    FunctionFacts function;
    function.file_path = file.relative;
    function.qualified_name = is_member
                                  ? QualifiedMethodName(TypeName(parent), name)
                                  : name;

    std::string package_path = file.package;
    std::string class_usr;
    std::set<std::string> fields;
    std::optional<MethodFacts> method;
    if (is_member) {
      class_usr = Usr(parent);
      if (const auto *owner = facts_.FindStruct(class_usr, &package_path);
          owner != nullptr) {
        fields.insert(owner->fields.begin(), owner->fields.end());
        if (kind != CXCursor_Constructor && kind != CXCursor_Destructor) {
          method.emplace();
          method->qualified_name = function.qualified_name;
          method->name = name;
          method->receiver_binding_name = "this";
          method->is_private = IsPrivateMember(cursor, name);
          method->is_utility = IsUtilityMethodName(name, config_);
        }
      }
    }

    if (const auto body = FindBody(cursor)) {
      const auto extent = clang_getCursorExtent(*body);
      function.has_body = true;
      function.body_start_line =
          static_cast<int>(LineOf(clang_getRangeStart(extent)));
      function.body_end_line =
          static_cast<int>(LineOf(clang_getRangeEnd(extent)));
      BodyScanner scanner(unit_, files_, facts_.module_path(), package_path,
                          function, method ? &*method : nullptr, class_usr,
                          std::move(fields));
      scanner.Scan(*body);
    }

    facts_.Package(package_path).functions.push_back(std::move(function));
    if (method) {
      if (auto *owner = facts_.FindStruct(class_usr, nullptr); owner != nullptr) {
        owner->methods.push_back(std::move(*method));
      }
    }
  }

  CXTranslationUnit unit_;
  ProjectFiles &files_;
  FactAccumulator &facts_;
  const HeuristicConfig &config_;
};

fs::path ChooseCompileCommandsPath(const fs::path &explicit_path,
                                   const fs::path &project_root,
                                   const fs::path &build_directory) {
  if (!explicit_path.empty()) {
    return fs::weakly_canonical(explicit_path);
  }
  if (!build_directory.empty()) {
    const auto candidate = build_directory / "compile_commands.json";
    if (fs::exists(candidate)) {
      return fs::weakly_canonical(candidate);
    }
  }
  return fs::weakly_canonical(project_root / "compile_commands.json");
}

fs::path CanonicalTranslationUnitPath(const std::string &file,
                                      const std::string &directory,
                                      const fs::path &project_root) {
  auto path = fs::path(file);
  if (path.is_relative()) {
    path = directory.empty() ? project_root / path : fs::path(directory) / path;
  }
  return fs::weakly_canonical(path);
}

std::vector<std::string> TokenizeCommand(const std::string &command) {
  std::istringstream stream(command);
  std::vector<std::string> tokens;
  std::string token;
  while (stream >> token) {
    tokens.push_back(token);
  }
  return tokens;
}

std::vector<std::string> ExtractArgs(CXCompileCommand command) {
  std::vector<std::string> args;
  const unsigned count = clang_CompileCommand_getNumArgs(command);
  args.reserve(count);
  for (unsigned index = 0; index < count; ++index) {
    args.push_back(ToString(clang_CompileCommand_getArg(command, index)));
  }
  return args;
}

std::vector<CompileCommandEntry>
LoadCompileCommandsFromJson(const fs::path &compile_commands_path,
                            const fs::path &project_root) {
  std::ifstream stream(compile_commands_path);
  if (!stream.is_open()) {
    return {};
  }
  const std::string content((std::istreambuf_iterator<char>(stream)),
                            std::istreambuf_iterator<char>());

  const std::regex object_regex("\\{[^\\}]*\\}");
  const std::regex file_regex("\\\"file\\\"\\s*:\\s*\\\"([^\\\"]+)\\\"");
  const std::regex directory_regex(
      "\\\"directory\\\"\\s*:\\s*\\\"([^\\\"]+)\\\"");
  const std::regex command_regex("\\\"command\\\"\\s*:\\s*\\\"([^\\\"]+)\\\"");

  std::unordered_set<std::string> seen_paths;
  std::vector<CompileCommandEntry> entries;
  for (std::sregex_iterator object(content.begin(), content.end(), object_regex),
       end;
       object != end; ++object) {
    const auto object_text = object->str();
    std::smatch file_match;
    if (!std::regex_search(object_text, file_match, file_regex)) {
      continue;
    }
    std::smatch directory_match;
    const auto directory =
        std::regex_search(object_text, directory_match, directory_regex)
            ? directory_match[1].str()
            : std::string{};
    const auto path =
        CanonicalTranslationUnitPath(file_match[1], directory, project_root);
    if (path.empty() || !seen_paths.insert(path.string()).second) {
      continue;
    }

    std::smatch command_match;
    CompileCommandEntry entry;
    entry.file = path;
    entry.directory = directory.empty() ? path.parent_path()
                                        : fs::weakly_canonical(directory);
    entry.args = std::regex_search(object_text, command_match, command_regex)
                     ? TokenizeCommand(command_match[1])
                     : std::vector<std::string>{};
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::vector<CompileCommandEntry>
LoadCompileCommands(const fs::path &compile_commands_path,
                    const fs::path &project_root) {
  CXCompilationDatabase_Error error = CXCompilationDatabase_NoError;
  CXCompilationDatabase database = clang_CompilationDatabase_fromDirectory(
      compile_commands_path.parent_path().string().c_str(), &error);
  if (error != CXCompilationDatabase_NoError || database == nullptr) {
    return LoadCompileCommandsFromJson(compile_commands_path, project_root);
  }

  CXCompileCommands commands =
      clang_CompilationDatabase_getAllCompileCommands(database);
  const unsigned size = clang_CompileCommands_getSize(commands);

  std::unordered_set<std::string> seen_paths;
  std::vector<CompileCommandEntry> entries;
  entries.reserve(size);
  for (unsigned index = 0; index < size; ++index) {
    CXCompileCommand command = clang_CompileCommands_getCommand(commands, index);
    const auto file = ToString(clang_CompileCommand_getFilename(command));
    const auto directory = ToString(clang_CompileCommand_getDirectory(command));
    const auto path = CanonicalTranslationUnitPath(file, directory, project_root);
    if (path.empty() || !seen_paths.insert(path.string()).second) {
      continue;
    }
    entries.push_back(
        {path, fs::weakly_canonical(directory), ExtractArgs(command)});
  }

  clang_CompileCommands_dispose(commands);
  clang_CompilationDatabase_dispose(database);

  if (entries.empty()) {
    return LoadCompileCommandsFromJson(compile_commands_path, project_root);
  }
  return entries;
}

// Drops the compiler, output and input arguments and anchors relative
// include directories at the command's working directory.
std::vector<std::string> NormalizeArgs(const CompileCommandEntry &entry) {
  static const std::vector<std::string> kPathFlags = {"-I", "-isystem",
                                                      "-iquote", "-include"};
  const auto absolute = [&](const std::string &value) {
    const fs::path path(value);
    return path.is_relative() ? (entry.directory / path).string() : value;
  };

  std::vector<std::string> args;
  for (std::size_t i = 0; i < entry.args.size(); ++i) {
    const auto &arg = entry.args[i];
    if (arg.empty()) {
      continue;
    }
    if (i == 0 && arg.front() != '-') {
      continue;
    }
    if (arg == "-c") {
      continue;
    }
    if (arg == "-o" && i + 1 < entry.args.size()) {
      ++i;
      continue;
    }
    if (arg.front() != '-' && IsSourcePath(arg)) {
      continue;
    }
    const auto flag = std::find(kPathFlags.begin(), kPathFlags.end(), arg);
    if (flag != kPathFlags.end() && i + 1 < entry.args.size()) {
      args.push_back(arg);
      args.push_back(absolute(entry.args[++i]));
      continue;
    }
    if (arg.size() > 2 && arg.compare(0, 2, "-I") == 0) {
      args.push_back("-I" + absolute(arg.substr(2)));
      continue;
    }
    args.push_back(arg);
  }

  const bool has_standard =
      std::any_of(args.begin(), args.end(), [](const std::string &arg) {
        return arg.rfind("-std=", 0) == 0;
      });
  if (!has_standard) {
    args.push_back("-std=c++17");
  }
  return args;
}

std::vector<CompileCommandEntry>
BuildFallbackCommands(const SourceAcquisitionResult &sources) {
  std::vector<CompileCommandEntry> entries;
  for (const auto &file : sources.files) {
    const auto path = fs::weakly_canonical(file);
    if (!IsSourcePath(path.string())) {
      continue;
    }
    CompileCommandEntry entry;
    entry.file = path;
    entry.directory = path.parent_path();
    entries.push_back(std::move(entry));
  }
  return entries;
}

using TranslationUnitPtr =
    std::unique_ptr<CXTranslationUnitImpl, decltype(&clang_disposeTranslationUnit)>;

TranslationUnitPtr Parse(CXIndex index, const CompileCommandEntry &entry) {
  const auto args = NormalizeArgs(entry);
  std::vector<const char *> arg_pointers;
  arg_pointers.reserve(args.size());
  for (const auto &arg : args) {
    arg_pointers.push_back(arg.c_str());
  }

  CXTranslationUnit unit = nullptr;
  const auto error = clang_parseTranslationUnit2(
      index, entry.file.string().c_str(), arg_pointers.data(),
      static_cast<int>(arg_pointers.size()), nullptr, 0,
      CXTranslationUnit_DetailedPreprocessingRecord, &unit);
  if (error != CXError_Success) {
    unit = nullptr;
  }
  return TranslationUnitPtr(unit, &clang_disposeTranslationUnit);
}

// Directories of project files with error diagnostics.
std::set<std::string> FailedPackages(CXTranslationUnit unit,
                                     ProjectFiles &files) {
  std::set<std::string> failed;
  const unsigned count = clang_getNumDiagnostics(unit);
  for (unsigned i = 0; i < count; ++i) {
    CXDiagnostic diagnostic = clang_getDiagnostic(unit, i);
    if (clang_getDiagnosticSeverity(diagnostic) >= CXDiagnostic_Error) {
      CXFile file{};
      clang_getFileLocation(clang_getDiagnosticLocation(diagnostic), &file,
                            nullptr, nullptr, nullptr);
      if (file != nullptr) {
        const auto &info = files.Lookup(ToString(clang_getFileName(file)));
        if (info.analyzed) {
          failed.insert(info.package);
        }
      }
    }
    clang_disposeDiagnostic(diagnostic);
  }
  return failed;
}

} // namespace

ClangFactExtractor::ClangFactExtractor(HeuristicConfig config,
                                       std::filesystem::path compile_commands_path,
                                       std::shared_ptr<Logger> logger)
    : config_(std::move(config)),
      compile_commands_path_(std::move(compile_commands_path)),
      logger_(EnsureLogger(std::move(logger))) {}

FactModel ClangFactExtractor::Extract(const SourceAcquisitionResult &sources) {
  if (sources.project_root.empty()) {
    throw std::invalid_argument("SourceAcquisitionResult.project_root is empty");
  }

  const auto project_root = fs::weakly_canonical(sources.project_root);
  const auto build_directory = sources.build_directory.empty()
                                   ? fs::path{}
                                   : fs::weakly_canonical(sources.build_directory);
  const auto compile_commands_path = ChooseCompileCommandsPath(
      compile_commands_path_, project_root, build_directory);
  if (!fs::exists(compile_commands_path)) {
    throw std::runtime_error("compile_commands.json not found at " +
                             compile_commands_path.string());
  }

  ProjectFiles files(project_root, sources.files);
  FactAccumulator facts(sources.module_path.empty()
                            ? project_root.filename().string()
                            : sources.module_path);
  for (const auto &file : sources.files) {
    const auto &info = files.Lookup(file);
    if (!info.analyzed) {
      continue;
    }
    auto &package = facts.Package(info.package);
    package.files.push_back(info.relative);
    package.total_lines += CountLines(file);
  }

  auto commands = LoadCompileCommands(compile_commands_path, project_root);
  if (commands.empty()) {
    commands = BuildFallbackCommands(sources);
  }
  commands.erase(std::remove_if(commands.begin(), commands.end(),
                                [&](const CompileCommandEntry &entry) {
                                  return !files.Lookup(entry.file.string())
                                              .analyzed;
                                }),
                 commands.end());
  std::sort(commands.begin(), commands.end(),
            [](const CompileCommandEntry &left, const CompileCommandEntry &right) {
              return left.file < right.file;
            });
  logger_->Log(LogLevel::kDebug, "extract.commands",
               {{"count", std::to_string(commands.size())},
                {"database", compile_commands_path.string()}});

  std::unique_ptr<void, decltype(&clang_disposeIndex)> index(
      clang_createIndex(0, 0), &clang_disposeIndex);
  for (const auto &entry : commands) {
    const auto &info = files.Lookup(entry.file.string());
    if (facts.IsSkipped(info.package)) {
      continue;
    }

    auto unit = Parse(index.get(), entry);
    auto failed = unit ? FailedPackages(unit.get(), files)
                       : std::set<std::string>{info.package};
    if (!failed.empty()) {
      // The unit's own directory loses its facts along with the broken one.
      failed.insert(info.package);
      for (const auto &package : failed) {
        facts.MarkSkipped(package);
        logger_->Log(LogLevel::kWarn, "extract.directory.skipped",
                     {{"directory", package.empty() ? "." : package},
                      {"translation_unit", info.relative}});
      }
      continue;
    }

    TranslationUnitWalker walker(unit.get(), files, facts, config_);
    walker.Walk();
    logger_->Log(LogLevel::kDebug, "extract.translation_unit.complete",
                 {{"file", info.relative}});
  }

  auto model = facts.Finish();
  logger_->Log(LogLevel::kInfo, "extract.complete",
               {{"packages", std::to_string(model.packages.size())},
                {"skipped", std::to_string(model.skipped_directories.size())}});
  return model;
}

} // namespace health
