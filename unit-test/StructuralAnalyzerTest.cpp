#include <algorithm>
#include <cstring>
#include <sstream>
#include <stdexcept>
#include "analysis/structural.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"
#include "test/environment.hpp"

using namespace std;
using namespace hindsight;
namespace fs = std::filesystem;

static const char SOURCE_DIR[] = "/hindsight-test/submission";

/*
 * 对应的源代码：
 *  1 #include <iostream>
 *  2 #include <vector>
 *  3 struct Node { std::vector<int> edges; };
 *  4 int dfs(std::vector<int> v, int d) { return d == 0 ? 0 : dfs(v, d - 1); }
 *  5 void unused() {}
 *  6 void helper(Node p) {}
 *  7
 *  8 int main() {
 *  9     int n;
 * 10     while (std::cin >> n) { std::cout << n << std::endl; }
 * 11     int grid[2000][2000];
 * 12     dfs({}, 3);
 * 13     helper(Node());
 * 14 }
 */
static const char PROGRAM[] = R"json({
  "id": "0x1", "kind": "TranslationUnitDecl",
  "inner": [
    {"id": "0x10", "kind": "CXXRecordDecl", "loc": {"offset": 40, "file": "/hindsight-test/submission/main.cpp", "line": 3, "col": 8, "tokLen": 4},
     "name": "Node", "tagUsed": "struct", "completeDefinition": true,
     "definitionData": {"isAggregate": true, "hasConstexprNonCopyMoveConstructor": true},
     "inner": [
       {"id": "0x11", "kind": "CXXRecordDecl", "loc": {"offset": 40, "col": 8, "tokLen": 4}, "isImplicit": true, "name": "Node", "tagUsed": "struct"},
       {"id": "0x12", "kind": "FieldDecl", "loc": {"offset": 64, "col": 31, "tokLen": 5}, "name": "edges", "type": {"qualType": "std::vector<int>"}}
     ]},
    {"id": "0x20", "kind": "FunctionDecl", "loc": {"offset": 81, "line": 4, "col": 5, "tokLen": 3},
     "name": "dfs", "mangledName": "_Z3dfsSt6vectorIiSaIiEEi", "type": {"qualType": "int (std::vector<int>, int)"},
     "inner": [
       {"id": "0x21", "kind": "ParmVarDecl", "loc": {"offset": 102, "col": 26, "tokLen": 1}, "name": "v", "type": {"qualType": "std::vector<int>"}},
       {"id": "0x22", "kind": "ParmVarDecl", "loc": {"offset": 109, "col": 33, "tokLen": 1}, "name": "d", "type": {"qualType": "int"}},
       {"id": "0x23", "kind": "CompoundStmt", "inner": [
         {"id": "0x24", "kind": "ReturnStmt", "inner": [
           {"id": "0x25", "kind": "ConditionalOperator", "inner": [
             {"id": "0x26", "kind": "CallExpr", "type": {"qualType": "int"}, "inner": [
               {"id": "0x27", "kind": "ImplicitCastExpr", "castKind": "FunctionToPointerDecay", "inner": [
                 {"id": "0x28", "kind": "DeclRefExpr", "type": {"qualType": "int (std::vector<int>, int)"},
                  "referencedDecl": {"id": "0x20", "kind": "FunctionDecl", "name": "dfs", "type": {"qualType": "int (std::vector<int>, int)"}}}
               ]}
             ]}
           ]}
         ]}
       ]}
     ]},
    {"id": "0x30", "kind": "FunctionDecl", "loc": {"offset": 158, "line": 5, "col": 6, "tokLen": 6},
     "name": "unused", "mangledName": "_Z6unusedv", "type": {"qualType": "void ()"},
     "inner": [{"id": "0x31", "kind": "CompoundStmt"}]},
    {"id": "0x40", "kind": "FunctionDecl", "loc": {"offset": 175, "line": 6, "col": 6, "tokLen": 6},
     "name": "helper", "mangledName": "_Z6helper4Node", "type": {"qualType": "void (Node)"},
     "inner": [
       {"id": "0x41", "kind": "ParmVarDecl", "loc": {"offset": 187, "col": 18, "tokLen": 1}, "name": "p", "type": {"qualType": "Node"}},
       {"id": "0x42", "kind": "CompoundStmt"}
     ]},
    {"id": "0x50", "kind": "FunctionDecl", "loc": {"offset": 200, "line": 8, "col": 5, "tokLen": 4},
     "name": "main", "mangledName": "main", "type": {"qualType": "int ()"},
     "inner": [
       {"id": "0x51", "kind": "CompoundStmt", "inner": [
         {"id": "0x52", "kind": "DeclStmt", "inner": [
           {"id": "0x53", "kind": "VarDecl", "loc": {"offset": 217, "line": 9, "col": 9, "tokLen": 1}, "name": "n", "type": {"qualType": "int"}}
         ]},
         {"id": "0x54", "kind": "WhileStmt", "inner": [
           {"id": "0x55", "kind": "CXXOperatorCallExpr", "inner": [
             {"id": "0x56", "kind": "DeclRefExpr", "range": {"begin": {"offset": 234, "line": 10, "col": 12, "tokLen": 3}, "end": {"offset": 239, "col": 17, "tokLen": 3}},
              "referencedDecl": {"id": "0x9001", "kind": "VarDecl", "name": "cin", "type": {"qualType": "std::istream"}}}
           ]},
           {"id": "0x57", "kind": "CompoundStmt", "inner": [
             {"id": "0x58", "kind": "CXXOperatorCallExpr", "inner": [
               {"id": "0x59", "kind": "DeclRefExpr",
                "referencedDecl": {"id": "0x9002", "kind": "FunctionDecl", "name": "endl", "type": {"qualType": "std::ostream &(std::ostream &)"}}}
             ]}
           ]}
         ]},
         {"id": "0x5a", "kind": "DeclStmt", "inner": [
           {"id": "0x5b", "kind": "VarDecl", "loc": {"offset": 290, "line": 11, "col": 9, "tokLen": 4}, "name": "grid", "type": {"qualType": "int [2000][2000]"}}
         ]},
         {"id": "0x5c", "kind": "CallExpr", "inner": [
           {"id": "0x5d", "kind": "ImplicitCastExpr", "inner": [
             {"id": "0x5e", "kind": "DeclRefExpr", "referencedDecl": {"id": "0x20", "kind": "FunctionDecl", "name": "dfs"}}
           ]}
         ]},
         {"id": "0x5f", "kind": "CallExpr", "inner": [
           {"id": "0x60", "kind": "ImplicitCastExpr", "inner": [
             {"id": "0x61", "kind": "DeclRefExpr", "referencedDecl": {"id": "0x40", "kind": "FunctionDecl", "name": "helper"}}
           ]}
         ]}
       ]}
     ]}
  ]
})json";

static translation_unit make_unit(const string &ast, const string &compiler_output = "") {
    istringstream is(ast);
    translation_unit unit;
    unit.source = fs::path(SOURCE_DIR) / "main.cpp";
    unit.ast = parse_clang_ast(is, SOURCE_DIR);
    unit.compiler_output = compiler_output;
    return unit;
}

static vector<diagnostic> with_rule(const vector<diagnostic> &diags, const string &rule_id) {
    vector<diagnostic> result;
    copy_if(diags.begin(), diags.end(), back_inserter(result), [&](const diagnostic &d) { return d.rule_id == rule_id; });
    return result;
}

class StructuralAnalyzerTest : public ::testing::Test {
protected:
    void SetUp() override {
        units = {make_unit(PROGRAM)};
        diags = analyzer.analyze(units, SOURCE_DIR);
    }

    structural_analyzer analyzer{"clang", 10, 8ll << 20};
    vector<translation_unit> units;
    vector<diagnostic> diags;
};

TEST_F(StructuralAnalyzerTest, CallGraphTest) {
    call_graph graph = call_graph::build(units);
    EXPECT_TRUE(graph.has_main());

    set<string> reachable = graph.reachable();
    EXPECT_TRUE(reachable.count("main"));
    EXPECT_TRUE(reachable.count("_Z3dfsSt6vectorIiSaIiEEi"));
    EXPECT_TRUE(reachable.count("_Z6helper4Node"));
    EXPECT_FALSE(reachable.count("_Z6unusedv"));

    EXPECT_EQ(graph.recursive(), set<string>{"_Z3dfsSt6vectorIiSaIiEEi"});
}

TEST_F(StructuralAnalyzerTest, UnreachableFunctionTest) {
    auto found = with_rule(diags, "unreachable-func");
    ASSERT_EQ(found.size(), 1);
    EXPECT_EQ(found[0].source, diagnostic_source::STRUCTURAL);
    EXPECT_EQ(found[0].message, "function 'unused' is defined but never called from main");
    ASSERT_TRUE(found[0].location);
    EXPECT_EQ(found[0].location->file, "main.cpp");
    EXPECT_EQ(found[0].location->line, 5);
    EXPECT_EQ(found[0].location->column, 6);
}

TEST_F(StructuralAnalyzerTest, NonPodByValueTest) {
    // dfs 是递归函数，每层递归都会复制 vector
    auto recursive = with_rule(diags, "nonpod-by-value-rec");
    ASSERT_EQ(recursive.size(), 1);
    ASSERT_TRUE(recursive[0].location);
    EXPECT_EQ(recursive[0].location->line, 4);
    EXPECT_EQ(recursive[0].location->column, 26);
    EXPECT_NE(recursive[0].message.find("'v'"), string::npos);

    // Node 含有 vector 成员，不是 POD
    auto plain = with_rule(diags, "nonpod-by-value");
    ASSERT_EQ(plain.size(), 1);
    ASSERT_TRUE(plain[0].location);
    EXPECT_EQ(plain[0].location->line, 6);
    EXPECT_NE(plain[0].message.find("'Node'"), string::npos);
}

TEST_F(StructuralAnalyzerTest, StreamRulesTest) {
    auto endl = with_rule(diags, "endl-in-loop");
    ASSERT_EQ(endl.size(), 1);
    EXPECT_EQ(endl[0].message, "std::endl inside a loop flushes the output stream at every iteration");

    auto cin = with_rule(diags, "cin-without-sync");
    ASSERT_EQ(cin.size(), 1);
    ASSERT_TRUE(cin[0].location);
    EXPECT_EQ(cin[0].location->line, 10);
}

TEST_F(StructuralAnalyzerTest, SyncWithStdioTest) {
    // 在 main 开头调用 std::ios::sync_with_stdio(false)
    string ast = PROGRAM;
    string call = R"({"id": "0x70", "kind": "CXXMemberCallExpr", "inner": [
           {"id": "0x71", "kind": "MemberExpr", "name": "sync_with_stdio", "isArrow": false, "referencedMemberDecl": "0x9003"}
         ]},
         )";
    size_t pos = ast.find(R"({"id": "0x52")");
    ASSERT_NE(pos, string::npos);
    ast.insert(pos, call);

    vector<translation_unit> synced = {make_unit(ast)};
    auto found = analyzer.analyze(synced, SOURCE_DIR);
    EXPECT_TRUE(with_rule(found, "cin-without-sync").empty());
    EXPECT_EQ(with_rule(found, "endl-in-loop").size(), 1);
}

TEST_F(StructuralAnalyzerTest, LargeStackArrayTest) {
    auto found = with_rule(diags, "large-stack-array");
    ASSERT_EQ(found.size(), 1);
    ASSERT_TRUE(found[0].location);
    EXPECT_EQ(found[0].location->line, 11);
    EXPECT_NE(found[0].message.find("'grid'"), string::npos);

    // 栈空间足够大时不报告
    structural_analyzer roomy("clang", 10, 64ll << 20);
    EXPECT_TRUE(with_rule(roomy.analyze(units, SOURCE_DIR), "large-stack-array").empty());
}

TEST_F(StructuralAnalyzerTest, NoMainTest) {
    // 只提交了函数实现时无法判断可达性
    string ast = PROGRAM;
    size_t pos = ast.find(R"("name": "main", "mangledName": "main")");
    ASSERT_NE(pos, string::npos);
    ast.replace(pos, strlen(R"("name": "main", "mangledName": "main")"), R"("name": "solve", "mangledName": "_Z5solvev")");

    vector<translation_unit> library = {make_unit(ast)};
    EXPECT_TRUE(with_rule(analyzer.analyze(library, SOURCE_DIR), "unreachable-func").empty());
}

TEST_F(StructuralAnalyzerTest, FailingRuleTest) {
    vector<structural_rule> rules = structural_analyzer::default_rules(8ll << 20);
    rules.insert(rules.begin(), structural_rule{"broken", [](const vector<translation_unit> &, const fs::path &, vector<diagnostic> &result) {
                                                    result.push_back(diagnostic());
                                                    throw runtime_error("unexpected node");
                                                }});
    structural_analyzer partial("clang", 10, rules);
    auto found = partial.analyze(units, SOURCE_DIR);

    auto errors = with_rule(found, INTERNAL_ANALYSIS_ERROR);
    ASSERT_EQ(errors.size(), 1);
    EXPECT_EQ(errors[0].source, diagnostic_source::STRUCTURAL);
    EXPECT_NE(errors[0].message.find("broken"), string::npos);
    EXPECT_NE(errors[0].message.find("unexpected node"), string::npos);

    // 失败规则的部分结果被丢弃，其他规则照常运行
    EXPECT_TRUE(with_rule(found, "").empty());
    EXPECT_EQ(with_rule(found, "unreachable-func").size(), 1);
    EXPECT_EQ(with_rule(found, "endl-in-loop").size(), 1);
}

TEST_F(StructuralAnalyzerTest, CompilerWarningsTest) {
    string output = R"(/hindsight-test/submission/main.cpp:9:9: warning: unused variable 'n' [-Wunused-variable]
    int n;
        ^
/usr/include/c++/11/bits/stl_vector.h:100:5: warning: something in a system header [-Wdeprecated]
/hindsight-test/submission/main.cpp:4:50: warning: comparison of integers of different signs: 'int' and 'size_t' [-Wsign-compare,-Wextra]
2 warnings generated.
)";
    auto warnings = parse_compiler_warnings(output, SOURCE_DIR);
    ASSERT_EQ(warnings.size(), 2);
    EXPECT_EQ(warnings[0].rule_id, "clang-diagnostic-unused-variable");
    EXPECT_EQ(warnings[0].message, "unused variable 'n'");
    ASSERT_TRUE(warnings[0].location);
    EXPECT_EQ(warnings[0].location->file, "main.cpp");
    EXPECT_EQ(warnings[0].location->line, 9);
    EXPECT_EQ(warnings[0].location->column, 9);
    EXPECT_EQ(warnings[1].rule_id, "clang-diagnostic-sign-compare");

    vector<translation_unit> warned = {make_unit(PROGRAM, output)};
    auto found = analyzer.analyze(warned, SOURCE_DIR);
    EXPECT_EQ(with_rule(found, "clang-diagnostic-unused-variable").size(), 1);
}

TEST(ArraySizeTest, EstimateTest) {
    EXPECT_EQ(estimate_array_size("int"), 0);
    EXPECT_EQ(estimate_array_size("int [10]"), 40);
    EXPECT_EQ(estimate_array_size("int [1000][1000]"), 4000000);
    EXPECT_EQ(estimate_array_size("const char [6]"), 6);
    EXPECT_EQ(estimate_array_size("long long [100]"), 800);
    EXPECT_EQ(estimate_array_size("std::array<long long, 100>"), 800);
    EXPECT_EQ(estimate_array_size("int (*)[10]"), 0);
    EXPECT_EQ(estimate_array_size("Point [10]"), 80);
}

TEST(StructuralProduceTest, MissingClangTest) {
    structural_analyzer analyzer("/nonexistent/clang", 10, 8ll << 20);
    analysis_input input;
    input.source_dir = SOURCE_DIR;
    input.sources = {fs::path(SOURCE_DIR) / "main.cpp"};
    EXPECT_THROW(analyzer.produce(input), analysis_unavailable_error);
}
