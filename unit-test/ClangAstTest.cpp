#include <sstream>
#include "analysis/clang_ast.hpp"
#include "common/exceptions.hpp"
#include "gtest/gtest.h"

using namespace std;
using namespace hindsight;

static const char SOURCE_DIR[] = "/hindsight-test/submission";

static ast_node parse(const string &text) {
    istringstream is(text);
    return parse_clang_ast(is, SOURCE_DIR);
}

// 位置信息是增量编码的：与上一个位置相同的 file 和 line 会被省略
static const char TRANSLATION_UNIT[] = R"json({
  "id": "0x1", "kind": "TranslationUnitDecl", "loc": {}, "range": {"begin": {}, "end": {}},
  "inner": [
    {"id": "0x2", "kind": "TypedefDecl", "loc": {}, "range": {"begin": {}, "end": {}},
     "isImplicit": true, "name": "__int128_t", "type": {"qualType": "__int128"}},
    {"id": "0x3", "kind": "FunctionDecl",
     "loc": {"offset": 100, "file": "/usr/include/stdio.h", "line": 10, "col": 12, "tokLen": 6},
     "range": {"begin": {"offset": 89, "col": 1, "tokLen": 6}, "end": {"offset": 130, "col": 42, "tokLen": 1}},
     "name": "printf", "mangledName": "printf", "type": {"qualType": "int (const char *, ...)"}, "storageClass": "extern"},
    {"id": "0x4", "kind": "FunctionDecl",
     "loc": {"offset": 23, "file": "/hindsight-test/submission/main.cpp", "line": 2, "col": 6, "tokLen": 3},
     "range": {"begin": {"offset": 18, "col": 1, "tokLen": 4}, "end": {"offset": 45, "line": 4, "col": 1, "tokLen": 1}},
     "name": "foo", "mangledName": "_Z3foov", "type": {"qualType": "void ()"},
     "inner": [
       {"id": "0x5", "kind": "CompoundStmt",
        "range": {"begin": {"offset": 29, "line": 2, "col": 12, "tokLen": 1}, "end": {"offset": 45, "line": 4, "col": 1, "tokLen": 1}},
        "inner": [
          {"id": "0x6", "kind": "DeclStmt",
           "range": {"begin": {"offset": 35, "line": 3, "col": 5, "tokLen": 3}, "end": {"offset": 41, "col": 11, "tokLen": 1}},
           "inner": [
             {"id": "0x7", "kind": "VarDecl", "loc": {"offset": 39, "col": 9, "tokLen": 1},
              "range": {"begin": {"offset": 35, "col": 5, "tokLen": 3}, "end": {"offset": 39, "col": 9, "tokLen": 1}},
              "name": "x", "type": {"qualType": "int"}}
           ]}
        ]}
     ]},
    {"id": "0x8", "kind": "FunctionDecl", "loc": {"offset": 52, "line": 6, "col": 5, "tokLen": 4},
     "range": {"begin": {"offset": 48, "col": 1, "tokLen": 3}, "end": {"offset": 70, "line": 8, "col": 1, "tokLen": 1}},
     "name": "main", "mangledName": "main", "type": {"qualType": "int ()"},
     "inner": [
       {"id": "0x9", "kind": "CompoundStmt",
        "range": {"begin": {"offset": 59, "line": 6, "col": 12, "tokLen": 1}, "end": {"offset": 70, "line": 8, "col": 1, "tokLen": 1}},
        "inner": [
          {"id": "0xa", "kind": "CallExpr",
           "range": {"begin": {"offset": 65, "line": 7, "col": 5, "tokLen": 3}, "end": {"offset": 69, "col": 9, "tokLen": 1}},
           "type": {"qualType": "void"},
           "inner": [
             {"id": "0xb", "kind": "ImplicitCastExpr",
              "range": {"begin": {"offset": 65, "col": 5, "tokLen": 3}, "end": {"offset": 65, "col": 5, "tokLen": 3}},
              "type": {"qualType": "void (*)()"}, "castKind": "FunctionToPointerDecay",
              "inner": [
                {"id": "0xc", "kind": "DeclRefExpr",
                 "range": {"begin": {"offset": 65, "col": 5, "tokLen": 3}, "end": {"offset": 65, "col": 5, "tokLen": 3}},
                 "type": {"qualType": "void ()"},
                 "referencedDecl": {"id": "0x4", "kind": "FunctionDecl", "name": "foo", "type": {"qualType": "void ()"}}}
              ]}
           ]}
        ]}
     ]}
  ]
})json";

TEST(ClangAstTest, UserDeclarationsTest) {
    ast_node root = parse(TRANSLATION_UNIT);
    EXPECT_EQ(root.kind, "TranslationUnitDecl");

    // 系统头文件和隐式声明被丢弃
    ASSERT_EQ(root.children.size(), 2);
    const ast_node &foo = root.children[0];
    EXPECT_EQ(foo.kind, "FunctionDecl");
    EXPECT_EQ(foo.name, "foo");
    EXPECT_EQ(foo.mangled_name, "_Z3foov");
    EXPECT_EQ(foo.type, "void ()");
    ASSERT_TRUE(foo.location);
    EXPECT_EQ(foo.location->file, "/hindsight-test/submission/main.cpp");
    EXPECT_EQ(foo.location->line, 2);
    EXPECT_EQ(foo.location->column, 6);

    const ast_node &x = foo.children.at(0).children.at(0).children.at(0);
    EXPECT_EQ(x.kind, "VarDecl");
    EXPECT_EQ(x.name, "x");
    ASSERT_TRUE(x.location);
    EXPECT_EQ(x.location->line, 3);
    EXPECT_EQ(x.location->column, 9);
}

TEST(ClangAstTest, DeltaLocationTest) {
    ast_node root = parse(TRANSLATION_UNIT);
    ASSERT_EQ(root.children.size(), 2);

    // main 的位置省略了文件名，沿用 foo 的文件
    const ast_node &main = root.children[1];
    EXPECT_EQ(main.name, "main");
    ASSERT_TRUE(main.location);
    EXPECT_EQ(main.location->file, "/hindsight-test/submission/main.cpp");
    EXPECT_EQ(main.location->line, 6);

    const ast_node &ref = main.children.at(0).children.at(0).children.at(0).children.at(0);
    EXPECT_EQ(ref.kind, "DeclRefExpr");
    EXPECT_EQ(ref.referenced_id, "0x4");
    EXPECT_EQ(ref.referenced_name, "foo");
    EXPECT_EQ(ref.referenced_kind, "FunctionDecl");
}

TEST(ClangAstTest, MacroExpansionTest) {
    ast_node root = parse(R"({
      "id": "0x1", "kind": "TranslationUnitDecl", "inner": [
        {"id": "0x2", "kind": "VarDecl",
         "loc": {"spellingLoc": {"offset": 16, "file": "/hindsight-test/submission/defs.h", "line": 1, "col": 17, "tokLen": 3},
                 "expansionLoc": {"offset": 40, "file": "/hindsight-test/submission/main.cpp", "line": 3, "col": 1, "tokLen": 6}},
         "name": "buf", "type": {"qualType": "int [100]"}},
        {"id": "0x3", "kind": "VarDecl", "loc": {"offset": 60, "line": 4, "col": 5, "tokLen": 1},
         "name": "n", "type": {"qualType": "int"}}
      ]
    })");

    ASSERT_EQ(root.children.size(), 2);
    ASSERT_TRUE(root.children[0].location);
    EXPECT_EQ(root.children[0].location->file, "/hindsight-test/submission/main.cpp");
    EXPECT_EQ(root.children[0].location->line, 3);
    ASSERT_TRUE(root.children[1].location);
    EXPECT_EQ(root.children[1].location->file, "/hindsight-test/submission/main.cpp");
    EXPECT_EQ(root.children[1].location->line, 4);
}

TEST(ClangAstTest, RecordDefinitionTest) {
    ast_node root = parse(R"({
      "id": "0x1", "kind": "TranslationUnitDecl", "inner": [
        {"id": "0x2", "kind": "CXXRecordDecl", "loc": {"offset": 7, "file": "/hindsight-test/submission/main.cpp", "line": 1, "col": 8, "tokLen": 5},
         "name": "Point", "tagUsed": "struct", "completeDefinition": true,
         "definitionData": {"isAggregate": true, "isPOD": true, "isTrivial": true}},
        {"id": "0x3", "kind": "CXXRecordDecl", "loc": {"offset": 40, "line": 2, "col": 8, "tokLen": 4},
         "name": "Node", "tagUsed": "struct", "completeDefinition": true,
         "definitionData": {"isAggregate": true, "hasUserDeclaredConstructor": true}}
      ]
    })");

    ASSERT_EQ(root.children.size(), 2);
    EXPECT_TRUE(root.children[0].complete_definition);
    EXPECT_TRUE(root.children[0].is_pod);
    EXPECT_TRUE(root.children[1].complete_definition);
    EXPECT_FALSE(root.children[1].is_pod);
}

TEST(ClangAstTest, MalformedAstTest) {
    EXPECT_THROW(parse("{\"kind\": \"TranslationUnitDecl\", \"inner\": ["), analysis_parse_error);
    EXPECT_THROW(parse(R"({"kind": "FunctionDecl"})"), analysis_parse_error);
    EXPECT_THROW(parse(R"({"kind": "TranslationUnitDecl", "inner": {}})"), analysis_parse_error);
    EXPECT_THROW(parse(R"({"kind": "TranslationUnitDecl", "inner": [42]})"), analysis_parse_error);
    EXPECT_THROW(parse(R"({"kind": "TranslationUnitDecl", "inner": [{"kind": "VarDecl", "name": 42}]})"), analysis_parse_error);
}

TEST(ClangAstTest, RejectedArgumentsTest) {
    EXPECT_NO_THROW(check_rejected_arguments("clang", "main.cpp:3:9: warning: unused variable 'x' [-Wunused-variable]\n"));
    EXPECT_THROW(check_rejected_arguments("clang", "clang: error: unknown argument: '-fbogus'\n"), configuration_error);
    EXPECT_THROW(check_rejected_arguments("clang", "error: invalid value 'c++99' in '-std=c++99'\n"), configuration_error);
}
