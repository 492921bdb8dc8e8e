#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <istream>
#include <optional>
#include <string>
#include <vector>
#include "hindsight/diagnostic.hpp"

namespace hindsight {

/**
 * @brief clang -Xclang -ast-dump=json 输出的语法树节点
 * 只保留结构化检查需要的字段
 */
struct ast_node {
    /**
     * @brief 节点编号，如 "0x55d0c8a3e2f8"，同一次输出中唯一
     */
    std::string id;

    /**
     * @brief 节点类型，如 FunctionDecl、CallExpr、ForStmt
     */
    std::string kind;

    /**
     * @brief 声明的名字，或 MemberExpr 引用的成员名
     */
    std::string name;

    /**
     * @brief 类型，如 "int (const std::vector<int> &)"
     */
    std::string type;

    /**
     * @brief 去除 typedef 后的类型，与 type 相同时为空
     */
    std::string desugared_type;

    /**
     * @brief DeclRefExpr 或 MemberExpr 引用的声明
     */
    std::string referenced_id, referenced_name, referenced_kind;

    /**
     * @brief 同一实体的上一个声明，比如函数定义之前的函数原型
     */
    std::string previous_decl;

    std::string mangled_name;

    /**
     * @brief 存储类型，如 static、extern
     */
    std::string storage_class;

    /**
     * @brief 节点的位置，宏展开时取展开位置，文件为 clang 输出的原始路径
     */
    std::optional<source_location> location;

    bool implicit = false;

    bool is_virtual = false;

    /**
     * @brief 类是否为 POD 类型，只对带有定义的 CXXRecordDecl 有意义
     */
    bool is_pod = true;

    /**
     * @brief CXXRecordDecl 是否带有定义
     */
    bool complete_definition = false;

    std::vector<ast_node> children;
};

/**
 * @brief 解析 clang 输出的 JSON 语法树
 * clang 输出的位置信息是增量编码的（文件名、行号与上一次输出相同时会被省略），
 * 因此需要按文档顺序遍历所有节点，包括最终会被丢弃的系统头文件中的节点。
 * @param doc TranslationUnitDecl 节点
 * @param source_dir 只保留位于该目录中的顶层声明
 * @return TranslationUnitDecl 节点，子节点只包括用户代码中的顶层声明
 * @throw analysis_parse_error 文档结构不符合预期
 */
ast_node load_clang_ast(const nlohmann::ordered_json &doc, const std::filesystem::path &source_dir);

/**
 * @brief 从输入流读取并解析 JSON 语法树
 * @throw analysis_parse_error JSON 格式错误或结构不符合预期
 */
ast_node parse_clang_ast(std::istream &is, const std::filesystem::path &source_dir);

/**
 * @brief 检查 clang 系列工具的输出中是否有编译选项被拒绝的报错
 * @throw configuration_error 编译选项无法识别或取值非法
 */
void check_rejected_arguments(const std::string &tool, const std::string &output);

}  // namespace hindsight
