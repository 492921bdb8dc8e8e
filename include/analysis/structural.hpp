#pragma once

#include <cstdint>
#include <filesystem>
#include <functional>
#include <map>
#include <set>
#include <string>
#include <vector>
#include "analysis/clang_ast.hpp"
#include "hindsight/producer.hpp"

namespace hindsight {

/**
 * @brief 一个翻译单元的结构化检查输入
 */
struct translation_unit {
    /**
     * @brief 翻译单元的源文件
     */
    std::filesystem::path source;

    /**
     * @brief 只包含用户代码顶层声明的语法树
     */
    ast_node ast;

    /**
     * @brief clang 输出的警告和错误
     */
    std::string compiler_output;
};

/**
 * @brief 由所有翻译单元合并得到的函数调用图
 * 函数以 mangled name 标识，因此同一函数在不同翻译单元中的定义和声明会被合并
 */
struct call_graph {
    struct function {
        std::string key;
        std::string name;
        const ast_node *decl = nullptr;

        /**
         * @brief 函数是否会被隐式调用（构造函数、析构函数、运算符、虚函数），
         * 这些函数被视为调用图的根
         */
        bool implicit_entry = false;

        /**
         * @brief 是否为模板或模板类中的函数
         */
        bool in_template = false;

        std::set<std::string> callees;
    };

    /**
     * @brief 全局变量初始化的伪函数
     */
    static const char GLOBAL_INIT[];

    static call_graph build(const std::vector<translation_unit> &units);

    /**
     * @brief 从 main、全局变量初始化和隐式调用的函数出发可达的函数
     */
    std::set<std::string> reachable() const;

    /**
     * @brief 位于调用图的环上的函数（直接或间接递归）
     */
    std::set<std::string> recursive() const;

    /**
     * @brief 递归函数以及从递归函数出发可达的函数
     */
    std::set<std::string> reachable_from_recursion() const;

    bool has_main() const;

    static std::string key_of(const ast_node &decl);

    /**
     * @brief 所有带有函数体的函数定义
     */
    std::map<std::string, function> functions;
};

/**
 * @brief 一条结构化检查规则
 * 每条规则独立运行，抛出的异常只影响该规则本身
 */
struct structural_rule {
    std::string name;
    std::function<void(const std::vector<translation_unit> &, const std::filesystem::path &, std::vector<diagnostic> &)> check;
};

/**
 * @brief 基于 clang 语法树的结构化检查
 * clang -fsyntax-only -Xclang -ast-dump=json 输出语法树，同一次调用输出的编译警告
 * 被转换为 clang-diagnostic-<选项> 诊断信息。
 */
struct structural_analyzer : public diagnostic_producer {
    /**
     * @param clang clang 的路径或名称
     * @param timeout 单个翻译单元的解析时间上限（秒）
     * @param stack_limit 栈空间大小（字节），局部数组超过该大小时报告 large-stack-array
     */
    structural_analyzer(const std::string &clang, double timeout, int64_t stack_limit);

    structural_analyzer(const std::string &clang, double timeout, std::vector<structural_rule> rules);

    diagnostic_source kind() const override;

    std::vector<diagnostic> produce(const analysis_input &input) const override;

    /**
     * @brief 对已经解析的翻译单元运行所有规则
     * 规则抛出异常时产生一条 internal-analysis-error 诊断信息，其余规则照常运行
     */
    std::vector<diagnostic> analyze(const std::vector<translation_unit> &units, const std::filesystem::path &source_dir) const;

    /**
     * @brief 默认的规则集合
     */
    static std::vector<structural_rule> default_rules(int64_t stack_limit);

private:
    std::string clang;
    double timeout;
    std::vector<structural_rule> rules;
};

/**
 * @brief 解析 clang 的警告输出，如
 * a.cpp:3:9: warning: unused variable 'x' [-Wunused-variable]
 * 只保留位于 source_dir 中的警告
 */
std::vector<diagnostic> parse_compiler_warnings(const std::string &output, const std::filesystem::path &source_dir);

/**
 * @brief 估计数组类型占用的字节数，如 "int [1000][1000]"、"std::array<long long, 100>"
 * @return 不是数组类型时返回 0
 */
int64_t estimate_array_size(const std::string &type);

}  // namespace hindsight
