#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include <utility>
#include <vector>
#include "hindsight/catalog.hpp"
#include "hindsight/comparator.hpp"
#include "hindsight/config.hpp"
#include "hindsight/producer.hpp"
#include "sandbox/executor.hpp"

namespace hindsight {

struct submission;

/**
 * @brief 创建提交时的额外选项
 */
struct submission_options {
    /**
     * @brief 额外的头文件目录
     */
    std::vector<std::filesystem::path> include_dirs;

    /**
     * @brief 该提交额外的编译选项，附加在工具链的编译选项之后
     */
    std::vector<std::string> compiler_args;

    /**
     * @brief 编译产物的存放目录，为空时使用 output_dir/work
     */
    std::filesystem::path work_dir;
};

/**
 * @brief 工具链，保存所有提交共享的配置（编译选项、沙箱资源限制、启用的规则）并创建提交
 * 构造后只读，可以被多个线程同时使用。提交持有工具链的引用，工具链必须比提交活得更久。
 */
struct toolchain {
    /**
     * @brief 使用配置中的规则目录，未指定时使用随程序安装的默认目录
     * @throw configuration_error 规则目录无法加载
     */
    explicit toolchain(const toolchain_config &config);

    toolchain(const toolchain_config &config, rule_catalog catalog);

    toolchain(const toolchain &) = delete;
    toolchain &operator=(const toolchain &) = delete;

    /**
     * @brief 创建一个提交，不会进行编译
     * @param source_dir 提交的源代码目录
     * @param output_dir 分析结果的输出目录，不存在时会被创建
     * @throw io_error 目录不存在或无法访问
     * @throw configuration_error 编译选项与源代码的语言不匹配，或目录中没有源文件
     */
    std::unique_ptr<submission> new_submission(const std::filesystem::path &source_dir,
                                               const std::filesystem::path &output_dir,
                                               const submission_options &options = submission_options()) const;

    /**
     * @brief 各个外部工具的可用情况，如 ("clang-tidy", "yes (LLVM version 14.0.0)")
     */
    std::vector<std::pair<std::string, std::string>> dump_info() const;

    bool sandbox_available() const;

    const toolchain_config &config() const;

    const rule_catalog &catalog() const;

    /**
     * @brief 编译器的完整路径，找不到编译器时为空
     */
    const std::filesystem::path &compiler() const;

    /**
     * @brief 启用的 clang-tidy 检查
     */
    const std::vector<std::string> &enabled_checks() const;

    /**
     * @brief 按来源选择分析工具
     */
    const diagnostic_producer &producer(diagnostic_source source) const;

    const sandboxed_executor &executor() const;

    /**
     * @brief 配置中指定的默认输出比较方式
     */
    const comparator &default_comparator() const;

private:
    toolchain_config cfg;
    rule_catalog rules;
    std::filesystem::path compiler_path;
    std::vector<std::string> checks;
    std::unique_ptr<diagnostic_producer> static_analyzer, structural, sanitizers;
    std::unique_ptr<sandboxed_executor> exec;
    std::unique_ptr<comparator> compare;
};

}  // namespace hindsight
