#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "common/exceptions.hpp"
#include "hindsight/diagnostic.hpp"

namespace hindsight {

/**
 * @brief 分析工具的输入
 */
struct analysis_input {
    /**
     * @brief 提交的源代码目录，诊断信息的文件路径相对于该目录
     */
    std::filesystem::path source_dir;

    /**
     * @brief 需要分析的翻译单元（绝对路径）
     */
    std::vector<std::filesystem::path> sources;

    /**
     * @brief 编译选项，包括工具链的编译选项、提交的额外编译选项和头文件目录
     */
    std::vector<std::string> compiler_args;

    /**
     * @brief 分析工具中间文件的存放目录
     */
    std::filesystem::path output_dir;

    /**
     * @brief 本次运行的运行目录，仅对运行时检测有意义
     */
    std::filesystem::path run_dir;
};

/**
 * @brief 部分文件的分析结果无法解析
 * partial 保留其余文件的诊断信息，并为每个无法解析的文件附加一条 source-incomplete 诊断信息
 */
struct partial_analysis_error : public analysis_parse_error {
    partial_analysis_error(const std::string &message, std::vector<diagnostic> partial);

    std::vector<diagnostic> partial;
};

/**
 * @brief 产生诊断信息的分析工具
 * 静态检查、结构化检查和运行时检测都实现这个接口，由 submission 统一调度。
 * 实现必须在构造后不再修改自身状态，以便多个提交并发使用同一个实例。
 */
struct diagnostic_producer {
    virtual ~diagnostic_producer();

    /**
     * @brief 产生的诊断信息的来源
     */
    virtual diagnostic_source kind() const = 0;

    /**
     * @brief 执行分析
     * @return 按发现顺序排列的诊断信息
     * @throw analysis_unavailable_error 分析工具无法调用
     * @throw analysis_parse_error 分析工具的输出无法解析
     * @throw partial_analysis_error 部分文件的输出无法解析
     * @throw configuration_error 编译选项与分析工具不兼容
     */
    virtual std::vector<diagnostic> produce(const analysis_input &input) const = 0;
};

}  // namespace hindsight
