#pragma once

#include <filesystem>
#include <string>
#include <vector>
#include "hindsight/producer.hpp"

namespace hindsight {

/**
 * @brief 调用 clang-tidy 进行静态检查
 * 每个翻译单元单独运行一次 clang-tidy，通过 --export-fixes 导出 YAML 格式的检查结果，
 * 再将其中的字节偏移转换为行号和列号。
 * 某个翻译单元无法完整分析时（比如编译错误），已经得到的检查结果会被保留，
 * 并额外产生一条 source-incomplete 诊断信息。
 */
struct clang_tidy_analyzer : public diagnostic_producer {
    /**
     * @param executable clang-tidy 的路径或名称
     * @param checks 启用的检查，如 performance-unnecessary-value-param
     * @param timeout 单个翻译单元的分析时间上限（秒）
     */
    clang_tidy_analyzer(const std::string &executable, const std::vector<std::string> &checks, double timeout);

    diagnostic_source kind() const override;

    std::vector<diagnostic> produce(const analysis_input &input) const override;

    /**
     * @brief 解析 clang-tidy 通过 --export-fixes 导出的 YAML 文件
     * @param fixes YAML 文件路径，文件不存在表示没有发现问题
     * @param source_dir 诊断信息中的文件路径相对于该目录
     * @throw analysis_parse_error YAML 格式错误
     */
    static std::vector<diagnostic> parse_fixes(const std::filesystem::path &fixes, const std::filesystem::path &source_dir);

    /**
     * @brief 传给 clang-tidy 的 --checks 参数
     */
    std::string check_filter() const;

private:
    std::string executable;
    std::vector<std::string> checks;
    double timeout;
};

}  // namespace hindsight
