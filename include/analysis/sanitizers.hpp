#pragma once

#include <filesystem>
#include <map>
#include <regex>
#include <set>
#include <string>
#include <utility>
#include <vector>
#include "hindsight/catalog.hpp"
#include "hindsight/producer.hpp"

namespace hindsight {

/**
 * @brief 解析 AddressSanitizer 和 UndefinedBehaviorSanitizer 的报告
 * 选手程序通过 log_path 将报告写入运行目录中的 sanitizer.<pid> 文件。
 *
 * UndefinedBehaviorSanitizer 的报告形如
 * a.cpp:5:12: runtime error: signed integer overflow: 2147483647 + 1 cannot be represented in type 'int'
 * 报错消息依次与规则目录中带有 match 的规则匹配，没有匹配的规则时使用 undefined-behavior。
 *
 * AddressSanitizer 的报告以 "==<pid>==ERROR: AddressSanitizer: <类型>" 开头，
 * 以 "SUMMARY: AddressSanitizer" 结束，得到 asan-<类型> 诊断信息。
 * 报告中调用栈第一个位于提交目录内的栈帧作为诊断信息的位置。
 * 若规则目录中存在 asan-<类型>-read 或 asan-<类型>-write，则根据访问类型细化规则。
 */
struct sanitizer_analyzer : public diagnostic_producer {
    /**
     * @throw configuration_error 规则目录中的 match 不是合法的正则表达式
     */
    explicit sanitizer_analyzer(const rule_catalog &catalog);

    diagnostic_source kind() const override;

    /**
     * @brief 解析 input.run_dir 中的所有报告
     */
    std::vector<diagnostic> produce(const analysis_input &input) const override;

    std::vector<diagnostic> parse(const std::string &log, const std::filesystem::path &source_dir) const;

    /**
     * @brief 启用运行时检测时选手程序的环境变量
     * @param extra_options 额外的选项，会覆盖默认选项
     */
    static std::map<std::string, std::string> environment(const std::map<std::string, std::string> &extra_options);

private:
    std::vector<std::pair<std::string, std::regex>> patterns;
    std::set<std::string> known_rules;
};

}  // namespace hindsight
