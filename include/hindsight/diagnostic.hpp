#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace hindsight {

/**
 * @brief 诊断信息的来源
 */
enum class diagnostic_source {
    /**
     * @brief 外部静态检查工具（clang-tidy）
     */
    STATIC,

    /**
     * @brief 基于语法树的结构化检查
     */
    STRUCTURAL,

    /**
     * @brief 运行时检测工具（AddressSanitizer、UndefinedBehaviorSanitizer）
     */
    INSTRUMENTATION
};

const char *to_string(diagnostic_source source);

/**
 * @brief 源代码中的位置，行号和列号从 1 开始
 */
struct source_location {
    /**
     * @brief 相对于提交的源代码目录的路径
     */
    std::string file;

    int line = 0;

    int column = 0;
};

bool operator==(const source_location &a, const source_location &b);
bool operator<(const source_location &a, const source_location &b);

/**
 * @brief 一条诊断信息
 * 严重程度和能解释的结果类别不保存在诊断信息中，而是在生成报告时从规则目录查询
 */
struct diagnostic {
    /**
     * @brief 规则编号，如 "performance-unnecessary-value-param"、"asan-heap-buffer-overflow"
     */
    std::string rule_id;

    /**
     * @brief 诊断信息来源
     */
    diagnostic_source source = diagnostic_source::STATIC;

    /**
     * @brief 诊断信息对应的源代码位置，可能不存在
     */
    std::optional<source_location> location;

    /**
     * @brief 分析工具给出的描述
     */
    std::string message;

    /**
     * @brief 位置所在的源代码行，可能为空
     */
    std::string code;
};

bool operator==(const diagnostic &a, const diagnostic &b);

void to_json(nlohmann::json &j, const source_location &location);
void to_json(nlohmann::json &j, const diagnostic &diag);

// 规则编号
inline constexpr char SOURCE_INCOMPLETE[] = "source-incomplete";
inline constexpr char INTERNAL_ANALYSIS_ERROR[] = "internal-analysis-error";

}  // namespace hindsight
