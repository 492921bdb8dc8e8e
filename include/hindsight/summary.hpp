#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "hindsight/catalog.hpp"
#include "hindsight/config.hpp"
#include "hindsight/diagnostic.hpp"
#include "hindsight/execution_result.hpp"
#include "hindsight/verdict.hpp"

namespace hindsight {

struct summary_options {
    /**
     * @brief 严重程度低于该值的规则不出现在报告中
     */
    int min_severity = 0;

    /**
     * @brief 只保留能够解释已观察到的运行结果的诊断信息
     * 运行时检测得到的诊断信息只能解释它所在的那次运行的结果
     */
    bool must_explain = false;
};

/**
 * @brief 同一规则的所有诊断信息
 */
struct rule_group {
    std::string rule_id;
    int severity = BASELINE_SEVERITY;
    std::string short_description;
    std::optional<std::string> extra_description;
    std::set<std::string> explains;

    /**
     * @brief 该规则能否解释至少一个已观察到的运行结果
     */
    bool explained = false;

    /**
     * @brief 去除重复（位置和描述都相同）后的诊断信息，保持发现顺序
     */
    std::vector<diagnostic> occurrences;
};

/**
 * @brief 对某个运行结果的可能解释，比如 "这可能是你超时的原因"
 */
struct hypothesis {
    verdict outcome = verdict::SYSTEM_ERROR;
    std::string rule_id;
    int severity = BASELINE_SEVERITY;
    std::string description;

    /**
     * @brief 出现该结果且能被该规则解释的测试点
     */
    std::vector<std::string> test_cases;
};

/**
 * @brief 对一个提交的所有诊断信息和运行结果的汇总，生成后不再修改
 */
struct summary_report {
    /**
     * @brief 总严重程度，同一规则只计算一次
     */
    int score = 0;

    /**
     * @brief 已观察到的运行结果类别（不包括 AC），如 TLE、WA
     */
    std::set<std::string> observed_verdicts;

    /**
     * @brief 按规则分组，能够解释运行结果的规则在前，其次按严重程度降序、规则编号升序
     */
    std::vector<rule_group> groups;

    /**
     * @brief 按严重程度降序、规则编号升序、结果类别升序排列
     */
    std::vector<hypothesis> hypotheses;
};

/**
 * @brief 汇总诊断信息和运行结果
 * 结果只取决于输入的内容，与检查的调用顺序无关
 * @param diagnostics 静态检查和结构化检查得到的诊断信息
 * @param results 所有运行结果，运行时检测的诊断信息从中获取
 */
summary_report build_summary(const rule_catalog &catalog,
                             const std::vector<diagnostic> &diagnostics,
                             const std::vector<execution_result> &results,
                             score_aggregation aggregation,
                             const summary_options &options);

void to_json(nlohmann::json &j, const rule_group &group);
void to_json(nlohmann::json &j, const hypothesis &h);
void to_json(nlohmann::json &j, const summary_report &report);

}  // namespace hindsight
