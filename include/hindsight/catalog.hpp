#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "hindsight/diagnostic.hpp"

namespace hindsight {

/**
 * @brief 规则目录中未给出 severity 的规则、以及不在目录中的规则的严重程度
 */
constexpr int BASELINE_SEVERITY = 1;

/**
 * @brief 规则目录中的一条规则
 */
struct diagnostic_rule {
    /**
     * @brief 规则编号，在目录中唯一
     */
    std::string id;

    /**
     * @brief 对问题的简短描述
     */
    std::string short_description;

    /**
     * @brief 对问题的补充说明，比如修改建议
     */
    std::optional<std::string> extra_description;

    /**
     * @brief 严重程度，越大越严重
     */
    int severity = BASELINE_SEVERITY;

    /**
     * @brief 该规则可能导致的结果类别，如 TLE、WA
     */
    std::set<std::string> explains;

    /**
     * @brief 匹配 UndefinedBehaviorSanitizer 报错消息的正则表达式
     * 仅对运行时检测规则有意义，为空表示不参与匹配
     */
    std::string match;
};

void from_json(const nlohmann::json &j, diagnostic_rule &rule);

/**
 * @brief 规则目录
 * 在 toolchain 构造时加载一次，之后只读，可以在多个提交间共享
 */
struct rule_catalog {
    rule_catalog();
    explicit rule_catalog(const std::vector<diagnostic_rule> &rules);

    /**
     * @brief 从 JSON 文件加载规则目录
     * 文件内容为规则编号到规则内容的映射，未知字段会被忽略
     * @throw configuration_error 文件无法读取或格式错误
     */
    static rule_catalog load(const std::filesystem::path &path);

    /**
     * @brief 从已解析的 JSON 文档构造规则目录
     * @throw configuration_error 格式错误
     */
    static rule_catalog parse(const nlohmann::json &doc);

    /**
     * @return 规则不存在时返回 nullptr
     */
    const diagnostic_rule *find(const std::string &id) const;

    /**
     * @brief 查询规则，不存在的规则得到默认严重程度和空的 explains
     */
    diagnostic_rule lookup(const std::string &id) const;

    std::vector<const diagnostic_rule *> rules() const;

    std::size_t size() const;

    /**
     * @brief 生成诊断信息的完整记录，附带规则的描述、严重程度和 explains
     */
    nlohmann::json describe(const diagnostic &diag) const;

    nlohmann::json describe(const std::vector<diagnostic> &diags) const;

private:
    std::map<std::string, diagnostic_rule> entries;
};

}  // namespace hindsight
