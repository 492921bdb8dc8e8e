#pragma once

#include <nlohmann/json.hpp>
#include <filesystem>
#include <istream>
#include <memory>
#include "hindsight/config.hpp"

namespace hindsight {

/**
 * @brief 输出比较的结果
 */
enum class comparison_result {
    PASS,
    FAIL,

    /**
     * @brief 无法比较，比如选手输出或标准输出无法读取，或者程序没有正常退出
     */
    INCONCLUSIVE
};

const char *to_string(comparison_result result);

void to_json(nlohmann::json &j, comparison_result result);

/**
 * @brief 选手输出与标准输出的比较方式
 */
struct comparator {
    virtual ~comparator();

    /**
     * @brief 比较两个输入流的内容
     * @param expected 标准输出
     * @param actual 选手程序的输出
     * @return PASS 或 FAIL
     */
    virtual comparison_result compare(std::istream &expected, std::istream &actual) const = 0;

    /**
     * @brief 比较两个文件，任一文件无法打开时返回 INCONCLUSIVE
     */
    comparison_result compare_files(const std::filesystem::path &expected, const std::filesystem::path &actual) const;
};

/**
 * @brief 逐字节比较
 */
struct exact_comparator : public comparator {
    comparison_result compare(std::istream &expected, std::istream &actual) const override;
};

/**
 * @brief 忽略每行末尾的空白字符以及文末的空行
 */
struct whitespace_comparator : public comparator {
    comparison_result compare(std::istream &expected, std::istream &actual) const override;
};

/**
 * @brief 按空白字符切分为单词逐个比较
 * 两个单词都能解析为有限的浮点数时，绝对误差或相对误差在容许范围内即视为相等，
 * 否则要求两个单词完全相同。单词数量不同一定不相等。
 */
struct numeric_comparator : public comparator {
    numeric_comparator(double absolute_tolerance, double relative_tolerance);

    comparison_result compare(std::istream &expected, std::istream &actual) const override;

private:
    bool same_token(const std::string &expected, const std::string &actual) const;

    double absolute_tolerance, relative_tolerance;
};

std::unique_ptr<comparator> make_comparator(const comparison_config &config);

}  // namespace hindsight
