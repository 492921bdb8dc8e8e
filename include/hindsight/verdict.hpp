#pragma once

#include <optional>
#include <string>

namespace hindsight {

/**
 * @brief 表示一次运行的结果类别
 * 诊断规则的 explains 字段使用结果类别的缩写（如 "TLE"）来声明其能够解释的结果
 */
enum class verdict {
    /**
     * @brief 程序正常退出，且输出与标准输出一致
     */
    ACCEPTED = 0,

    /**
     * @brief 程序正常退出，但输出与标准输出不一致
     */
    WRONG_ANSWER = 1,

    /**
     * @brief 程序因信号崩溃，或者以非零返回值退出
     */
    RUNTIME_ERROR = 2,

    /**
     * @brief 程序的 CPU 时间或墙钟时间超出限制
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 程序的内存使用超出 cgroup 限制
     * cgroup 限制内存时，程序可能被 OOM Killer 杀死，
     * 也可能因为 malloc 返回 NULL 或 new 抛出 bad_alloc 而以非零返回值退出，
     * 后者在触碰过内存上限时也会被归入此类。
     */
    MEMORY_LIMIT_EXCEEDED = 4,

    /**
     * @brief 程序输出过多
     */
    OUTPUT_LIMIT_EXCEEDED = 5,

    /**
     * @brief 无法判断，比如标准输出文件无法读取
     */
    SYSTEM_ERROR = 6
};

const char *get_display_message(verdict);

/**
 * @brief 结果类别的缩写，如 AC、WA、RTE
 */
const char *get_verdict_tag(verdict);

/**
 * @brief 从缩写解析结果类别
 * @return 无法识别时返回 nullopt
 */
std::optional<verdict> parse_verdict_tag(const std::string &tag);

}  // namespace hindsight
