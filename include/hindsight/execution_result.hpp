#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <string>
#include <vector>
#include "hindsight/comparator.hpp"
#include "hindsight/diagnostic.hpp"
#include "hindsight/verdict.hpp"

namespace hindsight {

/**
 * @brief 选手程序的终止方式
 */
enum class termination {
    /**
     * @brief 正常退出（返回值可能非零）
     */
    EXITED,

    /**
     * @brief 因信号崩溃，如 SIGSEGV、SIGABRT
     */
    SIGNALED,

    /**
     * @brief CPU 时间或墙钟时间超出限制
     */
    TIME_LIMIT,

    /**
     * @brief 内存超出限制
     */
    MEMORY_LIMIT,

    /**
     * @brief 输出超出限制
     */
    OUTPUT_LIMIT,

    /**
     * @brief 沙箱出错或运行被取消，选手程序的结果未知
     */
    ENVIRONMENT_ERROR
};

const char *to_string(termination status);

/**
 * @brief 选手程序在一个测试点上的运行结果，创建后不再修改
 */
struct execution_result {
    /**
     * @brief 测试点编号，默认为输入文件名去掉扩展名，重复运行时附加 #2、#3 等后缀
     */
    std::string test_case_id;

    termination status = termination::EXITED;

    /**
     * @brief 超出的资源：cpu-time、wall-time、memory、output，未超出限制时为空
     */
    std::string exceeded_resource;

    /**
     * @brief status 为 ENVIRONMENT_ERROR 时的错误信息
     */
    std::string environment_error;

    /**
     * @brief 返回值，因信号终止时为 128 + 信号编号
     */
    int exit_status = -1;

    /**
     * @brief 终止选手程序的信号，未被信号终止时为 0
     */
    int signal = 0;

    /**
     * @brief 墙钟时间和 CPU 时间（秒）
     */
    double wall_time = 0, cpu_time = 0;

    /**
     * @brief 内存使用峰值（字节）
     */
    int64_t peak_memory = 0;

    /**
     * @brief 标准输出和标准错误流的开头部分
     */
    std::string stdout_capture, stderr_capture;
    bool stdout_truncated = false, stderr_truncated = false;

    /**
     * @brief 输出比较结果，程序没有正常退出时为 INCONCLUSIVE
     */
    comparison_result comparison = comparison_result::INCONCLUSIVE;

    /**
     * @brief 是否启用了运行时检测
     */
    bool instrumented = false;

    /**
     * @brief 运行时检测发现的问题，按报告顺序排列
     */
    std::vector<diagnostic> instrumentation_diagnostics;

    /**
     * @brief 本次运行的结果类别
     */
    verdict outcome() const;
};

void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace hindsight
