#pragma once

#include <atomic>
#include <filesystem>
#include <functional>
#include "hindsight/execution_result.hpp"
#include "sandbox/sandbox.hpp"

namespace hindsight {

/**
 * @brief 在沙箱中运行选手程序并将 runguard 的结果转换为 Execution Result
 * 每次运行都会获取一个独立的沙箱上下文，运行结束（包括异常和取消）后立即清理。
 */
struct sandboxed_executor {
    /**
     * @param capture_limit 标准输出和标准错误流保存的最大长度（字节）
     */
    sandboxed_executor(const sandbox_config &config, std::size_t capture_limit);

    /**
     * @brief 运行一次选手程序
     * 结果中不包括测试点编号和输出比较结果，由调用方填写
     * @param inspect 沙箱清理之前调用，参数为运行目录，用于读取运行时检测的报告
     * @throw sandbox_unavailable_error 隔离机制不可用
     * @throw execution_environment_error 沙箱出错或被取消
     */
    execution_result execute(const sandbox_request &request, const std::atomic_bool *cancelled,
                             const std::function<void(const std::filesystem::path &)> &inspect = nullptr) const;

    /**
     * @brief 根据 runguard 的结果判断选手程序的终止方式
     * 超时优先于内存超限，内存超限优先于输出超限，最后才是信号和返回值
     */
    static void classify(const runguard_result &meta, const resource_limits &limits, execution_result &result);

    /**
     * @brief 检查沙箱是否可用
     * @throw sandbox_unavailable_error 不可用时说明原因
     */
    void probe() const;

private:
    sandbox_config config;
    std::size_t capture_limit;
};

}  // namespace hindsight
