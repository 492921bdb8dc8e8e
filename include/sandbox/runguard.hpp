#pragma once

#include <cstdint>
#include <filesystem>
#include <string>

namespace hindsight {

/**
 * @brief runguard 写入 meta 文件的运行结果
 */
struct runguard_result {
    /**
     * @brief 时钟时间
     * 单位为秒
     */
    double wall_time = -1;

    /**
     * @brief 用户时间（指在用户态下运行的 CPU 时间）
     * 单位为秒，cgroup 内所有进程、所有线程的 CPU 时间会累加
     */
    double user_time = -1;

    /**
     * @brief 系统时间（指在内核态下运行的时间）
     * 单位为秒，cgroup 内所有进程、所有线程的 CPU 时间会累加
     */
    double sys_time = -1;

    /**
     * @brief CPU 时间
     * 单位为秒，cgroup 内所有进程、所有线程的 CPU 时间会累加
     */
    double cpu_time = -1;

    /**
     * @brief 选手程序的返回值，因信号终止时为 128 + 信号编号
     * 没有该字段说明 runguard 没有正常结束
     */
    int exitcode = -1;

    /**
     * @brief 终止选手程序的信号，或 runguard 收到的 SIGALRM、SIGTERM
     */
    int signal = -1;

    /**
     * @brief runguard 自身的错误信息
     */
    std::string internal_error;

    /**
     * @brief 隔离机制是否不可用
     */
    bool sandbox_unavailable = false;

    /**
     * @brief 内存使用峰值（单位为字节）
     */
    int64_t memory = -1;

    /**
     * @brief oom 表示被 OOM Killer 杀死，max 表示内存使用曾触及上限
     */
    std::string memory_result;

    /**
     * @brief soft-timelimit 或 hard-timelimit，未超时为空
     */
    std::string time_result;

    /**
     * @brief exceeded 表示输出超出限制
     */
    std::string output_result;

    /**
     * @brief 被截断的输出流，如 "stdout,stderr"
     */
    std::string output_truncated;

    int64_t stdout_bytes = -1;
    int64_t stderr_bytes = -1;
};

/**
 * @brief 读取 runguard 的 meta 文件
 * 每行为 "key: value" 的格式，无法识别的值会被忽略
 */
runguard_result read_runguard_result(const std::filesystem::path &metafile);

}  // namespace hindsight
