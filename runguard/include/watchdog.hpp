#pragma once

#include <sys/resource.h>
#include <sys/types.h>
#include <chrono>
#include <optional>
#include <string>
#include "cgroup.hpp"
#include "meta.hpp"
#include "options.hpp"
#include "relay.hpp"

/**
 * @brief 在沙箱中运行一条命令并监视它
 *
 * 进程结构：
 * runguard（本进程，保持 root，转存输出并计时）
 * └── init（新 PID 命名空间的 1 号进程，只读地重新挂载文件系统）
 *     └── 选手程序（加入控制组、设置 rlimit、切换用户、加载 seccomp 后 exec）
 *
 * init 进程不会收到没有注册处理函数的信号，所以选手程序不直接作为 init。
 * init 退出时内核杀死整个命名空间，选手程序 fork 出的进程不会留下。
 * 子进程中隔离或 exec 失败的原因经错误管道传回，'S' 开头表示隔离机制不可用。
 * init 把选手程序的开始时间和等待状态依次写入状态管道，墙钟时间从选手程序开始时计算。
 */
struct watchdog {
    explicit watchdog(runguard_options options);

    watchdog(const watchdog &) = delete;
    watchdog &operator=(const watchdog &) = delete;

    /**
     * @brief 运行命令，结果写入 meta 文件
     * @return 选手程序的返回值，因信号终止时为 128 + 信号编号
     * @throw sandbox_setup_error 隔离机制不可用
     * @throw cgroup_exception 无法创建控制组
     * @throw std::exception runguard 内部错误
     */
    int run();

    /**
     * @brief run 抛出异常后调用：记录错误，杀死并清理残留的进程和控制组
     * @param sandbox 错误是否由隔离机制不可用引起
     * @return runguard 的返回值
     */
    int abandon(const std::string &reason, bool sandbox);

private:
    void prepare();
    int supervise();
    void arm_wall_timer();
    void abort_command(int sig);
    void check_child_failure(int fd);
    int decode_status(int status);
    void summarize(int exitcode);
    void release_cgroup();

    [[noreturn]] void init_process(int errfd, int statusfd);
    [[noreturn]] void command_process(int errfd);

    runguard_options opt;
    meta_writer meta;
    stream_relay relay;
    std::optional<control_group> group;

    pid_t init_pid = -1;
    int termination_signal = -1;
    bool wall_hard_limit = false;
    bool cpu_hard_limit = false;
    struct rusage usage = {};
    // started 在收到 init 报告的开始时间后被替换
    std::chrono::steady_clock::time_point started, finished;
};
