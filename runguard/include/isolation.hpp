#pragma once

#include <system_error>
#include "options.hpp"

/**
 * @brief 隔离机制不可用
 * 没有 root 权限、内核不支持命名空间或 cgroup v2 时抛出
 */
struct sandbox_setup_error : public std::system_error {
    sandbox_setup_error(int err, const std::string &what);
};

/**
 * @brief 分离 runguard 的 FD、IPC、NET、PID、UTS 和 SYSVSEM 命名空间
 * 此后 fork 出的第一个子进程成为新 PID 命名空间的 init 进程。
 * 挂载命名空间由 init 进程分离，runguard 自身仍然可以写入输出文件。
 * @throw sandbox_setup_error
 */
void enter_namespaces(const runguard_options &opt);

/**
 * @brief 在新的挂载命名空间中把工作目录以外的文件系统设为只读，并挂载新的 /proc
 * 只能在 init 进程中调用
 * @throw sandbox_setup_error
 */
void seal_filesystem(const runguard_options &opt);

/**
 * @brief 设置环境变量和 rlimit，加入控制组，然后切换到选手用户
 * @throw sandbox_setup_error 无法加入控制组
 * @throw std::system_error 其他系统调用失败
 */
void confine_process(const runguard_options &opt);

/**
 * @brief 加载 seccomp 过滤器，危险的系统调用（mount、ptrace、setns 等）返回 EPERM
 * @throw sandbox_setup_error
 */
void install_syscall_filter(const runguard_options &opt);
