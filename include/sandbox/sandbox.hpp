#pragma once

#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <vector>
#include "hindsight/config.hpp"
#include "sandbox/runguard.hpp"

namespace hindsight {

/**
 * @brief 沙箱的全局设置
 */
struct sandbox_config {
    /**
     * @brief runguard 可执行文件的路径
     */
    std::filesystem::path runguard;

    /**
     * @brief 运行目录的根目录
     */
    std::filesystem::path work_root;

    std::string user = "nobody";
    std::string group = "nogroup";
};

/**
 * @brief 一次运行的请求
 */
struct sandbox_request {
    /**
     * @brief 需要复制到运行目录中的可执行文件，复制后的文件名为 program
     */
    std::filesystem::path program;

    std::vector<std::string> args;

    /**
     * @brief 标准输入文件，为空表示 /dev/null
     */
    std::filesystem::path stdin_file;

    /**
     * @brief 标准输出重定向的文件
     */
    std::filesystem::path stdout_file;

    std::map<std::string, std::string> env;

    resource_limits limits;
};

/**
 * @brief 一次运行所独占的沙箱上下文
 * 构造时创建私有的运行目录，析构时杀死 cgroup 中残留的进程、删除 cgroup 和运行目录，
 * 清理失败只会记录日志，不会覆盖已经得到的运行结果。
 * 运行目录的结构：
 * run-<uuid>
 * ├── program             选手程序的副本
 * ├── stderr              选手程序的标准错误流
 * ├── program.meta        runguard 写入的运行结果
 * ├── runguard.log        runguard 的日志
 * └── sanitizer.<pid>     运行时检测工具的报告
 */
struct sandbox_context {
    /**
     * @throw sandbox_unavailable_error 没有 root 权限、runguard 不存在或 cgroup v2 不可用
     * @throw execution_environment_error 无法创建运行目录
     */
    explicit sandbox_context(const sandbox_config &config);
    ~sandbox_context();

    sandbox_context(const sandbox_context &) = delete;
    sandbox_context &operator=(const sandbox_context &) = delete;

    const std::filesystem::path &run_dir() const;

    const std::string &cgroup_name() const;

    std::filesystem::path stderr_file() const;

    /**
     * @brief 在沙箱中运行程序，阻塞直到程序结束、超时或被取消
     * @param cancelled 取消标记，被置位后 runguard 及其 cgroup 内的进程都会被杀死
     * @throw sandbox_unavailable_error 隔离机制不可用
     * @throw execution_environment_error runguard 出错或运行被取消
     */
    runguard_result run(const sandbox_request &request, const std::atomic_bool *cancelled = nullptr);

    /**
     * @brief 检查沙箱是否可用
     * @throw sandbox_unavailable_error 不可用时说明原因
     */
    static void probe(const sandbox_config &config);

private:
    void teardown();

    sandbox_config config;
    std::filesystem::path dir;
    std::string cgroup;
};

}  // namespace hindsight
