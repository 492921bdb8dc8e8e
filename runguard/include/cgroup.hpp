#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <stdexcept>
#include <string>

struct cgroup;

/**
 * @brief libcgroup 调用失败
 */
struct cgroup_exception : public std::runtime_error {
    cgroup_exception(const std::string &call, int err);

    /**
     * @brief libcgroup 函数返回非 0 时抛出异常
     */
    static void check(const std::string &call, int err);
};

/**
 * @brief 选手程序的资源配额，写入 cgroup 的控制文件
 */
struct cgroup_quota {
    /**
     * @brief memory.max，单位为字节，小于 0 表示不限制
     * 设置时 memory.swap.max 同时置为 0
     */
    int64_t memory = -1;

    /**
     * @brief pids.max，不大于 0 表示不限制
     */
    int64_t processes = -1;
};

/**
 * @brief 一个 cgroup v2 控制组
 *
 * 使用的控制器：
 * - memory：memory.max 限制内存，memory.peak 和 memory.events 统计峰值和 OOM
 * - pids：pids.max 防止 fork 炸弹
 * - cpu：cpu.stat 统计组内所有进程的 CPU 时间
 *
 * 对象本身只记录名字，内核中的控制组由 create 创建、remove 删除。
 * https://docs.kernel.org/admin-guide/cgroup-v2.html
 */
struct control_group {
    explicit control_group(std::string name);

    /**
     * @brief 在内核中创建控制组并写入配额
     * @throw cgroup_exception
     */
    void create(const cgroup_quota &quota);

    /**
     * @brief 把调用进程移入控制组
     * @throw cgroup_exception
     */
    void attach() const;

    /**
     * @brief memory.peak 中的内存峰值
     * @throw cgroup_exception 内核不支持 memory.peak（Linux 5.19 之前）
     */
    int64_t peak_memory() const;

    /**
     * @brief 读取 "key value" 形式的统计文件，如 cpu.stat、memory.events
     * 文件不存在时返回空映射
     */
    std::map<std::string, int64_t> stat(const std::string &file) const;

    /**
     * @brief 向组内所有进程发送信号
     */
    void signal_all(int sig) const;

    /**
     * @brief 杀死组内所有进程并等待控制组变空
     * 优先写入 cgroup.kill，内核不支持时逐个发送 SIGKILL
     * @return 控制组在 2 秒内变空，或者控制组不存在时返回 true
     */
    bool kill_all() const;

    /**
     * @brief 删除控制组，组内必须已经没有进程
     * @throw cgroup_exception
     */
    void remove() const;

    const std::string &name() const;

    /**
     * @brief 控制组在 cgroupfs 中的目录
     */
    std::filesystem::path directory() const;

    /**
     * @brief cgroup v2 的挂载点
     */
    static const std::filesystem::path &root();

    /**
     * @brief cgroup v2 已挂载且 memory、pids 控制器可用
     */
    static bool supported();

    /**
     * @brief 初始化 libcgroup，进程内调用一次
     * @throw cgroup_exception
     */
    static void init();

private:
    std::string group_name;
};
