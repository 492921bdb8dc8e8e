#pragma once

#include <cstdint>
#include <string>
#include <vector>
#include "cgroup.hpp"

/**
 * @brief runguard 自身出错时的返回值
 * 选手程序也可能以这些值退出，调用方应以 meta 文件为准
 */
enum runguard_exit_code {
    /**
     * @brief 内部错误，meta 文件中有 internal-error
     */
    EXIT_INTERNAL_ERROR = 121,

    /**
     * @brief 隔离机制不可用，meta 文件中有 sandbox-unavailable
     */
    EXIT_SANDBOX_UNAVAILABLE = 122
};

/**
 * @brief 时间限制，单位为秒
 * 超过 soft 时只记录为超时，超过 hard 时杀死选手程序
 */
struct time_limit {
    double soft = 0, hard = 0;
    bool enabled = false;
};

/**
 * @brief 选手程序进程内生效的限制
 */
struct process_limits {
    time_limit cpu;
    time_limit wall;

    int64_t file_size = -1;  // RLIMIT_FSIZE，单位为字节
    int64_t stack = -1;      // RLIMIT_STACK，小于等于 0 表示不限制
    int64_t open_files = -1;
    bool core_dumps = true;
};

/**
 * @brief 选手程序的标准输入输出
 * 空串表示 /dev/null
 */
struct stream_redirection {
    std::string input, output, error;

    /**
     * @brief stdout 和 stderr 各自最多保存的字节数，小于 0 不截断
     */
    int64_t capture_limit = -1;
};

struct runguard_options {
    /**
     * @brief 控制组名称，相对于 cgroup v2 的挂载点，为空时自动生成
     */
    std::string cgroup;
    cgroup_quota quota;
    process_limits limits;
    stream_redirection streams;

    /**
     * @brief 选手程序的工作目录，也是文件系统中唯一可写的部分
     */
    std::string work_dir;

    int uid = -1;
    int gid = -1;

    /**
     * @brief 不分离命名空间、不重新挂载文件系统、不加载 seccomp，仅用于调试
     */
    bool no_isolation = false;

    /**
     * @brief 保留 runguard 的环境变量，否则只保留 PATH
     */
    bool inherit_env = false;

    /**
     * @brief "KEY=VALUE" 形式的附加环境变量
     */
    std::vector<std::string> env;

    std::string meta_file;
    std::vector<std::string> command;
};
