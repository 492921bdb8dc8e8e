#pragma once

#include <fmt/format.h>
#include <glog/logging.h>
#include <boost/algorithm/string/join.hpp>
#include <boost/lexical_cast.hpp>
#include <atomic>
#include <filesystem>
#include <map>
#include <string>
#include <type_traits>
#include <vector>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

namespace hindsight {

inline void append_argument(std::vector<std::string> &argv, const std::string &arg) {
    argv.push_back(arg);
}

inline void append_argument(std::vector<std::string> &argv, const char *arg) {
    argv.emplace_back(arg);
}

inline void append_argument(std::vector<std::string> &argv, const std::filesystem::path &arg) {
    argv.push_back(arg.string());
}

template <typename T>
std::enable_if_t<std::is_arithmetic_v<T>> append_argument(std::vector<std::string> &argv, T arg) {
    argv.push_back(boost::lexical_cast<std::string>(arg));
}

template <typename T>
void append_argument(std::vector<std::string> &argv, const std::vector<T> &args) {
    for (const T &arg : args) append_argument(argv, arg);
}

/**
 * @brief 依次把参数转换为字符串追加到命令行中，容器参数会被展开
 */
template <typename... Args>
void to_string_list(std::vector<std::string> &argv, const Args &...args) {
    (append_argument(argv, args), ...);
}

/**
 * @brief 外部命令的运行参数
 */
struct process_options {
    /**
     * @brief 额外的环境变量，会覆盖当前进程中的同名变量
     */
    std::map<std::string, std::string> env;

    /**
     * @brief 标准输入、标准输出、标准错误流重定向的文件
     * 路径为空时，标准输入重定向到 /dev/null，标准输出和标准错误流继承当前进程
     */
    std::filesystem::path stdin_file, stdout_file, stderr_file;

    /**
     * @brief 标准错误流是否与标准输出写入同一个文件
     */
    bool merge_stderr = false;

    /**
     * @brief 运行时间上限（秒），超时后杀死整个进程组，小于等于 0 表示不限制
     */
    double timeout = -1;

    /**
     * @brief 取消标记，被置位后杀死整个进程组
     */
    const std::atomic_bool *cancelled = nullptr;
};

/**
 * @brief 外部命令的运行结果
 */
struct process_result {
    /**
     * @brief 外部命令的返回值，如果外部命令因为信号崩溃而没有返回码，则为 -1
     */
    int exitcode = -1;

    /**
     * @brief 导致外部命令终止的信号，正常退出时为 0
     */
    int signal = 0;

    bool timed_out = false;
    bool cancelled = false;
};

/**
 * @brief 执行外部命令
 * 子进程会成为新进程组的组长，超时或取消时整个进程组都会被杀死
 * @param options 运行参数
 * @param argv 外部命令的路径 (argv[0]) 和 参数 (argv)
 * @throw std::system_error 无法 fork 或外部命令无法执行（比如不存在）
 */
process_result exec_program(const process_options &options, const std::vector<std::string> &argv);

/**
 * @brief 以任意可转换为字符串的参数调用外部命令，不经过 shell
 * @code{.cpp}
 *     process_options options;
 *     options.stdout_file = "/tmp/tidy-version.txt";
 *     auto result = call_process_opt(options, std::filesystem::path("/usr/bin/clang-tidy"), "--version");
 * @endcode
 */
template <typename... Args>
process_result call_process_opt(const process_options &options, const Args &...args) {
    std::vector<std::string> argv;
    to_string_list(argv, args...);
    DLOG(INFO) << "Executing " << boost::algorithm::join(argv, " ");
    return exec_program(options, argv);
}

/**
 * @brief 在 PATH 中查找可执行文件
 * @param name 可执行文件名，包含 '/' 时视为路径直接检查
 * @return 可执行文件的路径，找不到时返回空路径
 */
std::filesystem::path find_executable(const std::string &name);

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 生成随机的唯一标识，用于运行目录和 cgroup 的命名
 */
std::string random_id();

}  // namespace hindsight
