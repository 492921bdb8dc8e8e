#pragma once

#include <nlohmann/json.hpp>
#include <cstdint>
#include <filesystem>
#include <map>
#include <string>
#include <vector>

namespace hindsight {

/**
 * @brief 运行选手程序时的资源限制
 */
struct resource_limits {
    /**
     * @brief 墙钟时间限制（秒）
     * 超过该时间后 runguard 会杀死选手程序的整个进程组
     */
    double wall_time = 10;

    /**
     * @brief CPU 时间限制（秒）
     */
    double cpu_time = 5;

    /**
     * @brief 内存限制（字节），通过 cgroup 的 memory.max 限制
     */
    int64_t memory = 512ll << 20;

    /**
     * @brief 输出限制（字节），包括标准输出和写入的单个文件大小
     */
    int64_t output = 64ll << 20;

    /**
     * @brief 栈空间限制（字节），-1 表示不限制
     */
    int64_t stack = 8ll << 20;

    /**
     * @brief 进程数限制，通过 cgroup 的 pids.max 限制
     */
    int processes = 16;

    /**
     * @brief 文件描述符数限制
     */
    int open_files = 64;
};

void from_json(const nlohmann::json &j, resource_limits &limits);
void to_json(nlohmann::json &j, const resource_limits &limits);

enum class comparison_mode {
    /**
     * @brief 逐字节比较
     */
    EXACT,

    /**
     * @brief 忽略行末空白字符和文末空行
     */
    WHITESPACE,

    /**
     * @brief 按空白字符切分为单词，浮点数在误差范围内即视为相等
     */
    NUMERIC
};

struct comparison_config {
    comparison_mode mode = comparison_mode::EXACT;
    double absolute_tolerance = 1e-6;
    double relative_tolerance = 1e-6;
};

void from_json(const nlohmann::json &j, comparison_config &config);

/**
 * @brief 总严重程度的计算方式
 */
enum class score_aggregation {
    SUM,
    MAX
};

/**
 * @brief 工具链的配置，所有提交共享
 */
struct toolchain_config {
    /**
     * @brief 编译器，为空时依次尝试环境变量 CXX、c++、g++、clang++
     */
    std::string compiler;

    /**
     * @brief 编译选项，如 -std=c++17 -O2
     */
    std::vector<std::string> compiler_args = {"-O2", "-Wall"};

    /**
     * @brief 启用运行时检测时附加的编译选项
     */
    std::vector<std::string> instrument_args = {"-fsanitize=address,undefined", "-g", "-fno-omit-frame-pointer"};

    /**
     * @brief 编译时间限制（秒）
     */
    double compile_time_limit = 60;

    /**
     * @brief 静态检查工具 clang-tidy 的路径或名称
     */
    std::string clang_tidy = "clang-tidy";

    /**
     * @brief 结构化检查使用的 clang 的路径或名称
     */
    std::string clang = "clang++";

    /**
     * @brief 启用的 clang-tidy 检查，为空表示目录中所有 clang-tidy 规则
     */
    std::vector<std::string> enabled_rules;

    /**
     * @brief 规则目录路径，为空时使用随程序安装的默认目录
     */
    std::filesystem::path catalog_path;

    /**
     * @brief runguard 的路径，为空时依次使用环境变量 RUNGUARD 和安装路径
     */
    std::filesystem::path runguard_path;

    /**
     * @brief 运行时的工作目录根，每次运行会在其中创建私有的运行目录
     */
    std::filesystem::path work_root = "/tmp/hindsight";

    /**
     * @brief 默认资源限制
     */
    resource_limits limits;

    /**
     * @brief 运行选手程序的用户和用户组
     */
    std::string sandbox_user = "nobody";
    std::string sandbox_group = "nogroup";

    /**
     * @brief Execution Result 中保存的标准输出和标准错误流的最大长度（字节）
     */
    std::size_t capture_limit = 64 << 10;

    /**
     * @brief 默认的输出比较方式
     */
    comparison_config comparison;

    score_aggregation aggregation = score_aggregation::SUM;

    /**
     * @brief 启用运行时检测时传给 ASAN_OPTIONS 和 UBSAN_OPTIONS 的额外选项
     */
    std::map<std::string, std::string> sanitizer_options;
};

void from_json(const nlohmann::json &j, toolchain_config &config);

}  // namespace hindsight
