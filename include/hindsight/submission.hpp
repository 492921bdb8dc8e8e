#pragma once

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <future>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "hindsight/comparator.hpp"
#include "hindsight/config.hpp"
#include "hindsight/diagnostic.hpp"
#include "hindsight/execution_result.hpp"
#include "hindsight/summary.hpp"

namespace hindsight {

struct toolchain;

/**
 * @brief 编译产物
 */
struct compiled_artifact {
    /**
     * @brief 可执行文件路径
     */
    std::filesystem::path binary;

    /**
     * @brief 是否启用了运行时检测
     */
    bool instrumented = false;

    /**
     * @brief 编译器的输出，编译成功时可能包含警告
     */
    std::string compiler_log;

    /**
     * @brief 源代码内容和编译命令的摘要，两者之一变化时编译产物失效
     */
    std::size_t fingerprint = 0;
};

/**
 * @brief check_output 的选项
 */
struct check_options {
    /**
     * @brief 是否在运行时检测（AddressSanitizer、UndefinedBehaviorSanitizer）下运行
     */
    bool instrument = false;

    /**
     * @brief 覆盖工具链的资源限制
     */
    std::optional<resource_limits> limits;

    /**
     * @brief 覆盖工具链的输出比较方式，调用方保证在调用期间有效
     */
    const comparator *compare = nullptr;

    /**
     * @brief 取消标记，置位后终止选手程序并清理沙箱
     */
    const std::atomic_bool *cancelled = nullptr;

    /**
     * @brief 测试点编号，为空时使用输入文件名去掉扩展名
     */
    std::string test_case_id;
};

/**
 * @brief 一个提交
 * 持有编译产物、静态和结构化检查得到的诊断信息以及每个测试点的运行结果。
 * 不同测试点的 check_output 可以并发调用，同一配置的编译只会进行一次。
 *
 * 输出目录的结构：
 * output_dir
 * ├── compiler.txt            编译器输出
 * ├── compiler-instr.txt      启用运行时检测时的编译器输出
 * ├── static-analysis.json    check_static 的结果
 * ├── custom-analysis.json    check_custom 的结果
 * ├── <case>-sanitizers.json  运行时检测的结果
 * └── work                    编译产物 program 和 program.instr
 */
struct submission {
    submission(const toolchain &tc,
               const std::filesystem::path &source_dir,
               const std::filesystem::path &output_dir,
               const std::filesystem::path &work_dir,
               std::vector<std::filesystem::path> sources,
               std::vector<std::filesystem::path> headers,
               std::vector<std::filesystem::path> others,
               std::vector<std::string> compiler_args);

    submission(const submission &) = delete;
    submission &operator=(const submission &) = delete;

    /**
     * @brief 运行 clang-tidy 静态检查，结果替换之前的静态检查结果
     * 部分文件无法分析时保留已得到的结果并附加 source-incomplete 诊断信息
     * @return 静态检查得到的诊断信息
     * @throw analysis_unavailable_error clang-tidy 无法调用
     * @throw analysis_parse_error clang-tidy 的输出无法解析
     * @throw configuration_error 编译选项与 clang-tidy 不兼容
     */
    std::vector<diagnostic> check_static();

    /**
     * @brief 运行结构化检查，结果替换之前的结构化检查结果
     * @return 该提交当前的所有诊断信息
     */
    std::vector<diagnostic> check_custom();

    /**
     * @brief 在一个测试点上运行选手程序并比较输出
     * 超时、内存超限、输出超限和崩溃都记录在返回的运行结果中，不会抛出异常
     * @param input_file 标准输入
     * @param expected_output_file 标准输出
     * @param actual_output_path 选手程序的输出写入的文件
     * @throw compilation_error 编译失败，此时不会产生运行结果
     * @throw sandbox_unavailable_error 隔离机制不可用
     * @throw execution_environment_error 沙箱出错或运行被取消，此时仍会记录一个结论为 SE 的运行结果
     */
    execution_result check_output(const std::filesystem::path &input_file,
                                  const std::filesystem::path &expected_output_file,
                                  const std::filesystem::path &actual_output_path,
                                  bool instrument = false);

    execution_result check_output(const std::filesystem::path &input_file,
                                  const std::filesystem::path &expected_output_file,
                                  const std::filesystem::path &actual_output_path,
                                  const check_options &options);

    /**
     * @brief 汇总已有的诊断信息和运行结果，不会触发任何检查
     */
    summary_report summary(const summary_options &options = summary_options()) const;

    /**
     * @brief 静态检查和结构化检查得到的诊断信息，按检查的调用顺序排列
     */
    std::vector<diagnostic> diagnostics() const;

    /**
     * @brief 所有运行结果，按 check_output 的调用顺序排列
     */
    std::vector<execution_result> results() const;

    /**
     * @brief 确保当前源代码和编译配置的编译产物存在，必要时进行编译
     * 并发调用时只有一个线程进行编译，其余线程等待并得到相同的产物或相同的编译错误
     * @throw compilation_error 编译失败或超时
     * @throw configuration_error 找不到编译器
     */
    std::shared_ptr<const compiled_artifact> ensure_artifact(bool instrument);

    /**
     * @brief 实际进行编译的次数
     */
    std::size_t compilation_count() const;

    const std::filesystem::path &source_dir() const;
    const std::filesystem::path &output_dir() const;
    const std::vector<std::filesystem::path> &sources() const;
    const std::vector<std::filesystem::path> &headers() const;
    const std::vector<std::filesystem::path> &other_files() const;

private:
    struct artifact_slot {
        std::mutex lock;
        std::size_t fingerprint = 0;
        std::shared_future<std::shared_ptr<const compiled_artifact>> current;
    };

    std::vector<std::string> compile_command(bool instrument) const;
    std::size_t fingerprint(const std::vector<std::string> &command) const;
    std::shared_ptr<const compiled_artifact> compile(bool instrument, const std::vector<std::string> &command, std::size_t fp);

    /**
     * @brief 运行一种分析工具并替换该来源之前的诊断信息
     */
    std::vector<diagnostic> run_analysis(diagnostic_source source, const std::string &check, const std::string &dump_file);
    void replace_diagnostics(diagnostic_source source, const std::vector<diagnostic> &found);

    /**
     * @brief 按调用顺序分配序号和测试点编号
     */
    std::pair<std::size_t, std::string> issue_test_case(const std::filesystem::path &input_file, const std::string &requested);

    /**
     * @brief 按序号插入运行结果，保持 check_output 的调用顺序
     */
    void store_result(std::size_t sequence, const execution_result &result);
    void write_json(const std::filesystem::path &path, const nlohmann::json &j) const;

    const toolchain &tc;
    std::filesystem::path src_dir, out_dir, work_dir;
    std::vector<std::filesystem::path> source_files, header_files, other;
    std::vector<std::string> args;

    artifact_slot slots[2];
    std::atomic<std::size_t> compilations{0};

    mutable std::mutex state_lock;
    std::vector<diagnostic> diags;
    std::vector<std::pair<std::size_t, execution_result>> runs;
    std::map<std::string, int> issued_cases;
    std::size_t issue_counter = 0;
};

}  // namespace hindsight
