#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace hindsight {

/**
 * @brief 分析引擎抛出的所有异常的基类
 * 保存异常信息、抛出时的调用栈，以及异常发生时正在执行的检查操作
 */
struct hindsight_exception : std::exception {
    hindsight_exception();
    explicit hindsight_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const hindsight_exception &ex);

    const char *what() const noexcept override;

    /**
     * @brief 引发异常的检查操作
     * 如 new_submission、check_static、check_custom、check_output
     */
    const std::string &check() const;

    /**
     * @brief 引发异常的测试点编号，与测试点无关时为空
     */
    const std::string &test_case() const;

    /**
     * @brief 记录异常发生的上下文
     * 在操作边界处捕获异常后调用，what() 将包含检查名和测试点编号
     */
    void set_context(const std::string &check, const std::string &test_case = "");

private:
    std::string message;
    std::string full_message;
    std::string check_name;
    std::string test_case_id;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 工具链或规则目录配置错误
 * 比如编译参数与源代码语言不匹配、规则目录格式错误，不应重试
 */
struct configuration_error : public hindsight_exception {
    explicit configuration_error(const std::string &message);
};

/**
 * @brief 提交的源代码目录或输出目录无法访问
 */
struct io_error : public hindsight_exception {
    explicit io_error(const std::string &message);
};

/**
 * @brief 选手程序编译失败
 * 此时不会产生任何 Execution Result，但仍可进行静态检查
 */
struct compilation_error : public hindsight_exception {
    compilation_error(const std::string &message, const std::string &error_log);

    /**
     * @brief 编译器的输出
     */
    std::string error_log;
};

/**
 * @brief 外部分析工具（clang-tidy、clang）无法调用
 */
struct analysis_unavailable_error : public hindsight_exception {
    explicit analysis_unavailable_error(const std::string &message);
};

/**
 * @brief 外部分析工具的输出无法解析
 */
struct analysis_parse_error : public hindsight_exception {
    explicit analysis_parse_error(const std::string &message);
};

/**
 * @brief 运行过程中沙箱或基础设施出错，比如磁盘已满、runguard 异常退出
 * 调用方可以重试本次运行
 */
struct execution_environment_error : public hindsight_exception {
    explicit execution_environment_error(const std::string &message);
};

/**
 * @brief 隔离机制不可用（没有特权、内核不支持 cgroup v2 或命名空间）
 * 评测系统绝不会退化为不隔离地运行选手程序
 */
struct sandbox_unavailable_error : public execution_environment_error {
    explicit sandbox_unavailable_error(const std::string &message);
};

}  // namespace hindsight
