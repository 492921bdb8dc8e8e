#pragma once

#include <filesystem>
#include <string>
#include "hindsight/catalog.hpp"
#include "hindsight/config.hpp"

/**
 * 测试用的临时目录和文件
 * 用法：
 * 1. auto dir = make_test_directory("ClangTidyTest");
 * 2. write_test_file(dir / "main.cpp", source);
 * 3. 测试结束后 remove_all(dir)
 */
namespace hindsight::test {

/**
 * @brief 创建一个空的临时目录，名称带有随机后缀，避免并行测试相互干扰
 */
std::filesystem::path make_test_directory(const std::string &name);

void write_test_file(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 写入一个可执行的 shell 脚本，用于模拟编译器和 clang-tidy
 */
void write_test_script(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 随源代码提供的规则目录
 */
const hindsight::rule_catalog &test_catalog();

/**
 * @brief 测试使用的工具链配置，规则目录和 runguard 指向构建目录
 */
hindsight::toolchain_config test_config();

/**
 * @brief 是否能在当前环境中运行沙箱（root 权限、cgroup v2、runguard）
 */
bool sandbox_available();

}  // namespace hindsight::test
