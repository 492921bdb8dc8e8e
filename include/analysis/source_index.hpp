#pragma once

#include <cstddef>
#include <filesystem>
#include <map>
#include <string>
#include <utility>
#include <vector>

namespace hindsight {

/**
 * @brief 源文件的行索引，用于将字节偏移转换为行号和列号，以及取出某一行的内容
 * 文件在第一次访问时读入并缓存，无法读取的文件视为空文件
 */
struct source_index {
    /**
     * @brief 将字节偏移转换为行号和列号（均从 1 开始）
     * 列号按字节计算，多字节字符不会被特殊处理；超出文件末尾的偏移会被定位到最后一行
     */
    std::pair<int, int> locate(const std::filesystem::path &file, std::size_t offset);

    /**
     * @brief 第 line 行的内容（不含换行符），行号越界时返回空串
     */
    std::string line_of(const std::filesystem::path &file, int line);

private:
    struct file_lines {
        std::string content;
        std::vector<std::size_t> starts;
    };

    const file_lines &load(const std::filesystem::path &file);

    std::map<std::string, file_lines> files;
};

}  // namespace hindsight
