#pragma once

#include <fstream>
#include <string>

/**
 * @brief runguard 的结果文件
 * 每行一个 "key: value"，由评测端的 read_runguard_result 解析
 */
struct meta_writer {
    void open(const std::string &path);

    template <typename T>
    void put(const char *key, const T &value) {
        if (out) out << key << ": " << value << std::endl;
    }

    /**
     * @brief 秒数统一保留三位小数
     */
    void put_seconds(const char *key, double seconds);

private:
    std::ofstream out;
};
