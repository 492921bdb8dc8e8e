#pragma once

#include <sys/select.h>
#include <cstddef>
#include <cstdint>
#include <string>

/**
 * @brief 把选手程序的 stdout 和 stderr 管道转存到文件
 * 超出 capture_limit 的部分被读出后丢弃，选手程序不会因管道写满而阻塞
 */
struct stream_relay {
    /**
     * @brief 一个被转存的输出流
     */
    struct channel {
        int pipe_read = -1;
        int pipe_write = -1;
        int file = -1;

        /**
         * @brief 从管道读到的字节数
         */
        size_t received = 0;

        /**
         * @brief 写入文件的字节数
         */
        size_t stored = 0;

        bool open() const {
            return pipe_read >= 0;
        }

        bool truncated() const {
            return stored < received;
        }
    };

    explicit stream_relay(int64_t capture_limit);
    ~stream_relay();

    stream_relay(const stream_relay &) = delete;
    stream_relay &operator=(const stream_relay &) = delete;

    /**
     * @brief 创建管道并打开目标文件，路径为空时写入 /dev/null
     * stderr 与 stdout 路径相同时共用同一个文件
     * @throw std::system_error
     */
    void open(const std::string &stdout_path, const std::string &stderr_path);

    /**
     * @brief 在选手程序进程中把管道的写端接到 fd 1 和 2
     * @throw std::system_error
     */
    void attach_child();

    /**
     * @brief 关闭本进程持有的管道写端，fork 之后调用
     */
    void close_write_ends();

    /**
     * @brief 关闭管道的两端，用于既不读也不写的 init 进程
     */
    void close_pipes();

    /**
     * @brief 把仍然打开的管道加入 fd 集合
     * @return 最大的 fd，没有打开的管道时返回 -1
     */
    int watch(fd_set &fds) const;

    /**
     * @brief 转存 fd 集合中可读的管道，读到 EOF 时关闭该管道
     * @throw std::system_error
     */
    void pump(const fd_set &fds);

    /**
     * @brief 选手程序结束后读完管道中剩余的数据
     */
    void drain();

    /**
     * @brief 关闭输出文件
     * @throw std::system_error
     */
    void finish();

    const channel &stdout_channel() const {
        return channels[0];
    }

    const channel &stderr_channel() const {
        return channels[1];
    }

private:
    void pump_one(channel &ch, int fd_number);

    int64_t limit;
    channel channels[2];
};
