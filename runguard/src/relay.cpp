#include "relay.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <sys/stat.h>
#include <unistd.h>
#include <algorithm>
#include <cerrno>
#include <system_error>

using namespace std;

static const size_t CHUNK_SIZE = 4096;

template <typename... Args>
[[noreturn]] static void fail(const char *format, const Args &...args) {
    throw system_error(errno, system_category(), fmt::format(format, args...));
}

static int open_target(const string &path) {
    // O_CLOEXEC 使选手程序无法绕过截断直接写入输出文件
    int fd = path.empty() ? open("/dev/null", O_WRONLY | O_CLOEXEC)
                          : open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, S_IRUSR | S_IWUSR | S_IRGRP | S_IROTH);
    if (fd < 0) fail("unable to open output file '{}'", path.empty() ? "/dev/null" : path);
    return fd;
}

static void write_all(int fd, const char *data, size_t size) {
    while (size > 0) {
        ssize_t n = write(fd, data, size);
        if (n < 0) {
            if (errno == EINTR) continue;
            fail("unable to write to fd {}", fd);
        }
        data += n;
        size -= n;
    }
}

stream_relay::stream_relay(int64_t capture_limit) : limit(capture_limit) {}

stream_relay::~stream_relay() {
    for (auto &ch : channels) {
        if (ch.pipe_read >= 0) close(ch.pipe_read);
        if (ch.pipe_write >= 0) close(ch.pipe_write);
    }
    if (channels[0].file >= 0) close(channels[0].file);
    if (channels[1].file >= 0 && channels[1].file != channels[0].file) close(channels[1].file);
}

void stream_relay::open(const string &stdout_path, const string &stderr_path) {
    for (auto &ch : channels) {
        int fds[2];
        if (pipe2(fds, O_CLOEXEC) != 0) fail("unable to create output pipe");
        ch.pipe_read = fds[0];
        ch.pipe_write = fds[1];
    }

    channels[0].file = open_target(stdout_path);
    if (!stderr_path.empty() && stderr_path == stdout_path)
        channels[1].file = channels[0].file;
    else
        channels[1].file = open_target(stderr_path);
}

void stream_relay::attach_child() {
    for (int i = 0; i < 2; ++i) {
        channel &ch = channels[i];
        if (dup2(ch.pipe_write, STDOUT_FILENO + i) < 0) fail("unable to redirect fd {}", STDOUT_FILENO + i);
        if (close(ch.pipe_write) != 0 || close(ch.pipe_read) != 0) fail("unable to close pipe of fd {}", STDOUT_FILENO + i);
        ch.pipe_read = ch.pipe_write = -1;
    }
}

void stream_relay::close_write_ends() {
    for (auto &ch : channels) {
        if (ch.pipe_write >= 0 && close(ch.pipe_write) != 0) fail("unable to close pipe");
        ch.pipe_write = -1;
    }
}

void stream_relay::close_pipes() {
    close_write_ends();
    for (auto &ch : channels) {
        if (ch.pipe_read >= 0) close(ch.pipe_read);
        ch.pipe_read = -1;
    }
}

int stream_relay::watch(fd_set &fds) const {
    int highest = -1;
    for (auto &ch : channels) {
        if (!ch.open()) continue;
        FD_SET(ch.pipe_read, &fds);
        highest = max(highest, ch.pipe_read);
    }
    return highest;
}

void stream_relay::pump(const fd_set &fds) {
    for (int i = 0; i < 2; ++i)
        if (channels[i].open() && FD_ISSET(channels[i].pipe_read, &fds))
            pump_one(channels[i], STDOUT_FILENO + i);
}

void stream_relay::pump_one(channel &ch, int fd_number) {
    char buffer[CHUNK_SIZE];
    size_t room = CHUNK_SIZE;
    if (limit >= 0) room = min(room, (size_t)limit - min(ch.stored, (size_t)limit));

    // 达到上限后仍然要读出数据，只是不再写入文件
    ssize_t n = read(ch.pipe_read, buffer, room > 0 ? room : CHUNK_SIZE);
    if (n < 0) {
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return;
        fail("unable to read output of fd {}", fd_number);
    }
    if (n == 0) {
        if (close(ch.pipe_read) != 0) fail("unable to close pipe of fd {}", fd_number);
        ch.pipe_read = -1;
        return;
    }

    ch.received += n;
    if (room > 0) {
        write_all(ch.file, buffer, n);
        ch.stored += n;
        if (limit >= 0 && ch.stored == (size_t)limit)
            LOG(INFO) << "output of fd " << fd_number << " reached " << limit << " bytes";
    }
}

void stream_relay::drain() {
    // 写端都已关闭，管道读到 EOF 为止
    while (true) {
        fd_set fds;
        FD_ZERO(&fds);
        if (watch(fds) < 0) return;
        pump(fds);
    }
}

void stream_relay::finish() {
    int out = channels[0].file, err = channels[1].file;
    channels[0].file = channels[1].file = -1;
    if (out >= 0 && close(out) != 0) fail("unable to close output file of fd {}", STDOUT_FILENO);
    if (err >= 0 && err != out && close(err) != 0) fail("unable to close output file of fd {}", STDERR_FILENO);
}
