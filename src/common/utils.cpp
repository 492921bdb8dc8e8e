#include "common/utils.hpp"
#include <fcntl.h>
#include <signal.h>
#include <sys/prctl.h>
#include <sys/stat.h>
#include <sys/wait.h>
#include <unistd.h>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <mutex>
#include <system_error>
#include <thread>

extern char **environ;

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

// 杀死进程组时 SIGTERM 与 SIGKILL 之间的间隔
static const auto KILL_DELAY = chrono::milliseconds(100);
static const auto POLL_INTERVAL = chrono::milliseconds(10);

static int open_redirect(const fs::path &path, int flags) {
    return open(path.c_str(), flags | O_CLOEXEC, 0644);
}

[[noreturn]] static void child_fail(int fd, int err) {
    // 将 errno 通过管道告诉父进程，管道在 exec 成功时会被自动关闭
    ssize_t written = write(fd, &err, sizeof(err));
    (void)written;
    _exit(127);
}

static void kill_group(pid_t pid) {
    kill(-pid, SIGTERM);
    this_thread::sleep_for(KILL_DELAY);
    kill(-pid, SIGKILL);
}

process_result exec_program(const process_options &options, const vector<string> &argv) {
    if (argv.empty()) throw system_error(make_error_code(errc::invalid_argument), "empty command line");

    // fork 之后子进程只能调用异步信号安全的函数，因此在 fork 之前准备好参数和环境变量
    vector<char *> args;
    for (auto &arg : argv) args.push_back(const_cast<char *>(arg.c_str()));
    args.push_back(nullptr);

    map<string, string> env_map;
    for (char **e = environ; e && *e; ++e) {
        string entry(*e);
        size_t eq = entry.find('=');
        if (eq == string::npos) continue;
        env_map[entry.substr(0, eq)] = entry.substr(eq + 1);
    }
    for (auto &[key, value] : options.env) env_map[key] = value;
    vector<string> env_list;
    for (auto &[key, value] : env_map) env_list.push_back(key + "=" + value);
    vector<char *> envp;
    for (auto &entry : env_list) envp.push_back(const_cast<char *>(entry.c_str()));
    envp.push_back(nullptr);

    int errpipe[2];
    if (pipe2(errpipe, O_CLOEXEC) == -1)
        throw system_error(errno, system_category(), "unable to create pipe");

    pid_t pid = fork();
    switch (pid) {
        case -1: {  // fork 失败
            int err = errno;
            close(errpipe[0]);
            close(errpipe[1]);
            throw system_error(err, system_category(), "unable to fork");
        }
        case 0: {  // 子进程
            close(errpipe[0]);
            setpgid(0, 0);
            // 父进程退出时子进程也要退出，避免遗留进程
            prctl(PR_SET_PDEATHSIG, SIGKILL);
            signal(SIGINT, SIG_IGN);

            int in = options.stdin_file.empty() ? open("/dev/null", O_RDONLY | O_CLOEXEC)
                                                : open_redirect(options.stdin_file, O_RDONLY);
            if (in < 0 || dup2(in, STDIN_FILENO) < 0) child_fail(errpipe[1], errno);
            if (!options.stdout_file.empty()) {
                int out = open_redirect(options.stdout_file, O_WRONLY | O_CREAT | O_TRUNC);
                if (out < 0 || dup2(out, STDOUT_FILENO) < 0) child_fail(errpipe[1], errno);
                if (options.merge_stderr && dup2(out, STDERR_FILENO) < 0) child_fail(errpipe[1], errno);
            }
            if (!options.merge_stderr && !options.stderr_file.empty()) {
                int err = open_redirect(options.stderr_file, O_WRONLY | O_CREAT | O_TRUNC);
                if (err < 0 || dup2(err, STDERR_FILENO) < 0) child_fail(errpipe[1], errno);
            }

            execvpe(args[0], args.data(), envp.data());
            child_fail(errpipe[1], errno);
        }
        default:  // 父进程
            break;
    }

    close(errpipe[1]);
    int child_errno = 0;
    ssize_t n;
    while ((n = read(errpipe[0], &child_errno, sizeof(child_errno))) == -1 && errno == EINTR)
        ;
    close(errpipe[0]);
    if (n > 0) {
        waitpid(pid, nullptr, 0);
        throw system_error(child_errno, system_category(), "unable to execute " + argv[0]);
    }

    process_result result;
    auto start = chrono::steady_clock::now();
    int status = 0;
    while (true) {
        pid_t ret = waitpid(pid, &status, WNOHANG);
        if (ret == pid) break;
        if (ret == -1) {
            if (errno == EINTR) continue;
            throw system_error(errno, system_category(), "waitpid failed");
        }

        bool cancel = options.cancelled && options.cancelled->load();
        bool timeout = options.timeout > 0 &&
                       chrono::duration<double>(chrono::steady_clock::now() - start).count() > options.timeout;
        if (cancel || timeout) {
            result.cancelled = cancel;
            result.timed_out = !cancel && timeout;
            LOG(WARNING) << "Killing process group " << pid << " of " << argv[0]
                         << (cancel ? " on cancellation" : " on timeout");
            kill_group(pid);
            while (waitpid(pid, &status, 0) == -1 && errno == EINTR)
                ;
            break;
        }
        this_thread::sleep_for(POLL_INTERVAL);
    }

    if (WIFEXITED(status)) {
        result.exitcode = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        result.signal = WTERMSIG(status);
    }
    return result;
}

fs::path find_executable(const string &name) {
    if (name.empty()) return {};
    if (name.find('/') != string::npos)
        return access(name.c_str(), X_OK) == 0 ? fs::path(name) : fs::path();

    string path = get_env("PATH", "/usr/local/bin:/usr/bin:/bin");
    stringstream ss(path);
    string dir;
    while (getline(ss, dir, ':')) {
        if (dir.empty()) continue;
        fs::path candidate = fs::path(dir) / name;
        struct stat st;
        if (stat(candidate.c_str(), &st) == 0 && S_ISREG(st.st_mode) && access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return {};
}

string get_env(const string &key, const string &def_value) {
    char *result = getenv(key.c_str());
    return !result ? def_value : string(result);
}

string random_id() {
    static mutex mut;
    static boost::uuids::random_generator generator;
    lock_guard<mutex> guard(mut);
    return boost::uuids::to_string(generator());
}

}  // namespace hindsight
