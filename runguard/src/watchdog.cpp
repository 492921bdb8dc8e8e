#include "watchdog.hpp"
#include <fcntl.h>
#include <fmt/core.h>
#include <glog/logging.h>
#include <signal.h>
#include <string.h>
#include <sys/prctl.h>
#include <sys/time.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>
#include <boost/algorithm/string/join.hpp>
#include <cmath>
#include <fstream>
#include <system_error>
#include <vector>
#include "isolation.hpp"

using namespace std;

static const struct timespec KILL_DELAY = {0, 100000000L};  // 0.1s

static volatile sig_atomic_t child_exited = 0;
static volatile sig_atomic_t pending_signal = -1;

template <typename... Args>
[[noreturn]] static void fail(const char *format, const Args &...args) {
    throw system_error(errno, system_category(), fmt::format(format, args...));
}

static void on_signal(int sig) {
    if (sig == SIGCHLD)
        child_exited = 1;
    else if (pending_signal == -1)
        pending_signal = sig;
}

static sigset_t supervised_signals() {
    sigset_t set;
    sigemptyset(&set);
    sigaddset(&set, SIGCHLD);
    sigaddset(&set, SIGALRM);
    sigaddset(&set, SIGTERM);
    return set;
}

/**
 * @brief 这些信号在 pselect 之外保持屏蔽，由主循环统一处理
 */
static void install_signal_handlers() {
    sigset_t blocked = supervised_signals();
    if (sigprocmask(SIG_BLOCK, &blocked, nullptr) != 0) fail("unable to block signals");

    struct sigaction action = {};
    action.sa_handler = on_signal;
    sigemptyset(&action.sa_mask);
    for (int sig : {SIGCHLD, SIGALRM, SIGTERM})
        if (sigaction(sig, &action, nullptr) != 0) fail("unable to install handler for signal {}", sig);
}

/**
 * @brief oom_score_adj 会被子进程继承
 * 通过 ssh 启动时它可能是负数，OOM Killer 就会先杀死别的进程，内存超限变成超时
 */
static void reset_oom_score() {
    const char *path = "/proc/self/oom_score_adj";
    int score = 0;
    {
        ifstream fin(path);
        if (!fin || !(fin >> score) || score >= 0) return;
    }
    LOG(INFO) << "resetting " << path << " from " << score << " to 0";
    ofstream fout(path);
    if (!(fout << 0 << endl)) fail("unable to write to {}", path);
}

[[noreturn]] static void report_failure(int errfd, bool sandbox, const char *what) {
    string message = fmt::format("{}{}", sandbox ? 'S' : 'I', what);
    ssize_t written = write(errfd, message.data(), message.size());
    (void)written;
    _exit(sandbox ? EXIT_SANDBOX_UNAVAILABLE : EXIT_INTERNAL_ERROR);
}

static double seconds(const struct timeval &tv) {
    return tv.tv_sec + tv.tv_usec * 1e-6;
}

watchdog::watchdog(runguard_options options)
    : opt(move(options)), relay(opt.streams.capture_limit) {
    meta.open(opt.meta_file);
}

void watchdog::prepare() {
    // 调用 runguard 的进程退出时，终止选手程序
    prctl(PR_SET_PDEATHSIG, SIGTERM);

    if (geteuid() != 0)
        throw sandbox_setup_error(EPERM, "runguard must be run as root");
    if (opt.uid < 0)
        throw runtime_error("a user to run the command as is required");
    if (!control_group::supported())
        throw sandbox_setup_error(ENOTSUP, fmt::format("cgroup v2 with memory and pids controllers is not mounted at {}",
                                                       control_group::root().string()));

    control_group::init();
    if (opt.cgroup.empty())
        opt.cgroup = fmt::format("/runguard_{}_{}", getpid(), (long)time(nullptr));
    control_group created(opt.cgroup);
    created.create(opt.quota);
    group = created;
    LOG(INFO) << "created cgroup " << opt.cgroup;

    reset_oom_score();
    relay.open(opt.streams.output, opt.streams.error);
    install_signal_handlers();
}

int watchdog::run() {
    prepare();

    int errpipe[2], statuspipe[2];
    if (pipe2(errpipe, O_CLOEXEC) != 0 || pipe2(statuspipe, O_CLOEXEC) != 0)
        fail("unable to create status pipes");

    enter_namespaces(opt);

    started = chrono::steady_clock::now();
    init_pid = fork();
    if (init_pid < 0) fail("unable to fork");
    if (init_pid == 0) {
        close(errpipe[0]);
        close(statuspipe[0]);
        init_process(errpipe[1], statuspipe[1]);
    }

    close(errpipe[1]);
    close(statuspipe[1]);
    relay.close_write_ends();
    arm_wall_timer();

    int status = supervise();
    finished = chrono::steady_clock::now();

    // 不隔离时选手程序的子进程可能还握着管道的写端
    group->kill_all();
    relay.drain();
    relay.finish();

    check_child_failure(errpipe[0]);
    // 状态管道中依次是选手程序的开始时间和等待状态，init 被杀死时可能都没有
    fcntl(statuspipe[0], F_SETFL, O_NONBLOCK);
    chrono::steady_clock::rep command_started;
    if (read(statuspipe[0], &command_started, sizeof(command_started)) == sizeof(command_started))
        started = chrono::steady_clock::time_point(chrono::steady_clock::duration(command_started));
    int command_status;
    if (read(statuspipe[0], &command_status, sizeof(command_status)) == sizeof(command_status))
        status = command_status;
    close(errpipe[0]);
    close(statuspipe[0]);

    int exitcode = decode_status(status);
    summarize(exitcode);
    return exitcode;
}

void watchdog::arm_wall_timer() {
    if (!opt.limits.wall.enabled) return;

    double whole;
    double fraction = modf(opt.limits.wall.hard, &whole);
    struct itimerval timer = {};
    timer.it_value.tv_sec = (time_t)whole;
    timer.it_value.tv_usec = (suseconds_t)(fraction * 1e6);
    if (setitimer(ITIMER_REAL, &timer, nullptr) != 0) fail("unable to set wall time timer");
    LOG(INFO) << fmt::format("hard wall time limit is {:.3f} seconds", opt.limits.wall.hard);
}

int watchdog::supervise() {
    sigset_t unblocked;
    sigemptyset(&unblocked);

    int status = 0;
    while (true) {
        fd_set readable;
        FD_ZERO(&readable);
        int highest = relay.watch(readable);

        // 屏蔽的信号只在 pselect 等待期间送达
        int ready = pselect(highest + 1, &readable, nullptr, nullptr, nullptr, &unblocked);
        if (ready < 0 && errno != EINTR) fail("unable to wait for command output");

        if (pending_signal != -1 && termination_signal == -1)
            abort_command(pending_signal);

        if (child_exited || termination_signal != -1) {
            child_exited = 0;
            pid_t pid = wait4(init_pid, &status, WNOHANG, &usage);
            if (pid < 0) fail("unable to wait for command");
            if (pid == init_pid) {
                init_pid = -1;
                return status;
            }
        }

        if (ready > 0) relay.pump(readable);
    }
}

void watchdog::abort_command(int sig) {
    termination_signal = sig;
    if (sig == SIGALRM) {
        wall_hard_limit = true;
        LOG(WARNING) << "hard wall time limit exceeded, aborting command";
    } else {
        LOG(WARNING) << "received signal " << sig << ", aborting command";
    }

    // 先让选手程序有机会正常退出，再杀死 init 进程和整个命名空间
    group->signal_all(SIGTERM);
    nanosleep(&KILL_DELAY, nullptr);
    if (kill(init_pid, SIGKILL) != 0 && errno != ESRCH)
        fail("unable to kill command");
    nanosleep(&KILL_DELAY, nullptr);
}

void watchdog::check_child_failure(int fd) {
    fcntl(fd, F_SETFL, O_NONBLOCK);
    char buffer[4096];
    ssize_t n = read(fd, buffer, sizeof(buffer) - 1);
    if (n <= 0) return;
    buffer[n] = '\0';
    if (buffer[0] == 'S') throw sandbox_setup_error(EPERM, buffer + 1);
    throw runtime_error(buffer + 1);
}

int watchdog::decode_status(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (!WIFSIGNALED(status)) throw runtime_error(fmt::format("unknown wait status {:#x}", status));

    int sig = WTERMSIG(status);
    if (termination_signal == -1) termination_signal = sig;
    if (sig == SIGXCPU) {
        cpu_hard_limit = true;
        LOG(WARNING) << "hard cpu time limit exceeded";
    } else {
        LOG(WARNING) << "command terminated by signal " << sig << " (" << strsignal(sig) << ")";
    }
    return 128 + sig;
}

void watchdog::summarize(int exitcode) {
    int64_t peak;
    try {
        peak = group->peak_memory();
    } catch (const cgroup_exception &e) {
        LOG(INFO) << "memory.peak unavailable (" << e.what() << "), using ru_maxrss";
        peak = (int64_t)usage.ru_maxrss * 1024;
    }
    meta.put("memory-bytes", peak);

    auto memory_events = group->stat("memory.events");
    if (memory_events["oom_kill"] > 0) {
        LOG(WARNING) << "command killed by the OOM killer";
        meta.put("memory-result", "oom");
    } else if (memory_events["max"] > 0) {
        LOG(INFO) << "memory limit reached " << memory_events["max"] << " times";
        meta.put("memory-result", "max");
    } else {
        meta.put("memory-result", "");
    }

    auto pids_events = group->stat("pids.events");
    if (pids_events["max"] > 0)
        LOG(WARNING) << "process limit reached " << pids_events["max"] << " times";

    double user, sys, cpu;
    auto cpu_stat = group->stat("cpu.stat");
    if (cpu_stat.count("usage_usec")) {
        user = cpu_stat["user_usec"] / 1e6;
        sys = cpu_stat["system_usec"] / 1e6;
        cpu = cpu_stat["usage_usec"] / 1e6;
    } else {
        user = seconds(usage.ru_utime);
        sys = seconds(usage.ru_stime);
        cpu = user + sys;
    }
    double wall = chrono::duration<double>(finished - started).count();
    LOG(INFO) << fmt::format("wall {:.3f}s, user {:.3f}s, sys {:.3f}s, cpu {:.3f}s", wall, user, sys, cpu);

    release_cgroup();

    meta.put("exitcode", exitcode);
    if (termination_signal != -1) meta.put("signal", termination_signal);
    meta.put_seconds("wall-time", wall);
    meta.put_seconds("user-time", user);
    meta.put_seconds("sys-time", sys);
    meta.put_seconds("cpu-time", cpu);

    const process_limits &limits = opt.limits;
    bool soft_exceeded = (limits.wall.enabled && wall > limits.wall.soft) || (limits.cpu.enabled && cpu > limits.cpu.soft);
    if (wall_hard_limit || cpu_hard_limit)
        meta.put("time-result", "hard-timelimit");
    else if (soft_exceeded)
        meta.put("time-result", "soft-timelimit");
    else
        meta.put("time-result", "");

    const auto &out = relay.stdout_channel(), &err = relay.stderr_channel();
    int64_t capture = opt.streams.capture_limit;
    if (capture >= 0) {
        vector<string> truncated;
        if (out.truncated()) truncated.push_back("stdout");
        if (err.truncated()) truncated.push_back("stderr");
        meta.put("output-truncated", boost::algorithm::join(truncated, ","));
    }

    bool output_exceeded = termination_signal == SIGXFSZ || (capture >= 0 && out.received > (size_t)capture);
    if (output_exceeded) LOG(WARNING) << "output limit exceeded";
    meta.put("output-result", output_exceeded ? "exceeded" : "");
    meta.put("stdout-bytes", out.received);
    meta.put("stderr-bytes", err.received);
}

void watchdog::release_cgroup() {
    if (!group) return;
    // 删除控制组之前组内必须没有进程
    if (group->kill_all()) {
        try {
            group->remove();
        } catch (const cgroup_exception &e) {
            LOG(ERROR) << "unable to delete cgroup " << group->name() << ": " << e.what();
        }
    }
    group.reset();
}

int watchdog::abandon(const string &reason, bool sandbox) {
    sigset_t blocked = supervised_signals();
    sigprocmask(SIG_BLOCK, &blocked, nullptr);

    LOG(ERROR) << (sandbox ? "sandbox unavailable: " : "") << reason;
    meta.put("internal-error", reason);
    if (sandbox) meta.put("sandbox-unavailable", 1);

    // init 退出后内核会杀死整个 PID 命名空间
    if (init_pid > 0) {
        if (kill(init_pid, SIGKILL) != 0 && errno != ESRCH)
            LOG(ERROR) << "unable to kill command: " << strerror(errno);
        nanosleep(&KILL_DELAY, nullptr);
    }
    release_cgroup();
    return sandbox ? EXIT_SANDBOX_UNAVAILABLE : EXIT_INTERNAL_ERROR;
}

void watchdog::init_process(int errfd, int statusfd) {
    try {
        prctl(PR_SET_PDEATHSIG, SIGKILL);
        signal(SIGCHLD, SIG_DFL);
        sigset_t none;
        sigemptyset(&none);
        sigprocmask(SIG_SETMASK, &none, nullptr);

        seal_filesystem(opt);

        // 墙钟时间从这里开始计算，不包括挂载文件系统的时间
        auto command_started = chrono::steady_clock::now().time_since_epoch().count();
        if (write(statusfd, &command_started, sizeof(command_started)) != sizeof(command_started))
            fail("unable to report start time");

        pid_t command = fork();
        if (command < 0) fail("unable to fork command");
        if (command == 0) command_process(errfd);
        relay.close_pipes();

        // 命名空间中的孤儿进程都会成为 init 的子进程，一并回收
        int status = 0;
        while (true) {
            pid_t pid = wait(&status);
            if (pid == command) break;
            if (pid < 0 && errno != EINTR) fail("unable to wait for command");
        }
        ssize_t written = write(statusfd, &status, sizeof(status));
        (void)written;
        _exit(0);
    } catch (const sandbox_setup_error &e) {
        report_failure(errfd, true, e.what());
    } catch (const exception &e) {
        report_failure(errfd, false, e.what());
    }
}

void watchdog::command_process(int errfd) {
    try {
        const string &input = opt.streams.input;
        int fd = open(input.empty() ? "/dev/null" : input.c_str(), O_RDONLY);
        if (fd < 0 || dup2(fd, STDIN_FILENO) < 0)
            fail("unable to open input file {}", input.empty() ? "/dev/null" : input);
        if (fd != STDIN_FILENO) close(fd);

        confine_process(opt);
        relay.attach_child();
        install_syscall_filter(opt);

        vector<char *> argv;
        for (auto &arg : opt.command) argv.push_back(arg.data());
        argv.push_back(nullptr);
        execvp(argv[0], argv.data());
        fail("unable to start command {}", opt.command[0]);
    } catch (const sandbox_setup_error &e) {
        report_failure(errfd, true, e.what());
    } catch (const exception &e) {
        report_failure(errfd, false, e.what());
    }
}
