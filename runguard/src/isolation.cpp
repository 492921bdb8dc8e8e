#include "isolation.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <sched.h>
#include <seccomp.h>
#include <sys/mount.h>
#include <sys/resource.h>
#include <unistd.h>
#include <cmath>
#include <cstdlib>
#include <memory>
#include <stdexcept>

using namespace std;

sandbox_setup_error::sandbox_setup_error(int err, const string &what)
    : system_error(err, system_category(), what) {}

[[noreturn]] static void fail(const string &what) {
    throw system_error(errno, system_category(), what);
}

void enter_namespaces(const runguard_options &opt) {
    if (opt.no_isolation) {
        LOG(WARNING) << "isolation disabled, running without namespaces";
        return;
    }

    // 新 PID 命名空间的 init 进程退出时，内核会杀死命名空间内的所有进程
    int flags = CLONE_FILES | CLONE_NEWIPC | CLONE_NEWNET | CLONE_NEWPID | CLONE_NEWUTS | CLONE_SYSVSEM;
    if (unshare(flags) != 0)
        throw sandbox_setup_error(errno, "unable to unshare namespaces");
}

static void remount(const char *source, const char *target, const char *type, unsigned long flags, const string &what) {
    if (mount(source, target, type, flags, nullptr) != 0)
        throw sandbox_setup_error(errno, what);
}

void seal_filesystem(const runguard_options &opt) {
    if (opt.no_isolation) return;

    if (unshare(CLONE_NEWNS) != 0)
        throw sandbox_setup_error(errno, "unable to unshare mount namespace");
    // 挂载点的变化不能传播回宿主机
    remount(nullptr, "/", nullptr, MS_REC | MS_PRIVATE, "unable to make mounts private");
    remount("proc", "/proc", "proc", MS_NOSUID | MS_NODEV | MS_NOEXEC, "unable to mount /proc");
    if (!opt.work_dir.empty()) {
        const char *dir = opt.work_dir.c_str();
        remount(dir, dir, nullptr, MS_BIND | MS_REC, fmt::format("unable to bind work directory {}", opt.work_dir));
    }
    remount("/", "/", nullptr, MS_BIND | MS_REMOUNT | MS_RDONLY, "unable to remount / read-only");
}

static void limit_resource(int resource, rlim_t soft, rlim_t hard, const char *name) {
    struct rlimit lim = {soft, hard};
    if (setrlimit(resource, &lim) != 0) fail(fmt::format("setrlimit({})", name));
}

static rlim_t or_unlimited(int64_t value) {
    return value > 0 ? (rlim_t)value : RLIM_INFINITY;
}

static void prepare_environment(const runguard_options &opt) {
    if (!opt.inherit_env) {
        const char *path = getenv("PATH");
        string kept = path ? path : "/usr/bin:/bin";
        clearenv();
        setenv("PATH", kept.c_str(), 1);
    }
    for (auto &entry : opt.env) {
        auto eq = entry.find('=');
        if (eq != string::npos)
            setenv(entry.substr(0, eq).c_str(), entry.substr(eq + 1).c_str(), 1);
    }
}

static void apply_rlimits(const process_limits &limits) {
    if (limits.cpu.enabled) {
        // 软限制处内核发送 SIGXCPU，多留一秒的硬限制用于区分 CPU 超时和其他信号
        rlim_t seconds = (rlim_t)ceil(limits.cpu.hard);
        limit_resource(RLIMIT_CPU, seconds, seconds + 1, "RLIMIT_CPU");
    }

    // 内存由控制组限制，AddressSanitizer 需要保留数 TB 的虚拟地址空间
    limit_resource(RLIMIT_AS, RLIM_INFINITY, RLIM_INFINITY, "RLIMIT_AS");
    limit_resource(RLIMIT_DATA, RLIM_INFINITY, RLIM_INFINITY, "RLIMIT_DATA");

    rlim_t stack = or_unlimited(limits.stack);
    limit_resource(RLIMIT_STACK, stack, stack, "RLIMIT_STACK");
    if (limits.file_size > 0) limit_resource(RLIMIT_FSIZE, limits.file_size, limits.file_size, "RLIMIT_FSIZE");
    if (limits.open_files > 0) limit_resource(RLIMIT_NOFILE, limits.open_files, limits.open_files, "RLIMIT_NOFILE");
    if (!limits.core_dumps) limit_resource(RLIMIT_CORE, 0, 0, "RLIMIT_CORE");
}

static void drop_privileges(int uid, int gid) {
    if (gid >= 0) {
        gid_t groups[] = {(gid_t)gid};
        if (setgid(gid) != 0) fail("unable to set group id");
        if (setgroups(1, groups) != 0) fail("unable to clear supplementary groups");
    }
    if (setuid(uid >= 0 ? (uid_t)uid : getuid()) != 0) fail("unable to set user id");
    if (getuid() == 0 || geteuid() == 0)
        throw runtime_error("refusing to run the command as root");
}

void confine_process(const runguard_options &opt) {
    prepare_environment(opt);
    apply_rlimits(opt.limits);

    try {
        control_group(opt.cgroup).attach();
    } catch (const cgroup_exception &e) {
        throw sandbox_setup_error(EPERM, e.what());
    }

    // 独立的会话使选手程序和它的子进程可以一起被杀死
    if (setsid() == -1) fail("unable to create session");
    if (!opt.work_dir.empty() && chdir(opt.work_dir.c_str()) != 0)
        fail(fmt::format("unable to enter work directory {}", opt.work_dir));

    drop_privileges(opt.uid, opt.gid);
}

void install_syscall_filter(const runguard_options &opt) {
    if (opt.no_isolation) return;

    static const char *const DENIED[] = {
        "mount", "umount2", "pivot_root", "chroot", "reboot", "kexec_load", "kexec_file_load",
        "init_module", "finit_module", "delete_module", "swapon", "swapoff", "setns", "unshare",
        "bpf", "perf_event_open", "ptrace", "process_vm_readv", "process_vm_writev",
        "keyctl", "add_key", "request_key", "acct", "settimeofday", "clock_settime"};

    unique_ptr<void, decltype(&seccomp_release)> filter(seccomp_init(SCMP_ACT_ALLOW), &seccomp_release);
    if (!filter) throw sandbox_setup_error(EINVAL, "seccomp_init");

    for (const char *name : DENIED) {
        int nr = seccomp_syscall_resolve_name(name);
        if (nr == __NR_SCMP_ERROR) continue;  // 当前架构没有该系统调用
        if (int err = seccomp_rule_add(filter.get(), SCMP_ACT_ERRNO(EPERM), nr, 0))
            throw sandbox_setup_error(-err, fmt::format("seccomp_rule_add({})", name));
    }
    if (int err = seccomp_load(filter.get()))
        throw sandbox_setup_error(-err, "seccomp_load");
}
