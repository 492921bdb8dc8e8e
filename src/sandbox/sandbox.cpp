#include "sandbox/sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <grp.h>
#include <pwd.h>
#include <unistd.h>
#include "cgroup.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

// runguard 自身的墙钟时间限制之外，再给它留出清理 cgroup 的时间
static const double RUNGUARD_GRACE_TIME = 5;

static string tail_of(const fs::path &path, size_t limit) {
    string content = read_file_content(path, "");
    if (content.size() > limit) content = content.substr(content.size() - limit);
    return content;
}

static int64_t to_kilobytes(int64_t bytes) {
    return bytes < 0 ? -1 : (bytes + 1023) / 1024;
}

void sandbox_context::probe(const sandbox_config &config) {
    if (geteuid() != 0)
        throw sandbox_unavailable_error("sandboxed execution requires root privileges");
    if (config.runguard.empty() || access(config.runguard.c_str(), X_OK) != 0)
        throw sandbox_unavailable_error(fmt::format("runguard is not executable at {}", config.runguard.string()));
    if (!control_group::supported())
        throw sandbox_unavailable_error(fmt::format("cgroup v2 with memory and pids controllers is not mounted at {}",
                                                    control_group::root().string()));
    if (!getpwnam(config.user.c_str()))
        throw configuration_error("unknown sandbox user " + config.user);
    if (!getgrnam(config.group.c_str()))
        throw configuration_error("unknown sandbox group " + config.group);
}

sandbox_context::sandbox_context(const sandbox_config &config)
    : config(config) {
    probe(config);

    string id = random_id();
    dir = config.work_root / ("run-" + id);
    cgroup = "/hindsight-" + id;

    error_code ec;
    fs::create_directories(config.work_root, ec);
    if (!ec) fs::create_directory(dir, ec);
    if (ec) throw execution_environment_error(fmt::format("unable to create run directory {}: {}", dir.string(), ec.message()));

    struct passwd *pwd = getpwnam(config.user.c_str());
    struct group *grp = getgrnam(config.group.c_str());
    if (chown(dir.c_str(), pwd->pw_uid, grp->gr_gid) != 0) {
        int err = errno;
        teardown();
        throw execution_environment_error(fmt::format("unable to chown run directory {}: {}", dir.string(), strerror(err)));
    }
    fs::permissions(dir, fs::perms::owner_all, ec);
    DLOG(INFO) << "Created sandbox run directory " << dir;
}

sandbox_context::~sandbox_context() {
    teardown();
}

const fs::path &sandbox_context::run_dir() const {
    return dir;
}

const string &sandbox_context::cgroup_name() const {
    return cgroup;
}

fs::path sandbox_context::stderr_file() const {
    return dir / "stderr";
}

runguard_result sandbox_context::run(const sandbox_request &request, const atomic_bool *cancelled) {
    fs::path program = dir / "program";
    error_code ec;
    fs::copy_file(request.program, program, fs::copy_options::overwrite_existing, ec);
    if (ec) throw execution_environment_error(fmt::format("unable to copy {} into run directory: {}", request.program.string(), ec.message()));
    fs::permissions(program, fs::perms::owner_all | fs::perms::group_read | fs::perms::group_exec |
                                 fs::perms::others_read | fs::perms::others_exec, ec);

    fs::path metafile = dir / "program.meta";
    fs::path logfile = dir / "runguard.log";
    const resource_limits &limits = request.limits;

    vector<string> argv = {
        config.runguard.string(),
        "--user=" + config.user,
        "--group=" + config.group,
        "--work-dir=" + dir.string(),
        "--cgroup=" + cgroup,
        fmt::format("--wall-time={}", limits.wall_time),
        fmt::format("--cpu-time={}", limits.cpu_time),
        fmt::format("--memory-limit={}", to_kilobytes(limits.memory)),
        fmt::format("--file-limit={}", to_kilobytes(limits.output)),
        fmt::format("--stack-limit={}", to_kilobytes(limits.stack)),
        fmt::format("--nproc={}", limits.processes),
        fmt::format("--nofile={}", limits.open_files),
        "--no-core-dumps",
        fmt::format("--stream-size={}", limits.output),
        "--standard-output-file=" + request.stdout_file.string(),
        "--standard-error-file=" + stderr_file().string(),
        "--out-meta=" + metafile.string()};
    if (!request.stdin_file.empty())
        argv.push_back("--standard-input-file=" + request.stdin_file.string());
    for (auto &[key, value] : request.env)
        argv.push_back(fmt::format("--variable={}={}", key, value));
    argv.push_back("--");
    argv.push_back("./program");
    for (auto &arg : request.args) argv.push_back(arg);

    process_options options;
    options.stderr_file = logfile;
    options.timeout = limits.wall_time + RUNGUARD_GRACE_TIME;
    options.cancelled = cancelled;

    LOG(INFO) << "Running " << request.program << " in sandbox " << cgroup;
    process_result proc;
    try {
        proc = exec_program(options, argv);
    } catch (const system_error &ex) {
        throw sandbox_unavailable_error(fmt::format("unable to start runguard: {}", ex.what()));
    }

    if (proc.cancelled)
        throw execution_environment_error("run cancelled");
    if (proc.timed_out)
        throw execution_environment_error(fmt::format("runguard did not finish in time: {}", tail_of(logfile, 2048)));
    if (!fs::exists(metafile))
        throw execution_environment_error(fmt::format("runguard exited without writing results: {}", tail_of(logfile, 2048)));

    runguard_result result = read_runguard_result(metafile);
    if (result.sandbox_unavailable)
        throw sandbox_unavailable_error(result.internal_error);
    if (!result.internal_error.empty())
        throw execution_environment_error("runguard: " + result.internal_error);
    if (result.exitcode < 0)
        throw execution_environment_error(fmt::format("runguard terminated abnormally: {}", tail_of(logfile, 2048)));
    return result;
}

void sandbox_context::teardown() {
    // cgroup 通常已经被 runguard 删除，只有 runguard 被杀死时才会残留
    // 由析构函数调用，文件系统操作都使用不抛出异常的版本
    error_code ec;
    control_group leftover(cgroup);
    if (!cgroup.empty() && fs::exists(leftover.directory(), ec)) {
        LOG(WARNING) << "Cleaning up leftover cgroup " << cgroup;
        if (leftover.kill_all()) {
            fs::remove(leftover.directory(), ec);
            if (ec) LOG(ERROR) << "Unable to remove cgroup " << cgroup << ": " << ec.message();
        }
    } else if (ec) {
        LOG(ERROR) << "Unable to inspect cgroup " << cgroup << ": " << ec.message();
    }

    if (!dir.empty()) {
        fs::remove_all(dir, ec);
        if (ec) LOG(ERROR) << "Unable to remove run directory " << dir << ": " << ec.message();
    }
}

}  // namespace hindsight
