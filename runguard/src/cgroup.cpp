#include "cgroup.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <libcgroup.h>
#include <signal.h>
#include <time.h>
#include <fstream>
#include <memory>
#include <sstream>
#include <system_error>
#include <vector>

using namespace std;
namespace fs = std::filesystem;

static string describe_cgroup_error(const string &call, int err) {
    // ECGOTHER 表示真正的错误码保存在 errno 中
    const char *reason = err == ECGOTHER ? cgroup_strerror(cgroup_get_last_errno()) : cgroup_strerror(err);
    return fmt::format("{}: {}", call, reason);
}

cgroup_exception::cgroup_exception(const string &call, int err)
    : runtime_error(describe_cgroup_error(call, err)) {}

void cgroup_exception::check(const string &call, int err) {
    if (err != 0) throw cgroup_exception(call, err);
}

namespace {

struct cgroup_deleter {
    void operator()(struct cgroup *cg) const {
        cgroup_free(&cg);
    }
};

using cgroup_handle = unique_ptr<struct cgroup, cgroup_deleter>;

cgroup_handle open_handle(const string &name) {
    cgroup_handle handle(cgroup_new_cgroup(name.c_str()));
    if (!handle) throw cgroup_exception(fmt::format("cgroup_new_cgroup({})", name), ECGOTHER);
    return handle;
}

struct cgroup_controller *require_controller(struct cgroup *cg, const char *name, bool existing) {
    struct cgroup_controller *ctrl = existing ? cgroup_get_controller(cg, name) : cgroup_add_controller(cg, name);
    if (!ctrl) throw cgroup_exception(fmt::format("{}({})", existing ? "cgroup_get_controller" : "cgroup_add_controller", name), ECGOTHER);
    return ctrl;
}

void set_value(struct cgroup_controller *ctrl, const char *key, int64_t value) {
    cgroup_exception::check(fmt::format("cgroup_add_value_int64({}, {})", key, value),
                            cgroup_add_value_int64(ctrl, key, value));
}

vector<pid_t> members(const fs::path &dir) {
    vector<pid_t> procs;
    ifstream fin(dir / "cgroup.procs");
    pid_t pid;
    while (fin >> pid) procs.push_back(pid);
    return procs;
}

}  // namespace

control_group::control_group(string name) : group_name(move(name)) {}

void control_group::create(const cgroup_quota &quota) {
    cgroup_handle cg = open_handle(group_name);

    struct cgroup_controller *memory = require_controller(cg.get(), "memory", false);
    if (quota.memory >= 0) {
        set_value(memory, "memory.max", quota.memory);
        // 允许交换时内存超限会表现为运行缓慢
        set_value(memory, "memory.swap.max", 0);
    }
    if (quota.processes > 0)
        set_value(require_controller(cg.get(), "pids", false), "pids.max", quota.processes);
    require_controller(cg.get(), "cpu", false);

    cgroup_exception::check(fmt::format("cgroup_create_cgroup({})", group_name), cgroup_create_cgroup(cg.get(), 1));
}

void control_group::attach() const {
    cgroup_handle cg = open_handle(group_name);
    cgroup_exception::check("cgroup_get_cgroup", cgroup_get_cgroup(cg.get()));
    cgroup_exception::check("cgroup_attach_task", cgroup_attach_task(cg.get()));
}

int64_t control_group::peak_memory() const {
    cgroup_handle cg = open_handle(group_name);
    cgroup_exception::check("cgroup_get_cgroup", cgroup_get_cgroup(cg.get()));
    int64_t peak = -1;
    cgroup_exception::check("cgroup_get_value_int64(memory.peak)",
                            cgroup_get_value_int64(require_controller(cg.get(), "memory", true), "memory.peak", &peak));
    return peak;
}

map<string, int64_t> control_group::stat(const string &file) const {
    map<string, int64_t> entries;
    ifstream fin(directory() / file);
    string line, key;
    int64_t value;
    while (getline(fin, line)) {
        istringstream ss(line);
        if (ss >> key >> value) entries[key] = value;
    }
    return entries;
}

void control_group::signal_all(int sig) const {
    for (pid_t pid : members(directory())) kill(pid, sig);
}

bool control_group::kill_all() const {
    const struct timespec poll_interval = {0, 10000000L};
    fs::path dir = directory();
    // 在析构函数中调用，不能抛出 filesystem_error
    error_code ec;
    if (!fs::exists(dir, ec)) return !ec;

    bool kill_file = false;
    if (fs::exists(dir / "cgroup.kill", ec)) {
        ofstream fout(dir / "cgroup.kill");
        kill_file = static_cast<bool>(fout << "1" << endl);
    }

    // 进程真正退出后才会从 cgroup.procs 中消失
    for (int round = 0; round < 200; ++round) {
        vector<pid_t> procs = members(dir);
        if (procs.empty()) return true;
        if (!kill_file)
            for (pid_t pid : procs) kill(pid, SIGKILL);
        nanosleep(&poll_interval, nullptr);
    }

    LOG(ERROR) << "cgroup " << group_name << " still has processes after SIGKILL";
    return false;
}

void control_group::remove() const {
    cgroup_handle cg = open_handle(group_name);
    cgroup_exception::check("cgroup_get_cgroup", cgroup_get_cgroup(cg.get()));
    cgroup_exception::check(fmt::format("cgroup_delete_cgroup_ext({})", group_name),
                            cgroup_delete_cgroup_ext(cg.get(), CGFLAG_DELETE_IGNORE_MIGRATION | CGFLAG_DELETE_RECURSIVE));
}

const string &control_group::name() const {
    return group_name;
}

fs::path control_group::directory() const {
    return root() / fs::path(group_name).relative_path();
}

const fs::path &control_group::root() {
    static const fs::path mount_point = "/sys/fs/cgroup";
    return mount_point;
}

bool control_group::supported() {
    ifstream fin(root() / "cgroup.controllers");
    bool memory = false, pids = false;
    string controller;
    while (fin >> controller) {
        memory = memory || controller == "memory";
        pids = pids || controller == "pids";
    }
    return memory && pids;
}

void control_group::init() {
    cgroup_exception::check("cgroup_init", cgroup_init());
}
