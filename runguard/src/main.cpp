#include <glog/logging.h>
#include <grp.h>
#include <pwd.h>
#include <boost/algorithm/string/classification.hpp>
#include <boost/algorithm/string/predicate.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/program_options.hpp>
#include <cmath>
#include <iostream>
#include "isolation.hpp"
#include "watchdog.hpp"

using namespace std;
namespace po = boost::program_options;

/**
 * @brief 解析 "soft:hard" 或 "seconds" 形式的时间限制
 */
void validate(boost::any &v, const vector<string> &values, time_limit *, int) {
    po::validators::check_first_occurrence(v);
    const string &text = po::validators::get_single_string(values);

    time_limit limit;
    auto colon = text.find(':');
    try {
        limit.soft = boost::lexical_cast<double>(text.substr(0, colon));
        limit.hard = colon == string::npos ? limit.soft : boost::lexical_cast<double>(text.substr(colon + 1));
    } catch (const boost::bad_lexical_cast &) {
        throw po::validation_error(po::validation_error::invalid_option_value);
    }
    if (!isfinite(limit.soft) || !isfinite(limit.hard) || limit.soft < 0 || limit.hard < limit.soft)
        throw po::validation_error(po::validation_error::invalid_option_value);
    limit.enabled = true;
    v = limit;
}

/**
 * @brief 用户名或用户编号
 * @throw std::runtime_error 用户不存在
 */
static int resolve_user(const string &name) {
    if (!name.empty() && boost::algorithm::all(name, boost::algorithm::is_digit()))
        return boost::lexical_cast<int>(name);
    struct passwd *pw = getpwnam(name.c_str());
    if (!pw) throw runtime_error("unknown user " + name);
    return (int)pw->pw_uid;
}

/**
 * @brief 用户组名或用户组编号
 * @throw std::runtime_error 用户组不存在
 */
static int resolve_group(const string &name) {
    if (!name.empty() && boost::algorithm::all(name, boost::algorithm::is_digit()))
        return boost::lexical_cast<int>(name);
    struct group *gr = getgrnam(name.c_str());
    if (!gr) throw runtime_error("unknown group " + name);
    return (int)gr->gr_gid;
}

/**
 * @brief 以 KB 为单位的选项转换为字节，负数表示不限制
 */
static int64_t kilobytes(const po::variables_map &vm, const char *key, int64_t fallback) {
    if (!vm.count(key)) return fallback;
    int64_t value = vm[key].as<int64_t>();
    return value < 0 ? -1 : value * 1024;
}

template <typename T>
static void take(const po::variables_map &vm, const char *key, T &target) {
    if (vm.count(key)) target = vm[key].as<T>();
}

int main(int argc, const char *argv[]) {
    google::InitGoogleLogging(argv[0]);
    FLAGS_logtostderr = true;

    po::options_description desc("runguard options");
    // clang-format off
    desc.add_options()
        ("user,u", po::value<string>(), "run the command as this user (name or id)")
        ("group,g", po::value<string>(), "run the command under this group (name or id)")
        ("work-dir,d", po::value<string>(), "working directory of the command, the only writable part of the file system")
        ("cgroup,c", po::value<string>(), "name of the control group to create for the command")
        ("wall-time,T", po::value<time_limit>(), "wall clock time limit in seconds, as soft[:hard]")
        ("cpu-time,t", po::value<time_limit>(), "CPU time limit in seconds, as soft[:hard]")
        ("memory-limit,m", po::value<int64_t>(), "memory limit in KB")
        ("file-limit,f", po::value<int64_t>(), "maximum size of files created by the command in KB")
        ("stack-limit,s", po::value<int64_t>(), "stack size limit in KB, -1 for unlimited")
        ("nproc,p", po::value<int64_t>(), "maximum number of processes alive at the same time")
        ("nofile,n", po::value<int64_t>(), "maximum number of open file descriptors")
        ("no-core-dumps", "disable core dumps")
        ("no-isolation", "do not create namespaces, remount file systems or load seccomp filters (debugging only)")
        ("standard-input-file,i", po::value<string>(), "file to use as standard input")
        ("standard-output-file,o", po::value<string>(), "file to save standard output to")
        ("standard-error-file,e", po::value<string>(), "file to save standard error to")
        ("stream-size", po::value<int64_t>(), "keep at most this many bytes of each output stream")
        ("environment,E", "keep the environment of runguard, otherwise only PATH is kept")
        ("variable,V", po::value<vector<string>>(), "extra environment variable as KEY=VALUE, may be repeated")
        ("out-meta,M", po::value<string>(), "file to write the run results to")
        ("cmd", po::value<vector<string>>()->composing()->required(), "command to run")
        ("help", "display this help text");
    // clang-format on

    po::positional_options_description positional;
    positional.add("cmd", -1);

    runguard_options opt;
    po::variables_map vm;
    try {
        po::store(po::command_line_parser(argc, argv).options(desc).positional(positional).run(), vm);
        if (vm.count("help")) {
            cout << "Usage: " << argv[0] << " [options] -- command [args...]" << endl
                 << "Runs a command as an unprivileged user inside namespaces and a cgroup, requires root." << endl
                 << desc << endl;
            return 0;
        }
        po::notify(vm);

        if (vm.count("user")) opt.uid = resolve_user(vm["user"].as<string>());
        if (vm.count("group")) opt.gid = resolve_group(vm["group"].as<string>());
    } catch (const po::error &e) {
        cerr << e.what() << endl << endl << desc << endl;
        return EXIT_INTERNAL_ERROR;
    } catch (const runtime_error &e) {
        cerr << e.what() << endl;
        return EXIT_INTERNAL_ERROR;
    }

    take(vm, "cgroup", opt.cgroup);
    take(vm, "work-dir", opt.work_dir);
    take(vm, "wall-time", opt.limits.wall);
    take(vm, "cpu-time", opt.limits.cpu);
    take(vm, "nofile", opt.limits.open_files);
    take(vm, "nproc", opt.quota.processes);
    opt.quota.memory = kilobytes(vm, "memory-limit", -1);
    opt.limits.file_size = kilobytes(vm, "file-limit", -1);
    opt.limits.stack = kilobytes(vm, "stack-limit", -1);
    opt.limits.core_dumps = !vm.count("no-core-dumps");
    opt.no_isolation = vm.count("no-isolation") > 0;
    take(vm, "standard-input-file", opt.streams.input);
    take(vm, "standard-output-file", opt.streams.output);
    take(vm, "standard-error-file", opt.streams.error);
    take(vm, "stream-size", opt.streams.capture_limit);
    opt.inherit_env = vm.count("environment") > 0;
    take(vm, "variable", opt.env);
    take(vm, "out-meta", opt.meta_file);
    opt.command = vm["cmd"].as<vector<string>>();

    watchdog dog(opt);
    try {
        return dog.run();
    } catch (const sandbox_setup_error &e) {
        return dog.abandon(e.what(), true);
    } catch (const cgroup_exception &e) {
        return dog.abandon(e.what(), true);
    } catch (const exception &e) {
        return dog.abandon(e.what(), false);
    }
}
