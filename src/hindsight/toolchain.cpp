#include "hindsight/toolchain.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <unistd.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/assign.hpp>
#include <set>
#include "analysis/clang_tidy.hpp"
#include "analysis/sanitizers.hpp"
#include "analysis/structural.hpp"
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "hindsight/submission.hpp"

#ifndef HINDSIGHT_DEFAULT_CATALOG
#define HINDSIGHT_DEFAULT_CATALOG "/usr/local/share/hindsight/catalog.json"
#endif

#ifndef HINDSIGHT_DEFAULT_RUNGUARD
#define HINDSIGHT_DEFAULT_RUNGUARD "/usr/local/bin/runguard"
#endif

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

// 规则目录中以这些前缀开头的规则由 clang-tidy 提供
static const vector<string> CLANG_TIDY_PREFIXES = boost::assign::list_of
    ("bugprone-")("cert-")("clang-analyzer-")("cppcoreguidelines-")("misc-")("modernize-")
    ("performance-")("readability-")("hicpp-")("google-")("llvm-")("portability-")("concurrency-");

static const set<string> SOURCE_EXTENSIONS = {".cpp", ".cc", ".cxx", ".c++", ".c"};
static const set<string> HEADER_EXTENSIONS = {".h", ".hpp", ".hh", ".hxx"};

// 这些选项会改变编译产物的类型或位置，由 submission 自行决定
static const set<string> RESERVED_ARGUMENTS = {"-o", "-c", "-E", "-S"};

static rule_catalog load_catalog(const toolchain_config &config) {
    fs::path path = config.catalog_path.empty() ? fs::path(HINDSIGHT_DEFAULT_CATALOG) : config.catalog_path;
    LOG(INFO) << "Loading rule catalog from " << path;
    return rule_catalog::load(path);
}

static fs::path detect_compiler(const toolchain_config &config) {
    vector<string> candidates;
    if (!config.compiler.empty()) {
        candidates.push_back(config.compiler);
    } else {
        string cxx = get_env("CXX", "");
        if (!cxx.empty()) candidates.push_back(cxx);
        candidates.insert(candidates.end(), {"c++", "g++", "clang++"});
    }

    for (auto &candidate : candidates) {
        fs::path path = find_executable(candidate);
        if (!path.empty()) return path;
    }
    LOG(WARNING) << "No C++ compiler found, tried " << boost::algorithm::join(candidates, ", ");
    return {};
}

static vector<string> detect_checks(const toolchain_config &config, const rule_catalog &catalog) {
    if (!config.enabled_rules.empty()) return config.enabled_rules;

    vector<string> checks;
    for (auto rule : catalog.rules()) {
        for (auto &prefix : CLANG_TIDY_PREFIXES) {
            if (boost::algorithm::starts_with(rule->id, prefix)) {
                checks.push_back(rule->id);
                break;
            }
        }
    }
    return checks;
}

static fs::path detect_runguard(const toolchain_config &config) {
    if (!config.runguard_path.empty()) return config.runguard_path;
    return get_env("RUNGUARD", HINDSIGHT_DEFAULT_RUNGUARD);
}

toolchain::toolchain(const toolchain_config &config)
    : toolchain(config, load_catalog(config)) {}

toolchain::toolchain(const toolchain_config &config, rule_catalog catalog)
    : cfg(config), rules(move(catalog)) {
    compiler_path = detect_compiler(cfg);
    checks = detect_checks(cfg, rules);

    static_analyzer = make_unique<clang_tidy_analyzer>(cfg.clang_tidy, checks, cfg.compile_time_limit);
    structural = make_unique<structural_analyzer>(cfg.clang, cfg.compile_time_limit, cfg.limits.stack);
    sanitizers = make_unique<sanitizer_analyzer>(rules);

    sandbox_config sandbox;
    sandbox.runguard = detect_runguard(cfg);
    sandbox.work_root = cfg.work_root;
    sandbox.user = cfg.sandbox_user;
    sandbox.group = cfg.sandbox_group;
    exec = make_unique<sandboxed_executor>(sandbox, cfg.capture_limit);

    compare = make_comparator(cfg.comparison);

    LOG(INFO) << fmt::format("Toolchain ready: compiler {}, {} rules, {} clang-tidy checks, runguard {}",
                             compiler_path.empty() ? "<none>" : compiler_path.string(),
                             rules.size(), checks.size(), sandbox.runguard.string());
}

/**
 * @brief 读取外部工具 --version 输出的第一行
 * @return 工具无法运行时返回空串
 */
static string tool_version(const fs::path &executable) {
    fs::path output = fs::temp_directory_path() / ("hindsight-version-" + random_id());
    defer {
        error_code ec;
        fs::remove(output, ec);
    };

    process_options options;
    options.stdout_file = output;
    options.merge_stderr = true;
    options.timeout = 10;
    process_result result;
    try {
        result = call_process_opt(options, executable, "--version");
    } catch (system_error &e) {
        LOG(WARNING) << "Unable to run " << executable << ": " << e.what();
        return "";
    }
    if (result.exitcode != 0) return "";

    string content = read_file_content(output, "");
    string first_line = content.substr(0, content.find('\n'));
    boost::algorithm::trim(first_line);
    return first_line;
}

static string describe_tool(const string &name) {
    fs::path path = find_executable(name);
    if (path.empty()) return "no (not found)";
    string version = tool_version(path);
    if (version.empty()) return fmt::format("no ({} is not runnable)", path.string());
    return fmt::format("yes ({})", version);
}

vector<pair<string, string>> toolchain::dump_info() const {
    vector<pair<string, string>> info;
    info.emplace_back("compiler", compiler_path.empty() ? "no (not found)" : describe_tool(compiler_path.string()));
    info.emplace_back("clang-tidy", describe_tool(cfg.clang_tidy));
    info.emplace_back("clang", describe_tool(cfg.clang));
    try {
        exec->probe();
        info.emplace_back("sandbox", "yes");
    } catch (sandbox_unavailable_error &e) {
        info.emplace_back("sandbox", fmt::format("no ({})", e.what()));
    } catch (configuration_error &e) {
        info.emplace_back("sandbox", fmt::format("no ({})", e.what()));
    }
    info.emplace_back("rules", to_string(rules.size()));
    return info;
}

bool toolchain::sandbox_available() const {
    try {
        exec->probe();
        return true;
    } catch (sandbox_unavailable_error &e) {
        LOG(WARNING) << "Sandbox unavailable: " << e.what();
        return false;
    } catch (configuration_error &e) {
        LOG(WARNING) << "Sandbox misconfigured: " << e.what();
        return false;
    }
}

/**
 * @brief 检查编译选项中的 -std= 是否与源代码的语言一致
 */
static void check_language(const vector<string> &args, bool c_language) {
    for (auto &arg : args) {
        if (!boost::algorithm::starts_with(arg, "-std=")) continue;
        string standard = arg.substr(5);
        bool cxx_standard = standard.find("++") != string::npos;
        if (c_language && cxx_standard)
            throw configuration_error(fmt::format("compiler argument {} is not valid for C sources", arg));
        if (!c_language && !cxx_standard)
            throw configuration_error(fmt::format("compiler argument {} is not valid for C++ sources", arg));
    }
}

unique_ptr<submission> toolchain::new_submission(const fs::path &source_dir, const fs::path &output_dir,
                                                 const submission_options &options) const {
    try {
        error_code ec;
        if (!fs::is_directory(source_dir, ec))
            throw io_error(fmt::format("source directory {} does not exist", source_dir.string()));
        if (access(source_dir.c_str(), R_OK | X_OK) != 0)
            throw io_error(fmt::format("source directory {} is not readable", source_dir.string()));

        fs::path work_dir = options.work_dir.empty() ? output_dir / "work" : options.work_dir;
        fs::create_directories(output_dir, ec);
        if (ec) throw io_error(fmt::format("unable to create output directory {}: {}", output_dir.string(), ec.message()));
        fs::create_directories(work_dir, ec);
        if (ec) throw io_error(fmt::format("unable to create work directory {}: {}", work_dir.string(), ec.message()));

        vector<fs::path> sources, headers, others;
        for (auto it = fs::recursive_directory_iterator(source_dir, ec); !ec && it != fs::recursive_directory_iterator(); it.increment(ec)) {
            if (!it->is_regular_file()) continue;
            fs::path path = fs::absolute(it->path());
            // 输出目录可能位于源代码目录中
            if (is_under_directory(path, output_dir) || is_under_directory(path, work_dir)) continue;

            string ext = boost::algorithm::to_lower_copy(path.extension().string());
            if (SOURCE_EXTENSIONS.count(ext))
                sources.push_back(path);
            else if (HEADER_EXTENSIONS.count(ext))
                headers.push_back(path);
            else
                others.push_back(path);
        }
        if (ec) throw io_error(fmt::format("unable to list source directory {}: {}", source_dir.string(), ec.message()));

        if (sources.empty())
            throw configuration_error(fmt::format("no source files found in {}", source_dir.string()));
        sort(sources.begin(), sources.end());
        sort(headers.begin(), headers.end());
        sort(others.begin(), others.end());

        bool c_language = all_of(sources.begin(), sources.end(), [](const fs::path &p) { return p.extension() == ".c"; });

        vector<string> args;
        // g++ 和 clang++ 会把 .c 文件当作 C++ 编译
        if (c_language) args.insert(args.end(), {"-x", "c"});
        args.insert(args.end(), cfg.compiler_args.begin(), cfg.compiler_args.end());
        args.insert(args.end(), options.compiler_args.begin(), options.compiler_args.end());
        for (auto &arg : args)
            if (RESERVED_ARGUMENTS.count(arg))
                throw configuration_error(fmt::format("compiler argument {} is not allowed", arg));
        check_language(args, c_language);

        for (auto &dir : options.include_dirs) {
            if (!fs::is_directory(dir, ec))
                throw io_error(fmt::format("include directory {} does not exist", dir.string()));
            args.push_back("-I" + fs::absolute(dir).string());
        }

        LOG(INFO) << fmt::format("New submission {}: {} sources, {} headers, {} other files",
                                 source_dir.string(), sources.size(), headers.size(), others.size());
        return make_unique<submission>(*this, fs::absolute(source_dir), fs::absolute(output_dir), fs::absolute(work_dir),
                                       move(sources), move(headers), move(others), move(args));
    } catch (hindsight_exception &e) {
        e.set_context("new_submission");
        throw;
    }
}

const toolchain_config &toolchain::config() const {
    return cfg;
}

const rule_catalog &toolchain::catalog() const {
    return rules;
}

const fs::path &toolchain::compiler() const {
    return compiler_path;
}

const vector<string> &toolchain::enabled_checks() const {
    return checks;
}

const diagnostic_producer &toolchain::producer(diagnostic_source source) const {
    switch (source) {
        case diagnostic_source::STATIC:
            return *static_analyzer;
        case diagnostic_source::STRUCTURAL:
            return *structural;
        case diagnostic_source::INSTRUMENTATION:
            return *sanitizers;
    }
    throw configuration_error("unknown diagnostic source");
}

const sandboxed_executor &toolchain::executor() const {
    return *exec;
}

const comparator &toolchain::default_comparator() const {
    return *compare;
}

}  // namespace hindsight
