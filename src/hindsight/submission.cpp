#include "hindsight/submission.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <boost/algorithm/string.hpp>
#include <boost/functional/hash.hpp>
#include <system_error>
#include "analysis/sanitizers.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"
#include "hindsight/toolchain.hpp"

namespace hindsight {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

submission::submission(const toolchain &tc,
                       const fs::path &source_dir,
                       const fs::path &output_dir,
                       const fs::path &work_dir,
                       vector<fs::path> sources,
                       vector<fs::path> headers,
                       vector<fs::path> others,
                       vector<string> compiler_args)
    : tc(tc), src_dir(source_dir), out_dir(output_dir), work_dir(work_dir), source_files(move(sources)), header_files(move(headers)), other(move(others)), args(move(compiler_args)) {}

vector<string> submission::compile_command(bool instrument) const {
    vector<string> command;
    to_string_list(command, tc.compiler(), args);
    if (instrument) to_string_list(command, tc.config().instrument_args);
    to_string_list(command, source_files, "-o", work_dir / (instrument ? "program.instr" : "program"), "-lm");
    return command;
}

size_t submission::fingerprint(const vector<string> &command) const {
    size_t seed = 0;
    for (auto &arg : command)
        boost::hash_combine(seed, arg);
    // 头文件的修改同样会使编译产物失效
    auto hash_files = [&](const vector<fs::path> &files) {
        for (auto &file : files) {
            boost::hash_combine(seed, file.string());
            boost::hash_combine(seed, read_file_content(file, ""));
        }
    };
    hash_files(source_files);
    hash_files(header_files);
    return seed;
}

shared_ptr<const compiled_artifact> submission::compile(bool instrument, const vector<string> &command, size_t fp) {
    if (tc.compiler().empty())
        throw configuration_error("no C++ compiler available");

    fs::path log = out_dir / (instrument ? "compiler-instr.txt" : "compiler.txt");
    fs::path binary = command[command.size() - 2];
    error_code ec;
    fs::remove(binary, ec);

    process_options options;
    options.stdout_file = log;
    options.merge_stderr = true;
    options.timeout = tc.config().compile_time_limit;

    ++compilations;
    LOG(INFO) << "Compiling " << src_dir << (instrument ? " with instrumentation" : "") << " to " << binary;

    process_result result;
    try {
        result = exec_program(options, command);
    } catch (system_error &e) {
        throw configuration_error(fmt::format("unable to run compiler {}: {}", command[0], e.what()));
    }

    string output = read_file_content(log, "");
    if (result.timed_out) {
        LOG(WARNING) << "Compilation of " << src_dir << " timed out";
        throw compilation_error(fmt::format("compilation exceeded {} seconds", tc.config().compile_time_limit), output);
    }
    if (result.exitcode != 0) {
        LOG(INFO) << "Compilation of " << src_dir << " failed with exit code " << result.exitcode;
        throw compilation_error(fmt::format("compilation failed with exit code {}", result.exitcode), output);
    }
    if (!fs::is_regular_file(binary))
        throw compilation_error("compiler did not produce an executable", output);

    auto artifact = make_shared<compiled_artifact>();
    artifact->binary = binary;
    artifact->instrumented = instrument;
    artifact->compiler_log = move(output);
    artifact->fingerprint = fp;
    return artifact;
}

shared_ptr<const compiled_artifact> submission::ensure_artifact(bool instrument) {
    vector<string> command = compile_command(instrument);
    size_t fp = fingerprint(command);
    artifact_slot &slot = slots[instrument ? 1 : 0];

    promise<shared_ptr<const compiled_artifact>> build;
    shared_future<shared_ptr<const compiled_artifact>> result;
    bool owner = false;
    {
        lock_guard<mutex> guard(slot.lock);
        if (slot.current.valid() && slot.fingerprint == fp) {
            result = slot.current;
        } else {
            owner = true;
            result = build.get_future().share();
            slot.current = result;
            slot.fingerprint = fp;
        }
    }

    // 编译在锁外进行，其他线程等待同一个 future 得到相同的产物或异常
    if (owner) {
        try {
            build.set_value(compile(instrument, command, fp));
        } catch (...) {
            build.set_exception(current_exception());
        }
    }

    // future 中的异常对象被所有调用方共享，复制一份再抛出，调用方附加的上下文互不影响
    try {
        return result.get();
    } catch (const compilation_error &e) {
        throw compilation_error(e);
    } catch (const configuration_error &e) {
        throw configuration_error(e);
    }
}

size_t submission::compilation_count() const {
    return compilations;
}

void submission::write_json(const fs::path &path, const json &j) const {
    write_file_content(path, j.dump(4, ' ', false, json::error_handler_t::replace));
}

void submission::replace_diagnostics(diagnostic_source source, const vector<diagnostic> &found) {
    lock_guard<mutex> guard(state_lock);
    diags.erase(remove_if(diags.begin(), diags.end(), [&](const diagnostic &d) { return d.source == source; }), diags.end());
    diags.insert(diags.end(), found.begin(), found.end());
}

/**
 * @brief 分析工具整体失败时，用一条 source-incomplete 诊断信息代替该来源的结果
 */
static diagnostic incomplete_marker(diagnostic_source source, const hindsight_exception &e) {
    diagnostic marker;
    marker.rule_id = SOURCE_INCOMPLETE;
    marker.source = source;
    marker.message = e.what();
    return marker;
}

vector<diagnostic> submission::run_analysis(diagnostic_source source, const string &check, const string &dump_file) {
    analysis_input input;
    input.source_dir = src_dir;
    input.sources = source_files;
    input.compiler_args = args;
    input.output_dir = out_dir;

    vector<diagnostic> found;
    try {
        LOG(INFO) << "Running " << check << " on " << src_dir;
        found = tc.producer(source).produce(input);
    } catch (analysis_unavailable_error &e) {
        replace_diagnostics(source, {incomplete_marker(source, e)});
        e.set_context(check);
        throw;
    } catch (partial_analysis_error &e) {
        // 其余文件的结果仍然有效，与 source-incomplete 诊断信息一同保留
        replace_diagnostics(source, e.partial);
        write_json(out_dir / dump_file, tc.catalog().describe(e.partial));
        e.set_context(check);
        throw;
    } catch (analysis_parse_error &e) {
        replace_diagnostics(source, {incomplete_marker(source, e)});
        e.set_context(check);
        throw;
    } catch (hindsight_exception &e) {
        e.set_context(check);
        throw;
    }

    replace_diagnostics(source, found);
    try {
        write_json(out_dir / dump_file, tc.catalog().describe(found));
    } catch (hindsight_exception &e) {
        e.set_context(check);
        throw;
    }
    LOG(INFO) << check << " found " << found.size() << " diagnostics in " << src_dir;
    return found;
}

vector<diagnostic> submission::check_static() {
    return run_analysis(diagnostic_source::STATIC, "check_static", "static-analysis.json");
}

vector<diagnostic> submission::check_custom() {
    run_analysis(diagnostic_source::STRUCTURAL, "check_custom", "custom-analysis.json");
    return diagnostics();
}

pair<size_t, string> submission::issue_test_case(const fs::path &input_file, const string &requested) {
    string base = requested.empty() ? input_file.stem().string() : assert_safe_path(requested);
    lock_guard<mutex> guard(state_lock);
    int count = ++issued_cases[base];
    string id = count == 1 ? base : fmt::format("{}#{}", base, count);
    return {issue_counter++, id};
}

execution_result submission::check_output(const fs::path &input_file,
                                          const fs::path &expected_output_file,
                                          const fs::path &actual_output_path,
                                          bool instrument) {
    check_options options;
    options.instrument = instrument;
    return check_output(input_file, expected_output_file, actual_output_path, options);
}

execution_result submission::check_output(const fs::path &input_file,
                                          const fs::path &expected_output_file,
                                          const fs::path &actual_output_path,
                                          const check_options &options) {
    size_t sequence = 0;
    string test_case;
    try {
        tie(sequence, test_case) = issue_test_case(input_file, options.test_case_id);
    } catch (hindsight_exception &e) {
        e.set_context("check_output", options.test_case_id);
        throw;
    }

    try {
        if (!fs::is_regular_file(input_file))
            throw io_error(fmt::format("input file {} does not exist", input_file.string()));

        auto artifact = ensure_artifact(options.instrument);

        sandbox_request request;
        request.program = artifact->binary;
        request.stdin_file = input_file;
        request.stdout_file = actual_output_path;
        request.limits = options.limits.value_or(tc.config().limits);
        if (options.instrument)
            request.env = sanitizer_analyzer::environment(tc.config().sanitizer_options);

        vector<diagnostic> found;
        auto inspect = [&](const fs::path &run_dir) {
            if (!options.instrument) return;
            analysis_input input;
            input.source_dir = src_dir;
            input.sources = source_files;
            input.compiler_args = args;
            input.output_dir = out_dir;
            input.run_dir = run_dir;
            found = tc.producer(diagnostic_source::INSTRUMENTATION).produce(input);
        };

        LOG(INFO) << fmt::format("Running test case {} of {}{}", test_case, src_dir.string(), options.instrument ? " with instrumentation" : "");
        execution_result result = tc.executor().execute(request, options.cancelled, inspect);
        result.test_case_id = test_case;
        result.instrumented = options.instrument;
        result.instrumentation_diagnostics = move(found);

        // 程序没有正常结束时输出可能不完整，比较没有意义
        if (result.status == termination::EXITED && result.exit_status == 0) {
            const comparator &compare = options.compare ? *options.compare : tc.default_comparator();
            result.comparison = compare.compare_files(expected_output_file, actual_output_path);
        }

        if (options.instrument)
            write_json(out_dir / (test_case + "-sanitizers.json"), tc.catalog().describe(result.instrumentation_diagnostics));

        LOG(INFO) << fmt::format("Test case {} of {}: {}", test_case, src_dir.string(), get_verdict_tag(result.outcome()));
        store_result(sequence, result);
        return result;
    } catch (execution_environment_error &e) {
        // 测试点编号已经分配，记录一个没有结论的运行结果
        execution_result result;
        result.test_case_id = test_case;
        result.instrumented = options.instrument;
        result.status = termination::ENVIRONMENT_ERROR;
        result.environment_error = e.what();
        LOG(WARNING) << fmt::format("Test case {} of {} is inconclusive: {}", test_case, src_dir.string(), e.what());
        store_result(sequence, result);
        e.set_context("check_output", test_case);
        throw;
    } catch (hindsight_exception &e) {
        e.set_context("check_output", test_case);
        throw;
    }
}

void submission::store_result(size_t sequence, const execution_result &result) {
    lock_guard<mutex> guard(state_lock);
    auto pos = upper_bound(runs.begin(), runs.end(), sequence,
                           [](size_t seq, const pair<size_t, execution_result> &run) { return seq < run.first; });
    runs.insert(pos, {sequence, result});
}

summary_report submission::summary(const summary_options &options) const {
    return build_summary(tc.catalog(), diagnostics(), results(), tc.config().aggregation, options);
}

vector<diagnostic> submission::diagnostics() const {
    lock_guard<mutex> guard(state_lock);
    return diags;
}

vector<execution_result> submission::results() const {
    lock_guard<mutex> guard(state_lock);
    vector<execution_result> list;
    for (auto &run : runs) list.push_back(run.second);
    return list;
}

const fs::path &submission::source_dir() const {
    return src_dir;
}

const fs::path &submission::output_dir() const {
    return out_dir;
}

const vector<fs::path> &submission::sources() const {
    return source_files;
}

const vector<fs::path> &submission::headers() const {
    return header_files;
}

const vector<fs::path> &submission::other_files() const {
    return other;
}

}  // namespace hindsight
