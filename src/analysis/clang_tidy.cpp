#include "analysis/clang_tidy.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <yaml-cpp/yaml.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include "analysis/clang_ast.hpp"
#include "analysis/source_index.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

clang_tidy_analyzer::clang_tidy_analyzer(const string &executable, const vector<string> &checks, double timeout)
    : executable(executable), checks(checks), timeout(timeout) {}

diagnostic_source clang_tidy_analyzer::kind() const {
    return diagnostic_source::STATIC;
}

string clang_tidy_analyzer::check_filter() const {
    return "-*," + boost::algorithm::join(checks, ",");
}

vector<diagnostic> clang_tidy_analyzer::parse_fixes(const fs::path &fixes, const fs::path &source_dir) {
    vector<diagnostic> result;
    if (!fs::exists(fixes)) return result;

    source_index index;
    try {
        YAML::Node doc = YAML::LoadFile(fixes.string());
        YAML::Node diags = doc["Diagnostics"];
        if (!diags) return result;
        if (!diags.IsSequence())
            throw analysis_parse_error(fmt::format("{}: Diagnostics is not a sequence", fixes.string()));

        for (size_t i = 0; i < diags.size(); ++i) {
            const YAML::Node &node = diags[i];
            // clang-tidy 9 之前，消息内容直接位于诊断记录中
            YAML::Node message = node["DiagnosticMessage"] ? node["DiagnosticMessage"] : node;

            diagnostic diag;
            diag.rule_id = node["DiagnosticName"].as<string>();
            diag.source = diagnostic_source::STATIC;
            diag.message = message["Message"].as<string>();

            string file = message["FilePath"] ? message["FilePath"].as<string>() : "";
            if (!file.empty()) {
                size_t offset = message["FileOffset"].as<size_t>();
                auto [line, column] = index.locate(file, offset);
                diag.location = source_location{display_path(file, source_dir), line, column};
                diag.code = index.line_of(file, line);
            }
            result.push_back(diag);
        }
    } catch (YAML::Exception &ex) {
        throw analysis_parse_error(fmt::format("malformed clang-tidy output {}: {}", fixes.string(), ex.what()));
    }
    return result;
}

static diagnostic incomplete_marker(const fs::path &source, const fs::path &source_dir, const string &message) {
    diagnostic marker;
    marker.rule_id = SOURCE_INCOMPLETE;
    marker.source = diagnostic_source::STATIC;
    marker.location = source_location{display_path(source, source_dir), 0, 0};
    marker.message = message;
    return marker;
}

vector<diagnostic> clang_tidy_analyzer::produce(const analysis_input &input) const {
    fs::path tidy = find_executable(executable);
    if (tidy.empty())
        throw analysis_unavailable_error(fmt::format("clang-tidy not found: {}", executable));
    if (checks.empty()) {
        LOG(WARNING) << "No clang-tidy check is enabled, skipping static analysis";
        return {};
    }

    vector<diagnostic> result;
    vector<string> unparsed;
    for (size_t i = 0; i < input.sources.size(); ++i) {
        const fs::path &source = input.sources[i];
        fs::path fixes = input.output_dir / fmt::format("clang-tidy-{}.yaml", i);
        fs::path log = input.output_dir / fmt::format("clang-tidy-{}.log", i);
        error_code ec;
        fs::remove(fixes, ec);

        process_options options;
        options.stdout_file = log;
        options.merge_stderr = true;
        options.timeout = timeout;

        LOG(INFO) << "Running clang-tidy on " << source;
        process_result proc;
        try {
            proc = call_process_opt(options, tidy, source, "--checks=" + check_filter(), "-header-filter=.*",
                                    "--export-fixes=" + fixes.string(), "--quiet", "--", input.compiler_args);
        } catch (system_error &ex) {
            throw analysis_unavailable_error(fmt::format("unable to run {}: {}", tidy.string(), ex.what()));
        }

        check_rejected_arguments("clang-tidy", read_file_content(log, ""));

        vector<diagnostic> found;
        try {
            found = parse_fixes(fixes, input.source_dir);
        } catch (analysis_parse_error &ex) {
            LOG(WARNING) << ex.what();
            unparsed.push_back(ex.what());
            result.push_back(incomplete_marker(source, input.source_dir, ex.what()));
            continue;
        }
        for (auto &diag : found)
            if (find(result.begin(), result.end(), diag) == result.end())
                result.push_back(diag);

        if (proc.timed_out || proc.exitcode != 0) {
            string reason = proc.timed_out ? "timed out"
                            : proc.exitcode < 0 ? fmt::format("was killed by signal {}", proc.signal)
                                                : fmt::format("exited with code {}", proc.exitcode);
            LOG(WARNING) << "clang-tidy " << reason << " on " << source;

            result.push_back(incomplete_marker(source, input.source_dir,
                                               fmt::format("clang-tidy {}, findings for this file may be incomplete", reason)));
        }
    }

    if (!unparsed.empty())
        throw partial_analysis_error(boost::algorithm::join(unparsed, "; "), move(result));
    return result;
}

}  // namespace hindsight
