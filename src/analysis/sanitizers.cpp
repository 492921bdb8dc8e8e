#include "analysis/sanitizers.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string.hpp>
#include <algorithm>
#include <sstream>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

static const char LOG_PREFIX[] = "sanitizer";
static const char FALLBACK_UB_RULE[] = "undefined-behavior";

static const regex UBSAN_ERROR(R"(^(.+?):(\d+):(\d+): runtime error: (.*)$)");
static const regex ASAN_ERROR(R"(^==\d+==ERROR: (?:AddressSanitizer|LeakSanitizer): (?:attempting )?([A-Za-z][A-Za-z-]*)(.*)$)");
static const regex ASAN_ACCESS(R"(^(READ|WRITE) of size (\d+))");
static const regex SEGV_ACCESS(R"(caused by a (READ|WRITE) memory access)");
static const regex STACK_FRAME(R"(^\s*#\d+ 0x[0-9a-fA-F]+ in (.+) (/\S+?):(\d+)(?::(\d+))?$)");

sanitizer_analyzer::sanitizer_analyzer(const rule_catalog &catalog) {
    for (const diagnostic_rule *rule : catalog.rules()) {
        known_rules.insert(rule->id);
        if (rule->match.empty()) continue;
        try {
            patterns.emplace_back(rule->id, regex(rule->match));
        } catch (regex_error &ex) {
            throw configuration_error(fmt::format("invalid match pattern of rule {}: {}", rule->id, ex.what()));
        }
    }
}

diagnostic_source sanitizer_analyzer::kind() const {
    return diagnostic_source::INSTRUMENTATION;
}

map<string, string> sanitizer_analyzer::environment(const map<string, string> &extra_options) {
    // 报告写入文件而不是标准错误流，避免与选手程序的输出混在一起
    map<string, string> asan = {{"log_path", LOG_PREFIX}, {"detect_leaks", "0"}, {"abort_on_error", "0"}};
    map<string, string> ubsan = {{"log_path", LOG_PREFIX}, {"print_stacktrace", "1"}};
    for (auto &[key, value] : extra_options) {
        asan[key] = value;
        ubsan[key] = value;
    }

    auto join = [](const map<string, string> &options) {
        vector<string> items;
        for (auto &[key, value] : options) items.push_back(key + "=" + value);
        return boost::algorithm::join(items, ":");
    };
    return {{"ASAN_OPTIONS", join(asan)}, {"UBSAN_OPTIONS", join(ubsan)}};
}

vector<diagnostic> sanitizer_analyzer::parse(const string &log, const fs::path &source_dir) const {
    vector<diagnostic> result;
    bool in_report = false;
    diagnostic current;
    string kind, access;

    auto finish = [&]() {
        if (!access.empty()) {
            string refined = current.rule_id + "-" + boost::algorithm::to_lower_copy(access);
            if (known_rules.count(refined)) current.rule_id = refined;
        }
        result.push_back(current);
        in_report = false;
    };

    istringstream ss(log);
    string line;
    while (getline(ss, line)) {
        if (!line.empty() && line.back() == '\r') line.pop_back();
        smatch m;

        if (!in_report) {
            if (regex_match(line, m, UBSAN_ERROR)) {
                diagnostic diag;
                diag.source = diagnostic_source::INSTRUMENTATION;
                diag.message = m[4].str();
                diag.location = source_location{display_path(m[1].str(), source_dir), stoi(m[2].str()), stoi(m[3].str())};
                diag.rule_id = FALLBACK_UB_RULE;
                for (auto &[id, pattern] : patterns) {
                    if (regex_search(diag.message, pattern)) {
                        diag.rule_id = id;
                        break;
                    }
                }
                result.push_back(diag);
            } else if (regex_match(line, m, ASAN_ERROR)) {
                in_report = true;
                kind = m[1].str();
                if (kind == "detected") kind = "memory-leak";
                access.clear();
                current = diagnostic();
                current.source = diagnostic_source::INSTRUMENTATION;
                current.rule_id = "asan-" + boost::algorithm::to_lower_copy(kind);
                current.message = kind;
            }
            continue;
        }

        if (boost::algorithm::starts_with(line, "SUMMARY: ")) {
            finish();
        } else if (regex_search(line, m, ASAN_ACCESS)) {
            access = m[1].str();
            current.message = fmt::format("{}: {} of size {}", kind, access, m[2].str());
        } else if (regex_search(line, m, SEGV_ACCESS)) {
            access = m[1].str();
            current.message = fmt::format("{}: {} memory access", kind, access);
        } else if (!current.location && regex_match(line, m, STACK_FRAME)) {
            string file = m[2].str();
            if (is_under_directory(file, source_dir)) {
                int column = m[4].matched ? stoi(m[4].str()) : 0;
                current.location = source_location{display_path(file, source_dir), stoi(m[3].str()), column};
            }
        }
    }

    // 报告被截断（比如程序在写报告时被杀死）
    if (in_report) finish();
    return result;
}

vector<diagnostic> sanitizer_analyzer::produce(const analysis_input &input) const {
    vector<fs::path> logs;
    error_code ec;
    for (auto &entry : fs::directory_iterator(input.run_dir, ec))
        if (boost::algorithm::starts_with(entry.path().filename().string(), string(LOG_PREFIX) + "."))
            logs.push_back(entry.path());
    if (ec)
        throw analysis_unavailable_error(fmt::format("unable to list sanitizer reports in {}: {}", input.run_dir.string(), ec.message()));
    sort(logs.begin(), logs.end());

    vector<diagnostic> result;
    for (auto &log : logs) {
        LOG(INFO) << "Parsing sanitizer report " << log;
        for (auto &diag : parse(read_file_content(log), input.source_dir))
            result.push_back(diag);
    }
    return result;
}

}  // namespace hindsight
