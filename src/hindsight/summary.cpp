#include "hindsight/summary.hpp"
#include <algorithm>
#include <map>
#include <tuple>

namespace hindsight {
using namespace std;
using namespace nlohmann;

namespace {

struct group_builder {
    rule_group group;

    /**
     * @brief 结果类别到能被该规则解释的测试点
     */
    map<string, vector<string>> explained_cases;
};

bool same_occurrence(const diagnostic &a, const diagnostic &b) {
    return a.location == b.location && a.message == b.message;
}

void add_case(vector<string> &cases, const string &test_case) {
    if (find(cases.begin(), cases.end(), test_case) == cases.end())
        cases.push_back(test_case);
}

}  // namespace

summary_report build_summary(const rule_catalog &catalog,
                             const vector<diagnostic> &diagnostics,
                             const vector<execution_result> &results,
                             score_aggregation aggregation,
                             const summary_options &options) {
    summary_report report;
    map<string, vector<string>> cases_by_verdict;
    for (auto &result : results) {
        verdict outcome = result.outcome();
        if (outcome == verdict::ACCEPTED || outcome == verdict::SYSTEM_ERROR) continue;
        report.observed_verdicts.insert(get_verdict_tag(outcome));
        add_case(cases_by_verdict[get_verdict_tag(outcome)], result.test_case_id);
    }

    map<string, group_builder> builders;
    auto add = [&](const diagnostic &diag, const execution_result *run) {
        diagnostic_rule rule = catalog.lookup(diag.rule_id);
        if (rule.severity < options.min_severity) return;

        // 静态诊断可以解释任何测试点的结果，运行时诊断只能解释所在运行的结果
        set<string> relevant;
        if (run) {
            verdict outcome = run->outcome();
            if (outcome != verdict::ACCEPTED && outcome != verdict::SYSTEM_ERROR && rule.explains.count(get_verdict_tag(outcome)))
                relevant.insert(get_verdict_tag(outcome));
        } else {
            for (auto &tag : rule.explains)
                if (report.observed_verdicts.count(tag)) relevant.insert(tag);
        }
        if (options.must_explain && relevant.empty()) return;

        auto [it, inserted] = builders.try_emplace(diag.rule_id);
        group_builder &builder = it->second;
        if (inserted) {
            builder.group.rule_id = rule.id;
            builder.group.severity = rule.severity;
            builder.group.short_description = rule.short_description;
            builder.group.extra_description = rule.extra_description;
            builder.group.explains = rule.explains;
        }

        auto &occurrences = builder.group.occurrences;
        if (none_of(occurrences.begin(), occurrences.end(), [&](const diagnostic &d) { return same_occurrence(d, diag); }))
            occurrences.push_back(diag);

        for (auto &tag : relevant) {
            builder.group.explained = true;
            auto &cases = builder.explained_cases[tag];
            if (run)
                add_case(cases, run->test_case_id);
            else
                for (auto &test_case : cases_by_verdict[tag]) add_case(cases, test_case);
        }
    };

    for (auto &diag : diagnostics) add(diag, nullptr);
    for (auto &result : results)
        for (auto &diag : result.instrumentation_diagnostics) add(diag, &result);

    for (auto &[id, builder] : builders) {
        if (aggregation == score_aggregation::MAX)
            report.score = max(report.score, builder.group.severity);
        else
            report.score += builder.group.severity;

        for (auto &[tag, cases] : builder.explained_cases) {
            hypothesis h;
            h.outcome = *parse_verdict_tag(tag);
            h.rule_id = id;
            h.severity = builder.group.severity;
            h.description = builder.group.short_description;
            h.test_cases = cases;
            report.hypotheses.push_back(h);
        }
        report.groups.push_back(move(builder.group));
    }

    sort(report.groups.begin(), report.groups.end(), [](const rule_group &a, const rule_group &b) {
        return make_tuple(!a.explained, -a.severity, a.rule_id) < make_tuple(!b.explained, -b.severity, b.rule_id);
    });
    sort(report.hypotheses.begin(), report.hypotheses.end(), [](const hypothesis &a, const hypothesis &b) {
        return make_tuple(-a.severity, a.rule_id, string(get_verdict_tag(a.outcome))) <
               make_tuple(-b.severity, b.rule_id, string(get_verdict_tag(b.outcome)));
    });
    return report;
}

void to_json(json &j, const rule_group &group) {
    j = {{"id", group.rule_id},
         {"short", group.short_description},
         {"extra", group.extra_description ? json(*group.extra_description) : json(nullptr)},
         {"severity", group.severity},
         {"explains", group.explains},
         {"explained", group.explained},
         {"occurrences", group.occurrences}};
}

void to_json(json &j, const hypothesis &h) {
    j = {{"verdict", get_verdict_tag(h.outcome)},
         {"id", h.rule_id},
         {"severity", h.severity},
         {"description", h.description},
         {"test_cases", h.test_cases}};
}

void to_json(json &j, const summary_report &report) {
    j = {{"score", report.score},
         {"observed_verdicts", report.observed_verdicts},
         {"groups", report.groups},
         {"hypotheses", report.hypotheses}};
}

}  // namespace hindsight
