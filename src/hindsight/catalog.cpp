#include "hindsight/catalog.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <fstream>
#include <regex>
#include "common/exceptions.hpp"
#include "hindsight/verdict.hpp"

namespace hindsight {
using namespace std;
using namespace nlohmann;
namespace fs = std::filesystem;

void from_json(const json &j, diagnostic_rule &rule) {
    j.at("short").get_to(rule.short_description);
    if (j.count("extra") && !j.at("extra").is_null())
        rule.extra_description = j.at("extra").get<string>();
    else
        rule.extra_description.reset();
    if (j.count("severity"))
        j.at("severity").get_to(rule.severity);
    else
        rule.severity = BASELINE_SEVERITY;
    rule.explains.clear();
    if (j.count("explains")) {
        const json &explains = j.at("explains");
        if (explains.is_string())
            rule.explains.insert(explains.get<string>());
        else
            for (auto &tag : explains)
                rule.explains.insert(tag.get<string>());
    }
    if (j.count("match"))
        j.at("match").get_to(rule.match);
    else
        rule.match.clear();
}

rule_catalog::rule_catalog() {}

rule_catalog::rule_catalog(const vector<diagnostic_rule> &rules) {
    for (auto &rule : rules)
        entries[rule.id] = rule;
}

rule_catalog rule_catalog::load(const fs::path &path) {
    ifstream fin(path);
    if (!fin) throw configuration_error(fmt::format("unable to read rule catalog {}", path.string()));

    json doc;
    try {
        fin >> doc;
    } catch (const json::exception &ex) {
        throw configuration_error(fmt::format("rule catalog {} is not valid JSON: {}", path.string(), ex.what()));
    }
    rule_catalog catalog = parse(doc);
    LOG(INFO) << "Loaded " << catalog.size() << " diagnostic rules from " << path;
    return catalog;
}

rule_catalog rule_catalog::parse(const json &doc) {
    if (!doc.is_object())
        throw configuration_error("rule catalog must be a mapping from rule id to rule");

    rule_catalog catalog;
    for (auto &[id, value] : doc.items()) {
        diagnostic_rule rule;
        try {
            value.get_to(rule);
        } catch (const json::exception &ex) {
            throw configuration_error(fmt::format("malformed rule {}: {}", id, ex.what()));
        }
        rule.id = id;

        if (rule.severity < 0)
            throw configuration_error(fmt::format("rule {} has negative severity {}", id, rule.severity));
        for (auto &tag : rule.explains)
            if (!parse_verdict_tag(tag))
                throw configuration_error(fmt::format("rule {} explains unknown verdict category {}", id, tag));
        if (!rule.match.empty()) {
            try {
                regex re(rule.match);
            } catch (const regex_error &ex) {
                throw configuration_error(fmt::format("rule {} has invalid match pattern: {}", id, ex.what()));
            }
        }

        catalog.entries[id] = move(rule);
    }
    return catalog;
}

const diagnostic_rule *rule_catalog::find(const string &id) const {
    auto it = entries.find(id);
    return it == entries.end() ? nullptr : &it->second;
}

diagnostic_rule rule_catalog::lookup(const string &id) const {
    if (auto rule = find(id)) return *rule;
    diagnostic_rule rule;
    rule.id = id;
    rule.short_description = id;
    return rule;
}

vector<const diagnostic_rule *> rule_catalog::rules() const {
    vector<const diagnostic_rule *> result;
    for (auto &[id, rule] : entries)
        result.push_back(&rule);
    return result;
}

size_t rule_catalog::size() const {
    return entries.size();
}

json rule_catalog::describe(const diagnostic &diag) const {
    json j = diag;
    diagnostic_rule rule = lookup(diag.rule_id);
    j["short"] = rule.short_description;
    j["extra"] = rule.extra_description ? json(*rule.extra_description) : json(nullptr);
    j["severity"] = rule.severity;
    j["explains"] = rule.explains;
    return j;
}

json rule_catalog::describe(const vector<diagnostic> &diags) const {
    json j = json::array();
    for (auto &diag : diags)
        j.push_back(describe(diag));
    return j;
}

}  // namespace hindsight
