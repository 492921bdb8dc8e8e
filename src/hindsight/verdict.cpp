#include "hindsight/verdict.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace hindsight {
using namespace std;

// clang-format off
static const unordered_map<verdict, const char *> verdict_string = boost::assign::map_list_of
    (verdict::ACCEPTED, "Accepted")
    (verdict::WRONG_ANSWER, "Wrong Answer")
    (verdict::RUNTIME_ERROR, "Runtime Error")
    (verdict::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (verdict::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (verdict::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (verdict::SYSTEM_ERROR, "System Error");

static const unordered_map<verdict, const char *> verdict_tag = boost::assign::map_list_of
    (verdict::ACCEPTED, "AC")
    (verdict::WRONG_ANSWER, "WA")
    (verdict::RUNTIME_ERROR, "RTE")
    (verdict::TIME_LIMIT_EXCEEDED, "TLE")
    (verdict::MEMORY_LIMIT_EXCEEDED, "MLE")
    (verdict::OUTPUT_LIMIT_EXCEEDED, "OLE")
    (verdict::SYSTEM_ERROR, "SE");
// clang-format on

const char *get_display_message(verdict v) {
    return verdict_string.at(v);
}

const char *get_verdict_tag(verdict v) {
    return verdict_tag.at(v);
}

optional<verdict> parse_verdict_tag(const string &tag) {
    for (auto &[v, name] : verdict_tag)
        if (tag == name) return v;
    return nullopt;
}

}  // namespace hindsight
