#include "hindsight/comparator.hpp"
#include <boost/lexical_cast.hpp>
#include <algorithm>
#include <cmath>
#include <fstream>
#include <iterator>
#include <string>
#include <vector>

namespace hindsight {
using namespace std;

const char *to_string(comparison_result result) {
    switch (result) {
        case comparison_result::PASS: return "pass";
        case comparison_result::FAIL: return "fail";
        default: return "inconclusive";
    }
}

void to_json(nlohmann::json &j, comparison_result result) {
    j = to_string(result);
}

comparator::~comparator() = default;

comparison_result comparator::compare_files(const filesystem::path &expected, const filesystem::path &actual) const {
    ifstream expected_stream(expected, ios::binary), actual_stream(actual, ios::binary);
    if (!expected_stream || !actual_stream)
        return comparison_result::INCONCLUSIVE;
    return compare(expected_stream, actual_stream);
}

comparison_result exact_comparator::compare(istream &expected, istream &actual) const {
    istreambuf_iterator<char> e(expected), a(actual), end;
    for (; e != end && a != end; ++e, ++a)
        if (*e != *a) return comparison_result::FAIL;
    return e == end && a == end ? comparison_result::PASS : comparison_result::FAIL;
}

static vector<string> read_trimmed_lines(istream &is) {
    vector<string> lines;
    string line;
    while (getline(is, line)) {
        size_t end = line.find_last_not_of(" \t\r\f\v");
        lines.push_back(end == string::npos ? "" : line.substr(0, end + 1));
    }
    while (!lines.empty() && lines.back().empty())
        lines.pop_back();
    return lines;
}

comparison_result whitespace_comparator::compare(istream &expected, istream &actual) const {
    return read_trimmed_lines(expected) == read_trimmed_lines(actual) ? comparison_result::PASS : comparison_result::FAIL;
}

numeric_comparator::numeric_comparator(double absolute_tolerance, double relative_tolerance)
    : absolute_tolerance(absolute_tolerance), relative_tolerance(relative_tolerance) {}

static bool parse_number(const string &token, double &value) {
    return boost::conversion::try_lexical_convert(token, value) && isfinite(value);
}

bool numeric_comparator::same_token(const string &expected, const string &actual) const {
    if (expected == actual) return true;

    double e, a;
    if (!parse_number(expected, e) || !parse_number(actual, a))
        return false;

    double diff = fabs(e - a);
    return diff <= absolute_tolerance || diff <= relative_tolerance * max(fabs(e), fabs(a));
}

comparison_result numeric_comparator::compare(istream &expected, istream &actual) const {
    vector<string> expected_tokens{istream_iterator<string>(expected), istream_iterator<string>()};
    vector<string> actual_tokens{istream_iterator<string>(actual), istream_iterator<string>()};
    if (expected_tokens.size() != actual_tokens.size())
        return comparison_result::FAIL;

    for (size_t i = 0; i < expected_tokens.size(); ++i)
        if (!same_token(expected_tokens[i], actual_tokens[i]))
            return comparison_result::FAIL;
    return comparison_result::PASS;
}

unique_ptr<comparator> make_comparator(const comparison_config &config) {
    switch (config.mode) {
        case comparison_mode::WHITESPACE:
            return make_unique<whitespace_comparator>();
        case comparison_mode::NUMERIC:
            return make_unique<numeric_comparator>(config.absolute_tolerance, config.relative_tolerance);
        default:
            return make_unique<exact_comparator>();
    }
}

}  // namespace hindsight
