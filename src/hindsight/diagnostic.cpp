#include "hindsight/diagnostic.hpp"
#include "hindsight/producer.hpp"
#include <tuple>

namespace hindsight {
using namespace std;
using namespace nlohmann;

const char *to_string(diagnostic_source source) {
    switch (source) {
        case diagnostic_source::STATIC:
            return "static";
        case diagnostic_source::STRUCTURAL:
            return "structural";
        case diagnostic_source::INSTRUMENTATION:
            return "instrumentation";
    }
    return "unknown";
}

bool operator==(const source_location &a, const source_location &b) {
    return a.file == b.file && a.line == b.line && a.column == b.column;
}

bool operator<(const source_location &a, const source_location &b) {
    return tie(a.file, a.line, a.column) < tie(b.file, b.line, b.column);
}

bool operator==(const diagnostic &a, const diagnostic &b) {
    return a.rule_id == b.rule_id && a.source == b.source && a.location == b.location &&
           a.message == b.message && a.code == b.code;
}

void to_json(json &j, const source_location &location) {
    j = {{"file", location.file}, {"line", location.line}, {"column", location.column}};
}

void to_json(json &j, const diagnostic &diag) {
    j = {{"id", diag.rule_id},
         {"source", to_string(diag.source)},
         {"message", diag.message}};
    if (diag.location) {
        j["file"] = diag.location->file;
        j["line"] = diag.location->line;
        j["column"] = diag.location->column;
    } else {
        j["file"] = nullptr;
        j["line"] = nullptr;
        j["column"] = nullptr;
    }
    if (!diag.code.empty()) j["code"] = diag.code;
}

diagnostic_producer::~diagnostic_producer() = default;

partial_analysis_error::partial_analysis_error(const std::string &message, std::vector<diagnostic> partial)
    : analysis_parse_error(message), partial(std::move(partial)) {}

}  // namespace hindsight
