#include "sandbox/runguard.hpp"
#include <boost/lexical_cast.hpp>
#include <fstream>
#include <map>

namespace hindsight {
using namespace std;

static map<string, string> read_metadata(const filesystem::path &metadata_file) {
    map<string, string> mp;
    ifstream fin(metadata_file);
    string line;
    while (getline(fin, line)) {
        size_t end = line.find(": ");
        if (end == string::npos) {
            // "key:" 这样值为空的行
            if (!line.empty() && line.back() == ':')
                mp[line.substr(0, line.size() - 1)] = "";
            continue;
        }
        mp[line.substr(0, end)] = line.substr(end + 2);
    }
    return mp;
}

template <typename T>
void try_to_parse(const map<string, string> &metadata, const char *key, T &value) {
    auto it = metadata.find(key);
    if (it == metadata.end()) return;
    boost::conversion::try_lexical_convert(it->second, value);
}

static void try_to_parse(const map<string, string> &metadata, const char *key, string &value) {
    auto it = metadata.find(key);
    if (it != metadata.end()) value = it->second;
}

runguard_result read_runguard_result(const filesystem::path &metafile) {
    auto metadata = read_metadata(metafile);
    runguard_result result;
    try_to_parse(metadata, "cpu-time", result.cpu_time);
    try_to_parse(metadata, "sys-time", result.sys_time);
    try_to_parse(metadata, "user-time", result.user_time);
    try_to_parse(metadata, "wall-time", result.wall_time);
    try_to_parse(metadata, "exitcode", result.exitcode);
    try_to_parse(metadata, "signal", result.signal);
    try_to_parse(metadata, "memory-bytes", result.memory);
    try_to_parse(metadata, "memory-result", result.memory_result);
    try_to_parse(metadata, "time-result", result.time_result);
    try_to_parse(metadata, "output-result", result.output_result);
    try_to_parse(metadata, "output-truncated", result.output_truncated);
    try_to_parse(metadata, "stdout-bytes", result.stdout_bytes);
    try_to_parse(metadata, "stderr-bytes", result.stderr_bytes);
    try_to_parse(metadata, "internal-error", result.internal_error);
    result.sandbox_unavailable = metadata.count("sandbox-unavailable") > 0;
    return result;
}

}  // namespace hindsight
