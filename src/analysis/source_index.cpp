#include "analysis/source_index.hpp"
#include <algorithm>
#include "common/io_utils.hpp"

namespace hindsight {
using namespace std;

const source_index::file_lines &source_index::load(const filesystem::path &file) {
    auto it = files.find(file.string());
    if (it != files.end()) return it->second;

    file_lines lines;
    lines.content = read_file_content(file, "");
    lines.starts.push_back(0);
    for (size_t i = 0; i < lines.content.size(); ++i)
        if (lines.content[i] == '\n' && i + 1 < lines.content.size())
            lines.starts.push_back(i + 1);
    return files.emplace(file.string(), move(lines)).first->second;
}

pair<int, int> source_index::locate(const filesystem::path &file, size_t offset) {
    const file_lines &lines = load(file);
    auto it = upper_bound(lines.starts.begin(), lines.starts.end(), offset);
    size_t line = it - lines.starts.begin();
    return {(int) line, (int) (offset - lines.starts[line - 1]) + 1};
}

string source_index::line_of(const filesystem::path &file, int line) {
    const file_lines &lines = load(file);
    if (line <= 0 || (size_t) line > lines.starts.size()) return "";

    size_t begin = lines.starts[line - 1];
    size_t end = lines.content.find('\n', begin);
    string code = lines.content.substr(begin, end == string::npos ? string::npos : end - begin);
    if (!code.empty() && code.back() == '\r') code.pop_back();
    return code;
}

}  // namespace hindsight
