#include "common/io_utils.hpp"
#include <fmt/core.h>
#include <fstream>
#include <iterator>
#include "common/exceptions.hpp"

namespace hindsight {
using namespace std;
namespace fs = std::filesystem;

string read_file_content(const fs::path &path) {
    ifstream fin(path, ios::binary);
    if (!fin) throw io_error(fmt::format("unable to read file {}", path.string()));
    string str((istreambuf_iterator<char>(fin)),
               (istreambuf_iterator<char>()));
    return str;
}

string read_file_content(const fs::path &path, const string &def) {
    if (!fs::exists(path)) {
        return def;
    } else {
        return read_file_content(path);
    }
}

string read_file_prefix(const fs::path &path, size_t limit, bool &truncated) {
    truncated = false;
    ifstream fin(path, ios::binary);
    if (!fin) return "";
    string str(limit, '\0');
    fin.read(str.data(), limit);
    str.resize(fin.gcount());
    if (str.size() == limit && fin.peek() != char_traits<char>::eof())
        truncated = true;
    return str;
}

void write_file_content(const fs::path &path, const string &content) {
    ofstream fout(path, ios::binary | ios::trunc);
    fout << content;
    fout.flush();
    if (!fout) throw io_error(fmt::format("unable to write file {}", path.string()));
}

string assert_safe_path(const string &subpath) {
    if (subpath.find("..") != string::npos || subpath.find('/') != string::npos)
        throw io_error("subpath is not safe " + subpath);
    return subpath;
}

bool is_under_directory(const fs::path &path, const fs::path &dir) {
    error_code ec;
    fs::path p = fs::weakly_canonical(path, ec);
    if (ec) p = path.lexically_normal();
    fs::path d = fs::weakly_canonical(dir, ec);
    if (ec) d = dir.lexically_normal();
    auto rel = p.lexically_relative(d);
    return !rel.empty() && *rel.begin() != "..";
}

string display_path(const fs::path &path, const fs::path &dir) {
    if (!is_under_directory(path, dir))
        return path.filename().string();
    error_code ec;
    fs::path p = fs::weakly_canonical(path, ec);
    if (ec) p = path.lexically_normal();
    fs::path d = fs::weakly_canonical(dir, ec);
    if (ec) d = dir.lexically_normal();
    return p.lexically_relative(d).string();
}

}  // namespace hindsight
