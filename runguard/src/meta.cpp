#include "meta.hpp"
#include <fmt/core.h>

using namespace std;

void meta_writer::open(const string &path) {
    if (!path.empty()) out.open(path, ofstream::out | ofstream::trunc);
}

void meta_writer::put_seconds(const char *key, double seconds) {
    put(key, fmt::format("{:.3f}", seconds));
}
