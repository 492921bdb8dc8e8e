#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace hindsight {
using namespace std;

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    try {
        f();
    } catch (const exception &ex) {
        LOG(ERROR) << "Deferred cleanup failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

void scoped_guard::dismiss() {
    f = nullptr;
}

}  // namespace hindsight
