#include "ojudge/common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace ojudge {
using namespace std;

scoped_guard::scoped_guard() : f() {}

scoped_guard::scoped_guard(function<void()> f) : f(move(f)) {}

scoped_guard::scoped_guard(scoped_guard &&other) noexcept : f(move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 析构函数中不能再抛出异常，否则在栈展开时会直接 terminate
    try {
        f();
    } catch (const exception &e) {
        LOG(ERROR) << "deferred action failed: " << e.what();
    }
}

scoped_guard scoped_guard::operator+(function<void()> f) const {
    return scoped_guard(move(f));
}

}  // namespace ojudge
