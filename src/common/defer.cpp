#include "common/defer.hpp"
#include <glog/logging.h>
#include <exception>

namespace sandbox {

scoped_guard::scoped_guard() : f() {}
scoped_guard::scoped_guard(const std::function<void()> &f) : f(f) {}
scoped_guard::scoped_guard(scoped_guard &&other) : f(std::move(other.f)) {
    other.f = nullptr;
}

scoped_guard::~scoped_guard() {
    if (!f) return;
    // 清理代码在析构函数中执行，异常不能再向外传播
    try {
        f();
    } catch (std::exception &ex) {
        LOG(ERROR) << "deferred action failed: " << ex.what();
    }
}

scoped_guard scoped_guard::operator+(const std::function<void()> &f) const {
    return scoped_guard(f);
}

}  // namespace sandbox
