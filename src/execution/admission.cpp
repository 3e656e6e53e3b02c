#include "execution/admission.hpp"
#include <chrono>

namespace runner {
using namespace std;

admission_limiter::admission_limiter(size_t capacity)
    : limit(capacity > 0 ? capacity : 1) {}

bool admission_limiter::acquire(const shared_ptr<cancellation_token> &token) {
    unique_lock lock(mut);
    while (used >= limit) {
        if (token && token->is_cancelled()) return false;
        // 定期检查取消状态
        cond.wait_for(lock, chrono::milliseconds(20));
    }
    if (token && token->is_cancelled()) return false;
    ++used;
    return true;
}

void admission_limiter::release() {
    {
        scoped_lock lock(mut);
        if (used > 0) --used;
    }
    cond.notify_one();
}

size_t admission_limiter::capacity() const {
    return limit;
}

size_t admission_limiter::in_use() const {
    scoped_lock lock(mut);
    return used;
}

}  // namespace runner
