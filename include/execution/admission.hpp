#pragma once

#include <condition_variable>
#include <memory>
#include <mutex>
#include "common/cancellation.hpp"

namespace runner {

/**
 * @brief 跨会话的全局并发名额
 * 每个会话的执行队列各自限制并发数，多个会话可以共享同一个 admission_limiter
 * 来限制整个进程同时进行的执行数（比如远程沙箱的配额）。
 */
struct admission_limiter {
    explicit admission_limiter(std::size_t capacity);

    /**
     * @brief 获取一个名额，阻塞直到有空闲名额或者 token 被取消
     * @return 是否获取到了名额，token 被取消时返回 false
     */
    bool acquire(const std::shared_ptr<cancellation_token> &token);

    void release();

    std::size_t capacity() const;

    std::size_t in_use() const;

private:
    mutable std::mutex mut;
    std::condition_variable cond;
    std::size_t limit;
    std::size_t used = 0;
};

}  // namespace runner
