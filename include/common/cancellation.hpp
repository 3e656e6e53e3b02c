#pragma once

#include <atomic>
#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <mutex>

namespace runner {

enum class cancel_reason {
    NONE,
    TIMEOUT,   // 超出了时间限制
    USER,      // 调用方显式取消
    SHUTDOWN   // 会话或者进程正在退出
};

/**
 * @brief 取消令牌
 * 同时被计时器、显式取消和执行后端观察。cancel 只会生效一次，
 * 注册的回调也只会被执行一次，这样资源的回收只会发生一次。
 */
struct cancellation_token {
    using callback = std::function<void(cancel_reason)>;

    /**
     * @brief 触发取消
     * @param reason 取消原因，只有第一次取消的原因会被记录
     * @return 若本次调用真正触发了取消，返回 true；已经被取消过则返回 false
     */
    bool cancel(cancel_reason reason);

    bool is_cancelled() const noexcept;

    cancel_reason reason() const noexcept;

    /**
     * @brief 注册取消回调
     * 若令牌已经被取消，回调会立即在当前线程中执行。
     * 回调在令牌内部的锁中执行，因此回调内不能再操作同一个令牌。
     * @return 回调 id，用于 remove_callback
     */
    std::uint64_t on_cancel(callback cb);

    /**
     * @brief 注销回调，返回后可以保证该回调不会再被执行
     */
    void remove_callback(std::uint64_t id);

private:
    std::atomic<bool> cancelled{false};
    std::atomic<cancel_reason> why{cancel_reason::NONE};
    std::mutex mut;
    std::uint64_t next_id = 0;
    std::map<std::uint64_t, callback> callbacks;
};

/**
 * @brief 在作用域内注册取消回调，离开作用域时自动注销
 * 回调通常捕获了栈上的变量，必须在栈帧销毁前注销
 */
struct cancellation_registration {
    cancellation_registration() = default;
    cancellation_registration(std::shared_ptr<cancellation_token> token, cancellation_token::callback cb);
    cancellation_registration(const cancellation_registration &) = delete;
    cancellation_registration &operator=(const cancellation_registration &) = delete;
    ~cancellation_registration();

private:
    std::shared_ptr<cancellation_token> token;
    std::uint64_t id = 0;
};

}  // namespace runner
