#pragma once

#include <condition_variable>
#include <deque>
#include <exception>
#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>
#include "common/cancellation.hpp"
#include "common/status.hpp"
#include "execution/admission.hpp"
#include "execution/backend.hpp"

namespace runner {

/**
 * @brief 执行队列，负责一个会话内所有执行的准入控制与生命周期
 *
 * 1. 同一时刻最多 max_concurrent 个执行在运行，其余的按 FIFO 顺序排队；
 *    若设置了 admission_limiter，还需要获得全局名额
 * 2. 每个执行有独立于后端的强制时间限制，从开始运行时计时。超时后队列会主动要求后端
 *    释放资源（中断解释器、销毁沙箱），然后才抛出 execution_timeout
 * 3. 可以通过请求 id 取消执行，取消会传递到后端
 * 4. 执行占用的名额在后端真正返回后才归还，因此下一个执行开始时后端一定已经恢复到可用状态
 *
 * 状态：QUEUED -> RUNNING -> {COMPLETED, TIMED_OUT, CANCELED, FAILED}
 */
struct execution_queue {
    /**
     * @brief 状态变化回调，在队列内部的锁中调用，回调中不能再调用执行队列
     */
    using state_listener = std::function<void(const execution_request &, execution_state)>;

    /**
     * @param max_concurrent 会话内允许同时运行的执行数
     * @param limiter 全局名额，可以为空
     */
    explicit execution_queue(std::size_t max_concurrent, std::shared_ptr<admission_limiter> limiter = nullptr);

    /**
     * @brief 等待所有执行结束
     * 仍在排队或者运行中的执行会被取消
     */
    ~execution_queue();

    /**
     * @brief 注册执行后端，请求会根据 backend_kind 交给对应的后端
     * 后端的生命周期必须长于执行队列
     */
    void register_backend(execution_backend &backend);

    bool has_backend(backend_kind kind) const;

    /**
     * @brief 后端是否支持同时运行多个执行
     */
    bool supports_parallel(backend_kind kind) const;

    /**
     * @brief 提交一次执行，阻塞直到执行进入终止状态
     * request.id 为空时生成随机 id，request.timeout_ms 小于等于 0 时使用 DEFAULT_TIMEOUT_MS
     * @return 执行结果，选手代码的错误保存在 error_summary 中
     * @throw validation_error 请求不合法，不会调用任何后端
     * @throw execution_timeout 超出时间限制，后端已经被要求释放资源
     * @throw execution_canceled 执行被取消
     * @throw 其他后端抛出的异常（backend_initialization_error、runtime_fault、transport_failure）
     * @param token 调用方的取消令牌，令牌被取消时该执行也会被取消，可以为空
     */
    execution_result execute(execution_request request, const std::shared_ptr<cancellation_token> &token = nullptr);

    /**
     * @brief 取消一次执行
     * 排队中的执行直接出队，运行中的执行会要求后端中止
     * @return 若找到了该执行返回 true
     */
    bool cancel(const std::string &request_id, cancel_reason reason = cancel_reason::USER);

    void on_state_changed(state_listener listener);

    std::size_t max_concurrent() const;

    std::size_t running_count() const;

    std::size_t queued_count() const;

private:
    struct ticket {
        execution_request request;
        execution_backend *backend = nullptr;
        execution_state state = execution_state::QUEUED;
        std::shared_ptr<cancellation_token> token = std::make_shared<cancellation_token>();
        std::uint64_t callback_id = 0;

        /**
         * @brief 后端是否已经返回
         */
        bool done = false;
        std::optional<execution_result> result;
        std::exception_ptr error;
        execution_state outcome = execution_state::FAILED;

        std::thread runner;
    };

    void transition(ticket &t, execution_state state);

    void dispatch(const std::shared_ptr<ticket> &t);

    /**
     * @brief 执行没有正常结束，要求后端释放资源并等待后端返回
     * @return 执行的终止状态，TIMED_OUT 或者 CANCELED
     */
    execution_state abandon(std::unique_lock<std::mutex> &lock, const std::shared_ptr<ticket> &t);

    std::size_t slots;
    std::shared_ptr<admission_limiter> limiter;
    std::map<backend_kind, execution_backend *> backends;
    std::vector<state_listener> listeners;

    mutable std::mutex mut;
    std::condition_variable cond;
    std::deque<std::shared_ptr<ticket>> waiting;
    std::map<std::string, std::shared_ptr<ticket>> tickets;
    std::size_t running = 0;
    bool closed = false;
};

}  // namespace runner
