#pragma once

#include <atomic>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include "execution/backend.hpp"
#include "execution/sandbox_client.hpp"

namespace runner {

/**
 * @brief 持有一个远程沙箱，析构时保证沙箱被销毁
 * 沙箱可能被超时、取消和正常结束三条路径同时要求销毁，release 只会真正执行一次。
 */
struct sandbox_lease {
    sandbox_lease(sandbox_client &client, std::string sandbox_id);
    sandbox_lease(const sandbox_lease &) = delete;
    sandbox_lease &operator=(const sandbox_lease &) = delete;
    ~sandbox_lease();

    const std::string &id() const;

    /**
     * @brief 销毁沙箱，失败时记录错误日志而不抛出异常
     * @return 本次调用是否真正执行了销毁
     */
    bool release();

    bool released() const;

private:
    sandbox_client &client;
    std::string sandbox_id;
    std::atomic<bool> done{false};
};

/**
 * @brief 远程一次性沙箱执行后端
 * 每个请求：创建沙箱（暂时性失败时重试一次）-> 上传文件 -> 运行入口文件 -> 销毁沙箱。
 * 不论以何种方式结束，沙箱都会被销毁。
 * 后端本身没有共享的可变状态，多个请求可以同时执行。
 */
struct sandbox_backend : public execution_backend {
    explicit sandbox_backend(std::shared_ptr<sandbox_client> client);

    backend_kind kind() const override;

    execution_result execute(const execution_request &request) override;

    /**
     * @brief 取消执行：中止正在进行的通信并立即销毁沙箱
     */
    void cancel(const std::string &request_id) override;

    bool supports_parallel() const override;

    /**
     * @brief 当前持有的沙箱数量
     */
    std::size_t active_sandboxes() const;

private:
    struct running_execution {
        std::shared_ptr<cancellation_token> token;
        std::shared_ptr<sandbox_lease> lease;
    };

    std::string provision(const execution_request &request, const std::shared_ptr<cancellation_token> &token, int &attempts);

    std::shared_ptr<sandbox_client> client;

    mutable std::mutex mut;
    std::map<std::string, running_execution> running;
};

}  // namespace runner
