#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "execution/request.hpp"

namespace runner {

/**
 * @brief 远程沙箱中一次运行的结果
 */
struct sandbox_run_result {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;

    /**
     * @brief 沙箱服务报告的错误，比如选手代码抛出的异常
     */
    std::optional<std::string> error;

    /**
     * @brief 沙箱服务是否因为超时而中止了运行
     */
    bool timed_out = false;
};

/**
 * @brief 远程沙箱服务的客户端
 * 沙箱服务负责创建一次性的隔离环境，sandbox_backend 通过这个接口来使用沙箱服务，
 * 测试时可以替换为 mock。
 * 所有操作都需要观察 token，token 被取消后应尽快返回并抛出 execution_canceled。
 */
struct sandbox_client {
    /**
     * @brief 创建一个沙箱
     * @param timeout_ms 沙箱的存活时间，超时后由沙箱服务自动回收
     * @return 沙箱 id
     * @throw provisioning_error 沙箱服务不可用，transient 表示是否允许重试
     */
    virtual std::string create(int timeout_ms, const std::shared_ptr<cancellation_token> &token) = 0;

    /**
     * @brief 上传项目文件
     * @throw transport_failure 上传失败
     */
    virtual void write_files(const std::string &sandbox_id, const std::vector<project_file> &files, const std::shared_ptr<cancellation_token> &token) = 0;

    /**
     * @brief 在沙箱中运行入口文件，由沙箱服务负责限制运行时间
     * @param entry_point 入口文件的完整路径
     * @throw transport_failure 与沙箱服务通信失败
     */
    virtual sandbox_run_result run(const std::string &sandbox_id, const std::string &entry_point, int timeout_ms, const std::shared_ptr<cancellation_token> &token) = 0;

    /**
     * @brief 销毁沙箱，可以在任意线程调用
     * @throw transport_failure 通信失败
     */
    virtual void kill(const std::string &sandbox_id) = 0;

    virtual ~sandbox_client();
};

}  // namespace runner
