#pragma once

#include <nlohmann/json.hpp>
#include "execution/sandbox_client.hpp"

namespace runner {

/**
 * @brief 通过 HTTP 访问沙箱服务的客户端，使用 libcurl
 *
 * POST   {base}/sandboxes                {template, timeoutMs} -> {sandboxId}
 * POST   {base}/sandboxes/{id}/files     {files: [{path, content}]}
 * POST   {base}/sandboxes/{id}/run       {entryPoint, cwd, timeoutMs} -> {stdout, stderr, exitCode, error?, timedOut?}
 * DELETE {base}/sandboxes/{id}
 *
 * 请求通过 X-API-Key 请求头认证。
 */
struct http_sandbox_client : public sandbox_client {
    /**
     * @param base_url 沙箱服务地址，比如 https://sandbox.example.com/v1
     * @param api_key API Key，为空时不发送认证头
     * @param template_name 创建沙箱使用的模板
     * @param workdir 项目文件在沙箱中的目录
     */
    http_sandbox_client(std::string base_url, std::string api_key, std::string template_name, std::string workdir);

    std::string create(int timeout_ms, const std::shared_ptr<cancellation_token> &token) override;

    void write_files(const std::string &sandbox_id, const std::vector<project_file> &files, const std::shared_ptr<cancellation_token> &token) override;

    sandbox_run_result run(const std::string &sandbox_id, const std::string &entry_point, int timeout_ms, const std::shared_ptr<cancellation_token> &token) override;

    void kill(const std::string &sandbox_id) override;

private:
    struct response {
        long status = 0;
        std::string body;
    };

    /**
     * @brief 发送一个请求
     * @param body 请求体，为 nullptr 时不发送请求体
     * @param timeout_ms 整个请求的时间限制
     * @throw transport_failure 网络错误
     * @throw execution_canceled token 在传输过程中被取消
     */
    response send(const std::string &method, const std::string &path, const nlohmann::json *body, long timeout_ms, const std::shared_ptr<cancellation_token> &token);

    std::string base_url;
    std::string api_key;
    std::string template_name;
    std::string workdir;
};

}  // namespace runner
