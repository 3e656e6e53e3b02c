#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "execution/admission.hpp"
#include "execution/execution_queue.hpp"
#include "execution/interpreter_backend.hpp"
#include "execution/sandbox_backend.hpp"

namespace runner {

struct session_options {
    /**
     * @brief 会话 id，为空时随机生成
     */
    std::string id;

    /**
     * @brief 临时目录的根目录，为空时使用 WORK_DIR
     */
    std::filesystem::path workdir;

    /**
     * @brief 会话内允许同时运行的执行数，为 0 时使用 DEFAULT_MAX_CONCURRENT
     */
    std::size_t max_concurrent = 0;

    /**
     * @brief 远程沙箱服务的客户端，为空时该会话不能使用远程执行
     */
    std::shared_ptr<sandbox_client> sandbox;

    /**
     * @brief 跨会话共享的全局名额，可以为空
     */
    std::shared_ptr<admission_limiter> limiter;
};

/**
 * @brief 一个会话拥有的执行资源
 * 包括会话内复用的进程内解释器、远程沙箱后端和会话的执行队列。
 * 评测时由调用方显式传入 session，而不是使用全局的单例，因此多个会话可以同时存在。
 */
struct session {
    explicit session(session_options options = {});
    ~session();

    const std::string &id() const;

    execution_queue &queue();

    interpreter_backend &interpreter();

    /**
     * @return 远程沙箱后端，未配置沙箱服务时为 nullptr
     */
    sandbox_backend *sandbox();

private:
    std::string session_id;
    std::filesystem::path root;

    // 执行队列引用了两个后端，必须最先销毁
    std::unique_ptr<interpreter_backend> interpreter_ptr;
    std::unique_ptr<sandbox_backend> sandbox_ptr;
    std::unique_ptr<execution_queue> queue_ptr;
};

}  // namespace runner
