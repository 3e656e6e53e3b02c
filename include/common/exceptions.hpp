#pragma once

#include <boost/lexical_cast.hpp>
#include <boost/stacktrace.hpp>
#include <memory>
#include <sstream>
#include <stdexcept>

namespace runner {

struct runner_exception : std::exception {
    runner_exception();
    explicit runner_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const runner_exception &ex);

    template <typename T>
    runner_exception operator<<(const T &t) const {
        return runner_exception(message + boost::lexical_cast<std::string>(t));
    }

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 项目文件不合法：路径不安全、扩展名不允许、入口文件不存在等
 * 在调用任何执行后端之前抛出
 */
struct validation_error : public runner_exception {
    explicit validation_error(const std::string &message);
};

/**
 * @brief 调用方违反了接口约定，比如提交时没有任何测试
 * 这是唯一一种会从 submission_orchestrator::run 抛给调用方的异常
 */
struct contract_violation : public runner_exception {
    explicit contract_violation(const std::string &message);
};

/**
 * @brief 执行后端初始化失败，比如解释器无法加载
 */
struct backend_initialization_error : public runner_exception {
    explicit backend_initialization_error(const std::string &message);
};

/**
 * @brief 远程沙箱创建失败，表示沙箱服务不可用
 * transient 为真时表示暂时性错误（网络错误、限流、服务端错误），允许重试一次
 */
struct provisioning_error : public backend_initialization_error {
    provisioning_error(const std::string &message, bool transient);

    bool transient;
};

/**
 * @brief 执行超时
 * 抛出该异常之前，执行队列一定已经要求后端释放了对应的资源
 */
struct execution_timeout : public runner_exception {
    explicit execution_timeout(const std::string &message);
};

/**
 * @brief 执行被取消
 */
struct execution_canceled : public runner_exception {
    explicit execution_canceled(const std::string &message);
};

/**
 * @brief 执行后端自身出错（不是选手代码的错误）
 */
struct runtime_fault : public runner_exception {
    explicit runtime_fault(const std::string &message);
};

/**
 * @brief 与远程沙箱服务通信失败，通常由 CURL 产生
 */
struct transport_failure : public runner_exception {
    explicit transport_failure(const std::string &message);
};

/**
 * @brief 提交记录持久化失败，仅作为警告返回给调用方
 */
struct persistence_error : public runner_exception {
    explicit persistence_error(const std::string &message);
};

}  // namespace runner
