#pragma once

#include <string>
#include "execution/request.hpp"

namespace runner {

/**
 * @brief 执行后端
 * 执行后端负责真正运行选手代码并捕获输出，目前有两种实现：
 * 1. interpreter_backend: 进程内嵌入的 CPython，会话内复用，同一时刻只执行一个请求
 * 2. sandbox_backend: 远程一次性沙箱，每个请求创建并销毁一个沙箱
 *
 * execute 可以抛出的异常：
 * validation_error: 项目文件不合法，此时不会写入任何文件
 * backend_initialization_error: 后端初始化失败（解释器无法加载、沙箱服务不可用）
 * execution_canceled: 执行被 cancel 中止
 * runtime_fault: 后端自身出错
 * transport_failure: 与远程服务通信失败
 * 选手代码本身的错误不会作为异常抛出，而是写入 execution_result::error_summary。
 */
struct execution_backend {
    /**
     * @brief 后端类型
     */
    virtual backend_kind kind() const = 0;

    /**
     * @brief 执行一次请求，阻塞直到执行结束
     * 后端需要在返回前释放本次执行占用的所有资源（临时文件、沙箱）
     * @param request 执行请求，调用方保证 request.id 非空
     * @return 捕获到的输出
     */
    virtual execution_result execute(const execution_request &request) = 0;

    /**
     * @brief 中止指定 id 的执行
     * 可以在任意线程调用。若该请求还没开始执行，后端应在开始时直接放弃；
     * 若请求已经结束或者不存在，什么也不做。
     * 调用返回时不保证执行已经结束，execute 会在资源释放后抛出 execution_canceled。
     */
    virtual void cancel(const std::string &request_id) = 0;

    /**
     * @brief 后端是否支持同时运行多个相互隔离的执行
     */
    virtual bool supports_parallel() const = 0;

    virtual ~execution_backend();
};

}  // namespace runner
