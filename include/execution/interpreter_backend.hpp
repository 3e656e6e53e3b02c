#pragma once

#include <Python.h>
#include <filesystem>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include "common/concurrent_queue.hpp"
#include "execution/backend.hpp"

namespace runner {

/**
 * @brief 进程内嵌入 CPython 的执行后端
 *
 * 每个实例拥有一个专用的 worker 线程，所有执行请求都会通过队列交给该线程依次执行，
 * 因此同一个实例内的执行不会交错，不论外部的执行队列允许多少并发。
 *
 * 状态：UNINITIALIZED -> INITIALIZING -> READY
 * 第一次执行时才会启动 worker 线程并加载解释器，加载期间到达的其他调用会等待同一次加载，
 * 而不会重复加载。加载失败时回到 UNINITIALIZED，下一次执行会重新尝试。
 *
 * 每次执行：
 * 1. 检查项目文件，不合法时不写入任何文件
 * 2. 将文件写入 workdir/run-<uuid>
 * 3. 将 sys.stdout/sys.stderr 重定向到本次执行独有的缓冲区，并以 __main__ 运行入口文件
 * 4. 恢复 sys 的状态，从 sys.modules 中移除本次执行导入的选手模块，删除临时目录
 *
 * 取消通过 PyThreadState_SetAsyncExc 向 worker 线程注入 ExecutionCancelled 异常实现，
 * 因此处于阻塞系统调用中的代码要等到调用返回后才会被中止。
 */
struct interpreter_backend : public execution_backend {
    enum class state {
        UNINITIALIZED,
        INITIALIZING,
        READY
    };

    /**
     * @param workdir 本实例存放临时目录的位置，通常为 WORK_DIR/<会话 id>
     */
    explicit interpreter_backend(std::filesystem::path workdir);
    ~interpreter_backend();

    backend_kind kind() const override;

    execution_result execute(const execution_request &request) override;

    void cancel(const std::string &request_id) override;

    bool supports_parallel() const override;

    /**
     * @brief 确保解释器已经加载，阻塞直到加载完成
     * @return 本实例加载解释器花费的毫秒数
     * @throw backend_initialization_error 加载失败
     */
    double initialize();

    state get_state() const;

private:
    struct job {
        execution_request request;
        std::promise<execution_result> result;
    };

    void worker_loop(std::shared_ptr<std::promise<double>> ready);

    void load_driver();

    execution_result run(const execution_request &request);

    std::filesystem::path workdir;

    mutable std::mutex mut;
    state current = state::UNINITIALIZED;
    std::shared_future<double> initialization;

    /**
     * @brief 当前正在解释器中运行的请求 id，访问时需要同时持有 GIL 与 mut
     */
    std::string running_id;

    /**
     * @brief 已经交给 worker 线程但还没开始运行的请求
     */
    std::set<std::string> pending_ids;

    /**
     * @brief 开始运行前就被取消的请求
     */
    std::set<std::string> cancelled_ids;

    /**
     * @brief worker 线程在 CPython 中的线程 id
     */
    unsigned long thread_ident = 0;

    /**
     * @brief 已经完成的执行数，用于判断解释器是否被复用
     */
    std::size_t executions = 0;

    /**
     * @brief 驱动模块，只能在持有 GIL 时访问，由 worker 线程创建和释放
     */
    PyObject *driver = nullptr;

    concurrent_queue<std::shared_ptr<job>> jobs;
    std::thread worker;
};

}  // namespace runner
