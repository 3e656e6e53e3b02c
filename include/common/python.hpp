#pragma once

#include <Python.h>
#include <mutex>
#include <string>

namespace runner {

/**
 * @brief 在作用域内持有 GIL
 * 任何调用 CPython API 的线程都必须先获得 GIL
 */
class GIL_guard {
public:
    GIL_guard();
    ~GIL_guard();

private:
    PyGILState_STATE state;
};

/**
 * @brief 在作用域内释放 GIL，允许其他线程执行 Python 代码
 */
class PyThread_guard {
public:
    PyThread_guard();
    ~PyThread_guard();

private:
    PyThreadState *state;
};

namespace python {

/**
 * @brief 初始化进程内的 CPython 解释器，只会真正初始化一次
 * 初始化完成后当前线程会释放 GIL，之后所有线程通过 GIL_guard 访问解释器。
 * 进程退出前不会调用 Py_Finalize，由操作系统回收。
 * @return 本次调用花费在初始化上的毫秒数，已经初始化过时为 0
 */
double ensure_initialized();

/**
 * @brief 解释器的版本号，比如 3.11.2
 */
std::string version();

/**
 * @brief 序列化选手代码执行的互斥锁
 * CPython 的 sys.stdout、sys.path、sys.modules 是整个进程共享的，
 * 因此即使存在多个会话，同一时刻也只能有一个执行在解释器里运行。
 */
std::mutex &execution_mutex();

/**
 * @brief 取出当前线程上挂起的 Python 异常并格式化为文本，同时清除异常状态
 * 调用方必须持有 GIL
 */
std::string fetch_error();

}  // namespace python

}  // namespace runner
