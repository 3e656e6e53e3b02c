#include "common/python.hpp"
#include <glog/logging.h>
#include <boost/python.hpp>
#include "common/exceptions.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;
namespace bp = boost::python;

GIL_guard::GIL_guard() {
    state = PyGILState_Ensure();
}

GIL_guard::~GIL_guard() {
    PyGILState_Release(state);
}

PyThread_guard::PyThread_guard() {
    state = PyEval_SaveThread();
}

PyThread_guard::~PyThread_guard() {
    PyEval_RestoreThread(state);
}

namespace python {

double ensure_initialized() {
    static once_flag flag;
    double cost = 0;
    // 若初始化抛出异常，once_flag 不会被标记，下一次调用会重新尝试
    call_once(flag, [&] {
        elapsed_time timer;
        if (Py_IsInitialized()) return;

        PyConfig config;
        PyConfig_InitPythonConfig(&config);
        // 信号由宿主进程处理，选手代码不能接管 SIGINT
        config.install_signal_handlers = 0;
        config.parse_argv = 0;
        PyStatus status = Py_InitializeFromConfig(&config);
        PyConfig_Clear(&config);
        if (PyStatus_Exception(status))
            throw backend_initialization_error(string("unable to initialize Python: ") + (status.err_msg ? status.err_msg : "unknown error"));

        // 初始化线程默认持有 GIL，释放掉以便其他线程通过 PyGILState_Ensure 获取
        PyEval_SaveThread();
        cost = timer.milliseconds();
        LOG(INFO) << "Python " << Py_GetVersion() << " initialized in " << cost << "ms";
    });
    return cost;
}

string version() {
    string full = Py_GetVersion();
    return full.substr(0, full.find(' '));
}

mutex &execution_mutex() {
    static mutex mut;
    return mut;
}

string fetch_error() {
    PyObject *type = nullptr, *value = nullptr, *trace = nullptr;
    PyErr_Fetch(&type, &value, &trace);
    if (!type) return "Unknown Python error";
    PyErr_NormalizeException(&type, &value, &trace);

    bp::object otype{bp::handle<>(type)};
    bp::object ovalue = value ? bp::object(bp::handle<>(value)) : bp::object();
    bp::object otrace = trace ? bp::object(bp::handle<>(trace)) : bp::object();
    try {
        bp::object traceback = bp::import("traceback");
        bp::object lines = traceback.attr("format_exception")(otype, ovalue, otrace);
        return bp::extract<string>(bp::str("").attr("join")(lines));
    } catch (bp::error_already_set &) {
        PyErr_Clear();
        return "Python error that could not be formatted";
    }
}

}  // namespace python

}  // namespace runner
