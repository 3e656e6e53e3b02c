#include "execution/interpreter_backend.hpp"
#include <glog/logging.h>
#include <boost/python.hpp>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/python.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/project.hpp"

namespace runner {
using namespace std;
namespace bp = boost::python;

/**
 * 驱动模块，负责在解释器中运行一次选手代码
 * run(root, entry) 返回 (stdout, stderr, error, cancelled)
 * error 为 None 表示正常结束，否则为只包含选手文件的异常栈
 */
static const char *DRIVER_SOURCE = R"PY(
import io
import os
import runpy
import sys
import traceback


class ExecutionCancelled(BaseException):
    pass


in_user_code = False


def _summarize(exc, root):
    prefix = os.path.join(root, '')
    frames = [f for f in traceback.extract_tb(exc.__traceback__) if f.filename.startswith(prefix)]
    lines = []
    if frames:
        lines.append('Traceback (most recent call last):\n')
        lines.extend(traceback.format_list(frames))
    lines.extend(traceback.format_exception_only(type(exc), exc))
    return ''.join(lines).replace(prefix, '')


def _restore(saved, root):
    sys.stdin, sys.stdout, sys.stderr = saved[0], saved[1], saved[2]
    sys.argv = saved[3]
    sys.path[:] = saved[4]
    os.chdir(saved[5])
    prefix = os.path.join(root, '')
    for name, module in list(sys.modules.items()):
        if (getattr(module, '__file__', None) or '').startswith(prefix):
            sys.modules.pop(name, None)


def run(root, entry):
    global in_user_code
    out, err = io.StringIO(), io.StringIO()
    saved = (sys.stdin, sys.stdout, sys.stderr, sys.argv, list(sys.path), os.getcwd())
    path = os.path.join(root, entry)
    error = None
    cancelled = False
    sys.stdin, sys.stdout, sys.stderr = io.StringIO(), out, err
    sys.argv = [path]
    sys.path.insert(0, root)
    if os.path.dirname(path) != root:
        sys.path.insert(0, os.path.dirname(path))
    os.chdir(root)
    try:
        try:
            in_user_code = True
            runpy.run_path(path, run_name='__main__')
        finally:
            in_user_code = False
    except ExecutionCancelled:
        cancelled = True
    except SystemExit as e:
        if isinstance(e.code, str):
            error = e.code
        elif e.code not in (None, 0):
            error = 'SystemExit: %s' % e.code
    except BaseException as e:
        error = _summarize(e, root)
    finally:
        while True:
            try:
                _restore(saved, root)
                break
            except ExecutionCancelled:
                cancelled = True
    return out.getvalue(), err.getvalue(), error, cancelled
)PY";

interpreter_backend::interpreter_backend(filesystem::path workdir)
    : workdir(move(workdir)) {}

interpreter_backend::~interpreter_backend() {
    string id;
    {
        scoped_lock lock(mut);
        id = running_id;
    }
    if (!id.empty()) cancel(id);

    jobs.close();
    if (worker.joinable()) worker.join();
}

backend_kind interpreter_backend::kind() const {
    return backend_kind::INTERPRETER;
}

bool interpreter_backend::supports_parallel() const {
    return false;
}

interpreter_backend::state interpreter_backend::get_state() const {
    scoped_lock lock(mut);
    return current;
}

double interpreter_backend::initialize() {
    shared_future<double> future;
    {
        scoped_lock lock(mut);
        if (current == state::UNINITIALIZED) {
            // 上一次加载失败的线程已经或者即将退出
            if (worker.joinable()) worker.join();

            current = state::INITIALIZING;
            auto ready = make_shared<promise<double>>();
            initialization = ready->get_future().share();
            worker = thread([this, ready] { worker_loop(ready); });
        }
        future = initialization;
    }
    return future.get();
}

void interpreter_backend::load_driver() {
    try {
        bp::object module = bp::import("types").attr("ModuleType")("_runner_driver");
        bp::dict ns = bp::extract<bp::dict>(module.attr("__dict__"));
        ns["__builtins__"] = bp::import("builtins");
        bp::exec(DRIVER_SOURCE, ns, ns);
        driver = module.ptr();
        Py_INCREF(driver);
    } catch (bp::error_already_set &) {
        throw backend_initialization_error("unable to load interpreter driver: " + python::fetch_error());
    }
}

void interpreter_backend::worker_loop(shared_ptr<promise<double>> ready) {
    elapsed_time timer;
    try {
        python::ensure_initialized();
    } catch (std::exception &ex) {
        LOG(ERROR) << "Interpreter initialization failed: " << ex.what();
        {
            scoped_lock lock(mut);
            current = state::UNINITIALIZED;
        }
        ready->set_exception(current_exception());
        return;
    }

    // 在线程退出前一直保留本线程的 PyThreadState，这样 thread_ident 始终有效
    GIL_guard thread_state;
    {
        try {
            load_driver();
        } catch (std::exception &ex) {
            LOG(ERROR) << "Interpreter initialization failed: " << ex.what();
            {
                scoped_lock lock(mut);
                current = state::UNINITIALIZED;
            }
            ready->set_exception(current_exception());
            return;
        }
        scoped_lock lock(mut);
        thread_ident = PyThread_get_thread_ident();
        current = state::READY;
    }
    double load_ms = timer.milliseconds();
    LOG(INFO) << "Interpreter backend at " << workdir << " is ready, loaded in " << load_ms << "ms";
    ready->set_value(load_ms);

    {
        PyThread_guard unlocked;

        shared_ptr<job> next;
        while (jobs.pop(next)) {
            try {
                execution_result result = run(next->request);
                auto &meta = get<interpreter_metadata>(result.metadata);
                meta.load_time_ms = load_ms;
                next->result.set_value(move(result));
            } catch (std::exception &ex) {
                LOG(INFO) << "Interpreter execution " << next->request.id << " aborted: " << ex.what();
                next->result.set_exception(current_exception());
            }
            next.reset();
        }
    }

    Py_CLEAR(driver);
}

execution_result interpreter_backend::run(const execution_request &request) {
    // 在拿到解释器之前请求一直留在 pending_ids 中，等待其他会话的执行时也可以被取消
    defer {
        scoped_lock lock(mut);
        pending_ids.erase(request.id);
        cancelled_ids.erase(request.id);
    };
    {
        scoped_lock lock(mut);
        if (cancelled_ids.count(request.id))
            throw execution_canceled("Execution " + request.id + " was canceled before it started");
    }

    validate_request(request);
    const project_file &entry = resolve_entry_point(request.files, request.entry_point);

    filesystem::path root = workdir / ("run-" + random_uuid());
    defer {
        if (DEBUG) return;
        error_code ec;
        filesystem::remove_all(root, ec);
        if (ec) LOG(ERROR) << "Unable to remove " << root << ": " << ec.message();
    };
    for (auto &file : request.files)
        write_file_content(root / file.path, file.content);

    execution_result result;
    interpreter_metadata meta;
    meta.python_version = python::version();
    bool cancelled = false;

    scoped_lock exclusive(python::execution_mutex());
    GIL_guard gil;
    {
        scoped_lock lock(mut);
        pending_ids.erase(request.id);
        if (cancelled_ids.erase(request.id))
            throw execution_canceled("Execution " + request.id + " was canceled before it started");
        meta.reused = executions++ > 0;
        running_id = request.id;
    }
    defer {
        scoped_lock lock(mut);
        running_id.clear();
        // 丢弃已经注入但还没有被触发的取消异常
        PyThreadState_SetAsyncExc(thread_ident, nullptr);
    };

    bp::object module(bp::handle<>(bp::borrowed(driver)));
    bp::object cancelled_type = module.attr("ExecutionCancelled");
    elapsed_time timer;
    try {
        bp::tuple ret = bp::extract<bp::tuple>(module.attr("run")(root.string(), entry.path));
        result.stdout_text = bp::extract<string>(ret[0]);
        result.stderr_text = bp::extract<string>(ret[1]);
        if (!bp::object(ret[2]).is_none())
            result.error_summary = bp::extract<string>(ret[2])();
        cancelled = bp::extract<bool>(ret[3]);
    } catch (bp::error_already_set &) {
        if (PyErr_ExceptionMatches(cancelled_type.ptr())) {
            PyErr_Clear();
            cancelled = true;
        } else {
            throw runtime_fault("interpreter driver failed: " + python::fetch_error());
        }
    }
    result.duration_ms = timer.milliseconds();
    result.metadata = meta;

    if (cancelled)
        throw execution_canceled("Execution " + request.id + " was canceled");

    LOG(INFO) << "Interpreter execution " << request.id << " finished in " << result.duration_ms << "ms"
              << (result.error_summary ? " with error" : "");
    return result;
}

execution_result interpreter_backend::execute(const execution_request &request) {
    validate_request(request);
    initialize();

    auto next = make_shared<job>();
    next->request = request;
    auto future = next->result.get_future();
    {
        scoped_lock lock(mut);
        pending_ids.insert(request.id);
    }
    if (!jobs.push(next)) {
        scoped_lock lock(mut);
        pending_ids.erase(request.id);
        throw runtime_fault("Interpreter backend is shutting down");
    }
    return future.get();
}

void interpreter_backend::cancel(const string &request_id) {
    {
        scoped_lock lock(mut);
        if (current != state::READY) return;
        if (pending_ids.count(request_id)) {
            cancelled_ids.insert(request_id);
            return;
        }
        if (running_id != request_id) return;
    }

    // 加锁顺序始终为 GIL -> mut
    GIL_guard gil;
    scoped_lock lock(mut);
    if (running_id != request_id || !driver) return;
    try {
        bp::object module(bp::handle<>(bp::borrowed(driver)));
        if (!bp::extract<bool>(module.attr("in_user_code"))) return;
        bp::object type = module.attr("ExecutionCancelled");
        PyThreadState_SetAsyncExc(thread_ident, type.ptr());
        LOG(INFO) << "Interrupting interpreter execution " << request_id;
    } catch (bp::error_already_set &) {
        LOG(ERROR) << "Unable to interrupt interpreter execution " << request_id << ": " << python::fetch_error();
    }
}

}  // namespace runner
