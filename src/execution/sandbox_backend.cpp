#include "execution/sandbox_backend.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/project.hpp"

namespace runner {
using namespace std;

static int timeout_of(const execution_request &request) {
    return request.timeout_ms > 0 ? request.timeout_ms : DEFAULT_TIMEOUT_MS;
}

sandbox_lease::sandbox_lease(sandbox_client &client, string sandbox_id)
    : client(client), sandbox_id(move(sandbox_id)) {}

sandbox_lease::~sandbox_lease() {
    release();
}

const string &sandbox_lease::id() const {
    return sandbox_id;
}

bool sandbox_lease::release() {
    if (done.exchange(true)) return false;
    try {
        client.kill(sandbox_id);
        LOG(INFO) << "Sandbox " << sandbox_id << " released";
    } catch (std::exception &ex) {
        LOG(ERROR) << "Unable to release sandbox " << sandbox_id << ": " << ex.what();
    }
    return true;
}

bool sandbox_lease::released() const {
    return done.load();
}

sandbox_backend::sandbox_backend(shared_ptr<sandbox_client> client)
    : client(move(client)) {}

backend_kind sandbox_backend::kind() const {
    return backend_kind::SANDBOX;
}

bool sandbox_backend::supports_parallel() const {
    return true;
}

size_t sandbox_backend::active_sandboxes() const {
    scoped_lock lock(mut);
    size_t count = 0;
    for (auto &[id, exec] : running)
        if (exec.lease && !exec.lease->released()) ++count;
    return count;
}

string sandbox_backend::provision(const execution_request &request, const shared_ptr<cancellation_token> &token, int &attempts) {
    // 沙箱的存活时间留出上传文件与回收的余量
    int lifetime_ms = timeout_of(request) + 2 * TEARDOWN_GRACE_MS;
    for (attempts = 1;; ++attempts) {
        try {
            return client->create(lifetime_ms, token);
        } catch (provisioning_error &ex) {
            if (!ex.transient || attempts >= 2 || token->is_cancelled()) throw;
            LOG(WARNING) << "Provisioning sandbox for " << request.id << " failed, retrying: " << ex.what();
        }
    }
}

execution_result sandbox_backend::execute(const execution_request &request) {
    validate_request(request);
    const project_file &entry = resolve_entry_point(request.files, request.entry_point);

    auto token = make_shared<cancellation_token>();
    {
        scoped_lock lock(mut);
        if (running.count(request.id))
            throw runtime_fault("Execution " + request.id + " is already running");
        running[request.id].token = token;
    }
    defer {
        scoped_lock lock(mut);
        running.erase(request.id);
    };

    execution_result result;
    sandbox_metadata meta;

    elapsed_time provision_timer;
    string sandbox_id = provision(request, token, meta.provision_attempts);
    meta.provision_ms = provision_timer.milliseconds();
    meta.sandbox_id = sandbox_id;

    auto lease = make_shared<sandbox_lease>(*client, sandbox_id);
    {
        scoped_lock lock(mut);
        running[request.id].lease = lease;
    }
    defer { lease->release(); };
    LOG(INFO) << "Execution " << request.id << " provisioned sandbox " << sandbox_id << " in " << meta.provision_ms << "ms";

    // cancel 可能在创建沙箱的过程中到达，此时还没有登记 lease
    if (token->is_cancelled())
        throw execution_canceled("Execution " + request.id + " was canceled");

    elapsed_time timer;
    sandbox_run_result ret;
    try {
        client->write_files(sandbox_id, request.files, token);
        timer = elapsed_time();
        ret = client->run(sandbox_id, entry.path, timeout_of(request), token);
    } catch (transport_failure &) {
        // 沙箱被取消操作销毁后，进行中的请求会以通信失败的形式结束
        if (token->is_cancelled())
            throw execution_canceled("Execution " + request.id + " was canceled");
        throw;
    }
    result.duration_ms = timer.milliseconds();

    if (token->is_cancelled())
        throw execution_canceled("Execution " + request.id + " was canceled");

    // 沙箱自身判定的超时与执行队列的超时同样处理，抛出前 lease 会被释放
    if (ret.timed_out)
        throw execution_timeout(fmt::format("Execution {} exceeded the time limit of {}ms in sandbox {}", request.id, timeout_of(request), sandbox_id));

    result.stdout_text = move(ret.stdout_text);
    result.stderr_text = move(ret.stderr_text);
    meta.exit_code = ret.exit_code;
    if (ret.error)
        result.error_summary = *ret.error;
    else if (ret.exit_code != 0)
        result.error_summary = "Process exited with code " + std::to_string(ret.exit_code);
    result.metadata = meta;

    LOG(INFO) << "Sandbox execution " << request.id << " finished in " << result.duration_ms << "ms with exit code " << ret.exit_code;
    return result;
}

void sandbox_backend::cancel(const string &request_id) {
    shared_ptr<cancellation_token> token;
    shared_ptr<sandbox_lease> lease;
    {
        scoped_lock lock(mut);
        auto it = running.find(request_id);
        if (it == running.end()) return;
        token = it->second.token;
        lease = it->second.lease;
    }
    token->cancel(cancel_reason::USER);
    if (lease && lease->release())
        LOG(INFO) << "Sandbox " << lease->id() << " of execution " << request_id << " was torn down by cancellation";
}

}  // namespace runner
