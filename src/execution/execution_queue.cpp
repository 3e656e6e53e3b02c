#include "execution/execution_queue.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <chrono>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/project.hpp"

namespace runner {
using namespace std;

execution_queue::execution_queue(size_t max_concurrent, shared_ptr<admission_limiter> limiter)
    : slots(max_concurrent > 0 ? max_concurrent : 1), limiter(move(limiter)) {}

execution_queue::~execution_queue() {
    vector<shared_ptr<cancellation_token>> tokens;
    {
        scoped_lock lock(mut);
        closed = true;
        for (auto &[id, t] : tickets) tokens.push_back(t->token);
    }
    for (auto &token : tokens) token->cancel(cancel_reason::SHUTDOWN);

    unique_lock lock(mut);
    cond.wait(lock, [this] { return running == 0 && tickets.empty(); });
}

void execution_queue::register_backend(execution_backend &backend) {
    scoped_lock lock(mut);
    backends[backend.kind()] = &backend;
}

bool execution_queue::has_backend(backend_kind kind) const {
    scoped_lock lock(mut);
    return backends.count(kind);
}

bool execution_queue::supports_parallel(backend_kind kind) const {
    scoped_lock lock(mut);
    auto it = backends.find(kind);
    return it != backends.end() && it->second->supports_parallel();
}

void execution_queue::on_state_changed(state_listener listener) {
    scoped_lock lock(mut);
    listeners.push_back(move(listener));
}

size_t execution_queue::max_concurrent() const {
    return slots;
}

size_t execution_queue::running_count() const {
    scoped_lock lock(mut);
    return running;
}

size_t execution_queue::queued_count() const {
    scoped_lock lock(mut);
    return waiting.size();
}

void execution_queue::transition(ticket &t, execution_state state) {
    t.state = state;
    LOG(INFO) << "Execution " << t.request.id << " [" << to_string(t.request.backend) << "]: " << get_display_message(state);
    for (auto &listener : listeners) listener(t.request, state);
}

void execution_queue::dispatch(const shared_ptr<ticket> &t) {
    ++running;
    transition(*t, execution_state::RUNNING);

    t->runner = thread([this, t] {
        optional<execution_result> result;
        exception_ptr error;
        execution_state outcome = execution_state::COMPLETED;
        try {
            result = t->backend->execute(t->request);
        } catch (execution_canceled &) {
            error = current_exception();
            outcome = execution_state::CANCELED;
        } catch (execution_timeout &) {
            error = current_exception();
            outcome = execution_state::TIMED_OUT;
        } catch (std::exception &) {
            error = current_exception();
            outcome = execution_state::FAILED;
        }
        if (limiter) limiter->release();

        {
            scoped_lock lock(mut);
            t->result = move(result);
            t->error = error;
            t->outcome = outcome;
            t->done = true;
            --running;
        }
        cond.notify_all();
    });
}

execution_state execution_queue::abandon(unique_lock<mutex> &lock, const shared_ptr<ticket> &t) {
    const string &id = t->request.id;

    // 取消令牌时不能持有 mut，令牌的回调需要获取 mut
    lock.unlock();
    t->token->cancel(cancel_reason::TIMEOUT);
    execution_state final_state = t->token->reason() == cancel_reason::TIMEOUT ? execution_state::TIMED_OUT : execution_state::CANCELED;

    // 后端可能还没有开始执行该请求，因此在等待期间反复要求后端中止
    auto grace = chrono::steady_clock::now() + chrono::milliseconds(TEARDOWN_GRACE_MS);
    lock.lock();
    while (!t->done && chrono::steady_clock::now() < grace) {
        lock.unlock();
        t->backend->cancel(id);
        lock.lock();
        cond.wait_for(lock, chrono::milliseconds(50), [&] { return t->done; });
    }
    bool released = t->done;
    lock.unlock();

    if (released) {
        t->runner.join();
    } else {
        // 名额会在后端真正返回时归还
        LOG(ERROR) << "Backend did not release execution " << id << " within " << TEARDOWN_GRACE_MS << "ms";
        t->runner.detach();
    }

    lock.lock();
    transition(*t, final_state);
    return final_state;
}

execution_result execution_queue::execute(execution_request request, const shared_ptr<cancellation_token> &token) {
    if (request.id.empty()) request.id = random_uuid();
    if (request.timeout_ms <= 0) request.timeout_ms = DEFAULT_TIMEOUT_MS;
    validate_request(request);

    auto t = make_shared<ticket>();
    t->request = move(request);
    const string id = t->request.id;
    const int timeout_ms = t->request.timeout_ms;

    t->callback_id = t->token->on_cancel([this](cancel_reason) {
        { scoped_lock lock(mut); }
        cond.notify_all();
    });
    defer { t->token->remove_callback(t->callback_id); };
    // 调用方的令牌被取消时取消本次执行，令牌已经被取消时会立即生效
    cancellation_registration link(token, [t](cancel_reason reason) { t->token->cancel(reason); });

    unique_lock lock(mut);
    auto backend = backends.find(t->request.backend);
    if (backend == backends.end())
        throw backend_initialization_error(fmt::format("Backend {} is not available", to_string(t->request.backend)));
    t->backend = backend->second;
    if (closed)
        throw execution_canceled("Execution queue is shutting down");
    if (tickets.count(id))
        throw validation_error("Execution " + id + " is already queued");

    tickets[id] = t;
    waiting.push_back(t);
    transition(*t, execution_state::QUEUED);

    while (true) {
        if (t->token->is_cancelled()) {
            waiting.erase(find(waiting.begin(), waiting.end(), t));
            transition(*t, execution_state::CANCELED);
            tickets.erase(id);
            cond.notify_all();
            throw execution_canceled("Execution " + id + " was canceled while queued");
        }
        if (waiting.front() == t && running < slots) {
            if (!limiter) break;

            lock.unlock();
            bool acquired = limiter->acquire(t->token);
            lock.lock();
            if (acquired && !t->token->is_cancelled()) break;
            if (acquired) limiter->release();
            continue;
        }
        cond.wait(lock);
    }
    waiting.pop_front();
    dispatch(t);
    cond.notify_all();

    auto deadline = chrono::steady_clock::now() + chrono::milliseconds(timeout_ms);
    cond.wait_until(lock, deadline, [&] { return t->done || t->token->is_cancelled(); });

    if (!t->done) {
        execution_state final_state = abandon(lock, t);
        tickets.erase(id);
        cond.notify_all();
        if (final_state == execution_state::TIMED_OUT)
            throw execution_timeout(fmt::format("Execution {} exceeded the time limit of {}ms", id, timeout_ms));
        throw execution_canceled("Execution " + id + " was canceled");
    }

    lock.unlock();
    t->runner.join();
    lock.lock();
    transition(*t, t->outcome);
    tickets.erase(id);
    cond.notify_all();

    if (t->error) rethrow_exception(t->error);
    return move(*t->result);
}

bool execution_queue::cancel(const string &request_id, cancel_reason reason) {
    shared_ptr<cancellation_token> token;
    {
        scoped_lock lock(mut);
        auto it = tickets.find(request_id);
        if (it == tickets.end()) return false;
        token = it->second->token;
    }
    token->cancel(reason);
    return true;
}

}  // namespace runner
