#include "judge/orchestrator.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <thread>
#include "common/defer.hpp"
#include "common/exceptions.hpp"
#include "common/utils.hpp"
#include "config.hpp"
#include "execution/project.hpp"

namespace runner {
using namespace std;

static const char *HIDDEN_TEST_MESSAGE = "Hidden test did not pass";
static const char *AGGREGATE_TIMEOUT_MESSAGE = "Not run: the submission time limit was exceeded";
static const char *EARLIER_TIMEOUT_MESSAGE = "Not run: an earlier test timed out";

// 测试未运行的原因
enum class stop_reason {
    NONE,
    AGGREGATE_TIMEOUT,
    EARLIER_TIMEOUT
};

submission_status derive_status(const submission_summary &summary, bool canceled, bool top_level_error, bool top_level_timeout) {
    if (canceled) return submission_status::CANCELED;
    if (summary.total > 0 && summary.passed == summary.total) return submission_status::SUCCESS;
    if (summary.passed == 0 && top_level_error) return submission_status::EXECUTION_ERROR;
    if (summary.passed == 0 && top_level_timeout) return submission_status::TIMED_OUT;
    return submission_status::PARTIAL;
}

submission_orchestrator::submission_orchestrator(execution_queue &queue, submission_store *store, progress_tracker *progress)
    : queue(queue), store(store), progress(progress), builder(VERDICT_MARKER), parser(VERDICT_MARKER) {}

bool submission_orchestrator::cancel(const string &submission_id) {
    shared_ptr<cancellation_token> token;
    {
        scoped_lock lock(mut);
        auto it = submissions.find(submission_id);
        if (it == submissions.end()) return false;
        token = it->second;
    }
    LOG(INFO) << "Canceling submission " << submission_id;
    token->cancel(cancel_reason::USER);
    return true;
}

optional<test_outcome> submission_orchestrator::run_test(const shared_ptr<cancellation_token> &token,
                                                         const vector<project_file> &files,
                                                         const test_definition &test,
                                                         backend_kind backend,
                                                         const string &entry_point,
                                                         int timeout_ms) {
    test_outcome outcome;
    outcome.id = test.id;
    outcome.name = test.name;

    try {
        harness h = builder.build(files, entry_point, test, backend, timeout_ms);
        execution_result result = queue.execute(h.request, token);
        outcome = parser.parse(test, result, h.nonce);
    } catch (execution_timeout &) {
        outcome.status = test_status::TIMED_OUT;
        outcome.message = fmt::format("Test exceeded the time limit of {}ms", timeout_ms);
        outcome.duration_ms = timeout_ms;
    } catch (execution_canceled &) {
        if (token->is_cancelled()) return {};
        outcome.status = test_status::ERRORED;
        outcome.message = "Execution was canceled";
    } catch (std::exception &ex) {
        LOG(WARNING) << "Test " << test.id << " could not be executed: " << ex.what();
        outcome.status = test_status::ERRORED;
        outcome.message = ex.what();
    }

    if (test.hidden && outcome.status != test_status::PASSED)
        outcome.message = HIDDEN_TEST_MESSAGE;
    return outcome;
}

submission_result submission_orchestrator::run(const vector<project_file> &files,
                                               const vector<test_definition> &tests,
                                               backend_kind backend,
                                               const submission_limits &limits,
                                               const submission_context &context) {
    if (tests.empty())
        throw contract_violation("A submission requires at least one test");

    submission_record record;
    record.submission_id = context.submission_id.empty() ? random_uuid() : context.submission_id;
    record.user_id = context.user_id;
    record.lesson_id = context.lesson_id;
    record.backend = backend;
    record.files = files;
    record.started_at = chrono::system_clock::now();
    const string &id = record.submission_id;

    auto token = make_shared<cancellation_token>();
    {
        scoped_lock lock(mut);
        if (submissions.count(id))
            throw contract_violation("Submission " + id + " is already running");
        submissions[id] = token;
    }
    defer {
        scoped_lock lock(mut);
        submissions.erase(id);
    };

    submission_result result;
    result.submission_id = id;

    const int timeout_ms = limits.timeout_ms > 0 ? limits.timeout_ms : DEFAULT_TIMEOUT_MS;
    const int submission_timeout_ms = limits.submission_timeout_ms > 0 ? limits.submission_timeout_ms : DEFAULT_SUBMISSION_TIMEOUT_MS;
    const auto deadline = chrono::steady_clock::now() + chrono::milliseconds(submission_timeout_ms);
    auto remaining = [&] {
        return (int)chrono::duration_cast<chrono::milliseconds>(deadline - chrono::steady_clock::now()).count();
    };

    LOG(INFO) << "Submission " << id << " started: " << files.size() << " files, " << tests.size()
              << " tests, backend " << to_string(backend);

    vector<test_outcome> outcomes;
    atomic<bool> canceled{false};
    bool top_level_error = false, top_level_timeout = false;

    auto top_level = [&](test_status status, const string &message) {
        test_outcome outcome;
        outcome.id = "execution";
        outcome.name = "Execution";
        outcome.status = status;
        outcome.message = message;
        outcome.duration_ms = result.execution_time_ms;
        outcomes.push_back(outcome);
    };

    // 检查项目文件，并且不带测试运行一次项目
    try {
        validate_project(files, limits.entry_point);

        execution_request request;
        request.id = random_uuid();
        request.mode = execution_mode::PROJECT;
        request.files = files;
        request.entry_point = limits.entry_point;
        request.backend = backend;
        request.timeout_ms = max(1, min(timeout_ms, remaining()));
        try {
            execution_result execution = queue.execute(request, token);
            result.execution_output = execution.stdout_text;
            result.execution_time_ms = execution.duration_ms;
            if (execution.error_summary) {
                top_level_error = true;
                top_level(test_status::ERRORED, *execution.error_summary);
            }
        } catch (execution_timeout &) {
            top_level_timeout = true;
            result.execution_time_ms = request.timeout_ms;
            top_level(test_status::TIMED_OUT, fmt::format("Execution timed out after {}ms", request.timeout_ms));
        }
    } catch (execution_canceled &) {
        canceled = true;
    } catch (std::exception &ex) {
        top_level_error = true;
        top_level(test_status::ERRORED, ex.what());
    }

    if (!top_level_error && !top_level_timeout && !canceled) {
        vector<optional<test_outcome>> slots(tests.size());
        atomic<size_t> next{0};
        atomic<stop_reason> stopped{stop_reason::NONE};

        auto worker = [&] {
            while (true) {
                size_t index = next++;
                if (index >= tests.size()) return;
                if (token->is_cancelled()) {
                    canceled = true;
                    return;
                }

                const test_definition &test = tests[index];
                stop_reason reason = stopped.load();
                int left = remaining();
                if (reason == stop_reason::NONE && left <= 0) {
                    reason = stop_reason::AGGREGATE_TIMEOUT;
                    stopped = reason;
                }
                if (reason != stop_reason::NONE) {
                    test_outcome skipped;
                    skipped.id = test.id;
                    skipped.name = test.name;
                    skipped.status = test_status::TIMED_OUT;
                    skipped.message = reason == stop_reason::AGGREGATE_TIMEOUT ? AGGREGATE_TIMEOUT_MESSAGE : EARLIER_TIMEOUT_MESSAGE;
                    slots[index] = skipped;
                    continue;
                }

                int own = test.timeout_ms > 0 ? test.timeout_ms : timeout_ms;
                int budget = min(own, left);
                auto outcome = run_test(token, files, test, backend, limits.entry_point, budget);
                if (!outcome) {
                    canceled = true;
                    return;
                }
                if (outcome->status == test_status::TIMED_OUT) {
                    if (budget < own)
                        stopped = stop_reason::AGGREGATE_TIMEOUT;
                    else if (limits.stop_on_timeout)
                        stopped = stop_reason::EARLIER_TIMEOUT;
                }
                slots[index] = move(outcome);
            }
        };

        size_t workers = 1;
        if (limits.max_concurrent > 1 && queue.supports_parallel(backend))
            workers = min({limits.max_concurrent, queue.max_concurrent(), tests.size()});

        if (workers <= 1) {
            worker();
        } else {
            vector<thread> threads;
            for (size_t i = 0; i < workers; ++i) threads.emplace_back(worker);
            for (auto &t : threads) t.join();
        }

        // 被取消时尚未开始的测试直接丢弃
        for (auto &slot : slots)
            if (slot) outcomes.push_back(move(*slot));
    }

    result.test_outcomes = outcomes;
    result.summary = summarize(outcomes);
    result.status = derive_status(result.summary, canceled, top_level_error, top_level_timeout);
    result.success = result.status == submission_status::SUCCESS;

    record.outcomes = move(outcomes);
    record.summary = result.summary;
    record.status = result.status;
    record.finished_at = chrono::system_clock::now();

    LOG(INFO) << "Submission " << id << " finished: " << get_display_message(result.status) << ", "
              << result.summary.passed << "/" << result.summary.total << " passed, score " << result.summary.score;

    persist(record, result);
    return result;
}

void submission_orchestrator::persist(const submission_record &record, submission_result &result) {
    if (store) {
        // 保存失败时只重试一次
        for (int attempt = 1; attempt <= 2; ++attempt) {
            try {
                store->save(record);
                break;
            } catch (std::exception &ex) {
                LOG(WARNING) << "Unable to save submission " << record.submission_id << " (attempt " << attempt << "): " << ex.what();
                if (attempt == 2)
                    result.warnings.push_back(string("Submission could not be saved: ") + ex.what());
            }
        }
    }

    if (progress && result.status == submission_status::SUCCESS && !record.user_id.empty() && !record.lesson_id.empty()) {
        try {
            progress->mark_lesson_complete(record.user_id, record.lesson_id);
        } catch (std::exception &ex) {
            LOG(WARNING) << "Unable to mark lesson " << record.lesson_id << " complete for " << record.user_id << ": " << ex.what();
            result.warnings.push_back(string("Lesson progress could not be updated: ") + ex.what());
        }
    }
}

playground_result submission_orchestrator::execute(const vector<project_file> &files,
                                                   const string &entry_point,
                                                   backend_kind backend,
                                                   int timeout_ms) {
    playground_result result;
    execution_request request;
    request.id = random_uuid();
    request.files = files;
    request.entry_point = entry_point;
    request.backend = backend;
    request.timeout_ms = timeout_ms > 0 ? timeout_ms : DEFAULT_TIMEOUT_MS;
    request.mode = files.size() == 1 ? execution_mode::SINGLE : execution_mode::PROJECT;

    try {
        execution_result execution = queue.execute(request);
        result.stdout_text = move(execution.stdout_text);
        result.stderr_text = move(execution.stderr_text);
        result.error = move(execution.error_summary);
        result.duration_ms = execution.duration_ms;
    } catch (execution_timeout &) {
        result.timed_out = true;
        result.error = fmt::format("Execution timed out after {}ms", request.timeout_ms);
        result.duration_ms = request.timeout_ms;
    } catch (std::exception &ex) {
        result.error = ex.what();
    }
    return result;
}

}  // namespace runner
