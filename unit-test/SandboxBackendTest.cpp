#include <atomic>
#include <chrono>
#include <future>
#include <set>
#include <thread>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "execution/sandbox_backend.hpp"
#include "test/mocks.hpp"
#include "test/scripted_backend.hpp"

using namespace std;
using namespace runner;
using ::testing::_;
using ::testing::Eq;
using ::testing::InSequence;
using ::testing::Invoke;
using ::testing::Return;
using ::testing::Throw;

class SandboxBackendTest : public ::testing::Test {
protected:
    SandboxBackendTest()
        : client(make_shared<::testing::StrictMock<mock_sandbox_client>>()), backend(client) {}

    static sandbox_run_result output(const string &stdout_text, int exit_code = 0) {
        sandbox_run_result result;
        result.stdout_text = stdout_text;
        result.exit_code = exit_code;
        return result;
    }

    shared_ptr<::testing::StrictMock<mock_sandbox_client>> client;
    sandbox_backend backend;
};

TEST_F(SandboxBackendTest, RunsAndReleasesTest) {
    {
        InSequence seq;
        EXPECT_CALL(*client, create(_, _)).WillOnce(Return("sb-1"));
        EXPECT_CALL(*client, write_files(Eq("sb-1"), _, _));
        EXPECT_CALL(*client, run(Eq("sb-1"), Eq("main.py"), 1000, _)).WillOnce(Return(output("hello\n")));
        EXPECT_CALL(*client, kill(Eq("sb-1")));
    }

    execution_request request = make_request("r1");
    request.backend = backend_kind::SANDBOX;
    request.timeout_ms = 1000;
    auto result = backend.execute(request);

    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_FALSE(result.error_summary);
    EXPECT_EQ(result.kind(), backend_kind::SANDBOX);
    auto &meta = get<sandbox_metadata>(result.metadata);
    EXPECT_EQ(meta.sandbox_id, "sb-1");
    EXPECT_EQ(meta.provision_attempts, 1);
    EXPECT_EQ(backend.active_sandboxes(), 0u);
}

TEST_F(SandboxBackendTest, RetriesTransientProvisioningOnceTest) {
    EXPECT_CALL(*client, create(_, _))
        .WillOnce(Throw(provisioning_error("503 service unavailable", true)))
        .WillOnce(Return("sb-2"));
    EXPECT_CALL(*client, write_files(_, _, _));
    EXPECT_CALL(*client, run(_, _, _, _)).WillOnce(Return(output("ok\n")));
    EXPECT_CALL(*client, kill(Eq("sb-2")));

    auto result = backend.execute(make_request("r2"));
    EXPECT_EQ(get<sandbox_metadata>(result.metadata).provision_attempts, 2);
}

TEST_F(SandboxBackendTest, GivesUpAfterSecondTransientFailureTest) {
    EXPECT_CALL(*client, create(_, _))
        .Times(2)
        .WillRepeatedly(Throw(provisioning_error("429 too many requests", true)));

    EXPECT_THROW(backend.execute(make_request("r3")), provisioning_error);
}

TEST_F(SandboxBackendTest, PermanentProvisioningFailureTest) {
    EXPECT_CALL(*client, create(_, _))
        .WillOnce(Throw(provisioning_error("401 unauthorized", false)));

    try {
        backend.execute(make_request("r4"));
        FAIL() << "provisioning_error expected";
    } catch (backend_initialization_error &ex) {
        EXPECT_NE(string(ex.what()).find("401"), string::npos);
    }
}

TEST_F(SandboxBackendTest, ReleasesOnTransportFailureTest) {
    EXPECT_CALL(*client, create(_, _)).WillOnce(Return("sb-5"));
    EXPECT_CALL(*client, write_files(_, _, _)).WillOnce(Throw(transport_failure("connection reset")));
    EXPECT_CALL(*client, kill(Eq("sb-5")));

    EXPECT_THROW(backend.execute(make_request("r5")), transport_failure);
    EXPECT_EQ(backend.active_sandboxes(), 0u);
}

TEST_F(SandboxBackendTest, ReleaseFailureIsLoggedTest) {
    EXPECT_CALL(*client, create(_, _)).WillOnce(Return("sb-6"));
    EXPECT_CALL(*client, write_files(_, _, _));
    EXPECT_CALL(*client, run(_, _, _, _)).WillOnce(Return(output("ok\n")));
    EXPECT_CALL(*client, kill(Eq("sb-6"))).WillOnce(Throw(transport_failure("timeout")));

    auto result = backend.execute(make_request("r6"));
    EXPECT_EQ(result.stdout_text, "ok\n");
}

TEST_F(SandboxBackendTest, ErrorSummaryTest) {
    sandbox_run_result raised = output("");
    raised.error = "ZeroDivisionError: division by zero";
    raised.exit_code = 1;

    EXPECT_CALL(*client, create(_, _)).WillOnce(Return("a")).WillOnce(Return("b"));
    EXPECT_CALL(*client, write_files(_, _, _)).Times(2);
    EXPECT_CALL(*client, run(_, _, _, _))
        .WillOnce(Return(raised))
        .WillOnce(Return(output("", 2)));
    EXPECT_CALL(*client, kill(_)).Times(2);

    EXPECT_EQ(backend.execute(make_request("e1")).error_summary.value(), "ZeroDivisionError: division by zero");
    EXPECT_EQ(backend.execute(make_request("e2")).error_summary.value(), "Process exited with code 2");
}

TEST_F(SandboxBackendTest, SandboxTimeoutTest) {
    sandbox_run_result timed_out = output("partial");
    timed_out.timed_out = true;
    timed_out.exit_code = -1;

    EXPECT_CALL(*client, create(_, _)).WillOnce(Return("sb-t"));
    EXPECT_CALL(*client, write_files(_, _, _));
    EXPECT_CALL(*client, run(_, _, _, _)).WillOnce(Return(timed_out));
    EXPECT_CALL(*client, kill(Eq("sb-t")));

    EXPECT_THROW(backend.execute(make_request("t1")), execution_timeout);
    EXPECT_EQ(backend.active_sandboxes(), 0u);
}

TEST_F(SandboxBackendTest, CancelTearsDownSandboxTest) {
    promise<void> started;
    EXPECT_CALL(*client, create(_, _)).WillOnce(Return("sb-7"));
    EXPECT_CALL(*client, write_files(_, _, _));
    EXPECT_CALL(*client, run(_, _, _, _))
        .WillOnce(Invoke([&](const string &, const string &, int, const shared_ptr<cancellation_token> &token) {
            started.set_value();
            if (wait_cancelled(*token, 5000))
                throw execution_canceled("aborted by callback");
            return output("never");
        }));
    EXPECT_CALL(*client, kill(Eq("sb-7"))).Times(1);

    auto future = async(launch::async, [&] { return backend.execute(make_request("r7")); });
    started.get_future().wait();
    EXPECT_EQ(backend.active_sandboxes(), 1u);
    backend.cancel("r7");

    EXPECT_THROW(future.get(), execution_canceled);
    EXPECT_EQ(backend.active_sandboxes(), 0u);
}

TEST_F(SandboxBackendTest, ParallelExecutionsTest) {
    EXPECT_TRUE(backend.supports_parallel());

    atomic<int> next{0};
    EXPECT_CALL(*client, create(_, _)).Times(3).WillRepeatedly(Invoke([&](int, const shared_ptr<cancellation_token> &) {
        return "sb-p" + to_string(next++);
    }));
    EXPECT_CALL(*client, write_files(_, _, _)).Times(3);
    EXPECT_CALL(*client, run(_, _, _, _)).Times(3).WillRepeatedly(Invoke([](const string &id, const string &, int, const shared_ptr<cancellation_token> &) {
        this_thread::sleep_for(chrono::milliseconds(50));
        return output(id);
    }));
    EXPECT_CALL(*client, kill(_)).Times(3);

    vector<future<execution_result>> futures;
    for (int i = 0; i < 3; ++i)
        futures.push_back(async(launch::async, [&, i] { return backend.execute(make_request("p" + to_string(i))); }));
    set<string> outputs;
    for (auto &f : futures) outputs.insert(f.get().stdout_text);
    EXPECT_EQ(outputs.size(), 3u);
}
