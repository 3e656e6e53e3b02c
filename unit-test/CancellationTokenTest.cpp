#include <atomic>
#include <chrono>
#include <thread>
#include <vector>
#include "gtest/gtest.h"
#include "common/cancellation.hpp"
#include "execution/admission.hpp"

using namespace std;
using namespace runner;

class CancellationTokenTest : public ::testing::Test {
};

TEST_F(CancellationTokenTest, CancelOnceTest) {
    cancellation_token token;
    EXPECT_FALSE(token.is_cancelled());
    EXPECT_EQ(token.reason(), cancel_reason::NONE);

    int calls = 0;
    token.on_cancel([&](cancel_reason reason) {
        ++calls;
        EXPECT_EQ(reason, cancel_reason::TIMEOUT);
    });

    EXPECT_TRUE(token.cancel(cancel_reason::TIMEOUT));
    EXPECT_FALSE(token.cancel(cancel_reason::USER));
    EXPECT_TRUE(token.is_cancelled());
    EXPECT_EQ(token.reason(), cancel_reason::TIMEOUT);
    EXPECT_EQ(calls, 1);
}

TEST_F(CancellationTokenTest, CallbackAfterCancelTest) {
    cancellation_token token;
    token.cancel(cancel_reason::SHUTDOWN);

    cancel_reason seen = cancel_reason::NONE;
    token.on_cancel([&](cancel_reason reason) { seen = reason; });
    EXPECT_EQ(seen, cancel_reason::SHUTDOWN);
}

TEST_F(CancellationTokenTest, RemoveCallbackTest) {
    cancellation_token token;
    int calls = 0;
    auto id = token.on_cancel([&](cancel_reason) { ++calls; });
    token.remove_callback(id);
    token.cancel(cancel_reason::USER);
    EXPECT_EQ(calls, 0);
}

TEST_F(CancellationTokenTest, RegistrationScopeTest) {
    auto token = make_shared<cancellation_token>();
    int calls = 0;
    {
        cancellation_registration registration(token, [&](cancel_reason) { ++calls; });
    }
    token->cancel(cancel_reason::USER);
    EXPECT_EQ(calls, 0);

    // 空令牌不注册任何回调
    cancellation_registration empty(nullptr, [&](cancel_reason) { ++calls; });
    EXPECT_EQ(calls, 0);
}

TEST_F(CancellationTokenTest, ConcurrentCancelTest) {
    cancellation_token token;
    atomic<int> calls{0}, winners{0};
    token.on_cancel([&](cancel_reason) { ++calls; });

    vector<thread> threads;
    for (int i = 0; i < 8; ++i)
        threads.emplace_back([&] {
            if (token.cancel(cancel_reason::USER)) ++winners;
        });
    for (auto &t : threads) t.join();

    EXPECT_EQ(calls.load(), 1);
    EXPECT_EQ(winners.load(), 1);
}

TEST_F(CancellationTokenTest, AdmissionLimiterTest) {
    admission_limiter limiter(1);
    auto token = make_shared<cancellation_token>();
    EXPECT_TRUE(limiter.acquire(token));
    EXPECT_EQ(limiter.in_use(), 1u);

    // 名额用尽时等待，令牌被取消后放弃
    thread canceller([&] {
        this_thread::sleep_for(chrono::milliseconds(50));
        token->cancel(cancel_reason::USER);
    });
    EXPECT_FALSE(limiter.acquire(token));
    canceller.join();

    limiter.release();
    EXPECT_EQ(limiter.in_use(), 0u);
    EXPECT_TRUE(limiter.acquire(nullptr));
    limiter.release();
}
