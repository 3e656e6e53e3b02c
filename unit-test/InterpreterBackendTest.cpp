#include <chrono>
#include <filesystem>
#include <future>
#include <thread>
#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "config.hpp"
#include "execution/interpreter_backend.hpp"
#include "test/scripted_backend.hpp"

using namespace std;
using namespace std::filesystem;
using namespace runner;

class InterpreterBackendTest : public ::testing::Test {
protected:
    static void SetUpTestCase() {
        workdir = WORK_DIR / "interpreter";
        create_directories(workdir);
        backend = make_unique<interpreter_backend>(workdir);
        backend->initialize();
    }

    static void TearDownTestCase() {
        backend.reset();
    }

    static size_t run_directories() {
        size_t count = 0;
        for (auto &entry : directory_iterator(workdir))
            if (entry.path().filename().string().rfind("run-", 0) == 0) ++count;
        return count;
    }

    static path workdir;
    static unique_ptr<interpreter_backend> backend;
};

path InterpreterBackendTest::workdir;
unique_ptr<interpreter_backend> InterpreterBackendTest::backend;

TEST_F(InterpreterBackendTest, CapturesOutputTest) {
    auto result = backend->execute(make_request("stdout", "import sys\nprint('hello')\nprint('oops', file=sys.stderr)\n"));
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(result.stderr_text, "oops\n");
    EXPECT_FALSE(result.error_summary);
    EXPECT_EQ(result.kind(), backend_kind::INTERPRETER);
    EXPECT_FALSE(get<interpreter_metadata>(result.metadata).python_version.empty());
    EXPECT_EQ(backend->get_state(), interpreter_backend::state::READY);
    EXPECT_EQ(run_directories(), 0u);
}

TEST_F(InterpreterBackendTest, ReusesInterpreterTest) {
    backend->execute(make_request("first"));
    auto result = backend->execute(make_request("second"));
    EXPECT_TRUE(get<interpreter_metadata>(result.metadata).reused);
    // 重复初始化不会重新加载
    EXPECT_EQ(backend->initialize(), get<interpreter_metadata>(result.metadata).load_time_ms);
}

TEST_F(InterpreterBackendTest, ErrorSummaryTest) {
    auto result = backend->execute(make_request("raise", "print('before')\nraise ValueError('bad value')\n"));
    EXPECT_EQ(result.stdout_text, "before\n");
    ASSERT_TRUE(result.error_summary);
    EXPECT_NE(result.error_summary->find("ValueError: bad value"), string::npos);
    EXPECT_NE(result.error_summary->find("main.py"), string::npos);
    // 临时目录不会出现在错误信息中
    EXPECT_EQ(result.error_summary->find(workdir.string()), string::npos);

    result = backend->execute(make_request("syntax", "def broken(:\n"));
    ASSERT_TRUE(result.error_summary);
    EXPECT_NE(result.error_summary->find("SyntaxError"), string::npos);
}

TEST_F(InterpreterBackendTest, SystemExitTest) {
    auto result = backend->execute(make_request("exit0", "import sys\nsys.exit(0)\n"));
    EXPECT_FALSE(result.error_summary);

    result = backend->execute(make_request("exit3", "import sys\nsys.exit(3)\n"));
    ASSERT_TRUE(result.error_summary);
    EXPECT_EQ(*result.error_summary, "SystemExit: 3");
}

TEST_F(InterpreterBackendTest, EmptyStdinTest) {
    auto result = backend->execute(make_request("stdin", "input()\n"));
    ASSERT_TRUE(result.error_summary);
    EXPECT_NE(result.error_summary->find("EOFError"), string::npos);
}

TEST_F(InterpreterBackendTest, ProjectImportsAreIsolatedTest) {
    execution_request request;
    request.id = "project-1";
    request.files = {{"main.py", "from utils.helpers import VALUE\nprint(VALUE)\n"},
                     {"utils/__init__.py", ""},
                     {"utils/helpers.py", "VALUE = 1\n"}};
    auto result = backend->execute(request);
    EXPECT_EQ(result.stdout_text, "1\n");

    // 上一次执行导入的选手模块已经被移除
    request.id = "project-2";
    request.files[2].content = "VALUE = 2\n";
    result = backend->execute(request);
    EXPECT_EQ(result.stdout_text, "2\n");
}

TEST_F(InterpreterBackendTest, NestedEntryPointTest) {
    execution_request request;
    request.id = "nested";
    request.files = {{"src/app.py", "import helper\nprint(helper.NAME)\n"},
                     {"src/helper.py", "NAME = 'sibling'\n"}};
    request.entry_point = "app.py";
    auto result = backend->execute(request);
    EXPECT_FALSE(result.error_summary) << *result.error_summary;
    EXPECT_EQ(result.stdout_text, "sibling\n");
}

TEST_F(InterpreterBackendTest, ValidationErrorTest) {
    execution_request request = make_request("invalid");
    request.files.push_back({"../escape.py", ""});
    EXPECT_THROW(backend->execute(request), validation_error);
    EXPECT_EQ(run_directories(), 0u);
}

TEST_F(InterpreterBackendTest, CancelRunningTest) {
    auto future = async(launch::async, [] {
        return backend->execute(make_request("loop", "print('start', flush=True)\nwhile True:\n    pass\n"));
    });
    this_thread::sleep_for(chrono::milliseconds(300));
    backend->cancel("loop");

    ASSERT_EQ(future.wait_for(chrono::seconds(5)), future_status::ready);
    EXPECT_THROW(future.get(), execution_canceled);

    // 中止后解释器仍然可以继续使用
    auto result = backend->execute(make_request("after-cancel"));
    EXPECT_EQ(result.stdout_text, "hello\n");
    EXPECT_EQ(run_directories(), 0u);
}

TEST_F(InterpreterBackendTest, CancelPendingTest) {
    auto running = async(launch::async, [] {
        return backend->execute(make_request("blocker", "import time\ntime.sleep(0.5)\n"));
    });
    this_thread::sleep_for(chrono::milliseconds(100));
    auto pending = async(launch::async, [] {
        return backend->execute(make_request("pending"));
    });
    this_thread::sleep_for(chrono::milliseconds(100));
    backend->cancel("pending");

    EXPECT_NO_THROW(running.get());
    EXPECT_THROW(pending.get(), execution_canceled);
}

TEST_F(InterpreterBackendTest, CancelUnknownTest) {
    EXPECT_NO_THROW(backend->cancel("no-such-execution"));
    auto result = backend->execute(make_request("after-unknown"));
    EXPECT_EQ(result.stdout_text, "hello\n");
}

TEST_F(InterpreterBackendTest, CancelWhileWaitingForOtherBackendTest) {
    create_directories(workdir / "other");
    interpreter_backend other(workdir / "other");
    other.initialize();

    auto first = async(launch::async, [] {
        return backend->execute(make_request("holder", "while True:\n    pass\n"));
    });
    this_thread::sleep_for(chrono::milliseconds(200));
    auto second = async(launch::async, [&other] {
        return other.execute(make_request("waiter", "while True:\n    pass\n"));
    });

    // 第二个请求在等待另一个后端释放解释器时被取消，像执行队列那样反复通知
    for (int i = 0; i < 6; ++i) {
        this_thread::sleep_for(chrono::milliseconds(50));
        other.cancel("waiter");
    }

    for (int i = 0; i < 100 && first.wait_for(chrono::milliseconds(50)) != future_status::ready; ++i)
        backend->cancel("holder");
    ASSERT_EQ(first.wait_for(chrono::seconds(5)), future_status::ready);
    EXPECT_THROW(first.get(), execution_canceled);

    // 解释器空闲后，已经被取消的请求不会再运行选手代码
    ASSERT_EQ(second.wait_for(chrono::seconds(2)), future_status::ready);
    EXPECT_THROW(second.get(), execution_canceled);

    auto result = other.execute(make_request("after-wait"));
    EXPECT_EQ(result.stdout_text, "hello\n");
    result = backend->execute(make_request("after-holder"));
    EXPECT_EQ(result.stdout_text, "hello\n");
}
