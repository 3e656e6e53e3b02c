#include "gtest/gtest.h"
#include "common/exceptions.hpp"
#include "judge/harness.hpp"

using namespace std;
using namespace runner;

class HarnessBuilderTest : public ::testing::Test {
protected:
    HarnessBuilderTest() : builder("@@VERDICT") {
        test.id = "t1";
        test.name = "adds numbers";
        test.code = "assert add(1, 2) == 3, \"expected 3\"\n";
    }

    harness_builder builder;
    test_definition test;
};

TEST_F(HarnessBuilderTest, BuildsRequestTest) {
    vector<project_file> files = {{"main.py", "def add(a, b):\n    return a + b\n"}};
    harness h = builder.build(files, "main.py", test, backend_kind::SANDBOX, 5000);

    EXPECT_EQ(h.nonce.size(), 16u);
    EXPECT_EQ(h.path, "_runner_harness_" + h.nonce.substr(0, 8) + ".py");
    EXPECT_FALSE(h.request.id.empty());
    EXPECT_EQ(h.request.entry_point, h.path);
    EXPECT_EQ(h.request.backend, backend_kind::SANDBOX);
    EXPECT_EQ(h.request.timeout_ms, 5000);
    EXPECT_EQ(h.request.mode, execution_mode::PROJECT);
    ASSERT_EQ(h.request.files.size(), 2u);
    EXPECT_EQ(h.request.files[0].path, "main.py");
    EXPECT_EQ(h.request.files[1].path, h.path);
}

TEST_F(HarnessBuilderTest, HarnessBesideEntryTest) {
    vector<project_file> files = {{"src/app.py", "x = 1"}, {"src/util.py", ""}};
    harness h = builder.build(files, "app.py", test, backend_kind::INTERPRETER, 1000);

    EXPECT_EQ(h.path.rfind("src/_runner_harness_", 0), 0u);
    const string &source = h.request.files.back().content;
    EXPECT_NE(source.find("spec_from_file_location(\n        \"app\""), string::npos);
    EXPECT_NE(source.find("\"app.py\")"), string::npos);
    EXPECT_NE(source.find("\"src/app.py\""), string::npos);
}

TEST_F(HarnessBuilderTest, RendersEscapedTestCodeTest) {
    test.code = "s = '''a \"quoted\" {brace}\n\\n'''\nassert s\n";
    string source = builder.render("main", "main.py", test, "0123456789abcdef");

    EXPECT_NE(source.find("\"@@VERDICT:0123456789abcdef:\""), string::npos);
    EXPECT_NE(source.find("_runner_sys.modules[\"main\"]"), string::npos);
    // 测试代码作为字符串字面量嵌入，不会直接出现在框架代码中
    EXPECT_EQ(source.find("assert s\n"), string::npos);
    EXPECT_NE(source.find("assert s\\n"), string::npos);
    EXPECT_NE(source.find("\"<adds numbers>\""), string::npos);
}

TEST_F(HarnessBuilderTest, UniqueNonceTest) {
    vector<project_file> files = {{"main.py", ""}};
    harness a = builder.build(files, "main.py", test, backend_kind::INTERPRETER, 1000);
    harness b = builder.build(files, "main.py", test, backend_kind::INTERPRETER, 1000);
    EXPECT_NE(a.nonce, b.nonce);
    EXPECT_NE(a.request.id, b.request.id);
}

TEST_F(HarnessBuilderTest, MissingEntryTest) {
    vector<project_file> files = {{"main.py", ""}};
    EXPECT_THROW(builder.build(files, "app.py", test, backend_kind::INTERPRETER, 1000), validation_error);
}

TEST_F(HarnessBuilderTest, NonIdentifierEntryTest) {
    vector<project_file> files = {{"my-main.py", "def add(a, b):\n    return a + b\n"}};
    harness h = builder.build(files, "my-main.py", test, backend_kind::INTERPRETER, 1000);

    // 入口文件按路径加载，文件名不会出现在 import 语句中
    const string &source = h.request.files.back().content;
    EXPECT_EQ(source.find("import my-main"), string::npos);
    EXPECT_NE(source.find("_runner_sys.modules[\"my-main\"]"), string::npos);
    EXPECT_NE(source.find("\"my-main.py\")"), string::npos);
}
