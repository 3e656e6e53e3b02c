#include "gtest/gtest.h"
#include "judge/result_parser.hpp"

using namespace std;
using namespace runner;

static const string MARKER = "@@VERDICT";
static const string NONCE = "0123456789abcdef";

class ResultParserTest : public ::testing::Test {
protected:
    ResultParserTest() : parser(MARKER) {
        test.id = "t1";
        test.name = "adds numbers";
    }

    test_outcome parse(const string &stdout_text, optional<string> error = {}) {
        execution_result result;
        result.stdout_text = stdout_text;
        result.error_summary = move(error);
        result.duration_ms = 12.5;
        return parser.parse(test, result, NONCE);
    }

    static string line(const string &kind, const string &detail = "") {
        return MARKER + ":" + NONCE + ":" + kind + (detail.empty() ? "" : ":" + detail) + "\n";
    }

    result_parser parser;
    test_definition test;
};

TEST_F(ResultParserTest, PassTest) {
    auto outcome = parse("user output\n" + line("PASS"));
    EXPECT_EQ(outcome.id, "t1");
    EXPECT_EQ(outcome.name, "adds numbers");
    EXPECT_EQ(outcome.status, test_status::PASSED);
    EXPECT_FALSE(outcome.message);
    EXPECT_DOUBLE_EQ(outcome.duration_ms, 12.5);
}

TEST_F(ResultParserTest, FailTest) {
    auto outcome = parse(line("FAIL", "\"expected 3, got 4\""));
    EXPECT_EQ(outcome.status, test_status::FAILED);
    EXPECT_EQ(outcome.message.value(), "expected 3, got 4");
}

TEST_F(ResultParserTest, ErrorTest) {
    auto outcome = parse(line("ERROR", "\"NameError: name 'add' is not defined\""));
    EXPECT_EQ(outcome.status, test_status::ERRORED);
    EXPECT_EQ(outcome.message.value(), "NameError: name 'add' is not defined");
}

TEST_F(ResultParserTest, FailOutranksPassTest) {
    auto outcome = parse(line("PASS") + line("ERROR", "\"boom\"") + line("FAIL", "\"wrong\""));
    EXPECT_EQ(outcome.status, test_status::FAILED);
    EXPECT_EQ(outcome.message.value(), "wrong");

    outcome = parse(line("PASS") + line("ERROR", "\"boom\""));
    EXPECT_EQ(outcome.status, test_status::ERRORED);
    EXPECT_EQ(outcome.message.value(), "boom");
}

TEST_F(ResultParserTest, BackendErrorOutranksMarkersTest) {
    auto outcome = parse(line("PASS"), "SyntaxError: invalid syntax");
    EXPECT_EQ(outcome.status, test_status::ERRORED);
    EXPECT_EQ(outcome.message.value(), "SyntaxError: invalid syntax");
}

TEST_F(ResultParserTest, NoVerdictTest) {
    auto outcome = parse("just some output\n");
    EXPECT_EQ(outcome.status, test_status::ERRORED);
    EXPECT_EQ(outcome.message.value(), "No verdict produced");

    EXPECT_EQ(parse("").status, test_status::ERRORED);
}

TEST_F(ResultParserTest, IgnoresForeignMarkersTest) {
    // 选手代码伪造的标记没有本次的随机值
    string forged = MARKER + ":ffffffffffffffff:PASS\n";
    EXPECT_EQ(parse(forged).status, test_status::ERRORED);

    // 标记必须独占一行
    string inline_marker = "prefix " + line("PASS");
    EXPECT_EQ(parse(inline_marker).status, test_status::ERRORED);

    EXPECT_EQ(parse(MARKER + ":" + NONCE + ":MAYBE\n").status, test_status::ERRORED);
}

TEST_F(ResultParserTest, WindowsLineEndingsTest) {
    auto outcome = parse("output\r\n" + MARKER + ":" + NONCE + ":PASS\r\n");
    EXPECT_EQ(outcome.status, test_status::PASSED);
}

TEST_F(ResultParserTest, MalformedDetailTest) {
    auto outcome = parse(line("FAIL", "not json"));
    EXPECT_EQ(outcome.status, test_status::FAILED);
    EXPECT_EQ(outcome.message.value(), "not json");

    outcome = parse(MARKER + ":" + NONCE + ":FAIL\n");
    EXPECT_EQ(outcome.message.value(), "Assertion failed");
}
