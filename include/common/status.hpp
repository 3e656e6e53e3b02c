#pragma once

#include <string>

namespace runner {

/**
 * @brief 单个测试的评测结果
 */
enum class test_status {
    /**
     * @brief 测试通过，测试框架输出了通过标记
     */
    PASSED = 0,

    /**
     * @brief 测试中的断言失败，测试框架输出了失败标记和失败信息
     */
    FAILED = 1,

    /**
     * @brief 测试出错
     * 包括选手代码无法导入、测试抛出了断言以外的异常、后端执行出错、
     * 以及没有输出任何评测标记的情况。
     */
    ERRORED = 2,

    /**
     * @brief 测试运行时间超出限制，或者提交的总时间超出限制后未执行的测试
     */
    TIMED_OUT = 3
};

/**
 * @brief 整个提交的评测结果
 */
enum class submission_status {
    /**
     * @brief 所有测试均通过
     */
    SUCCESS = 0,

    /**
     * @brief 部分测试通过，或者没有测试通过但代码本身可以运行
     */
    PARTIAL = 1,

    /**
     * @brief 选手代码本身无法运行（语法错误、导入时抛出异常、项目文件不合法），测试未被执行
     */
    EXECUTION_ERROR = 2,

    /**
     * @brief 选手代码本身运行超时，测试未被执行
     */
    TIMED_OUT = 3,

    /**
     * @brief 提交被取消，已经完成的测试结果仍然保留
     */
    CANCELED = 4
};

/**
 * @brief 执行队列中一次执行的状态
 * QUEUED -> RUNNING -> {COMPLETED, TIMED_OUT, CANCELED, FAILED}
 * 后四种均为终止状态
 */
enum class execution_state {
    QUEUED = 0,
    RUNNING = 1,
    COMPLETED = 2,
    TIMED_OUT = 3,
    CANCELED = 4,
    FAILED = 5
};

const char *get_display_message(test_status);
const char *get_display_message(submission_status);
const char *get_display_message(execution_state);

/**
 * @brief 序列化时使用的名称，如 passed, timedOut
 */
const char *to_string(test_status);
const char *to_string(submission_status);

/**
 * @brief 解析 to_string 生成的名称
 * @throw std::invalid_argument 名称不存在时
 */
test_status parse_test_status(const std::string &name);
submission_status parse_submission_status(const std::string &name);

bool is_terminal(execution_state state);

}  // namespace runner
