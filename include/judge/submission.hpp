#pragma once

#include <chrono>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>
#include "common/status.hpp"
#include "execution/request.hpp"
#include "judge/test_case.hpp"

namespace runner {

/**
 * @brief 提交的得分统计
 * failed 包括所有未通过的测试（失败、出错、超时），因此 passed + failed == total
 */
struct submission_summary {
    std::size_t total = 0;
    std::size_t passed = 0;
    std::size_t failed = 0;

    /**
     * @brief round(passed / total * 100)，没有测试结果时为 0
     */
    int score = 0;
};

/**
 * @brief 提交的来源
 */
struct submission_context {
    /**
     * @brief 提交 id，为空时随机生成
     */
    std::string submission_id;

    std::string user_id;

    std::string lesson_id;
};

/**
 * @brief 提交的限制
 */
struct submission_limits {
    /**
     * @brief 单次执行（运行项目或者运行一个测试）的时间限制，小于等于 0 时使用 DEFAULT_TIMEOUT_MS
     */
    int timeout_ms = 0;

    /**
     * @brief 整个提交的时间限制，小于等于 0 时使用 DEFAULT_SUBMISSION_TIMEOUT_MS
     */
    int submission_timeout_ms = 0;

    /**
     * @brief 允许同时运行的测试数，只有支持并行的后端才会并行运行测试
     */
    std::size_t max_concurrent = 1;

    std::string entry_point = "main.py";

    /**
     * @brief 某个测试超时后是否不再运行剩余的测试
     */
    bool stop_on_timeout = true;
};

/**
 * @brief 一次提交的完整记录，评测结束后交给持久化接口
 */
struct submission_record {
    std::string submission_id;
    std::string user_id;
    std::string lesson_id;
    backend_kind backend = backend_kind::INTERPRETER;
    std::vector<project_file> files;
    std::vector<test_outcome> outcomes;
    submission_summary summary;
    submission_status status = submission_status::EXECUTION_ERROR;
    std::chrono::system_clock::time_point started_at;
    std::chrono::system_clock::time_point finished_at;
};

/**
 * @brief 返回给调用方的提交结果
 */
struct submission_result {
    /**
     * @brief 是否所有测试都通过
     */
    bool success = false;

    submission_status status = submission_status::EXECUTION_ERROR;

    /**
     * @brief 测试结果，顺序与测试的声明顺序一致
     */
    std::vector<test_outcome> test_outcomes;

    submission_summary summary;

    /**
     * @brief 运行项目时的标准输出
     */
    std::string execution_output;

    /**
     * @brief 运行项目花费的时间，单位为毫秒
     */
    double execution_time_ms = 0;

    std::string submission_id;

    /**
     * @brief 不影响结果的警告，比如持久化失败
     */
    std::vector<std::string> warnings;
};

/**
 * @brief 自由运行一个项目（不包含测试）的结果
 */
struct playground_result {
    std::string stdout_text;
    std::string stderr_text;
    std::optional<std::string> error;
    double duration_ms = 0;
    bool timed_out = false;
};

/**
 * @brief 统计测试结果
 */
submission_summary summarize(const std::vector<test_outcome> &outcomes);

void to_json(nlohmann::json &j, const submission_summary &summary);
void from_json(const nlohmann::json &j, submission_summary &summary);
void to_json(nlohmann::json &j, const submission_record &record);
void from_json(const nlohmann::json &j, submission_record &record);
void to_json(nlohmann::json &j, const submission_result &result);
void to_json(nlohmann::json &j, const playground_result &result);

}  // namespace runner
