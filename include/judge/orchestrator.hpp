#pragma once

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include "common/cancellation.hpp"
#include "execution/execution_queue.hpp"
#include "judge/harness.hpp"
#include "judge/ports.hpp"
#include "judge/result_parser.hpp"
#include "judge/submission.hpp"

namespace runner {

/**
 * @brief 评测一次提交
 *
 * 1. 检查项目文件，不合法时直接返回执行错误
 * 2. 不带测试运行一次项目，项目本身无法运行（语法错误、异常、超时）时只产生一个测试结果，不再运行任何测试
 * 3. 按声明顺序依次运行每个测试：生成测试框架 -> 执行队列 -> 判定结果。
 *    只有支持并行的后端并且允许多个并发时才会并行运行测试，结果仍按声明顺序排列
 * 4. 统计得分并得出提交状态
 * 5. 将提交记录交给持久化接口（失败时重试一次，仍失败则作为警告返回），
 *    所有测试通过时通知学习进度接口
 *
 * 除了违反接口约定（没有测试）以外，所有错误都会被转换为提交结果，不会抛出给调用方。
 */
struct submission_orchestrator {
    /**
     * @param queue 会话的执行队列
     * @param store 持久化接口，可以为空
     * @param progress 学习进度接口，可以为空
     */
    submission_orchestrator(execution_queue &queue, submission_store *store = nullptr, progress_tracker *progress = nullptr);

    /**
     * @brief 评测一次提交，阻塞直到评测结束
     * @throw contract_violation tests 为空
     */
    submission_result run(const std::vector<project_file> &files,
                          const std::vector<test_definition> &tests,
                          backend_kind backend,
                          const submission_limits &limits,
                          const submission_context &context = {});

    /**
     * @brief 不带测试运行一次项目，用于自由练习
     * @param files 项目文件，只有一个文件时按单文件模式运行
     * @param timeout_ms 时间限制，小于等于 0 时使用 DEFAULT_TIMEOUT_MS
     */
    playground_result execute(const std::vector<project_file> &files,
                              const std::string &entry_point,
                              backend_kind backend,
                              int timeout_ms);

    /**
     * @brief 取消一次正在进行的提交
     * 正在运行的执行会被中止，尚未开始的测试不再运行，已经完成的测试结果会保留
     * @return 若找到了该提交返回 true
     */
    bool cancel(const std::string &submission_id);

private:
    /**
     * @brief 运行一个测试
     * @param timeout_ms 本次运行的时间限制
     * @return 测试结果，提交被取消时返回空
     */
    std::optional<test_outcome> run_test(const std::shared_ptr<cancellation_token> &token,
                                         const std::vector<project_file> &files,
                                         const test_definition &test,
                                         backend_kind backend,
                                         const std::string &entry_point,
                                         int timeout_ms);

    void persist(const submission_record &record, submission_result &result);

    execution_queue &queue;
    submission_store *store;
    progress_tracker *progress;
    harness_builder builder;
    result_parser parser;

    std::mutex mut;
    /**
     * @brief 正在评测的提交的取消令牌
     */
    std::map<std::string, std::shared_ptr<cancellation_token>> submissions;
};

/**
 * @brief 根据测试结果得出提交状态
 * 被取消 -> CANCELED；全部通过 -> SUCCESS；没有测试通过且项目本身运行出错 -> EXECUTION_ERROR；
 * 没有测试通过且项目本身运行超时 -> TIMED_OUT；其他情况 -> PARTIAL
 */
submission_status derive_status(const submission_summary &summary, bool canceled, bool top_level_error, bool top_level_timeout);

}  // namespace runner
