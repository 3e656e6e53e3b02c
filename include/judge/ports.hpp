#pragma once

#include <optional>
#include <string>
#include <vector>
#include "judge/submission.hpp"

/**
 * 评测核心依赖的外部接口
 * 评测核心只调用这些接口，不负责实现课程内容、用户、历史记录等功能。
 */
namespace runner {

/**
 * @brief 查询提交记录的条件，为空的条件不参与过滤
 */
struct submission_filter {
    std::optional<std::string> user_id;
    std::optional<std::string> lesson_id;
    std::optional<submission_status> status;

    bool matches(const submission_record &record) const;
};

/**
 * @brief 提交记录的持久化接口
 */
struct submission_store {
    /**
     * @brief 保存提交记录
     * @throw persistence_error 保存失败
     */
    virtual void save(const submission_record &record) = 0;

    /**
     * @brief 查询提交记录，按保存顺序返回
     * @throw persistence_error 查询失败
     */
    virtual std::vector<submission_record> find(const submission_filter &filter) = 0;

    virtual ~submission_store();
};

/**
 * @brief 学习进度接口，只有在提交的所有测试都通过时才会被调用
 */
struct progress_tracker {
    virtual void mark_lesson_complete(const std::string &user_id, const std::string &lesson_id) = 0;

    virtual ~progress_tracker();
};

}  // namespace runner
