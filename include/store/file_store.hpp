#pragma once

#include <filesystem>
#include <mutex>
#include "judge/ports.hpp"

namespace runner {

/**
 * @brief 将提交记录以 JSON Lines 格式追加保存到文件中
 * 每行一个提交记录，文件不存在时会自动创建。
 * 同一个进程内的并发访问是安全的，不支持多个进程同时写入同一个文件。
 */
struct file_submission_store : public submission_store {
    explicit file_submission_store(std::filesystem::path path);

    void save(const submission_record &record) override;

    /**
     * @brief 查询提交记录，无法解析的行会被跳过
     */
    std::vector<submission_record> find(const submission_filter &filter) override;

    const std::filesystem::path &path() const;

private:
    std::filesystem::path file;
    std::mutex mut;
};

}  // namespace runner
