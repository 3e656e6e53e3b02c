#pragma once

#include <filesystem>
#include <string>

namespace runner {

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(const std::filesystem::path &path);

/**
 * @brief 读取文本文件的全部内容
 * @param path 文本文件路径
 * @param def 若文件不存在，返回 def
 * @return 文本文件的内容(没有指定编码)
 */
std::string read_file_content(std::filesystem::path const &path, const std::string &def);

/**
 * @brief 将文本写入文件，会自动创建父目录
 * @param path 文件路径
 * @param content 文件内容
 * @note 写入失败时抛出 std::system_error
 */
void write_file_content(const std::filesystem::path &path, const std::string &content);

/**
 * @brief 在文件末尾追加一行
 */
void append_line(const std::filesystem::path &path, const std::string &line);

bool utf8_check_is_valid(const std::string &string);

/**
 * @brief 截断过长的文本，用于日志以及错误信息
 * @param text 原文本
 * @param limit 保留的最大字节数
 */
std::string truncate_text(const std::string &text, std::size_t limit);

}  // namespace runner
