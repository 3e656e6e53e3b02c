#pragma once

#include <set>
#include <string>
#include <vector>
#include "execution/request.hpp"

/**
 * 项目文件的合法性检查
 * 所有检查都是纯函数，执行队列和每个执行后端在写入任何文件之前都会调用，
 * 不合法时抛出 validation_error。
 */
namespace runner {

/**
 * @brief 检查单个文件路径是否安全
 * 拒绝：空路径、绝对路径（/、\、盘符）、反斜杠、空的路径段、"." 与 ".." 路径段、
 * NUL 字符、不在 extensions 中的扩展名。
 * 由于执行时会将文件写入临时目录，如果路径包含 ".."，那么最后有可能覆盖临时目录以外的文件。
 * @param path 被检查的相对路径
 * @param extensions 允许的扩展名（包含点号，如 ".py"）
 */
void validate_path(const std::string &path, const std::set<std::string> &extensions);

/**
 * @brief 检查整个项目：文件数量、每个文件的路径与内容、路径唯一性、入口文件
 * @param files 项目文件
 * @param entry_point 入口文件
 */
void validate_project(const std::vector<project_file> &files, const std::string &entry_point);

/**
 * @brief 查找入口文件
 * 优先完全匹配路径，否则匹配路径末尾的若干段（比如 "main.py" 可以匹配 "src/main.py"），
 * 存在多个匹配时认为有歧义。
 * @return 入口文件
 */
const project_file &resolve_entry_point(const std::vector<project_file> &files, const std::string &entry_point);

/**
 * @brief 检查执行请求，单文件模式下要求请求中恰好只有一个文件
 */
void validate_request(const execution_request &request);

}  // namespace runner
