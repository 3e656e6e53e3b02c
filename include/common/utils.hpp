#pragma once

#include <fmt/core.h>
#include <chrono>
#include <ctime>
#include <filesystem>
#include <string>

namespace fmt {
template <>
struct formatter<std::filesystem::path> {
    template <typename ParseContext>
    constexpr auto parse(ParseContext &ctx) { return ctx.begin(); }

    template <typename FormatContext>
    auto format(const std::filesystem::path &p, FormatContext &ctx) const {
        return format_to(ctx.out(), "{}", p.string());
    }
};
}  // namespace fmt

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 生成一个随机的 uuid 字符串
 * 用于执行请求 id、提交 id 以及临时目录名
 */
std::string random_uuid();

/**
 * @brief 将时间点格式化为 ISO 8601 的 UTC 时间字符串
 */
std::string format_time(std::chrono::system_clock::time_point time);

/**
 * @brief 解析 format_time 生成的时间字符串，格式不正确时返回 epoch
 */
std::chrono::system_clock::time_point parse_time(const std::string &text);

/**
 * @brief 计时器，使用单调时钟，不受系统时间调整的影响
 */
struct elapsed_time {

    elapsed_time();

    template <typename DurationT>
    DurationT duration() const {
        return std::chrono::duration_cast<DurationT>(std::chrono::steady_clock::now() - start);
    }

    /**
     * @brief 经过的毫秒数，保留小数部分
     */
    double milliseconds() const;

private:
    std::chrono::steady_clock::time_point start;
};
