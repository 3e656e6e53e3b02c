#pragma once

#include <string>
#include <vector>
#include "execution/request.hpp"
#include "judge/test_case.hpp"

namespace runner {

/**
 * @brief 由项目和一个测试生成的可执行单元
 */
struct harness {
    /**
     * @brief 执行请求，文件为项目文件加上测试框架文件，入口为测试框架文件
     */
    execution_request request;

    /**
     * @brief 本次生成的随机值，评测标记必须带有该随机值才会被识别
     */
    std::string nonce;

    /**
     * @brief 测试框架文件在项目中的路径
     */
    std::string path;
};

/**
 * @brief 测试框架生成器
 *
 * 测试框架文件与入口文件位于同一目录，运行时：
 * 1. 按路径加载入口文件（文件名不必是合法的模块名），把公开的名字导入测试的命名空间，
 *    效果与 from <入口模块> import * 相同，导入失败时输出 ERROR 标记
 * 2. 在同一个命名空间中运行测试代码
 * 3. 测试代码抛出 AssertionError 时输出 FAIL 标记，抛出其他异常时输出 ERROR 标记，否则输出 PASS 标记
 *
 * 标记独占一行，格式为 <marker>:<nonce>:<PASS|FAIL|ERROR>[:<JSON 字符串>]，
 * 选手代码的输出几乎不可能恰好构成一个带有本次随机值的完整标记行。
 */
struct harness_builder {
    explicit harness_builder(std::string marker);

    /**
     * @param files 已经通过检查的项目文件
     * @param entry_point 入口文件
     * @param test 测试
     * @param backend 执行后端
     * @param timeout_ms 执行的时间限制
     */
    harness build(const std::vector<project_file> &files, const std::string &entry_point, const test_definition &test, backend_kind backend, int timeout_ms) const;

    /**
     * @brief 生成测试框架的源代码
     * @param module 入口文件加载后在 sys.modules 中的名字
     * @param entry_path 入口文件在项目中的路径
     */
    std::string render(const std::string &module, const std::string &entry_path, const test_definition &test, const std::string &nonce) const;

    const std::string &marker() const;

private:
    std::string marker_prefix;
};

}  // namespace runner
