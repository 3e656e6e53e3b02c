#pragma once

#include <optional>
#include <string>
#include "execution/request.hpp"
#include "judge/test_case.hpp"

namespace runner {

/**
 * @brief 根据测试框架的输出判定测试结果
 *
 * 判定顺序：
 * 1. 后端报告了错误（error_summary） -> ERRORED，信息为后端的错误信息
 * 2. 存在 FAIL 标记 -> FAILED，信息为断言失败信息
 * 3. 存在 ERROR 标记 -> ERRORED，信息为异常信息
 * 4. 存在 PASS 标记 -> PASSED
 * 5. 没有任何标记 -> ERRORED，信息为 "No verdict produced"
 * 运行时间取后端测量的时间。
 */
struct result_parser {
    explicit result_parser(std::string marker);

    /**
     * @param test 被评测的测试
     * @param result 测试框架的执行结果
     * @param nonce 测试框架的随机值，只识别带有该随机值的标记
     */
    test_outcome parse(const test_definition &test, const execution_result &result, const std::string &nonce) const;

private:
    std::string marker_prefix;
};

}  // namespace runner
