#pragma once

#include <filesystem>
#include <set>
#include <string>

namespace runner {

/**
 * @brief 单次执行（运行项目或者运行一个测试）的默认时间限制
 * @note 单位为毫秒，默认 30 秒
 */
extern int DEFAULT_TIMEOUT_MS;

/**
 * @brief 整个提交（运行项目加上所有测试）的默认总时间限制
 * @note 单位为毫秒
 */
extern int DEFAULT_SUBMISSION_TIMEOUT_MS;

/**
 * @brief 执行超时或被取消后，等待后端释放资源的最长时间
 * @note 单位为毫秒。超过该时间后资源仍未释放会记录错误日志，
 * 占用的并发名额会在后端真正返回时归还。
 */
extern int TEARDOWN_GRACE_MS;

/**
 * @brief 每个会话默认允许同时执行的请求数
 */
extern int DEFAULT_MAX_CONCURRENT;

/**
 * @brief 允许出现在项目中的文件扩展名
 */
extern std::set<std::string> ALLOWED_EXTENSIONS;

/**
 * @brief 单个项目最多允许的文件数以及单个文件的最大字节数
 */
extern std::size_t MAX_PROJECT_FILES;
extern std::size_t MAX_FILE_SIZE;

/**
 * @brief 进程内解释器执行选手代码的根目录
 *
 * WORK_DIR
 * ├── session-1 // 会话 id
 * │   ├── run-ABCDEFG // 一次执行的临时目录（随机 uuid），执行完成后删除
 * │   │   ├── main.py
 * │   │   └── _runner_harness_0a1b2c3d.py
 * │   └── ...
 * └── ...
 */
extern std::filesystem::path WORK_DIR;

/**
 * @brief 远程沙箱服务的地址，为空时不启用远程执行
 */
extern std::string SANDBOX_URL;

/**
 * @brief 远程沙箱服务的 API Key，通过 X-API-Key 请求头发送
 */
extern std::string SANDBOX_API_KEY;

/**
 * @brief 创建远程沙箱时使用的模板
 */
extern std::string SANDBOX_TEMPLATE;

/**
 * @brief 远程沙箱中运行项目的工作目录
 */
extern std::string SANDBOX_WORKDIR;

/**
 * @brief 输出标记的前缀，测试框架用该前缀加上随机值标记评测结果
 */
extern std::string VERDICT_MARKER;

/**
 * @brief 是否开启 DEBUG 模式
 * 如果开启 DEBUG 模式，执行完成后不删除临时目录，以便手动检查执行时写入的文件。
 */
extern bool DEBUG;

}  // namespace runner
