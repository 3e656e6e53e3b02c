#pragma once

#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

/**
 * 这个头文件包含执行请求与执行结果
 * 1. project_file 类（表示项目中的一个文件）
 * 2. execution_request 类（表示一次执行）
 * 3. execution_result 类（表示一次执行捕获到的输出）
 */
namespace runner {

/**
 * @brief 执行后端的类型
 */
enum class backend_kind {
    INTERPRETER,  // 进程内嵌入的解释器
    SANDBOX       // 远程的一次性沙箱服务
};

/**
 * @brief 执行模式
 */
enum class execution_mode {
    SINGLE,  // 执行一段代码，请求中只有一个文件，同时也是入口文件
    PROJECT  // 执行多文件项目
};

/**
 * @brief 项目中的一个文件
 * @note path 为相对路径，比如 "utils/helpers.py"，必须通过 validate_project 检查
 */
struct project_file {
    std::string path;
    std::string content;
};

/**
 * @brief 一次执行请求
 * 由执行队列持有，进入终止状态后销毁
 */
struct execution_request {
    /**
     * @brief 请求 id，用于取消执行。为空时由执行队列生成
     */
    std::string id;

    execution_mode mode = execution_mode::PROJECT;

    std::vector<project_file> files;

    /**
     * @brief 入口文件，可以是完整路径，也可以是路径末尾的若干段（如 main.py）
     */
    std::string entry_point = "main.py";

    backend_kind backend = backend_kind::INTERPRETER;

    /**
     * @brief 时间限制，单位为毫秒，小于等于 0 时使用 DEFAULT_TIMEOUT_MS
     */
    int timeout_ms = 0;
};

/**
 * @brief 进程内解释器的附加信息
 */
struct interpreter_metadata {
    /**
     * @brief 解释器加载花费的时间，单位为毫秒
     */
    double load_time_ms = 0;

    /**
     * @brief 本次执行是否复用了之前已经加载好的解释器
     */
    bool reused = false;

    std::string python_version;
};

/**
 * @brief 远程沙箱的附加信息
 */
struct sandbox_metadata {
    std::string sandbox_id;

    /**
     * @brief 创建沙箱花费的时间，单位为毫秒
     */
    double provision_ms = 0;

    /**
     * @brief 入口程序的退出码
     */
    int exit_code = 0;

    /**
     * @brief 创建沙箱的尝试次数，暂时性错误会重试一次
     */
    int provision_attempts = 0;
};

/**
 * @brief 与执行后端相关的附加信息，按 backend_kind 区分
 */
using backend_metadata = std::variant<interpreter_metadata, sandbox_metadata>;

/**
 * @brief 一次执行的结果
 * 选手代码抛出的异常不会作为 C++ 异常抛出，而是保存在 error_summary 中
 */
struct execution_result {
    std::string stdout_text;
    std::string stderr_text;

    /**
     * @brief 选手代码未捕获的异常、语法错误或者非零退出码的描述
     */
    std::optional<std::string> error_summary;

    /**
     * @brief 后端测量的实际运行时间，单位为毫秒
     */
    double duration_ms = 0;

    backend_metadata metadata;

    backend_kind kind() const;
};

const char *to_string(backend_kind kind);
const char *to_string(execution_mode mode);

/**
 * @brief 解析后端名称
 * 同时接受 interpreter/client 与 sandbox/server（前端使用的名称）
 * @throw std::invalid_argument 名称不存在时
 */
backend_kind parse_backend_kind(const std::string &name);

void to_json(nlohmann::json &j, const project_file &file);
void from_json(const nlohmann::json &j, project_file &file);
void to_json(nlohmann::json &j, const execution_result &result);

}  // namespace runner
