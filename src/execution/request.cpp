#include "execution/request.hpp"
#include <stdexcept>
#include "common/stl_utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

backend_kind execution_result::kind() const {
    return holds_alternative<sandbox_metadata>(metadata) ? backend_kind::SANDBOX : backend_kind::INTERPRETER;
}

const char *to_string(backend_kind kind) {
    switch (kind) {
        case backend_kind::INTERPRETER:
            return "interpreter";
        case backend_kind::SANDBOX:
            return "sandbox";
    }
    return "unknown";
}

const char *to_string(execution_mode mode) {
    return mode == execution_mode::SINGLE ? "single" : "project";
}

backend_kind parse_backend_kind(const string &name) {
    if (name == "interpreter" || name == "client") return backend_kind::INTERPRETER;
    if (name == "sandbox" || name == "server") return backend_kind::SANDBOX;
    throw invalid_argument("unknown backend " + name);
}

void to_json(json &j, const project_file &file) {
    j = {{"path", file.path}, {"content", file.content}};
}

void from_json(const json &j, project_file &file) {
    j.at("path").get_to(file.path);
    j.at("content").get_to(file.content);
}

void to_json(json &j, const execution_result &result) {
    j = {{"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"durationMs", result.duration_ms},
         {"backend", to_string(result.kind())}};
    if (result.error_summary) j["error"] = *result.error_summary;
    visit(overloaded{
              [&](const interpreter_metadata &meta) {
                  j["metadata"] = {{"loadTimeMs", meta.load_time_ms},
                                   {"reused", meta.reused},
                                   {"pythonVersion", meta.python_version}};
              },
              [&](const sandbox_metadata &meta) {
                  j["metadata"] = {{"sandboxId", meta.sandbox_id},
                                   {"provisionMs", meta.provision_ms},
                                   {"exitCode", meta.exit_code},
                                   {"provisionAttempts", meta.provision_attempts}};
              }},
          result.metadata);
}

}  // namespace runner
