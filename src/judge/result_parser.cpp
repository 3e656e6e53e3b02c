#include "judge/result_parser.hpp"
#include <nlohmann/json.hpp>
#include "common/stl_utils.hpp"

namespace runner {
using namespace std;

struct marker_line {
    string kind;
    optional<string> detail;
};

/**
 * @brief 解析一行输出，不是标记行时返回空
 */
static optional<marker_line> parse_line(string line, const string &prefix) {
    if (!line.empty() && line.back() == '\r') line.pop_back();
    if (line.compare(0, prefix.size(), prefix) != 0) return {};

    string rest = line.substr(prefix.size());
    size_t colon = rest.find(':');
    marker_line marker;
    marker.kind = rest.substr(0, colon);
    if (marker.kind != "PASS" && marker.kind != "FAIL" && marker.kind != "ERROR") return {};
    if (colon != string::npos) {
        string payload = rest.substr(colon + 1);
        try {
            nlohmann::json detail = nlohmann::json::parse(payload);
            marker.detail = detail.is_string() ? detail.get<string>() : detail.dump();
        } catch (nlohmann::json::exception &) {
            marker.detail = payload;
        }
    }
    return marker;
}

result_parser::result_parser(string marker)
    : marker_prefix(move(marker)) {}

test_outcome result_parser::parse(const test_definition &test, const execution_result &result, const string &nonce) const {
    test_outcome outcome;
    outcome.id = test.id;
    outcome.name = test.name;
    outcome.duration_ms = result.duration_ms;

    if (result.error_summary) {
        outcome.status = test_status::ERRORED;
        outcome.message = *result.error_summary;
        return outcome;
    }

    string prefix = marker_prefix + ":" + nonce + ":";
    optional<marker_line> fail, error;
    bool passed = false;
    for (auto &line : split(result.stdout_text, '\n')) {
        auto marker = parse_line(line, prefix);
        if (!marker) continue;
        if (marker->kind == "FAIL" && !fail)
            fail = marker;
        else if (marker->kind == "ERROR" && !error)
            error = marker;
        else if (marker->kind == "PASS")
            passed = true;
    }

    if (fail) {
        outcome.status = test_status::FAILED;
        outcome.message = fail->detail.value_or("Assertion failed");
    } else if (error) {
        outcome.status = test_status::ERRORED;
        outcome.message = error->detail.value_or("Test raised an error");
    } else if (passed) {
        outcome.status = test_status::PASSED;
    } else {
        outcome.status = test_status::ERRORED;
        outcome.message = "No verdict produced";
    }
    return outcome;
}

}  // namespace runner
