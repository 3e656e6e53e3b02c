#include "judge/submission.hpp"
#include <cmath>
#include "common/json_utils.hpp"
#include "common/utils.hpp"

namespace runner {
using namespace std;
using namespace nlohmann;

submission_summary summarize(const vector<test_outcome> &outcomes) {
    submission_summary summary;
    summary.total = outcomes.size();
    for (auto &outcome : outcomes)
        if (outcome.status == test_status::PASSED) ++summary.passed;
    summary.failed = summary.total - summary.passed;
    summary.score = summary.total ? (int)lround(100.0 * summary.passed / summary.total) : 0;
    return summary;
}

void to_json(json &j, const submission_summary &summary) {
    j = {{"total", summary.total},
         {"passed", summary.passed},
         {"failed", summary.failed},
         {"score", summary.score}};
}

void from_json(const json &j, submission_summary &summary) {
    summary.total = get_value<size_t>(j, "total");
    summary.passed = get_value<size_t>(j, "passed");
    summary.failed = get_value<size_t>(j, "failed");
    summary.score = get_value<int>(j, "score");
}

void to_json(json &j, const submission_record &record) {
    j = {{"submissionId", record.submission_id},
         {"userId", record.user_id},
         {"lessonId", record.lesson_id},
         {"backend", to_string(record.backend)},
         {"files", record.files},
         {"outcomes", record.outcomes},
         {"summary", record.summary},
         {"status", to_string(record.status)},
         {"startedAt", format_time(record.started_at)},
         {"finishedAt", format_time(record.finished_at)}};
}

void from_json(const json &j, submission_record &record) {
    record.submission_id = get_value<string>(j, "submissionId");
    record.user_id = get_value_def<string>(j, "", "userId");
    record.lesson_id = get_value_def<string>(j, "", "lessonId");
    record.backend = parse_backend_kind(get_value_def<string>(j, "interpreter", "backend"));
    record.files = get_value_def<vector<project_file>>(j, {}, "files");
    record.outcomes = get_value_def<vector<test_outcome>>(j, {}, "outcomes");
    record.summary = get_value<submission_summary>(j, "summary");
    record.status = parse_submission_status(get_value<string>(j, "status"));
    record.started_at = parse_time(get_value_def<string>(j, "", "startedAt"));
    record.finished_at = parse_time(get_value_def<string>(j, "", "finishedAt"));
}

void to_json(json &j, const submission_result &result) {
    j = {{"success", result.success},
         {"status", to_string(result.status)},
         {"testOutcomes", result.test_outcomes},
         {"summary", result.summary},
         {"executionOutput", result.execution_output},
         {"executionTimeMs", result.execution_time_ms},
         {"submissionId", result.submission_id}};
    if (!result.warnings.empty()) j["warnings"] = result.warnings;
}

void to_json(json &j, const playground_result &result) {
    j = {{"stdout", result.stdout_text},
         {"stderr", result.stderr_text},
         {"durationMs", result.duration_ms},
         {"timedOut", result.timed_out}};
    if (result.error) j["error"] = *result.error;
}

}  // namespace runner
