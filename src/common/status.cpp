#include "common/status.hpp"
#include <boost/assign.hpp>
#include <stdexcept>
#include <unordered_map>

namespace runner {
using namespace std;

// clang-format off
static const unordered_map<test_status, const char *> test_status_string = boost::assign::map_list_of
    (test_status::PASSED, "Passed")
    (test_status::FAILED, "Failed")
    (test_status::ERRORED, "Errored")
    (test_status::TIMED_OUT, "Timed Out");

static const unordered_map<test_status, const char *> test_status_name = boost::assign::map_list_of
    (test_status::PASSED, "passed")
    (test_status::FAILED, "failed")
    (test_status::ERRORED, "errored")
    (test_status::TIMED_OUT, "timedOut");

static const unordered_map<submission_status, const char *> submission_status_string = boost::assign::map_list_of
    (submission_status::SUCCESS, "All Tests Passed")
    (submission_status::PARTIAL, "Partially Passed")
    (submission_status::EXECUTION_ERROR, "Execution Error")
    (submission_status::TIMED_OUT, "Timed Out")
    (submission_status::CANCELED, "Canceled");

static const unordered_map<submission_status, const char *> submission_status_name = boost::assign::map_list_of
    (submission_status::SUCCESS, "success")
    (submission_status::PARTIAL, "partial")
    (submission_status::EXECUTION_ERROR, "execution-error")
    (submission_status::TIMED_OUT, "timed-out")
    (submission_status::CANCELED, "canceled");

static const unordered_map<execution_state, const char *> execution_state_string = boost::assign::map_list_of
    (execution_state::QUEUED, "Queued")
    (execution_state::RUNNING, "Running")
    (execution_state::COMPLETED, "Completed")
    (execution_state::TIMED_OUT, "Timed Out")
    (execution_state::CANCELED, "Canceled")
    (execution_state::FAILED, "Failed");
// clang-format on

const char *get_display_message(test_status stat) {
    return test_status_string.at(stat);
}

const char *get_display_message(submission_status stat) {
    return submission_status_string.at(stat);
}

const char *get_display_message(execution_state state) {
    return execution_state_string.at(state);
}

const char *to_string(test_status stat) {
    return test_status_name.at(stat);
}

const char *to_string(submission_status stat) {
    return submission_status_name.at(stat);
}

test_status parse_test_status(const string &name) {
    for (auto &[stat, value] : test_status_name)
        if (name == value) return stat;
    throw invalid_argument("unknown test status " + name);
}

submission_status parse_submission_status(const string &name) {
    for (auto &[stat, value] : submission_status_name)
        if (name == value) return stat;
    throw invalid_argument("unknown submission status " + name);
}

bool is_terminal(execution_state state) {
    return state != execution_state::QUEUED && state != execution_state::RUNNING;
}

}  // namespace runner
