#include "judge/ports.hpp"

namespace runner {

bool submission_filter::matches(const submission_record &record) const {
    if (user_id && record.user_id != *user_id) return false;
    if (lesson_id && record.lesson_id != *lesson_id) return false;
    if (status && record.status != *status) return false;
    return true;
}

submission_store::~submission_store() = default;

progress_tracker::~progress_tracker() = default;

}  // namespace runner
