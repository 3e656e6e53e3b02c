#include "execution/session.hpp"
#include <glog/logging.h>
#include "common/utils.hpp"
#include "config.hpp"

namespace runner {
using namespace std;

session::session(session_options options)
    : session_id(options.id.empty() ? random_uuid() : options.id) {
    filesystem::path base = options.workdir.empty() ? WORK_DIR : options.workdir;
    root = filesystem::absolute(base) / session_id;

    interpreter_ptr = make_unique<interpreter_backend>(root);
    if (options.sandbox)
        sandbox_ptr = make_unique<sandbox_backend>(options.sandbox);

    size_t max_concurrent = options.max_concurrent > 0 ? options.max_concurrent : (size_t)DEFAULT_MAX_CONCURRENT;
    queue_ptr = make_unique<execution_queue>(max_concurrent, options.limiter);
    queue_ptr->register_backend(*interpreter_ptr);
    if (sandbox_ptr) queue_ptr->register_backend(*sandbox_ptr);

    LOG(INFO) << "Session " << session_id << " created, max concurrent executions: " << max_concurrent
              << (sandbox_ptr ? ", sandbox enabled" : "");
}

session::~session() {
    queue_ptr.reset();
    sandbox_ptr.reset();
    interpreter_ptr.reset();

    if (!DEBUG) {
        error_code ec;
        filesystem::remove_all(root, ec);
    }
    LOG(INFO) << "Session " << session_id << " closed";
}

const string &session::id() const {
    return session_id;
}

execution_queue &session::queue() {
    return *queue_ptr;
}

interpreter_backend &session::interpreter() {
    return *interpreter_ptr;
}

sandbox_backend *session::sandbox() {
    return sandbox_ptr.get();
}

}  // namespace runner
