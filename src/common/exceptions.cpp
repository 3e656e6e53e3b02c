#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace runner {
using namespace std;

runner_exception::runner_exception()
    : runner_exception("") {}

runner_exception::runner_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *runner_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const runner_exception &ex) {
    os << boost::diagnostic_information(ex) << endl
       << *ex.stacktrace;
    return os;
}

validation_error::validation_error(const string &message)
    : runner_exception(message) {}

contract_violation::contract_violation(const string &message)
    : runner_exception(message) {}

backend_initialization_error::backend_initialization_error(const string &message)
    : runner_exception(message) {}

provisioning_error::provisioning_error(const string &message, bool transient)
    : backend_initialization_error(message), transient(transient) {}

execution_timeout::execution_timeout(const string &message)
    : runner_exception(message) {}

execution_canceled::execution_canceled(const string &message)
    : runner_exception(message) {}

runtime_fault::runtime_fault(const string &message)
    : runner_exception(message) {}

transport_failure::transport_failure(const string &message)
    : runner_exception(message) {}

persistence_error::persistence_error(const string &message)
    : runner_exception(message) {}

}  // namespace runner
