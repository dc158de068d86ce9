#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace assessor {
using namespace std;

assessor_exception::assessor_exception()
    : assessor_exception("") {}

assessor_exception::assessor_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *assessor_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const assessor_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

internal_error::internal_error()
    : assessor_exception() {}

internal_error::internal_error(const string &message)
    : assessor_exception(message) {}

workspace_error::workspace_error()
    : assessor_exception() {}

workspace_error::workspace_error(const string &message)
    : assessor_exception(message) {}

spawn_error::spawn_error()
    : assessor_exception() {}

spawn_error::spawn_error(const string &message)
    : assessor_exception(message) {}

harness_error::harness_error()
    : assessor_exception() {}

harness_error::harness_error(const string &message)
    : assessor_exception(message) {}

}  // namespace assessor
