#include "common/exceptions.hpp"
#include <boost/exception/diagnostic_information.hpp>

namespace sandbox {
using namespace std;

sandbox_exception::sandbox_exception(const string &message)
    : message(message), stacktrace(make_shared<boost::stacktrace::stacktrace>()) {}

const char *sandbox_exception::what() const noexcept {
    return message.c_str();
}

std::ostream &operator<<(std::ostream &os, const sandbox_exception &ex) {
    os << boost::diagnostic_information(ex) << endl << *ex.stacktrace;
    return os;
}

infrastructure_error::infrastructure_error(const string &message)
    : sandbox_exception(message) {}

compilation_error::compilation_error(const string &what, const string &error_log, double elapsed_ms)
    : sandbox_exception(what), error_log(error_log), elapsed_ms(elapsed_ms) {}

}  // namespace sandbox
