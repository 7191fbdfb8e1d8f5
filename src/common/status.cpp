#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace sandbox {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::COMPLETED, "Completed")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILATION_ERROR, "Compilation Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::SECURITY_VIOLATION, "Security Violation")
    (status::UNSUPPORTED_LANGUAGE, "Unsupported Language")
    (status::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

}  // namespace sandbox
