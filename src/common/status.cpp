#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace assessor {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::MALFORMED_OUTPUT, "Malformed Output")
    (status::HARNESS_ERROR, "Harness Error")
    (status::SYSTEM_ERROR, "System Error")
    (status::NOT_IMPLEMENTED, "Not Implemented")
    (status::CANCELLED, "Cancelled");

static const unordered_map<status, const char *> status_name = boost::assign::map_list_of
    (status::ACCEPTED, "ACCEPTED")
    (status::WRONG_ANSWER, "WRONG_ANSWER")
    (status::RUNTIME_ERROR, "RUNTIME_ERROR")
    (status::TIME_LIMIT_EXCEEDED, "TIME_LIMIT_EXCEEDED")
    (status::OUTPUT_LIMIT_EXCEEDED, "OUTPUT_LIMIT_EXCEEDED")
    (status::MALFORMED_OUTPUT, "MALFORMED_OUTPUT")
    (status::HARNESS_ERROR, "HARNESS_ERROR")
    (status::SYSTEM_ERROR, "SYSTEM_ERROR")
    (status::NOT_IMPLEMENTED, "NOT_IMPLEMENTED")
    (status::CANCELLED, "CANCELLED");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

const char *get_status_name(status stat) {
    return status_name.at(stat);
}

}  // namespace assessor
