#include "ojudge/common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>

namespace ojudge {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::ACCEPTED, "Accepted")
    (status::WRONG_ANSWER, "Wrong Answer")
    (status::PRESENTATION_ERROR, "Presentation Error")
    (status::TIME_LIMIT_EXCEEDED, "Time Limit Exceeded")
    (status::MEMORY_LIMIT_EXCEEDED, "Memory Limit Exceeded")
    (status::OUTPUT_LIMIT_EXCEEDED, "Output Limit Exceeded")
    (status::RUNTIME_ERROR, "Runtime Error")
    (status::COMPILE_ERROR, "Compile Error")
    (status::SYSTEM_ERROR, "System Error");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

}  // namespace ojudge
