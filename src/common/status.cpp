#include "common/status.hpp"
#include <boost/assign.hpp>
#include <unordered_map>
#include "common/stl_utils.hpp"

namespace codeeval {
using namespace std;

// clang-format off
static const unordered_map<status, const char *> status_string = boost::assign::map_list_of
    (status::PASSED, "passed")
    (status::TIMED_OUT, "timed out")
    (status::FAILED, "failed");
// clang-format on

const char *get_display_message(status stat) {
    return status_string.at(stat);
}

status get_status(const execution_outcome &result) {
    return visit(overloaded{
                     [](const outcome::passed &) { return status::PASSED; },
                     [](const outcome::timed_out &) { return status::TIMED_OUT; },
                     [](const outcome::failed &) { return status::FAILED; }},
                 result);
}

string to_result_string(const execution_outcome &result) {
    string display = get_display_message(get_status(result));
    if (auto fail = get_if<outcome::failed>(&result))
        return display + ": " + fail->message;
    return display;
}

}  // namespace codeeval
