#include "judge/run_result.hpp"
#include <boost/assign.hpp>
#include <ostream>
#include <unordered_map>
#include "common/utils.hpp"

namespace codejudge {
using namespace std;
using namespace nlohmann;

// clang-format off
static const unordered_map<error_type, const char *> error_type_string = boost::assign::map_list_of
    (error_type::SUCCESS, "success")
    (error_type::INVALID_INPUT, "invalid_input")
    (error_type::COMPILATION_ERROR, "compilation_error")
    (error_type::RUNTIME_ERROR, "runtime_error")
    (error_type::TIMEOUT, "timeout")
    (error_type::SYSTEM_ERROR, "system_error");

static const unordered_map<error_type, status> error_type_status = boost::assign::map_list_of
    (error_type::SUCCESS, status::ACCEPTED)
    (error_type::INVALID_INPUT, status::RUNTIME_ERROR)
    (error_type::COMPILATION_ERROR, status::COMPILATION_ERROR)
    (error_type::RUNTIME_ERROR, status::RUNTIME_ERROR)
    (error_type::TIMEOUT, status::TIME_LIMIT_EXCEEDED)
    (error_type::SYSTEM_ERROR, status::SYSTEM_ERROR);
// clang-format on

const char *get_error_type_name(error_type type) {
    return error_type_string.at(type);
}

status to_status(error_type type) {
    return error_type_status.at(type);
}

bool run_result::success() const {
    return type == error_type::SUCCESS;
}

json to_run_response(const run_result &result) {
    json j;
    j["success"] = result.success();
    if (result.success()) {
        j["output"] = result.output;
    } else {
        j["error"] = result.error;
        j["error_type"] = get_error_type_name(result.type);
    }
    j["execution_time"] = format_seconds(result.elapsed_time);
    return j;
}

ostream &operator<<(ostream &os, const run_result &result) {
    os << get_error_type_name(result.type) << " (" << format_seconds(result.elapsed_time);
    if (result.memory_used >= 0) os << ", " << result.memory_used << "KB";
    os << ")";
    if (!result.error.empty()) os << ": " << result.error;
    return os;
}

}  // namespace codejudge
