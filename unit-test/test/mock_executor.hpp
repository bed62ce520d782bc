#pragma once

#include "gmock/gmock.h"
#include "judge/executor.hpp"

namespace codejudge::mock {

struct mock_executor : public executor {
    MOCK_METHOD(run_result, run, (const run_request &request), (const, override));
};

inline run_result success_result(const std::string &output, double elapsed_time = 0.1, long memory_used = -1) {
    run_result result;
    result.type = error_type::SUCCESS;
    result.output = output;
    result.elapsed_time = elapsed_time;
    result.memory_used = memory_used;
    return result;
}

inline run_result failure_result(error_type type, const std::string &error, double elapsed_time = 0.1) {
    run_result result;
    result.type = type;
    result.error = error;
    result.elapsed_time = elapsed_time;
    return result;
}

}  // namespace codejudge::mock
