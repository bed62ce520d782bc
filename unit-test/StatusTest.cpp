#include "gtest/gtest.h"
#include "common/status.hpp"
#include "judge/run_result.hpp"

using namespace std;
using namespace codejudge;

TEST(StatusTest, DisplayMessages) {
    EXPECT_STREQ(get_display_message(status::PENDING), "Pending");
    EXPECT_STREQ(get_display_message(status::ACCEPTED), "Accepted");
    EXPECT_STREQ(get_display_message(status::WRONG_ANSWER), "Wrong Answer");
    EXPECT_STREQ(get_display_message(status::TIME_LIMIT_EXCEEDED), "Time Limit Exceeded");
    EXPECT_STREQ(get_display_message(status::RUNTIME_ERROR), "Runtime Error");
    EXPECT_STREQ(get_display_message(status::COMPILATION_ERROR), "Compilation Error");
    EXPECT_STREQ(get_display_message(status::MEMORY_LIMIT_EXCEEDED), "Memory Limit Exceeded");
}

TEST(StatusTest, ParseStatus) {
    EXPECT_EQ(parse_status("Wrong Answer"), status::WRONG_ANSWER);
    EXPECT_EQ(parse_status("System Error"), status::SYSTEM_ERROR);
    EXPECT_THROW(parse_status("wrong answer"), out_of_range);
}

TEST(StatusTest, ErrorTypeNames) {
    EXPECT_STREQ(get_error_type_name(error_type::INVALID_INPUT), "invalid_input");
    EXPECT_STREQ(get_error_type_name(error_type::COMPILATION_ERROR), "compilation_error");
    EXPECT_STREQ(get_error_type_name(error_type::RUNTIME_ERROR), "runtime_error");
    EXPECT_STREQ(get_error_type_name(error_type::TIMEOUT), "timeout");
    EXPECT_STREQ(get_error_type_name(error_type::SYSTEM_ERROR), "system_error");
}

TEST(StatusTest, ErrorTypeToStatus) {
    EXPECT_EQ(to_status(error_type::SUCCESS), status::ACCEPTED);
    EXPECT_EQ(to_status(error_type::TIMEOUT), status::TIME_LIMIT_EXCEEDED);
    EXPECT_EQ(to_status(error_type::COMPILATION_ERROR), status::COMPILATION_ERROR);
    EXPECT_EQ(to_status(error_type::RUNTIME_ERROR), status::RUNTIME_ERROR);
    EXPECT_EQ(to_status(error_type::INVALID_INPUT), status::RUNTIME_ERROR);
    EXPECT_EQ(to_status(error_type::SYSTEM_ERROR), status::SYSTEM_ERROR);
}

TEST(StatusTest, RunResponse) {
    run_result ok;
    ok.type = error_type::SUCCESS;
    ok.output = "5";
    ok.elapsed_time = 0.0771;
    nlohmann::json j = to_run_response(ok);
    EXPECT_EQ(j["success"], true);
    EXPECT_EQ(j["output"], "5");
    EXPECT_EQ(j["execution_time"], "0.077s");
    EXPECT_FALSE(j.contains("error_type"));

    run_result timeout;
    timeout.type = error_type::TIMEOUT;
    timeout.error = "Time Limit Exceeded: Execution took longer than 1s";
    timeout.elapsed_time = 1.0;
    j = to_run_response(timeout);
    EXPECT_EQ(j["success"], false);
    EXPECT_EQ(j["error_type"], "timeout");
    EXPECT_EQ(j["error"], timeout.error);
    EXPECT_FALSE(j.contains("output"));
}
