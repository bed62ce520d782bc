#include <sstream>
#include "gtest/gtest.h"
#include "common/io_utils.hpp"
#include "server/local/local_server.hpp"

using namespace std;
using namespace codejudge;
using namespace nlohmann;

static const char *PROBLEM = R"({
    "id": "1",
    "title": "A+B",
    "time_limit": 1.0,
    "memory_limit": 256,
    "test_cases": [
        {"id": 1, "input": "2 3", "expected_output": "5", "is_sample": true},
        {"id": 2, "input": "1 1", "expected_output": "2"}
    ]
})";

TEST(LocalServerTest, LoadProblems) {
    temporary_directory dir(filesystem::temp_directory_path());
    write_file_content(dir.path() / "1.json", PROBLEM);
    write_file_content(dir.path() / "README.md", "not a problem");

    ostringstream out;
    server::local::configuration judge_server(out);
    EXPECT_EQ(judge_server.load_problems(dir.path()), 1);
    problem prob = judge_server.fetch_problem("1");
    EXPECT_EQ(prob.title, "A+B");
    EXPECT_EQ(prob.test_cases.size(), 2);
    EXPECT_THROW(judge_server.fetch_problem("2"), out_of_range);
}

TEST(LocalServerTest, MalformedProblem) {
    temporary_directory dir(filesystem::temp_directory_path());
    write_file_content(dir.path() / "bad.json", "{\"id\": ");
    ostringstream out;
    server::local::configuration judge_server(out);
    EXPECT_THROW(judge_server.load_problem(dir.path() / "bad.json"), invalid_argument);
}

TEST(LocalServerTest, SummarizePrintsJsonLine) {
    ostringstream out;
    server::local::configuration judge_server(out);
    submission submit;
    submit.sub_id = "9";
    submit.prob_id = "1";
    submit.result = status::TIME_LIMIT_EXCEEDED;
    judge_server.summarize(submit);

    string line = out.str();
    ASSERT_FALSE(line.empty());
    EXPECT_EQ(line.back(), '\n');
    json j = json::parse(line);
    EXPECT_EQ(j["submission_id"], "9");
    EXPECT_EQ(j["status"], "Time Limit Exceeded");
}

TEST(LocalServerTest, SolvedCountIgnoresRepeatedAcceptance) {
    ostringstream out;
    server::local::configuration judge_server(out);
    submission submit;
    submit.user_id = "alice";
    submit.prob_id = "1";
    judge_server.on_accepted(submit);
    judge_server.on_accepted(submit);
    submit.prob_id = "2";
    judge_server.on_accepted(submit);
    EXPECT_EQ(judge_server.solved_count("alice"), 2);
    EXPECT_EQ(judge_server.solved_count("bob"), 0);
}
