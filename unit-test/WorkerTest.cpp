#include <algorithm>
#include "gmock/gmock.h"
#include "gtest/gtest.h"
#include "test/mock_executor.hpp"
#include "test/mock_judge_server.hpp"
#include "worker.hpp"

using namespace std;
using namespace codejudge;
using namespace codejudge::mock;
using ::testing::_;
using ::testing::Invoke;

TEST(WorkerTest, JudgesEverySubmission) {
    server::mock::configuration judge_server;
    problem prob;
    prob.id = "1";
    for (long long id = 1; id <= 3; ++id) {
        test_case tc;
        tc.id = id;
        tc.input = to_string(id);
        tc.expected_output = to_string(id);
        prob.test_cases.push_back(tc);
    }
    judge_server.problems[prob.id] = prob;

    mock_executor exec;
    // 代码为 wrong 的提交输出错误答案
    EXPECT_CALL(exec, run(_)).WillRepeatedly(Invoke([](const run_request &request) {
        return success_result(request.code == "wrong" ? "0" : request.input, 0.01);
    }));

    judger j(exec, judge_server);
    const size_t count = 20;
    {
        worker_pool pool(j, judge_server, 4);
        EXPECT_EQ(pool.size(), 4);
        for (size_t i = 0; i < count; ++i) {
            auto submit = make_shared<submission>();
            submit->sub_id = to_string(i);
            submit->prob_id = "1";
            submit->language = "python";
            submit->code = i % 2 ? "wrong" : "right";
            EXPECT_TRUE(pool.submit(submit));
        }
        pool.stop();
        EXPECT_FALSE(pool.submit(make_shared<submission>()));
    }

    auto results = judge_server.results();
    ASSERT_EQ(results.size(), count);
    for (auto &submit : results) {
        size_t i = stoul(submit.sub_id);
        if (i % 2) {
            EXPECT_EQ(submit.result, status::WRONG_ANSWER);
            EXPECT_EQ(submit.test_cases_passed, 0);
        } else {
            EXPECT_EQ(submit.result, status::ACCEPTED);
            EXPECT_EQ(submit.test_cases_passed, 3);
        }
        EXPECT_EQ(submit.test_cases_total, 3);
    }
    EXPECT_EQ(judge_server.accepted_notifications, count / 2);
}

TEST(WorkerTest, DefaultWorkerCount) {
    server::mock::configuration judge_server;
    mock_executor exec;
    judger j(exec, judge_server);
    worker_pool pool(j, judge_server, 0);
    EXPECT_GE(pool.size(), 1);
}
