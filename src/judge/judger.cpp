#include "judge/judger.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include <ctime>
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

static const char *NO_TEST_CASES_MESSAGE = "No test cases found for this problem.";
static const char *JUDGE_SYSTEM_ERROR_MESSAGE = "An unexpected judging system error occurred";
static const char *COMPILE_TIMEOUT_MARKER = "Timed out";

judger::judger(const executor &exec, server::judge_server &judge_server)
    : exec(exec), judge_server(judge_server) {}

status judger::judge(submission &submit) const {
    // 每次评测都是新的会话，不能累加上一次评测的结果
    submit.reset();
    LOG(INFO) << "Judging submission " << submit.sub_id << " of problem " << submit.prob_id << " [" << submit.language << "]";
    try {
        run_test_cases(submit);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Judging submission " << submit.sub_id << " crashed: " << boost::diagnostic_information(ex);
        submit.result = status::RUNTIME_ERROR;
        submit.error = JUDGE_SYSTEM_ERROR_MESSAGE;
    }
    submit.judged_at = time(nullptr);

    if (submit.result == status::ACCEPTED) {
        try {
            judge_server.on_accepted(submit);
        } catch (std::exception &ex) {
            // 统计失败不影响评测结果
            LOG(ERROR) << "Unable to update statistics for submission " << submit.sub_id << ": " << boost::diagnostic_information(ex);
        }
    }

    LOG(INFO) << "Finished judging " << submit;
    return submit.result;
}

status judger::rejudge(submission &submit) const {
    LOG(INFO) << "Rejudging submission " << submit.sub_id << ", previous result: " << get_display_message(submit.result);
    return judge(submit);
}

void judger::run_test_cases(submission &submit) const {
    problem prob = judge_server.fetch_problem(submit.prob_id);
    vector<test_case> test_cases = prob.ordered_test_cases();
    submit.test_cases_total = test_cases.size();
    if (test_cases.empty()) {
        LOG(WARNING) << "No test cases found for problem " << prob.id;
        submit.result = status::RUNTIME_ERROR;
        submit.error = NO_TEST_CASES_MESSAGE;
        return;
    }

    for (auto &tc : test_cases) {
        run_request request;
        request.language = submit.language;
        request.code = submit.code;
        request.input = tc.input;
        request.time_limit = prob.time_limit;
        request.memory_limit = int64_t(prob.memory_limit) * 1024 * 1024;
        run_result result = exec.run(request);
        DLOG(INFO) << "Submission " << submit.sub_id << ", test case " << tc.id << ": " << result;

        submit.execution_time += result.elapsed_time;
        if (result.memory_used >= 0) {
            submit.memory_used = max(submit.memory_used, result.memory_used);
            submit.memory_measured = true;
        }
        submit.output = result.output;
        submit.error = result.error;

        if (result.success() && result.output == trim_output(tc.expected_output)) {
            ++submit.test_cases_passed;
            continue;
        }

        submit.result = result.success() ? status::WRONG_ANSWER : to_status(result.type);
        return;
    }

    submit.result = status::ACCEPTED;
}

status judge_with_retry(const judger &j, submission &submit) {
    status result = j.judge(submit);
    if (result == status::COMPILATION_ERROR && submit.error.find(COMPILE_TIMEOUT_MARKER) != string::npos) {
        LOG(WARNING) << "Compilation of submission " << submit.sub_id << " timed out, judging once more";
        result = j.rejudge(submit);
    }
    return result;
}

}  // namespace codejudge
