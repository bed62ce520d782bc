#include "judge/submission.hpp"
#include <algorithm>

namespace codejudge {
using namespace std;
using namespace nlohmann;

/**
 * @brief 读取 id，JSON 中的 id 可以是字符串，也可以是数字
 */
static string get_id(const json &j, const char *key) {
    const json &value = j.at(key);
    if (value.is_string()) return value.get<string>();
    if (value.is_number_integer()) return to_string(value.get<long long>());
    throw invalid_argument(string("Unexpected value type of: ") + key + " in " + j.dump());
}

vector<test_case> problem::ordered_test_cases() const {
    vector<test_case> result = test_cases;
    stable_sort(result.begin(), result.end(), [](const test_case &a, const test_case &b) { return a.id < b.id; });
    return result;
}

vector<test_case> problem::samples() const {
    vector<test_case> result;
    for (auto &tc : ordered_test_cases())
        if (tc.is_sample) result.push_back(tc);
    return result;
}

void submission::reset() {
    result = status::PENDING;
    output.clear();
    error.clear();
    execution_time = 0;
    memory_used = 0;
    memory_measured = false;
    test_cases_passed = 0;
    test_cases_total = 0;
    judged_at = 0;
}

void from_json(const json &j, test_case &tc) {
    j.at("id").get_to(tc.id);
    j.at("input").get_to(tc.input);
    j.at("expected_output").get_to(tc.expected_output);
    tc.is_sample = j.value("is_sample", false);
}

void from_json(const json &j, problem &prob) {
    prob.id = get_id(j, "id");
    prob.title = j.value("title", "");
    prob.time_limit = j.value("time_limit", 1.0);
    prob.memory_limit = j.value("memory_limit", 256);
    if (j.count("test_cases")) j.at("test_cases").get_to(prob.test_cases);
    if (prob.time_limit <= 0)
        throw invalid_argument("time_limit of problem " + prob.id + " should be positive");
}

void from_json(const json &j, submission &submit) {
    submit.sub_id = get_id(j, "submission_id");
    submit.prob_id = get_id(j, "problem_id");
    submit.user_id = j.value("user_id", "");
    j.at("language").get_to(submit.language);
    j.at("code").get_to(submit.code);
}

void to_json(json &j, const submission &submit) {
    j = {{"submission_id", submit.sub_id},
         {"problem_id", submit.prob_id},
         {"user_id", submit.user_id},
         {"language", submit.language},
         {"status", get_display_message(submit.result)},
         {"output", submit.output},
         {"error", submit.error},
         {"execution_time", submit.execution_time},
         {"memory_used", submit.memory_measured ? json(submit.memory_used) : json()},
         {"test_cases_passed", submit.test_cases_passed},
         {"test_cases_total", submit.test_cases_total},
         {"judged_at", submit.judged_at ? json(submit.judged_at) : json()}};
}

ostream &operator<<(ostream &os, const submission &submit) {
    os << "submission " << submit.sub_id << " of problem " << submit.prob_id << " [" << submit.language << "]: "
       << get_display_message(submit.result) << " " << submit.test_cases_passed << "/" << submit.test_cases_total;
    return os;
}

}  // namespace codejudge
