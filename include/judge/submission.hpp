#pragma once

#include <ctime>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include <vector>
#include "common/status.hpp"

namespace codejudge {

/**
 * @brief 一个测试点，由外部的题目存储所拥有，评测时只读
 */
struct test_case {
    /**
     * @brief 测试点 id，评测时按 id 升序依次评测
     */
    long long id = 0;

    std::string input;

    std::string expected_output;

    /**
     * @brief 是否是样例，样例对用户可见
     */
    bool is_sample = false;
};

struct problem {
    std::string id;

    std::string title;

    /**
     * @brief 每个测试点的时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 内存限制，单位为 MB
     */
    int memory_limit = 256;

    std::vector<test_case> test_cases;

    /**
     * @brief 用户可见的样例，按 id 升序
     */
    std::vector<test_case> samples() const;

    /**
     * @brief 按 id 升序排列的所有测试点，评测时使用这个顺序
     */
    std::vector<test_case> ordered_test_cases() const;
};

/**
 * @brief 一个选手提交及其评测结果
 * 评测结果字段只由负责该提交的 judger 写入
 */
struct submission {
    std::string sub_id;

    std::string prob_id;

    /**
     * @brief 提交者，统计通过题数时使用
     */
    std::string user_id;

    std::string language;

    std::string code;

    status result = status::PENDING;

    /**
     * @brief 失败测试点（或者最后一个测试点）的程序输出
     */
    std::string output;

    std::string error;

    /**
     * @brief 所有已运行测试点的运行时间之和，单位为秒
     */
    double execution_time = 0;

    /**
     * @brief 所有已运行测试点中的最大内存使用，单位为 KB
     * 仅当 memory_measured 为真时才是真实的测量值
     */
    long memory_used = 0;

    /**
     * @brief memory_used 是否是真实的测量值，容器模式下不测量内存
     */
    bool memory_measured = false;

    std::size_t test_cases_passed = 0;

    std::size_t test_cases_total = 0;

    /**
     * @brief 评测完成的时间，0 表示还没有评测
     */
    time_t judged_at = 0;

    /**
     * @brief 清空评测结果，回到 PENDING 状态，重新评测前调用
     */
    void reset();
};

void from_json(const nlohmann::json &j, test_case &tc);

void from_json(const nlohmann::json &j, problem &prob);

/**
 * @brief 解析评测请求
 * @code{.json}
 * {"submission_id": "42", "problem_id": "1", "user_id": "alice", "language": "python", "code": "print(1)"}
 * @endcode
 */
void from_json(const nlohmann::json &j, submission &submit);

void to_json(nlohmann::json &j, const submission &submit);

std::ostream &operator<<(std::ostream &os, const submission &submit);

}  // namespace codejudge
