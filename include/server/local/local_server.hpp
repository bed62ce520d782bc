#pragma once

#include <filesystem>
#include <map>
#include <mutex>
#include <ostream>
#include <set>
#include "server/judge_server.hpp"

namespace codejudge::server::local {

/**
 * @brief 基于本地文件的评测服务器
 * 题目从 JSON 文件中读取，格式为：
 * @code{.json}
 * {
 *   "id": "1",
 *   "title": "A+B",
 *   "time_limit": 1.0,
 *   "memory_limit": 256,
 *   "test_cases": [
 *     {"id": 1, "input": "2 3", "expected_output": "5", "is_sample": true}
 *   ]
 * }
 * @endcode
 * 评测结果以 JSON lines 的形式写到输出流中
 */
struct configuration : public judge_server {
    /**
     * @param out 评测结果的输出流
     */
    explicit configuration(std::ostream &out);

    std::string category() const override;

    /**
     * @brief 读取一个题目文件
     * @return 读取到的题目
     * @throw std::invalid_argument 若文件不是合法的题目
     */
    problem load_problem(const std::filesystem::path &path);

    /**
     * @brief 读取文件夹下所有扩展名为 .json 的题目文件
     * @return 读取的题目数
     */
    std::size_t load_problems(const std::filesystem::path &dir);

    void add_problem(const problem &prob);

    problem fetch_problem(const std::string &prob_id) override;

    void summarize(submission &submit) override;

    void on_accepted(submission &submit) override;

    /**
     * @brief 用户通过的题目数，同一题目多次通过只算一次
     */
    std::size_t solved_count(const std::string &user_id);

private:
    std::ostream &out;
    std::mutex mut;
    std::map<std::string, problem> problems;
    std::map<std::string, std::set<std::string>> solved;
};

}  // namespace codejudge::server::local
