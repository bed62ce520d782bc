#pragma once

#include <map>
#include <mutex>
#include <vector>
#include "server/judge_server.hpp"

namespace codejudge::server::mock {

/**
 * @brief 测试用的评测服务器，题目由测试直接添加，评测结果保存在内存中
 */
struct configuration : public judge_server {
    std::map<std::string, problem> problems;

    /**
     * @brief 按返回顺序保存的评测结果
     */
    std::vector<submission> summarized;

    /**
     * @brief on_accepted 的调用次数
     */
    std::size_t accepted_notifications = 0;

    /**
     * @brief 为真时 on_accepted 抛出异常，模拟统计服务出错
     */
    bool fail_on_accepted = false;

    std::string category() const override;

    problem fetch_problem(const std::string &prob_id) override;

    void summarize(submission &submit) override;

    void on_accepted(submission &submit) override;

    std::vector<submission> results();

private:
    std::mutex mut;
};

}  // namespace codejudge::server::mock
