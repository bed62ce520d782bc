#pragma once

#include <string>
#include "judge/submission.hpp"

namespace codejudge::server {

/**
 * @brief 表示评测引擎之外的协作者：题目存储、提交记录以及用户统计
 * 比如可以是本地的题目文件夹，也可以是某个在线评测平台
 */
struct judge_server {
    virtual ~judge_server();

    /**
     * @brief 评测服务器的 id
     */
    virtual std::string category() const = 0;

    /**
     * @brief 获取提交对应的题目及其测试点
     * @param prob_id 题目 id
     * @throw std::out_of_range 若题目不存在
     */
    virtual problem fetch_problem(const std::string &prob_id) = 0;

    /**
     * @brief 将评测结束的提交写回服务器
     * 该函数可能被多个 worker 并发调用，实现需要自行同步
     * @param submit 已经得到最终评测结果的提交
     */
    virtual void summarize(submission &submit) = 0;

    /**
     * @brief 提交通过了所有测试点，服务器可以借此重新计算用户的通过题数
     * 每次评测通过只调用一次，是否需要去重由服务器决定
     */
    virtual void on_accepted(submission &submit) = 0;
};

}  // namespace codejudge::server
