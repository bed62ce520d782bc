#pragma once

#include "judge/executor.hpp"
#include "judge/submission.hpp"
#include "server/judge_server.hpp"

namespace codejudge {

/**
 * @brief 评测一个提交：按 id 升序依次运行所有测试点，遇到第一个失败的测试点立即停止
 * 评测状态只存在于提交本身，因此同一个 judger 可以被多个 worker 并发使用，
 * 但同一个提交同时只能被一个 worker 评测。
 */
struct judger {
    judger(const executor &exec, server::judge_server &judge_server);

    /**
     * @brief 评测提交，并将结果写入提交
     * 评测开始时清空提交之前的评测结果，因此对同一个提交重复调用得到相同的结果。
     * 这个函数不会抛出异常，评测系统内部的错误会被记录为运行时错误，
     * 保证提交总能得到最终的评测结果。
     * @return 最终的评测结果
     */
    status judge(submission &submit) const;

    /**
     * @brief 丢弃之前的评测结果，重新评测
     */
    status rejudge(submission &submit) const;

private:
    const executor &exec;
    server::judge_server &judge_server;

    void run_test_cases(submission &submit) const;
};

/**
 * @brief 评测提交，若编译阶段出现偶发的超时，则重新评测一次
 * 最多只会重试一次
 */
status judge_with_retry(const judger &j, submission &submit);

}  // namespace codejudge
