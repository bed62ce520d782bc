#pragma once

#include <memory>
#include <thread>
#include <vector>
#include "common/concurrent_queue.hpp"
#include "judge/judger.hpp"
#include "server/judge_server.hpp"

/**
 * 评测 worker 相关函数
 * 每个提交都由某一个 worker 线程完整地评测，因此一个运行很慢或者卡死的提交
 * 不会阻塞新提交的接收，只会占用一个 worker。
 * 同一个提交的测试点在同一个 worker 中依次评测。
 */
namespace codejudge {

struct worker_pool {
    /**
     * @brief 启动评测 worker 线程
     * @param j 评测器，所有 worker 共享
     * @param judge_server 评测结束后将提交返回给该服务器
     * @param workers worker 线程数，为 0 时使用 CPU 核心数
     */
    worker_pool(const judger &j, server::judge_server &judge_server, std::size_t workers);

    /**
     * @brief 停止所有 worker，已经提交的评测仍然会被完成
     */
    ~worker_pool();

    worker_pool(const worker_pool &) = delete;
    worker_pool &operator=(const worker_pool &) = delete;

    /**
     * @brief 将提交放入评测队列
     * @return 若 worker 已经停止，返回 false
     */
    bool submit(std::shared_ptr<submission> submit);

    /**
     * @brief 停止接收新的提交，等待队列中剩余的提交评测完成后结束所有 worker
     */
    void stop();

    std::size_t size() const;

private:
    const judger &j;
    server::judge_server &judge_server;
    concurrent_queue<std::shared_ptr<submission>> queue;
    std::vector<std::thread> threads;

    void worker_loop(std::size_t worker_id);
};

}  // namespace codejudge
