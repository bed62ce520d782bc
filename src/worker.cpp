#include "worker.hpp"
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>

namespace codejudge {
using namespace std;

worker_pool::worker_pool(const judger &j, server::judge_server &judge_server, size_t workers)
    : j(j), judge_server(judge_server) {
    if (workers == 0) workers = max(1u, thread::hardware_concurrency());
    for (size_t i = 0; i < workers; ++i)
        threads.emplace_back([this, i] { worker_loop(i); });
    LOG(INFO) << "Started " << workers << " judge workers";
}

worker_pool::~worker_pool() {
    stop();
}

bool worker_pool::submit(shared_ptr<submission> submit) {
    return queue.push(move(submit));
}

void worker_pool::stop() {
    queue.close();
    for (auto &thd : threads)
        if (thd.joinable()) thd.join();
}

size_t worker_pool::size() const {
    return threads.size();
}

/**
 * @brief worker 循环：不断从队列中取出提交进行评测，直到队列被关闭且为空
 */
void worker_pool::worker_loop(size_t worker_id) {
    shared_ptr<submission> submit;
    while (queue.pop(submit)) {
        judge_with_retry(j, *submit);
        try {
            judge_server.summarize(*submit);
        } catch (std::exception &ex) {
            LOG(ERROR) << "Worker " << worker_id << " is unable to return the result of submission " << submit->sub_id
                       << " to " << judge_server.category() << ": " << boost::diagnostic_information(ex);
        }
        submit.reset();
    }
    DLOG(INFO) << "Worker " << worker_id << " stopped";
}

}  // namespace codejudge
