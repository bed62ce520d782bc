#include "test/mock_judge_server.hpp"
#include <stdexcept>

namespace codejudge::server::mock {
using namespace std;

string configuration::category() const {
    return "mock";
}

problem configuration::fetch_problem(const string &prob_id) {
    scoped_lock guard(mut);
    return problems.at(prob_id);
}

void configuration::summarize(submission &submit) {
    scoped_lock guard(mut);
    summarized.push_back(submit);
}

void configuration::on_accepted(submission &) {
    scoped_lock guard(mut);
    ++accepted_notifications;
    if (fail_on_accepted) throw runtime_error("statistics service unavailable");
}

vector<submission> configuration::results() {
    scoped_lock guard(mut);
    return summarized;
}

}  // namespace codejudge::server::mock
