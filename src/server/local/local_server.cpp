#include "server/local/local_server.hpp"
#include <glog/logging.h>
#include "common/io_utils.hpp"

namespace codejudge::server::local {
using namespace std;
using namespace nlohmann;

configuration::configuration(ostream &out)
    : out(out) {}

string configuration::category() const {
    return "local";
}

problem configuration::load_problem(const filesystem::path &path) {
    problem prob;
    try {
        prob = json::parse(read_file_content(path)).get<problem>();
    } catch (json::exception &ex) {
        throw invalid_argument("Malformed problem file " + path.string() + ": " + ex.what());
    }
    add_problem(prob);
    LOG(INFO) << "Loaded problem " << prob.id << " (" << prob.test_cases.size() << " test cases) from " << path;
    return prob;
}

size_t configuration::load_problems(const filesystem::path &dir) {
    size_t count = 0;
    for (auto &entry : filesystem::directory_iterator(dir)) {
        if (!entry.is_regular_file() || entry.path().extension() != ".json") continue;
        load_problem(entry.path());
        ++count;
    }
    return count;
}

void configuration::add_problem(const problem &prob) {
    scoped_lock guard(mut);
    problems[prob.id] = prob;
}

problem configuration::fetch_problem(const string &prob_id) {
    scoped_lock guard(mut);
    auto it = problems.find(prob_id);
    if (it == problems.end()) throw out_of_range("Unknown problem " + prob_id);
    return it->second;
}

void configuration::summarize(submission &submit) {
    json j = submit;
    scoped_lock guard(mut);
    out << j.dump() << endl;
}

void configuration::on_accepted(submission &submit) {
    scoped_lock guard(mut);
    if (solved[submit.user_id].insert(submit.prob_id).second)
        LOG(INFO) << "User " << submit.user_id << " solved problem " << submit.prob_id
                  << ", " << solved[submit.user_id].size() << " problems solved";
}

size_t configuration::solved_count(const string &user_id) {
    scoped_lock guard(mut);
    auto it = solved.find(user_id);
    return it == solved.end() ? 0 : it->second.size();
}

}  // namespace codejudge::server::local
