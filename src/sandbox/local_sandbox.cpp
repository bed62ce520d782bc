#include "sandbox/local_sandbox.hpp"
#include "sandbox/process.hpp"

namespace codejudge {
using namespace std;

local_sandbox::local_sandbox(const engine_config &config)
    : config(config) {}

bool local_sandbox::hardened() const {
    return false;
}

string local_sandbox::name() const {
    return "local";
}

sandbox_result local_sandbox::execute(const sandbox_request &request) {
    process_options opt;
    opt.command = request.command;
    opt.work_dir = request.work_dir;
    opt.stdin_data = request.stdin_data;
    opt.time_limit = request.time_limit;
    opt.output_limit = config.output_limit;

    process_result proc = run_process(opt);

    sandbox_result result;
    result.exitcode = proc.exitcode;
    result.timed_out = proc.timed_out;
    result.out = move(proc.out);
    result.err = move(proc.err);
    result.wall_time = proc.wall_time;
    result.memory = proc.memory;
    return result;
}

}  // namespace codejudge
