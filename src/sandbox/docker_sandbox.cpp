#include "sandbox/docker_sandbox.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/exception/diagnostic_information.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>
#include "common/exceptions.hpp"
#include "sandbox/process.hpp"

namespace codejudge {
using namespace std;

/**
 * @brief docker 客户端自身出错（比如无法创建容器）时的退出码
 */
static const int DOCKER_CLIENT_ERROR_EXITCODE = 125;

/**
 * @brief 删除容器所允许的时间，单位为秒
 */
static const double CLEANUP_TIME_LIMIT = 30;

static const string MOUNT_POINT = "/workspace";

/**
 * @brief 在析构时强制删除容器
 * 超时时 docker 客户端会被杀死，但容器本身仍在运行，因此必须通过 rm -f 杀死并删除
 */
struct container_guard {
    container_guard(const string &runtime, const string &container_name)
        : runtime(runtime), container_name(container_name) {}

    ~container_guard() {
        process_options opt;
        opt.command = {runtime, "rm", "-f", container_name};
        opt.time_limit = CLEANUP_TIME_LIMIT;
        try {
            process_result result = run_process(opt);
            // 容器没有被成功创建时 rm 会失败，这种情况可以忽略
            if (result.timed_out)
                LOG(WARNING) << "Timed out removing container " << container_name;
        } catch (std::exception &ex) {
            LOG(ERROR) << "Unable to remove container " << container_name << ": " << boost::diagnostic_information(ex);
        }
    }

    container_guard(const container_guard &) = delete;
    container_guard &operator=(const container_guard &) = delete;

private:
    string runtime, container_name;
};

static string generate_container_name() {
    thread_local boost::uuids::random_generator generator;
    return "codejudge-" + boost::uuids::to_string(generator());
}

docker_sandbox::docker_sandbox(const engine_config &config)
    : config(config) {}

bool docker_sandbox::hardened() const {
    return true;
}

string docker_sandbox::name() const {
    return config.container_runtime;
}

vector<string> docker_sandbox::build_run_command(const sandbox_request &request, const string &container_name) const {
    vector<string> command = {
        config.container_runtime, "run",
        "--name", container_name,
        "--network", "none",
        "--memory", to_string(request.memory_limit),
        "--memory-swap", to_string(request.memory_limit),
        "--pids-limit", to_string(request.proc_limit),
        "-v", request.work_dir.string() + ":" + MOUNT_POINT,
        "-w", MOUNT_POINT,
        "-i",
        request.image,
        // 时间限制在容器内执行，不包括容器启动的时间，超时的程序以 137 退出
        "timeout", "-s", "KILL", fmt::format("{:g}", request.time_limit)};
    command.insert(command.end(), request.command.begin(), request.command.end());
    return command;
}

sandbox_result docker_sandbox::execute(const sandbox_request &request) {
    if (request.image.empty())
        throw sandbox_error("No container image specified");

    string container_name = generate_container_name();

    process_options opt;
    opt.command = build_run_command(request, container_name);
    opt.stdin_data = request.stdin_data;
    // 外层的时限只用于防止 docker 客户端卡住，容器启动需要额外的时间
    opt.time_limit = request.time_limit + config.container_overhead;
    opt.output_limit = config.output_limit;

    container_guard guard(config.container_runtime, container_name);
    process_result proc = run_process(opt);

    if (!proc.timed_out && proc.exitcode == DOCKER_CLIENT_ERROR_EXITCODE) {
        LOG(ERROR) << "Container runtime failed to start " << request.image << ": " << proc.err;
        throw sandbox_error("Container runtime failed to start image " + request.image);
    }

    sandbox_result result;
    result.exitcode = proc.exitcode;
    // 容器被 SIGKILL 杀死，通常是超时或者达到内存上限
    result.timed_out = proc.timed_out || proc.exitcode == CONTAINER_KILLED_EXITCODE;
    result.out = move(proc.out);
    result.err = move(proc.err);
    result.wall_time = proc.wall_time;
    // docker 客户端的 rusage 不是容器内程序的内存使用
    result.memory = -1;
    return result;
}

bool docker_sandbox::available(const engine_config &config) {
    process_options opt;
    opt.command = {config.container_runtime, "version", "--format", "{{.Server.Version}}"};
    opt.time_limit = 10;
    try {
        process_result result = run_process(opt);
        if (result.timed_out || result.exitcode != 0) {
            LOG(WARNING) << "Container runtime " << config.container_runtime << " is not available: " << result.err;
            return false;
        }
        return true;
    } catch (std::system_error &ex) {
        LOG(WARNING) << "Unable to probe container runtime " << config.container_runtime << ": " << ex.what();
        return false;
    }
}

}  // namespace codejudge
