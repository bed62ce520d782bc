#include "judge/executor.hpp"
#include <fmt/core.h>
#include <glog/logging.h>
#include <boost/algorithm/string/trim.hpp>
#include <boost/exception/diagnostic_information.hpp>
#include <algorithm>
#include "common/exceptions.hpp"
#include "common/io_utils.hpp"
#include "common/utils.hpp"

namespace codejudge {
using namespace std;

static const char *INVALID_INPUT_MESSAGE = "Invalid Test Case: No input provided";
static const char *NO_JAVA_CLASS_MESSAGE = "Compilation Error: No class found in Java code";
static const char *RUNTIME_ERROR_MESSAGE = "Runtime error occurred";
static const char *INTERNAL_ERROR_MESSAGE = "Execution failed: internal error";

static run_result make_result(error_type type, const string &error) {
    run_result result;
    result.type = type;
    result.error = error;
    return result;
}

executor::~executor() {}

sandbox_executor::sandbox_executor(const engine_config &config, sandbox &box)
    : config(config), box(box) {}

run_result sandbox_executor::run(const run_request &request) const {
    try {
        return execute(request);
    } catch (unsupported_language &ex) {
        LOG(WARNING) << "Rejected run request: " << ex.what();
        return make_result(error_type::SYSTEM_ERROR, ex.what());
    } catch (internal_error &ex) {
        // 无法创建临时文件夹是致命错误，与后端无关
        LOG(ERROR) << "Unable to prepare run of " << request.language << ": " << ex;
        return make_result(error_type::SYSTEM_ERROR, INTERNAL_ERROR_MESSAGE);
    } catch (std::exception &ex) {
        LOG(ERROR) << "Run of " << request.language << " failed in " << box.name() << " sandbox: "
                   << boost::diagnostic_information(ex);
        return make_result(box.hardened() ? error_type::SYSTEM_ERROR : error_type::RUNTIME_ERROR, INTERNAL_ERROR_MESSAGE);
    }
}

run_result sandbox_executor::execute(const run_request &request) const {
    if (boost::algorithm::trim_copy(request.input).empty())
        return make_result(error_type::INVALID_INPUT, INVALID_INPUT_MESSAGE);
    if (request.code.size() > MAX_CODE_LENGTH)
        return make_result(error_type::INVALID_INPUT, fmt::format("Code exceeds the maximum length of {} bytes", MAX_CODE_LENGTH));
    if (!(request.time_limit > 0 && request.time_limit <= MAX_TIME_LIMIT))
        return make_result(error_type::INVALID_INPUT, fmt::format("Time limit should be in (0, {:g}] seconds", MAX_TIME_LIMIT));

    const toolchain_profile &profile = find_language(request.language);

    map<string, string> vars;
    vars["python"] = box.hardened() ? "python" : config.python_command;
    if (profile.needs_class_name) {
        auto class_name = find_java_class_name(request.code);
        if (!class_name) return make_result(error_type::COMPILATION_ERROR, NO_JAVA_CLASS_MESSAGE);
        vars["class"] = *class_name;
    }

    temporary_directory dir(config.temp_dir);
    string code = profile.rewrite ? profile.rewrite(request.code) : request.code;
    write_file_content(dir.path() / expand_placeholders(profile.source_filename, vars), code);

    string image = config.image_for(profile.language, profile.image);

    switch (profile.strategy) {
        case execution_strategy::COMPILED:
            if (auto failure = compile(profile, image, dir.path(), vars)) return *failure;
            break;
        case execution_strategy::INTERPRETED:
            break;
    }

    sandbox_request run_req;
    run_req.image = image;
    run_req.command = expand_command(profile.run_command, vars);
    run_req.work_dir = dir.path();
    run_req.stdin_data = request.input;
    run_req.time_limit = request.time_limit;
    run_req.memory_limit = request.memory_limit > 0 ? request.memory_limit : config.memory_limit;
    run_req.proc_limit = max(config.proc_limit, profile.min_proc_limit);
    sandbox_result sr = box.execute(run_req);

    run_result result;
    result.elapsed_time = sr.wall_time;
    result.memory_used = sr.memory;
    if (sr.timed_out) {
        result.type = error_type::TIMEOUT;
        result.error = fmt::format("Time Limit Exceeded: Execution took longer than {:g}s", request.time_limit);
        // 容器因为内存上限被杀死时，时钟时间可能小于时间限制
        result.elapsed_time = max(sr.wall_time, request.time_limit);
    } else if (sr.exitcode == 0) {
        result.type = error_type::SUCCESS;
        result.output = trim_output(sr.out);
    } else {
        result.type = error_type::RUNTIME_ERROR;
        result.output = trim_output(sr.out);
        result.error = trim_output(sr.err);
        if (result.error.empty()) result.error = RUNTIME_ERROR_MESSAGE;
    }
    DLOG(INFO) << "Run of " << request.language << " in " << box.name() << " sandbox: " << result;
    return result;
}

optional<run_result> sandbox_executor::compile(const toolchain_profile &profile, const string &image, const filesystem::path &work_dir, const map<string, string> &vars) const {
    sandbox_request req;
    req.image = image;
    req.command = expand_command(profile.compile_command, vars);
    req.work_dir = work_dir;
    req.time_limit = config.compile_time_limit;
    req.memory_limit = config.memory_limit;
    req.proc_limit = max(config.proc_limit, profile.min_proc_limit);
    sandbox_result sr = box.execute(req);

    if (sr.timed_out)
        return make_result(error_type::COMPILATION_ERROR, fmt::format("Compilation Error:\nTimed out after {:g}s while compiling", config.compile_time_limit));
    if (sr.exitcode != 0)
        return make_result(error_type::COMPILATION_ERROR, "Compilation Error:\n" + sr.err);
    return nullopt;
}

}  // namespace codejudge
