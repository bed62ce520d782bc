#pragma once

#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>
#include "config.hpp"

namespace codejudge {

/**
 * @brief 一次编译或运行步骤的请求
 */
struct sandbox_request {
    /**
     * @brief 容器镜像，本地进程模式下忽略
     */
    std::string image;

    /**
     * @brief 要执行的命令，工作路径为 work_dir
     */
    std::vector<std::string> command;

    /**
     * @brief 存放源代码和编译产物的文件夹，容器模式下会被挂载到容器中
     */
    std::filesystem::path work_dir;

    std::string stdin_data;

    /**
     * @brief 时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 内存上限，单位为字节，本地进程模式下忽略
     */
    int64_t memory_limit = 512LL * 1024 * 1024;

    /**
     * @brief 最多能同时存在的进程数，本地进程模式下忽略
     */
    int proc_limit = 20;
};

/**
 * @brief 一次编译或运行步骤的原始结果，还没有经过分类
 */
struct sandbox_result {
    int exitcode = -1;

    /**
     * @brief 是否因为超时或者达到资源上限被杀死
     */
    bool timed_out = false;

    std::string out;

    std::string err;

    /**
     * @brief 时钟时间，单位为秒
     */
    double wall_time = 0;

    /**
     * @brief 峰值内存，单位为 KB，-1 表示没有测量
     */
    long memory = -1;
};

/**
 * @brief 执行编译或运行步骤的隔离层
 * 两种实现（容器、本地进程）返回相同形状的结果，调用方不需要知道是哪一种实现执行了请求
 */
struct sandbox {
    virtual ~sandbox();

    /**
     * @brief 是否是强化模式（容器隔离）
     * 强化模式下未分类的异常会被报告为 system_error，否则为 runtime_error
     */
    virtual bool hardened() const = 0;

    virtual std::string name() const = 0;

    /**
     * @brief 执行一个步骤，阻塞直到步骤结束或者超时被杀死
     * @throw sandbox_error 若隔离层本身无法执行该请求
     * @throw std::system_error 若无法创建子进程
     */
    virtual sandbox_result execute(const sandbox_request &request) = 0;
};

/**
 * @brief 根据配置创建沙箱
 * 调用方应当在启动时已经确认容器运行时可用（见 docker_sandbox::available）
 */
std::unique_ptr<sandbox> make_sandbox(const engine_config &config);

}  // namespace codejudge
