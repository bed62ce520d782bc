#pragma once

#include "sandbox/sandbox.hpp"

namespace codejudge {

/**
 * @brief 容器在被 SIGKILL 杀死（超时或达到内存上限）时的退出码
 */
const int CONTAINER_KILLED_EXITCODE = 137;

/**
 * @brief 容器模式（强化模式）
 * 每个步骤都通过 `docker run` 在一次性的容器中执行：
 * 1. 禁用网络；
 * 2. 限制内存与 swap；
 * 3. 限制进程数；
 * 4. 临时文件夹挂载到 /workspace；
 * 5. 程序在容器内通过 timeout -s KILL 限制运行时间。
 * 步骤结束后无论成功与否，容器都会被强制删除。
 */
struct docker_sandbox : public sandbox {
    explicit docker_sandbox(const engine_config &config);

    bool hardened() const override;

    std::string name() const override;

    sandbox_result execute(const sandbox_request &request) override;

    /**
     * @brief 构造 docker run 的完整命令行
     * @param container_name 容器名，用于超时后杀死容器以及事后清理
     */
    std::vector<std::string> build_run_command(const sandbox_request &request, const std::string &container_name) const;

    /**
     * @brief 探测容器运行时是否可用
     * @return 若 `docker version` 能在限定时间内成功执行，返回 true
     */
    static bool available(const engine_config &config);

private:
    const engine_config &config;
};

}  // namespace codejudge
