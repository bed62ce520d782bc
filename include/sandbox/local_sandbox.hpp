#pragma once

#include "sandbox/sandbox.hpp"

namespace codejudge {

/**
 * @brief 本地进程模式
 * 直接在临时文件夹中以子进程的形式运行命令，只有时钟时间限制。
 * 这种模式不隔离内存与网络，安全性弱于容器模式，
 * 仅用于没有容器运行时的环境，保证评测流程仍然可用。
 */
struct local_sandbox : public sandbox {
    explicit local_sandbox(const engine_config &config);

    bool hardened() const override;

    std::string name() const override;

    sandbox_result execute(const sandbox_request &request) override;

private:
    const engine_config &config;
};

}  // namespace codejudge
