#pragma once

#include <filesystem>
#include <string>
#include "config.hpp"
#include "gtest/gtest.h"

/**
 * @brief 若命令不存在，跳过当前测试，只能在测试函数体中使用
 */
#define REQUIRE_COMMAND(command)                    \
    if (!codejudge::test::has_command(command))     \
    GTEST_SKIP() << command << " is not installed"

/**
 * 测试用的评测环境
 * 需要真实工具链的测试在工具链不存在时跳过：
 * REQUIRE_COMMAND("javac");
 */
namespace codejudge::test {

/**
 * @brief 检查命令是否存在于 PATH 中
 */
bool has_command(const std::string &command);

/**
 * @brief 本地进程模式的配置，编译时间限制放宽以免机器较慢时误报
 */
engine_config local_config();

/**
 * @brief 在 dir 中写入一个模拟 docker 命令行的脚本，返回脚本路径
 * `run` 子命令跳过选项和镜像名，在本地直接执行容器命令；
 * 镜像名为 exit-N 时不执行命令，直接以 N 退出，用于模拟容器被杀死或运行时出错。
 * 其他子命令（如 rm）直接成功。
 */
std::filesystem::path write_fake_container_runtime(const std::filesystem::path &dir);

}  // namespace codejudge::test
