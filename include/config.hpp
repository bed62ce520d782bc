#pragma once

#include <cstdint>
#include <filesystem>
#include <map>
#include <nlohmann/json.hpp>
#include <string>

namespace codejudge {

/**
 * @brief 评测引擎的配置
 * 进程启动时构造一次，之后以引用的方式传给沙箱和执行器，运行期间不再修改。
 * 配置来源的优先级从低到高为：默认值、JSON 配置文件、环境变量、命令行参数。
 */
struct engine_config {
    /**
     * @brief 是否使用容器沙箱（强化模式）
     * 为假时使用本地进程模式，本地进程模式不隔离内存与网络。
     * 若为真但容器运行时不可用，启动时会回退到本地进程模式。
     * 对应环境变量 USE_DOCKER，取值 true/false，默认为 true
     */
    bool use_sandbox = true;

    /**
     * @brief 容器运行时的命令行程序
     */
    std::string container_runtime = "docker";

    /**
     * @brief 按语言覆盖默认的容器镜像，键为语言标识
     * @code{.json}
     * {"python": "python:3.11-slim", "cpp": "gcc:13"}
     * @endcode
     */
    std::map<std::string, std::string> images;

    /**
     * @brief 容器的内存上限，单位为字节
     */
    int64_t memory_limit = 512LL * 1024 * 1024;

    /**
     * @brief 容器内最多能同时存在的进程数
     */
    int proc_limit = 20;

    /**
     * @brief 编译步骤的时间限制，单位为秒
     */
    double compile_time_limit = 10;

    /**
     * @brief 容器启动的额外时间，单位为秒
     * 容器模式下等待 time_limit + container_overhead 后才强制结束容器
     */
    double container_overhead = 2;

    /**
     * @brief 本地进程模式下使用的 Python 解释器
     */
    std::string python_command = "python3";

    /**
     * @brief 程序 stdout/stderr 最多保存多少字节，超出部分会被丢弃
     */
    std::size_t output_limit = 64 * 1024 * 1024;

    /**
     * @brief 存放临时编译运行目录的根目录
     */
    std::filesystem::path temp_dir = std::filesystem::temp_directory_path();

    /**
     * @brief 评测 worker 线程数，为 0 时使用 CPU 核心数
     */
    std::size_t workers = 0;

    /**
     * @brief 获取语言在容器模式下使用的镜像
     * @param language 语言标识
     * @param def 若配置没有覆盖该语言，返回 def
     */
    std::string image_for(const std::string &language, const std::string &def) const;
};

void from_json(const nlohmann::json &j, engine_config &config);

/**
 * @brief 读取 JSON 配置文件，配置文件中未出现的项保持原值
 */
void load_config_file(const std::filesystem::path &path, engine_config &config);

/**
 * @brief 使用环境变量 USE_DOCKER 覆盖 use_sandbox
 */
void apply_environment(engine_config &config);

}  // namespace codejudge
