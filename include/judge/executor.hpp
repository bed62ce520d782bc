#pragma once

#include "config.hpp"
#include "judge/language.hpp"
#include "judge/run_result.hpp"
#include "sandbox/sandbox.hpp"

namespace codejudge {

/**
 * @brief 源代码的最大长度，单位为字节
 */
const std::size_t MAX_CODE_LENGTH = 10 * 1024;

/**
 * @brief 允许的最大时间限制，单位为秒
 */
const double MAX_TIME_LIMIT = 60;

/**
 * @brief 单次运行：给定语言、源代码、输入和时间限制，得到分类后的运行结果
 */
struct executor {
    virtual ~executor();

    /**
     * @brief 编译（如果需要）并运行一次程序
     * 这个函数不会抛出异常，所有的失败都通过 run_result::type 返回
     * 这个函数可以并发调用
     */
    virtual run_result run(const run_request &request) const = 0;
};

/**
 * @brief 通过沙箱后端执行的 executor
 * 每次运行都会创建一个新的临时文件夹，运行结束后删除，不同运行之间不共享任何文件
 */
struct sandbox_executor : public executor {
    sandbox_executor(const engine_config &config, sandbox &box);

    run_result run(const run_request &request) const override;

private:
    const engine_config &config;
    sandbox &box;

    /**
     * @throw internal_error 若无法创建临时文件夹或写入源代码
     * @throw unsupported_language 若语言不受支持
     * @throw sandbox_error 若沙箱后端本身出错
     */
    run_result execute(const run_request &request) const;

    /**
     * @brief 编译源代码
     * @return 若编译失败，返回编译错误的结果
     */
    std::optional<run_result> compile(const toolchain_profile &profile, const std::string &image, const std::filesystem::path &work_dir, const std::map<std::string, std::string> &vars) const;
};

}  // namespace codejudge
