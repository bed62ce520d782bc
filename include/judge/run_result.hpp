#pragma once

#include <cstdint>
#include <nlohmann/json.hpp>
#include <ostream>
#include <string>
#include "common/status.hpp"

namespace codejudge {

/**
 * @brief 单次运行的结果分类
 */
enum class error_type {
    SUCCESS,

    /**
     * @brief 请求本身不合法（比如输入为空），没有执行任何命令
     */
    INVALID_INPUT,

    COMPILATION_ERROR,

    RUNTIME_ERROR,

    TIMEOUT,

    /**
     * @brief 沙箱后端或评测系统本身出错
     */
    SYSTEM_ERROR
};

/**
 * @brief 对外约定的错误类型名，如 invalid_input
 * SUCCESS 对应 success，只在内部使用
 */
const char *get_error_type_name(error_type type);

/**
 * @brief 将单次运行的结果分类映射为评测结果
 * 请求不合法的情况被归为运行时错误
 */
status to_status(error_type type);

/**
 * @brief 一次运行请求，不会被持久化
 */
struct run_request {
    std::string language;

    std::string code;

    /**
     * @brief 程序的标准输入，去除首尾空白后不能为空
     */
    std::string input;

    /**
     * @brief 时间限制，单位为秒
     */
    double time_limit = 1;

    /**
     * @brief 内存上限，单位为字节，为 0 时使用引擎配置的上限
     * 只有容器模式会限制内存
     */
    int64_t memory_limit = 0;
};

/**
 * @brief 一次运行的结果，每次运行恰好产生一个结果分类
 */
struct run_result {
    error_type type = error_type::SYSTEM_ERROR;

    /**
     * @brief 去除首尾空白后的程序标准输出
     */
    std::string output;

    /**
     * @brief 编译器或程序的错误输出，或者给用户看的错误信息
     */
    std::string error;

    /**
     * @brief 运行步骤的时钟时间，单位为秒，不包含编译时间
     */
    double elapsed_time = 0;

    /**
     * @brief 峰值内存，单位为 KB，-1 表示没有测量
     */
    long memory_used = -1;

    bool success() const;
};

/**
 * @brief 构造对外返回的运行结果
 * @code{.json}
 * {"success": true, "output": "5", "execution_time": "0.012s"}
 * {"success": false, "error": "...", "error_type": "timeout", "execution_time": "1.002s"}
 * @endcode
 */
nlohmann::json to_run_response(const run_result &result);

std::ostream &operator<<(std::ostream &os, const run_result &result);

}  // namespace codejudge
