#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 表示整个提交的评测结果
 * 显示名称（get_display_message）是对外约定的字符串，外部系统按原样比较，不能修改
 */
enum class status {
    /**
     * @brief 提交还未开始评测，或者正在被重新评测
     */
    PENDING = 0,

    /**
     * @brief 所有测试点的输出在去除首尾空白后都和标准输出完全一致
     */
    ACCEPTED = 1,

    /**
     * @brief 程序正常退出，但某个测试点的输出和标准输出不一致
     */
    WRONG_ANSWER = 2,

    /**
     * @brief 程序运行时间超出题目的时间限制
     * 在容器模式下，容器因为达到限制被杀死（退出码 137）也会归为此类
     */
    TIME_LIMIT_EXCEEDED = 3,

    /**
     * @brief 程序以非零退出码结束
     * 评测系统本身出现未预期的异常时，提交也会被标记为运行时错误
     */
    RUNTIME_ERROR = 4,

    /**
     * @brief 编译失败，或者 Java 代码中找不到类声明
     */
    COMPILATION_ERROR = 5,

    /**
     * @brief 内存超限
     * 属于对外约定的结果集合，但目前的后端无法将其与超时区分，因此不会产生该结果
     */
    MEMORY_LIMIT_EXCEEDED = 6,

    /**
     * @brief 沙箱后端本身出错
     */
    SYSTEM_ERROR = 7
};

const char *get_display_message(status);

/**
 * @brief 根据显示名称解析评测结果
 * @throw std::out_of_range 若名称不是合法的评测结果
 */
status parse_status(const std::string &message);

}  // namespace codejudge
