#pragma once

#include <boost/stacktrace.hpp>
#include <memory>
#include <ostream>
#include <stdexcept>
#include <string>

namespace codejudge {

/**
 * @brief 评测系统内部异常的基类
 * 构造时会记录调用栈，调用栈只写入日志，不会返回给用户
 */
struct judge_exception : std::exception {
    explicit judge_exception(const std::string &message);

    friend std::ostream &operator<<(std::ostream &os, const judge_exception &ex);

    const char *what() const noexcept override;

private:
    std::string message;
    std::shared_ptr<boost::stacktrace::stacktrace> stacktrace;
};

/**
 * @brief 表示评测系统的内部错误
 * 比如无法创建临时文件夹、无法写入源代码文件
 */
struct internal_error : public judge_exception {
    explicit internal_error(const std::string &message);
};

/**
 * @brief 表示沙箱后端本身出错
 * 比如容器运行时无法启动容器，而不是用户程序出错
 */
struct sandbox_error : public judge_exception {
    explicit sandbox_error(const std::string &message);
};

/**
 * @brief 表示请求的语言没有对应的工具链配置
 */
struct unsupported_language : public judge_exception {
    explicit unsupported_language(const std::string &language);

    const std::string language;
};

}  // namespace codejudge
