#pragma once

#include <functional>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace codejudge {

/**
 * @brief 语言的执行方式
 */
enum class execution_strategy {
    /**
     * @brief 直接由解释器运行源代码，语法错误会在运行时才被发现
     */
    INTERPRETED,

    /**
     * @brief 先编译，编译成功后再运行编译产物
     */
    COMPILED
};

/**
 * @brief 一种语言的工具链描述
 * 命令模板中可以出现以下占位符，在执行时被替换：
 * {python}: Python 解释器，容器模式下为 python，本地模式下由配置决定
 * {class}: 从 Java 源代码中找到的类名
 */
struct toolchain_profile {
    /**
     * @brief 语言标识，如 python、cpp、c、java
     */
    std::string language;

    /**
     * @brief 源代码的文件名，可以包含 {class} 占位符
     */
    std::string source_filename;

    execution_strategy strategy;

    /**
     * @brief 编译命令，解释型语言为空
     */
    std::vector<std::string> compile_command;

    std::vector<std::string> run_command;

    /**
     * @brief 容器模式下默认使用的镜像，可以被配置覆盖
     */
    std::string image;

    /**
     * @brief 编译前对源代码进行的纯文本替换，可以为空
     */
    std::function<std::string(const std::string &)> rewrite;

    /**
     * @brief 是否需要从源代码中找出类名（Java）
     */
    bool needs_class_name = false;

    /**
     * @brief 容器内进程数上限的下限，为 0 时只使用引擎配置
     * --pids-limit 同时限制线程数，JVM 启动时就会创建数十个 GC 与 JIT 线程
     */
    int min_proc_limit = 0;
};

/**
 * @brief 根据语言标识查找工具链
 * @throw unsupported_language 若语言不受支持
 */
const toolchain_profile &find_language(const std::string &language);

/**
 * @brief 所有受支持的语言标识
 */
std::vector<std::string> supported_languages();

/**
 * @brief 将 #include <bits/stdc++.h> 展开为常用标准库头文件的列表
 * 这只是文本替换，使得不提供 bits/stdc++.h 的编译器也能编译这类代码
 */
std::string expand_bits_header(const std::string &code);

/**
 * @brief 找到 Java 源代码中第一个类声明的类名
 * @return 类名，若找不到类声明则为空
 */
std::optional<std::string> find_java_class_name(const std::string &code);

/**
 * @brief 替换字符串中所有 {key} 形式的占位符
 */
std::string expand_placeholders(const std::string &text, const std::map<std::string, std::string> &vars);

std::vector<std::string> expand_command(const std::vector<std::string> &command, const std::map<std::string, std::string> &vars);

}  // namespace codejudge
