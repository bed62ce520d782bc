#pragma once

#include <string>

namespace codejudge {

/**
 * @brief 根据 key 来查找环境变量
 * @param key 环境变量的键
 * @param def_value 如果键不存在，返回该参数
 * @return 环境变量的值，或者不存在时返回 def_value
 */
std::string get_env(const std::string &key, const std::string &def_value);

/**
 * @brief 设置环境变量
 * @param key 环境变量的键
 * @param value 环境变量的值
 * @param replace 若为真，则覆盖已有的环境变量值
 */
void set_env(const std::string &key, const std::string &value, bool replace = true);

/**
 * @brief 去除字符串首尾的空白字符，不影响中间的空白字符
 * 程序输出和标准输出都经过这个函数处理后再比较
 */
std::string trim_output(const std::string &text);

/**
 * @brief 将秒数格式化为对外返回的执行时间，如 "0.077s"
 */
std::string format_seconds(double seconds);

}  // namespace codejudge
